#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "fake_dispatcher.hpp"
#include "execution/scheduler/scheduler.hpp"


using namespace std::chrono_literals;
using Status = IDispatcher::DispatchHandle::Status;

class SchedulerTest: public ::testing::Test
{
protected:
	JobQueue queue_{3};
	WorkerRegistry registry_;
	std::shared_ptr<FakeDispatcher> dispatcher_ = std::make_shared<FakeDispatcher>(Status::ACKNOWLEDGED);
	scheduler::Scheduler scheduler_{queue_, registry_, dispatcher_, 50ms};
};

TEST_F(SchedulerTest, DispatchesInSubmissionOrder)
{
	registry_.register_worker("w", 1, Address{"w", 9000});

	const auto j1 = queue_.submit("1");
	const auto j2 = queue_.submit("2");
	const auto j3 = queue_.submit("3");

	for(const auto job_id: {j1, j2, j3})
	{
		EXPECT_EQ(scheduler_.run_once(), 1u);
		// acknowledgement is applied on the next pass, which has nothing to dispatch yet
		EXPECT_EQ(scheduler_.run_once(), 0u);
		ASSERT_EQ(queue_.snapshot(job_id).state, JobState::RUNNING);

		ASSERT_EQ(queue_.complete(job_id, "w", JobOutcome{true, 0, ""}), JobQueue::ReportResult::APPLIED);
		ASSERT_TRUE(registry_.release_job("w", job_id));
	}

	EXPECT_EQ(dispatcher_->dispatched_jobs(), (std::vector<job_id_t>{j1, j2, j3}));
}

TEST_F(SchedulerTest, FillsWorkersInRegistrationOrder)
{
	registry_.register_worker("A", 2, Address{"a", 9000});
	registry_.register_worker("B", 1, Address{"b", 9000});

	const auto j1 = queue_.submit("1");
	const auto j2 = queue_.submit("2");
	const auto j3 = queue_.submit("3");

	EXPECT_EQ(scheduler_.run_once(), 3u);

	EXPECT_EQ(queue_.snapshot(j1).worker_id, "A");
	EXPECT_EQ(queue_.snapshot(j2).worker_id, "A");
	EXPECT_EQ(queue_.snapshot(j3).worker_id, "B");
	EXPECT_FALSE(queue_.peek_next().has_value());

	EXPECT_EQ(registry_.get_worker("A").load, 2u);
	EXPECT_EQ(registry_.get_worker("B").load, 1u);
	EXPECT_EQ(registry_.get_status("A"), WorkerStatus::BUSY);
	EXPECT_EQ(registry_.get_status("B"), WorkerStatus::BUSY);
}

TEST_F(SchedulerTest, NeverExceedsCapacity)
{
	registry_.register_worker("w", 2, Address{"w", 9000});
	for(int i = 0; i < 5; ++i)
	{
		static_cast<void>(queue_.submit(std::to_string(i)));
	}

	EXPECT_EQ(scheduler_.run_once(), 2u);
	EXPECT_EQ(scheduler_.run_once(), 0u);

	EXPECT_EQ(registry_.get_worker("w").load, 2u);
	EXPECT_EQ(queue_.statistics().queued, 3u);
}

TEST_F(SchedulerTest, SkipsPullOnlyAndOfflineWorkers)
{
	registry_.register_worker("pull", 1);
	registry_.register_worker("gone", 1, Address{"g", 9000});
	ASSERT_TRUE(registry_.mark_offline("gone").has_value());

	const auto job_id = queue_.submit("1");

	EXPECT_EQ(scheduler_.run_once(), 0u);
	EXPECT_EQ(queue_.snapshot(job_id).state, JobState::QUEUED);
	EXPECT_TRUE(dispatcher_->dispatched().empty());
}

TEST_F(SchedulerTest, ForwardsPayloadToEndpoint)
{
	registry_.register_worker("w", 1, Address{"worker-host", 9100});
	const auto job_id = queue_.submit("opaque-bytes");

	ASSERT_EQ(scheduler_.run_once(), 1u);

	const auto dispatched = dispatcher_->dispatched();
	ASSERT_EQ(dispatched.size(), 1u);
	EXPECT_EQ(dispatched[0].job_id, job_id);
	EXPECT_EQ(dispatched[0].payload, "opaque-bytes");
	EXPECT_EQ(dispatched[0].endpoint, (Address{"worker-host", 9100}));
}

TEST_F(SchedulerTest, RejectedDispatchRequeuesJobAndMarksWorkerOffline)
{
	dispatcher_->set_automatic_outcome(Status::REJECTED);
	registry_.register_worker("w", 2, Address{"w", 9000});

	const auto j1 = queue_.submit("1");
	const auto j2 = queue_.submit("2");

	ASSERT_EQ(scheduler_.run_once(), 2u);
	EXPECT_EQ(scheduler_.run_once(), 0u);

	EXPECT_EQ(registry_.get_status("w"), WorkerStatus::OFFLINE);
	EXPECT_EQ(registry_.get_worker("w").load, 0u);

	const auto first = queue_.snapshot(j1);
	EXPECT_EQ(first.state, JobState::QUEUED);
	EXPECT_EQ(first.dispatch_attempts, 1u);
	EXPECT_EQ(queue_.snapshot(j2).state, JobState::QUEUED);
	EXPECT_EQ(queue_.peek_next(), j1);
}

TEST_F(SchedulerTest, TimedOutDispatchIsTreatedAsFailure)
{
	dispatcher_->set_automatic_outcome(std::nullopt);
	registry_.register_worker("w", 1, Address{"w", 9000});
	const auto job_id = queue_.submit("1");

	ASSERT_EQ(scheduler_.run_once(), 1u);
	EXPECT_EQ(queue_.snapshot(job_id).state, JobState::ASSIGNED);

	dispatcher_->dispatched().front().handle->complete(Status::TIME_OUT);
	scheduler_.run_once();

	EXPECT_EQ(queue_.snapshot(job_id).state, JobState::QUEUED);
	EXPECT_EQ(registry_.get_status("w"), WorkerStatus::OFFLINE);
}

TEST_F(SchedulerTest, JobFailsOnceDispatchAttemptsAreExhausted)
{
	dispatcher_->set_automatic_outcome(Status::REJECTED);
	registry_.register_worker("w", 1, Address{"w", 9000});
	const auto job_id = queue_.submit("1");

	for(uint32_t attempt = 1; attempt <= 3; ++attempt)
	{
		ASSERT_EQ(scheduler_.run_once(), 1u);
		scheduler_.run_once();
		ASSERT_EQ(registry_.get_status("w"), WorkerStatus::OFFLINE);
		registry_.heartbeat("w");
	}

	const auto job = queue_.snapshot(job_id);
	EXPECT_EQ(job.state, JobState::FAILED);
	EXPECT_EQ(job.dispatch_attempts, 3u);
	ASSERT_TRUE(job.outcome.has_value());
	EXPECT_EQ(job.outcome->status_code, DISPATCH_FAILED_STATUS_CODE);
	EXPECT_EQ(job.outcome->data, "TransportFailure");

	EXPECT_EQ(scheduler_.run_once(), 0u);
	EXPECT_EQ(dispatcher_->dispatched().size(), 3u);
}

TEST_F(SchedulerTest, LateAcknowledgementOfCancelledJobIsHarmless)
{
	dispatcher_->set_automatic_outcome(std::nullopt);
	registry_.register_worker("w", 1, Address{"w", 9000});
	const auto job_id = queue_.submit("1");

	ASSERT_EQ(scheduler_.run_once(), 1u);
	queue_.cancel(job_id);
	registry_.release_job("w", job_id);

	dispatcher_->dispatched().front().handle->complete(Status::ACKNOWLEDGED);
	EXPECT_NO_THROW(scheduler_.run_once());

	EXPECT_EQ(queue_.snapshot(job_id).state, JobState::CANCELLED);
	EXPECT_EQ(registry_.get_status("w"), WorkerStatus::ONLINE);
}

TEST_F(SchedulerTest, BackgroundLoopDispatchesSubmittedJobs)
{
	registry_.register_worker("w", 1, Address{"w", 9000});
	scheduler_.start();
	EXPECT_TRUE(scheduler_.running());

	const auto job_id = queue_.submit("1");
	scheduler_.send_event(scheduler::event::JobSubmitted{});

	const auto deadline = std::chrono::steady_clock::now() + 5s;
	while(queue_.snapshot(job_id).state != JobState::RUNNING && std::chrono::steady_clock::now() < deadline)
	{
		std::this_thread::sleep_for(10ms);
	}

	scheduler_.stop();

	EXPECT_FALSE(scheduler_.running());
	EXPECT_EQ(queue_.snapshot(job_id).state, JobState::RUNNING);
	EXPECT_EQ(dispatcher_->dispatched_jobs(), (std::vector<job_id_t>{job_id}));
}

TEST_F(SchedulerTest, RunningCanBePolledWhileStartingAndStopping)
{
	std::atomic<bool> done = false;
	std::jthread poller([this, &done]()
	{
		while(!done)
		{
			static_cast<void>(scheduler_.running());
		}
	});

	for(int round = 0; round < 20; ++round)
	{
		scheduler_.start();
		EXPECT_TRUE(scheduler_.running());
		scheduler_.stop();
		EXPECT_FALSE(scheduler_.running());
	}

	done = true;
}

TEST_F(SchedulerTest, CompletionAfterSchedulerIsDestroyedIsDropped)
{
	auto dispatcher = std::make_shared<FakeDispatcher>();
	auto owned_scheduler = std::make_unique<scheduler::Scheduler>(queue_, registry_, dispatcher, 50ms);

	registry_.register_worker("w", 1, Address{"w", 9000});
	const auto job_id = queue_.submit("1");
	ASSERT_EQ(owned_scheduler->run_once(), 1u);

	const auto dispatched = dispatcher->dispatched();
	ASSERT_EQ(dispatched.size(), 1u);

	owned_scheduler.reset();
	dispatched.front().handle->complete(Status::REJECTED);

	// nobody is left to handle the rejection
	EXPECT_EQ(queue_.snapshot(job_id).state, JobState::ASSIGNED);
}
