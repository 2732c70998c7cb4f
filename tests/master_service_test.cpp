#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include "fake_dispatcher.hpp"
#include "service/common_exceptions.hpp"
#include "service/master_service.hpp"


using namespace std::chrono_literals;
using Status = IDispatcher::DispatchHandle::Status;

class MasterServiceTest: public ::testing::Test
{
protected:
	ManualClock clock_;
	std::shared_ptr<FakeDispatcher> dispatcher_ = std::make_shared<FakeDispatcher>(Status::ACKNOWLEDGED);
	MasterService master_{settings(), dispatcher_, clock_.function()};

	static MasterService::Settings settings()
	{
		MasterService::Settings settings;
		settings.scheduling_interval = 50ms;
		settings.max_dispatch_attempts = 3;
		settings.liveness.heartbeat_timeout = 15000ms;
		settings.liveness.removal_grace = 60000ms;
		settings.liveness.sweep_interval = 100ms;

		return settings;
	}

	void expect_consistent_info()
	{
		const auto info = master_.master_info();
		EXPECT_EQ(
				info.queued_count + info.running_count + info.completed_count + info.failed_count + info.cancelled_count,
				info.total_submitted
		);
		EXPECT_LE(info.online_count, info.worker_count);
	}
};

TEST_F(MasterServiceTest, CapacityIsSharedAcrossWorkers)
{
	master_.register_worker("A", 2, Address{"a", 9000});
	master_.register_worker("B", 1, Address{"b", 9000});

	for(int i = 0; i < 3; ++i)
	{
		static_cast<void>(master_.submit("job"));
	}

	EXPECT_EQ(master_.run_scheduling_pass(), 3u);

	const auto workers = master_.slave_list();
	ASSERT_EQ(workers.size(), 2u);
	EXPECT_EQ(workers[0].load, 2u);
	EXPECT_EQ(workers[1].load, 1u);
	EXPECT_EQ(master_.master_info().queued_count, 0u);
	EXPECT_FALSE(master_.peek_next().has_value());
}

TEST_F(MasterServiceTest, FullLifecycleOfPushedJob)
{
	master_.register_worker("w", 1, Address{"w", 9000});
	const auto job_id = master_.submit("payload");

	EXPECT_TRUE(std::holds_alternative<ResultAggregator::Pending>(master_.get_result(job_id)));

	ASSERT_EQ(master_.run_scheduling_pass(), 1u);
	master_.run_scheduling_pass();
	EXPECT_EQ(master_.job_info(job_id).state, JobState::RUNNING);

	master_.report(job_id, "w", JobOutcome{true, 0, "done"});

	const auto result = master_.get_result(job_id);
	ASSERT_TRUE(std::holds_alternative<ResultAggregator::Finished>(result));
	const auto& finished = std::get<ResultAggregator::Finished>(result);
	EXPECT_EQ(finished.state, JobState::COMPLETED);
	EXPECT_EQ(finished.outcome, (JobOutcome{true, 0, "done"}));

	EXPECT_EQ(master_.get_worker_status("w"), WorkerStatus::ONLINE);
	EXPECT_EQ(master_.slave_list().front().load, 0u);
}

TEST_F(MasterServiceTest, HeartbeatTimeoutRequeuesJob)
{
	master_.register_worker("w", 1, Address{"w", 9000});
	const auto job_id = master_.submit("payload");

	ASSERT_EQ(master_.run_scheduling_pass(), 1u);
	master_.run_scheduling_pass();
	ASSERT_EQ(master_.job_info(job_id).state, JobState::RUNNING);

	clock_.advance(16000ms);
	const auto sweep = master_.run_liveness_sweep();

	ASSERT_EQ(sweep.went_offline.size(), 1u);
	EXPECT_EQ(master_.job_info(job_id).state, JobState::QUEUED);
	EXPECT_FALSE(master_.job_info(job_id).worker_id.has_value());
	EXPECT_EQ(master_.get_worker_status("w"), WorkerStatus::OFFLINE);
	EXPECT_EQ(master_.peek_next(), job_id);
	expect_consistent_info();
}

TEST_F(MasterServiceTest, RequeuedJobGoesToNextWorker)
{
	master_.register_worker("first", 1, Address{"f", 9000});
	const auto job_id = master_.submit("payload");
	ASSERT_EQ(master_.run_scheduling_pass(), 1u);

	clock_.advance(10000ms);
	master_.register_worker("second", 1, Address{"s", 9000});
	clock_.advance(6000ms);
	master_.run_liveness_sweep();

	EXPECT_EQ(master_.run_scheduling_pass(), 1u);
	EXPECT_EQ(master_.job_info(job_id).worker_id, "second");
	EXPECT_EQ(dispatcher_->dispatched().back().endpoint, (Address{"s", 9000}));
}

TEST_F(MasterServiceTest, MismatchedReportLeavesJobUntouched)
{
	master_.register_worker("w1", 1);
	master_.register_worker("w2", 1);
	const auto job_id = master_.submit("payload");

	const auto pulled = master_.dequeue_for("w1");
	ASSERT_TRUE(pulled.has_value());
	ASSERT_EQ(pulled->job_id, job_id);

	EXPECT_THROW(master_.report(job_id, "w2", JobOutcome{true, 0, ""}), WorkerMismatchException);
	EXPECT_THROW(master_.acknowledge(job_id, "w2"), WorkerMismatchException);

	const auto job = master_.job_info(job_id);
	EXPECT_EQ(job.state, JobState::ASSIGNED);
	EXPECT_EQ(job.worker_id, "w1");
}

TEST_F(MasterServiceTest, DuplicateReportIsNoOp)
{
	master_.register_worker("w", 1);
	const auto job_id = master_.submit("payload");
	ASSERT_TRUE(master_.dequeue_for("w").has_value());

	master_.acknowledge(job_id, "w");
	master_.acknowledge(job_id, "w");
	master_.report(job_id, "w", JobOutcome{false, 7, "first"});
	EXPECT_NO_THROW(master_.report(job_id, "w", JobOutcome{true, 0, "second"}));

	const auto job = master_.job_info(job_id);
	EXPECT_EQ(job.state, JobState::FAILED);
	EXPECT_EQ(job.outcome, (JobOutcome{false, 7, "first"}));
	EXPECT_EQ(master_.master_info().failed_count, 1u);
}

TEST_F(MasterServiceTest, PullOnlyWorkerDequeuesJobs)
{
	master_.register_worker("pull", 2);
	const auto j1 = master_.submit("one");
	const auto j2 = master_.submit("two");

	EXPECT_EQ(master_.run_scheduling_pass(), 0u);

	const auto first = master_.dequeue_for("pull");
	const auto second = master_.dequeue_for("pull");
	ASSERT_TRUE(first.has_value());
	ASSERT_TRUE(second.has_value());
	EXPECT_EQ(first->job_id, j1);
	EXPECT_EQ(first->payload, "one");
	EXPECT_EQ(second->job_id, j2);

	EXPECT_THROW(static_cast<void>(master_.dequeue_for("pull")), CapacityExceededException);

	master_.report(j1, "pull", JobOutcome{true, 0, ""});
	EXPECT_FALSE(master_.dequeue_for("pull").has_value());
}

TEST_F(MasterServiceTest, DequeueForUnknownWorkerFails)
{
	static_cast<void>(master_.submit("payload"));

	EXPECT_THROW(static_cast<void>(master_.dequeue_for("ghost")), UnknownWorkerException);
	EXPECT_EQ(master_.master_info().queued_count, 1u);
}

TEST_F(MasterServiceTest, CancelRunningJobAbortsAndIgnoresLateReport)
{
	master_.register_worker("w", 1, Address{"w", 9000});
	const auto job_id = master_.submit("payload");
	ASSERT_EQ(master_.run_scheduling_pass(), 1u);
	master_.run_scheduling_pass();

	master_.cancel(job_id);

	const auto aborts = dispatcher_->aborts();
	ASSERT_EQ(aborts.size(), 1u);
	EXPECT_EQ(aborts[0].job_id, job_id);
	EXPECT_EQ(aborts[0].endpoint, (Address{"w", 9000}));
	EXPECT_EQ(master_.slave_list().front().load, 0u);

	EXPECT_NO_THROW(master_.report(job_id, "w", JobOutcome{true, 0, "late"}));

	const auto result = master_.get_result(job_id);
	ASSERT_TRUE(std::holds_alternative<ResultAggregator::Finished>(result));
	EXPECT_EQ(std::get<ResultAggregator::Finished>(result).state, JobState::CANCELLED);
	EXPECT_FALSE(std::get<ResultAggregator::Finished>(result).outcome.has_value());
}

TEST_F(MasterServiceTest, CancelOfPulledJobIsDeliveredWithHeartbeat)
{
	master_.register_worker("pull", 1);
	const auto job_id = master_.submit("payload");
	ASSERT_TRUE(master_.dequeue_for("pull").has_value());

	master_.cancel(job_id);

	EXPECT_TRUE(dispatcher_->aborts().empty());
	EXPECT_EQ(master_.heartbeat("pull"), (std::vector<job_id_t>{job_id}));
	EXPECT_TRUE(master_.heartbeat("pull").empty());
}

TEST_F(MasterServiceTest, CancelQueuedJob)
{
	const auto j1 = master_.submit("1");
	const auto j2 = master_.submit("2");

	master_.cancel(j1);

	EXPECT_EQ(master_.peek_next(), j2);
	EXPECT_THROW(master_.cancel(j1), InvalidStateException);
	EXPECT_THROW(master_.cancel(99), JobNotFoundException);
	EXPECT_EQ(master_.master_info().cancelled_count, 1u);
}

TEST_F(MasterServiceTest, RejectedDispatchFailsJobAfterRetries)
{
	dispatcher_->set_automatic_outcome(Status::REJECTED);
	master_.register_worker("w", 1, Address{"w", 9000});
	const auto job_id = master_.submit("payload");

	for(int attempt = 0; attempt < 3; ++attempt)
	{
		ASSERT_EQ(master_.run_scheduling_pass(), 1u);
		master_.run_scheduling_pass();
		EXPECT_EQ(master_.get_worker_status("w"), WorkerStatus::OFFLINE);
		EXPECT_TRUE(master_.heartbeat("w").empty());
	}

	const auto result = master_.get_result(job_id);
	ASSERT_TRUE(std::holds_alternative<ResultAggregator::Finished>(result));
	const auto& finished = std::get<ResultAggregator::Finished>(result);
	EXPECT_EQ(finished.state, JobState::FAILED);
	ASSERT_TRUE(finished.outcome.has_value());
	EXPECT_EQ(finished.outcome->status_code, DISPATCH_FAILED_STATUS_CODE);
	expect_consistent_info();
}

TEST_F(MasterServiceTest, ReRegistrationRevivesOfflineWorker)
{
	master_.register_worker("w", 1, Address{"w", 9000});
	clock_.advance(15001ms);
	master_.run_liveness_sweep();
	ASSERT_EQ(master_.get_worker_status("w"), WorkerStatus::OFFLINE);

	const auto handle = master_.register_worker("w", 3, Address{"w", 9001});

	EXPECT_FALSE(handle.created);
	EXPECT_EQ(master_.get_worker_status("w"), WorkerStatus::ONLINE);
	EXPECT_EQ(master_.slave_list().front().capacity, 3u);
}

TEST_F(MasterServiceTest, OfflineWorkerIsForgottenAfterGracePeriod)
{
	master_.register_worker("w", 1, Address{"w", 9000});

	clock_.advance(15001ms);
	master_.run_liveness_sweep();
	EXPECT_EQ(master_.master_info().worker_count, 1u);
	EXPECT_EQ(master_.master_info().online_count, 0u);

	clock_.advance(60000ms);
	master_.run_liveness_sweep();

	EXPECT_EQ(master_.master_info().worker_count, 0u);
	EXPECT_THROW(static_cast<void>(master_.get_worker_status("w")), UnknownWorkerException);
	EXPECT_THROW(static_cast<void>(master_.heartbeat("w")), UnknownWorkerException);
}

TEST_F(MasterServiceTest, MasterInfoCountsStayConsistent)
{
	master_.register_worker("push", 1, Address{"p", 9000});
	master_.register_worker("pull", 1);

	const auto j1 = master_.submit("1");
	const auto j2 = master_.submit("2");
	const auto j3 = master_.submit("3");
	static_cast<void>(master_.submit("4"));
	expect_consistent_info();

	ASSERT_EQ(master_.run_scheduling_pass(), 1u);
	ASSERT_TRUE(master_.dequeue_for("pull").has_value());
	expect_consistent_info();

	master_.report(j2, "pull", JobOutcome{true, 0, ""});
	master_.cancel(j3);
	expect_consistent_info();

	const auto info = master_.master_info();
	EXPECT_EQ(info.worker_count, 2u);
	EXPECT_EQ(info.online_count, 2u);
	EXPECT_EQ(info.queued_count, 1u);
	EXPECT_EQ(info.running_count, 1u);
	EXPECT_EQ(info.completed_count, 1u);
	EXPECT_EQ(info.cancelled_count, 1u);
	EXPECT_EQ(info.total_submitted, 4u);
	EXPECT_EQ(master_.job_info(j1).worker_id, "push");
}

TEST_F(MasterServiceTest, StartAndStopLeaveAssignedJobsRecorded)
{
	dispatcher_->set_automatic_outcome(std::nullopt);
	master_.register_worker("w", 1, Address{"w", 9000});
	master_.start();

	const auto job_id = master_.submit("payload");

	const auto deadline = std::chrono::steady_clock::now() + 5s;
	while(dispatcher_->dispatched().empty() && std::chrono::steady_clock::now() < deadline)
	{
		std::this_thread::sleep_for(10ms);
	}

	master_.stop();

	EXPECT_EQ(dispatcher_->dispatched().size(), 1u);
	EXPECT_EQ(master_.job_info(job_id).state, JobState::ASSIGNED);
	EXPECT_EQ(master_.job_info(job_id).worker_id, "w");
}

TEST_F(MasterServiceTest, CompletionArrivingAfterShutdownIsDropped)
{
	auto dispatcher = std::make_shared<FakeDispatcher>();
	auto master = std::make_unique<MasterService>(settings(), dispatcher, clock_.function());

	master->register_worker("w", 1, Address{"w", 9000});
	static_cast<void>(master->submit("payload"));
	ASSERT_EQ(master->run_scheduling_pass(), 1u);

	const auto dispatched = dispatcher->dispatched();
	ASSERT_EQ(dispatched.size(), 1u);

	master.reset();

	dispatched.front().handle->complete(Status::ACKNOWLEDGED);
	EXPECT_TRUE(dispatched.front().handle->completed());
}

TEST_F(MasterServiceTest, ConcurrentPullsCancelsAndReportsKeepLoadWithinCapacity)
{
	constexpr std::size_t JOB_COUNT = 300;

	master_.register_worker("w", 2);

	std::vector<job_id_t> job_ids;
	for(std::size_t i = 0; i < JOB_COUNT; ++i)
	{
		job_ids.emplace_back(master_.submit(std::to_string(i)));
	}

	const auto deadline = std::chrono::steady_clock::now() + 10s;
	std::atomic<bool> over_capacity = false;

	const auto all_finished = [this]()
	{
		const auto info = master_.master_info();
		return info.completed_count + info.cancelled_count == info.total_submitted;
	};

	const auto keep_going = [&]()
	{
		return !all_finished() && std::chrono::steady_clock::now() < deadline;
	};

	const auto pull = [&]()
	{
		while(keep_going())
		{
			std::optional<MasterService::PulledJob> job;
			try
			{
				job = master_.dequeue_for("w");
			}
			catch(const CapacityExceededException&)
			{
				// the other puller holds both slots
			}

			if(!job.has_value())
			{
				std::this_thread::yield();
				continue;
			}

			master_.report(job->job_id, "w", JobOutcome{true, 0, job->payload});
		}
	};

	const auto cancel_every_third = [&]()
	{
		for(std::size_t i = 0; i < job_ids.size(); i += 3)
		{
			try
			{
				master_.cancel(job_ids[i]);
			}
			catch(const InvalidStateException&)
			{
				// already completed
			}
		}
	};

	const auto watch_load = [&]()
	{
		while(keep_going())
		{
			for(const auto& worker: master_.slave_list())
			{
				if(worker.load > worker.capacity)
				{
					over_capacity = true;
				}
			}
		}
	};

	{
		std::vector<std::jthread> threads;
		threads.emplace_back(pull);
		threads.emplace_back(pull);
		threads.emplace_back(cancel_every_third);
		threads.emplace_back(watch_load);
	}

	EXPECT_FALSE(over_capacity);
	EXPECT_TRUE(all_finished());
	expect_consistent_info();

	const auto info = master_.master_info();
	EXPECT_EQ(info.queued_count, 0u);
	EXPECT_EQ(info.running_count, 0u);
	EXPECT_EQ(master_.slave_list().front().load, 0u);

	// both slots are free again
	static_cast<void>(master_.submit("after"));
	static_cast<void>(master_.submit("after"));
	EXPECT_TRUE(master_.dequeue_for("w").has_value());
	EXPECT_TRUE(master_.dequeue_for("w").has_value());
}

TEST_F(MasterServiceTest, WorkerLossDuringConcurrentPullsRequeuesEveryJob)
{
	constexpr std::size_t JOB_COUNT = 200;

	master_.register_worker("w", 2);
	for(std::size_t i = 0; i < JOB_COUNT; ++i)
	{
		static_cast<void>(master_.submit(std::to_string(i)));
	}

	const auto deadline = std::chrono::steady_clock::now() + 10s;

	const auto all_completed = [this]()
	{
		const auto info = master_.master_info();
		return info.completed_count == info.total_submitted;
	};

	const auto pull = [&]()
	{
		while(!all_completed() && std::chrono::steady_clock::now() < deadline)
		{
			std::optional<MasterService::PulledJob> job;
			try
			{
				job = master_.dequeue_for("w");
			}
			catch(const MasterError&)
			{
				// full or offline at the moment
			}

			if(!job.has_value())
			{
				std::this_thread::yield();
				continue;
			}

			try
			{
				master_.report(job->job_id, "w", JobOutcome{true, 0, job->payload});
			}
			catch(const WorkerMismatchException&)
			{
				// requeued by the sweep before the report arrived
			}
		}
	};

	const auto flap = [&]()
	{
		for(int round = 0; round < 30; ++round)
		{
			clock_.advance(15001ms);
			master_.run_liveness_sweep();
			static_cast<void>(master_.heartbeat("w"));
			std::this_thread::yield();
		}
	};

	{
		std::vector<std::jthread> threads;
		threads.emplace_back(pull);
		threads.emplace_back(pull);
		threads.emplace_back(flap);
	}

	EXPECT_TRUE(all_completed());
	expect_consistent_info();
	EXPECT_EQ(master_.master_info().running_count, 0u);
	EXPECT_EQ(master_.get_worker_status("w"), WorkerStatus::ONLINE);
	EXPECT_EQ(master_.slave_list().front().load, 0u);
}
