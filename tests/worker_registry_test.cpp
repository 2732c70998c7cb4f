#include <gtest/gtest.h>

#include "fake_dispatcher.hpp"
#include "service/assignment.hpp"
#include "service/common_exceptions.hpp"
#include "service/worker_registry.hpp"


using namespace std::chrono_literals;

namespace
{
	constexpr auto HEARTBEAT_TIMEOUT = 15000ms;
	constexpr auto REMOVAL_GRACE = 60000ms;
}

TEST(WorkerRegistryTest, RegisterCreatesOnlineWorker)
{
	WorkerRegistry registry;

	const auto handle = registry.register_worker("w1", 2, Address{"localhost", 7000});

	EXPECT_TRUE(handle.created);
	EXPECT_EQ(handle.capacity, 2u);

	const auto worker = registry.get_worker("w1");
	EXPECT_EQ(worker.status, WorkerStatus::ONLINE);
	EXPECT_EQ(worker.load, 0u);
	ASSERT_TRUE(worker.endpoint.has_value());
	EXPECT_EQ(worker.endpoint->to_string(), "localhost:7000");
}

TEST(WorkerRegistryTest, RegisterRejectsInvalidArguments)
{
	WorkerRegistry registry;

	EXPECT_THROW(registry.register_worker("", 1), InvalidArgumentException);
	EXPECT_THROW(registry.register_worker("w1", 0), InvalidArgumentException);
	EXPECT_EQ(registry.size(), 0u);
}

TEST(WorkerRegistryTest, ReRegistrationUpdatesCapacity)
{
	WorkerRegistry registry;
	registry.register_worker("w1", 1);

	const auto handle = registry.register_worker("w1", 4, Address{"host", 1});

	EXPECT_FALSE(handle.created);
	EXPECT_EQ(registry.size(), 1u);
	EXPECT_EQ(registry.get_worker("w1").capacity, 4u);
	EXPECT_TRUE(registry.get_worker("w1").endpoint.has_value());
}

TEST(WorkerRegistryTest, ListFollowsRegistrationOrder)
{
	WorkerRegistry registry;
	registry.register_worker("zeta", 1);
	registry.register_worker("alpha", 1);
	registry.register_worker("mid", 1);

	const auto workers = registry.list();

	ASSERT_EQ(workers.size(), 3u);
	EXPECT_EQ(workers[0].id, "zeta");
	EXPECT_EQ(workers[1].id, "alpha");
	EXPECT_EQ(workers[2].id, "mid");
}

TEST(WorkerRegistryTest, UnknownWorkerIsReported)
{
	WorkerRegistry registry;

	EXPECT_THROW(registry.heartbeat("ghost"), UnknownWorkerException);
	EXPECT_THROW(static_cast<void>(registry.get_status("ghost")), UnknownWorkerException);
	EXPECT_THROW(static_cast<void>(registry.reserve_slot("ghost")), UnknownWorkerException);
}

TEST(WorkerRegistryTest, ReservationsRespectCapacity)
{
	WorkerRegistry registry;
	registry.register_worker("w1", 2);

	const auto first = registry.reserve_slot("w1");
	const auto second = registry.reserve_slot("w1");

	EXPECT_EQ(registry.get_status("w1"), WorkerStatus::BUSY);
	EXPECT_THROW(static_cast<void>(registry.reserve_slot("w1")), CapacityExceededException);

	EXPECT_TRUE(registry.commit_assignment(first, 10));
	registry.release_slot(second);

	const auto worker = registry.get_worker("w1");
	EXPECT_EQ(worker.load, 1u);
	EXPECT_EQ(worker.status, WorkerStatus::ONLINE);
}

TEST(WorkerRegistryTest, ReservationFromOldEpochCannotCommit)
{
	WorkerRegistry registry;
	registry.register_worker("w1", 1);

	const auto reservation = registry.reserve_slot("w1");
	ASSERT_TRUE(registry.mark_offline("w1").has_value());
	registry.heartbeat("w1");

	EXPECT_FALSE(registry.commit_assignment(reservation, 1));
	EXPECT_EQ(registry.get_worker("w1").load, 0u);
}

TEST(WorkerRegistryTest, OfflineWorkerCannotReserve)
{
	WorkerRegistry registry;
	registry.register_worker("w1", 1);
	ASSERT_TRUE(registry.mark_offline("w1").has_value());

	EXPECT_THROW(static_cast<void>(registry.reserve_slot("w1")), InvalidStateException);
	EXPECT_FALSE(registry.mark_offline("w1").has_value());
}

TEST(WorkerRegistryTest, ReleaseJobFreesCapacity)
{
	WorkerRegistry registry;
	registry.register_worker("w1", 1);

	ASSERT_TRUE(registry.commit_assignment(registry.reserve_slot("w1"), 5));
	EXPECT_EQ(registry.get_status("w1"), WorkerStatus::BUSY);

	EXPECT_TRUE(registry.release_job("w1", 5));
	EXPECT_FALSE(registry.release_job("w1", 5));
	EXPECT_EQ(registry.get_status("w1"), WorkerStatus::ONLINE);
}

TEST(WorkerRegistryTest, PendingAbortsAreDrainedOnce)
{
	WorkerRegistry registry;
	registry.register_worker("w1", 1);

	registry.add_pending_abort("w1", 3);
	registry.add_pending_abort("w1", 1);

	EXPECT_EQ(registry.drain_pending_aborts("w1"), (std::vector<job_id_t>{1, 3}));
	EXPECT_TRUE(registry.drain_pending_aborts("w1").empty());
}

TEST(WorkerRegistryTest, SweepMarksSilentWorkersOffline)
{
	ManualClock clock;
	WorkerRegistry registry(clock.function());

	registry.register_worker("quiet", 2);
	registry.register_worker("chatty", 1);
	ASSERT_TRUE(registry.commit_assignment(registry.reserve_slot("quiet"), 7));

	clock.advance(10000ms);
	registry.heartbeat("chatty");
	clock.advance(6000ms);

	const auto result = registry.sweep(HEARTBEAT_TIMEOUT, REMOVAL_GRACE);

	ASSERT_EQ(result.went_offline.size(), 1u);
	EXPECT_EQ(result.went_offline[0].worker_id, "quiet");
	EXPECT_EQ(result.went_offline[0].jobs, (std::vector<job_id_t>{7}));
	EXPECT_TRUE(result.removed.empty());

	EXPECT_EQ(registry.get_status("quiet"), WorkerStatus::OFFLINE);
	EXPECT_EQ(registry.get_worker("quiet").load, 0u);
	EXPECT_EQ(registry.get_status("chatty"), WorkerStatus::ONLINE);
}

TEST(WorkerRegistryTest, HeartbeatRevivesOfflineWorker)
{
	ManualClock clock;
	WorkerRegistry registry(clock.function());
	registry.register_worker("w1", 1);

	clock.advance(HEARTBEAT_TIMEOUT + 1ms);
	ASSERT_EQ(registry.sweep(HEARTBEAT_TIMEOUT, REMOVAL_GRACE).went_offline.size(), 1u);

	EXPECT_TRUE(registry.heartbeat("w1"));
	EXPECT_FALSE(registry.heartbeat("w1"));
	EXPECT_EQ(registry.get_status("w1"), WorkerStatus::ONLINE);
}

TEST(WorkerRegistryTest, OfflineWorkerIsRemovedAfterGrace)
{
	ManualClock clock;
	WorkerRegistry registry(clock.function());
	registry.register_worker("w1", 1);

	clock.advance(HEARTBEAT_TIMEOUT + 1ms);
	EXPECT_TRUE(registry.sweep(HEARTBEAT_TIMEOUT, REMOVAL_GRACE).removed.empty());

	clock.advance(REMOVAL_GRACE);
	const auto result = registry.sweep(HEARTBEAT_TIMEOUT, REMOVAL_GRACE);

	EXPECT_TRUE(result.went_offline.empty());
	EXPECT_EQ(result.removed, (std::vector<std::string>{"w1"}));
	EXPECT_EQ(registry.size(), 0u);
	EXPECT_THROW(static_cast<void>(registry.get_status("w1")), UnknownWorkerException);
}

TEST(WorkerRegistryTest, HeartbeatAgeIsReported)
{
	ManualClock clock;
	WorkerRegistry registry(clock.function());
	registry.register_worker("w1", 1);

	clock.advance(1500ms);

	EXPECT_EQ(registry.get_worker("w1").heartbeat_age, 1500ms);
}

TEST(AssignmentTest, AssignsOldestJobToWorker)
{
	WorkerRegistry registry;
	JobQueue queue;
	registry.register_worker("w1", 1);

	const auto j1 = queue.submit("1");
	static_cast<void>(queue.submit("2"));

	EXPECT_EQ(assign_next_job(registry, queue, "w1"), j1);
	EXPECT_EQ(registry.get_worker("w1").load, 1u);
	EXPECT_THROW(static_cast<void>(assign_next_job(registry, queue, "w1")), CapacityExceededException);
}

TEST(AssignmentTest, EmptyQueueReleasesReservation)
{
	WorkerRegistry registry;
	JobQueue queue;
	registry.register_worker("w1", 1);

	EXPECT_FALSE(assign_next_job(registry, queue, "w1").has_value());
	EXPECT_EQ(registry.get_worker("w1").load, 0u);
}

TEST(AssignmentTest, LostJobsReturnInSubmissionOrder)
{
	WorkerRegistry registry;
	JobQueue queue;
	registry.register_worker("w1", 3);

	const auto j1 = queue.submit("1");
	const auto j2 = queue.submit("2");
	const auto j3 = queue.submit("3");
	const auto j4 = queue.submit("4");

	ASSERT_EQ(assign_next_job(registry, queue, "w1"), j1);
	ASSERT_EQ(assign_next_job(registry, queue, "w1"), j2);
	ASSERT_EQ(assign_next_job(registry, queue, "w1"), j3);

	const auto lost = registry.mark_offline("w1");
	ASSERT_TRUE(lost.has_value());
	requeue_lost_jobs(queue, lost.value());

	EXPECT_EQ(queue.dequeue_for("w2"), j1);
	EXPECT_EQ(queue.dequeue_for("w2"), j2);
	EXPECT_EQ(queue.dequeue_for("w2"), j3);
	EXPECT_EQ(queue.dequeue_for("w2"), j4);
}

TEST(WorkerRegistryTest, WorkerStaysBoundToRegisteringPrincipal)
{
	WorkerRegistry registry;
	registry.register_worker("w1", 2, std::nullopt, 7);

	EXPECT_NO_THROW(registry.verify_owner("w1", 7));
	EXPECT_THROW(registry.verify_owner("w1", 8), WorkerMismatchException);
	EXPECT_THROW(registry.register_worker("w1", 5, std::nullopt, 8), WorkerMismatchException);
	EXPECT_EQ(registry.get_worker("w1").capacity, 2u);

	registry.register_worker("w1", 3, std::nullopt, 7);
	EXPECT_EQ(registry.get_worker("w1").capacity, 3u);
}

TEST(WorkerRegistryTest, UnownedWorkerIsClaimedOnReRegistration)
{
	WorkerRegistry registry;
	registry.register_worker("w1", 1);

	EXPECT_NO_THROW(registry.verify_owner("w1", 3));

	registry.register_worker("w1", 1, std::nullopt, 3);
	EXPECT_THROW(registry.verify_owner("w1", 4), WorkerMismatchException);
	EXPECT_THROW(registry.verify_owner("ghost", 3), UnknownWorkerException);
}

TEST(AssignmentTest, JobCancelledBeforeCommitDoesNotHoldCapacity)
{
	WorkerRegistry registry;
	JobQueue queue;
	registry.register_worker("w1", 1);

	const auto j1 = queue.submit("1");

	const auto reservation = registry.reserve_slot("w1");
	ASSERT_EQ(queue.dequeue_for("w1"), j1);

	// cancel lands before the job is recorded on the worker
	const auto cancelled = queue.cancel(j1);
	ASSERT_EQ(cancelled.worker_id, std::optional<std::string>("w1"));
	EXPECT_FALSE(registry.release_job("w1", j1));

	EXPECT_FALSE(commit_dequeued_job(registry, queue, reservation, j1));
	EXPECT_EQ(registry.get_worker("w1").load, 0u);
	EXPECT_EQ(queue.snapshot(j1).state, JobState::CANCELLED);

	const auto j2 = queue.submit("2");
	EXPECT_EQ(assign_next_job(registry, queue, "w1"), j2);
	EXPECT_EQ(registry.get_worker("w1").load, 1u);
}

TEST(AssignmentTest, ExpiredReservationReturnsJobToQueue)
{
	WorkerRegistry registry;
	JobQueue queue;
	registry.register_worker("w1", 1);

	const auto j1 = queue.submit("1");

	const auto reservation = registry.reserve_slot("w1");
	ASSERT_EQ(queue.dequeue_for("w1"), j1);
	ASSERT_TRUE(registry.mark_offline("w1").has_value());

	EXPECT_FALSE(commit_dequeued_job(registry, queue, reservation, j1));
	EXPECT_EQ(queue.snapshot(j1).state, JobState::QUEUED);
	EXPECT_EQ(queue.peek_next(), j1);
	EXPECT_EQ(registry.get_worker("w1").load, 0u);
}
