#ifndef TALUSD_JOB_QUEUE_HPP
#define TALUSD_JOB_QUEUE_HPP

#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "model/job.hpp"


/**
 * Owns every job the master has accepted and the FIFO sequence of queued ones.
 *
 * Each job carries its own mutex. Every state change holds the job table in
 * shared mode for its whole duration, so taking the table exclusively (see
 * statistics()) observes no transition half way through.
 * Lock order: jobs_mutex_ -> pending_mutex_ -> JobEntry::mutex.
 */
class JobQueue
{
public:
	enum class RequeueReason
	{
		WORKER_LOST,
		TRANSPORT_FAILURE
	};

	enum class RequeueResult
	{
		REQUEUED,
		FAILED,
		IGNORED
	};

	enum class ReportResult
	{
		APPLIED,
		IGNORED
	};

	struct CancelResult
	{
		JobState previous_state;
		std::optional<std::string> worker_id;
	};

	struct Statistics
	{
		std::size_t queued = 0;
		std::size_t assigned = 0;
		std::size_t running = 0;
		std::size_t completed = 0;
		std::size_t failed = 0;
		std::size_t cancelled = 0;
		std::size_t total = 0;
	};

	explicit JobQueue(uint32_t max_dispatch_attempts = 3);

	[[nodiscard]] job_id_t submit(std::string payload);
	CancelResult cancel(job_id_t job_id);

	[[nodiscard]] std::optional<job_id_t> peek_next() const;
	[[nodiscard]] std::optional<job_id_t> dequeue_for(const std::string& worker_id);

	RequeueResult requeue_front(job_id_t job_id, const std::string& worker_id, RequeueReason reason);

	// True while the job is assigned or running on the worker.
	[[nodiscard]] bool is_held_by(job_id_t job_id, const std::string& worker_id) const;

	bool mark_running(job_id_t job_id, const std::string& worker_id);
	ReportResult complete(job_id_t job_id, const std::string& worker_id, const JobOutcome& outcome);

	[[nodiscard]] Job snapshot(job_id_t job_id) const;
	[[nodiscard]] std::string payload(job_id_t job_id) const;
	[[nodiscard]] Statistics statistics() const;

private:
	struct JobEntry
	{
		mutable std::mutex mutex;

		job_id_t id;
		std::string payload;
		JobState state = JobState::QUEUED;
		std::optional<std::string> worker_id;
		std::chrono::system_clock::time_point submission_time;
		uint32_t dispatch_attempts = 0;
		std::optional<JobOutcome> outcome;
	};

	uint32_t max_dispatch_attempts_;

	mutable std::shared_mutex jobs_mutex_;
	std::unordered_map<job_id_t, std::shared_ptr<JobEntry>> jobs_;
	job_id_t next_job_id_ = 1;

	mutable std::mutex pending_mutex_;
	std::deque<job_id_t> pending_;

	static void transition(JobEntry& job, JobState state);

	[[nodiscard]] std::shared_ptr<JobEntry> find_job(job_id_t job_id) const;
};

#endif //TALUSD_JOB_QUEUE_HPP
