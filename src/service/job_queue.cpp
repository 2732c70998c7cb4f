#include "service/job_queue.hpp"

#include <algorithm>

#include "spdlog/spdlog.h"

#include "service/common_exceptions.hpp"


JobQueue::JobQueue(uint32_t max_dispatch_attempts)
	: max_dispatch_attempts_(std::max<uint32_t>(max_dispatch_attempts, 1))
{
}

void JobQueue::transition(JobEntry& job, JobState state)
{
	if(!is_transition_allowed(job.state, state))
	{
		throw InvalidStateException(
				"Job " + std::to_string(job.id) + " cannot move from " + to_string(job.state) + " to " + to_string(state)
		);
	}

	spdlog::debug("Job {}: {} -> {}", job.id, to_string(job.state), to_string(state));
	job.state = state;
}

std::shared_ptr<JobQueue::JobEntry> JobQueue::find_job(job_id_t job_id) const
{
	const auto iter = jobs_.find(job_id);
	if(iter == std::end(jobs_))
	{
		throw JobNotFoundException("No job with identifier " + std::to_string(job_id));
	}

	return iter->second;
}

job_id_t JobQueue::submit(std::string payload)
{
	std::unique_lock lock(jobs_mutex_);

	auto entry = std::make_shared<JobEntry>();
	entry->id = next_job_id_++;
	entry->payload = std::move(payload);
	entry->submission_time = std::chrono::system_clock::now();

	jobs_.try_emplace(entry->id, entry);

	{
		std::unique_lock pending_lock(pending_mutex_);
		pending_.emplace_back(entry->id);
	}

	spdlog::debug("Job {} submitted ({} bytes of payload)", entry->id, entry->payload.size());

	return entry->id;
}

JobQueue::CancelResult JobQueue::cancel(job_id_t job_id)
{
	std::shared_lock lock(jobs_mutex_);

	const auto entry = find_job(job_id);

	std::unique_lock pending_lock(pending_mutex_);
	std::unique_lock job_lock(entry->mutex);

	if(is_terminal(entry->state))
	{
		throw InvalidStateException("Job " + std::to_string(job_id) + " is already " + to_string(entry->state));
	}

	const auto previous_state = entry->state;
	if(previous_state == JobState::QUEUED)
	{
		std::erase(pending_, job_id);
	}

	transition(*entry, JobState::CANCELLED);

	return CancelResult{previous_state, entry->worker_id};
}

std::optional<job_id_t> JobQueue::peek_next() const
{
	std::unique_lock lock(pending_mutex_);

	if(pending_.empty())
	{
		return std::nullopt;
	}

	return pending_.front();
}

std::optional<job_id_t> JobQueue::dequeue_for(const std::string& worker_id)
{
	std::shared_lock lock(jobs_mutex_);
	std::unique_lock pending_lock(pending_mutex_);

	if(pending_.empty())
	{
		return std::nullopt;
	}

	const auto job_id = pending_.front();
	const auto entry = find_job(job_id);

	std::unique_lock job_lock(entry->mutex);

	transition(*entry, JobState::ASSIGNED);
	entry->worker_id = worker_id;
	pending_.pop_front();

	return job_id;
}

JobQueue::RequeueResult JobQueue::requeue_front(job_id_t job_id, const std::string& worker_id, RequeueReason reason)
{
	std::shared_lock lock(jobs_mutex_);

	const auto entry = find_job(job_id);

	std::unique_lock pending_lock(pending_mutex_);
	std::unique_lock job_lock(entry->mutex);

	if(is_terminal(entry->state) || entry->state == JobState::QUEUED || entry->worker_id != worker_id)
	{
		return RequeueResult::IGNORED;
	}

	if(reason == RequeueReason::TRANSPORT_FAILURE)
	{
		++entry->dispatch_attempts;

		if(entry->dispatch_attempts >= max_dispatch_attempts_)
		{
			transition(*entry, JobState::FAILED);
			entry->outcome = JobOutcome{false, DISPATCH_FAILED_STATUS_CODE, "TransportFailure"};
			spdlog::info("Job {} failed, dispatch attempts exhausted ({})", job_id, entry->dispatch_attempts);

			return RequeueResult::FAILED;
		}
	}

	transition(*entry, JobState::QUEUED);
	entry->worker_id = std::nullopt;
	pending_.emplace_front(job_id);

	spdlog::debug("Job {} returned to the front of the queue", job_id);

	return RequeueResult::REQUEUED;
}

bool JobQueue::is_held_by(job_id_t job_id, const std::string& worker_id) const
{
	std::shared_lock lock(jobs_mutex_);

	const auto entry = find_job(job_id);

	std::unique_lock job_lock(entry->mutex);

	return !is_terminal(entry->state) && entry->state != JobState::QUEUED && entry->worker_id == worker_id;
}

bool JobQueue::mark_running(job_id_t job_id, const std::string& worker_id)
{
	std::shared_lock lock(jobs_mutex_);

	const auto entry = find_job(job_id);

	std::unique_lock job_lock(entry->mutex);

	if(is_terminal(entry->state))
	{
		return false;
	}

	if(entry->worker_id != worker_id)
	{
		throw WorkerMismatchException("Job " + std::to_string(job_id) + " is not assigned to worker " + worker_id);
	}

	if(entry->state == JobState::RUNNING)
	{
		return false;
	}

	transition(*entry, JobState::RUNNING);

	return true;
}

JobQueue::ReportResult JobQueue::complete(job_id_t job_id, const std::string& worker_id, const JobOutcome& outcome)
{
	std::shared_lock lock(jobs_mutex_);

	const auto entry = find_job(job_id);

	std::unique_lock job_lock(entry->mutex);

	if(is_terminal(entry->state))
	{
		spdlog::debug("Ignoring report for job {} from worker {}, job already {}", job_id, worker_id, to_string(entry->state));
		return ReportResult::IGNORED;
	}

	if(entry->worker_id != worker_id)
	{
		throw WorkerMismatchException("Job " + std::to_string(job_id) + " is not assigned to worker " + worker_id);
	}

	if(entry->state == JobState::ASSIGNED)
	{
		transition(*entry, JobState::RUNNING);
	}

	transition(*entry, outcome.success ? JobState::COMPLETED : JobState::FAILED);
	entry->outcome = outcome;

	return ReportResult::APPLIED;
}

Job JobQueue::snapshot(job_id_t job_id) const
{
	std::shared_lock lock(jobs_mutex_);

	const auto entry = find_job(job_id);

	std::unique_lock job_lock(entry->mutex);

	return Job{
		entry->id,
		entry->payload,
		entry->state,
		entry->worker_id,
		entry->submission_time,
		entry->dispatch_attempts,
		entry->outcome
	};
}

std::string JobQueue::payload(job_id_t job_id) const
{
	std::shared_lock lock(jobs_mutex_);

	const auto entry = find_job(job_id);

	// payload is never modified after submission
	return entry->payload;
}

JobQueue::Statistics JobQueue::statistics() const
{
	// exclusive: no transition can be in progress while we count
	std::unique_lock lock(jobs_mutex_);

	Statistics statistics;
	statistics.total = jobs_.size();

	for(const auto& [job_id, entry]: jobs_)
	{
		switch(entry->state)
		{
			case JobState::QUEUED:
				++statistics.queued;
				break;
			case JobState::ASSIGNED:
				++statistics.assigned;
				break;
			case JobState::RUNNING:
				++statistics.running;
				break;
			case JobState::COMPLETED:
				++statistics.completed;
				break;
			case JobState::FAILED:
				++statistics.failed;
				break;
			case JobState::CANCELLED:
				++statistics.cancelled;
				break;
		}
	}

	return statistics;
}
