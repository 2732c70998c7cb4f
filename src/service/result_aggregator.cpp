#include "service/result_aggregator.hpp"

#include "spdlog/spdlog.h"


ResultAggregator::ResultAggregator(JobQueue& job_queue, WorkerRegistry& worker_registry) noexcept
	: job_queue_(job_queue), worker_registry_(worker_registry)
{
}

void ResultAggregator::set_scheduler(scheduler::IScheduler* scheduler) noexcept
{
	scheduler_ = scheduler;
}

void ResultAggregator::acknowledge(job_id_t job_id, const std::string& worker_id)
{
	if(job_queue_.mark_running(job_id, worker_id))
	{
		spdlog::debug("Job {} acknowledged by worker {}", job_id, worker_id);
	}
}

void ResultAggregator::report(job_id_t job_id, const std::string& worker_id, const JobOutcome& outcome)
{
	if(job_queue_.complete(job_id, worker_id, outcome) == JobQueue::ReportResult::IGNORED)
	{
		return;
	}

	spdlog::info(
			"Job {} {} on worker {} with status code {}",
			job_id, outcome.success ? "completed" : "failed", worker_id, outcome.status_code
	);

	worker_registry_.release_job(worker_id, job_id);

	if(scheduler_ != nullptr)
	{
		scheduler_->send_event(scheduler::event::CapacityChanged{});
	}
}

ResultAggregator::Result ResultAggregator::get_result(job_id_t job_id) const
{
	const auto job = job_queue_.snapshot(job_id);

	if(is_terminal(job.state))
	{
		return Finished{job.state, job.outcome};
	}

	return Pending{job.state};
}
