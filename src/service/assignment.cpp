#include "service/assignment.hpp"

#include <algorithm>
#include <functional>

#include "spdlog/spdlog.h"


std::optional<job_id_t> assign_next_job(WorkerRegistry& registry, JobQueue& queue, const std::string& worker_id)
{
	// every round consumes a queued job, so this ends with the queue
	while(true)
	{
		const auto reservation = registry.reserve_slot(worker_id);

		std::optional<job_id_t> job_id;
		try
		{
			job_id = queue.dequeue_for(worker_id);
		}
		catch(const std::runtime_error&)
		{
			registry.release_slot(reservation);
			throw;
		}

		if(!job_id.has_value())
		{
			registry.release_slot(reservation);
			return std::nullopt;
		}

		if(commit_dequeued_job(registry, queue, reservation, job_id.value()))
		{
			spdlog::debug("Job {} assigned to worker {}", job_id.value(), worker_id);
			return job_id;
		}
	}
}

bool commit_dequeued_job(
		WorkerRegistry& registry,
		JobQueue& queue,
		const WorkerRegistry::SlotReservation& reservation,
		job_id_t job_id
)
{
	if(!registry.commit_assignment(reservation, job_id))
	{
		queue.requeue_front(job_id, reservation.worker_id, JobQueue::RequeueReason::WORKER_LOST);
		return false;
	}

	// a cancel between dequeue and commit found nothing to release on the worker
	if(!queue.is_held_by(job_id, reservation.worker_id))
	{
		registry.release_job(reservation.worker_id, job_id);
		spdlog::debug("Job {} left worker {} before it was recorded there", job_id, reservation.worker_id);
		return false;
	}

	return true;
}

void requeue_lost_jobs(
		JobQueue& queue,
		const WorkerRegistry::LostWorker& lost_worker,
		std::optional<job_id_t> failed_dispatch
)
{
	auto jobs = lost_worker.jobs;
	std::ranges::sort(jobs, std::greater<>());

	// pushing to the front newest first leaves the oldest at the head
	for(const auto job_id: jobs)
	{
		const auto reason = job_id == failed_dispatch ? JobQueue::RequeueReason::TRANSPORT_FAILURE : JobQueue::RequeueReason::WORKER_LOST;

		switch(queue.requeue_front(job_id, lost_worker.worker_id, reason))
		{
			case JobQueue::RequeueResult::REQUEUED:
				spdlog::info("Job {} requeued after losing worker {}", job_id, lost_worker.worker_id);
				break;
			case JobQueue::RequeueResult::FAILED:
				spdlog::error("Job {} failed: TransportFailure, dispatch attempts exhausted", job_id);
				break;
			case JobQueue::RequeueResult::IGNORED:
				break;
		}
	}
}
