#ifndef TALUSD_ASSIGNMENT_HPP
#define TALUSD_ASSIGNMENT_HPP

#include <optional>
#include <string>

#include "service/job_queue.hpp"
#include "service/worker_registry.hpp"


// Reserves a slot on the worker, takes the head of the queue and records it on
// the worker. Throws CapacityExceeded / InvalidState when the worker cannot
// take a job. Returns nullopt when nothing is queued.
[[nodiscard]] std::optional<job_id_t> assign_next_job(WorkerRegistry& registry, JobQueue& queue, const std::string& worker_id);

// Records a job taken with dequeue_for on the reserving worker. Returns false
// and leaves the worker's load untouched when the reservation expired or the
// job stopped being held by the worker in the meantime (cancelled, requeued).
[[nodiscard]] bool commit_dequeued_job(
		WorkerRegistry& registry,
		JobQueue& queue,
		const WorkerRegistry::SlotReservation& reservation,
		job_id_t job_id
);

// Returns jobs of a lost worker to the front of the queue, oldest first.
// The job whose dispatch failed, if any, is charged a dispatch attempt.
void requeue_lost_jobs(
		JobQueue& queue,
		const WorkerRegistry::LostWorker& lost_worker,
		std::optional<job_id_t> failed_dispatch = std::nullopt
);

#endif //TALUSD_ASSIGNMENT_HPP
