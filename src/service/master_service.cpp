#include "service/master_service.hpp"

#include <algorithm>

#include "spdlog/spdlog.h"

#include "service/assignment.hpp"
#include "service/common_exceptions.hpp"


MasterService::MasterService(
		Settings settings,
		std::shared_ptr<IDispatcher> dispatcher,
		WorkerRegistry::now_function_type now
)
	: worker_registry_(std::move(now)),
	  job_queue_(settings.max_dispatch_attempts),
	  dispatcher_(std::move(dispatcher)),
	  result_aggregator_(job_queue_, worker_registry_),
	  scheduler_(job_queue_, worker_registry_, dispatcher_, settings.scheduling_interval),
	  liveness_monitor_(worker_registry_, job_queue_, settings.liveness)
{
	result_aggregator_.set_scheduler(&scheduler_);
	liveness_monitor_.set_scheduler(&scheduler_);
}

MasterService::~MasterService()
{
	stop();
}

void MasterService::start()
{
	scheduler_.start();
	liveness_monitor_.start();
	spdlog::info("Master service started");
}

void MasterService::stop()
{
	liveness_monitor_.stop();
	scheduler_.stop();
}

job_id_t MasterService::submit(std::string payload)
{
	const auto job_id = job_queue_.submit(std::move(payload));
	scheduler_.send_event(scheduler::event::JobSubmitted{});

	return job_id;
}

void MasterService::cancel(job_id_t job_id)
{
	const auto result = job_queue_.cancel(job_id);
	spdlog::info("Job {} cancelled while {}", job_id, to_string(result.previous_state));

	if(!result.worker_id.has_value())
	{
		return;
	}

	worker_registry_.release_job(result.worker_id.value(), job_id);
	send_abort(result.worker_id.value(), job_id);

	scheduler_.send_event(scheduler::event::CapacityChanged{});
}

void MasterService::send_abort(const std::string& worker_id, job_id_t job_id)
{
	std::optional<Address> endpoint;
	try
	{
		endpoint = worker_registry_.get_worker(worker_id).endpoint;
	}
	catch(const UnknownWorkerException&)
	{
		spdlog::debug("Worker {} of cancelled job {} no longer registered", worker_id, job_id);
		return;
	}

	if(!endpoint.has_value())
	{
		// pull only slaves learn about it with the next heartbeat
		worker_registry_.add_pending_abort(worker_id, job_id);
		return;
	}

	try
	{
		dispatcher_->abort(endpoint.value(), job_id);
	}
	catch(const std::runtime_error& error)
	{
		spdlog::info("Failed to send abort of job {} to worker {}: {}", job_id, worker_id, error.what());
	}
}

ResultAggregator::Result MasterService::get_result(job_id_t job_id) const
{
	return result_aggregator_.get_result(job_id);
}

std::optional<job_id_t> MasterService::peek_next() const
{
	return job_queue_.peek_next();
}

Job MasterService::job_info(job_id_t job_id) const
{
	return job_queue_.snapshot(job_id);
}

MasterService::MasterInfo MasterService::master_info() const
{
	const auto workers = worker_registry_.list();
	const auto statistics = job_queue_.statistics();

	const auto online_count = std::ranges::count_if(
			workers,
			[](const auto& worker){ return worker.status != WorkerStatus::OFFLINE; }
	);

	return MasterInfo{
		.worker_count = workers.size(),
		.online_count = static_cast<std::size_t>(online_count),
		.queued_count = statistics.queued,
		.running_count = statistics.assigned + statistics.running,
		.completed_count = statistics.completed,
		.failed_count = statistics.failed,
		.cancelled_count = statistics.cancelled,
		.total_submitted = statistics.total
	};
}

std::vector<Worker> MasterService::slave_list() const
{
	return worker_registry_.list();
}

WorkerHandle MasterService::register_worker(
		const std::string& worker_id,
		std::size_t capacity,
		const std::optional<Address>& endpoint,
		std::optional<uint64_t> owner_id
)
{
	const auto handle = worker_registry_.register_worker(worker_id, capacity, endpoint, owner_id);
	scheduler_.send_event(scheduler::event::CapacityChanged{});

	return handle;
}

void MasterService::verify_worker_owner(const std::string& worker_id, uint64_t owner_id) const
{
	worker_registry_.verify_owner(worker_id, owner_id);
}

std::vector<job_id_t> MasterService::heartbeat(const std::string& worker_id)
{
	if(worker_registry_.heartbeat(worker_id))
	{
		scheduler_.send_event(scheduler::event::CapacityChanged{});
	}

	return worker_registry_.drain_pending_aborts(worker_id);
}

std::optional<MasterService::PulledJob> MasterService::dequeue_for(const std::string& worker_id)
{
	const auto job_id = assign_next_job(worker_registry_, job_queue_, worker_id);
	if(!job_id.has_value())
	{
		return std::nullopt;
	}

	return PulledJob{job_id.value(), job_queue_.payload(job_id.value())};
}

void MasterService::acknowledge(job_id_t job_id, const std::string& worker_id)
{
	result_aggregator_.acknowledge(job_id, worker_id);
}

void MasterService::report(job_id_t job_id, const std::string& worker_id, const JobOutcome& outcome)
{
	result_aggregator_.report(job_id, worker_id, outcome);
}

WorkerStatus MasterService::get_worker_status(const std::string& worker_id) const
{
	return worker_registry_.get_status(worker_id);
}

std::size_t MasterService::run_scheduling_pass()
{
	return scheduler_.run_once();
}

WorkerRegistry::SweepResult MasterService::run_liveness_sweep()
{
	return liveness_monitor_.sweep_once();
}
