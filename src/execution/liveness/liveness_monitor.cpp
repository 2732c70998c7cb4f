#include "execution/liveness/liveness_monitor.hpp"

#include <algorithm>

#include "spdlog/spdlog.h"

#include "service/assignment.hpp"


LivenessMonitor::LivenessMonitor(WorkerRegistry& worker_registry, JobQueue& job_queue, Settings settings) noexcept
	: worker_registry_(worker_registry), job_queue_(job_queue), settings_(settings)
{
}

LivenessMonitor::~LivenessMonitor()
{
	stop();
}

void LivenessMonitor::set_scheduler(scheduler::IScheduler* scheduler) noexcept
{
	scheduler_ = scheduler;
}

void LivenessMonitor::start()
{
	std::unique_lock lock(state_mutex_);
	if(running_)
	{
		return;
	}

	shutting_down_ = false;
	running_ = true;

	monitor_thread_ = std::jthread([this](){
		LivenessMonitor::thread_body(*this);
	});
}

void LivenessMonitor::stop()
{
	{
		std::unique_lock lock(state_mutex_);
		if(!running_)
		{
			return;
		}
		shutting_down_ = true;
		running_ = false;
	}

	state_cv_.notify_one();
	monitor_thread_.join();
	spdlog::info("Liveness monitor stopped");
}

void LivenessMonitor::thread_body(LivenessMonitor& monitor)
{
	spdlog::info(
			"Starting liveness monitor, heartbeat timeout {} ms, removal grace {} ms",
			monitor.settings_.heartbeat_timeout.count(), monitor.settings_.removal_grace.count()
	);

	while(true)
	{
		{
			std::unique_lock lock(monitor.state_mutex_);
			if(monitor.state_cv_.wait_for(lock, monitor.settings_.sweep_interval, [&monitor](){ return monitor.shutting_down_; }))
			{
				return;
			}
		}

		try
		{
			monitor.sweep_once();
		}
		catch(const std::runtime_error& error)
		{
			spdlog::error("Liveness sweep failed: {}", error.what());
		}
	}
}

WorkerRegistry::SweepResult LivenessMonitor::sweep_once()
{
	auto result = worker_registry_.sweep(settings_.heartbeat_timeout, settings_.removal_grace);

	for(const auto& lost_worker: result.went_offline)
	{
		requeue_lost_jobs(job_queue_, lost_worker);
	}

	const bool requeued_any = std::ranges::any_of(result.went_offline, [](const auto& lost){ return !lost.jobs.empty(); });
	if(requeued_any && scheduler_ != nullptr)
	{
		scheduler_->send_event(scheduler::event::CapacityChanged{});
	}

	return result;
}
