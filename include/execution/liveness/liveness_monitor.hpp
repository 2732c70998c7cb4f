#ifndef TALUSD_LIVENESS_MONITOR_HPP
#define TALUSD_LIVENESS_MONITOR_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "execution/scheduler/i_scheduler.hpp"
#include "service/job_queue.hpp"
#include "service/worker_registry.hpp"


class LivenessMonitor
{
public:
	struct Settings
	{
		std::chrono::milliseconds heartbeat_timeout{15000};
		std::chrono::milliseconds removal_grace{60000};
		std::chrono::milliseconds sweep_interval{1000};
	};

	LivenessMonitor(WorkerRegistry& worker_registry, JobQueue& job_queue, Settings settings) noexcept;
	~LivenessMonitor();

	void set_scheduler(scheduler::IScheduler* scheduler) noexcept;

	void start();
	void stop();

	WorkerRegistry::SweepResult sweep_once();

private:
	WorkerRegistry& worker_registry_;
	JobQueue& job_queue_;
	Settings settings_;
	scheduler::IScheduler* scheduler_ = nullptr;

	std::jthread monitor_thread_;
	std::mutex state_mutex_;
	std::condition_variable state_cv_;
	bool shutting_down_ = false;
	bool running_ = false;

	static void thread_body(LivenessMonitor& monitor);
};

#endif //TALUSD_LIVENESS_MONITOR_HPP
