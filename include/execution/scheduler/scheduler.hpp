#ifndef TALUSD_SCHEDULER_HPP
#define TALUSD_SCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>

#include "execution/scheduler/i_scheduler.hpp"
#include "execution/dispatcher/i_dispatcher.hpp"
#include "service/job_queue.hpp"
#include "service/worker_registry.hpp"

namespace scheduler
{
	/**
	 * Control loop pairing free worker capacity with queued jobs.
	 *
	 * Runs on its own thread. A pass is triggered by any event or, when
	 * nothing happens, by the scheduling interval. Dispatch is asynchronous:
	 * the outcome comes back as a DispatchCompleted event.
	 */
	class Scheduler: public IScheduler
	{
	public:
		Scheduler(
				JobQueue& job_queue,
				WorkerRegistry& worker_registry,
				std::shared_ptr<IDispatcher> dispatcher,
				std::chrono::milliseconds interval
		);
		~Scheduler();

		void start();
		void stop();
		[[nodiscard]] bool running() const noexcept;

		void send_event(SchedulerEvent event) override;

		// Handles every queued event, then runs one scheduling pass.
		// Returns the number of jobs dispatched by the pass.
		std::size_t run_once();

	private:
		// Dispatch completions reach the scheduler through the sink, so a
		// handle finishing after the scheduler is gone finds it detached.
		struct EventSink
		{
			std::mutex mutex;
			Scheduler* scheduler = nullptr;
		};

		JobQueue& job_queue_;
		WorkerRegistry& worker_registry_;
		std::shared_ptr<IDispatcher> dispatcher_;
		std::chrono::milliseconds interval_;
		std::shared_ptr<EventSink> event_sink_;

		std::jthread scheduler_thread_;
		std::queue<SchedulerEvent> event_queue_;

		std::mutex event_queue_mutex_;
		std::condition_variable event_queue_cv_;
		bool shutting_down_ = false;
		std::atomic<bool> running_ = false;

		std::mutex scheduler_state_mutex_;

		static void thread_body(Scheduler& scheduler);

		std::queue<SchedulerEvent> take_events();
		std::size_t schedule_pass();
		void dispatch_job(const Worker& worker, job_id_t job_id);

		void handle_job_submitted(const event::JobSubmitted& event);
		void handle_capacity_changed(const event::CapacityChanged& event);
		void handle_dispatch_completed(const event::DispatchCompleted& event);

		void dispatch_message(const SchedulerEvent& event);
	};
}

#endif //TALUSD_SCHEDULER_HPP
