#include "execution/scheduler/scheduler.hpp"

#include <algorithm>

#include "spdlog/spdlog.h"

#include "service/assignment.hpp"
#include "service/common_exceptions.hpp"


namespace
{
	template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
	template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
}

namespace scheduler
{
	Scheduler::Scheduler(
			JobQueue& job_queue,
			WorkerRegistry& worker_registry,
			std::shared_ptr<IDispatcher> dispatcher,
			std::chrono::milliseconds interval
	)
		: job_queue_(job_queue),
		  worker_registry_(worker_registry),
		  dispatcher_(std::move(dispatcher)),
		  interval_(interval),
		  event_sink_(std::make_shared<EventSink>())
	{
		event_sink_->scheduler = this;
	}

	Scheduler::~Scheduler()
	{
		stop();

		// waits for a completion being delivered right now
		std::unique_lock lock(event_sink_->mutex);
		event_sink_->scheduler = nullptr;
	}

	void Scheduler::start()
	{
		std::unique_lock lock(event_queue_mutex_);
		if(running_)
		{
			return;
		}

		shutting_down_ = false;
		running_ = true;

		scheduler_thread_ = std::jthread([this](){
			Scheduler::thread_body(*this);
		});
	}

	void Scheduler::stop()
	{
		{
			std::unique_lock lock(event_queue_mutex_);
			if(!running_)
			{
				return;
			}
			shutting_down_ = true;
			running_ = false;
		}

		event_queue_cv_.notify_one();
		scheduler_thread_.join();
		spdlog::info("Scheduler stopped");
	}

	bool Scheduler::running() const noexcept
	{
		return running_;
	}

	void Scheduler::send_event(SchedulerEvent event)
	{
		{
			std::unique_lock lock(event_queue_mutex_);

			event_queue_.emplace(std::move(event));
		}
		event_queue_cv_.notify_one();
	}

	void Scheduler::thread_body(Scheduler& scheduler)
	{
		spdlog::info("Starting scheduler thread, interval {} ms", scheduler.interval_.count());
		while(true)
		{
			{
				std::unique_lock lock(scheduler.event_queue_mutex_);

				scheduler.event_queue_cv_.wait_for(
					lock,
					scheduler.interval_,
					[&queue=scheduler.event_queue_, &shutting_down=scheduler.shutting_down_]
					{
						return !queue.empty() || shutting_down;
					}
				);

				if(scheduler.shutting_down_)
				{
					return;
				}
			}

			try
			{
				scheduler.run_once();
			}
			catch(const std::runtime_error& error)
			{
				spdlog::error("Scheduling pass failed: {}", error.what());
			}
		}
	}

	std::queue<SchedulerEvent> Scheduler::take_events()
	{
		std::unique_lock lock(event_queue_mutex_);

		std::queue<SchedulerEvent> events;
		std::swap(events, event_queue_);

		return events;
	}

	std::size_t Scheduler::run_once()
	{
		std::unique_lock lock(scheduler_state_mutex_);

		auto events = take_events();
		while(!events.empty())
		{
			spdlog::trace("Received message with type id {}", events.front().index());
			dispatch_message(events.front());
			events.pop();
		}

		return schedule_pass();
	}

	std::size_t Scheduler::schedule_pass()
	{
		std::size_t dispatched = 0;

		for(const auto& worker: worker_registry_.list())
		{
			if(worker.status == WorkerStatus::OFFLINE || !worker.endpoint.has_value())
			{
				continue;
			}

			const std::size_t free_slots = worker.capacity > worker.load ? worker.capacity - worker.load : 0;
			for(std::size_t slot = 0; slot < free_slots; ++slot)
			{
				std::optional<job_id_t> job_id;
				try
				{
					job_id = assign_next_job(worker_registry_, job_queue_, worker.id);
				}
				catch(const MasterError& error)
				{
					// worker changed since the snapshot, move on to the next one
					spdlog::debug("Skipping worker {}: {}", worker.id, error.what());
					break;
				}

				if(!job_id.has_value())
				{
					if(!job_queue_.peek_next().has_value())
					{
						return dispatched;
					}
					break;
				}

				dispatch_job(worker, job_id.value());
				++dispatched;
			}
		}

		return dispatched;
	}

	void Scheduler::dispatch_job(const Worker& worker, job_id_t job_id)
	{
		const IDispatcher::DispatchRequest request{job_id, job_queue_.payload(job_id)};

		// the job is already recorded as assigned, a failure here is handled like a rejected dispatch
		std::shared_ptr<IDispatcher::DispatchHandle> handle;
		try
		{
			handle = dispatcher_->dispatch(worker.endpoint.value(), request);
		}
		catch(const std::runtime_error& error)
		{
			spdlog::error("Dispatch of job {} to worker {} failed: {}", job_id, worker.id, error.what());
			send_event(event::DispatchCompleted{job_id, worker.id, IDispatcher::DispatchHandle::Status::REJECTED});
			return;
		}

		handle->set_completion_callback(
				[sink = event_sink_, job_id, worker_id = worker.id](IDispatcher::DispatchHandle::Status status)
				{
					std::unique_lock lock(sink->mutex);
					if(sink->scheduler == nullptr)
					{
						spdlog::debug("Dropping completion of job {}, scheduler is gone", job_id);
						return;
					}
					sink->scheduler->send_event(SchedulerEvent(event::DispatchCompleted{job_id, worker_id, status}));
				}
		);
	}

	void Scheduler::handle_job_submitted([[maybe_unused]] const event::JobSubmitted& event)
	{
	}

	void Scheduler::handle_capacity_changed([[maybe_unused]] const event::CapacityChanged& event)
	{
	}

	void Scheduler::handle_dispatch_completed(const event::DispatchCompleted& event)
	{
		using Status = IDispatcher::DispatchHandle::Status;

		if(event.status == Status::ACKNOWLEDGED)
		{
			try
			{
				job_queue_.mark_running(event.job_id, event.worker_id);
			}
			catch(const MasterError& error)
			{
				// job was requeued or cancelled while the dispatch was in flight
				spdlog::debug("Late acknowledgement of job {} by worker {}: {}", event.job_id, event.worker_id, error.what());
			}
			return;
		}

		spdlog::info("Dispatch of job {} to worker {} failed: {}", event.job_id, event.worker_id, to_string(event.status));

		std::optional<WorkerRegistry::LostWorker> lost_worker;
		try
		{
			lost_worker = worker_registry_.mark_offline(event.worker_id);
		}
		catch(const UnknownWorkerException&)
		{
			spdlog::debug("Worker {} already removed", event.worker_id);
		}

		// worker went offline earlier, only the failed job is left to handle
		if(!lost_worker.has_value())
		{
			worker_registry_.release_job(event.worker_id, event.job_id);
			lost_worker = WorkerRegistry::LostWorker{event.worker_id, {event.job_id}};
		}
		else if(std::ranges::find(lost_worker->jobs, event.job_id) == std::end(lost_worker->jobs))
		{
			lost_worker->jobs.emplace_back(event.job_id);
		}

		requeue_lost_jobs(job_queue_, lost_worker.value(), event.job_id);
	}

	void Scheduler::dispatch_message(const SchedulerEvent& event)
	{
		std::visit(
			overloaded{
				[this](const event::JobSubmitted& job_submitted) { handle_job_submitted(job_submitted); },
				[this](const event::CapacityChanged& capacity_changed) { handle_capacity_changed(capacity_changed); },
				[this](const event::DispatchCompleted& dispatch_completed) { handle_dispatch_completed(dispatch_completed); }
			},
			event
		);
	}
}
