#include "service/worker_registry.hpp"

#include <algorithm>

#include "spdlog/spdlog.h"

#include "service/common_exceptions.hpp"


namespace
{
	std::chrono::milliseconds age_of(WorkerRegistry::clock_type::time_point last_heartbeat, WorkerRegistry::clock_type::time_point now)
	{
		if(now < last_heartbeat)
		{
			return std::chrono::milliseconds::zero();
		}
		return std::chrono::duration_cast<std::chrono::milliseconds>(now - last_heartbeat);
	}
}

WorkerRegistry::WorkerRegistry(now_function_type now)
	: now_(std::move(now))
{
}

std::size_t WorkerRegistry::WorkerEntry::load() const noexcept
{
	return assigned_jobs.size() + reserved_slots;
}

Worker WorkerRegistry::WorkerEntry::snapshot(clock_type::time_point now) const
{
	WorkerStatus status = WorkerStatus::ONLINE;
	if(offline)
	{
		status = WorkerStatus::OFFLINE;
	}
	else if(load() >= capacity)
	{
		status = WorkerStatus::BUSY;
	}

	return Worker{
		id,
		status,
		capacity,
		load(),
		endpoint,
		registration_order,
		epoch,
		age_of(last_heartbeat, now)
	};
}

WorkerRegistry::LostWorker WorkerRegistry::WorkerEntry::go_offline()
{
	offline = true;
	++epoch;
	reserved_slots = 0;

	LostWorker lost{id, {assigned_jobs.begin(), assigned_jobs.end()}};
	assigned_jobs.clear();

	return lost;
}

WorkerHandle WorkerRegistry::register_worker(
		const std::string& worker_id,
		std::size_t capacity,
		const std::optional<Address>& endpoint,
		std::optional<uint64_t> owner_id
)
{
	if(worker_id.empty())
	{
		throw InvalidArgumentException("Worker identifier must not be empty");
	}

	if(capacity == 0)
	{
		throw InvalidArgumentException("Worker " + worker_id + " declared zero capacity");
	}

	const auto now = now_();

	std::unique_lock lock(workers_mutex_);

	if(const auto iter = workers_.find(worker_id); iter != std::end(workers_))
	{
		auto& entry = *iter->second;
		std::unique_lock entry_lock(entry.mutex);

		if(owner_id.has_value() && entry.owner_id.has_value() && entry.owner_id != owner_id)
		{
			throw WorkerMismatchException("Worker " + worker_id + " is registered by another principal");
		}

		if(!entry.owner_id.has_value())
		{
			entry.owner_id = owner_id;
		}

		entry.capacity = capacity;
		entry.endpoint = endpoint;
		entry.last_heartbeat = now;

		if(entry.offline)
		{
			entry.offline = false;
			spdlog::info("Worker {} re-registered, back online with capacity {}", worker_id, capacity);
		}
		else
		{
			spdlog::info("Worker {} re-registered with capacity {}", worker_id, capacity);
		}

		return WorkerHandle{entry.id, entry.capacity, entry.epoch, false};
	}

	auto entry = std::make_shared<WorkerEntry>();
	entry->id = worker_id;
	entry->registration_order = next_registration_order_++;
	entry->capacity = capacity;
	entry->endpoint = endpoint;
	entry->owner_id = owner_id;
	entry->last_heartbeat = now;

	workers_.try_emplace(worker_id, entry);

	spdlog::info(
			"Worker {} registered with capacity {} ({})",
			worker_id, capacity,
			endpoint.has_value() ? "push to " + endpoint->to_string() : std::string("pull only")
	);

	return WorkerHandle{entry->id, entry->capacity, entry->epoch, true};
}

void WorkerRegistry::verify_owner(const std::string& worker_id, uint64_t owner_id) const
{
	const auto entry = find_worker(worker_id);

	std::unique_lock lock(entry->mutex);

	if(entry->owner_id.has_value() && entry->owner_id.value() != owner_id)
	{
		throw WorkerMismatchException("Worker " + worker_id + " is registered by another principal");
	}
}

bool WorkerRegistry::heartbeat(const std::string& worker_id)
{
	const auto entry = find_worker(worker_id);
	const auto now = now_();

	std::unique_lock lock(entry->mutex);
	entry->last_heartbeat = now;

	if(entry->offline)
	{
		entry->offline = false;
		spdlog::info("Worker {} is back online", worker_id);
		return true;
	}

	return false;
}

std::vector<Worker> WorkerRegistry::list() const
{
	const auto now = now_();
	const auto entries = entries_in_registration_order();

	std::vector<Worker> workers;
	workers.reserve(entries.size());

	for(const auto& entry: entries)
	{
		std::unique_lock lock(entry->mutex);
		workers.emplace_back(entry->snapshot(now));
	}

	return workers;
}

Worker WorkerRegistry::get_worker(const std::string& worker_id) const
{
	const auto entry = find_worker(worker_id);
	const auto now = now_();

	std::unique_lock lock(entry->mutex);
	return entry->snapshot(now);
}

WorkerStatus WorkerRegistry::get_status(const std::string& worker_id) const
{
	return get_worker(worker_id).status;
}

std::size_t WorkerRegistry::size() const
{
	std::shared_lock lock(workers_mutex_);
	return workers_.size();
}

WorkerRegistry::SlotReservation WorkerRegistry::reserve_slot(const std::string& worker_id)
{
	const auto entry = find_worker(worker_id);

	std::unique_lock lock(entry->mutex);

	if(entry->offline)
	{
		throw InvalidStateException("Worker " + worker_id + " is offline");
	}

	if(entry->load() >= entry->capacity)
	{
		throw CapacityExceededException("Worker " + worker_id + " has no free capacity");
	}

	++entry->reserved_slots;

	return SlotReservation{worker_id, entry->epoch};
}

bool WorkerRegistry::commit_assignment(const SlotReservation& reservation, job_id_t job_id)
{
	const auto entry = find_worker(reservation.worker_id);

	std::unique_lock lock(entry->mutex);

	if(entry->offline || entry->epoch != reservation.epoch)
	{
		spdlog::debug("Reservation on worker {} expired before job {} was committed", reservation.worker_id, job_id);
		return false;
	}

	--entry->reserved_slots;
	entry->assigned_jobs.emplace(job_id);

	return true;
}

void WorkerRegistry::release_slot(const SlotReservation& reservation) noexcept
{
	std::shared_ptr<WorkerEntry> entry;
	{
		std::shared_lock lock(workers_mutex_);
		const auto iter = workers_.find(reservation.worker_id);
		if(iter == std::end(workers_))
		{
			return;
		}
		entry = iter->second;
	}

	std::unique_lock lock(entry->mutex);
	if(entry->epoch == reservation.epoch && entry->reserved_slots > 0)
	{
		--entry->reserved_slots;
	}
}

bool WorkerRegistry::release_job(const std::string& worker_id, job_id_t job_id) noexcept
{
	std::shared_ptr<WorkerEntry> entry;
	{
		std::shared_lock lock(workers_mutex_);
		const auto iter = workers_.find(worker_id);
		if(iter == std::end(workers_))
		{
			return false;
		}
		entry = iter->second;
	}

	std::unique_lock lock(entry->mutex);
	return entry->assigned_jobs.erase(job_id) > 0;
}

void WorkerRegistry::add_pending_abort(const std::string& worker_id, job_id_t job_id) noexcept
{
	std::shared_ptr<WorkerEntry> entry;
	{
		std::shared_lock lock(workers_mutex_);
		const auto iter = workers_.find(worker_id);
		if(iter == std::end(workers_))
		{
			return;
		}
		entry = iter->second;
	}

	std::unique_lock lock(entry->mutex);
	entry->pending_aborts.emplace(job_id);
}

std::vector<job_id_t> WorkerRegistry::drain_pending_aborts(const std::string& worker_id)
{
	const auto entry = find_worker(worker_id);

	std::unique_lock lock(entry->mutex);

	std::vector<job_id_t> aborts(entry->pending_aborts.begin(), entry->pending_aborts.end());
	entry->pending_aborts.clear();

	return aborts;
}

std::optional<WorkerRegistry::LostWorker> WorkerRegistry::mark_offline(const std::string& worker_id)
{
	const auto entry = find_worker(worker_id);

	std::unique_lock lock(entry->mutex);

	if(entry->offline)
	{
		return std::nullopt;
	}

	auto lost = entry->go_offline();
	spdlog::info("Worker {} marked offline, {} job(s) to requeue", worker_id, lost.jobs.size());

	return lost;
}

WorkerRegistry::SweepResult WorkerRegistry::sweep(std::chrono::milliseconds heartbeat_timeout, std::chrono::milliseconds removal_grace)
{
	const auto now = now_();
	const auto entries = entries_in_registration_order();

	SweepResult result;
	std::vector<std::string> to_remove;

	for(const auto& entry: entries)
	{
		std::unique_lock lock(entry->mutex);

		const auto age = age_of(entry->last_heartbeat, now);

		if(!entry->offline && age > heartbeat_timeout)
		{
			auto lost = entry->go_offline();
			spdlog::info("Worker {} missed heartbeats for {} ms, marked offline", entry->id, age.count());
			result.went_offline.emplace_back(std::move(lost));
		}

		if(entry->offline && age > heartbeat_timeout + removal_grace)
		{
			to_remove.emplace_back(entry->id);
		}
	}

	if(!to_remove.empty())
	{
		std::unique_lock lock(workers_mutex_);

		for(const auto& worker_id: to_remove)
		{
			const auto iter = workers_.find(worker_id);
			if(iter == std::end(workers_))
			{
				continue;
			}

			// registration or heartbeat may have revived it since the scan
			std::unique_lock entry_lock(iter->second->mutex);
			if(!iter->second->offline)
			{
				continue;
			}
			entry_lock.unlock();

			workers_.erase(iter);
			result.removed.emplace_back(worker_id);
			spdlog::info("Worker {} removed after grace period", worker_id);
		}
	}

	return result;
}

std::shared_ptr<WorkerRegistry::WorkerEntry> WorkerRegistry::find_worker(const std::string& worker_id) const
{
	std::shared_lock lock(workers_mutex_);

	const auto iter = workers_.find(worker_id);
	if(iter == std::end(workers_))
	{
		throw UnknownWorkerException("No worker with identifier " + worker_id);
	}

	return iter->second;
}

std::vector<std::shared_ptr<WorkerRegistry::WorkerEntry>> WorkerRegistry::entries_in_registration_order() const
{
	std::vector<std::shared_ptr<WorkerEntry>> entries;
	{
		std::shared_lock lock(workers_mutex_);

		entries.reserve(workers_.size());
		std::ranges::transform(workers_, std::back_inserter(entries), [](const auto& entry){ return entry.second; });
	}

	// registration_order is immutable after creation, safe to read unlocked
	std::ranges::sort(
			entries,
			[](const auto& lhs, const auto& rhs)
			{
				return lhs->registration_order < rhs->registration_order;
			}
	);

	return entries;
}
