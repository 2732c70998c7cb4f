#ifndef TALUSD_WORKER_REGISTRY_HPP
#define TALUSD_WORKER_REGISTRY_HPP

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

#include "model/job.hpp"
#include "model/worker.hpp"


class WorkerRegistry
{
public:
	using clock_type = std::chrono::steady_clock;
	using now_function_type = std::function<clock_type::time_point()>;

	// Capacity slot held between picking a job and recording it on the worker.
	// Only commits while the worker stays in the epoch it was reserved in.
	struct SlotReservation
	{
		std::string worker_id;
		uint64_t epoch;
	};

	struct LostWorker
	{
		std::string worker_id;
		std::vector<job_id_t> jobs;
	};

	struct SweepResult
	{
		std::vector<LostWorker> went_offline;
		std::vector<std::string> removed;
	};

	explicit WorkerRegistry(now_function_type now = clock_type::now);

	// A worker registered with an owner stays bound to it: re-registration or
	// verify_owner by another principal fails with WorkerMismatch.
	WorkerHandle register_worker(
			const std::string& worker_id,
			std::size_t capacity,
			const std::optional<Address>& endpoint = std::nullopt,
			std::optional<uint64_t> owner_id = std::nullopt
	);
	void verify_owner(const std::string& worker_id, uint64_t owner_id) const;
	// Returns true when the heartbeat brought an offline worker back.
	bool heartbeat(const std::string& worker_id);

	[[nodiscard]] std::vector<Worker> list() const;
	[[nodiscard]] Worker get_worker(const std::string& worker_id) const;
	[[nodiscard]] WorkerStatus get_status(const std::string& worker_id) const;
	[[nodiscard]] std::size_t size() const;

	[[nodiscard]] SlotReservation reserve_slot(const std::string& worker_id);
	[[nodiscard]] bool commit_assignment(const SlotReservation& reservation, job_id_t job_id);
	void release_slot(const SlotReservation& reservation) noexcept;
	bool release_job(const std::string& worker_id, job_id_t job_id) noexcept;

	void add_pending_abort(const std::string& worker_id, job_id_t job_id) noexcept;
	[[nodiscard]] std::vector<job_id_t> drain_pending_aborts(const std::string& worker_id);

	std::optional<LostWorker> mark_offline(const std::string& worker_id);
	SweepResult sweep(std::chrono::milliseconds heartbeat_timeout, std::chrono::milliseconds removal_grace);

private:
	struct WorkerEntry
	{
		mutable std::mutex mutex;

		std::string id;
		uint64_t registration_order;
		std::size_t capacity;
		std::optional<Address> endpoint;
		std::optional<uint64_t> owner_id;

		bool offline = false;
		uint64_t epoch = 0;
		clock_type::time_point last_heartbeat;

		std::set<job_id_t> assigned_jobs;
		std::size_t reserved_slots = 0;
		std::set<job_id_t> pending_aborts;

		[[nodiscard]] std::size_t load() const noexcept;
		[[nodiscard]] Worker snapshot(clock_type::time_point now) const;
		LostWorker go_offline();
	};

	now_function_type now_;

	mutable std::shared_mutex workers_mutex_;
	std::map<std::string, std::shared_ptr<WorkerEntry>> workers_;
	uint64_t next_registration_order_ = 0;

	[[nodiscard]] std::shared_ptr<WorkerEntry> find_worker(const std::string& worker_id) const;
	[[nodiscard]] std::vector<std::shared_ptr<WorkerEntry>> entries_in_registration_order() const;
};

#endif //TALUSD_WORKER_REGISTRY_HPP
