#ifndef TALUSD_MASTER_SERVICE_HPP
#define TALUSD_MASTER_SERVICE_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "execution/dispatcher/i_dispatcher.hpp"
#include "execution/liveness/liveness_monitor.hpp"
#include "execution/scheduler/scheduler.hpp"
#include "service/job_queue.hpp"
#include "service/result_aggregator.hpp"
#include "service/worker_registry.hpp"


/**
 * Entry point of the master. Owns the worker registry, the job queue and the
 * loops working on them; every client and slave request goes through here.
 */
class MasterService
{
public:
	struct Settings
	{
		std::chrono::milliseconds scheduling_interval{500};
		uint32_t max_dispatch_attempts = 3;
		LivenessMonitor::Settings liveness{};
	};

	struct MasterInfo
	{
		std::size_t worker_count;
		std::size_t online_count;
		std::size_t queued_count;
		std::size_t running_count;
		std::size_t completed_count;
		std::size_t failed_count;
		std::size_t cancelled_count;
		std::size_t total_submitted;
	};

	struct PulledJob
	{
		job_id_t job_id;
		std::string payload;
	};

	MasterService(
			Settings settings,
			std::shared_ptr<IDispatcher> dispatcher,
			WorkerRegistry::now_function_type now = WorkerRegistry::clock_type::now
	);
	~MasterService();

	MasterService(const MasterService&) = delete;
	MasterService& operator=(const MasterService&) = delete;

	void start();
	void stop();

	// client side
	[[nodiscard]] job_id_t submit(std::string payload);
	void cancel(job_id_t job_id);
	[[nodiscard]] ResultAggregator::Result get_result(job_id_t job_id) const;
	[[nodiscard]] std::optional<job_id_t> peek_next() const;
	[[nodiscard]] Job job_info(job_id_t job_id) const;
	[[nodiscard]] MasterInfo master_info() const;
	[[nodiscard]] std::vector<Worker> slave_list() const;

	// slave side
	WorkerHandle register_worker(
			const std::string& worker_id,
			std::size_t capacity,
			const std::optional<Address>& endpoint = std::nullopt,
			std::optional<uint64_t> owner_id = std::nullopt
	);
	void verify_worker_owner(const std::string& worker_id, uint64_t owner_id) const;
	[[nodiscard]] std::vector<job_id_t> heartbeat(const std::string& worker_id);
	[[nodiscard]] std::optional<PulledJob> dequeue_for(const std::string& worker_id);
	void acknowledge(job_id_t job_id, const std::string& worker_id);
	void report(job_id_t job_id, const std::string& worker_id, const JobOutcome& outcome);
	[[nodiscard]] WorkerStatus get_worker_status(const std::string& worker_id) const;

	// runs one iteration of the background loops on the calling thread
	std::size_t run_scheduling_pass();
	WorkerRegistry::SweepResult run_liveness_sweep();

private:
	WorkerRegistry worker_registry_;
	JobQueue job_queue_;
	std::shared_ptr<IDispatcher> dispatcher_;

	ResultAggregator result_aggregator_;
	scheduler::Scheduler scheduler_;
	LivenessMonitor liveness_monitor_;

	void send_abort(const std::string& worker_id, job_id_t job_id);
};

#endif //TALUSD_MASTER_SERVICE_HPP
