#ifndef TALUSD_RESULT_AGGREGATOR_HPP
#define TALUSD_RESULT_AGGREGATOR_HPP

#include <variant>

#include "execution/scheduler/i_scheduler.hpp"
#include "service/job_queue.hpp"
#include "service/worker_registry.hpp"


class ResultAggregator
{
public:
	struct Pending
	{
		JobState state;
	};

	// Cancelled jobs finish without an outcome.
	struct Finished
	{
		JobState state;
		std::optional<JobOutcome> outcome;
	};

	using Result = std::variant<Pending, Finished>;

	ResultAggregator(JobQueue& job_queue, WorkerRegistry& worker_registry) noexcept;

	void set_scheduler(scheduler::IScheduler* scheduler) noexcept;

	void acknowledge(job_id_t job_id, const std::string& worker_id);
	void report(job_id_t job_id, const std::string& worker_id, const JobOutcome& outcome);

	[[nodiscard]] Result get_result(job_id_t job_id) const;

private:
	JobQueue& job_queue_;
	WorkerRegistry& worker_registry_;
	scheduler::IScheduler* scheduler_ = nullptr;
};

#endif //TALUSD_RESULT_AGGREGATOR_HPP
