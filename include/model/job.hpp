#ifndef TALUSD_JOB_HPP
#define TALUSD_JOB_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>


using job_id_t = uint64_t;

enum class JobState
{
	QUEUED,
	ASSIGNED,
	RUNNING,
	COMPLETED,
	FAILED,
	CANCELLED
};

// status code stored on jobs failed by the master after dispatch retries ran out
constexpr int32_t DISPATCH_FAILED_STATUS_CODE = -1;

struct JobOutcome
{
	bool success = false;
	int32_t status_code = 0;
	std::string data;

	bool operator==(const JobOutcome& other) const = default;
};

struct Job
{
	job_id_t id;
	std::string payload;
	JobState state;
	std::optional<std::string> worker_id;
	std::chrono::system_clock::time_point submission_time;
	uint32_t dispatch_attempts;
	std::optional<JobOutcome> outcome;
};

[[nodiscard]] bool is_terminal(JobState state) noexcept;
[[nodiscard]] bool is_transition_allowed(JobState from, JobState to) noexcept;
[[nodiscard]] const char* to_string(JobState state) noexcept;

#endif //TALUSD_JOB_HPP
