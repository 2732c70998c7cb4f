#include "model/job.hpp"


bool is_terminal(JobState state) noexcept
{
	using enum JobState;
	return state == COMPLETED || state == FAILED || state == CANCELLED;
}

bool is_transition_allowed(JobState from, JobState to) noexcept
{
	using enum JobState;
	switch(from)
	{
		case QUEUED:
			return to == ASSIGNED || to == CANCELLED;
		case ASSIGNED:
			return to == RUNNING || to == QUEUED || to == CANCELLED || to == FAILED;
		case RUNNING:
			return to == COMPLETED || to == FAILED || to == QUEUED || to == CANCELLED;
		default:
			return false;
	}
}

const char* to_string(JobState state) noexcept
{
	using enum JobState;
	switch(state)
	{
		case QUEUED:
			return "queued";
		case ASSIGNED:
			return "assigned";
		case RUNNING:
			return "running";
		case COMPLETED:
			return "completed";
		case FAILED:
			return "failed";
		case CANCELLED:
			return "cancelled";
	}
	return "unknown";
}
