#ifndef TALUSD_SCHEDULER_EVENTS_HPP
#define TALUSD_SCHEDULER_EVENTS_HPP

#include <string>

#include "model/job.hpp"
#include "execution/dispatcher/i_dispatcher.hpp"

namespace scheduler::event
{
	struct JobSubmitted
	{};

	struct CapacityChanged
	{};

	struct DispatchCompleted
	{
		job_id_t job_id;
		std::string worker_id;
		IDispatcher::DispatchHandle::Status status;
	};
}

#endif //TALUSD_SCHEDULER_EVENTS_HPP
