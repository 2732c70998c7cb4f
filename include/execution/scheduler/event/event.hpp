#ifndef TALUSD_SCHEDULER_EVENT_HPP
#define TALUSD_SCHEDULER_EVENT_HPP

#include <variant>

#include "execution/scheduler/event/scheduler_events.hpp"


namespace scheduler
{
	using SchedulerEvent = std::variant<event::JobSubmitted, event::CapacityChanged, event::DispatchCompleted>;
}

#endif //TALUSD_SCHEDULER_EVENT_HPP
