#ifndef TALUSD_I_SCHEDULER_HPP
#define TALUSD_I_SCHEDULER_HPP

#include "execution/scheduler/event/event.hpp"


namespace scheduler
{
	class IScheduler
	{
	public:
		virtual ~IScheduler() = default;

		virtual void send_event(SchedulerEvent event) = 0;
	};
}

#endif //TALUSD_I_SCHEDULER_HPP
