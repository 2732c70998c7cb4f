#include "model/worker.hpp"


const char* to_string(WorkerStatus status) noexcept
{
	using enum WorkerStatus;
	switch(status)
	{
		case ONLINE:
			return "online";
		case BUSY:
			return "busy";
		case OFFLINE:
			return "offline";
	}
	return "unknown";
}
