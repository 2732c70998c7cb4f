#include "service/common_exceptions.hpp"


const char* to_string(ErrorKind kind) noexcept
{
	using enum ErrorKind;
	switch(kind)
	{
		case UNKNOWN_WORKER:
			return "UnknownWorker";
		case JOB_NOT_FOUND:
			return "JobNotFound";
		case INVALID_STATE:
			return "InvalidState";
		case WORKER_MISMATCH:
			return "WorkerMismatch";
		case CAPACITY_EXCEEDED:
			return "CapacityExceeded";
		case TRANSPORT_FAILURE:
			return "TransportFailure";
		case INVALID_ARGUMENT:
			return "InvalidArgument";
	}
	return "Unknown";
}
