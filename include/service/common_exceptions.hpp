#ifndef TALUSD_COMMON_EXCEPTIONS_HPP
#define TALUSD_COMMON_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>


enum class ErrorKind
{
	UNKNOWN_WORKER,
	JOB_NOT_FOUND,
	INVALID_STATE,
	WORKER_MISMATCH,
	CAPACITY_EXCEEDED,
	TRANSPORT_FAILURE,
	INVALID_ARGUMENT
};

[[nodiscard]] const char* to_string(ErrorKind kind) noexcept;

struct MasterError: public std::runtime_error
{
	MasterError(ErrorKind error_kind, const std::string& message)
	: std::runtime_error(message), kind_(error_kind)
	{}

	[[nodiscard]] ErrorKind kind() const noexcept
	{
		return kind_;
	}

private:
	ErrorKind kind_;
};

struct UnknownWorkerException: public MasterError
{
	explicit UnknownWorkerException(const std::string& message): MasterError(ErrorKind::UNKNOWN_WORKER, message) {};
};

struct JobNotFoundException: public MasterError
{
	explicit JobNotFoundException(const std::string& message): MasterError(ErrorKind::JOB_NOT_FOUND, message) {};
};

struct InvalidStateException: public MasterError
{
	explicit InvalidStateException(const std::string& message): MasterError(ErrorKind::INVALID_STATE, message) {};
};

struct WorkerMismatchException: public MasterError
{
	explicit WorkerMismatchException(const std::string& message): MasterError(ErrorKind::WORKER_MISMATCH, message) {};
};

struct CapacityExceededException: public MasterError
{
	explicit CapacityExceededException(const std::string& message): MasterError(ErrorKind::CAPACITY_EXCEEDED, message) {};
};

struct TransportFailureException: public MasterError
{
	explicit TransportFailureException(const std::string& message): MasterError(ErrorKind::TRANSPORT_FAILURE, message) {};
};

struct InvalidArgumentException: public MasterError
{
	explicit InvalidArgumentException(const std::string& message): MasterError(ErrorKind::INVALID_ARGUMENT, message) {};
};


#endif //TALUSD_COMMON_EXCEPTIONS_HPP
