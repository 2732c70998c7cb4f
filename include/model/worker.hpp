#ifndef TALUSD_WORKER_HPP
#define TALUSD_WORKER_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "utils/address.hpp"


enum class WorkerStatus
{
	ONLINE,
	BUSY,
	OFFLINE
};

struct Worker
{
	std::string id;
	WorkerStatus status;
	std::size_t capacity;
	std::size_t load;
	std::optional<Address> endpoint;
	uint64_t registration_order;
	uint64_t epoch;
	std::chrono::milliseconds heartbeat_age;
};

struct WorkerHandle
{
	std::string id;
	std::size_t capacity;
	uint64_t epoch;
	bool created;
};

[[nodiscard]] const char* to_string(WorkerStatus status) noexcept;

#endif //TALUSD_WORKER_HPP
