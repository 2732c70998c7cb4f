#ifndef TALUSD_MODEL_PROTO_MAPPER_HPP
#define TALUSD_MODEL_PROTO_MAPPER_HPP

#include <stdexcept>

#include <common.pb.h>
#include <master.pb.h>

#include "model/job.hpp"
#include "model/worker.hpp"
#include "utils/address.hpp"


namespace mapper
{
	struct MappingError: public std::runtime_error
	{
		using std::runtime_error::runtime_error;
	};

	[[nodiscard]] talus::proto::WorkerStatus to_proto(WorkerStatus status);
	[[nodiscard]] talus::proto::JobState to_proto(JobState state);
	[[nodiscard]] talus::proto::JobOutcome to_proto(const JobOutcome& outcome);
	[[nodiscard]] talus::proto::Endpoint to_proto(const Address& address);
	[[nodiscard]] talus::proto::SlaveSummary to_proto(const Worker& worker);
	[[nodiscard]] talus::proto::JobDescription to_proto(const Job& job);

	[[nodiscard]] WorkerStatus to_model(talus::proto::WorkerStatus status);
	[[nodiscard]] JobState to_model(talus::proto::JobState state);
	[[nodiscard]] JobOutcome to_model(const talus::proto::JobOutcome& outcome_proto);
	[[nodiscard]] Address to_model(const talus::proto::Endpoint& endpoint_proto);
}

#endif //TALUSD_MODEL_PROTO_MAPPER_HPP
