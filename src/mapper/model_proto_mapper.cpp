#include "mapper/model_proto_mapper.hpp"

#include <limits>


namespace mapper
{
	talus::proto::WorkerStatus to_proto(WorkerStatus status)
	{
		switch(status)
		{
			case WorkerStatus::ONLINE:
				return talus::proto::WORKER_ONLINE;
			case WorkerStatus::BUSY:
				return talus::proto::WORKER_BUSY;
			case WorkerStatus::OFFLINE:
				return talus::proto::WORKER_OFFLINE;
			default:
				throw MappingError("Proto schema, model mismatch");
		}
	}

	talus::proto::JobState to_proto(JobState state)
	{
		switch(state)
		{
			case JobState::QUEUED:
				return talus::proto::JOB_QUEUED;
			case JobState::ASSIGNED:
				return talus::proto::JOB_ASSIGNED;
			case JobState::RUNNING:
				return talus::proto::JOB_RUNNING;
			case JobState::COMPLETED:
				return talus::proto::JOB_COMPLETED;
			case JobState::FAILED:
				return talus::proto::JOB_FAILED;
			case JobState::CANCELLED:
				return talus::proto::JOB_CANCELLED;
			default:
				throw MappingError("Proto schema, model mismatch");
		}
	}

	talus::proto::JobOutcome to_proto(const JobOutcome& outcome)
	{
		talus::proto::JobOutcome outcome_proto;

		outcome_proto.set_success(outcome.success);
		outcome_proto.set_status_code(outcome.status_code);
		outcome_proto.set_data(outcome.data);

		return outcome_proto;
	}

	talus::proto::Endpoint to_proto(const Address& address)
	{
		talus::proto::Endpoint endpoint_proto;

		endpoint_proto.set_hostname(address.hostname);
		endpoint_proto.set_port(address.port);

		return endpoint_proto;
	}

	talus::proto::SlaveSummary to_proto(const Worker& worker)
	{
		talus::proto::SlaveSummary summary;

		summary.set_id(worker.id);
		summary.set_status(to_proto(worker.status));
		summary.set_capacity(static_cast<uint32_t>(worker.capacity));
		summary.set_load(static_cast<uint32_t>(worker.load));
		if(worker.endpoint.has_value())
		{
			*summary.mutable_endpoint() = to_proto(worker.endpoint.value());
		}
		summary.set_heartbeat_age_ms(static_cast<uint64_t>(worker.heartbeat_age.count()));

		return summary;
	}

	talus::proto::JobDescription to_proto(const Job& job)
	{
		talus::proto::JobDescription description;

		description.set_job_id(job.id);
		description.set_state(to_proto(job.state));
		if(job.worker_id.has_value())
		{
			description.set_worker_id(job.worker_id.value());
		}

		const auto submission_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(job.submission_time.time_since_epoch());
		description.set_submission_time_ms(static_cast<uint64_t>(submission_time_ms.count()));
		description.set_dispatch_attempts(job.dispatch_attempts);

		return description;
	}

	WorkerStatus to_model(talus::proto::WorkerStatus status)
	{
		switch(status)
		{
			case talus::proto::WORKER_ONLINE:
				return WorkerStatus::ONLINE;
			case talus::proto::WORKER_BUSY:
				return WorkerStatus::BUSY;
			case talus::proto::WORKER_OFFLINE:
				return WorkerStatus::OFFLINE;
			default:
				throw MappingError("Proto schema, model mismatch");
		}
	}

	JobState to_model(talus::proto::JobState state)
	{
		switch(state)
		{
			case talus::proto::JOB_QUEUED:
				return JobState::QUEUED;
			case talus::proto::JOB_ASSIGNED:
				return JobState::ASSIGNED;
			case talus::proto::JOB_RUNNING:
				return JobState::RUNNING;
			case talus::proto::JOB_COMPLETED:
				return JobState::COMPLETED;
			case talus::proto::JOB_FAILED:
				return JobState::FAILED;
			case talus::proto::JOB_CANCELLED:
				return JobState::CANCELLED;
			default:
				throw MappingError("Proto schema, model mismatch");
		}
	}

	JobOutcome to_model(const talus::proto::JobOutcome& outcome_proto)
	{
		return JobOutcome{outcome_proto.success(), outcome_proto.status_code(), outcome_proto.data()};
	}

	Address to_model(const talus::proto::Endpoint& endpoint_proto)
	{
		if(endpoint_proto.hostname().empty())
		{
			throw MappingError("Endpoint without hostname");
		}

		if(endpoint_proto.port() == 0 || endpoint_proto.port() > std::numeric_limits<uint16_t>::max())
		{
			throw MappingError("Endpoint port out of range");
		}

		return Address{endpoint_proto.hostname(), static_cast<uint16_t>(endpoint_proto.port())};
	}
}
