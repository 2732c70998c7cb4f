#include "controller/slave_controller.hpp"

#include "spdlog/spdlog.h"

#include "mapper/model_proto_mapper.hpp"
#include "utils/controller_utils.hpp"
#include "service/common_exceptions.hpp"


SlaveController::SlaveController(MasterService& master_service) noexcept
	: master_service_(master_service)
{
}

grpc::Status SlaveController::authorize_worker(grpc::ServerContext* context, const std::string& worker_id) const
{
	if(const auto status = require_role(context, Role::SLAVE); !status.ok())
	{
		return status;
	}

	const auto principal_id = extract_principal_id_from_context(context);
	if(!principal_id.has_value())
	{
		return {grpc::StatusCode::UNAUTHENTICATED, "Connection is not authenticated"};
	}

	try
	{
		master_service_.verify_worker_owner(worker_id, principal_id.value());
	}
	catch(const MasterError& error)
	{
		spdlog::info("Principal {} denied access to worker {}: {}", principal_id.value(), worker_id, error.what());
		return to_status(error, context);
	}

	return grpc::Status::OK;
}

grpc::Status SlaveController::register_slave(
		grpc::ServerContext* context,
		const talus::proto::RegisterSlaveRequest* request,
		talus::proto::RegisterSlaveResponse* response)
{
	using namespace grpc;

	if(const auto status = require_role(context, Role::SLAVE); !status.ok())
	{
		return status;
	}

	const auto principal_id = extract_principal_id_from_context(context);
	if(!principal_id.has_value())
	{
		return {StatusCode::UNAUTHENTICATED, "Connection is not authenticated"};
	}

	std::optional<Address> endpoint;
	if(request->has_endpoint())
	{
		try
		{
			endpoint = mapper::to_model(request->endpoint());
		}
		catch(const mapper::MappingError& error)
		{
			spdlog::info("Slave {} sent invalid endpoint: {}", request->worker_id(), error.what());
			return to_status(InvalidArgumentException(error.what()), context);
		}
	}

	try
	{
		const auto handle = master_service_.register_worker(request->worker_id(), request->capacity(), endpoint, principal_id);

		response->set_worker_id(handle.id);
		response->set_capacity(static_cast<uint32_t>(handle.capacity));
		response->set_created(handle.created);
	}
	catch(const MasterError& error)
	{
		spdlog::info("Failed to register slave {}: {}", request->worker_id(), error.what());
		return to_status(error, context);
	}
	catch(const std::runtime_error& error)
	{
		spdlog::error(error.what());
		return {StatusCode::INTERNAL, INTERNAL_ERROR_MSG};
	}

	return Status::OK;
}

grpc::Status SlaveController::heartbeat(
		grpc::ServerContext* context,
		const talus::proto::HeartbeatRequest* request,
		talus::proto::HeartbeatResponse* response)
{
	using namespace grpc;

	if(const auto status = authorize_worker(context, request->worker_id()); !status.ok())
	{
		return status;
	}

	try
	{
		const auto aborted_jobs = master_service_.heartbeat(request->worker_id());
		for(const auto job_id: aborted_jobs)
		{
			response->add_aborted_jobs(job_id);
		}
	}
	catch(const MasterError& error)
	{
		spdlog::debug("Rejected heartbeat from {}: {}", request->worker_id(), error.what());
		return to_status(error, context);
	}
	catch(const std::runtime_error& error)
	{
		spdlog::error(error.what());
		return {StatusCode::INTERNAL, INTERNAL_ERROR_MSG};
	}

	return Status::OK;
}

grpc::Status SlaveController::slave_status(
		grpc::ServerContext* context,
		const talus::proto::SlaveStatusRequest* request,
		talus::proto::SlaveStatusResponse* response)
{
	using namespace grpc;

	if(const auto status = authorize_worker(context, request->worker_id()); !status.ok())
	{
		return status;
	}

	try
	{
		response->set_status(mapper::to_proto(master_service_.get_worker_status(request->worker_id())));
	}
	catch(const MasterError& error)
	{
		return to_status(error, context);
	}
	catch(const std::runtime_error& error)
	{
		spdlog::error(error.what());
		return {StatusCode::INTERNAL, INTERNAL_ERROR_MSG};
	}

	return Status::OK;
}

grpc::Status SlaveController::dequeue_job(
		grpc::ServerContext* context,
		const talus::proto::DequeueJobRequest* request,
		talus::proto::DequeueJobResponse* response)
{
	using namespace grpc;

	if(const auto status = authorize_worker(context, request->worker_id()); !status.ok())
	{
		return status;
	}

	try
	{
		if(const auto job = master_service_.dequeue_for(request->worker_id()); job.has_value())
		{
			response->set_job_id(job->job_id);
			response->set_payload(job->payload);
		}
	}
	catch(const MasterError& error)
	{
		spdlog::debug("Slave {} failed to dequeue: {}", request->worker_id(), error.what());
		return to_status(error, context);
	}
	catch(const std::runtime_error& error)
	{
		spdlog::error(error.what());
		return {StatusCode::INTERNAL, INTERNAL_ERROR_MSG};
	}

	return Status::OK;
}

grpc::Status SlaveController::acknowledge_job(
		grpc::ServerContext* context,
		const talus::proto::AcknowledgeJobRequest* request,
		talus::proto::Empty* response)
{
	static_cast<void>(response);

	using namespace grpc;

	if(const auto status = authorize_worker(context, request->worker_id()); !status.ok())
	{
		return status;
	}

	try
	{
		master_service_.acknowledge(request->job_id(), request->worker_id());
	}
	catch(const MasterError& error)
	{
		spdlog::info("Rejected acknowledgement of job {} from {}: {}", request->job_id(), request->worker_id(), error.what());
		return to_status(error, context);
	}
	catch(const std::runtime_error& error)
	{
		spdlog::error(error.what());
		return {StatusCode::INTERNAL, INTERNAL_ERROR_MSG};
	}

	return Status::OK;
}

grpc::Status SlaveController::report_result(
		grpc::ServerContext* context,
		const talus::proto::ReportResultRequest* request,
		talus::proto::Empty* response)
{
	static_cast<void>(response);

	using namespace grpc;

	if(const auto status = authorize_worker(context, request->worker_id()); !status.ok())
	{
		return status;
	}

	try
	{
		master_service_.report(request->job_id(), request->worker_id(), mapper::to_model(request->outcome()));
	}
	catch(const MasterError& error)
	{
		spdlog::info("Rejected result of job {} from {}: {}", request->job_id(), request->worker_id(), error.what());
		return to_status(error, context);
	}
	catch(const std::runtime_error& error)
	{
		spdlog::error(error.what());
		return {StatusCode::INTERNAL, INTERNAL_ERROR_MSG};
	}

	return Status::OK;
}
