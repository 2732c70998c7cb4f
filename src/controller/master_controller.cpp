#include "controller/master_controller.hpp"

#include "spdlog/spdlog.h"

#include "mapper/model_proto_mapper.hpp"
#include "utils/controller_utils.hpp"
#include "service/common_exceptions.hpp"


namespace
{
	template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
	template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
}

MasterController::MasterController(MasterService& master_service) noexcept
	: master_service_(master_service)
{
}

grpc::Status MasterController::master_info(
		grpc::ServerContext* context,
		const talus::proto::Empty* request,
		talus::proto::MasterInfo* response)
{
	static_cast<void>(request);

	using namespace grpc;

	if(const auto status = require_role(context, Role::CLIENT); !status.ok())
	{
		return status;
	}

	try
	{
		const auto info = master_service_.master_info();

		response->set_worker_count(info.worker_count);
		response->set_online_count(info.online_count);
		response->set_queued_count(info.queued_count);
		response->set_running_count(info.running_count);
		response->set_completed_count(info.completed_count);
		response->set_failed_count(info.failed_count);
		response->set_cancelled_count(info.cancelled_count);
		response->set_total_submitted(info.total_submitted);
	}
	catch(const std::runtime_error& error)
	{
		spdlog::error(error.what());
		return {StatusCode::INTERNAL, INTERNAL_ERROR_MSG};
	}

	return Status::OK;
}

grpc::Status MasterController::slave_list(
		grpc::ServerContext* context,
		const talus::proto::Empty* request,
		talus::proto::SlaveList* response)
{
	static_cast<void>(request);

	using namespace grpc;

	if(const auto status = require_role(context, Role::CLIENT); !status.ok())
	{
		return status;
	}

	try
	{
		const auto workers = master_service_.slave_list();

		response->mutable_slaves()->Reserve(static_cast<int>(workers.size()));
		for(const auto& worker: workers)
		{
			*response->add_slaves() = mapper::to_proto(worker);
		}
	}
	catch(const std::runtime_error& error)
	{
		spdlog::error(error.what());
		return {StatusCode::INTERNAL, INTERNAL_ERROR_MSG};
	}

	return Status::OK;
}

grpc::Status MasterController::submit_job(
		grpc::ServerContext* context,
		const talus::proto::SubmitJobRequest* request,
		talus::proto::JobHandle* response)
{
	using namespace grpc;

	if(const auto status = require_role(context, Role::CLIENT); !status.ok())
	{
		return status;
	}

	try
	{
		const auto job_id = master_service_.submit(request->payload());
		response->set_job_id(job_id);
		spdlog::info("Job {} submitted by {}", job_id, context->peer());
	}
	catch(const MasterError& error)
	{
		spdlog::info("Failed to submit job: {}", error.what());
		return to_status(error, context);
	}
	catch(const std::runtime_error& error)
	{
		spdlog::error(error.what());
		return {StatusCode::INTERNAL, INTERNAL_ERROR_MSG};
	}

	return Status::OK;
}

grpc::Status MasterController::cancel_job(
		grpc::ServerContext* context,
		const talus::proto::JobHandle* request,
		talus::proto::Empty* response)
{
	static_cast<void>(response);

	using namespace grpc;

	if(const auto status = require_role(context, Role::CLIENT); !status.ok())
	{
		return status;
	}

	try
	{
		master_service_.cancel(request->job_id());
	}
	catch(const MasterError& error)
	{
		spdlog::info("Failed to cancel job {}: {}", request->job_id(), error.what());
		return to_status(error, context);
	}
	catch(const std::runtime_error& error)
	{
		spdlog::error(error.what());
		return {StatusCode::INTERNAL, INTERNAL_ERROR_MSG};
	}

	return Status::OK;
}

grpc::Status MasterController::get_result(
		grpc::ServerContext* context,
		const talus::proto::JobHandle* request,
		talus::proto::JobResult* response)
{
	using namespace grpc;

	if(const auto status = require_role(context, Role::CLIENT); !status.ok())
	{
		return status;
	}

	try
	{
		const auto result = master_service_.get_result(request->job_id());

		response->set_job_id(request->job_id());
		std::visit(
			overloaded{
				[response](const ResultAggregator::Pending& pending)
				{
					response->set_state(mapper::to_proto(pending.state));
					response->set_pending(true);
				},
				[response](const ResultAggregator::Finished& finished)
				{
					response->set_state(mapper::to_proto(finished.state));
					response->set_pending(false);
					if(finished.outcome.has_value())
					{
						*response->mutable_outcome() = mapper::to_proto(finished.outcome.value());
					}
				}
			},
			result
		);
	}
	catch(const MasterError& error)
	{
		spdlog::debug("Failed to get result of job {}: {}", request->job_id(), error.what());
		return to_status(error, context);
	}
	catch(const std::runtime_error& error)
	{
		spdlog::error(error.what());
		return {StatusCode::INTERNAL, INTERNAL_ERROR_MSG};
	}

	return Status::OK;
}

grpc::Status MasterController::describe_job(
		grpc::ServerContext* context,
		const talus::proto::JobHandle* request,
		talus::proto::JobDescription* response)
{
	using namespace grpc;

	if(const auto status = require_role(context, Role::CLIENT); !status.ok())
	{
		return status;
	}

	try
	{
		*response = mapper::to_proto(master_service_.job_info(request->job_id()));
	}
	catch(const MasterError& error)
	{
		spdlog::debug("Failed to describe job {}: {}", request->job_id(), error.what());
		return to_status(error, context);
	}
	catch(const std::runtime_error& error)
	{
		spdlog::error(error.what());
		return {StatusCode::INTERNAL, INTERNAL_ERROR_MSG};
	}

	return Status::OK;
}

grpc::Status MasterController::peek_next(
		grpc::ServerContext* context,
		const talus::proto::Empty* request,
		talus::proto::PeekNextResponse* response)
{
	static_cast<void>(request);

	using namespace grpc;

	if(const auto status = require_role(context, Role::CLIENT); !status.ok())
	{
		return status;
	}

	if(const auto job_id = master_service_.peek_next(); job_id.has_value())
	{
		response->set_job_id(job_id.value());
	}

	return Status::OK;
}
