#include "execution/dispatcher/grpc_dispatcher.hpp"

#include <bit>
#include <optional>

#include "spdlog/spdlog.h"


namespace
{
	template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
	template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
}

void GrpcDispatcher::GrpcDispatchHandle::mark_completed()
{
	spdlog::debug(
			"Dispatch finished with status: {} {}",
			status_.ok() ? "OK" : "NOT OK", status_.error_message()
	);
	DispatchHandle::mark_completed();
}

IDispatcher::DispatchHandle::Status GrpcDispatcher::GrpcDispatchHandle::status() const noexcept
{
	using enum Status;
	if(!completed())
	{
		return PENDING;
	}

	if(status_.ok())
	{
		return response_.accepted() ? ACKNOWLEDGED : REJECTED;
	}

	if(status_.error_code() == grpc::StatusCode::DEADLINE_EXCEEDED)
	{
		return TIME_OUT;
	}

	return REJECTED;
}

GrpcDispatcher::GrpcDispatcher(std::chrono::milliseconds dispatch_timeout)
	: dispatch_timeout_(dispatch_timeout)
{
	spdlog::info("Dispatch transport: grpc, timeout {} ms", dispatch_timeout_.count());

	thread_ = std::jthread([dispatcher = this]()
	{
		thread_body(*dispatcher);
	});
}

GrpcDispatcher::~GrpcDispatcher()
{
	completion_queue_.Shutdown();
	thread_.join();
}

talus::proto::SlaveAgent::Stub& GrpcDispatcher::stub_for(const Address& endpoint)
{
	std::unique_lock lock(stubs_mutex_);

	const auto address = endpoint.to_string();
	auto iter = stubs_.find(address);
	if(iter == std::end(stubs_))
	{
		auto channel = grpc::CreateChannel(address, grpc::InsecureChannelCredentials());
		iter = stubs_.try_emplace(address, talus::proto::SlaveAgent::NewStub(channel)).first;
		spdlog::debug("Opened channel to slave agent {}", address);
	}

	return *iter->second;
}

void GrpcDispatcher::thread_body(GrpcDispatcher& dispatcher)
{
	void* tag = nullptr;
	bool ok = false;

	while(true)
	{
		if(!dispatcher.completion_queue_.Next(&tag, &ok))
		{
			return;
		}

		std::optional<pending_call_t> call;
		{
			std::unique_lock lock(dispatcher.calls_mutex_);

			const auto iter = dispatcher.calls_.find(tag);
			if(iter == std::end(dispatcher.calls_))
			{
				spdlog::error("Completion for unknown dispatch call");
				continue;
			}

			call = std::move(iter->second);
			dispatcher.calls_.erase(iter);
		}

		std::visit(
			overloaded{
				[](const std::shared_ptr<GrpcDispatchHandle>& handle) { handle->mark_completed(); },
				[](const std::shared_ptr<AbortCall>& abort_call)
				{
					if(!abort_call->status.ok())
					{
						spdlog::info("Abort of job {} not delivered: {}", abort_call->job_id, abort_call->status.error_message());
					}
				}
			},
			call.value()
		);
	}
}

std::shared_ptr<IDispatcher::DispatchHandle> GrpcDispatcher::dispatch(const Address& endpoint, const DispatchRequest& request)
{
	auto& stub = stub_for(endpoint);

	auto handle = std::make_shared<GrpcDispatchHandle>();
	const auto tag = std::bit_cast<void*>(handle.get());

	talus::proto::ExecuteRequest request_proto;
	request_proto.set_job_id(request.job_id);
	request_proto.set_payload(request.payload);

	handle->context_.set_deadline(std::chrono::system_clock::now() + dispatch_timeout_);

	{
		std::unique_lock lock(calls_mutex_);
		calls_.try_emplace(tag, handle);
	}

	handle->rpc_ = stub.Asyncexecute(&handle->context_, request_proto, &completion_queue_);
	handle->rpc_->Finish(&handle->response_, &handle->status_, tag);

	spdlog::debug("Job {} dispatched to {}", request.job_id, endpoint.to_string());

	return handle;
}

void GrpcDispatcher::abort(const Address& endpoint, job_id_t job_id)
{
	auto& stub = stub_for(endpoint);

	auto call = std::make_shared<AbortCall>();
	call->job_id = job_id;
	call->context.set_deadline(std::chrono::system_clock::now() + dispatch_timeout_);
	const auto tag = std::bit_cast<void*>(call.get());

	talus::proto::AbortRequest request_proto;
	request_proto.set_job_id(job_id);

	{
		std::unique_lock lock(calls_mutex_);
		calls_.try_emplace(tag, call);
	}

	call->rpc = stub.Asyncabort(&call->context, request_proto, &completion_queue_);
	call->rpc->Finish(&call->response, &call->status, tag);

	spdlog::debug("Abort of job {} sent to {}", job_id, endpoint.to_string());
}
