#ifndef TALUSD_GRPC_DISPATCHER_HPP
#define TALUSD_GRPC_DISPATCHER_HPP

#include <chrono>
#include <thread>
#include <unordered_map>
#include <variant>

#include <grpcpp/grpcpp.h>

#include "slave_agent.grpc.pb.h"

#include "execution/dispatcher/i_dispatcher.hpp"


class GrpcDispatcher: public IDispatcher
{
public:
	class GrpcDispatchHandle: public DispatchHandle
	{
	public:
		Status status() const noexcept override;

	private:
		friend class GrpcDispatcher;

		talus::proto::ExecuteResponse response_;
		grpc::ClientContext context_;
		grpc::Status status_;
		std::unique_ptr<grpc::ClientAsyncResponseReader<talus::proto::ExecuteResponse>> rpc_;

		void mark_completed() override;
	};

	explicit GrpcDispatcher(std::chrono::milliseconds dispatch_timeout);
	~GrpcDispatcher();

	std::shared_ptr<DispatchHandle> dispatch(const Address& endpoint, const DispatchRequest& request) override;
	void abort(const Address& endpoint, job_id_t job_id) override;

private:
	struct AbortCall
	{
		job_id_t job_id;
		talus::proto::Empty response;
		grpc::ClientContext context;
		grpc::Status status;
		std::unique_ptr<grpc::ClientAsyncResponseReader<talus::proto::Empty>> rpc;
	};

	using pending_call_t = std::variant<std::shared_ptr<GrpcDispatchHandle>, std::shared_ptr<AbortCall>>;

	std::chrono::milliseconds dispatch_timeout_;

	std::mutex stubs_mutex_;
	std::unordered_map<std::string, std::unique_ptr<talus::proto::SlaveAgent::Stub>> stubs_;

	grpc::CompletionQueue completion_queue_;

	std::mutex calls_mutex_;
	std::unordered_map<void*, pending_call_t> calls_;

	std::jthread thread_;

	talus::proto::SlaveAgent::Stub& stub_for(const Address& endpoint);

	static void thread_body(GrpcDispatcher& dispatcher);
};

#endif //TALUSD_GRPC_DISPATCHER_HPP
