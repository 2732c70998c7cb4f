#ifndef TALUSD_MASTER_CONTROLLER_HPP
#define TALUSD_MASTER_CONTROLLER_HPP

#include <master.grpc.pb.h>

#include "service/master_service.hpp"


class MasterController: public talus::proto::Master::Service
{
public:
	explicit MasterController(MasterService& master_service) noexcept;

	grpc::Status master_info(
			grpc::ServerContext* context,
			const talus::proto::Empty* request,
			talus::proto::MasterInfo* response
	) override;

	grpc::Status slave_list(
			grpc::ServerContext* context,
			const talus::proto::Empty* request,
			talus::proto::SlaveList* response
	) override;

	grpc::Status submit_job(
			grpc::ServerContext* context,
			const talus::proto::SubmitJobRequest* request,
			talus::proto::JobHandle* response
	) override;

	grpc::Status cancel_job(
			grpc::ServerContext* context,
			const talus::proto::JobHandle* request,
			talus::proto::Empty* response
	) override;

	grpc::Status get_result(
			grpc::ServerContext* context,
			const talus::proto::JobHandle* request,
			talus::proto::JobResult* response
	) override;

	grpc::Status describe_job(
			grpc::ServerContext* context,
			const talus::proto::JobHandle* request,
			talus::proto::JobDescription* response
	) override;

	grpc::Status peek_next(
			grpc::ServerContext* context,
			const talus::proto::Empty* request,
			talus::proto::PeekNextResponse* response
	) override;

private:
	MasterService& master_service_;
};

#endif //TALUSD_MASTER_CONTROLLER_HPP
