#ifndef TALUSD_SLAVE_CONTROLLER_HPP
#define TALUSD_SLAVE_CONTROLLER_HPP

#include <slave.grpc.pb.h>

#include "service/master_service.hpp"


class SlaveController: public talus::proto::Slave::Service
{
public:
	explicit SlaveController(MasterService& master_service) noexcept;

	grpc::Status register_slave(
			grpc::ServerContext* context,
			const talus::proto::RegisterSlaveRequest* request,
			talus::proto::RegisterSlaveResponse* response
	) override;

	grpc::Status heartbeat(
			grpc::ServerContext* context,
			const talus::proto::HeartbeatRequest* request,
			talus::proto::HeartbeatResponse* response
	) override;

	grpc::Status slave_status(
			grpc::ServerContext* context,
			const talus::proto::SlaveStatusRequest* request,
			talus::proto::SlaveStatusResponse* response
	) override;

	grpc::Status dequeue_job(
			grpc::ServerContext* context,
			const talus::proto::DequeueJobRequest* request,
			talus::proto::DequeueJobResponse* response
	) override;

	grpc::Status acknowledge_job(
			grpc::ServerContext* context,
			const talus::proto::AcknowledgeJobRequest* request,
			talus::proto::Empty* response
	) override;

	grpc::Status report_result(
			grpc::ServerContext* context,
			const talus::proto::ReportResultRequest* request,
			talus::proto::Empty* response
	) override;

private:
	MasterService& master_service_;

	// Slave role plus ownership of the worker id by the connected principal.
	grpc::Status authorize_worker(grpc::ServerContext* context, const std::string& worker_id) const;
};

#endif //TALUSD_SLAVE_CONTROLLER_HPP
