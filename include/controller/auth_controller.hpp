#ifndef TALUSD_AUTH_CONTROLLER_HPP
#define TALUSD_AUTH_CONTROLLER_HPP

#include <auth.grpc.pb.h>

#include "service/auth_service.hpp"


class AuthController: public talus::proto::Auth::Service
{
public:
	explicit AuthController(AuthService& auth_service) noexcept;

	grpc::Status authorize_connection(
			grpc::ServerContext* context,
			const talus::proto::AuthenticationToken* request,
			talus::proto::ConnectionToken* response
	) override;

private:
	AuthService& auth_service_;
};

#endif //TALUSD_AUTH_CONTROLLER_HPP
