#ifndef TALUSD_SERVER_CREDENTIALS_HPP
#define TALUSD_SERVER_CREDENTIALS_HPP

#include <memory>

#include <grpcpp/grpcpp.h>

#include "service/auth_service.hpp"
#include "utils/config.hpp"


struct CredentialsError: public std::runtime_error
{
	using std::runtime_error::runtime_error;
};

// SSL credentials when configured, local TCP credentials otherwise. Both
// validate connection tokens, except on the authorization call itself.
[[nodiscard]] std::shared_ptr<grpc::ServerCredentials> build_server_credentials(
		const Config::SecurityConfig& config,
		const AuthService& auth_service
);

#endif //TALUSD_SERVER_CREDENTIALS_HPP
