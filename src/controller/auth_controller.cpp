#include "controller/auth_controller.hpp"

#include <optional>

#include "spdlog/spdlog.h"

#include "utils/controller_utils.hpp"


AuthController::AuthController(AuthService& auth_service) noexcept
	: auth_service_(auth_service)
{
}

grpc::Status AuthController::authorize_connection(
		grpc::ServerContext* context,
		const talus::proto::AuthenticationToken* request,
		talus::proto::ConnectionToken* response)
{
	using namespace grpc;

	std::optional<std::string> connection_token;
	try
	{
		connection_token = auth_service_.authenticate(request->access_key());
	}
	catch(const AuthenticationError& error)
	{
		spdlog::info("Refused connection token for {}: {}", context->peer(), error.what());
		return {StatusCode::UNAUTHENTICATED, error.what()};
	}
	catch(const std::runtime_error& error)
	{
		spdlog::error("Failed to issue connection token: {}", error.what());
		return {StatusCode::INTERNAL, INTERNAL_ERROR_MSG};
	}

	if(!connection_token.has_value())
	{
		spdlog::info("Refused connection token for {}: unknown access key", context->peer());
		return {StatusCode::UNAUTHENTICATED, "Invalid access key"};
	}

	response->set_token(std::move(connection_token.value()));
	spdlog::debug("Connection token issued to {}", context->peer());

	return Status::OK;
}
