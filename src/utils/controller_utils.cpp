#include "utils/controller_utils.hpp"

#include "plugins/token_auth_metadata_processor.hpp"


grpc::StatusCode to_status_code(ErrorKind kind) noexcept
{
	using enum ErrorKind;

	switch(kind)
	{
		case UNKNOWN_WORKER:
		case JOB_NOT_FOUND:
			return grpc::StatusCode::NOT_FOUND;
		case INVALID_STATE:
			return grpc::StatusCode::FAILED_PRECONDITION;
		case WORKER_MISMATCH:
			return grpc::StatusCode::PERMISSION_DENIED;
		case CAPACITY_EXCEEDED:
			return grpc::StatusCode::RESOURCE_EXHAUSTED;
		case TRANSPORT_FAILURE:
			return grpc::StatusCode::UNAVAILABLE;
		case INVALID_ARGUMENT:
			return grpc::StatusCode::INVALID_ARGUMENT;
	}

	return grpc::StatusCode::INTERNAL;
}

grpc::Status to_status(const MasterError& error, grpc::ServerContext* context)
{
	const auto kind = to_string(error.kind());

	if(context != nullptr)
	{
		context->AddTrailingMetadata(ERROR_KIND_METADATA_KEY, kind);
	}

	return {to_status_code(error.kind()), std::string(kind) + ": " + error.what()};
}

std::optional<Role> extract_role_from_context(const grpc::ServerContext* context)
{
	if(context == nullptr || context->auth_context() == nullptr)
	{
		return std::nullopt;
	}

	const auto role_property = context->auth_context()->FindPropertyValues(TokenAuthMetadataProcessor::PEER_ROLE_PROPERTY_NAME);
	if(role_property.empty())
	{
		return std::nullopt;
	}

	try
	{
		return role_from_string(std::string(role_property.front().data(), role_property.front().length()));
	}
	catch(const std::invalid_argument&)
	{
		return std::nullopt;
	}
}

std::optional<uint64_t> extract_principal_id_from_context(const grpc::ServerContext* context)
{
	if(context == nullptr || context->auth_context() == nullptr)
	{
		return std::nullopt;
	}

	const auto identity = context->auth_context()->GetPeerIdentity();
	if(identity.empty())
	{
		return std::nullopt;
	}

	try
	{
		return AuthService::principal_id_from_string(std::string(identity.front().data(), identity.front().length()));
	}
	catch(const InvalidTokenError&)
	{
		return std::nullopt;
	}
}

grpc::Status require_role(const grpc::ServerContext* context, Role role)
{
	const auto connection_role = extract_role_from_context(context);
	if(!connection_role.has_value())
	{
		return {grpc::StatusCode::UNAUTHENTICATED, "Connection is not authenticated"};
	}

	if(connection_role.value() != role)
	{
		return {grpc::StatusCode::PERMISSION_DENIED, std::string("Operation requires role ") + to_string(role)};
	}

	return grpc::Status::OK;
}
