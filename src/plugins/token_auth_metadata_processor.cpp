#include "plugins/token_auth_metadata_processor.hpp"

#include <cstring>
#include <utility>

#include "spdlog/spdlog.h"

#include "utils/string_utils.hpp"


namespace
{
	constexpr const char* const BEARER_PREFIX = "Bearer";
	constexpr const char* const PATH_KEY = ":path";
}

TokenAuthMetadataProcessor::TokenAuthMetadataProcessor(
		const AuthService& auth_service,
		std::vector<std::string> paths_not_secured):
	auth_service_(auth_service),
	paths_not_secured_(std::move(paths_not_secured))
{
}

grpc::Status TokenAuthMetadataProcessor::pin_principal(const AuthService::Principal& principal, grpc::AuthContext* context) const
{
	using namespace grpc;

	const auto principal_id_str = std::to_string(principal.id);

	if(const auto pinned = context->FindPropertyValues(PEER_IDENTITY_PROPERTY_NAME); !pinned.empty())
	{
		if(principal_id_str != std::string(pinned.front().data(), pinned.front().length()))
		{
			return {StatusCode::UNAUTHENTICATED, "Connection already used by other principal. Please open new connection to server"};
		}

		return Status::OK;
	}

	context->AddProperty(PEER_IDENTITY_PROPERTY_NAME, principal_id_str);
	context->AddProperty(PEER_ROLE_PROPERTY_NAME, to_string(principal.role));
	context->SetPeerIdentityPropertyName(PEER_IDENTITY_PROPERTY_NAME);

	return Status::OK;
}

grpc::Status TokenAuthMetadataProcessor::Process(
		const InputMetadata& auth_metadata,
		grpc::AuthContext* context,
		OutputMetadata* consumed_auth_metadata,
		OutputMetadata* response_metadata)
{
	static_cast<void>(response_metadata);

	using namespace grpc;

	if(const auto path = auth_metadata.find(PATH_KEY); path != std::end(auth_metadata))
	{
		const bool matched = std::ranges::any_of(
				paths_not_secured_,
				[&path](const auto& open_path)
				{
					return open_path == path->second;
				}
		);

		if(matched)
		{
			return Status::OK;
		}
	}

	const auto token_metadata = auth_metadata.find(AUTH_TOKEN_KEY);
	if(token_metadata == std::end(auth_metadata))
	{
		return {StatusCode::UNAUTHENTICATED, "No token provided"};
	}

	const auto token_metadata_value = std::string(token_metadata->second.data(), token_metadata->second.length());
	if(!token_metadata_value.starts_with(BEARER_PREFIX))
	{
		spdlog::info("Invalid auth token format");
		return {StatusCode::UNAUTHENTICATED, "Invalid auth token format"};
	}

	auto token_metadata_value_begin = std::begin(token_metadata_value);
	std::advance(token_metadata_value_begin, std::strlen(BEARER_PREFIX));

	const auto token_value = trim(token_metadata_value_begin, std::end(token_metadata_value));

	try
	{
		const auto token = auth_service_.load_token(token_value);
		if(!auth_service_.is_auth_token_valid(token))
		{
			spdlog::info("Auth token expired");
			return {StatusCode::UNAUTHENTICATED, "Auth token expired"};
		}

		const auto principal = auth_service_.principal(token.principal_id);
		if(!principal.has_value())
		{
			return {StatusCode::UNAUTHENTICATED, "Unknown principal"};
		}

		if(const auto status = pin_principal(principal.value(), context); !status.ok())
		{
			return status;
		}

		consumed_auth_metadata->insert(std::make_pair(
				std::string(token_metadata->first.data(), token_metadata->first.length()),
				token_metadata_value));

		return Status::OK;
	}
	catch(const InvalidTokenError& error)
	{
		spdlog::info("Failed to decode connection token");
		return {StatusCode::UNAUTHENTICATED, error.what()};
	}
}
