#include "service/auth_service.hpp"

#include <paseto.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>


const char* const AuthService::footer = "talusd";

const char* to_string(Role role) noexcept
{
	switch(role)
	{
		case Role::CLIENT:
			return "client";
		case Role::SLAVE:
			return "slave";
	}

	return "unknown";
}

Role role_from_string(const std::string& role)
{
	if(role == "client")
	{
		return Role::CLIENT;
	}
	if(role == "slave")
	{
		return Role::SLAVE;
	}

	throw std::invalid_argument("Unknown role: " + role);
}

std::array<uint8_t, 16> AuthService::AuthToken::to_binarray() const
{
	std::array<uint8_t, 16> binarray{};

	memcpy(binarray.data(), reinterpret_cast<const std::byte*>(&principal_id), sizeof(principal_id));
	const auto session_start_from_epoch = session_start_time.time_since_epoch();
	const auto timestamp = std::chrono::duration_cast<std::chrono::seconds>(session_start_from_epoch).count();

	memcpy(binarray.data() + sizeof(principal_id), reinterpret_cast<const std::byte*>(&timestamp), sizeof(timestamp));

	return binarray;
}

AuthService::AuthToken AuthService::AuthToken::from_binarray(const std::array<uint8_t, 16>& bin_token)
{
	AuthToken token{};

	memcpy(reinterpret_cast<std::byte*>(&token.principal_id), bin_token.data(), sizeof(principal_id));

	int64_t timestamp;
	memcpy(reinterpret_cast<std::byte*>(&timestamp), bin_token.data() + sizeof(principal_id), sizeof(timestamp));

	std::chrono::seconds seconds_from_epoch(timestamp);
	token.session_start_time = std::chrono::time_point<std::chrono::system_clock>{seconds_from_epoch};

	return token;
}

AuthService::AuthService(const paseto_key_type& key, std::chrono::seconds token_lifetime, std::vector<AccessKey> access_keys)
	:key_(key), token_lifetime_(token_lifetime), access_keys_(std::move(access_keys))
{
}

std::optional<std::string> AuthService::authenticate(std::string_view access_key) const
{
	const auto access_key_iter = std::ranges::find_if(
			access_keys_,
			[&access_key](const auto& configured){ return configured.key == access_key; }
	);

	if(access_key_iter == std::end(access_keys_))
	{
		return std::nullopt;
	}

	const auto principal_id = static_cast<uint64_t>(std::distance(std::begin(access_keys_), access_key_iter));
	AuthToken token {.principal_id = principal_id, .session_start_time = std::chrono::system_clock::now()};

	const auto token_binarray = token.to_binarray();
	const auto encrypted_token = paseto_v2_local_encrypt(
			token_binarray.data(),
			token_binarray.size(),
			key_.data(),
			reinterpret_cast<const uint8_t*>(AuthService::footer),
			std::strlen(AuthService::footer)
	);

	if(!encrypted_token)
	{
		throw AuthenticationError("Failed to issue connection token");
	}

	std::string token_str(encrypted_token);
	paseto_free(encrypted_token);

	spdlog::info("Issued connection token for {} ({})", access_key_iter->name, to_string(access_key_iter->role));

	return token_str;
}

AuthService::AuthToken AuthService::load_token(const std::string& connection_token) const
{
	const auto token_size = std::tuple_size_v<AuthToken::token_bin_type>;
	size_t decrypted_size = 0;

	const auto token_data = paseto_v2_local_decrypt(connection_token.c_str(), &decrypted_size, key_.data(), nullptr, nullptr);
	if(!token_data)
	{
		throw InvalidTokenError("Invalid token format");
	}

	if(decrypted_size != token_size)
	{
		paseto_free(token_data);
		throw InvalidTokenError("Invalid token format");
	}

	AuthToken::token_bin_type token_bin{};
	std::copy(token_data, token_data + token_size, std::begin(token_bin));
	paseto_free(token_data);

	return AuthToken::from_binarray(token_bin);
}

bool AuthService::is_auth_token_valid(
		const AuthToken& auth_token,
		std::chrono::time_point<std::chrono::system_clock> point
) const noexcept
{
	return auth_token.principal_id < access_keys_.size() && auth_token.session_start_time + token_lifetime_ > point;
}

std::optional<AuthService::Principal> AuthService::principal(uint64_t principal_id) const
{
	if(principal_id >= access_keys_.size())
	{
		return std::nullopt;
	}

	const auto& access_key = access_keys_[principal_id];
	return Principal{principal_id, access_key.name, access_key.role};
}

uint64_t AuthService::principal_id_from_string(const std::string& principal_id_string)
{
	std::size_t processed_size = 0;
	uint64_t principal_id = 0;
	try
	{
		principal_id = std::stoull(principal_id_string, &processed_size);
	}
	catch(const std::logic_error&)
	{
		throw InvalidTokenError("Malformed principal identifier " + principal_id_string);
	}

	if(processed_size != principal_id_string.size())
	{
		throw InvalidTokenError("Malformed principal identifier " + principal_id_string);
	}

	return principal_id;
}
