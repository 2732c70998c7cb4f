#ifndef TALUSD_AUTH_SERVICE_HPP
#define TALUSD_AUTH_SERVICE_HPP

#include <array>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "utils/paseto_utils.hpp"


struct AuthenticationError: public std::runtime_error
{
	explicit AuthenticationError(const std::string& arg): std::runtime_error(arg) {};
};

struct InvalidTokenError: public std::runtime_error
{
	explicit InvalidTokenError(const std::string& arg): std::runtime_error(arg) {};
};

enum class Role
{
	CLIENT,
	SLAVE
};

[[nodiscard]] const char* to_string(Role role) noexcept;
[[nodiscard]] Role role_from_string(const std::string& role);

struct AccessKey
{
	std::string name;
	std::string key;
	Role role;
};

class AuthService
{
public:
	struct Principal
	{
		uint64_t id;
		std::string name;
		Role role;
	};

	struct AuthToken
	{
		using token_bin_type = std::array<uint8_t, 16>;

		uint64_t principal_id{};
		std::chrono::time_point<std::chrono::system_clock> session_start_time{};

		[[nodiscard]] token_bin_type to_binarray() const;
		static AuthToken from_binarray(const token_bin_type& bin_token);
	};

	static const char* const footer;

	AuthService(const paseto_key_type& key, std::chrono::seconds token_lifetime, std::vector<AccessKey> access_keys);

	[[nodiscard]] std::optional<std::string> authenticate(std::string_view access_key) const;
	[[nodiscard]] AuthToken load_token(const std::string& connection_token) const;
	[[nodiscard]] bool is_auth_token_valid(
			const AuthToken& auth_token,
			std::chrono::time_point<std::chrono::system_clock> point = std::chrono::system_clock::now()
	) const noexcept;

	[[nodiscard]] std::optional<Principal> principal(uint64_t principal_id) const;

	static uint64_t principal_id_from_string(const std::string& principal_id_string);

private:
	paseto_key_type key_;
	std::chrono::seconds token_lifetime_;
	std::vector<AccessKey> access_keys_;
};

#endif //TALUSD_AUTH_SERVICE_HPP
