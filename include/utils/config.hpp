#ifndef TALUSD_CONFIG_HPP
#define TALUSD_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "utils/address.hpp"
#include "service/auth_service.hpp"


struct Config
{
	struct ServerConfig
	{
		Address listen_address;
	};

	struct SecurityConfig
	{
		struct SSLConfig
		{
			std::string ca_certificate_path;
			std::string certificate_path;
			std::string certificate_key_path;
		};

		std::string secret_key;
		uint64_t token_lifetime;
		std::vector<AccessKey> access_keys;

		std::optional<SSLConfig> ssl_config;
	};

	struct LoggingConfig
	{
		enum class LogLevel
		{
			INFO,
			WARNING,
			ERROR,
			DEBUG
		};

		LogLevel level;
	};

	struct SchedulerConfig
	{
		std::chrono::milliseconds interval{500};
		std::chrono::milliseconds dispatch_timeout{5000};
		uint32_t max_dispatch_attempts = 3;
	};

	struct LivenessConfig
	{
		std::chrono::milliseconds heartbeat_timeout{15000};
		std::chrono::milliseconds removal_grace{60000};
		std::chrono::milliseconds sweep_interval{1000};
	};

	struct GrpcDispatchConfig
	{};

	struct HttpDispatchConfig
	{
		std::size_t concurrency_limit = 16;
	};

	using dispatch_config_t = std::variant<GrpcDispatchConfig, HttpDispatchConfig>;

	ServerConfig server;
	SecurityConfig security;
	LoggingConfig logging;
	SchedulerConfig scheduler;
	LivenessConfig liveness;
	dispatch_config_t dispatch;
};


Config load_config(const std::filesystem::path& path);
Config parse_config(const std::string& yaml_content);

#endif //TALUSD_CONFIG_HPP
