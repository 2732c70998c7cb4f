#include "utils/config.hpp"

#include <unordered_map>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>


namespace
{
	template<typename T>
	T get_value(const YAML::Node& root_node, const std::string& name)
	{
		if(const auto node = root_node[name]; node)
		{
			return node.as<T>();
		}
		spdlog::error("Failed to read node " +name);
		throw std::runtime_error("Failed to read node " +name);
	}

	template<typename T>
	T get_optional_value(const YAML::Node& root_node, const std::string& name, T default_value)
	{
		if(const auto node = root_node[name]; node)
		{
			return node.as<T>();
		}
		else
		{
			return default_value;
		}
	}

	std::chrono::milliseconds get_positive_duration(const YAML::Node& root_node, const std::string& name, std::chrono::milliseconds default_value)
	{
		const auto value = get_optional_value<int64_t>(root_node, name, default_value.count());
		if(value <= 0)
		{
			spdlog::error("Node {} must be a positive number of milliseconds", name);
			throw std::runtime_error("Node " + name + " must be a positive number of milliseconds");
		}

		return std::chrono::milliseconds(value);
	}

	Config::SecurityConfig::SSLConfig load_ssl_config(const YAML::Node& ssl_node)
	{
		Config::SecurityConfig::SSLConfig ssl_config;
		if(!ssl_node["ca_certificate"] || !ssl_node["certificate"] || !ssl_node["certificate_key"])
		{
			spdlog::error("Failed to read node ssl. ca_certificate, certificate and certificate_key must be provided");
			throw std::runtime_error("Failed to read node ssl. ca_certificate, certificate and certificate_key must be provided");
		}
		ssl_config.ca_certificate_path = get_value<std::string>(ssl_node, "ca_certificate");
		ssl_config.certificate_path = get_value<std::string>(ssl_node, "certificate");
		ssl_config.certificate_key_path = get_value<std::string>(ssl_node, "certificate_key");

		return ssl_config;
	}

	Config::ServerConfig load_server_config(const YAML::Node& node)
	{
		Config::ServerConfig server_config;

		server_config.listen_address.hostname = get_optional_value<std::string>(node, "hostname", "0.0.0.0");
		server_config.listen_address.port = get_optional_value<uint16_t>(node, "port", 5000);

		return server_config;
	}

	std::vector<AccessKey> load_access_keys(const YAML::Node& node)
	{
		std::vector<AccessKey> access_keys;

		if(!node)
		{
			return access_keys;
		}

		if(!node.IsSequence())
		{
			throw std::runtime_error("Node access_keys must be a list");
		}

		for(auto iter = std::cbegin(node); iter != std::cend(node); ++iter)
		{
			const auto access_key_node = iter->as<YAML::Node>();

			AccessKey access_key;
			access_key.name = get_value<std::string>(access_key_node, "name");
			access_key.key = get_value<std::string>(access_key_node, "key");

			const auto role = get_value<std::string>(access_key_node, "role");
			try
			{
				access_key.role = role_from_string(role);
			}
			catch(const std::invalid_argument& error)
			{
				spdlog::error("Invalid role {} for access key {}", role, access_key.name);
				throw std::runtime_error(error.what());
			}

			access_keys.emplace_back(std::move(access_key));
		}

		return access_keys;
	}

	Config::SecurityConfig load_security_config(const YAML::Node& node)
	{
		Config::SecurityConfig security_config;

		security_config.secret_key = get_value<std::string>(node, "secret_key");
		security_config.token_lifetime = get_optional_value<uint64_t>(node, "token_lifetime", 3600);
		security_config.access_keys = load_access_keys(node["access_keys"]);

		if(const auto ssl_node = node["ssl"]; ssl_node)
		{
			security_config.ssl_config = load_ssl_config(ssl_node);
		}
		else
		{
			security_config.ssl_config = std::nullopt;
		}
		return security_config;
	}

	Config::LoggingConfig::LogLevel map_log_level(const std::string& log_level_name)
	{
		const std::unordered_map<std::string, Config::LoggingConfig::LogLevel> level_mapping{
				{"INFO", Config::LoggingConfig::LogLevel::INFO},
				{"WARNING", Config::LoggingConfig::LogLevel::WARNING},
				{"ERROR", Config::LoggingConfig::LogLevel::ERROR},
				{"DEBUG", Config::LoggingConfig::LogLevel::DEBUG}
		};

		if(const auto iter = level_mapping.find(log_level_name); iter != std::end(level_mapping))
		{
			return iter->second;
		}

		spdlog::error("Invalid logging level: {}", log_level_name);
		throw std::runtime_error("Invalid logging level");
	}

	Config::LoggingConfig load_logging_config(const YAML::Node& node)
	{
		Config::LoggingConfig logging_config = {};

		const auto level_string = get_value<std::string>(node, "level");
		logging_config.level = map_log_level(level_string);

		return logging_config;
	}

	Config::SchedulerConfig load_scheduler_config(const YAML::Node& node)
	{
		Config::SchedulerConfig defaults{};
		Config::SchedulerConfig config{};

		config.interval = get_positive_duration(node, "interval_ms", defaults.interval);
		config.dispatch_timeout = get_positive_duration(node, "dispatch_timeout_ms", defaults.dispatch_timeout);
		config.max_dispatch_attempts = get_optional_value<uint32_t>(node, "max_dispatch_attempts", defaults.max_dispatch_attempts);

		if(config.max_dispatch_attempts == 0)
		{
			throw std::runtime_error("Node max_dispatch_attempts must be at least 1");
		}

		return config;
	}

	Config::LivenessConfig load_liveness_config(const YAML::Node& node)
	{
		Config::LivenessConfig defaults{};
		Config::LivenessConfig config{};

		config.heartbeat_timeout = get_positive_duration(node, "heartbeat_timeout_ms", defaults.heartbeat_timeout);
		config.removal_grace = get_positive_duration(node, "removal_grace_ms", defaults.removal_grace);
		config.sweep_interval = get_positive_duration(node, "sweep_interval_ms", defaults.sweep_interval);

		return config;
	}

	Config::HttpDispatchConfig load_http_dispatch_config(const YAML::Node& node)
	{
		Config::HttpDispatchConfig config{};

		config.concurrency_limit = get_optional_value<std::size_t>(node, "concurrency_limit", config.concurrency_limit);
		if(config.concurrency_limit == 0)
		{
			throw std::runtime_error("Node concurrency_limit must be at least 1");
		}

		return config;
	}

	Config::dispatch_config_t load_dispatch_config(const YAML::Node& node)
	{
		Config::dispatch_config_t dispatch_config;
		if(node.size() == 0)
		{
			throw std::runtime_error("No dispatch configuration");
		}

		if(node.size() > 1)
		{
			throw std::runtime_error("Multiple dispatch configuration not supported");
		}

		if(const auto grpc_node = node["grpc"]; grpc_node)
		{
			dispatch_config = Config::GrpcDispatchConfig{};
		}
		else if(const auto http_node = node["http"]; http_node)
		{
			dispatch_config = load_http_dispatch_config(http_node);
		}
		else
		{
			throw std::runtime_error("Invalid dispatch type");
		}

		return dispatch_config;
	}

	Config load_config_from_node(const YAML::Node& root_node)
	{
		Config config;

		if(const auto node = root_node["server"]; node)
		{
			config.server = load_server_config(node);
		}
		else
		{
			spdlog::error("Failed to read node server");
			throw std::runtime_error("Failed to read node server");
		}

		if(const auto node = root_node["security"]; node)
		{
			config.security = load_security_config(node);
		}
		else
		{
			spdlog::error("Failed to read node security");
			throw std::runtime_error("Failed to read node security");
		}

		if(const auto node = root_node["logging"]; node)
		{
			config.logging = load_logging_config(node);
		}
		else
		{
			config.logging = Config::LoggingConfig{
				Config::LoggingConfig::LogLevel::INFO
			};
		}

		if(const auto node = root_node["scheduler"]; node)
		{
			config.scheduler = load_scheduler_config(node);
		}

		if(const auto node = root_node["liveness"]; node)
		{
			config.liveness = load_liveness_config(node);
		}

		if(const auto node = root_node["dispatch"]; node)
		{
			config.dispatch = load_dispatch_config(node);
		}
		else
		{
			spdlog::error("Failed to read dispatch config");
			throw std::runtime_error("Failed to read dispatch config");
		}

		return config;
	}
}

Config load_config(const std::filesystem::path &path)
{
	if(!std::filesystem::exists(path))
	{
		throw std::runtime_error("File " + path.string() + " not found");
	}

	if(!std::filesystem::is_regular_file(path))
	{
		throw std::runtime_error(path.string() + " is not a regular file");
	}

	return load_config_from_node(YAML::LoadFile(path.string()));
}

Config parse_config(const std::string& yaml_content)
{
	return load_config_from_node(YAML::Load(yaml_content));
}
