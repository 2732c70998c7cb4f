#include <chrono>
#include <csignal>
#include <string>
#include <thread>
#include <unordered_map>

#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>

#include "utils/config.hpp"
#include "utils/paseto_utils.hpp"
#include "utils/server_credentials.hpp"

#include "execution/dispatcher/grpc_dispatcher.hpp"
#include "execution/dispatcher/http_dispatcher.hpp"

#include "service/auth_service.hpp"
#include "service/master_service.hpp"

#include "controller/auth_controller.hpp"
#include "controller/master_controller.hpp"
#include "controller/slave_controller.hpp"


namespace
{
	constexpr const char* const DEFAULT_CONFIG_PATH = "./talusd.yaml";

	template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
	template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

	volatile std::sig_atomic_t shutdown_requested = 0;

	void handle_signal(int signal)
	{
		static_cast<void>(signal);
		shutdown_requested = 1;
	}
}

void init_global_logger(const Config::LoggingConfig& config)
{
	using enum Config::LoggingConfig::LogLevel;

	const std::unordered_map<Config::LoggingConfig::LogLevel, spdlog::level::level_enum> spdlog_log_level_map{
		{INFO, spdlog::level::level_enum::info},
		{WARNING, spdlog::level::level_enum::warn},
		{ERROR, spdlog::level::level_enum::err},
		{DEBUG, spdlog::level::level_enum::debug}
	};

	const auto spdlog_level = spdlog_log_level_map.at(config.level);
	spdlog::set_level(spdlog_level);
	spdlog::info("Logger set up to: {} level", spdlog::level::to_short_c_str(spdlog_level));
}

std::shared_ptr<IDispatcher> build_dispatcher(const Config& config)
{
	return std::visit(
		overloaded{
			[&config](const Config::GrpcDispatchConfig&) -> std::shared_ptr<IDispatcher>
			{
				spdlog::info("Dispatching jobs over gRPC");
				return std::make_shared<GrpcDispatcher>(config.scheduler.dispatch_timeout);
			},
			[&config](const Config::HttpDispatchConfig& http_config) -> std::shared_ptr<IDispatcher>
			{
				spdlog::info("Dispatching jobs over HTTP, concurrency limit {}", http_config.concurrency_limit);
				return std::make_shared<HttpDispatcher>(config.scheduler.dispatch_timeout, http_config.concurrency_limit);
			}
		},
		config.dispatch
	);
}

int main(int argc, char** argv)
{
	const std::string config_path = argc > 1 ? argv[1] : DEFAULT_CONFIG_PATH;

	Config config;
	try
	{
		config = load_config(config_path);
	}
	catch(const std::runtime_error& error)
	{
		spdlog::critical("Failed to load configuration from {}: {}", config_path, error.what());
		return 1;
	}

	init_global_logger(config.logging);

	const paseto_key_type paseto_key = init_paseto(config.security.secret_key);
	const std::string address = config.server.listen_address.to_string();

	if(config.security.access_keys.empty())
	{
		spdlog::warn("No access keys configured, nobody will be able to connect");
	}

	AuthService auth_service(paseto_key, std::chrono::seconds(config.security.token_lifetime), config.security.access_keys);

	MasterService::Settings settings;
	settings.scheduling_interval = config.scheduler.interval;
	settings.max_dispatch_attempts = config.scheduler.max_dispatch_attempts;
	settings.liveness = LivenessMonitor::Settings{
		config.liveness.heartbeat_timeout,
		config.liveness.removal_grace,
		config.liveness.sweep_interval
	};

	MasterService master_service(settings, build_dispatcher(config));

	const auto credentials = build_server_credentials(config.security, auth_service);

	grpc::ServerBuilder builder;
	builder.AddListeningPort(address, credentials);

	AuthController auth_controller(auth_service);
	builder.RegisterService(&auth_controller);
	spdlog::debug("Auth controller created");

	MasterController master_controller(master_service);
	builder.RegisterService(&master_controller);
	spdlog::debug("Master controller created");

	SlaveController slave_controller(master_service);
	builder.RegisterService(&slave_controller);
	spdlog::debug("Slave controller created");

	auto server = builder.BuildAndStart();
	if(!server)
	{
		spdlog::critical("Failed to start server on address: {}", address);
		return 1;
	}

	master_service.start();
	spdlog::info("Server listening on address: {}", address);

	std::signal(SIGINT, handle_signal);
	std::signal(SIGTERM, handle_signal);

	std::jthread shutdown_watcher([&server]()
	{
		while(shutdown_requested == 0)
		{
			std::this_thread::sleep_for(std::chrono::milliseconds(200));
		}

		spdlog::info("Shutting down");
		server->Shutdown();
	});

	server->Wait();

	master_service.stop();

	return 0;
}
