#include "utils/server_credentials.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>

#include <auth.grpc.pb.h>
#include <spdlog/spdlog.h>

#include "plugins/token_auth_metadata_processor.hpp"


namespace
{
	std::string read_pem_file(const std::filesystem::path& filepath)
	{
		if(!std::filesystem::is_regular_file(filepath))
		{
			spdlog::error("Certificate file {} not found", filepath.string());
			throw CredentialsError("Certificate file " + filepath.string() + " not found");
		}

		std::ifstream file(filepath, std::ios::binary);
		if(!file)
		{
			throw CredentialsError("Failed to open " + filepath.string());
		}

		return {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
	}
}

std::shared_ptr<grpc::ServerCredentials> build_server_credentials(
		const Config::SecurityConfig& config,
		const AuthService& auth_service
)
{
	std::vector<std::string> path_not_secured = {std::string("/") + talus::proto::Auth::service_full_name() + "/authorize_connection"};
	const auto auth_metadata_processor = std::make_shared<TokenAuthMetadataProcessor>(auth_service, path_not_secured);

	if(config.ssl_config)
	{
		spdlog::info("Running in SSL mode");
		grpc::SslServerCredentialsOptions options(
				GRPC_SSL_DONT_REQUEST_CLIENT_CERTIFICATE
		);

		grpc::SslServerCredentialsOptions::PemKeyCertPair key_cert = {
			read_pem_file(config.ssl_config->certificate_key_path),
			read_pem_file(config.ssl_config->certificate_path)
		};
		options.pem_root_certs = read_pem_file(config.ssl_config->ca_certificate_path);
		options.pem_key_cert_pairs.emplace_back(std::move(key_cert));

		auto credentials = grpc::SslServerCredentials(options);
		credentials->SetAuthMetadataProcessor(auth_metadata_processor);

		return credentials;
	}

	spdlog::info("Running in LOCAL mode");
	auto credentials = grpc::experimental::LocalServerCredentials(grpc_local_connect_type::LOCAL_TCP);
	credentials->SetAuthMetadataProcessor(auth_metadata_processor);

	return credentials;
}
