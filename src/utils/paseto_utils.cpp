#include "utils/paseto_utils.hpp"

#include <mutex>

#include <spdlog/spdlog.h>


namespace
{
	std::once_flag paseto_init_flag;
	bool paseto_initialized = false;
}

paseto_key_type init_paseto(const std::string& secret_key)
{
	std::call_once(paseto_init_flag, []()
	{
		paseto_initialized = paseto_init();
	});

	if(!paseto_initialized)
	{
		spdlog::error("Failed to initialize libpaseto");
		throw PasetoKeyError("Failed to initialize libpaseto");
	}

	if(secret_key.empty())
	{
		spdlog::error("Empty security.secret_key");
		throw PasetoKeyError("Connection token key not configured");
	}

	paseto_key_type key{};
	if(!paseto_v2_local_load_key_base64(key.data(), secret_key.c_str()))
	{
		spdlog::error("Failed to load paseto key, expected {} base64 encoded bytes", key.size());
		throw PasetoKeyError("Invalid connection token key");
	}

	return key;
}
