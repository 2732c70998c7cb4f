#ifndef TALUSD_PASETO_UTILS_HPP
#define TALUSD_PASETO_UTILS_HPP

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <paseto.h>


using paseto_key_type = std::array<uint8_t, paseto_v2_LOCAL_KEYBYTES>;

struct PasetoKeyError: public std::runtime_error
{
	using std::runtime_error::runtime_error;
};

// Initializes libpaseto once per process and decodes the base64 v2.local key
// used to issue connection tokens.
[[nodiscard]] paseto_key_type init_paseto(const std::string& secret_key);

#endif //TALUSD_PASETO_UTILS_HPP
