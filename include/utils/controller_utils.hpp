#ifndef TALUSD_CONTROLLER_UTILS_HPP
#define TALUSD_CONTROLLER_UTILS_HPP

#include <optional>

#include <grpcpp/grpcpp.h>

#include "service/auth_service.hpp"
#include "service/common_exceptions.hpp"


constexpr const char* const INTERNAL_ERROR_MSG = "Internal server error";
constexpr const char* const ERROR_KIND_METADATA_KEY = "talus-error-kind";

[[nodiscard]] grpc::StatusCode to_status_code(ErrorKind kind) noexcept;

// Converts the error to a status and attaches its kind as trailing metadata.
[[nodiscard]] grpc::Status to_status(const MasterError& error, grpc::ServerContext* context);

[[nodiscard]] std::optional<Role> extract_role_from_context(const grpc::ServerContext* context);
[[nodiscard]] std::optional<uint64_t> extract_principal_id_from_context(const grpc::ServerContext* context);

// OK when the connection was authenticated with the given role.
[[nodiscard]] grpc::Status require_role(const grpc::ServerContext* context, Role role);

#endif //TALUSD_CONTROLLER_UTILS_HPP
