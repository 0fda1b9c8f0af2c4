#pragma once

#include <credo/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: authorization status.
// Outcome of resolving an actor against a subject through the bound
// registry. not_found and forbidden are separate user-facing failures.
namespace credo::schema {

enum class authorization_status : uint8_t {
  authorized = 0,
  not_found = 1,
  forbidden = 2
};

inline constexpr auto kAuthorizationStatusMappings = std::array{
    std::pair<std::string_view, authorization_status>{
        "authorized", authorization_status::authorized},
    std::pair<std::string_view, authorization_status>{
        "not_found", authorization_status::not_found},
    std::pair<std::string_view, authorization_status>{
        "forbidden", authorization_status::forbidden},
};

inline constexpr std::string_view to_string(const authorization_status value) {
  return to_string(value, kAuthorizationStatusMappings).value_or("unknown");
}

}  // namespace credo::schema
