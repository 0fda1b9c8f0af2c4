#pragma once

#include <credo/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: error code.
// Failure kinds returned by instance and factory operations. Callers branch
// on the code, never on the log text.
namespace credo::schema {

enum class error_code : uint32_t {
  ok = 0,
  not_authorized = 1,
  agent_not_found = 2,
  reviewer_not_agent = 3,
  invalid_registry = 4,
  already_initialized = 5,
  not_owner = 6,
  invalid_owner = 7,
  address_occupied = 8,
  instance_missing = 9,
  invalid_template = 10,
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code>{"ok", error_code::ok},
    std::pair<std::string_view, error_code>{"not_authorized",
                                            error_code::not_authorized},
    std::pair<std::string_view, error_code>{"agent_not_found",
                                            error_code::agent_not_found},
    std::pair<std::string_view, error_code>{"reviewer_not_agent",
                                            error_code::reviewer_not_agent},
    std::pair<std::string_view, error_code>{"invalid_registry",
                                            error_code::invalid_registry},
    std::pair<std::string_view, error_code>{"already_initialized",
                                            error_code::already_initialized},
    std::pair<std::string_view, error_code>{"not_owner", error_code::not_owner},
    std::pair<std::string_view, error_code>{"invalid_owner",
                                            error_code::invalid_owner},
    std::pair<std::string_view, error_code>{"address_occupied",
                                            error_code::address_occupied},
    std::pair<std::string_view, error_code>{"instance_missing",
                                            error_code::instance_missing},
    std::pair<std::string_view, error_code>{"invalid_template",
                                            error_code::invalid_template},
};

template <>
inline std::optional<error_code> try_from_string<error_code>(
    const std::string_view value) {
  return from_string(value, kErrorCodeMappings);
}

inline constexpr std::string_view to_string(const error_code value) {
  return to_string(value, kErrorCodeMappings).value_or("unknown");
}

}  // namespace credo::schema
