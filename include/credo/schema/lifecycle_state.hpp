#pragma once

#include <credo/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: lifecycle state.
// Where an address sits in the instance lifecycle. Only uninitialized
// instances accept initialize; initialized is terminal.
namespace credo::schema {

enum class lifecycle_state : uint8_t {
  absent = 0,
  template_body = 1,
  uninitialized = 2,
  initialized = 3
};

inline constexpr auto kLifecycleStateMappings = std::array{
    std::pair<std::string_view, lifecycle_state>{"absent",
                                                 lifecycle_state::absent},
    std::pair<std::string_view, lifecycle_state>{
        "template_body", lifecycle_state::template_body},
    std::pair<std::string_view, lifecycle_state>{
        "uninitialized", lifecycle_state::uninitialized},
    std::pair<std::string_view, lifecycle_state>{"initialized",
                                                 lifecycle_state::initialized},
};

template <>
inline std::optional<lifecycle_state> try_from_string<lifecycle_state>(
    const std::string_view value) {
  return from_string(value, kLifecycleStateMappings);
}

inline constexpr std::string_view to_string(const lifecycle_state value) {
  return to_string(value, kLifecycleStateMappings).value_or("unknown");
}

}  // namespace credo::schema
