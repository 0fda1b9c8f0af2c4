#pragma once

#include <credo/schema/enum_string.hpp>
#include <credo/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

// Schema type: capability.
// Structural interfaces an instance reports through supports_interface.
namespace credo::schema {

enum class capability_t : uint8_t {
  introspection = 0,
  subject_metadata = 1,
  instance_metadata = 2,
  reviews = 3,
  instance_operations = 4
};

inline constexpr auto kCapabilityMappings = std::array{
    std::pair<std::string_view, capability_t>{"credo.IIntrospection",
                                              capability_t::introspection},
    std::pair<std::string_view, capability_t>{"credo.ISubjectMetadata",
                                              capability_t::subject_metadata},
    std::pair<std::string_view, capability_t>{"credo.IInstanceMetadata",
                                              capability_t::instance_metadata},
    std::pair<std::string_view, capability_t>{"credo.IReviews",
                                              capability_t::reviews},
    std::pair<std::string_view, capability_t>{
        "credo.IInstanceOperations", capability_t::instance_operations},
};

inline constexpr std::string_view to_string(const capability_t value) {
  return to_string(value, kCapabilityMappings).value_or("unknown");
}

/// Reserved id that no instance ever supports.
inline constexpr interface_id_t kInvalidInterfaceId{0xff, 0xff, 0xff, 0xff};

/// First four bytes of blake3 over the capability's interface name.
interface_id_t make_interface_id(capability_t capability);

}  // namespace credo::schema
