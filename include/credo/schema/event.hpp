#pragma once

#include <credo/schema/event_attribute.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: event.
// Notification emitted by a committed operation for external indexers. Not
// correctness bearing: nothing inside credo reads events back.
namespace credo::schema {

inline constexpr std::string_view kMetadataChangedEvent{"metadata_changed"};
inline constexpr std::string_view kReviewSubmittedEvent{"review_submitted"};
inline constexpr std::string_view kOwnershipTransferredEvent{
    "ownership_transferred"};
inline constexpr std::string_view kRegistryUpdatedEvent{"registry_updated"};
inline constexpr std::string_view kInitializedEvent{"initialized"};
inline constexpr std::string_view kInstanceCreatedEvent{"instance_created"};

template <uint16_t Version>
struct event;

template <>
struct event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<event_attribute_t> attributes;

  /// Value of the first attribute named `key`, if any.
  std::optional<std::string> find(std::string_view key) const {
    for (const auto& attribute : attributes) {
      if (attribute.key == key) {
        return attribute.value;
      }
    }
    return std::nullopt;
  }
};

using event_t = event<1>;

}  // namespace credo::schema
