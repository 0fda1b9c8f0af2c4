#pragma once

#include <array>
#include <string_view>

// Schema key type: namespaces.
// Domain strings of every namespaced region. The namespace id is
// blake3(domain) and never depends on which address executes the logic.
// Bump the version suffix instead of editing a domain in place.
namespace credo::schema::key {

inline constexpr std::string_view kSubjectMetadataDomain{
    "credo.subject_metadata.v1"};
inline constexpr std::string_view kInstanceMetadataDomain{
    "credo.instance_metadata.v1"};
inline constexpr std::string_view kReviewsDomain{"credo.reviews.v1"};
inline constexpr std::string_view kInstanceCoreDomain{"credo.instance.core.v1"};
inline constexpr std::string_view kFactoryCoreDomain{"credo.factory.core.v1"};
inline constexpr std::string_view kFactoryInstancesDomain{
    "credo.factory.instances.v1"};
inline constexpr std::string_view kFactoryInstanceCountsDomain{
    "credo.factory.instance_counts.v1"};

inline constexpr std::array<std::string_view, 7> kNamespaceDomains{
    kSubjectMetadataDomain,     kInstanceMetadataDomain,
    kReviewsDomain,             kInstanceCoreDomain,
    kFactoryCoreDomain,         kFactoryInstancesDomain,
    kFactoryInstanceCountsDomain};

/// Instance metadata key holding the display name given at initialization.
inline constexpr std::string_view kDisplayNameKey{"name"};

}  // namespace credo::schema::key
