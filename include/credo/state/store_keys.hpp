#pragma once

#include <credo/schema/event_attribute.hpp>
#include <credo/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Composite key shapes used with namespaced_store. Each shape provides
// encode_key (the bytes hashed into a slot location) and describe_key (the
// attributes carried by change notifications).
namespace credo::state {

struct subject_metadata_key final {
  credo::schema::subject_id_t subject_id{};
  std::string key;
};

struct instance_metadata_key final {
  std::string key;
};

struct review_key final {
  credo::schema::subject_id_t reviewer_id{};
  credo::schema::subject_id_t reviewed_id{};
};

/// Named scalar field of an instance or factory.
struct field_key final {
  std::string field;
};

/// Position in a factory's creation list. The null creator is the global
/// list.
struct instance_list_key final {
  credo::schema::address_t creator{};
  uint64_t index{};
};

/// Length of a factory's creation list. The null creator is the global list.
struct instance_count_key final {
  credo::schema::address_t creator{};
};

credo::schema::bytes_t encode_key(const subject_metadata_key& key);
credo::schema::bytes_t encode_key(const instance_metadata_key& key);
credo::schema::bytes_t encode_key(const review_key& key);
credo::schema::bytes_t encode_key(const field_key& key);
credo::schema::bytes_t encode_key(const instance_list_key& key);
credo::schema::bytes_t encode_key(const instance_count_key& key);

std::vector<credo::schema::event_attribute_t> describe_key(
    const subject_metadata_key& key);
std::vector<credo::schema::event_attribute_t> describe_key(
    const instance_metadata_key& key);
std::vector<credo::schema::event_attribute_t> describe_key(
    const review_key& key);
std::vector<credo::schema::event_attribute_t> describe_key(
    const field_key& key);
std::vector<credo::schema::event_attribute_t> describe_key(
    const instance_list_key& key);
std::vector<credo::schema::event_attribute_t> describe_key(
    const instance_count_key& key);

}  // namespace credo::state
