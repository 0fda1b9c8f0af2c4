#include <credo/schema/encoding/scale/encoder.hpp>
#include <credo/state/store_keys.hpp>

#include <string>
#include <tuple>
#include <utility>

namespace credo::state {

namespace {

using encoder_t = credo::schema::encoding::scale_encoder_t;

credo::schema::event_attribute_t indexed(std::string key, std::string value) {
  return credo::schema::event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = true};
}

}  // namespace

credo::schema::bytes_t encode_key(const subject_metadata_key& key) {
  auto encoder = encoder_t{};
  return encoder.encode(std::tuple{key.subject_id, key.key});
}

credo::schema::bytes_t encode_key(const instance_metadata_key& key) {
  auto encoder = encoder_t{};
  return encoder.encode(key.key);
}

credo::schema::bytes_t encode_key(const review_key& key) {
  auto encoder = encoder_t{};
  return encoder.encode(std::tuple{key.reviewer_id, key.reviewed_id});
}

credo::schema::bytes_t encode_key(const field_key& key) {
  auto encoder = encoder_t{};
  return encoder.encode(key.field);
}

credo::schema::bytes_t encode_key(const instance_list_key& key) {
  auto encoder = encoder_t{};
  return encoder.encode(std::tuple{key.creator, key.index});
}

credo::schema::bytes_t encode_key(const instance_count_key& key) {
  auto encoder = encoder_t{};
  return encoder.encode(key.creator);
}

std::vector<credo::schema::event_attribute_t> describe_key(
    const subject_metadata_key& key) {
  return {indexed("subject_id", std::to_string(key.subject_id)),
          indexed("key", key.key)};
}

std::vector<credo::schema::event_attribute_t> describe_key(
    const instance_metadata_key& key) {
  return {indexed("key", key.key)};
}

std::vector<credo::schema::event_attribute_t> describe_key(
    const review_key& key) {
  return {indexed("reviewer_id", std::to_string(key.reviewer_id)),
          indexed("reviewed_id", std::to_string(key.reviewed_id))};
}

std::vector<credo::schema::event_attribute_t> describe_key(
    const field_key& key) {
  return {indexed("field", key.field)};
}

std::vector<credo::schema::event_attribute_t> describe_key(
    const instance_list_key& key) {
  return {indexed("creator", credo::schema::to_hex(key.creator)),
          indexed("index", std::to_string(key.index))};
}

std::vector<credo::schema::event_attribute_t> describe_key(
    const instance_count_key& key) {
  return {indexed("creator", credo::schema::to_hex(key.creator))};
}

}  // namespace credo::state
