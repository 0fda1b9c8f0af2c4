#include <credo/blake3/hash.hpp>
#include <credo/schema/capability.hpp>

#include <algorithm>

namespace credo::schema {

interface_id_t make_interface_id(const capability_t capability) {
  auto digest = credo::blake3::hash(to_string(capability));
  auto id = interface_id_t{};
  std::copy_n(std::begin(digest), id.size(), std::begin(id));
  return id;
}

}  // namespace credo::schema
