#pragma once

#include <boost/program_options.hpp>
#include <credo/schema/primitives.hpp>
#include <optional>
#include <string>

namespace credo::config {

/// Command line of credo-inspect.
struct options final {
  std::string db_path{"credo.db"};
  std::optional<credo::schema::address_t> factory;
  std::optional<credo::schema::address_t> creator;
  std::optional<credo::schema::hash32_t> predict_salt;
  std::string log_level{"info"};
  std::string log_file;
  bool help{};
};

boost::program_options::options_description make_description();

/// Parse argv into options.
///
/// Throws boost::program_options::error on malformed input, including
/// addresses and salts that are not 64 hex characters and unknown log
/// levels.
options parse_options(int argc, const char* const argv[]);

/// Throws boost::program_options::error unless `db_path` names an existing
/// directory. credo-inspect never creates a database.
void require_existing_database(const options& parsed);

}  // namespace credo::config
