#include <credo/config/options.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <system_error>

namespace po = boost::program_options;

namespace {

std::optional<credo::schema::hash32_t> parse_hash(
    const po::variables_map& vm,
    const std::string& name) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  const auto& text = vm[name].as<std::string>();
  auto hash = credo::schema::try_make_hash32(text);
  if (!hash.has_value()) {
    throw po::invalid_option_value{name + "=" + text};
  }
  return hash;
}

}  // namespace

namespace credo::config {

po::options_description make_description() {
  auto description = po::options_description{"credo-inspect"};
  description.add_options()("help,h", "Show the help message")(
      "db-path,d", po::value<std::string>()->default_value("credo.db"),
      "RocksDB directory holding credential state")(
      "factory,f", po::value<std::string>(),
      "Factory address to inspect (hex)")(
      "creator,c", po::value<std::string>(),
      "Only list instances created by this address (hex)")(
      "predict,p", po::value<std::string>(),
      "Print the deterministic address for this salt (hex)")(
      "log-level,l", po::value<std::string>()->default_value("info"),
      "trace, debug, info, warn, err, critical or off")(
      "log-file", po::value<std::string>(),
      "Also write logs to this file");
  return description;
}

options parse_options(const int argc, const char* const argv[]) {
  auto description = make_description();
  auto vm = po::variables_map{};
  po::store(po::parse_command_line(argc, argv, description), vm);
  po::notify(vm);

  auto parsed = options{};
  parsed.help = vm.contains("help");
  parsed.db_path = vm["db-path"].as<std::string>();
  parsed.factory = parse_hash(vm, "factory");
  parsed.creator = parse_hash(vm, "creator");
  parsed.predict_salt = parse_hash(vm, "predict");
  parsed.log_level = vm["log-level"].as<std::string>();
  if (spdlog::level::from_str(parsed.log_level) == spdlog::level::off &&
      parsed.log_level != "off") {
    throw po::invalid_option_value{"log-level=" + parsed.log_level};
  }
  if (vm.contains("log-file")) {
    parsed.log_file = vm["log-file"].as<std::string>();
  }
  return parsed;
}

void require_existing_database(const options& parsed) {
  auto error = std::error_code{};
  if (!std::filesystem::is_directory(parsed.db_path, error)) {
    throw po::invalid_option_value{"db-path=" + parsed.db_path};
  }
}

}  // namespace credo::config
