#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <credo/config/options.hpp>
#include <credo/factory/instance_factory.hpp>
#include <credo/registry/registry_directory.hpp>
#include <credo/schema/lifecycle_state.hpp>
#include <credo/storage/rocksdb/storage.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

void install_logger(const credo::config::options& options) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (!options.log_file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        options.log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "inspect", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::from_str(options.log_level));
}

void print_instance(const credo::instance::credential_instance& instance) {
  std::cout << "  " << credo::schema::to_hex(instance.address())
            << " state=" << credo::schema::to_string(instance.lifecycle())
            << " owner=" << credo::schema::to_hex(instance.owner())
            << " registry=" << credo::schema::to_hex(instance.registry())
            << " name=\""
            << credo::schema::make_string(
                   instance.get_instance_metadata("name"))
            << "\"\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  auto options = credo::config::options{};
  try {
    options = credo::config::parse_options(argc, argv);
  } catch (const boost::program_options::error& ex) {
    std::cerr << ex.what() << "\n" << credo::config::make_description();
    return 2;
  }

  if (options.help || !options.factory.has_value()) {
    std::cout << credo::config::make_description() << std::endl;
    return options.help ? 0 : 2;
  }

  try {
    credo::config::require_existing_database(options);
  } catch (const boost::program_options::error& ex) {
    std::cerr << "no credential database: " << ex.what() << "\n";
    return 2;
  }

  install_logger(options);
  spdlog::info("Opening credential state at {}", options.db_path);

  auto storage =
      credo::storage::make_storage<credo::storage::rocksdb_storage_tag>(
          options.db_path, true);
  auto registries = credo::registry::registry_directory{};
  auto factory =
      credo::factory::instance_factory{storage, registries, *options.factory};

  if (!factory.exists()) {
    spdlog::error("No factory deployed at {}",
                  credo::schema::to_hex(*options.factory));
    spdlog::shutdown();
    return 1;
  }

  std::cout << "factory   " << credo::schema::to_hex(factory.address())
            << "\ntemplate  "
            << credo::schema::to_hex(factory.template_address())
            << "\ncode      " << credo::schema::to_hex(factory.code_identity())
            << "\n";

  if (options.predict_salt.has_value()) {
    std::cout << "predicted "
              << credo::schema::to_hex(
                     factory.predict_address(*options.predict_salt))
              << "\n";
  }

  auto instances =
      options.creator.has_value()
          ? factory.instances_by_creator(*options.creator)
          : factory.all_instances();
  std::cout << "instances " << instances.size() << "\n";
  for (const auto& address : instances) {
    print_instance(factory.instance(address));
  }

  spdlog::shutdown();
  return 0;
}
