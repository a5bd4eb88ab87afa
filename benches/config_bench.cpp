#include "bench_common.hpp"

#include "textguard/config/config.hpp"
#include "textguard/observability/factory.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

// Startup cost of every CLI call: read and check config.toml, then build the
// observer it names.
void run_config_benchmark() {
  const auto workspace = std::filesystem::temp_directory_path() / "textguard-config-bench";
  std::error_code ec;
  std::filesystem::remove_all(workspace, ec);
  std::filesystem::create_directories(workspace, ec);
  if (ec) {
    std::cerr << "config bench skipped: " << ec.message() << "\n";
    return;
  }

  const auto path = workspace / "config.toml";
  {
    std::ofstream file(path);
    file << "[scan]\nmax_input_chars = 100000\n\n"
         << "[detectors]\nhex = true\nrot13 = true\n\n"
         << "[history]\nbackend = \"none\"\n\n"
         << "[observability]\nbackend = \"log, stats\"\n\n"
         << "[cli]\nfail_level = \"medium\"\n";
  }
  textguard::config::set_config_path_override(path);

  textguard::bench::run_bench("config_load_and_validate", 500, [] {
    const auto config = textguard::config::load_config();
    if (config.ok()) {
      (void)textguard::config::validate_config(config.value());
    }
  });

  const auto config = textguard::config::load_config();
  if (config.ok()) {
    textguard::bench::run_bench("observer_from_config", 2000, [&] {
      (void)textguard::observability::create_observer(config.value());
    });
  }

  textguard::config::clear_config_path_override();
  std::filesystem::remove_all(workspace, ec);
}
