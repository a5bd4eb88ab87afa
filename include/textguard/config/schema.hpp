#pragma once

#include <cstdint>
#include <string>

namespace textguard::config {

struct ScanConfig {
  std::uint64_t max_input_chars = 100'000;
};

struct DetectorsConfig {
  bool hex = false;
  bool rot13 = false;
};

struct HistoryConfig {
  std::string backend = "sqlite";
  std::string path = "~/.textguard/history.db";
  std::uint64_t default_limit = 20;
};

struct ObservabilityConfig {
  std::string backend = "none";
};

struct CliConfig {
  std::string fail_level = "high";
};

struct Config {
  ScanConfig scan;
  DetectorsConfig detectors;
  HistoryConfig history;
  ObservabilityConfig observability;
  CliConfig cli;
};

} // namespace textguard::config
