#pragma once

#include "textguard/engine/finding.hpp"

#include <string>
#include <vector>

namespace textguard::engine {

struct TechniqueInfo {
  std::string name;
  std::string description;
  Severity severity = Severity::Low;
  std::vector<std::string> examples;
};

/// Reference table of the obfuscation techniques the scanner recognizes.
[[nodiscard]] const std::vector<TechniqueInfo> &technique_catalog();

} // namespace textguard::engine
