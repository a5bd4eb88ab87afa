#pragma once

#include "textguard/engine/finding.hpp"
#include "textguard/engine/scan_text.hpp"

#include <optional>
#include <string>
#include <vector>

namespace textguard::engine {

inline constexpr std::size_t kMaxDelimiterMatchChars = 50;

/// One step of a rule sequence. Literals are lower-case and tried in order;
/// whitespace, `Until` and `RunExcept` steps are greedy and never give back
/// what they consumed, so matching cost stays linear in the subject.
struct PatternStep {
  enum class Kind { Literal, Space, Until, RunExcept };

  Kind kind = Kind::Literal;
  std::vector<std::string> alternatives;
  std::size_t min_count = 0;
  char excluded = '\0';
};

/// A rule is a set of step sequences tried in order at each occurrence of its
/// anchor literal. `source` is the pattern text reported with findings.
struct PatternRule {
  std::string source;
  std::string description;
  std::string anchor;
  std::vector<std::vector<PatternStep>> sequences;
};

struct PatternMatch {
  std::size_t begin = 0;
  std::size_t end = 0;
};

/// First match of `rule` at or after byte `from` in an ASCII-lowered subject.
[[nodiscard]] std::optional<PatternMatch> find_pattern(const PatternRule &rule,
                                                       const std::string &subject,
                                                       std::size_t from = 0);

/// Instruction-override phrasing, matched against the ASCII-lowered text.
[[nodiscard]] const std::vector<PatternRule> &instruction_patterns();

/// Delimiter and role-marker injection. Matched case-insensitively, reported
/// with the original text.
[[nodiscard]] const std::vector<PatternRule> &delimiter_patterns();

[[nodiscard]] const std::vector<std::string> &suspicious_keywords();

[[nodiscard]] std::vector<Finding> detect_instruction_patterns(const ScanText &text);
[[nodiscard]] std::vector<Finding> detect_delimiter_injection(const ScanText &text);

/// Threat labels for decoded payload content: `Contains '<keyword>'` for each
/// suspicious keyword present, then the description of every instruction
/// pattern that matches.
[[nodiscard]] std::vector<std::string> check_content_for_threats(const std::string &content);

} // namespace textguard::engine
