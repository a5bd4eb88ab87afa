#include "textguard/engine/patterns.hpp"

#include "textguard/common/fs.hpp"
#include "textguard/common/utf8.hpp"

#include <utility>

namespace textguard::engine {

namespace {

using Sequence = std::vector<PatternStep>;

// Alternative step sequences for one position in a rule, in the order they are
// tried. An optional group carries the empty sequence last.
using Piece = std::vector<Sequence>;

Piece one_of(std::vector<std::string> words) {
  PatternStep step;
  step.kind = PatternStep::Kind::Literal;
  step.alternatives = std::move(words);
  return {{std::move(step)}};
}

Piece lit(std::string text) { return one_of({std::move(text)}); }

Piece spaces(const std::size_t min_count) {
  PatternStep step;
  step.kind = PatternStep::Kind::Space;
  step.min_count = min_count;
  return {{std::move(step)}};
}

// Everything up to and including the first `terminator`.
Piece until(std::string terminator) {
  PatternStep step;
  step.kind = PatternStep::Kind::Until;
  step.alternatives = {std::move(terminator)};
  return {{std::move(step)}};
}

Piece run_except(const char excluded) {
  PatternStep step;
  step.kind = PatternStep::Kind::RunExcept;
  step.excluded = excluded;
  step.min_count = 1;
  return {{std::move(step)}};
}

std::vector<Sequence> expand(const std::vector<Piece> &pieces) {
  std::vector<Sequence> sequences{Sequence{}};
  for (const auto &piece : pieces) {
    std::vector<Sequence> next;
    next.reserve(sequences.size() * piece.size());
    for (const auto &prefix : sequences) {
      for (const auto &choice : piece) {
        Sequence sequence = prefix;
        sequence.insert(sequence.end(), choice.begin(), choice.end());
        next.push_back(std::move(sequence));
      }
    }
    sequences = std::move(next);
  }
  return sequences;
}

Piece optional_group(const std::vector<Piece> &pieces) {
  Piece out = expand(pieces);
  out.emplace_back();
  return out;
}

// Every rule starts with a single literal, which becomes its anchor.
PatternRule rule(std::string source, std::string description, const std::vector<Piece> &pieces) {
  PatternRule out;
  out.source = std::move(source);
  out.description = std::move(description);
  out.sequences = expand(pieces);
  out.anchor = out.sequences.front().front().alternatives.front();
  return out;
}

bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

std::optional<std::size_t> match_steps(const Sequence &steps, const std::size_t index,
                                       const std::string &subject, const std::size_t pos) {
  if (index == steps.size()) {
    return pos;
  }

  const auto &step = steps[index];
  switch (step.kind) {
  case PatternStep::Kind::Literal:
    for (const auto &word : step.alternatives) {
      if (subject.compare(pos, word.size(), word) != 0) {
        continue;
      }
      if (const auto end = match_steps(steps, index + 1, subject, pos + word.size())) {
        return end;
      }
    }
    return std::nullopt;
  case PatternStep::Kind::Space: {
    std::size_t end = pos;
    while (end < subject.size() && is_ascii_space(subject[end])) {
      ++end;
    }
    if (end - pos < step.min_count) {
      return std::nullopt;
    }
    return match_steps(steps, index + 1, subject, end);
  }
  case PatternStep::Kind::Until: {
    const std::string &terminator = step.alternatives.front();
    const auto found = subject.find(terminator, pos);
    if (found == std::string::npos) {
      return std::nullopt;
    }
    return match_steps(steps, index + 1, subject, found + terminator.size());
  }
  case PatternStep::Kind::RunExcept: {
    std::size_t end = pos;
    while (end < subject.size() && subject[end] != step.excluded) {
      ++end;
    }
    if (end - pos < step.min_count) {
      return std::nullopt;
    }
    return match_steps(steps, index + 1, subject, end);
  }
  }
  return std::nullopt;
}

struct PatternHits {
  std::size_t count = 0;
  std::vector<std::string> matches;
  std::vector<std::size_t> positions;
};

// Rules run on the lowered text; match text is cut from `report`, which has
// the same byte layout.
PatternHits collect_hits(const ScanText &text, const std::string &report, const PatternRule &entry,
                         const std::size_t max_match_chars) {
  PatternHits hits;
  std::size_t from = 0;
  while (const auto match = find_pattern(entry, text.folded(), from)) {
    ++hits.count;
    from = match->end;
    if (hits.matches.size() >= kMaxReportedMatches) {
      continue;
    }
    std::string value = report.substr(match->begin, match->end - match->begin);
    if (max_match_chars > 0) {
      value = common::utf8_prefix(value, max_match_chars);
    }
    hits.matches.push_back(std::move(value));
    hits.positions.push_back(text.codepoint_offset(match->begin));
  }
  return hits;
}

std::vector<Finding> run_rules(const ScanText &text, const std::string &report,
                               const std::vector<PatternRule> &rules, const FindingType type,
                               const Severity severity, const std::size_t max_match_chars) {
  std::vector<Finding> findings;
  for (const auto &entry : rules) {
    auto hits = collect_hits(text, report, entry, max_match_chars);
    if (hits.count == 0) {
      continue;
    }
    Finding finding;
    finding.type = type;
    finding.description = entry.description;
    finding.severity = severity;
    finding.count = hits.count;
    finding.positions = std::move(hits.positions);
    finding.pattern = entry.source;
    finding.matches = std::move(hits.matches);
    findings.push_back(std::move(finding));
  }
  return findings;
}

} // namespace

std::optional<PatternMatch> find_pattern(const PatternRule &rule, const std::string &subject,
                                         const std::size_t from) {
  for (auto pos = subject.find(rule.anchor, from); pos != std::string::npos;
       pos = subject.find(rule.anchor, pos + 1)) {
    for (const auto &sequence : rule.sequences) {
      if (const auto end = match_steps(sequence, 0, subject, pos)) {
        return PatternMatch{pos, *end};
      }
    }
  }
  return std::nullopt;
}

const std::vector<PatternRule> &instruction_patterns() {
  static const std::vector<PatternRule> rules = [] {
    const auto orders = one_of({"previous", "prior", "above", "earlier"});
    const auto markers = one_of({"system", "instruction", "prompt"});

    std::vector<PatternRule> out;
    out.push_back(rule(
        R"(ignore\s+(all\s+)?(previous|prior|above|earlier)\s+(instructions?|prompts?|rules?|guidelines?))",
        "Instruction override attempt",
        {lit("ignore"), spaces(1), optional_group({lit("all"), spaces(1)}), orders, spaces(1),
         one_of({"instructions", "instruction", "prompts", "prompt", "rules", "rule", "guidelines",
                 "guideline"})}));
    out.push_back(rule(R"(disregard\s+(all\s+)?(previous|prior|above|earlier))",
                       "Instruction override attempt",
                       {lit("disregard"), spaces(1), optional_group({lit("all"), spaces(1)}),
                        orders}));
    out.push_back(rule(R"(forget\s+(everything|all|what)\s+(you|i)\s+(said|told|mentioned))",
                       "Memory manipulation attempt",
                       {lit("forget"), spaces(1), one_of({"everything", "all", "what"}), spaces(1),
                        one_of({"you", "i"}), spaces(1), one_of({"said", "told", "mentioned"})}));
    out.push_back(rule(R"(new\s+(system\s+)?prompt)", "System prompt injection",
                       {lit("new"), spaces(1), optional_group({lit("system"), spaces(1)}),
                        lit("prompt")}));
    out.push_back(rule(R"(you\s+are\s+now\s+)", "Role hijacking attempt",
                       {lit("you"), spaces(1), lit("are"), spaces(1), lit("now"), spaces(1)}));
    out.push_back(rule(R"(act\s+as\s+(if|a|an)\s+)", "Role manipulation attempt",
                       {lit("act"), spaces(1), lit("as"), spaces(1), one_of({"if", "a", "an"}),
                        spaces(1)}));
    out.push_back(rule(R"(pretend\s+(you|to)\s+)", "Role manipulation attempt",
                       {lit("pretend"), spaces(1), one_of({"you", "to"}), spaces(1)}));
    out.push_back(rule(R"(override\s+(your|all|any)\s+(instructions?|rules?|safety))",
                       "Safety bypass attempt",
                       {lit("override"), spaces(1), one_of({"your", "all", "any"}), spaces(1),
                        one_of({"instructions", "instruction", "rules", "rule", "safety"})}));
    out.push_back(rule(R"(bypass\s+(your|all|any)\s+(restrictions?|filters?|safety))",
                       "Safety bypass attempt",
                       {lit("bypass"), spaces(1), one_of({"your", "all", "any"}), spaces(1),
                        one_of({"restrictions", "restriction", "filters", "filter", "safety"})}));
    out.push_back(rule(R"(jailbreak)", "Jailbreak attempt", {lit("jailbreak")}));
    out.push_back(rule(R"(DAN\s*mode)", "DAN jailbreak attempt",
                       {lit("dan"), spaces(0), lit("mode")}));
    out.push_back(rule(R"(developer\s+mode)", "Developer mode bypass attempt",
                       {lit("developer"), spaces(1), lit("mode")}));
    out.push_back(rule(R"(\[\s*system\s*\])", "System tag injection",
                       {lit("["), spaces(0), lit("system"), spaces(0), lit("]")}));
    out.push_back(rule(R"(\[\s*/\s*system\s*\])", "System tag injection",
                       {lit("["), spaces(0), lit("/"), spaces(0), lit("system"), spaces(0),
                        lit("]")}));
    out.push_back(rule(R"(<\s*system\s*>)", "System tag injection",
                       {lit("<"), spaces(0), lit("system"), spaces(0), lit(">")}));
    out.push_back(rule(R"(###\s*(system|instruction|prompt))", "Delimiter injection",
                       {lit("###"), spaces(0), markers}));
    out.push_back(rule(R"(---\s*(system|instruction|prompt))", "Delimiter injection",
                       {lit("---"), spaces(0), markers}));
    out.push_back(rule(R"(\|\s*SYSTEM\s*\|)", "Delimiter injection",
                       {lit("|"), spaces(0), lit("system"), spaces(0), lit("|")}));
    return out;
  }();
  return rules;
}

const std::vector<PatternRule> &delimiter_patterns() {
  static const std::vector<PatternRule> rules = [] {
    std::vector<PatternRule> out;
    out.push_back(
        rule(R"(```[\s\S]*?```)", "Code block delimiter", {lit("```"), until("```")}));
    out.push_back(rule(R"(<\|[^|]+\|>)", "Pipe delimiter",
                       {lit("<|"), run_except('|'), lit("|>")}));
    out.push_back(rule(R"(\[INST\])", "Instruction marker", {lit("[inst]")}));
    out.push_back(rule(R"(\[/INST\])", "Instruction marker", {lit("[/inst]")}));
    out.push_back(rule(R"(<<SYS>>)", "System tag", {lit("<<sys>>")}));
    out.push_back(rule(R"(<</SYS>>)", "System tag", {lit("<</sys>>")}));
    out.push_back(rule(R"(Human:)", "Role marker", {lit("human:")}));
    out.push_back(rule(R"(Assistant:)", "Role marker", {lit("assistant:")}));
    out.push_back(rule(R"(###\s*Human)", "Role delimiter", {lit("###"), spaces(0), lit("human")}));
    out.push_back(
        rule(R"(###\s*Assistant)", "Role delimiter", {lit("###"), spaces(0), lit("assistant")}));
    return out;
  }();
  return rules;
}

const std::vector<std::string> &suspicious_keywords() {
  static const std::vector<std::string> keywords = {
      "ignore",     "system",    "prompt",     "instruction", "override",  "jailbreak",
      "bypass",     "disregard", "forget",     "pretend",     "roleplay",  "act as",
      "new prompt", "admin",     "root",       "sudo",        "execute",   "eval",
      "exec",       "password",  "secret",     "key",         "token",     "credential",
      "api_key",    "delete",    "drop",       "truncate",    "rm -rf",    "format",
      "shutdown",   "assistant:", "human:",    "[inst]",      "[/inst]",   "<<sys>>",
      "<</sys>>",   "dan mode",  "developer mode", "unrestricted", "no filter"};
  return keywords;
}

std::vector<Finding> detect_instruction_patterns(const ScanText &text) {
  return run_rules(text, text.folded(), instruction_patterns(),
                   FindingType::InstructionInjection, Severity::High, 0);
}

std::vector<Finding> detect_delimiter_injection(const ScanText &text) {
  return run_rules(text, text.utf8(), delimiter_patterns(), FindingType::DelimiterInjection,
                   Severity::Medium, kMaxDelimiterMatchChars);
}

std::vector<std::string> check_content_for_threats(const std::string &content) {
  std::vector<std::string> threats;
  const std::string lowered = common::to_lower(content);

  for (const auto &keyword : suspicious_keywords()) {
    if (lowered.find(keyword) != std::string::npos) {
      threats.push_back("Contains '" + keyword + "'");
    }
  }

  for (const auto &entry : instruction_patterns()) {
    if (find_pattern(entry, lowered).has_value()) {
      threats.push_back(entry.description);
    }
  }

  return threats;
}

} // namespace textguard::engine
