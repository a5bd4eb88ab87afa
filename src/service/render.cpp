#include "textguard/service/render.hpp"

#include "textguard/common/json_util.hpp"

#include <sstream>
#include <string_view>

namespace textguard::service {

namespace {

std::string quoted(const std::string_view value) { return common::json_string(std::string(value)); }

void write_optional(std::ostringstream &out, const char *key,
                    const std::optional<std::string> &value) {
  if (value.has_value()) {
    out << ",\"" << key << "\":" << common::json_string(*value);
  }
}

void write_optional(std::ostringstream &out, const char *key,
                    const std::optional<std::size_t> &value) {
  if (value.has_value()) {
    out << ",\"" << key << "\":" << *value;
  }
}

} // namespace

std::string render_finding(const engine::Finding &finding) {
  std::ostringstream out;
  out << "{\"type\":" << quoted(engine::to_string(finding.type));
  if (finding.encoding.has_value()) {
    out << ",\"encoding\":" << quoted(engine::to_string(*finding.encoding));
  }
  out << ",\"description\":" << common::json_string(finding.description);
  out << ",\"severity\":" << quoted(engine::to_string(finding.severity));
  if (finding.count.has_value()) {
    out << ",\"count\":" << *finding.count;
    out << ",\"positions\":" << common::json_number_array(finding.positions);
  }

  write_optional(out, "character", finding.character);
  write_optional(out, "unicode", finding.unicode);
  write_optional(out, "looks_like", finding.looks_like);
  write_optional(out, "hidden_content", finding.hidden_content);

  write_optional(out, "pattern", finding.pattern);
  if (finding.pattern.has_value()) {
    out << ",\"matches\":" << common::json_string_array(finding.matches);
  }

  write_optional(out, "encoded_preview", finding.encoded_preview);
  write_optional(out, "decoded_preview", finding.decoded_preview);
  write_optional(out, "position", finding.position);
  if (!finding.threats_found.empty()) {
    out << ",\"threats_found\":" << common::json_string_array(finding.threats_found);
  }
  write_optional(out, "layers", finding.layers);
  if (finding.layers.has_value()) {
    out << ",\"nested_layers\":[";
    for (std::size_t i = 0; i < finding.nested_layers.size(); ++i) {
      if (i > 0) {
        out << ",";
      }
      out << "{\"depth\":" << finding.nested_layers[i].depth
          << ",\"preview\":" << common::json_string(finding.nested_layers[i].preview) << "}";
    }
    out << "]";
  }
  write_optional(out, "encoded_word", finding.encoded_word);
  write_optional(out, "decoded_word", finding.decoded_word);
  write_optional(out, "decoded_context", finding.decoded_context);
  out << "}";
  return out.str();
}

std::string render_findings(const std::vector<engine::Finding> &findings) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < findings.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << render_finding(findings[i]);
  }
  out << "]";
  return out.str();
}

std::string render_summary(const std::vector<engine::SummaryEntry> &summary) {
  std::ostringstream out;
  out << "{";
  for (std::size_t i = 0; i < summary.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << quoted(engine::to_string(summary[i].type)) << ":{\"count\":" << summary[i].count
        << ",\"severity\":" << quoted(engine::to_string(summary[i].severity)) << "}";
  }
  out << "}";
  return out.str();
}

std::string render_scan_result(const ScanResult &result) {
  std::ostringstream out;
  out << "{\"id\":" << common::json_string(result.id)
      << ",\"timestamp\":" << common::json_string(result.timestamp)
      << ",\"original_text_length\":" << result.original_text_length
      << ",\"threat_level\":" << quoted(engine::to_string(result.threat_level))
      << ",\"total_findings\":" << result.total_findings
      << ",\"findings\":" << render_findings(result.findings)
      << ",\"summary\":" << render_summary(result.summary) << "}";
  return out.str();
}

std::string render_clean_result(const CleanResult &result) {
  std::ostringstream out;
  out << "{\"id\":" << common::json_string(result.id)
      << ",\"timestamp\":" << common::json_string(result.timestamp)
      << ",\"original_length\":" << result.original_length
      << ",\"cleaned_length\":" << result.cleaned_length
      << ",\"cleaned_text\":" << common::json_string(result.cleaned_text)
      << ",\"characters_removed\":" << result.characters_removed << ",\"removed_details\":[";
  for (std::size_t i = 0; i < result.removed_details.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << "{\"category\":" << quoted(engine::to_string(result.removed_details[i].category))
        << ",\"count\":" << result.removed_details[i].count << "}";
  }
  out << "],\"threat_level_before\":" << quoted(engine::to_string(result.threat_level_before))
      << "}";
  return out.str();
}

std::string render_history(const std::vector<history::ScanHistoryEntry> &entries) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < entries.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    const auto &entry = entries[i];
    out << "{\"id\":" << common::json_string(entry.id)
        << ",\"timestamp\":" << common::json_string(entry.timestamp)
        << ",\"original_text_preview\":" << common::json_string(entry.original_text_preview)
        << ",\"threat_level\":" << common::json_string(entry.threat_level)
        << ",\"total_findings\":" << entry.total_findings << "}";
  }
  out << "]";
  return out.str();
}

std::string render_techniques(const std::vector<engine::TechniqueInfo> &techniques) {
  std::ostringstream out;
  out << "{\"techniques\":[";
  for (std::size_t i = 0; i < techniques.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << "{\"name\":" << common::json_string(techniques[i].name)
        << ",\"description\":" << common::json_string(techniques[i].description)
        << ",\"severity\":" << quoted(engine::to_string(techniques[i].severity))
        << ",\"examples\":" << common::json_string_array(techniques[i].examples) << "}";
  }
  out << "]}";
  return out.str();
}

} // namespace textguard::service
