#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace textguard::engine {

/// Immutable view of one input handed to the detectors: the UTF-8 bytes, the
/// decoded codepoints, an ASCII-lowered copy for case-folded matching and a
/// byte-to-codepoint offset table. The lowered copy has the same byte layout
/// as the input, so match offsets from either map through the same table.
class ScanText {
public:
  explicit ScanText(std::string utf8);

  [[nodiscard]] const std::string &utf8() const { return utf8_; }
  [[nodiscard]] const std::u32string &codepoints() const { return codepoints_; }
  [[nodiscard]] const std::string &folded() const { return folded_; }
  [[nodiscard]] std::size_t length() const { return codepoints_.size(); }

  [[nodiscard]] std::size_t codepoint_offset(std::size_t byte_offset) const;

private:
  std::string utf8_;
  std::u32string codepoints_;
  std::string folded_;
  std::vector<std::size_t> offsets_;
};

} // namespace textguard::engine
