#include "textguard/engine/scan_text.hpp"

#include "textguard/common/fs.hpp"
#include "textguard/common/utf8.hpp"

#include <utility>

namespace textguard::engine {

ScanText::ScanText(std::string utf8)
    : utf8_(std::move(utf8)), codepoints_(common::decode_utf8(utf8_)),
      folded_(common::to_lower(utf8_)), offsets_(common::byte_to_codepoint_offsets(utf8_)) {}

std::size_t ScanText::codepoint_offset(const std::size_t byte_offset) const {
  if (byte_offset >= offsets_.size()) {
    return codepoints_.size();
  }
  return offsets_[byte_offset];
}

} // namespace textguard::engine
