#include "textguard/common/utf8.hpp"

#include <cstdio>

namespace textguard::common {

char32_t next_codepoint(const std::string &input, std::size_t &index) {
  const unsigned char lead = static_cast<unsigned char>(input[index]);
  if (lead < 0x80U) {
    ++index;
    return lead;
  }

  std::size_t extra = 0;
  char32_t value = 0;
  char32_t minimum = 0;
  if ((lead & 0xE0U) == 0xC0U) {
    extra = 1;
    value = lead & 0x1FU;
    minimum = 0x80U;
  } else if ((lead & 0xF0U) == 0xE0U) {
    extra = 2;
    value = lead & 0x0FU;
    minimum = 0x800U;
  } else if ((lead & 0xF8U) == 0xF0U) {
    extra = 3;
    value = lead & 0x07U;
    minimum = 0x10000U;
  } else {
    ++index;
    return kReplacementCharacter;
  }

  if (index + extra >= input.size()) {
    ++index;
    return kReplacementCharacter;
  }

  for (std::size_t i = 1; i <= extra; ++i) {
    const unsigned char cont = static_cast<unsigned char>(input[index + i]);
    if ((cont & 0xC0U) != 0x80U) {
      ++index;
      return kReplacementCharacter;
    }
    value = (value << 6U) | static_cast<char32_t>(cont & 0x3FU);
  }

  if (value < minimum || value > 0x10FFFFU || (value >= 0xD800U && value <= 0xDFFFU)) {
    ++index;
    return kReplacementCharacter;
  }

  index += extra + 1;
  return value;
}

std::u32string decode_utf8(const std::string &input) {
  std::u32string out;
  out.reserve(input.size());
  std::size_t index = 0;
  while (index < input.size()) {
    out.push_back(next_codepoint(input, index));
  }
  return out;
}

bool is_valid_utf8(const std::string &input) {
  std::size_t index = 0;
  while (index < input.size()) {
    const std::size_t start = index;
    // A literal U+FFFD is three bytes; a rejected byte advances by one.
    if (next_codepoint(input, index) == kReplacementCharacter && index - start == 1) {
      return false;
    }
  }
  return true;
}

void append_utf8(std::string &out, const char32_t cp) {
  if (cp < 0x80U) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800U) {
    out.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else if (cp < 0x10000U) {
    out.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else if (cp <= 0x10FFFFU) {
    out.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else {
    append_utf8(out, kReplacementCharacter);
  }
}

std::string encode_utf8(const std::u32string &input) {
  return encode_utf8(input, 0, input.size());
}

std::string encode_utf8(const std::u32string &input, const std::size_t offset,
                        const std::size_t count) {
  std::string out;
  if (offset >= input.size()) {
    return out;
  }
  const std::size_t end = count > input.size() - offset ? input.size() : offset + count;
  out.reserve(end - offset);
  for (std::size_t i = offset; i < end; ++i) {
    append_utf8(out, input[i]);
  }
  return out;
}

std::size_t codepoint_length(const std::string &input) {
  std::size_t count = 0;
  std::size_t index = 0;
  while (index < input.size()) {
    (void)next_codepoint(input, index);
    ++count;
  }
  return count;
}

std::string utf8_prefix(const std::string &input, const std::size_t max_codepoints) {
  std::string out;
  std::size_t index = 0;
  std::size_t taken = 0;
  while (index < input.size() && taken < max_codepoints) {
    append_utf8(out, next_codepoint(input, index));
    ++taken;
  }
  return out;
}

std::string codepoint_label(const char32_t cp) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "U+%04X", static_cast<unsigned int>(cp));
  return buf;
}

std::vector<std::size_t> byte_to_codepoint_offsets(const std::string &input) {
  std::vector<std::size_t> offsets(input.size() + 1, 0);
  std::size_t index = 0;
  std::size_t cp_index = 0;
  while (index < input.size()) {
    const std::size_t start = index;
    (void)next_codepoint(input, index);
    for (std::size_t i = start; i < index; ++i) {
      offsets[i] = cp_index;
    }
    ++cp_index;
  }
  offsets[input.size()] = cp_index;
  return offsets;
}

} // namespace textguard::common
