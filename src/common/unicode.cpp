#include "textguard/common/unicode.hpp"

#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utypes.h>

#include <utility>

namespace textguard::common {

bool is_printable(const char32_t cp) {
  if (cp == U' ') {
    return true;
  }
  switch (u_charType(static_cast<UChar32>(cp))) {
  case U_CONTROL_CHAR:
  case U_FORMAT_CHAR:
  case U_SURROGATE:
  case U_PRIVATE_USE_CHAR:
  case U_UNASSIGNED:
  case U_LINE_SEPARATOR:
  case U_PARAGRAPH_SEPARATOR:
  case U_SPACE_SEPARATOR:
    return false;
  default:
    return true;
  }
}

bool is_printable_or_space(const char32_t cp) {
  return is_printable(cp) || u_isspace(static_cast<UChar32>(cp)) != 0;
}

Result<std::string> nfkc_normalize(const std::string &input) {
  UErrorCode status = U_ZERO_ERROR;
  const icu::Normalizer2 *normalizer = icu::Normalizer2::getNFKCInstance(status);
  if (U_FAILURE(status) || normalizer == nullptr) {
    return Result<std::string>::failure(std::string("NFKC normalizer unavailable: ") +
                                        u_errorName(status));
  }

  const icu::UnicodeString source = icu::UnicodeString::fromUTF8(input);
  const icu::UnicodeString normalized = normalizer->normalize(source, status);
  if (U_FAILURE(status)) {
    return Result<std::string>::failure(std::string("NFKC normalization failed: ") +
                                        u_errorName(status));
  }

  std::string out;
  normalized.toUTF8String(out);
  return Result<std::string>::success(std::move(out));
}

} // namespace textguard::common
