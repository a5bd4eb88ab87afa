#include "textguard/common/ids.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <array>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace textguard::common {

Result<std::string> generate_uuid_v4() {
  std::array<unsigned char, 16> data{};
  if (RAND_bytes(data.data(), static_cast<int>(data.size())) != 1) {
    return Result<std::string>::failure("RAND_bytes failed: " +
                                        std::to_string(ERR_get_error()));
  }
  data[6] = static_cast<unsigned char>((data[6] & 0x0FU) | 0x40U);
  data[8] = static_cast<unsigned char>((data[8] & 0x3FU) | 0x80U);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < data.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      stream << '-';
    }
    stream << std::setw(2) << static_cast<int>(data[i]);
  }
  return Result<std::string>::success(stream.str());
}

std::string now_rfc3339() {
  const auto now = std::chrono::system_clock::now();
  const auto time = std::chrono::system_clock::to_time_t(now);
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() %
      1000;
  std::tm tm{};
  gmtime_r(&time, &tm);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis << 'Z';
  return out.str();
}

} // namespace textguard::common
