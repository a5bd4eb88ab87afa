#pragma once

#include "textguard/common/result.hpp"
#include <string>

namespace textguard::common {

/// Random RFC 4122 version-4 UUID, lower-case hex with dashes.
[[nodiscard]] Result<std::string> generate_uuid_v4();

/// Current UTC time as `YYYY-MM-DDTHH:MM:SS.mmmZ`.
[[nodiscard]] std::string now_rfc3339();

} // namespace textguard::common
