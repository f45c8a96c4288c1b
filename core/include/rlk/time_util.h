#pragma once

#include <string>

namespace rlk {

// "2024-01-01T12:00:00Z"
std::string now_iso_utc();
// "20240101_120000", UTC, for file names.
std::string now_stamp();

} // namespace rlk
