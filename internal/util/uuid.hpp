#pragma once

#include <string>

namespace supervisor::util {

// Random RFC 4122 version 4 id in canonical lowercase text form. Used for
// instance, execution and transcript entry ids; ids are never parsed back.
std::string NewId();

} // namespace supervisor::util
