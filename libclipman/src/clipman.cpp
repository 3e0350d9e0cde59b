/**
 * @file clipman.cpp
 * @brief Library version information
 */

#include "clipman/clipman.h"

namespace clipman {

VersionInfo get_version() { return VersionInfo{}; }

} // namespace clipman
