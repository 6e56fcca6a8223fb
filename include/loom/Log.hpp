#pragma once

#include <ostream>

namespace loom {

// Engine log streams. Progress goes to logOut(), rejected operations to logErr().
// Each line starts with a [Tag] naming the module that wrote it.
std::ostream& logOut();
std::ostream& logErr();

// Disabling routes both streams to a sink (tests keep the console quiet this way)
void setLogEnabled(bool enabled);
bool isLogEnabled();

} // namespace loom
