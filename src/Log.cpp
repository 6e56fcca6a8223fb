#include <loom/Log.hpp>

#include <iostream>

namespace loom {

namespace {

bool s_logEnabled = true;

std::ostream& nullStream() {
    // A stream without a buffer swallows everything written to it
    static std::ostream s_null(nullptr);
    return s_null;
}

} // namespace

std::ostream& logOut() {
    return s_logEnabled ? std::cout : nullStream();
}

std::ostream& logErr() {
    return s_logEnabled ? std::cerr : nullStream();
}

void setLogEnabled(bool enabled) {
    s_logEnabled = enabled;
}

bool isLogEnabled() {
    return s_logEnabled;
}

} // namespace loom
