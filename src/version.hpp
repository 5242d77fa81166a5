#pragma once

// Set by the build from the project version.
#ifndef TOOLMUX_VERSION
#define TOOLMUX_VERSION "0.1.0"
#endif

namespace toolmux {

constexpr const char* kServerName = "toolmux";
constexpr const char* kVersion = TOOLMUX_VERSION;

} // namespace toolmux
