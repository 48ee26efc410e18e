#pragma once

#include <string>

namespace gazeclean {

// Project version string as defined by CMake's project(VERSION ...).
//
// CMake defines GAZECLEAN_VERSION_STRING for all targets that link against the
// core gazeclean library.
#ifndef GAZECLEAN_VERSION_STRING
  #define GAZECLEAN_VERSION_STRING "0.0.0"
#endif

inline const char* version_cstr() {
  return GAZECLEAN_VERSION_STRING;
}

inline std::string version_string() {
  return std::string(version_cstr());
}

inline std::string build_type_string() {
#ifdef NDEBUG
  return "Release";
#else
  return "Debug";
#endif
}

} // namespace gazeclean
