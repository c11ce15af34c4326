#pragma once

// RDU_VERSION comes from the build (project version)
#ifndef RDU_VERSION
#define RDU_VERSION "0.0.0"
#endif

namespace rdu::config {

inline constexpr const char* VERSION = RDU_VERSION;

}  // namespace rdu::config
