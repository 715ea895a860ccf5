#pragma once

#define SIMLENS_VERSION_MAJOR 3
#define SIMLENS_VERSION_MINOR 0
#define SIMLENS_VERSION_PATCH 0

#define SIMLENS_VERSION_STRING "3.0.0"

// For compile-time version checks
#define SIMLENS_VERSION \
  (SIMLENS_VERSION_MAJOR * 10000 + SIMLENS_VERSION_MINOR * 100 + SIMLENS_VERSION_PATCH)

namespace simlens {

inline const char* Version() { return SIMLENS_VERSION_STRING; }

}  // namespace simlens
