#pragma once

#define CANON_VERSION_MAJOR 0
#define CANON_VERSION_MINOR 1
#define CANON_VERSION_PATCH 0

#define CANON_VERSION_STRING "0.1.0"

// For compile-time version checks
#define CANON_VERSION \
  (CANON_VERSION_MAJOR * 10000 + CANON_VERSION_MINOR * 100 + CANON_VERSION_PATCH)

namespace canon {

inline const char* Version() { return CANON_VERSION_STRING; }

}  // namespace canon
