#pragma once

#define GTIN_VERSION_MAJOR 1
#define GTIN_VERSION_MINOR 0
#define GTIN_VERSION_PATCH 2

#define GTIN_VERSION_STRING "1.0.2"

// For compile-time version checks
#define GTIN_VERSION \
  (GTIN_VERSION_MAJOR * 10000 + GTIN_VERSION_MINOR * 100 + GTIN_VERSION_PATCH)

namespace gtin {

inline const char* Version() { return GTIN_VERSION_STRING; }

}  // namespace gtin
