#pragma once

#define LULL_VERSION_MAJOR 0
#define LULL_VERSION_MINOR 1
#define LULL_VERSION_PATCH 0

#define LULL_VERSION_CODE \
  ((LULL_VERSION_MAJOR << 16) | (LULL_VERSION_MINOR << 8) | (LULL_VERSION_PATCH))

#define LULL_VERSION_STRING "0.1.0"

namespace lull {
struct version {
  static constexpr int major = LULL_VERSION_MAJOR;
  static constexpr int minor = LULL_VERSION_MINOR;
  static constexpr int patch = LULL_VERSION_PATCH;
  static constexpr const char* string = LULL_VERSION_STRING;
};
}
