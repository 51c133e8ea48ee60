#pragma once

#include <string>

namespace IdUtils {
    // Random lower-case hex string, used as the temporary file prefix that
    // keeps concurrent downloads of the same title from colliding.
    // Each call draws from a per-thread generator seeded from std::random_device.
    std::string generateShortId(size_t length = 8);
}
