#include "id_utils.h"
#include <random>

namespace IdUtils {

std::string generateShortId(size_t length) {
    static const char hex_digits[] = "0123456789abcdef";
    thread_local std::mt19937 generator{std::random_device{}()};
    std::uniform_int_distribution<int> distribution(0, 15);

    std::string id;
    id.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        id += hex_digits[distribution(generator)];
    }
    return id;
}

} // namespace IdUtils
