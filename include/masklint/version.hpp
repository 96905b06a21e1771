#pragma once
#include <iostream>

#define MASKLINT_VERSION_MAJOR 0
#define MASKLINT_VERSION_MINOR 3
#define MASKLINT_VERSION_PATCH 0
#define MASKLINT_VERSION_STRING "0.3.0"

namespace masklint {

inline void print_version() {
    std::cout << "masklint " << MASKLINT_VERSION_STRING << std::endl;
}

}  // namespace masklint
