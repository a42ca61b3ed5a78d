#pragma once

#include <random>
#include <string>
#include <stduuid/uuid.h>

namespace util {

// Random v4 UUID in its canonical 36-character form.
inline std::string make_transfer_id() {
    thread_local std::random_device rd;
    thread_local std::mt19937 generator(rd());

    uuids::uuid_random_generator gen{generator};
    return uuids::to_string(gen());
}

} // namespace util
