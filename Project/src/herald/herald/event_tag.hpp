#pragma once

#include "event_key.hpp"

namespace Herald {

// Binds a payload type to a key so typed registrations and emissions agree at compile time.
template <typename T> struct EventTag {
    using PayloadType = T;

    EventKey key;
};

}
