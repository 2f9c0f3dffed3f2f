#include "event_key.hpp"

namespace Herald {

std::string toString(const EventKey& key)
{
    if (const std::string* name = std::get_if<std::string>(&key))
        return *name;

    return "Symbol(" + std::get<Symbol>(key).description() + ")";
}

}
