#include "registry.hpp"

#include <algorithm>

namespace Herald {

namespace {
    template <typename List, typename Item> void removeFirst(List& list, const Item& item)
    {
        auto it = std::find(list.begin(), list.end(), item);
        if (it != list.end())
            list.erase(it);
    }
}

Handler makeHandler(HandlerFunction function)
{
    return std::make_shared<HandlerFunction>(std::move(function));
}

WildcardHandler makeWildcardHandler(WildcardFunction function)
{
    return std::make_shared<WildcardFunction>(std::move(function));
}

void Registry::add(const EventKey& type, Handler handler)
{
    handlers[type].push_back(std::move(handler));
}

void Registry::add(WildcardHandler handler)
{
    wildcard.push_back(std::move(handler));
}

void Registry::remove(const EventKey& type, const Handler& handler)
{
    auto it = handlers.find(type);
    if (it == handlers.end())
        return;

    removeFirst(it->second, handler);
}

void Registry::remove(const WildcardHandler& handler) { removeFirst(wildcard, handler); }

void Registry::clear(const EventKey& type) { handlers[type] = HandlerList {}; }

void Registry::clearWildcard() { wildcard = WildcardHandlerList {}; }

bool Registry::contains(const EventKey& type, const Handler& handler) const
{
    auto it = handlers.find(type);
    if (it == handlers.end())
        return false;

    return std::find(it->second.begin(), it->second.end(), handler) != it->second.end();
}

bool Registry::contains(const WildcardHandler& handler) const
{
    return std::find(wildcard.begin(), wildcard.end(), handler) != wildcard.end();
}

size_t Registry::count(const EventKey& type) const
{
    auto it = handlers.find(type);
    if (it == handlers.end())
        return 0;

    return it->second.size();
}

HandlerList Registry::snapshot(const EventKey& type) const
{
    auto it = handlers.find(type);
    if (it == handlers.end())
        return {};

    return it->second;
}

}
