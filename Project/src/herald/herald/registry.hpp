#pragma once

#include "event_key.hpp"

#include <any>
#include <functional>
#include <memory>
#include <unordered_map>
#include <vector>

namespace Herald {

using Payload = std::any;

using HandlerFunction = std::function<void(const Payload&)>;
using WildcardFunction = std::function<void(const EventKey&, const Payload&)>;

// Handlers are compared by identity, so the same callable can be registered and removed repeatedly.
using Handler = std::shared_ptr<HandlerFunction>;
using WildcardHandler = std::shared_ptr<WildcardFunction>;

using HandlerList = std::vector<Handler>;
using WildcardHandlerList = std::vector<WildcardHandler>;

Handler makeHandler(HandlerFunction function);
WildcardHandler makeWildcardHandler(WildcardFunction function);

struct Registry {
    std::unordered_map<EventKey, HandlerList> handlers;
    WildcardHandlerList wildcard;

    void add(const EventKey& type, Handler handler);
    void add(WildcardHandler handler);

    // Removes the first occurrence only. An emptied list is kept.
    void remove(const EventKey& type, const Handler& handler);
    void remove(const WildcardHandler& handler);

    void clear(const EventKey& type);
    void clearWildcard();

    bool contains(const EventKey& type) const { return handlers.contains(type); }
    bool contains(const EventKey& type, const Handler& handler) const;
    bool contains(const WildcardHandler& handler) const;
    size_t count(const EventKey& type) const;

    HandlerList snapshot(const EventKey& type) const;
    WildcardHandlerList snapshotWildcard() const { return wildcard; }
};

}
