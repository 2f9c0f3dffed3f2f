#include "emitter.hpp"

#include "logger.hpp"

#include <functional>

namespace Herald {

namespace {
    // Null handlers are accepted at registration and fail here like an empty std::function.
    template <typename Function> Function& callable(const std::shared_ptr<Function>& handler)
    {
        if (!handler)
            throw std::bad_function_call();

        return *handler;
    }
}

Emitter::Emitter()
    : m_Registry(std::make_shared<Registry>())
{
}

Emitter::Emitter(std::shared_ptr<Registry> registry)
    : m_Registry(registry ? std::move(registry) : std::make_shared<Registry>())
{
}

Remover Emitter::on(const EventKey& type, Handler handler)
{
    m_Registry->add(type, handler);
    HERALD_LOG_DEBUG("on {} ({} handlers)", toString(type), m_Registry->count(type));

    return Remover(m_Registry, type, std::move(handler));
}

Remover Emitter::on(const EventKey& type, HandlerFunction function)
{
    return on(type, makeHandler(std::move(function)));
}

Remover Emitter::on(WildcardKey, WildcardHandler handler)
{
    m_Registry->add(handler);
    HERALD_LOG_DEBUG("on * ({} handlers)", m_Registry->wildcard.size());

    return Remover(m_Registry, std::move(handler));
}

Remover Emitter::on(WildcardKey, WildcardFunction function)
{
    return on(WILDCARD, makeWildcardHandler(std::move(function)));
}

Remover Emitter::once(const EventKey& type, Handler handler)
{
    Handler wrapper = std::make_shared<HandlerFunction>();
    std::weak_ptr<HandlerFunction> self = wrapper;
    std::weak_ptr<Registry> registry = m_Registry;

    *wrapper = [registry, type, handler, self](const Payload& payload) {
        if (std::shared_ptr<Registry> live = registry.lock())
            live->remove(type, self.lock());

        callable(handler)(payload);
    };

    return on(type, std::move(wrapper));
}

Remover Emitter::once(const EventKey& type, HandlerFunction function)
{
    return once(type, makeHandler(std::move(function)));
}

Remover Emitter::once(WildcardKey, WildcardHandler handler)
{
    WildcardHandler wrapper = std::make_shared<WildcardFunction>();
    std::weak_ptr<WildcardFunction> self = wrapper;
    std::weak_ptr<Registry> registry = m_Registry;

    *wrapper = [registry, handler, self](const EventKey& type, const Payload& payload) {
        if (std::shared_ptr<Registry> live = registry.lock())
            live->remove(self.lock());

        callable(handler)(type, payload);
    };

    return on(WILDCARD, std::move(wrapper));
}

Remover Emitter::once(WildcardKey, WildcardFunction function)
{
    return once(WILDCARD, makeWildcardHandler(std::move(function)));
}

std::future<Payload> Emitter::waitFor(const EventKey& type)
{
    auto promise = std::make_shared<std::promise<Payload>>();
    auto resolved = std::make_shared<bool>(false);
    std::future<Payload> future = promise->get_future();

    // A re-entrant emit can reach the wrapper again through an outer snapshot; only the first resolves.
    once(type, [promise, resolved](const Payload& payload) {
        if (*resolved)
            return;

        *resolved = true;
        promise->set_value(payload);
    });

    return future;
}

std::future<std::pair<EventKey, Payload>> Emitter::waitFor(WildcardKey)
{
    auto promise = std::make_shared<std::promise<std::pair<EventKey, Payload>>>();
    auto resolved = std::make_shared<bool>(false);
    std::future<std::pair<EventKey, Payload>> future = promise->get_future();

    once(WILDCARD, [promise, resolved](const EventKey& type, const Payload& payload) {
        if (*resolved)
            return;

        *resolved = true;
        promise->set_value(std::make_pair(type, payload));
    });

    return future;
}

void Emitter::off(const EventKey& type)
{
    HERALD_LOG_DEBUG("off {} (all)", toString(type));
    m_Registry->clear(type);
}

void Emitter::off(const EventKey& type, const Handler& handler)
{
    HERALD_LOG_DEBUG("off {}", toString(type));
    m_Registry->remove(type, handler);
}

void Emitter::off(WildcardKey)
{
    HERALD_LOG_DEBUG("off * (all)");
    m_Registry->clearWildcard();
}

void Emitter::off(WildcardKey, const WildcardHandler& handler)
{
    HERALD_LOG_DEBUG("off *");
    m_Registry->remove(handler);
}

void Emitter::emit(const EventKey& type, const Payload& payload)
{
    HandlerList handlers = m_Registry->snapshot(type);
    HERALD_LOG_DEBUG("emit {} ({} handlers)", toString(type), handlers.size());

    for (const Handler& handler : handlers) {
        callable(handler)(payload);
    }

    WildcardHandlerList wildcards = m_Registry->snapshotWildcard();
    for (const WildcardHandler& handler : wildcards) {
        callable(handler)(type, payload);
    }
}

}
