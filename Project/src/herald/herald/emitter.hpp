#pragma once

#include "event_key.hpp"
#include "event_tag.hpp"
#include "registry.hpp"
#include "remover.hpp"

#include <any>
#include <functional>
#include <future>
#include <memory>
#include <type_traits>
#include <utility>

namespace Herald {

class Emitter {
    template <typename T> using TypedFunction = std::type_identity_t<std::function<void(const T&)>>;

  public:
    Emitter();
    explicit Emitter(std::shared_ptr<Registry> registry);
    ~Emitter() = default;

    Remover on(const EventKey& type, Handler handler);
    Remover on(const EventKey& type, HandlerFunction function);
    Remover on(WildcardKey, WildcardHandler handler);
    Remover on(WildcardKey, WildcardFunction function);

    // The handler is unregistered before it runs, so a re-entrant emit cannot reach it again.
    Remover once(const EventKey& type, Handler handler);
    Remover once(const EventKey& type, HandlerFunction function);
    Remover once(WildcardKey, WildcardHandler handler);
    Remover once(WildcardKey, WildcardFunction function);

    std::future<Payload> waitFor(const EventKey& type);
    std::future<std::pair<EventKey, Payload>> waitFor(WildcardKey);

    void off(const EventKey& type);
    void off(const EventKey& type, const Handler& handler);
    void off(WildcardKey);
    void off(WildcardKey, const WildcardHandler& handler);

    // Type handlers run first, then wildcard handlers. Each list is copied before dispatch, so
    // registrations made by a handler only apply to later emissions. Exceptions are not caught.
    void emit(const EventKey& type, const Payload& payload = {});

    template <typename T> Remover on(const EventTag<T>& tag, TypedFunction<T> function)
    {
        return on(tag.key, typedHandler<T>(std::move(function)));
    }

    template <typename T> Remover once(const EventTag<T>& tag, TypedFunction<T> function)
    {
        return once(tag.key, typedHandler<T>(std::move(function)));
    }

    template <typename T> std::future<T> waitFor(const EventTag<T>& tag)
    {
        auto promise = std::make_shared<std::promise<T>>();
        auto resolved = std::make_shared<bool>(false);
        std::future<T> future = promise->get_future();

        once(tag, [promise, resolved](const T& payload) {
            if (*resolved)
                return;

            *resolved = true;
            promise->set_value(payload);
        });

        return future;
    }

    template <typename T> void off(const EventTag<T>& tag) { off(tag.key); }

    template <typename T> void emit(const EventTag<T>& tag, const std::type_identity_t<T>& payload)
    {
        emit(tag.key, Payload(payload));
    }

    Registry& all() { return *m_Registry; }
    const Registry& all() const { return *m_Registry; }
    std::shared_ptr<Registry> registry() const { return m_Registry; }

  private:
    template <typename T> static HandlerFunction typedHandler(std::function<void(const T&)> function)
    {
        return [function = std::move(function)](
                   const Payload& payload) { function(std::any_cast<const T&>(payload)); };
    }

  private:
    std::shared_ptr<Registry> m_Registry;
};

}
