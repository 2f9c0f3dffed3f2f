#pragma once

#include "registry.hpp"

#include <memory>
#include <optional>

namespace Herald {

// Undoes a single registration. Copies share state, so the removal happens at most once.
class Remover {
  public:
    Remover() = default;
    Remover(std::weak_ptr<Registry> registry, EventKey type, Handler handler);
    Remover(std::weak_ptr<Registry> registry, WildcardHandler handler);
    ~Remover() = default;

    void operator()() const;

    // False once the handler has left the registry by any route, including a fired once().
    bool active() const;

  private:
    struct Registration {
        std::weak_ptr<Registry> registry;
        std::optional<EventKey> type;
        Handler handler;
        WildcardHandler wildcardHandler;
        bool pending = true;
    };

    std::shared_ptr<Registration> m_Registration;
};

}
