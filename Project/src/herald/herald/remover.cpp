#include "remover.hpp"

#include "logger.hpp"

namespace Herald {

Remover::Remover(std::weak_ptr<Registry> registry, EventKey type, Handler handler)
    : m_Registration(std::make_shared<Registration>(Registration {
          .registry = std::move(registry),
          .type = std::move(type),
          .handler = std::move(handler),
      }))
{
}

Remover::Remover(std::weak_ptr<Registry> registry, WildcardHandler handler)
    : m_Registration(std::make_shared<Registration>(Registration {
          .registry = std::move(registry),
          .wildcardHandler = std::move(handler),
      }))
{
}

void Remover::operator()() const
{
    if (!m_Registration || !m_Registration->pending)
        return;

    m_Registration->pending = false;

    std::shared_ptr<Registry> registry = m_Registration->registry.lock();
    if (!registry) {
        HERALD_LOG_DEBUG("Remover invoked after its registry was destroyed");
        return;
    }

    if (m_Registration->type) {
        HERALD_LOG_DEBUG("Remover: off {}", toString(*m_Registration->type));
        registry->remove(*m_Registration->type, m_Registration->handler);
    } else {
        HERALD_LOG_DEBUG("Remover: off *");
        registry->remove(m_Registration->wildcardHandler);
    }
}

bool Remover::active() const
{
    if (!m_Registration || !m_Registration->pending)
        return false;

    std::shared_ptr<Registry> registry = m_Registration->registry.lock();
    if (!registry)
        return false;

    if (m_Registration->type)
        return registry->contains(*m_Registration->type, m_Registration->handler);

    return registry->contains(m_Registration->wildcardHandler);
}

}
