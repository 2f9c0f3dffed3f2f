#include "symbol.hpp"

#include <atomic>

namespace Herald {

namespace {
    std::atomic<uint64_t> s_NextId { 1 };
}

Symbol::Symbol(std::string description)
    : m_Id(s_NextId.fetch_add(1, std::memory_order_relaxed))
    , m_Description(std::move(description))
{
}

}
