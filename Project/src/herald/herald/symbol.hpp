#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace Herald {

// Opaque event key. Every constructed Symbol is unique; copies compare equal.
class Symbol {
  public:
    explicit Symbol(std::string description = "");
    ~Symbol() = default;

    uint64_t id() const { return m_Id; }
    const std::string& description() const { return m_Description; }

    bool operator==(const Symbol& other) const { return m_Id == other.m_Id; }

  private:
    uint64_t m_Id;
    std::string m_Description;
};

}

template <> struct std::hash<Herald::Symbol> {
    size_t operator()(const Herald::Symbol& symbol) const
    {
        return std::hash<uint64_t> {}(symbol.id());
    }
};
