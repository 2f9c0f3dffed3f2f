#pragma once

#include <cstdint>
#include <string>

struct DemoSettings {
    uint32_t events = 16;
    uint32_t handlers = 4;
    bool once = false;
    std::string logLevel = "info";
};
