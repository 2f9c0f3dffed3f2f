#include "logger.hpp"

#include "spdlog/common.h"

#include <vector>

namespace Herald {

void Logger::init(spdlog::level::level_enum level)
{
    std::vector<spdlog::sink_ptr> sinks;

    auto stdout_sink = std::make_shared<spdlog::sinks::stdout_sink_mt>();
    stdout_sink->set_level(spdlog::level::trace);

    sinks.push_back(stdout_sink);

    s_Logger = std::make_shared<spdlog::logger>("Herald", begin(sinks), end(sinks));

    s_Logger->set_pattern("[%d/%m/%C %H:%M:%S.%e] [%l] %v");
    s_Logger->set_level(level);

    HERALD_LOG_DEBUG("Initialized Logger");
}

std::shared_ptr<spdlog::logger> Logger::getLogger()
{
    if (!s_Logger)
        init();

    return s_Logger;
}

void Logger::setLevel(spdlog::level::level_enum level) { getLogger()->set_level(level); }

}
