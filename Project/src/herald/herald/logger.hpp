#pragma once

#include "spdlog/sinks/stdout_sinks.h"
#include "spdlog/spdlog.h"

#include <memory>

namespace Herald {

class Logger {
  public:
    static void init(spdlog::level::level_enum level = spdlog::level::debug);
    static std::shared_ptr<spdlog::logger> getLogger();

    static void setLevel(spdlog::level::level_enum level);

  private:
    inline static std::shared_ptr<spdlog::logger> s_Logger;

  private:
    Logger() = delete;
};

}

#ifdef HERALD_DEBUG
#define HERALD_LOG_DEBUG(...) ::Herald::Logger::getLogger()->debug(__VA_ARGS__)
#define HERALD_LOG_INFO(...) ::Herald::Logger::getLogger()->info(__VA_ARGS__)
#define HERALD_LOG_ERROR(...) ::Herald::Logger::getLogger()->error(__VA_ARGS__)
#define HERALD_LOG_CRITICAL(...) ::Herald::Logger::getLogger()->critical(__VA_ARGS__)
#else
#define HERALD_LOG_DEBUG(...)
#define HERALD_LOG_INFO(...)
#define HERALD_LOG_ERROR(...)
#define HERALD_LOG_CRITICAL(...)
#endif
