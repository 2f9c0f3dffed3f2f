#include <CLI/CLI.hpp>

#include <herald/emitter.hpp>
#include <herald/logger.hpp>

#include "demo_settings.hpp"

#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <future>

int main(int argc, char** argv)
{
    CLI::App app { "Drive an event emitter with a synthetic workload" };
    argv = app.ensure_utf8(argv);

    DemoSettings settings;

    app.add_option("-e,--events", settings.events, "Number of tick events to emit");
    app.add_option("-n,--handlers", settings.handlers, "Number of tick handlers to register");
    app.add_flag("--once", settings.once, "Register tick handlers with once()");
    app.add_option("-l,--log-level", settings.logLevel, "Logging level")
        ->check(CLI::IsMember({ "trace", "debug", "info", "warning", "error", "critical", "off" }));

    CLI11_PARSE(app, argc, argv);

    Herald::Logger::init(spdlog::level::from_str(settings.logLevel));

    Herald::EventTag<uint32_t> tick { "tick" };
    Herald::EventTag<uint64_t> done { Herald::Symbol("done") };

    Herald::Emitter emitter;

    uint64_t tickCalls = 0;
    uint64_t tickSum = 0;
    for (uint32_t i = 0; i < settings.handlers; i++) {
        auto handler = [&tickCalls, &tickSum](const uint32_t& value) {
            tickCalls++;
            tickSum += value;
        };

        if (settings.once)
            emitter.once(tick, handler);
        else
            emitter.on(tick, handler);
    }

    uint64_t wildcardCalls = 0;
    emitter.on(Herald::WILDCARD, [&wildcardCalls](const Herald::EventKey& type, const Herald::Payload&) {
        HERALD_LOG_DEBUG("Observed {}", Herald::toString(type));
        wildcardCalls++;
    });

    std::future<uint64_t> finished = emitter.waitFor(done);

    for (uint32_t i = 0; i < settings.events; i++) {
        emitter.emit(tick, i);
    }
    emitter.emit(done, tickCalls);

    HERALD_LOG_INFO("Emitted {} ticks", settings.events);

    printf("tick handler calls: %" PRIu64 "\n", finished.get());
    printf("tick payload sum:   %" PRIu64 "\n", tickSum);
    printf("wildcard calls:     %" PRIu64 "\n", wildcardCalls);

    return 0;
}
