#include <atomic>
#include <chrono>
#include <csignal>
#include <string>
#include <thread>

#include "Utils/Log.hpp"
#include "Console/ConVar.hpp"
#include "ListenServer.hpp"

using namespace Tether;

static volatile std::sig_atomic_t g_running = 1;

static void handle_signal(int)
{
    g_running = 0;
}

static void load_configuration(int argc, char* argv[])
{
    InitializeDefaultCVars();
    ConVarRegistry::get().setSide(ConVarSide::Server);

    // First argument that is not a "+cvar value" pair is the config file
    if (argc > 1 && argv[1][0] != '+') {
        if (!ConVarRegistry::get().loadConfig(argv[1])) {
            LOG_APP_WARN("Could not load config '{}', using defaults", argv[1]);
        }
    }

    int overrides = ConVarRegistry::get().applyCommandLine(argc, argv);
    if (overrides > 0) {
        LOG_APP_INFO("Applied {} command line overrides", overrides);
    }

    std::string log_file = CVAR_STRING(log_file);
    if (!log_file.empty()) {
        CLog::Shutdown();
        CLog::Init(log_file);
    }
    CLog::SetLevel(CVAR_BOOL(developer) ? spdlog::level::trace : spdlog::level::info);

    ConVarRegistry::get().lockReadOnly();
}

int main(int argc, char* argv[])
{
    CLog::Init();
    load_configuration(argc, argv);

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    ListenServerConfig config = ListenServerConfig::fromCVars();
    LOG_APP_INFO("Starting {} server on {}:{}...",
        config.run_local_client ? "listen" : "dedicated", config.address, config.port);

    ListenServer listen_server(config);
    listen_server.setOnLoadLevel([](const std::string& path) {
        LOG_APP_INFO("Local client loading level '{}'", path);
    });

    if (!listen_server.initialize()) {
        LOG_APP_FATAL("Failed to initialize server");
        CLog::Shutdown();
        return 1;
    }

    LOG_APP_INFO("Server started successfully");

    using clock = std::chrono::steady_clock;
    const auto tick_duration = std::chrono::duration_cast<clock::duration>(
        std::chrono::duration<float>(config.fixed_delta));
    auto next_tick = clock::now();

    while (g_running) {
        listen_server.onTick();

        // Fixed rate; skip ahead instead of bursting after a stall
        next_tick += tick_duration;
        auto now = clock::now();
        if (next_tick < now) {
            next_tick = now;
        }
        std::this_thread::sleep_until(next_tick);
    }

    LOG_APP_INFO("Shutting down after {} ticks", listen_server.getTickCount());
    listen_server.shutdown();
    CLog::Shutdown();
    return 0;
}
