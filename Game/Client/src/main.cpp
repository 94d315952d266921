#include <chrono>
#include <csignal>
#include <cstdlib>
#include <string>
#include <thread>

#include "Utils/Log.hpp"
#include "Console/ConVar.hpp"
#include "ClientNetworkManager.hpp"
#include "world.hpp"

using namespace Tether;

static volatile std::sig_atomic_t g_running = 1;

static world _world;
static ClientNetworkManager _network;

static void handle_signal(int)
{
    g_running = 0;
}

static void quit_client(int code)
{
    _network.disconnect();
    CLog::Shutdown();
    std::exit(code);
}

int main(int argc, char* argv[])
{
    CLog::Init();
    InitializeDefaultCVars();
    ConVarRegistry::get().setSide(ConVarSide::Client);

    if (argc > 1 && argv[1][0] != '+') {
        if (!ConVarRegistry::get().loadConfig(argv[1])) {
            LOG_APP_WARN("Could not load config '{}', using defaults", argv[1]);
        }
    }
    ConVarRegistry::get().applyCommandLine(argc, argv);

    std::string log_file = CVAR_STRING(log_file);
    if (!log_file.empty()) {
        CLog::Shutdown();
        CLog::Init(log_file);
    }
    CLog::SetLevel(CVAR_BOOL(developer) ? spdlog::level::trace : spdlog::level::info);
    ConVarRegistry::get().lockReadOnly();

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    int tickrate = CVAR_INT(sv_tickrate);
    _world.setFixedDelta(1.0f / static_cast<float>(tickrate > 0 ? tickrate : 60));

    _network.setMaxFrameSize(static_cast<uint32_t>(CVAR_INT(net_maxframesize)));
    _network.setConnectTimeout(static_cast<uint32_t>(CVAR_INT(net_connecttimeout)));
    _network.setOnServerMessage([](const ServerMessage& message) {
        _network.applyServerMessage(_world, message);
    });
    _network.setOnLoadLevel([](const std::string& path) {
        LOG_APP_INFO("Server requested level '{}'", path);
    });
    _network.setOnDisconnected([]() {
        LOG_APP_WARN("Disconnected from server");
        g_running = 0;
    });

    std::string address = CVAR_STRING(cl_address);
    uint16_t port = static_cast<uint16_t>(CVAR_INT(cl_port));
    LOG_APP_INFO("Connecting to {}:{}...", address, port);

    if (_network.connectToServer(address, port) != NetError::None) {
        LOG_APP_FATAL("Failed to connect: {}", _network.getLastErrorMessage());
        quit_client(1);
    }

    using clock = std::chrono::steady_clock;
    const auto tick_duration = std::chrono::duration_cast<clock::duration>(
        std::chrono::duration<float>(_world.fixed_delta));
    auto next_tick = clock::now();
    auto next_report = clock::now() + std::chrono::seconds(1);

    while (g_running && _network.isConnected()) {
        if (_network.readMessages() != NetError::None) {
            break;
        }

        int auto_input = CVAR_INT(cl_autoinput);
        if (auto_input != 0) {
            PlayerInputMessage input;
            input.left = auto_input < 0;
            input.right = auto_input > 0;
            if (_network.send(input) != NetError::None) {
                break;
            }
        }

        if (clock::now() >= next_report) {
            next_report += std::chrono::seconds(1);
            NetworkStats stats = _network.getStats();
            LOG_APP_INFO("Mirroring {} entities ({} messages in, {} out)",
                _network.getMirroredEntityCount(), stats.messages_received, stats.messages_sent);
        }

        next_tick += tick_duration;
        auto now = clock::now();
        if (next_tick < now) {
            next_tick = now;
        }
        std::this_thread::sleep_until(next_tick);
    }

    quit_client(0);
    return 0;
}
