// Default ConVar definitions
#include "ConVar.hpp"

using namespace Tether;

// Server cvars
CONVAR(sv_address, "127.0.0.1", ConVarFlags::ARCHIVE | ConVarFlags::SERVER_ONLY | ConVarFlags::READ_ONLY,
       "Address the server listens on");

CONVAR_BOUNDED(sv_port, 10000, 0, 65535, ConVarFlags::ARCHIVE | ConVarFlags::SERVER_ONLY | ConVarFlags::READ_ONLY,
               "Port the server listens on (0 = pick a free port)");

CONVAR_BOUNDED(sv_maxclients, 0, 0, 4096, ConVarFlags::ARCHIVE | ConVarFlags::SERVER_ONLY,
               "Maximum live connections (0 = unlimited)");

// Read by both programs
CONVAR_BOUNDED(sv_tickrate, 60, 1, 1000, ConVarFlags::ARCHIVE | ConVarFlags::READ_ONLY,
               "Host ticks per second");

CONVAR_BOUNDED(sv_syncinterval, 3, 1, 1000, ConVarFlags::ARCHIVE | ConVarFlags::SERVER_ONLY,
               "Ticks between state syncs");

CONVAR(sv_deltacompression, 1, ConVarFlags::ARCHIVE | ConVarFlags::SERVER_ONLY,
       "Only send entities that changed since the last sync (0=full snapshots)");

CONVAR_BOUNDED(sv_playerspeed, 5.0f, 0.0f, 1000.0f, ConVarFlags::ARCHIVE | ConVarFlags::SERVER_ONLY,
               "Player movement speed driven by PlayerInput");

CONVAR(sv_listen, 1, ConVarFlags::ARCHIVE | ConVarFlags::SERVER_ONLY | ConVarFlags::READ_ONLY,
       "Also run a local client in the server process");

CONVAR(sv_level, "", ConVarFlags::ARCHIVE | ConVarFlags::SERVER_ONLY,
       "Level path sent to clients when they join (empty = none)");

// Client cvars
CONVAR(cl_address, "127.0.0.1", ConVarFlags::ARCHIVE | ConVarFlags::CLIENT_ONLY,
       "Server address the client connects to");

CONVAR_BOUNDED(cl_port, 10000, 1, 65535, ConVarFlags::ARCHIVE | ConVarFlags::CLIENT_ONLY,
               "Server port the client connects to");

CONVAR_BOUNDED(cl_autoinput, 0, -1, 1, ConVarFlags::CLIENT_ONLY,
               "Headless client input: -1 hold left, 1 hold right, 0 idle");

// Network cvars
CONVAR_BOUNDED(net_maxframesize, 16777216, 64, 268435456, ConVarFlags::ARCHIVE,
               "Largest accepted frame payload in bytes");

CONVAR_BOUNDED(net_connecttimeout, 5000, 100, 60000, ConVarFlags::ARCHIVE,
               "Milliseconds a client waits for the connection handshake");

// Logging
CONVAR(log_file, "", ConVarFlags::ARCHIVE | ConVarFlags::READ_ONLY,
       "Also write log output to this file");

CONVAR(developer, 0, ConVarFlags::ARCHIVE,
       "Developer mode - enables trace logging");

namespace Tether {

// Referencing this function keeps the registrations above in static links
void InitializeDefaultCVars()
{
}

} // namespace Tether
