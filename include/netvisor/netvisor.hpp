#pragma once

// Core types
#include "core/api_key.hpp"
#include "core/config.hpp"
#include "core/types.hpp"
#include "core/uuid.hpp"

// Daemon registry
#include "daemon/daemon.hpp"
#include "daemon/daemon_store.hpp"
#include "daemon/json_daemon_store.hpp"

// Network
#include "net/http_client.hpp"

// Fleet
#include "fleet/api.hpp"
#include "fleet/fleet_service.hpp"

// Discovery sessions
#include "discovery/discovery_manager.hpp"
#include "discovery/reclaimer.hpp"
#include "discovery/session_table.hpp"

// Process wiring
#include "server/control_plane.hpp"

#include <string>

namespace netvisor {

// Get version string
std::string version();

}  // namespace netvisor
