#pragma once
#include "config/config_types.h"
#include "router_registry.h"

class IUpstreamClient;

namespace source_catalog {

// Mounts every built-in source. Returns the number of sources mounted.
int registerDefaultSources(RouterRegistry& registry,
                           IUpstreamClient& client,
                           const GatewayConfig& config);

}
