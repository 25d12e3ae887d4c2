#pragma once

#include "ScenarioEngine.h"
#include "net/Router.h"

#include <string>

namespace mockprom {

// Registers the Prometheus query API, /metrics, and the scenario control
// endpoints. The engine must outlive the router.
void register_routes(Router& router, ScenarioEngine& engine);

std::string status_json(const ScenarioStatus& st);
std::string format_iso8601_utc(Clock::time_point tp);

}
