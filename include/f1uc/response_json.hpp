#pragma once
#include <string>
#include <f1uc/orchestrator.hpp>
#include <f1uc/version.hpp>

namespace f1uc {

// Wire form of /simulate: p_undercut, pitLoss_s, outLapDelta_s, assumptions
// (models_fitted = !used_backoff) and, for multi-horizon runs, horizons and
// optimal_pit_lap. Non-finite numbers are written as null.
std::string to_json(const SimulationResponse& resp);

// {"service": ..., "version": ..., "healthy": ...}
std::string to_json(const ServiceStatus& status);

} // namespace f1uc
