#pragma once

#include <nlohmann/json.hpp>

#include "discovery/scanner.hpp"

namespace devscout {
namespace http {

// Sweep counters keyed by miss reason name
nlohmann::json encode_sweep_stats(const discovery::SweepStats &stats);

}  // namespace http
}  // namespace devscout
