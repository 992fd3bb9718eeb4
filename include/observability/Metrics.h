/***
 * Name: gsc::obs::Metrics
 * Purpose: Collect per-stage timings, AST geometry and translation counters.
 * Inputs:
 *   - Calls to start/stop timers for named stages (Lex, Parse, Liveness,
 *     Translate, Emit).
 *   - AST summary values (nodes, depth) and counters recorded by the driver.
 * Outputs:
 *   - Human-readable text and JSON summaries.
 * Theory of Operation:
 *   Uses steady_clock timestamps to measure durations. A stage timed more
 *   than once (Liveness and Translate run per function) accumulates.
 *   Formatting is performed on demand.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gsc::obs {

struct AstGeometry {
  uint64_t nodes{0};
  uint64_t maxDepth{0};
};

class Metrics {
 public:
  using Clock = std::chrono::steady_clock;

  void start(const std::string& name);
  void stop(const std::string& name);

  void setAstGeometry(AstGeometry g) { geom_ = g; }
  const std::optional<AstGeometry>& astGeometry() const { return geom_; }

  void incCounter(const std::string& key, uint64_t delta = 1) { counters_[key] += delta; }
  void setCounter(const std::string& key, uint64_t value) { counters_[key] = value; }
  void setGauge(const std::string& key, uint64_t value) { gauges_[key] = value; }
  const std::map<std::string, uint64_t>& counters() const { return counters_; }
  const std::map<std::string, uint64_t>& gauges() const { return gauges_; }
  bool hasDuration(const std::string& name) const { return durations_us_.count(name) != 0; }

  std::string summaryText() const;
  std::string summaryJson() const;
  // Short machine-readable observations derived from the counters.
  std::vector<std::string> hints() const;

 private:
  std::map<std::string, Clock::time_point> active_{};
  std::map<std::string, uint64_t> durations_us_{};
  std::optional<AstGeometry> geom_{};
  std::map<std::string, uint64_t> counters_{};
  std::map<std::string, uint64_t> gauges_{};
};

} // namespace gsc::obs
