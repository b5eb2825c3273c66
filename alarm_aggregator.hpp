#pragma once
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "zone_state.hpp"

namespace mvs {

// ============================================================
// Alarm state aggregation
//   ZoneSnapshot (+ transition in flight) -> PanelState
//
// Priority for the collapsed mode:
//   internal_total -> ARMED_AWAY
//   internal_night -> ARMED_NIGHT
//   internal_day | external -> ARMED_HOME
//   nothing        -> DISARMED
// The label list always reports every active zone.
// ============================================================

enum class PanelMode { DISARMED, ARMED_HOME, ARMED_NIGHT, ARMED_AWAY, ARMING, DISARMING };
enum class TransitionKind { ARMING, DISARMING };

const char* to_string(PanelMode m);
const char* to_string(TransitionKind t);

struct PanelState {
  PanelMode mode{PanelMode::DISARMED};
  size_t active_count{0};
  std::vector<std::string> active_labels; // zone order: day, night, total, external
  bool multiple{false};                   // active_count >= 2

  // detail sensor text: "Ninguna", the single label, or "Múltiples (N)"
  std::string summary() const;

  bool operator==(const PanelState& o) const {
    return mode == o.mode && active_count == o.active_count &&
           active_labels == o.active_labels && multiple == o.multiple;
  }
  bool operator!=(const PanelState& o) const { return !(*this == o); }
};

// pure, total over every snapshot
PanelState resolve_panel(const ZoneSnapshot& zones,
                         std::optional<TransitionKind> in_flight = std::nullopt);

// Holds the single "transition in flight" flag of the process.
// The mutex is shared with SessionManager (one lock per process).
class AlarmAggregator {
public:
  explicit AlarmAggregator(std::mutex& mu) : mu_(mu) {}

  AlarmAggregator(const AlarmAggregator&) = delete;
  AlarmAggregator& operator=(const AlarmAggregator&) = delete;

  // throws mvs::Error(TRANSITION_ALREADY_IN_FLIGHT) if one is already running
  void begin_transition(TransitionKind kind);
  void end_transition();

  std::optional<TransitionKind> in_flight() const;

  PanelState resolve(const ZoneSnapshot& zones) const;

private:
  std::mutex& mu_;
  std::optional<TransitionKind> in_flight_;
};

// begin on construction, end on destruction (also when the command throws)
class TransitionGuard {
public:
  TransitionGuard(AlarmAggregator& agg, TransitionKind kind) : agg_(agg) {
    agg_.begin_transition(kind);
  }
  ~TransitionGuard() { if(active_) agg_.end_transition(); }

  TransitionGuard(const TransitionGuard&) = delete;
  TransitionGuard& operator=(const TransitionGuard&) = delete;

  void end() {
    if(!active_) return;
    active_ = false;
    agg_.end_transition();
  }

private:
  AlarmAggregator& agg_;
  bool active_{true};
};

} // namespace mvs
