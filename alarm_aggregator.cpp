#include "alarm_aggregator.hpp"
#include "errors.hpp"

#include <iostream>

namespace mvs {

const char* to_string(PanelMode m) {
  switch(m){
    case PanelMode::DISARMED:    return "disarmed";
    case PanelMode::ARMED_HOME:  return "armed_home";
    case PanelMode::ARMED_NIGHT: return "armed_night";
    case PanelMode::ARMED_AWAY:  return "armed_away";
    case PanelMode::ARMING:      return "arming";
    case PanelMode::DISARMING:   return "disarming";
  }
  return "unknown";
}

const char* to_string(TransitionKind t) {
  return t == TransitionKind::ARMING ? "arming" : "disarming";
}

std::string PanelState::summary() const {
  if(active_count == 0) return "Ninguna";
  if(active_count == 1 && !active_labels.empty()) return active_labels.front();
  return "Múltiples (" + std::to_string(active_count) + ")";
}

static PanelMode settled_mode(const ZoneSnapshot& z) {
  if(z.active(ZoneKind::INTERNAL_TOTAL)) return PanelMode::ARMED_AWAY;
  if(z.active(ZoneKind::INTERNAL_NIGHT)) return PanelMode::ARMED_NIGHT;
  if(z.active(ZoneKind::INTERNAL_DAY) || z.active(ZoneKind::EXTERNAL)) return PanelMode::ARMED_HOME;
  return PanelMode::DISARMED;
}

PanelState resolve_panel(const ZoneSnapshot& zones, std::optional<TransitionKind> in_flight) {
  PanelState p;

  if(in_flight)
    p.mode = (*in_flight == TransitionKind::ARMING) ? PanelMode::ARMING : PanelMode::DISARMING;
  else
    p.mode = settled_mode(zones);

  for(ZoneKind k : kAllZones){
    if(zones.active(k)) p.active_labels.emplace_back(zone_label(k));
  }
  p.active_count = p.active_labels.size();
  p.multiple = p.active_count >= 2;
  return p;
}

void AlarmAggregator::begin_transition(TransitionKind kind) {
  std::scoped_lock lk(mu_);
  if(in_flight_){
    throw Error(ErrorKind::TRANSITION_ALREADY_IN_FLIGHT,
                std::string("a command is already in progress (") + to_string(*in_flight_) + ")");
  }
  in_flight_ = kind;
  std::cout << "[ALARM] transition begin: " << to_string(kind) << "\n";
}

void AlarmAggregator::end_transition() {
  std::scoped_lock lk(mu_);
  if(in_flight_)
    std::cout << "[ALARM] transition end: " << to_string(*in_flight_) << "\n";
  in_flight_.reset();
}

std::optional<TransitionKind> AlarmAggregator::in_flight() const {
  std::scoped_lock lk(mu_);
  return in_flight_;
}

PanelState AlarmAggregator::resolve(const ZoneSnapshot& zones) const {
  return resolve_panel(zones, in_flight());
}

} // namespace mvs
