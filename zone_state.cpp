#include "zone_state.hpp"
#include "errors.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace mvs {

using json = nlohmann::json;

const char* zone_key(ZoneKind k) {
  switch(k){
    case ZoneKind::INTERNAL_DAY:   return "internal_day";
    case ZoneKind::INTERNAL_NIGHT: return "internal_night";
    case ZoneKind::INTERNAL_TOTAL: return "internal_total";
    case ZoneKind::EXTERNAL:       return "external";
  }
  return "unknown";
}

const char* zone_label(ZoneKind k) {
  switch(k){
    case ZoneKind::INTERNAL_DAY:   return "Interna Día";
    case ZoneKind::INTERNAL_NIGHT: return "Interna Noche";
    case ZoneKind::INTERNAL_TOTAL: return "Interna Total";
    case ZoneKind::EXTERNAL:       return "Externa";
  }
  return "Desconocida";
}

std::optional<ZoneKind> zone_from_key(const std::string& key) {
  for(ZoneKind k : kAllZones){
    if(key == zone_key(k)) return k;
  }
  return std::nullopt;
}

ZoneSnapshot ZoneSnapshot::from_states(const std::vector<ZoneAlarmState>& states) {
  ZoneSnapshot s;
  std::array<bool, 4> seen{};
  for(const auto& st : states){
    auto idx = static_cast<size_t>(st.kind);
    if(seen[idx])
      throw Error(ErrorKind::PROTOCOL, std::string("duplicate zone in snapshot: ") + zone_key(st.kind));
    seen[idx] = true;
    s.set(st.kind, st.active);
  }
  return s;
}

std::optional<ZoneSnapshot> ZoneSnapshot::from_panel_code(const std::string& code) {
  if(code.size() != 1) return std::nullopt;

  ZoneSnapshot s;
  switch(code[0]){
    case 'D': break;
    case 'E': s.set(ZoneKind::EXTERNAL, true); break;
    case 'P': s.set(ZoneKind::INTERNAL_DAY, true); break;
    case 'Q': s.set(ZoneKind::INTERNAL_NIGHT, true); break;
    case 'B': s.set(ZoneKind::INTERNAL_DAY, true);   s.set(ZoneKind::EXTERNAL, true); break;
    case 'C': s.set(ZoneKind::INTERNAL_NIGHT, true); s.set(ZoneKind::EXTERNAL, true); break;
    case 'T': s.set(ZoneKind::INTERNAL_TOTAL, true); break;
    case 'A': s.set(ZoneKind::INTERNAL_TOTAL, true); s.set(ZoneKind::EXTERNAL, true); break;
    default:  return std::nullopt;
  }
  return s;
}

size_t ZoneSnapshot::active_count() const {
  return static_cast<size_t>(std::count(flags_.begin(), flags_.end(), true));
}

std::vector<ZoneAlarmState> ZoneSnapshot::states() const {
  std::vector<ZoneAlarmState> out;
  out.reserve(kAllZones.size());
  for(ZoneKind k : kAllZones) out.push_back({k, active(k)});
  return out;
}

// -------------------- ZoneMessageMap --------------------

static void add_alarm_list(ZoneMessageMap& m, ZoneKind k, const json& node, const char* where) {
  if(!node.is_object()) throw std::runtime_error(std::string("zone map: ") + where + " must be an object");
  auto it = node.find("alarm");
  if(it == node.end()) return;
  if(!it->is_array()) throw std::runtime_error(std::string("zone map: ") + where + ".alarm must be an array");
  for(const auto& msg : *it){
    if(!msg.is_string()) throw std::runtime_error(std::string("zone map: ") + where + ".alarm entries must be strings");
    m.add(k, msg.get<std::string>());
  }
}

ZoneMessageMap ZoneMessageMap::parse(const std::string& json_text) {
  json root = json::parse(json_text, nullptr, false);
  if(root.is_discarded() || !root.is_object())
    throw std::runtime_error("zone map: not a JSON object");

  ZoneMessageMap m;

  if(auto in = root.find("internal"); in != root.end()){
    if(!in->is_object()) throw std::runtime_error("zone map: internal must be an object");
    static const std::pair<const char*, ZoneKind> parts[] = {
      {"day", ZoneKind::INTERNAL_DAY},
      {"night", ZoneKind::INTERNAL_NIGHT},
      {"total", ZoneKind::INTERNAL_TOTAL},
    };
    for(const auto& [name, kind] : parts){
      auto it = in->find(name);
      if(it != in->end()) add_alarm_list(m, kind, *it, name);
    }
  }

  if(auto ex = root.find("external"); ex != root.end())
    add_alarm_list(m, ZoneKind::EXTERNAL, *ex, "external");

  // messages that mean "nothing armed"
  if(auto dis = root.find("disarmed"); dis != root.end()){
    if(!dis->is_array()) throw std::runtime_error("zone map: disarmed must be an array");
    for(const auto& msg : *dis){
      if(!msg.is_string()) throw std::runtime_error("zone map: disarmed entries must be strings");
      m.by_message_[msg.get<std::string>()];
    }
  }

  return m;
}

ZoneMessageMap ZoneMessageMap::load_file(const std::string& path) {
  std::ifstream f(path);
  if(!f) throw std::runtime_error("cannot open zone map file: " + path);
  std::stringstream ss;
  ss << f.rdbuf();
  return parse(ss.str());
}

void ZoneMessageMap::add(ZoneKind k, const std::string& message) {
  auto& v = by_message_[message];
  if(std::find(v.begin(), v.end(), k) == v.end())
    v.push_back(k);
}

std::optional<ZoneSnapshot> ZoneMessageMap::classify(const std::string& message) const {
  auto it = by_message_.find(message);
  if(it == by_message_.end()) return std::nullopt;

  ZoneSnapshot s;
  for(ZoneKind k : it->second) s.set(k, true);
  return s;
}

} // namespace mvs
