#pragma once
// ============================================================
// Zone alarm state: the raw partial-alarm flags reported by the
// provider for one installation.
//   - internal day / night / total, external (perimeter)
//   - a fetch yields a complete ZoneSnapshot or fails; there is
//     no partial update
// ============================================================

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mvs {

enum class ZoneKind : uint8_t {
  INTERNAL_DAY   = 0,
  INTERNAL_NIGHT = 1,
  INTERNAL_TOTAL = 2,
  EXTERNAL       = 3
};

constexpr std::array<ZoneKind, 4> kAllZones{
  ZoneKind::INTERNAL_DAY, ZoneKind::INTERNAL_NIGHT,
  ZoneKind::INTERNAL_TOTAL, ZoneKind::EXTERNAL
};

// machine key (config files, journal)
const char* zone_key(ZoneKind k);
// display label
const char* zone_label(ZoneKind k);
std::optional<ZoneKind> zone_from_key(const std::string& key);

struct ZoneAlarmState {
  ZoneKind kind{ZoneKind::INTERNAL_DAY};
  bool active{false};
};

class ZoneSnapshot {
public:
  ZoneSnapshot() = default;

  // at most one entry per kind; kinds not listed are inactive.
  // throws mvs::Error(PROTOCOL) on a duplicated kind
  static ZoneSnapshot from_states(const std::vector<ZoneAlarmState>& states);

  // single-letter panel code reported as protomResponse
  // (D, E, P, Q, B, C, T, A). nullopt for an unknown code
  static std::optional<ZoneSnapshot> from_panel_code(const std::string& code);

  void set(ZoneKind k, bool active) { flags_[static_cast<size_t>(k)] = active; }
  bool active(ZoneKind k) const { return flags_[static_cast<size_t>(k)]; }

  size_t active_count() const;
  std::vector<ZoneAlarmState> states() const;

  bool operator==(const ZoneSnapshot& o) const { return flags_ == o.flags_; }
  bool operator!=(const ZoneSnapshot& o) const { return !(*this == o); }

private:
  std::array<bool, 4> flags_{};
};

// ============================================================
// Status-message classifier. The provider sometimes reports the
// settled state only as free text; which texts mean which zone is
// installation-specific, so the mapping is loaded from JSON:
//   { "internal": { "day":   {"alarm": ["..."]},
//                   "night": {"alarm": ["..."]},
//                   "total": {"alarm": ["..."]} },
//     "external": { "alarm": ["..."] },
//     "disarmed": ["..."] }
// ============================================================
class ZoneMessageMap {
public:
  ZoneMessageMap() = default;

  // throws std::runtime_error when the file cannot be read or has the wrong shape
  static ZoneMessageMap load_file(const std::string& path);
  static ZoneMessageMap parse(const std::string& json_text);

  void add(ZoneKind k, const std::string& message);

  // nullopt when the message is not known at all
  std::optional<ZoneSnapshot> classify(const std::string& message) const;

  bool empty() const { return by_message_.empty(); }

private:
  std::unordered_map<std::string, std::vector<ZoneKind>> by_message_;
};

} // namespace mvs
