#pragma once
#include <optional>
#include <string>

#include "session.hpp"

namespace mvs {

// ============================================================
// Credential store: one JSON file holding the persisted Session.
//   - directory 0700, file 0600
//   - save = write temp file + fsync + rename (never a torn file)
//   - load never throws: missing / unreadable / malformed -> nullopt
// ============================================================
class CredentialStore {
public:
  explicit CredentialStore(std::string path);

  // $HOME/.my_verisure/session.json
  static std::string default_path();

  std::optional<Session> load() const;
  bool save(const Session& s) const;
  bool clear() const;   // idempotent

  const std::string& path() const { return path_; }

  // create the parent directory 0700 (or tighten it); false on failure
  bool ensure_private_dir() const;

  // strict decode / encode of the file body
  static std::optional<Session> decode(const std::string& text);
  static std::string encode(const Session& s);

private:
  std::string path_;
};

} // namespace mvs
