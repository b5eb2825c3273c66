#include "credential_store.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

namespace mvs {

using json = nlohmann::json;

static constexpr int kFileVersion = 1;

static std::string dir_of(const std::string& path) {
  auto pos = path.find_last_of('/');
  if(pos == std::string::npos) return ".";
  if(pos == 0) return "/";
  return path.substr(0, pos);
}

CredentialStore::CredentialStore(std::string path) : path_(std::move(path)) {}

std::string CredentialStore::default_path() {
  const char* home = std::getenv("HOME");
  std::string base = (home && *home) ? home : ".";
  return base + "/.my_verisure/session.json";
}

// -------------------- encode / decode --------------------

std::string CredentialStore::encode(const Session& s) {
  json j;
  j["version"]       = kFileVersion;
  j["identity"]      = s.identity;
  j["secret"]        = s.secret;
  j["installation"]  = s.installation ? json(*s.installation) : json(nullptr);
  j["timestamp"]     = s.timestamp_ms;
  j["token"]         = s.token;
  j["refresh_token"] = s.refresh_token;
  return j.dump(2);
}

static bool read_string(const json& j, const char* key, std::string& out, bool required) {
  auto it = j.find(key);
  if(it == j.end() || it->is_null()) return !required;
  if(!it->is_string()) return false;
  out = it->get<std::string>();
  return true;
}

std::optional<Session> CredentialStore::decode(const std::string& text) {
  json j = json::parse(text, nullptr, false);
  if(j.is_discarded() || !j.is_object()) return std::nullopt;

  auto ver = j.find("version");
  if(ver == j.end() || !ver->is_number_integer() || ver->get<int>() != kFileVersion)
    return std::nullopt;

  Session s;
  if(!read_string(j, "identity", s.identity, true) || s.identity.empty()) return std::nullopt;
  if(!read_string(j, "secret", s.secret, true) || s.secret.empty()) return std::nullopt;
  if(!read_string(j, "token", s.token, false)) return std::nullopt;
  if(!read_string(j, "refresh_token", s.refresh_token, false)) return std::nullopt;

  auto inst = j.find("installation");
  if(inst != j.end() && !inst->is_null()){
    if(!inst->is_string()) return std::nullopt;
    s.installation = inst->get<std::string>();
  }

  auto ts = j.find("timestamp");
  if(ts == j.end() || !ts->is_number_integer()) return std::nullopt;
  s.timestamp_ms = ts->get<int64_t>();

  return s;
}

// -------------------- file I/O --------------------

bool CredentialStore::ensure_private_dir() const {
  std::string dir = dir_of(path_);
  if(::mkdir(dir.c_str(), 0700) == 0) return true;
  if(errno != EEXIST){
    std::cerr << "[STORE] cannot create " << dir << ": " << std::strerror(errno) << "\n";
    return false;
  }
  struct stat st{};
  if(::stat(dir.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)){
    std::cerr << "[STORE] not a directory: " << dir << "\n";
    return false;
  }
  if((st.st_mode & 0077) != 0 && st.st_uid == ::geteuid()){
    if(::chmod(dir.c_str(), 0700) != 0)
      std::cerr << "[STORE] cannot restrict " << dir << ": " << std::strerror(errno) << "\n";
  }
  return true;
}

std::optional<Session> CredentialStore::load() const {
  int fd = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
  if(fd < 0){
    if(errno != ENOENT)
      std::cerr << "[STORE] cannot open " << path_ << ": " << std::strerror(errno) << "\n";
    return std::nullopt;
  }

  std::string text;
  char buf[4096];
  for(;;){
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if(n < 0){
      if(errno == EINTR) continue;
      std::cerr << "[STORE] read failed " << path_ << ": " << std::strerror(errno) << "\n";
      ::close(fd);
      return std::nullopt;
    }
    if(n == 0) break;
    text.append(buf, static_cast<size_t>(n));
  }
  ::close(fd);

  auto s = decode(text);
  if(!s) std::cerr << "[STORE] ignoring malformed session file " << path_ << "\n";
  return s;
}

bool CredentialStore::save(const Session& s) const {
  if(!ensure_private_dir()) return false;

  const std::string body = encode(s);
  const std::string tmp = path_ + ".tmp." + std::to_string(::getpid());

  int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
  if(fd < 0){
    std::cerr << "[STORE] cannot create " << tmp << ": " << std::strerror(errno) << "\n";
    return false;
  }

  const char* p = body.data();
  size_t left = body.size();
  while(left > 0){
    ssize_t n = ::write(fd, p, left);
    if(n < 0){
      if(errno == EINTR) continue;
      std::cerr << "[STORE] write failed " << tmp << ": " << std::strerror(errno) << "\n";
      ::close(fd);
      ::unlink(tmp.c_str());
      return false;
    }
    p += n;
    left -= static_cast<size_t>(n);
  }

  if(::fsync(fd) != 0){
    std::cerr << "[STORE] fsync failed " << tmp << ": " << std::strerror(errno) << "\n";
    ::close(fd);
    ::unlink(tmp.c_str());
    return false;
  }
  ::close(fd);

  if(::rename(tmp.c_str(), path_.c_str()) != 0){
    std::cerr << "[STORE] rename failed " << path_ << ": " << std::strerror(errno) << "\n";
    ::unlink(tmp.c_str());
    return false;
  }

  // make the rename itself durable
  int dfd = ::open(dir_of(path_).c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if(dfd >= 0){
    ::fsync(dfd);
    ::close(dfd);
  }

  std::cout << "[STORE] session saved for " << s.identity << "\n";
  return true;
}

bool CredentialStore::clear() const {
  if(::unlink(path_.c_str()) == 0){
    std::cout << "[STORE] session file removed\n";
    return true;
  }
  if(errno == ENOENT) return true;
  std::cerr << "[STORE] cannot remove " << path_ << ": " << std::strerror(errno) << "\n";
  return false;
}

} // namespace mvs
