#include "device_identity.hpp"

#include <cctype>
#include <memory>
#include <stdexcept>

#include <openssl/evp.h>
#include <sys/utsname.h>

namespace mvs {

static constexpr const char* kAppVersion = "10.154.0";

std::string sha256_hex(const std::string& data) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if(!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");

  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if(EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
     EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
     EVP_DigestFinal_ex(ctx.get(), md, &len) != 1)
    throw std::runtime_error("sha256 digest failed");

  static const char* hex = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for(unsigned int i = 0; i < len; i++){
    out.push_back(hex[md[i] >> 4]);
    out.push_back(hex[md[i] & 0x0f]);
  }
  return out;
}

static std::string uuid_format(const std::string& h) {
  return h.substr(0, 8) + "-" + h.substr(8, 4) + "-" + h.substr(12, 4) + "-" +
         h.substr(16, 4) + "-" + h.substr(20, 12);
}

static std::string upper(std::string s) {
  for(auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

DeviceIdentity make_device_identity(const std::string& user) {
  std::string sys = "Linux", machine = "unknown", release = "";
  struct utsname u{};
  if(::uname(&u) == 0){
    sys = u.sysname;
    machine = u.machine;
    release = u.release;
  }

  DeviceIdentity d;
  d.id_device            = sha256_hex(user + "_" + sys + "_" + machine);
  d.uuid                 = upper(uuid_format(d.id_device));
  d.id_device_indigitall = uuid_format(sha256_hex(user + "_indigitall_" + sys));
  d.device_name          = "MyVerisureCore-" + sys;
  d.device_brand         = "MyVerisureCore";
  d.device_os_version    = sys + " " + release;
  d.device_version       = kAppVersion;
  return d;
}

} // namespace mvs
