#pragma once
#include <string>

namespace mvs {

// Identifiers the provider uses to recognize this device across logins.
// Derived from the user and the host, so they are stable without storage.
struct DeviceIdentity {
  std::string id_device;             // sha256(user_sys_machine), lower hex
  std::string uuid;                  // same digest, upper-case 8-4-4-4-12
  std::string id_device_indigitall;  // sha256(user_indigitall_sys), lower 8-4-4-4-12
  std::string device_name;
  std::string device_brand;
  std::string device_os_version;
  std::string device_version;
};

// lower-case hex digest; throws std::runtime_error if OpenSSL fails
std::string sha256_hex(const std::string& data);

DeviceIdentity make_device_identity(const std::string& user);

} // namespace mvs
