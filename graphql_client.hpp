#pragma once
// ============================================================
// Provider GraphQL API (customers.securitasdirect.es/owa-api/graphql)
//
// GraphqlTransport        - one POST {query, variables} -> JSON reply
// HttpsGraphqlTransport   - the real one (Beast over TLS)
// GraphqlAuthClient       - AuthTransport: xSLoginToken, xSValidateDevice,
//                           xSSendOtp, xSInstallations as token probe
// GraphqlProviderClient   - ProviderClient bound to one Session:
//                           xSInstallations, xSSrv, xSCheckAlarm(+Status),
//                           xSArmPanel/xSArmStatus, xSDisarmPanel/xSDisarmStatus
// ============================================================

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "config.hpp"
#include "device_identity.hpp"
#include "https_transport.hpp"
#include "provider_client.hpp"
#include "session.hpp"
#include "zone_state.hpp"

namespace mvs {

struct GraphqlSettings {
  std::string host{"customers.securitasdirect.es"};
  std::string port{"443"};
  std::string target{"/owa-api/graphql"};
  bool verify_tls{true};
  std::string country{"ES"};
  std::string lang{"es"};
};

struct PollPolicy {
  int64_t interval_ms{5000};
  int command_attempts{30};   // xSArmStatus / xSDisarmStatus
  int status_attempts{10};    // xSCheckAlarmStatus
};

GraphqlSettings graphql_settings(const Config& cfg);
PollPolicy poll_policy(const Config& cfg);

class GraphqlTransport {
public:
  virtual ~GraphqlTransport() = default;

  // full reply object ({"data": ..., "errors": [...]}).
  // throws Error(TRANSPORT) on I/O failure, HTTP 5xx or a non-JSON body
  virtual nlohmann::json execute(const std::string& query, const nlohmann::json& variables,
                                 const HeaderList& headers) = 0;
};

class HttpsGraphqlTransport : public GraphqlTransport {
public:
  explicit HttpsGraphqlTransport(GraphqlSettings s);

  nlohmann::json execute(const std::string& query, const nlohmann::json& variables,
                         const HeaderList& headers) override;

private:
  GraphqlSettings s_;
  std::mutex mu_;           // one request at a time on the shared io_context
  HttpsTransport http_;
};

// App / Extension headers every request carries
HeaderList app_headers();

// app headers + "auth" JSON header for a logged-in user
HeaderList session_headers(const GraphqlSettings& s, const std::string& user, const std::string& hash);

// ============================================================

class GraphqlAuthClient : public AuthTransport {
public:
  GraphqlAuthClient(std::shared_ptr<GraphqlTransport> t, GraphqlSettings s);

  LoginReply login(const std::string& identity, const std::string& secret) override;
  void send_otp(const std::string& identity, const std::string& pre_token,
                int phone_id, const std::string& otp_hash) override;
  LoginReply verify_otp(const std::string& identity, const std::string& secret,
                        const std::string& pre_token, const std::string& otp_hash,
                        const std::string& code) override;
  bool probe(const Session& s) override;

private:
  // xSLoginToken payload with res == OK; throws INVALID_CREDENTIALS / PROTOCOL
  nlohmann::json login_token(const std::string& identity, const std::string& secret);
  nlohmann::json validation_variables(const std::string& identity) const;

  std::shared_ptr<GraphqlTransport> t_;
  GraphqlSettings s_;
};

// ============================================================

class GraphqlProviderClient : public ProviderClient {
public:
  GraphqlProviderClient(std::shared_ptr<GraphqlTransport> t, GraphqlSettings s, Session session,
                        ZoneMessageMap messages, PollPolicy poll);

  std::vector<Installation> list_installations() override;
  ZoneSnapshot fetch_zone_states(const std::string& installation) override;
  void arm(const std::string& installation, ArmMode mode) override;
  void disarm(const std::string& installation, const std::string& code) override;

  // settled status reply -> snapshot; throws Error(PROTOCOL) if it cannot be mapped
  static ZoneSnapshot decode_status(const nlohmann::json& reply, const ZoneMessageMap& messages);

private:
  struct PanelContext {
    std::string panel;
    std::string capabilities;
  };

  const PanelContext& context(const std::string& numinst);
  HeaderList installation_headers(const std::string& numinst, const PanelContext& ctx) const;

  void run_command(const std::string& numinst, const char* mutation, const char* mutation_field,
                   const char* status_query, const char* status_field, const std::string& request,
                   const nlohmann::json& extra_vars);

  void pause() const;

  std::shared_ptr<GraphqlTransport> t_;
  GraphqlSettings s_;
  Session session_;
  ZoneMessageMap messages_;
  PollPolicy poll_;
  DeviceIdentity device_;

  std::mutex mu_;
  std::map<std::string, PanelContext> contexts_;
};

} // namespace mvs
