#include "graphql_client.hpp"
#include "errors.hpp"

#include <chrono>
#include <iostream>
#include <thread>

namespace mvs {

using json = nlohmann::json;

static constexpr const char* kSessionId = "OWI______________________";
static constexpr const char* kCallBy    = "OWI_10";

// ------------------------------------------------------------------ queries

static const char* kLoginMutation = R"(
mutation mkLoginToken($user: String!, $password: String!, $id: String!, $country: String!, $idDevice: String, $idDeviceIndigitall: String, $deviceType: String, $deviceVersion: String, $deviceResolution: String, $lang: String!, $callby: String!, $uuid: String, $deviceName: String, $deviceBrand: String, $deviceOsVersion: String) {
  xSLoginToken(user: $user, password: $password, id: $id, country: $country, idDevice: $idDevice, idDeviceIndigitall: $idDeviceIndigitall, deviceType: $deviceType, deviceVersion: $deviceVersion, deviceResolution: $deviceResolution, lang: $lang, callby: $callby, uuid: $uuid, deviceName: $deviceName, deviceBrand: $deviceBrand, deviceOsVersion: $deviceOsVersion) {
    res msg hash lang legals changePassword needDeviceAuthorization refreshToken
  }
})";

static const char* kValidateDeviceMutation = R"(
mutation mkValidateDevice($idDevice: String, $idDeviceIndigitall: String, $uuid: String, $deviceName: String, $deviceBrand: String, $deviceOsVersion: String, $deviceVersion: String) {
  xSValidateDevice(idDevice: $idDevice, idDeviceIndigitall: $idDeviceIndigitall, uuid: $uuid, deviceName: $deviceName, deviceBrand: $deviceBrand, deviceOsVersion: $deviceOsVersion, deviceVersion: $deviceVersion) {
    res msg hash refreshToken legals
  }
})";

static const char* kSendOtpMutation = R"(
mutation mkSendOTP($recordId: Int!, $otpHash: String!) {
  xSSendOtp(recordId: $recordId, otpHash: $otpHash) { res msg }
})";

static const char* kInstallationsQuery = R"(
query mkInstallationList {
  xSInstallations { installations { numinst alias panel type } }
})";

static const char* kServicesQuery = R"(
query Srv($numinst: String!, $uuid: String) {
  xSSrv(numinst: $numinst, uuid: $uuid) {
    res msg
    installation { numinst alias panel capabilities }
  }
})";

static const char* kCheckAlarmQuery = R"(
query CheckAlarm($numinst: String!, $panel: String!) {
  xSCheckAlarm(numinst: $numinst, panel: $panel) { res msg referenceId }
})";

static const char* kCheckAlarmStatusQuery = R"(
query CheckAlarmStatus($numinst: String!, $idService: String!, $panel: String!, $referenceId: String!) {
  xSCheckAlarmStatus(numinst: $numinst, idService: $idService, panel: $panel, referenceId: $referenceId) {
    res msg status numinst protomResponse protomResponseDate forcedArmed
  }
})";

static const char* kArmPanelMutation = R"(
mutation xSArmPanel($numinst: String!, $request: ArmCodeRequest!, $panel: String!, $currentStatus: String, $forceArmingRemoteId: String, $armAndLock: Boolean) {
  xSArmPanel(numinst: $numinst, request: $request, panel: $panel, currentStatus: $currentStatus, forceArmingRemoteId: $forceArmingRemoteId, armAndLock: $armAndLock) {
    res msg referenceId
  }
})";

static const char* kArmStatusQuery = R"(
query ArmStatus($numinst: String!, $request: ArmCodeRequest, $panel: String!, $referenceId: String!, $counter: Int!, $forceArmingRemoteId: String, $armAndLock: Boolean) {
  xSArmStatus(numinst: $numinst, panel: $panel, referenceId: $referenceId, counter: $counter, request: $request, forceArmingRemoteId: $forceArmingRemoteId, armAndLock: $armAndLock) {
    res msg status protomResponse protomResponseDate numinst requestId
    error { code type allowForcing exceptionsNumber referenceId suid }
  }
})";

static const char* kDisarmPanelMutation = R"(
mutation xSDisarmPanel($numinst: String!, $request: DisarmCodeRequest!, $panel: String!) {
  xSDisarmPanel(numinst: $numinst, request: $request, panel: $panel) { res msg referenceId }
})";

static const char* kDisarmStatusQuery = R"(
query DisarmStatus($numinst: String!, $panel: String!, $referenceId: String!, $counter: Int!, $request: DisarmCodeRequest) {
  xSDisarmStatus(numinst: $numinst, panel: $panel, referenceId: $referenceId, counter: $counter, request: $request) {
    res msg status protomResponse protomResponseDate numinst requestId
    error { code type allowForcing exceptionsNumber referenceId suid }
  }
})";

// ------------------------------------------------------------------ helpers

static std::string str_of(const json& j, const char* key) {
  if(!j.is_object()) return {};
  auto it = j.find(key);
  if(it == j.end()) return {};
  if(it->is_string()) return it->get<std::string>();
  if(it->is_number_integer()) return std::to_string(it->get<long long>());
  return {};
}

static bool bool_of(const json& j, const char* key) {
  if(!j.is_object()) return false;
  auto it = j.find(key);
  return it != j.end() && it->is_boolean() && it->get<bool>();
}

// first entry of "errors", or nullptr
static const json* first_error(const json& reply) {
  auto it = reply.find("errors");
  if(it == reply.end() || !it->is_array() || it->empty()) return nullptr;
  return &(*it)[0];
}

static std::string error_message(const json& err) {
  std::string m = str_of(err, "message");
  return m.empty() ? std::string("unknown error") : m;
}

static const json& error_data(const json& err) {
  static const json empty = json::object();
  auto it = err.find("data");
  return (it != err.end() && it->is_object()) ? *it : empty;
}

// reply["data"][field] or an empty object
static json payload(const json& reply, const char* field) {
  auto d = reply.find("data");
  if(d == reply.end() || !d->is_object()) return json::object();
  auto f = d->find(field);
  if(f == d->end() || !f->is_object()) return json::object();
  return *f;
}

static std::vector<PhoneTarget> parse_phones(const json& data) {
  std::vector<PhoneTarget> out;
  auto it = data.find("auth-phones");
  if(it == data.end() || !it->is_array()) return out;
  for(const auto& p : *it){
    if(!p.is_object()) continue;
    auto id = p.find("id");
    if(id == p.end() || !id->is_number_integer()) continue;
    out.push_back(PhoneTarget{id->get<int>(), str_of(p, "phone")});
  }
  return out;
}

GraphqlSettings graphql_settings(const Config& cfg) {
  GraphqlSettings s;
  s.host       = cfg.api_host;
  s.port       = cfg.api_port;
  s.target     = cfg.api_target;
  s.verify_tls = cfg.verify_tls;
  s.country    = cfg.country;
  s.lang       = cfg.lang;
  return s;
}

PollPolicy poll_policy(const Config& cfg) {
  PollPolicy p;
  p.interval_ms      = cfg.poll_interval_ms;
  p.command_attempts = cfg.arm_poll_attempts;
  p.status_attempts  = cfg.status_poll_attempts;
  return p;
}

HeaderList app_headers() {
  return {
    {"App", R"({"origin": "native", "appVersion": "10.154.0"})"},
    {"Extension", R"({"mode": "full"})"},
  };
}

HeaderList session_headers(const GraphqlSettings& s, const std::string& user, const std::string& hash) {
  json auth = {
    {"loginTimestamp", now_ms_utc()},
    {"user", user},
    {"id", kSessionId},
    {"country", s.country},
    {"lang", s.lang},
    {"callby", kCallBy},
    {"hash", hash.empty() ? json(nullptr) : json(hash)},
  };
  HeaderList h = app_headers();
  h.emplace_back("auth", auth.dump());
  return h;
}

// ------------------------------------------------------------------ transport

HttpsGraphqlTransport::HttpsGraphqlTransport(GraphqlSettings s)
  : s_(std::move(s)), http_(s_.host, s_.port, s_.verify_tls) {}

json HttpsGraphqlTransport::execute(const std::string& query, const json& variables,
                                    const HeaderList& headers)
{
  json body = {{"query", query}, {"variables", variables.is_null() ? json::object() : variables}};

  HttpResponse resp;
  {
    std::scoped_lock lk(mu_);
    resp = http_.post(s_.target, headers, body.dump());
  }

  if(resp.status >= 500)
    throw Error(ErrorKind::TRANSPORT, "HTTP " + std::to_string(resp.status) + " from " + s_.host);

  json reply = json::parse(resp.body, nullptr, false);
  if(reply.is_discarded() || !reply.is_object())
    throw Error(ErrorKind::TRANSPORT, "HTTP " + std::to_string(resp.status) + ": reply is not JSON");
  return reply;
}

// ------------------------------------------------------------------ auth

GraphqlAuthClient::GraphqlAuthClient(std::shared_ptr<GraphqlTransport> t, GraphqlSettings s)
  : t_(std::move(t)), s_(std::move(s)) {}

json GraphqlAuthClient::validation_variables(const std::string& identity) const {
  DeviceIdentity d = make_device_identity(identity);
  return {
    {"idDevice", d.id_device},
    {"idDeviceIndigitall", d.id_device_indigitall},
    {"uuid", d.uuid},
    {"deviceName", d.device_name},
    {"deviceBrand", d.device_brand},
    {"deviceOsVersion", d.device_os_version},
    {"deviceVersion", d.device_version},
  };
}

json GraphqlAuthClient::login_token(const std::string& identity, const std::string& secret) {
  json vars = validation_variables(identity);
  vars["user"]             = identity;
  vars["password"]         = secret;
  vars["id"]               = kSessionId;
  vars["country"]          = s_.country;
  vars["lang"]             = s_.lang;
  vars["callby"]           = kCallBy;
  vars["deviceType"]       = "";
  vars["deviceResolution"] = "";

  json reply = t_->execute(kLoginMutation, vars, app_headers());

  if(const json* err = first_error(reply)){
    if(str_of(error_data(*err), "err") == "60091")
      throw Error(ErrorKind::INVALID_CREDENTIALS, "invalid user or password");
    throw Error(ErrorKind::PROTOCOL, "login failed: " + error_message(*err));
  }

  json d = payload(reply, "xSLoginToken");
  if(str_of(d, "res") != "OK"){
    std::string msg = str_of(d, "msg");
    throw Error(ErrorKind::INVALID_CREDENTIALS, "login refused: " + (msg.empty() ? "no response data" : msg));
  }
  return d;
}

LoginReply GraphqlAuthClient::login(const std::string& identity, const std::string& secret) {
  std::cout << "[GRAPHQL] xSLoginToken user=" << identity << "\n";
  json d = login_token(identity, secret);

  LoginReply out;
  out.token = str_of(d, "hash");
  out.refresh_token = str_of(d, "refreshToken");

  if(!bool_of(d, "needDeviceAuthorization")) return out;

  std::cout << "[GRAPHQL] device authorization required, validating device\n";
  json reply = t_->execute(kValidateDeviceMutation, validation_variables(identity),
                           session_headers(s_, identity, out.token));

  json v = payload(reply, "xSValidateDevice");
  if(str_of(v, "res") == "OK"){
    out.token = str_of(v, "hash");
    out.refresh_token = str_of(v, "refreshToken");
    return out;
  }

  const json* err = first_error(reply);
  if(!err){
    std::string msg = str_of(v, "msg");
    throw Error(ErrorKind::PROTOCOL, "device validation failed: " + (msg.empty() ? "no response data" : msg));
  }

  const json& ed = error_data(*err);
  std::string auth_code = str_of(ed, "auth-code");
  std::string auth_type = str_of(ed, "auth-type");

  if(auth_type == "OTP" || auth_code == "10001"){
    LoginReply otp;
    otp.otp_required = true;
    otp.pre_token = out.token;
    otp.otp_hash = str_of(ed, "auth-otp-hash");
    otp.phones = parse_phones(ed);
    std::cout << "[GRAPHQL] second factor required, " << otp.phones.size() << " phone(s) offered\n";
    return otp;
  }

  throw Error(ErrorKind::PROTOCOL, "device validation failed: " + error_message(*err) +
                                   " (auth-code " + (auth_code.empty() ? "?" : auth_code) + ")");
}

void GraphqlAuthClient::send_otp(const std::string& identity, const std::string& pre_token,
                                 int phone_id, const std::string& otp_hash)
{
  std::cout << "[GRAPHQL] xSSendOtp recordId=" << phone_id << "\n";
  json reply = t_->execute(kSendOtpMutation, {{"recordId", phone_id}, {"otpHash", otp_hash}},
                           session_headers(s_, identity, pre_token));

  if(const json* err = first_error(reply))
    throw Error(ErrorKind::OTP_NOT_SENT, "failed to send code: " + error_message(*err));

  json d = payload(reply, "xSSendOtp");
  if(str_of(d, "res") != "OK"){
    std::string msg = str_of(d, "msg");
    throw Error(ErrorKind::OTP_NOT_SENT, "failed to send code: " + (msg.empty() ? "no response data" : msg));
  }
}

LoginReply GraphqlAuthClient::verify_otp(const std::string& identity, const std::string& secret,
                                         const std::string& pre_token, const std::string& otp_hash,
                                         const std::string& code)
{
  HeaderList h = session_headers(s_, identity, pre_token);
  json security = {{"token", code}, {"type", "OTP"}, {"otpHash", otp_hash}};
  h.emplace_back("Security", security.dump());

  json reply = t_->execute(kValidateDeviceMutation, validation_variables(identity), h);

  if(const json* err = first_error(reply))
    throw Error(ErrorKind::INVALID_OTP, "code rejected: " + error_message(*err));

  json v = payload(reply, "xSValidateDevice");
  if(str_of(v, "res") != "OK")
    throw Error(ErrorKind::INVALID_OTP, "code rejected: " + str_of(v, "msg"));

  if(bool_of(v, "needDeviceAuthorization"))
    throw Error(ErrorKind::PROTOCOL, "device still not authorized after code verification");

  LoginReply out;
  out.token = str_of(v, "hash");
  out.refresh_token = str_of(v, "refreshToken");

  // fresh tokens for the now-authorized device; the validation tokens stay valid otherwise
  try{
    json d = login_token(identity, secret);
    if(!bool_of(d, "needDeviceAuthorization") && !str_of(d, "hash").empty()){
      out.token = str_of(d, "hash");
      out.refresh_token = str_of(d, "refreshToken");
    }
  } catch(const Error& e){
    std::cerr << "[GRAPHQL] post-verification login failed (" << e.status()
              << "), keeping validation tokens\n";
  }
  return out;
}

bool GraphqlAuthClient::probe(const Session& s) {
  json reply = t_->execute(kInstallationsQuery, json::object(), session_headers(s_, s.identity, s.token));
  if(const json* err = first_error(reply)){
    std::cout << "[GRAPHQL] token probe rejected: " << error_message(*err) << "\n";
    return false;
  }
  auto d = reply.find("data");
  return d != reply.end() && d->is_object() && d->contains("xSInstallations") &&
         !(*d)["xSInstallations"].is_null();
}

// ------------------------------------------------------------------ provider

GraphqlProviderClient::GraphqlProviderClient(std::shared_ptr<GraphqlTransport> t, GraphqlSettings s,
                                             Session session, ZoneMessageMap messages, PollPolicy poll)
  : t_(std::move(t)), s_(std::move(s)), session_(std::move(session)),
    messages_(std::move(messages)), poll_(poll), device_(make_device_identity(session_.identity)) {}

void GraphqlProviderClient::pause() const {
  if(poll_.interval_ms > 0)
    std::this_thread::sleep_for(std::chrono::milliseconds(poll_.interval_ms));
}

std::vector<Installation> GraphqlProviderClient::list_installations() {
  json reply = t_->execute(kInstallationsQuery, json::object(),
                           session_headers(s_, session_.identity, session_.token));
  if(const json* err = first_error(reply))
    throw Error(ErrorKind::PROTOCOL, "failed to list installations: " + error_message(*err));

  json d = payload(reply, "xSInstallations");
  auto it = d.find("installations");
  if(it == d.end() || !it->is_array())
    throw Error(ErrorKind::PROTOCOL, "installation list missing from reply");

  std::vector<Installation> out;
  for(const auto& i : *it){
    Installation inst;
    inst.numinst = str_of(i, "numinst");
    inst.alias   = str_of(i, "alias");
    inst.panel   = str_of(i, "panel");
    inst.type    = str_of(i, "type");
    if(inst.numinst.empty()) continue;
    out.push_back(inst);
  }
  std::cout << "[GRAPHQL] " << out.size() << " installation(s)\n";
  return out;
}

const GraphqlProviderClient::PanelContext& GraphqlProviderClient::context(const std::string& numinst) {
  {
    std::scoped_lock lk(mu_);
    auto it = contexts_.find(numinst);
    if(it != contexts_.end()) return it->second;
  }

  HeaderList h = session_headers(s_, session_.identity, session_.token);
  h.emplace_back("numinst", numinst);
  json reply = t_->execute(kServicesQuery, {{"numinst", numinst}, {"uuid", device_.uuid}}, h);
  if(const json* err = first_error(reply))
    throw Error(ErrorKind::PROTOCOL, "failed to load installation " + numinst + ": " + error_message(*err));

  json d = payload(reply, "xSSrv");
  auto inst = d.find("installation");
  if(inst == d.end() || !inst->is_object())
    throw Error(ErrorKind::PROTOCOL, "installation " + numinst + " not found");

  PanelContext ctx;
  ctx.panel = str_of(*inst, "panel");
  ctx.capabilities = str_of(*inst, "capabilities");
  if(ctx.panel.empty())
    throw Error(ErrorKind::PROTOCOL, "installation " + numinst + " reports no panel");

  std::scoped_lock lk(mu_);
  return contexts_.emplace(numinst, std::move(ctx)).first->second;
}

HeaderList GraphqlProviderClient::installation_headers(const std::string& numinst,
                                                       const PanelContext& ctx) const
{
  HeaderList h = session_headers(s_, session_.identity, session_.token);
  h.emplace_back("numinst", numinst);
  h.emplace_back("panel", ctx.panel);
  h.emplace_back("x-capabilities", ctx.capabilities);
  return h;
}

ZoneSnapshot GraphqlProviderClient::decode_status(const json& reply, const ZoneMessageMap& messages) {
  std::string code = str_of(reply, "protomResponse");
  if(!code.empty()){
    auto snap = ZoneSnapshot::from_panel_code(code);
    if(!snap) throw Error(ErrorKind::PROTOCOL, "unknown panel status code '" + code + "'");
    return *snap;
  }

  std::string msg = str_of(reply, "msg");
  auto snap = messages.classify(msg);
  if(!snap) throw Error(ErrorKind::PROTOCOL, "unrecognized status message '" + msg + "'");
  return *snap;
}

ZoneSnapshot GraphqlProviderClient::fetch_zone_states(const std::string& numinst) {
  const PanelContext& ctx = context(numinst);
  HeaderList h = installation_headers(numinst, ctx);

  json reply = t_->execute(kCheckAlarmQuery, {{"numinst", numinst}, {"panel", ctx.panel}}, h);
  if(const json* err = first_error(reply))
    throw Error(ErrorKind::PROTOCOL, "status check refused: " + error_message(*err));

  json d = payload(reply, "xSCheckAlarm");
  std::string ref = str_of(d, "referenceId");
  if(str_of(d, "res") != "OK" || ref.empty())
    throw Error(ErrorKind::PROTOCOL, "status check refused: " + str_of(d, "msg"));

  json vars = {{"numinst", numinst}, {"idService", "EST"}, {"panel", ctx.panel}, {"referenceId", ref}};

  for(int attempt = 1; attempt <= poll_.status_attempts; attempt++){
    json r = t_->execute(kCheckAlarmStatusQuery, vars, h);
    if(const json* err = first_error(r))
      throw Error(ErrorKind::PROTOCOL, "status poll failed: " + error_message(*err));

    json st = payload(r, "xSCheckAlarmStatus");
    std::string res = str_of(st, "res");

    if(res == "OK"){
      ZoneSnapshot snap = decode_status(st, messages_);
      std::cout << "[GRAPHQL] " << numinst << " zones settled after " << attempt
                << " poll(s), " << snap.active_count() << " active\n";
      return snap;
    }
    if(res != "WAIT")
      throw Error(ErrorKind::PROTOCOL, "status poll answered " + res + ": " + str_of(st, "msg"));

    if(attempt < poll_.status_attempts) pause();
  }

  throw Error(ErrorKind::PROTOCOL, "panel status did not settle after " +
                                   std::to_string(poll_.status_attempts) + " polls");
}

void GraphqlProviderClient::run_command(const std::string& numinst, const char* mutation,
                                        const char* mutation_field, const char* status_query,
                                        const char* status_field, const std::string& request,
                                        const json& extra_vars)
{
  const PanelContext& ctx = context(numinst);
  HeaderList h = installation_headers(numinst, ctx);

  json vars = {{"numinst", numinst}, {"request", request}, {"panel", ctx.panel}};
  for(auto it = extra_vars.begin(); it != extra_vars.end(); ++it) vars[it.key()] = it.value();

  std::cout << "[GRAPHQL] " << mutation_field << " " << request << " on " << numinst << "\n";
  json reply = t_->execute(mutation, vars, h);
  if(const json* err = first_error(reply))
    throw Error(ErrorKind::COMMAND_FAILED, request + " refused: " + error_message(*err));

  json d = payload(reply, mutation_field);
  std::string ref = str_of(d, "referenceId");
  if(str_of(d, "res") != "OK" || ref.empty())
    throw Error(ErrorKind::COMMAND_FAILED, request + " refused: " + str_of(d, "msg"));

  vars["referenceId"] = ref;

  for(int counter = 1; counter <= poll_.command_attempts; counter++){
    vars["counter"] = counter;
    json r = t_->execute(status_query, vars, h);
    if(const json* err = first_error(r))
      throw Error(ErrorKind::COMMAND_FAILED, request + " failed: " + error_message(*err));

    json st = payload(r, status_field);
    std::string res = str_of(st, "res");

    if(res == "OK"){
      std::cout << "[GRAPHQL] " << request << " confirmed (" << str_of(st, "msg") << ")\n";
      return;
    }
    if(res != "WAIT")
      throw Error(ErrorKind::COMMAND_FAILED, request + " failed: " + str_of(st, "msg"));

    if(counter < poll_.command_attempts) pause();
  }

  throw Error(ErrorKind::COMMAND_FAILED, request + " not confirmed after " +
                                         std::to_string(poll_.command_attempts) + " polls");
}

void GraphqlProviderClient::arm(const std::string& numinst, ArmMode mode) {
  const char* request = "ARM1";
  switch(mode){
    case ArmMode::AWAY:  request = "ARM1"; break;
    case ArmMode::HOME:  request = "PERI1"; break;
    case ArmMode::NIGHT: request = "ARMNIGHT1"; break;
  }
  json extra = {{"currentStatus", "E"}, {"forceArmingRemoteId", nullptr}, {"armAndLock", false}};
  run_command(numinst, kArmPanelMutation, "xSArmPanel", kArmStatusQuery, "xSArmStatus", request, extra);
}

void GraphqlProviderClient::disarm(const std::string& numinst, const std::string& code) {
  std::string request = code.empty() ? std::string("DARM1") : code;
  run_command(numinst, kDisarmPanelMutation, "xSDisarmPanel", kDisarmStatusQuery, "xSDisarmStatus",
              request, json::object());
}

} // namespace mvs
