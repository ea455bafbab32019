#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "config.hpp"
#include "device_identity.hpp"
#include "dispatcher.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "session.hpp"

namespace clawlink {

inline int64_t epoch_now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

/// True for a connect rejection that asks the device to be paired first.
inline bool is_pairing_error(const std::optional<std::string> &code,
                             const std::optional<std::string> &message) {
  if (code && *code == "NOT_PAIRED")
    return true;
  if (!message)
    return false;
  std::string lower = *message;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return lower.find("pairing") != std::string::npos;
}

/// payload.snapshot.sessionDefaults.mainSessionKey, if present.
inline std::optional<std::string> extract_main_session_key(const json &payload) {
  auto snapshot = detail::optional_object(payload, "snapshot");
  if (!snapshot)
    return std::nullopt;
  auto defaults = detail::optional_object(*snapshot, "sessionDefaults");
  if (!defaults)
    return std::nullopt;
  return detail::optional_string(*defaults, "mainSessionKey");
}

/// Params of the `connect` request. The device block is included only when
/// an identity is given and it produced a signature.
inline json build_connect_params(const client_options &opts,
                                 const std::optional<std::string> &token,
                                 const device_identity *identity,
                                 const std::optional<std::string> &nonce,
                                 int64_t signed_at_ms) {
  json params = {
      {"minProtocol", kProtocolVersion},
      {"maxProtocol", kProtocolVersion},
      {"client",
       {{"id", opts.client_id},
        {"version", opts.client_version},
        {"platform", opts.platform},
        {"mode", opts.mode}}},
  };
  if (token && !token->empty())
    params["auth"] = {{"token", *token}};

  if (identity == nullptr)
    return params;

  auth_payload_fields fields;
  fields.device_id = identity->device_id();
  fields.client_id = opts.client_id;
  fields.client_mode = opts.mode;
  fields.role = opts.role;
  fields.scopes = opts.scopes;
  fields.signed_at_ms = signed_at_ms;
  fields.token = token;
  fields.nonce = nonce;

  auto signature = identity->sign(build_auth_payload(fields));
  if (!signature) {
    logger()->warn("device signing failed, connecting with token only");
    return params;
  }

  json device = {{"id", identity->device_id()},
                 {"publicKey", identity->public_key_base64url()},
                 {"signature", *signature},
                 {"signedAt", signed_at_ms}};
  if (nonce)
    device["nonce"] = *nonce;
  params["device"] = device;
  params["scopes"] = opts.scopes;
  params["role"] = opts.role;
  return params;
}

struct handshake_result {
  std::optional<std::string> main_session_key;
};

/// Interprets the gateway's answer to `connect`. Throws handshake_error on
/// rejection.
inline handshake_result read_connect_result(const rpc_result &result) {
  if (!result.ok) {
    bool pairing = is_pairing_error(result.error_code, result.error_message);
    throw handshake_error(result.error_code.value_or(""),
                          result.error_message.value_or(""), pairing);
  }
  handshake_result out;
  if (result.payload)
    out.main_session_key = extract_main_session_key(*result.payload);
  return out;
}

/// Runs the connect exchange on a fresh session: waits briefly for a
/// challenge nonce, then sends `connect` and reads the reply.
class auth_handshake {
public:
  auth_handshake(const client_options &opts,
                 std::shared_ptr<const device_identity> identity)
      : opts_(opts), identity_(std::move(identity)) {}

  /// `challenge` must have been armed before the session started reading.
  handshake_result run(socket_session &session, challenge_slot &challenge,
                       const std::optional<std::string> &token) const {
    auto nonce = challenge.wait(opts_.challenge_timeout_ms);
    if (nonce)
      logger()->debug("received connect challenge");
    else
      logger()->debug("no connect challenge, proceeding without nonce");

    json params = build_connect_params(opts_, token, identity_.get(), nonce,
                                       epoch_now_ms());
    auto result = session.request("connect", params,
                                  opts_.connect_request_timeout_ms);
    return read_connect_result(result);
  }

private:
  client_options opts_;
  std::shared_ptr<const device_identity> identity_;
};

} // namespace clawlink
