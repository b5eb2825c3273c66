#pragma once
#include <boost/asio/ssl.hpp>
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <stdexcept>
#include <string>

namespace mvs {
namespace asio = boost::asio;

// Client-side TLS config: TLS1.2+, system trust store, peer verification
inline void apply_client_tls(asio::ssl::context& ctx, bool verify) {
  SSL_CTX* c = ctx.native_handle();

  if (SSL_CTX_set_min_proto_version(c, TLS1_2_VERSION) != 1)
    throw std::runtime_error("SSL_CTX_set_min_proto_version failed");

  if (!verify) {
    ctx.set_verify_mode(asio::ssl::verify_none);
    return;
  }

  if (SSL_CTX_set_default_verify_paths(c) != 1)
    throw std::runtime_error("SSL_CTX_set_default_verify_paths failed");

  ctx.set_verify_mode(asio::ssl::verify_peer);
}

// SNI + host name check for one connection
template <typename SslStream>
inline void prepare_client_stream(SslStream& stream, const std::string& host, bool verify) {
  if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str()))
    throw std::runtime_error("SSL_set_tlsext_host_name failed");

  if (verify)
    stream.set_verify_callback(asio::ssl::host_name_verification(host));
}

} // namespace mvs
