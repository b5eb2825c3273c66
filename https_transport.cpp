#include "https_transport.hpp"
#include "errors.hpp"
#include "tls_client.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <iostream>

namespace mvs {
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

HttpsTransport::HttpsTransport(std::string host, std::string port, bool verify_tls)
  : host_(std::move(host)), port_(std::move(port)), verify_(verify_tls),
    ctx_(asio::ssl::context::tls_client)
{
  apply_client_tls(ctx_, verify_);
  if(!verify_)
    std::cerr << "[GRAPHQL] WARNING: TLS peer verification disabled for " << host_ << "\n";
}

HttpResponse HttpsTransport::post(const std::string& target, const HeaderList& headers,
                                  const std::string& body)
{
  try{
    beast::ssl_stream<beast::tcp_stream> stream(io_, ctx_);
    prepare_client_stream(stream, host_, verify_);

    tcp::resolver res(io_);
    auto eps = res.resolve(host_, port_);
    beast::get_lowest_layer(stream).connect(eps);
    stream.handshake(asio::ssl::stream_base::client);

    http::request<http::string_body> req{http::verb::post, target, 11};
    req.set(http::field::host, host_);
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req.set(http::field::content_type, "application/json");
    req.set(http::field::connection, "close");
    for(const auto& h : headers) req.set(h.first, h.second);
    req.body() = body;
    req.prepare_payload();

    http::write(stream, req);

    beast::flat_buffer buf;
    http::response<http::string_body> resp;
    http::read(stream, buf, resp);

    beast::error_code ec;
    stream.shutdown(ec);
    // response already complete; eof / truncated close are normal here
    if(ec && ec != asio::error::eof && ec != asio::ssl::error::stream_truncated)
      std::cerr << "[GRAPHQL] TLS shutdown: " << ec.message() << "\n";

    HttpResponse out;
    out.status = resp.result_int();
    out.body = std::move(resp.body());
    return out;

  } catch(const boost::system::system_error& e){
    throw Error(ErrorKind::TRANSPORT, host_ + ": " + e.what());
  }
}

} // namespace mvs
