#pragma once

#include "reload_state.hpp"
#include "request_router.hpp"
#include "utils/logging.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

inline constexpr const char *SERVER_NAME = "flashless/1.0";

// Serves one client connection on the calling thread until the peer goes
// away or a response ends keep-alive. Reload streams hold the connection
// until a write fails.
class HttpSession {
public:
  // context owns the socket's services and must outlive it.
  HttpSession(std::shared_ptr<net::io_context> context, tcp::socket socket,
              std::shared_ptr<const RequestRouter> router,
              std::shared_ptr<ReloadState> reload_state,
              RequestLogLevel log_level);

  void run();

private:
  using Request = http::request<http::string_body>;

  struct Outcome {
    std::optional<unsigned> status;
    bool keep_alive = false;
    bool logged = false;
  };

  Outcome handle(const Request &req);
  Outcome serve_fixture(const RouteDecision &decision, const Request &req);
  Outcome serve_file(const fs::path &file, const std::string &path,
                     const Request &req);
  Outcome serve_html_with_reload(const fs::path &file, const std::string &path,
                                 const Request &req);
  Outcome serve_reload_stream(const Request &req);
  Outcome respond_json(http::status status, const nlohmann::json &payload,
                       const Request &req);
  Outcome respond_not_found(const std::string &path, const Request &req);

  template <class Body> Outcome send(http::response<Body> &res);
  bool write_frame(const std::string &frame);
  void log(const Request &req, std::optional<unsigned> status) const;

  std::shared_ptr<net::io_context> context_;
  tcp::socket socket_;
  std::shared_ptr<const RequestRouter> router_;
  std::shared_ptr<ReloadState> reload_state_;
  RequestLogLevel log_level_;
};
