#include "http_session.hpp"
#include "live_reload.hpp"
#include "utils/mime_types.hpp"
#include "utils/paths.hpp"
#include <boost/asio/write.hpp>
#include <boost/beast/core/string.hpp>
#include <chrono>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <utility>

namespace {

bool is_supported_method(const std::string &method) {
  return method == "GET" || method == "POST" || method == "PUT" ||
         method == "DELETE" || method == "PATCH";
}

// Peers hanging up mid-response are a normal end of the connection.
bool is_disconnect(const beast::error_code &ec) {
  return ec == http::error::end_of_stream || ec == net::error::eof ||
         ec == net::error::connection_reset ||
         ec == net::error::broken_pipe ||
         ec == net::error::connection_aborted ||
         ec == http::error::partial_message;
}

std::string weak_etag(const fs::path &file, std::uintmax_t size) {
  std::error_code ec;
  auto modified = fs::last_write_time(file, ec);
  auto nanos = ec ? 0
                  : std::chrono::duration_cast<std::chrono::nanoseconds>(
                        modified.time_since_epoch())
                        .count();

  std::ostringstream ss;
  ss << "W/\"" << std::hex << static_cast<unsigned long long>(nanos) << "-"
     << static_cast<unsigned long long>(size) << "\"";
  return ss.str();
}

std::string cache_control(const Manifest &manifest) {
  return "public, max-age=" +
         std::to_string(manifest.ui.cache_policy.max_age_seconds);
}

} // namespace

HttpSession::HttpSession(std::shared_ptr<net::io_context> context,
                         tcp::socket socket,
                         std::shared_ptr<const RequestRouter> router,
                         std::shared_ptr<ReloadState> reload_state,
                         RequestLogLevel log_level)
    : context_(std::move(context)), socket_(std::move(socket)),
      router_(std::move(router)),
      reload_state_(std::move(reload_state)), log_level_(log_level) {}

void HttpSession::run() {
  beast::flat_buffer buffer;
  beast::error_code ec;

  for (;;) {
    Request req;
    http::read(socket_, buffer, req, ec);
    if (ec) {
      if (!is_disconnect(ec)) {
        Request bad;
        bad.version(11);
        bad.keep_alive(false);
        Outcome outcome = respond_json(
            http::status::bad_request, {{"error", "Bad request"}}, bad);
        if (should_log_request(log_level_, outcome.status)) {
          log_request("-", "-", outcome.status);
        }
      }
      break;
    }

    Outcome outcome = handle(req);
    if (!outcome.logged) {
      log(req, outcome.status);
    }
    if (!outcome.keep_alive) {
      break;
    }
  }

  socket_.shutdown(tcp::socket::shutdown_send, ec);
  socket_.close(ec);
}

HttpSession::Outcome HttpSession::handle(const Request &req) {
  std::string method(req.method_string());
  std::string path = normalize_http_path(std::string(req.target()));

  if (!is_supported_method(method)) {
    return respond_json(http::status::not_implemented,
                        {{"error", "Unsupported method"}, {"method", method}},
                        req);
  }

  RouteDecision decision = router_->route(method, path);
  switch (decision.kind) {
  case RouteKind::ReloadStream:
    return serve_reload_stream(req);
  case RouteKind::Fixture:
    return serve_fixture(decision, req);
  case RouteKind::StaticFile:
    return serve_file(decision.file, path, req);
  case RouteKind::NotFound:
    break;
  }
  return respond_not_found(path, req);
}

HttpSession::Outcome HttpSession::serve_fixture(const RouteDecision &decision,
                                                const Request &req) {
  const ApiMapping &mapping = *decision.mapping;
  nlohmann::json missing = {{"error", "Missing fixture: " + mapping.fixture}};

  std::error_code exists_ec;
  if (!fs::is_regular_file(decision.file, exists_ec)) {
    return respond_json(http::status::internal_server_error, missing, req);
  }

  beast::error_code ec;
  http::file_body::value_type body;
  body.open(decision.file.string().c_str(), beast::file_mode::scan, ec);
  if (ec) {
    return respond_json(http::status::internal_server_error, missing, req);
  }

  std::string content_type = get_mime_type(decision.file);
  for (const auto &[name, value] : mapping.headers) {
    if (beast::iequals(name, "Content-Type")) {
      content_type = value;
    }
  }

  auto size = body.size();
  http::response<http::file_body> res;
  res.version(req.version());
  res.result(static_cast<unsigned>(mapping.status));
  res.set(http::field::server, SERVER_NAME);
  res.set(http::field::content_type, content_type);
  res.content_length(size);

  // Framing headers always describe the body actually sent.
  for (const auto &[name, value] : mapping.headers) {
    if (beast::iequals(name, "Content-Type") ||
        beast::iequals(name, "Content-Length")) {
      continue;
    }
    res.set(name, value);
  }

  res.keep_alive(req.keep_alive());
  res.body() = std::move(body);
  return send(res);
}

HttpSession::Outcome HttpSession::serve_file(const fs::path &file,
                                             const std::string &path,
                                             const Request &req) {
  std::string content_type = get_mime_type(file);
  if (router_->live_reload() && is_html_type(content_type)) {
    return serve_html_with_reload(file, path, req);
  }

  beast::error_code ec;
  http::file_body::value_type body;
  body.open(file.string().c_str(), beast::file_mode::scan, ec);
  if (ec) {
    return respond_not_found(path, req);
  }

  const Manifest &manifest = router_->manifest();
  auto size = body.size();

  http::response<http::file_body> res;
  res.version(req.version());
  res.result(http::status::ok);
  res.set(http::field::server, SERVER_NAME);
  res.set(http::field::content_type, content_type);
  res.content_length(size);
  res.set(http::field::cache_control, cache_control(manifest));
  if (manifest.ui.cache_policy.etag) {
    res.set(http::field::etag, weak_etag(file, size));
  }
  res.keep_alive(req.keep_alive());
  res.body() = std::move(body);
  return send(res);
}

HttpSession::Outcome
HttpSession::serve_html_with_reload(const fs::path &file,
                                    const std::string &path,
                                    const Request &req) {
  std::ifstream input(file, std::ios::binary);
  if (!input.is_open()) {
    return respond_not_found(path, req);
  }

  std::string html((std::istreambuf_iterator<char>(input)),
                   std::istreambuf_iterator<char>());

  http::response<http::string_body> res{http::status::ok, req.version()};
  res.set(http::field::server, SERVER_NAME);
  res.set(http::field::content_type, "text/html; charset=utf-8");
  res.set(http::field::cache_control, cache_control(router_->manifest()));
  res.keep_alive(req.keep_alive());
  res.body() = inject_live_reload(html, router_->reload_path());
  res.prepare_payload();
  return send(res);
}

HttpSession::Outcome HttpSession::serve_reload_stream(const Request &req) {
  http::response<http::empty_body> res{http::status::ok, req.version()};
  res.set(http::field::server, SERVER_NAME);
  res.set(http::field::content_type, "text/event-stream; charset=utf-8");
  res.set(http::field::cache_control, "no-cache");
  res.set(http::field::connection, "keep-alive");

  Outcome outcome;
  outcome.logged = true;

  beast::error_code ec;
  http::response_serializer<http::empty_body> sr{res};
  http::write_header(socket_, sr, ec);
  if (ec) {
    log(req, std::nullopt);
    return outcome;
  }

  outcome.status = res.result_int();
  log(req, outcome.status);

  uint64_t version = reload_state_->get();
  if (!write_frame(sse_data_frame(version))) {
    return outcome;
  }

  for (;;) {
    auto changed = reload_state_->wait_for_change(version, LIVE_RELOAD_KEEPALIVE);
    if (!changed) {
      if (!write_frame(sse_keepalive_frame())) {
        break;
      }
      continue;
    }

    version = *changed;
    if (!write_frame(sse_data_frame(version))) {
      break;
    }
  }
  return outcome;
}

HttpSession::Outcome HttpSession::respond_json(http::status status,
                                               const nlohmann::json &payload,
                                               const Request &req) {
  http::response<http::string_body> res{status, req.version()};
  res.set(http::field::server, SERVER_NAME);
  res.set(http::field::content_type, "application/json");
  res.keep_alive(req.keep_alive());
  res.body() = payload.dump();
  res.prepare_payload();
  return send(res);
}

HttpSession::Outcome HttpSession::respond_not_found(const std::string &path,
                                                    const Request &req) {
  return respond_json(http::status::not_found,
                      {{"error", "Not found"}, {"path", path}}, req);
}

template <class Body>
HttpSession::Outcome HttpSession::send(http::response<Body> &res) {
  Outcome outcome;
  outcome.keep_alive = res.keep_alive();

  beast::error_code ec;
  http::response_serializer<Body> sr{res};
  http::write_header(socket_, sr, ec);
  if (ec) {
    outcome.keep_alive = false;
    return outcome;
  }

  outcome.status = res.result_int();
  http::write(socket_, sr, ec);
  if (ec) {
    outcome.keep_alive = false;
  }
  return outcome;
}

bool HttpSession::write_frame(const std::string &frame) {
  beast::error_code ec;
  net::write(socket_, net::buffer(frame), ec);
  return !ec;
}

void HttpSession::log(const Request &req, std::optional<unsigned> status) const {
  if (should_log_request(log_level_, status)) {
    log_request(std::string(req.method_string()), std::string(req.target()),
                status);
  }
}
