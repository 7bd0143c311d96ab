#include "preview_server.hpp"
#include "http_session.hpp"
#include "utils/errors.hpp"
#include <exception>
#include <system_error>
#include <utility>
#include <vector>

namespace {

tcp::endpoint resolve_endpoint(net::io_context &ioc, const std::string &host,
                               unsigned short port) {
  tcp::resolver resolver(ioc);
  auto results = resolver.resolve(host, std::to_string(port),
                                  tcp::resolver::passive);
  if (results.empty()) {
    throw FlashlessError("Cannot resolve host: " + host);
  }
  return results.begin()->endpoint();
}

} // namespace

PreviewServer::PreviewServer(Manifest manifest, const std::string &host,
                             unsigned short port, RequestLogLevel log_level,
                             bool live_reload,
                             std::chrono::milliseconds live_reload_interval)
    : router_(std::make_shared<const RequestRouter>(std::move(manifest),
                                                    live_reload)),
      reload_state_(std::make_shared<ReloadState>()), log_level_(log_level),
      connection_ioc_(std::make_shared<net::io_context>()), acceptor_(ioc_) {
  try {
    tcp::endpoint endpoint = resolve_endpoint(ioc_, host, port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);
    endpoint_ = acceptor_.local_endpoint();
  } catch (const boost::system::system_error &e) {
    throw FlashlessError("Failed to bind preview server on " + host + ":" +
                         std::to_string(port) + ": " + e.code().message());
  }

  if (live_reload) {
    const Manifest &loaded = router_->manifest();
    std::vector<fs::path> roots{loaded.ui.asset_root};
    if (!loaded.api.fixtures_dir.empty()) {
      roots.push_back(loaded.api.fixtures_dir);
    }

    auto state = reload_state_;
    watcher_ = std::make_unique<FileWatcher>(
        std::move(roots), live_reload_interval, [state]() {
          state->bump();
          log_info("Change detected (v" + std::to_string(state->get()) + ")");
        });
  }
}

PreviewServer::~PreviewServer() { stop(); }

void PreviewServer::start() {
  if (serve_thread_.joinable()) {
    throw FlashlessError("Preview server is already running");
  }
  if (watcher_) {
    watcher_->start();
  }
  serve_thread_ = std::thread([this]() { serve_forever(); });
}

void PreviewServer::stop() {
  if (watcher_ && watcher_->running()) {
    if (!watcher_->stop(WATCHER_STOP_TIMEOUT)) {
      log_warning("File watcher did not stop within " +
                  std::to_string(WATCHER_STOP_TIMEOUT.count()) + "s");
    }
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_ = true;
    ioc_.stop();
    if (!serving_) {
      boost::system::error_code ec;
      acceptor_.close(ec);
    }
  }

  if (serve_thread_.joinable() &&
      serve_thread_.get_id() != std::this_thread::get_id()) {
    serve_thread_.join();
  }
}

void PreviewServer::serve_forever() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
      return;
    }
    serving_ = true;
  }

  do_accept();
  try {
    ioc_.run();
  } catch (const std::exception &e) {
    log_error(std::string("Preview server stopped: ") + e.what());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  serving_ = false;
  boost::system::error_code ec;
  acceptor_.close(ec);
}

void PreviewServer::do_accept() {
  acceptor_.async_accept(
      *connection_ioc_,
      [this](boost::system::error_code ec, tcp::socket socket) {
        on_accept(ec, std::move(socket));
      });
}

void PreviewServer::on_accept(boost::system::error_code ec,
                              tcp::socket socket) {
  if (ec == net::error::operation_aborted) {
    return;
  }

  if (ec) {
    log_warning("Accept failed: " + ec.message());
  } else {
    auto session = std::make_shared<HttpSession>(
        connection_ioc_, std::move(socket), router_, reload_state_,
        log_level_);
    try {
      std::thread([session]() {
        try {
          session->run();
        } catch (const std::exception &e) {
          log_error(std::string("Connection failed: ") + e.what());
        }
      }).detach();
    } catch (const std::system_error &e) {
      log_error(std::string("Cannot start connection worker: ") + e.what());
    }
  }

  do_accept();
}
