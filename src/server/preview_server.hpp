#ifndef PREVIEW_SERVER_HPP
#define PREVIEW_SERVER_HPP

#include "core/manifest.hpp"
#include "reload_state.hpp"
#include "request_router.hpp"
#include "utils/file_watcher.hpp"
#include "utils/logging.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

inline constexpr std::chrono::seconds WATCHER_STOP_TIMEOUT{2};

// HTTP preview of a built frontend plus mocked API fixtures. The port is bound
// on construction, so address() already reports an ephemeral port.
class PreviewServer {
public:
  PreviewServer(Manifest manifest, const std::string &host, unsigned short port,
                RequestLogLevel log_level = RequestLogLevel::Errors,
                bool live_reload = true,
                std::chrono::milliseconds live_reload_interval =
                    std::chrono::seconds(1));
  ~PreviewServer();

  PreviewServer(const PreviewServer &) = delete;
  PreviewServer &operator=(const PreviewServer &) = delete;

  boost::asio::ip::tcp::endpoint address() const { return endpoint_; }
  std::string host() const { return endpoint_.address().to_string(); }
  unsigned short port() const { return endpoint_.port(); }

  // Starts the watcher and serves on a background thread.
  void start();

  // Stops the watcher (bounded), then the accept loop. Open reload streams
  // are left to end with their clients.
  void stop();

  // Accepts connections on the calling thread until stop().
  void serve_forever();

  const RequestRouter &router() const { return *router_; }
  std::shared_ptr<ReloadState> reload_state() const { return reload_state_; }
  bool live_reload() const { return watcher_ != nullptr; }

private:
  void do_accept();
  void on_accept(boost::system::error_code ec,
                 boost::asio::ip::tcp::socket socket);

  std::shared_ptr<const RequestRouter> router_;
  std::shared_ptr<ReloadState> reload_state_;
  RequestLogLevel log_level_;

  boost::asio::io_context ioc_;
  std::shared_ptr<boost::asio::io_context> connection_ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  boost::asio::ip::tcp::endpoint endpoint_;

  std::unique_ptr<FileWatcher> watcher_;
  std::thread serve_thread_;

  std::mutex mutex_;
  bool serving_ = false;
  bool stopped_ = false;
};

#endif
