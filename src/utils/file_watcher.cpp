#include "file_watcher.hpp"
#include "file_watcher_listener.hpp"
#include "logging.hpp"
#include <efsw/efsw.hpp>
#include <exception>
#include <system_error>
#include <utility>

FileSnapshot snapshot_files(const std::vector<fs::path> &roots) {
  FileSnapshot snapshot;

  for (const auto &root : roots) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
      continue;
    }

    fs::recursive_directory_iterator it(
        root, fs::directory_options::skip_permission_denied, ec);
    const fs::recursive_directory_iterator end;

    while (!ec && it != end) {
      const fs::path path = it->path();

      std::error_code stat_ec;
      if (it->is_regular_file(stat_ec)) {
        auto size = fs::file_size(path, stat_ec);
        if (!stat_ec) {
          auto modified = fs::last_write_time(path, stat_ec);
          if (!stat_ec) {
            snapshot[path] = FileStamp{modified, size};
          }
        }
      }

      it.increment(ec);
    }
  }

  return snapshot;
}

FileWatcher::FileWatcher(std::vector<fs::path> roots,
                         std::chrono::milliseconds interval, Callback on_change)
    : roots_(std::move(roots)), interval_(interval),
      on_change_(std::move(on_change)), state_(std::make_shared<State>()) {}

FileWatcher::~FileWatcher() { stop(std::chrono::seconds(2)); }

void FileWatcher::start() {
  if (thread_.joinable()) {
    return;
  }

  state_ = std::make_shared<State>();

  // Changes made after start() returns are measured against this baseline.
  FileSnapshot baseline = snapshot_files(roots_);

  std::promise<void> done;
  done_ = done.get_future();
  thread_ = std::thread(&FileWatcher::run, state_, roots_, interval_,
                        on_change_, std::move(baseline), std::move(done));

  start_native_watch();
}

void FileWatcher::start_native_watch() {
  std::shared_ptr<State> state = state_;
  listener_ = std::make_unique<FileWatcherListener>([state]() {
    {
      std::lock_guard<std::mutex> lock(state->mutex);
      state->woken = true;
    }
    state->wake.notify_all();
  });

  native_ = std::make_unique<efsw::FileWatcher>();

  int watch_count = 0;
  for (const auto &root : roots_) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
      continue;
    }

    efsw::WatchID id = native_->addWatch(root.string(), listener_.get(), true);
    if (id < 0) {
      log_warning("Native file events unavailable for " + root.string() +
                  " (" + efsw::Errors::Log::getLastErrorLog() +
                  "); polling only");
      continue;
    }
    watch_count++;
  }

  if (watch_count > 0) {
    native_->watch();
  }
}

void FileWatcher::wake() {
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->woken = true;
  }
  state_->wake.notify_all();
}

bool FileWatcher::stop(std::chrono::milliseconds timeout) {
  native_.reset();
  listener_.reset();

  if (!thread_.joinable()) {
    return true;
  }

  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->stop_requested = true;
  }
  state_->wake.notify_all();

  if (done_.wait_for(timeout) == std::future_status::ready) {
    thread_.join();
    return true;
  }

  log_warning("File watcher did not stop within " +
              std::to_string(timeout.count()) + "ms");
  thread_.detach();
  return false;
}

void FileWatcher::run(std::shared_ptr<State> state, std::vector<fs::path> roots,
                      std::chrono::milliseconds interval, Callback on_change,
                      FileSnapshot snapshot, std::promise<void> done) {
  for (;;) {
    {
      std::unique_lock<std::mutex> lock(state->mutex);
      state->wake.wait_for(lock, interval, [&] {
        return state->stop_requested || state->woken;
      });
      if (state->stop_requested) {
        break;
      }
      state->woken = false;
    }

    FileSnapshot next = snapshot_files(roots);
    if (next == snapshot) {
      continue;
    }

    snapshot = std::move(next);
    try {
      on_change();
    } catch (const std::exception &e) {
      log_error(std::string("File change handler failed: ") + e.what());
    }
  }

  done.set_value();
}
