#ifndef FILE_WATCHER_HPP
#define FILE_WATCHER_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace efsw {
class FileWatcher;
}
class FileWatcherListener;

struct FileStamp {
  fs::file_time_type modified;
  std::uintmax_t size = 0;

  bool operator==(const FileStamp &) const = default;
};

using FileSnapshot = std::map<fs::path, FileStamp>;

// Records every regular file below the roots. Missing roots and files that
// vanish mid-scan are skipped.
FileSnapshot snapshot_files(const std::vector<fs::path> &roots);

// Polls the roots every interval and calls on_change whenever the snapshot
// differs from the previous one. Native events (efsw) only shorten the wait;
// the snapshot comparison alone decides whether something changed.
class FileWatcher {
public:
  using Callback = std::function<void()>;

  FileWatcher(std::vector<fs::path> roots, std::chrono::milliseconds interval,
              Callback on_change);
  ~FileWatcher();

  FileWatcher(const FileWatcher &) = delete;
  FileWatcher &operator=(const FileWatcher &) = delete;

  void start();

  // Signals the loop and waits up to timeout for it to exit. Returns false
  // if the loop did not finish in time; its thread is then left detached.
  bool stop(std::chrono::milliseconds timeout);

  // Triggers an immediate rescan.
  void wake();

  bool running() const { return thread_.joinable(); }

private:
  struct State {
    std::mutex mutex;
    std::condition_variable wake;
    bool stop_requested = false;
    bool woken = false;
  };

  static void run(std::shared_ptr<State> state, std::vector<fs::path> roots,
                  std::chrono::milliseconds interval, Callback on_change,
                  FileSnapshot snapshot, std::promise<void> done);

  void start_native_watch();

  std::vector<fs::path> roots_;
  std::chrono::milliseconds interval_;
  Callback on_change_;
  std::shared_ptr<State> state_;
  std::thread thread_;
  std::future<void> done_;
  std::unique_ptr<FileWatcherListener> listener_;
  std::unique_ptr<efsw::FileWatcher> native_;
};

#endif
