#include "file_watcher_listener.hpp"
#include <utility>

FileWatcherListener::FileWatcherListener(std::function<void()> callback)
    : on_event(std::move(callback)) {}

void FileWatcherListener::handleFileAction(efsw::WatchID watchid,
                                           const std::string &dir,
                                           const std::string &filename,
                                           efsw::Action action,
                                           std::string oldFilename) {
  (void)watchid;
  (void)dir;
  (void)oldFilename;

  // Editor swap and lock files churn constantly; the poller still sees them.
  if (filename.empty() || filename[0] == '.' || filename[0] == '~') {
    return;
  }

  switch (action) {
  case efsw::Actions::Add:
  case efsw::Actions::Delete:
  case efsw::Actions::Modified:
  case efsw::Actions::Moved:
    if (on_event) {
      on_event();
    }
    break;
  default:
    break;
  }
}
