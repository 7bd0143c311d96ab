#pragma once

#include <efsw/efsw.hpp>
#include <functional>
#include <string>

// Forwards native change events so the snapshot poller can rescan early.
class FileWatcherListener : public efsw::FileWatchListener {
private:
  std::function<void()> on_event;

public:
  explicit FileWatcherListener(std::function<void()> callback);

  void handleFileAction(efsw::WatchID watchid, const std::string &dir,
                        const std::string &filename, efsw::Action action,
                        std::string oldFilename = "") override;
};
