#include "test_support.hpp"
#include "utils/file_watcher.hpp"
#include <atomic>
#include <gtest/gtest.h>
#include <stdexcept>

using namespace std::chrono_literals;
using test_support::TempProject;
using test_support::wait_until;

TEST(SnapshotFilesTest, RecordsRegularFilesRecursively) {
  TempProject project;
  fs::path a = project.write("dist/index.html", "<html></html>");
  fs::path b = project.write("dist/assets/app.js", "12345");
  project.mkdir("dist/empty");

  FileSnapshot snapshot = snapshot_files({project.root() / "dist"});

  ASSERT_EQ(snapshot.size(), 2u);
  EXPECT_EQ(snapshot.at(a).size, 13u);
  EXPECT_EQ(snapshot.at(b).size, 5u);
}

TEST(SnapshotFilesTest, SkipsMissingRoots) {
  TempProject project;
  fs::path a = project.write("dist/index.html", "x");

  FileSnapshot snapshot =
      snapshot_files({project.root() / "missing", project.root() / "dist"});

  ASSERT_EQ(snapshot.size(), 1u);
  EXPECT_TRUE(snapshot.count(a));
}

TEST(SnapshotFilesTest, DetectsContentChange) {
  TempProject project;
  project.write("dist/index.html", "one");
  FileSnapshot before = snapshot_files({project.root() / "dist"});

  project.write("dist/index.html", "three");
  FileSnapshot after = snapshot_files({project.root() / "dist"});
  EXPECT_FALSE(after == before);
}

TEST(FileWatcherTest, ReportsModification) {
  TempProject project;
  project.write("dist/index.html", "<html>one</html>");
  std::atomic<int> changes{0};

  FileWatcher watcher({project.root() / "dist"}, 20ms, [&] { changes++; });
  watcher.start();

  project.write("dist/index.html", "<html>updated</html>");
  EXPECT_TRUE(wait_until([&] { return changes.load() > 0; }, 3s));
  EXPECT_TRUE(watcher.stop(2s));
}

TEST(FileWatcherTest, ReportsNewAndDeletedFiles) {
  TempProject project;
  project.write("dist/index.html", "x");
  std::atomic<int> changes{0};

  FileWatcher watcher({project.root() / "dist", project.root() / "fixtures"},
                      20ms, [&] { changes++; });
  watcher.start();

  project.write("fixtures/health.json", "{}");
  ASSERT_TRUE(wait_until([&] { return changes.load() >= 1; }, 3s));

  int seen = changes.load();
  fs::remove(project.root() / "dist" / "index.html");
  EXPECT_TRUE(wait_until([&] { return changes.load() > seen; }, 3s));
  watcher.stop(2s);
}

TEST(FileWatcherTest, QuietTreeDoesNotFire) {
  TempProject project;
  project.write("dist/index.html", "x");
  std::atomic<int> changes{0};

  FileWatcher watcher({project.root() / "dist"}, 10ms, [&] { changes++; });
  watcher.start();
  std::this_thread::sleep_for(150ms);
  watcher.stop(2s);

  EXPECT_EQ(changes.load(), 0);
}

TEST(FileWatcherTest, WakeForcesRescan) {
  TempProject project;
  project.write("dist/index.html", "x");
  std::atomic<int> changes{0};

  FileWatcher watcher({project.root() / "dist"}, 1h, [&] { changes++; });
  watcher.start();

  project.write("dist/index.html", "changed");
  watcher.wake();
  EXPECT_TRUE(wait_until([&] { return changes.load() > 0; }, 3s));
  watcher.stop(2s);
}

TEST(FileWatcherTest, StopIsPromptAndRepeatable) {
  TempProject project;
  FileWatcher watcher({project.root()}, 1h, [] {});

  EXPECT_TRUE(watcher.stop(100ms));

  watcher.start();
  EXPECT_TRUE(watcher.running());

  auto started = std::chrono::steady_clock::now();
  EXPECT_TRUE(watcher.stop(2s));
  EXPECT_LT(std::chrono::steady_clock::now() - started, 1s);
  EXPECT_FALSE(watcher.running());
  EXPECT_TRUE(watcher.stop(100ms));
}

TEST(FileWatcherTest, ThrowingCallbackKeepsWatching) {
  TempProject project;
  project.write("dist/index.html", "1");
  std::atomic<int> calls{0};

  FileWatcher watcher({project.root() / "dist"}, 20ms, [&] {
    calls++;
    throw std::runtime_error("handler failed");
  });
  watcher.start();

  project.write("dist/index.html", "22");
  ASSERT_TRUE(wait_until([&] { return calls.load() >= 1; }, 3s));

  int seen = calls.load();
  project.write("dist/index.html", "333");
  EXPECT_TRUE(wait_until([&] { return calls.load() > seen; }, 3s));
  watcher.stop(2s);
}
