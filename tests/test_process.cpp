// Child process runner: exit status, stderr capture, cancellation.

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

#include "fixtures/temp_dir.hpp"
#include "scene_encode/process.hpp"

namespace scene_encode {
namespace {

using test_support::read_file;
using test_support::TempDir;

TEST(ProcessTest, SuccessfulCommand) {
  TempDir dir("process");
  ProcessResult result;
  std::string error;
  ASSERT_TRUE(run_process({"sh", "-c", "echo to-stdout; exit 0"},
                          dir / "ok.log", nullptr, result, error))
      << error;
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_FALSE(result.cancelled);
  // stdout is discarded, only stderr reaches the log
  EXPECT_EQ(read_file(dir / "ok.log"), "");
}

TEST(ProcessTest, FailureCarriesStderrTail) {
  TempDir dir("process");
  ProcessResult result;
  std::string error;
  EXPECT_FALSE(run_process({"sh", "-c", "echo 'Invalid argument' >&2; exit 3"},
                           dir / "fail.log", nullptr, result, error));
  EXPECT_EQ(result.exit_code, 3);
  EXPECT_NE(result.log_tail.find("Invalid argument"), std::string::npos);
  EXPECT_NE(error.find("status 3"), std::string::npos);
  EXPECT_NE(error.find("Invalid argument"), std::string::npos);
}

TEST(ProcessTest, MissingProgram) {
  TempDir dir("process");
  ProcessResult result;
  std::string error;
  EXPECT_FALSE(run_process({"scene-encode-no-such-program"}, dir / "x.log",
                           nullptr, result, error));
  EXPECT_FALSE(error.empty());
  EXPECT_FALSE(run_process({}, dir / "x.log", nullptr, result, error));
}

TEST(ProcessTest, CancelTerminatesChild) {
  TempDir dir("process");
  std::atomic<bool> cancel{false};

  std::thread trigger([&cancel]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    cancel.store(true);
  });

  auto start = std::chrono::steady_clock::now();
  ProcessResult result;
  std::string error;
  bool ok = run_process({"sleep", "30"}, dir / "sleep.log", &cancel, result,
                        error);
  auto elapsed = std::chrono::steady_clock::now() - start;
  trigger.join();

  EXPECT_FALSE(ok);
  EXPECT_TRUE(result.cancelled);
  EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST(ProcessTest, AlreadyCancelledDoesNotStart) {
  TempDir dir("process");
  std::atomic<bool> cancel{true};
  ProcessResult result;
  std::string error;
  EXPECT_FALSE(run_process({"sh", "-c", "touch started"}, dir / "c.log",
                           &cancel, result, error));
  EXPECT_TRUE(result.cancelled);
}

TEST(ProcessTest, DescribeQuotesArguments) {
  EXPECT_EQ(describe_command({"ffmpeg", "-i", "a b.mkv"}),
            "ffmpeg -i \"a b.mkv\"");
}

} // namespace
} // namespace scene_encode
