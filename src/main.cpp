/**
 * @file main.cpp
 * @brief Entry point for scene_encode
 *
 * @details Usage: scene_encode <source> <output_dir>
 *
 *          Encoder, metric and detection settings come from the environment
 *          (see config.hpp). Exit codes:
 *
 *          - 0: success
 *
 *          - 1: fatal pipeline error (bad input, unusable output directory)
 *
 *          - 2: one or more scenes failed (nothing merged)
 *
 *          - 130: interrupted (rerun to resume)
 *
 * @note The cache lives in <output_dir>/cache.json. Deleting it, or the whole
 *       output directory, is the way to drop cached results.
 */

#include <atomic>
#include <cstdio>
#include <exception>
#include <string>

#include <signal.h>

#include "scene_encode/config.hpp"
#include "scene_encode/ffmpeg_backend.hpp"
#include "scene_encode/logging.hpp"
#include "scene_encode/pipeline.hpp"
#include "scene_encode/types.hpp"

using namespace scene_encode;

namespace {

/// Set from the signal handler, polled by workers and child process waits
std::atomic<bool> g_cancel{false};

void on_signal(int) { g_cancel.store(true); }

void install_signal_handlers() {
  struct sigaction sa {};
  sa.sa_handler = on_signal;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

} // namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc < 3) {
    LOG_WARN("Usage: ./scene_encode <source> <output_dir>");
    return static_cast<int>(RunStatus::Fatal);
  }

  PipelineConfig config;
  std::string error;
  if (!load_pipeline_config(argv[1], argv[2], config, error)) {
    LOG_ERROR("Invalid configuration: {}", error);
    return static_cast<int>(RunStatus::Fatal);
  }
  config.cancel = &g_cancel;

  install_signal_handlers();

  LOG_INFO("Source: {}", config.source.string());
  LOG_INFO("Output directory: {}", config.output_dir.string());
  LOG_INFO("Encoder: {} ({}), metric: {}",
           encoder_kind_name(config.encoder.kind),
           config.encoder.effective_preset(),
           metric_kind_name(config.metric.kind));

  RunStatus status = RunStatus::Fatal;
  try {
    FFmpegBackend media(config.ffmpeg);
    Pipeline pipeline(config, media);
    status = pipeline.run();
  } catch (const std::exception &e) {
    LOG_ERROR("Fatal: {}", e.what());
    status = RunStatus::Fatal;
  }

  TimingCollector::print_summary();
  return static_cast<int>(status);
}
