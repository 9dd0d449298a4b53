/**
 * @file pipeline.hpp
 * @brief Whole-run orchestration
 *
 * @details The Pipeline class sequences one run:
 *
 *          1. Verify the output directory and open the cache store
 *
 *          2. Identify the source file
 *
 *          3. Probe (frame count, frame rate, crop)
 *
 *          4. Detect scenes
 *
 *          5. Extract, encode and measure every scene in parallel
 *
 *          6. Merge the encoded scenes in index order
 *
 *          7. Aggregate the scene scores, write and print the report
 *
 * @note Merge never runs on partial input: a single failed scene ends the run
 *       with RunStatus::ScenesFailed after all other scenes were attempted.
 */

#ifndef SCENE_ENCODE_PIPELINE_HPP
#define SCENE_ENCODE_PIPELINE_HPP

#include <string>

#include "cache_store.hpp"
#include "config.hpp"
#include "layout.hpp"
#include "media.hpp"
#include "report.hpp"
#include "stages.hpp"
#include "types.hpp"

namespace scene_encode {

/**
 * @class Pipeline
 * @brief Orchestrates one run over a source and an output directory.
 *
 * @attention The cache store, the stage counters and the summary belong to
 *            the Pipeline instance; nothing is kept in static state, so two
 *            pipelines over different output directories are independent.
 */
class Pipeline {
public:
  /**
   * @param config Run configuration (copied)
   * @param media Media backend, must outlive the pipeline
   */
  Pipeline(PipelineConfig config, MediaBackend &media);

  Pipeline(const Pipeline &) = delete;
  Pipeline &operator=(const Pipeline &) = delete;

  /**
   * @brief Run the complete pipeline.
   *
   * @details May be called again on the same instance: counters and derived
   *          settings start over and the summary describes the last run only.
   *
   * @return Run outcome (also the process exit code)
   */
  RunStatus run();

  /// Summary of the last run()
  const RunSummary &summary() const { return summary_; }

  /// Effective configuration (encoder keyint filled in after probe)
  const PipelineConfig &config() const { return config_; }

  const CacheStore &store() const { return store_; }

  /// Write report.json and print the console report after run() (default on)
  void set_report(bool enabled) { report_ = enabled; }

private:
  RunStatus execute(StageContext &ctx);
  RunStatus fail(const std::string &what, const std::string &error);

  PipelineConfig config_;
  const int configured_encode_threads_; //< As configured (0 = sized per run)
  MediaBackend &media_;
  OutputLayout layout_;
  CacheStore store_;
  StageCounters counters_;
  RunSummary summary_;
  bool report_ = true;
  bool layout_ready_ = false;
};

} // namespace scene_encode

#endif // SCENE_ENCODE_PIPELINE_HPP
