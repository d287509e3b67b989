// Repository: Z-Play-supply
// Component: Supply Metrics
// Purpose: Point-in-time snapshot of the media supply in Prometheus text format.
// Copyright (c) 2025 Z-Play
//
// These metrics are passive observations. Capturing a snapshot takes only the
// locks the observed objects already expose through their accessors.

#ifndef ZPLAY_TELEMETRY_SUPPLY_METRICS_HPP_
#define ZPLAY_TELEMETRY_SUPPLY_METRICS_HPP_

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

#include "zplay/engine/WorkerPool.hpp"
#include "zplay/supply/AcquisitionPipeline.hpp"
#include "zplay/supply/PlaybackFront.hpp"
#include "zplay/supply/PlaybackSpeed.hpp"

namespace zplay::telemetry {

// =============================================================================
// SupplyMetrics
// Built by Capture() on the requesting thread; plain data afterwards.
// =============================================================================

struct SupplyMetrics {
  // ---- Ready queue ----
  uint64_t ready_len = 0;
  uint64_t ready_capacity = 0;
  uint64_t queued_video = 0;
  uint64_t queued_image = 0;
  uint64_t queued_audio = 0;

  // ---- Stages ----
  uint64_t preroll_in_flight = 0;
  uint64_t dedup_size = 0;
  uint64_t dedup_capacity = 0;
  uint64_t roots_enabled = 0;
  uint64_t roots_disabled = 0;
  supply::PipelineCounters counters;

  // ---- Worker pool ----
  uint64_t engines_live = 0;
  std::vector<size_t> engines_per_worker;

  // ---- Playback front ----
  bool playing = false;
  double playback_rate = 1.0;
  uint64_t items_played = 0;

  static SupplyMetrics Capture(const supply::AcquisitionPipeline& pipeline,
                               const engine::WorkerPool& pool,
                               const supply::PlaybackFront* front) {
    SupplyMetrics m;
    const auto stats = pipeline.Stats();
    m.ready_len = pipeline.Ready().Size();
    m.ready_capacity = pipeline.Ready().Capacity();
    m.queued_video = stats.video;
    m.queued_image = stats.image;
    m.queued_audio = stats.audio;
    m.preroll_in_flight = pipeline.PrerollInFlight();
    m.dedup_size = pipeline.Dedup().Size();
    m.dedup_capacity = pipeline.Dedup().Capacity();
    m.roots_enabled = pipeline.Roots().Enabled().size();
    m.roots_disabled = pipeline.Roots().Disabled().size();
    m.counters = pipeline.Counters();
    m.engines_live = pool.EngineCount();
    m.engines_per_worker = pool.EnginesPerWorker();
    if (front != nullptr) {
      const auto now = front->NowPlaying();
      m.playing = now.active;
      m.playback_rate = supply::PlaybackSpeedRate(now.speed);
      m.items_played = now.items_played;
    }
    return m;
  }

  // Generate Prometheus text exposition format
  std::string GeneratePrometheusText() const {
    std::ostringstream oss;

    oss << "# HELP zplay_ready_queue_length Prerolled engines waiting in the Ready queue\n";
    oss << "# TYPE zplay_ready_queue_length gauge\n";
    oss << "zplay_ready_queue_length " << ready_len << "\n";

    oss << "\n# HELP zplay_ready_queue_capacity Ready queue capacity\n";
    oss << "# TYPE zplay_ready_queue_capacity gauge\n";
    oss << "zplay_ready_queue_capacity " << ready_capacity << "\n";

    oss << "\n# HELP zplay_ready_queue_items Ready items by media kind\n";
    oss << "# TYPE zplay_ready_queue_items gauge\n";
    oss << "zplay_ready_queue_items{kind=\"video\"} " << queued_video << "\n";
    oss << "zplay_ready_queue_items{kind=\"image\"} " << queued_image << "\n";
    oss << "zplay_ready_queue_items{kind=\"audio\"} " << queued_audio << "\n";

    oss << "\n# HELP zplay_preroll_in_flight Engines in the preroll working set\n";
    oss << "# TYPE zplay_preroll_in_flight gauge\n";
    oss << "zplay_preroll_in_flight " << preroll_in_flight << "\n";

    oss << "\n# HELP zplay_dedup_entries Paths currently marked outstanding\n";
    oss << "# TYPE zplay_dedup_entries gauge\n";
    oss << "zplay_dedup_entries " << dedup_size << "\n";

    oss << "\n# HELP zplay_dedup_capacity Dedup cache horizon\n";
    oss << "# TYPE zplay_dedup_capacity gauge\n";
    oss << "zplay_dedup_capacity " << dedup_capacity << "\n";

    oss << "\n# HELP zplay_roots Configured media roots\n";
    oss << "# TYPE zplay_roots gauge\n";
    oss << "zplay_roots{enabled=\"true\"} " << roots_enabled << "\n";
    oss << "zplay_roots{enabled=\"false\"} " << roots_disabled << "\n";

    oss << "\n# HELP zplay_scan_samples_total Samples returned by the sampler\n";
    oss << "# TYPE zplay_scan_samples_total counter\n";
    oss << "zplay_scan_samples_total " << counters.sampled << "\n";

    oss << "\n# HELP zplay_scan_misses_total Scans that found nothing in time\n";
    oss << "# TYPE zplay_scan_misses_total counter\n";
    oss << "zplay_scan_misses_total " << counters.scan_misses << "\n";

    oss << "\n# HELP zplay_candidates_total Candidates by outcome\n";
    oss << "# TYPE zplay_candidates_total counter\n";
    oss << "zplay_candidates_total{outcome=\"duplicate\"} " << counters.duplicates << "\n";
    oss << "zplay_candidates_total{outcome=\"admitted\"} " << counters.admitted << "\n";
    oss << "zplay_candidates_total{outcome=\"queued\"} " << counters.queued << "\n";
    oss << "zplay_candidates_total{outcome=\"discarded\"} " << counters.discarded << "\n";
    oss << "zplay_candidates_total{outcome=\"evicted\"} " << counters.evicted << "\n";
    oss << "zplay_candidates_total{outcome=\"taken\"} " << counters.taken << "\n";
    oss << "zplay_candidates_total{outcome=\"cleared\"} " << counters.cleared << "\n";

    oss << "\n# HELP zplay_engines_live Engines owned by pool workers\n";
    oss << "# TYPE zplay_engines_live gauge\n";
    oss << "zplay_engines_live " << engines_live << "\n";

    oss << "\n# HELP zplay_worker_engines Engines owned per worker\n";
    oss << "# TYPE zplay_worker_engines gauge\n";
    for (size_t i = 0; i < engines_per_worker.size(); ++i) {
      oss << "zplay_worker_engines{worker=\"" << i << "\"} " << engines_per_worker[i] << "\n";
    }

    oss << "\n# HELP zplay_playback_active Whether the front has a current item\n";
    oss << "# TYPE zplay_playback_active gauge\n";
    oss << "zplay_playback_active " << (playing ? 1 : 0) << "\n";

    oss << "\n# HELP zplay_playback_rate Current playback rate\n";
    oss << "# TYPE zplay_playback_rate gauge\n";
    oss << "zplay_playback_rate " << playback_rate << "\n";

    oss << "\n# HELP zplay_items_played_total Items started by the playback front\n";
    oss << "# TYPE zplay_items_played_total counter\n";
    oss << "zplay_items_played_total " << items_played << "\n";

    return oss.str();
  }
};

}  // namespace zplay::telemetry

#endif  // ZPLAY_TELEMETRY_SUPPLY_METRICS_HPP_
