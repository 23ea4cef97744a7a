#include "raytraced_renderer.h"

#include "util/error.h"
#include "util/worker_group.h"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <system_error>
#include <thread>

namespace Lumina {

RaytracedRenderer::RaytracedRenderer(const RenderConfig& config)
    : config(config), samples_done(0), cancel_requested(false),
      timed_out(false), aborted(false), has_deadline(false) {}

RenderReport RaytracedRenderer::render(const Scene& scene) {
  config.validate();
  if (!scene.is_built()) {
    throw ConfigurationError("scene must be built before rendering");
  }
  if (!scene.get_camera()) {
    throw ConfigurationError("scene has no camera");
  }

  auto t_start = std::chrono::steady_clock::now();

  Camera camera = *scene.get_camera();
  camera.set_screen_size(config.width, config.height);
  PathTracer pt(&scene, &camera, config);

  framebuffer.resize(config.width, config.height, config.aux_buffers);
  report = RenderReport();
  samples_done = 0;
  timed_out = false;
  aborted = false;

  has_deadline = config.time_limit_seconds > 0;
  if (has_deadline) {
    deadline = t_start + std::chrono::duration_cast<
                             std::chrono::steady_clock::duration>(
                             std::chrono::duration<double>(
                                 config.time_limit_seconds));
  }

  tiles.clear();
  for (size_t y = 0; y < config.height; y += config.tile_size) {
    for (size_t x = 0; x < config.width; x += config.tile_size) {
      tiles.push_back(WorkItem(tiles.size(), x, y,
                               std::min(x + config.tile_size, config.width),
                               std::min(y + config.tile_size,
                                        config.height)));
    }
  }
  tile_failed.assign(tiles.size(), 0);

  run_pass(1, pt);
  // joining the pass 1 workers is the barrier before refinement
  if (config.adaptive && !should_stop()) run_pass(2, pt);

  // a cancel is consumed by the render it stopped
  report.cancelled = cancel_requested.exchange(false);
  report.timed_out = timed_out;
  report.seconds = std::chrono::duration<double>(
                       std::chrono::steady_clock::now() - t_start).count();

  if (config.verbose) {
    printf("[Renderer] Rendered %zux%zu with %zu samples (%zu degenerate) "
           "in %.3f sec\n",
           config.width, config.height, report.total_samples,
           report.degenerate_samples, report.seconds);
    if (report.cancelled) printf("[Renderer] Render cancelled\n");
    if (report.timed_out) printf("[Renderer] Time limit reached\n");
  }
  return report;
}

void RaytracedRenderer::run_pass(int pass, const PathTracer& pt) {
  work_queue.clear();
  for (const WorkItem& item : tiles) {
    if (!tile_failed[item.tile]) work_queue.put_work(item);
  }

  size_t num_threads = config.num_threads;
  if (num_threads == 0) {
    num_threads = std::max(1u, std::thread::hardware_concurrency());
  }

  if (config.verbose) {
    printf("[Renderer] Pass %d: %zu tiles on %zu threads\n", pass,
           tiles.size(), num_threads);
  }

  WorkerGroup workers;
  try {
    for (size_t i = 0; i < num_threads; ++i) {
      workers.spawn(&RaytracedRenderer::worker_thread, this, pass, &pt);
    }
  } catch (const std::system_error& e) {
    // stop the workers already running; the group joins them on unwind
    aborted = true;
    printf("[Renderer] Could not start worker thread: %s\n", e.what());
    throw;
  }
  workers.join_all();
}

void RaytracedRenderer::worker_thread(int pass, const PathTracer* pt) {
  PathStats stats;
  WorkItem item;
  while (!should_stop() && work_queue.try_get_work(&item)) {
    try {
      render_tile(item, pass, *pt, &stats);
    } catch (const std::exception& e) {
      record_failure(item, pass, e.what());
    } catch (...) {
      record_failure(item, pass, "unknown exception");
    }
  }

  std::lock_guard<std::mutex> lock(report_mutex);
  report.total_samples += stats.samples;
  report.degenerate_samples += stats.degenerate;
}

void RaytracedRenderer::record_failure(const WorkItem& item, int pass,
                                       const std::string& message) {
  std::lock_guard<std::mutex> lock(report_mutex);
  tile_failed[item.tile] = 1;
  for (size_t y = item.y0; y < item.y1; ++y) {
    for (size_t x = item.x0; x < item.x1; ++x) {
      framebuffer.mark_failed(x, y);
    }
  }
  TileFailure failure = { item.x0, item.y0, item.x1, item.y1, message,
                          pass };
  report.failed_tiles.push_back(failure);
  if (config.verbose) {
    printf("[Renderer] Tile (%zu, %zu)-(%zu, %zu) failed in pass %d: %s\n",
           item.x0, item.y0, item.x1, item.y1, pass, message.c_str());
  }
}

void RaytracedRenderer::render_tile(const WorkItem& item, int pass,
                                    const PathTracer& pt, PathStats* stats) {
  for (size_t y = item.y0; y < item.y1; ++y) {
    for (size_t x = item.x0; x < item.x1; ++x) {
      if (should_stop()) return;
      if (pass == 1) {
        size_t n = config.adaptive ? config.min_samples
                                   : config.samples_per_pixel;
        pt.raytrace_pixel(x, y, n, &framebuffer, stats, this);
      } else {
        pt.raytrace_pixel_adaptive(x, y, &framebuffer, stats, this);
      }
    }
  }
}

bool RaytracedRenderer::should_stop() {
  if (cancel_requested || aborted) return true;
  if (timed_out) return true;
  if (has_deadline && std::chrono::steady_clock::now() >= deadline) {
    timed_out = true;
    return true;
  }
  return false;
}

void RaytracedRenderer::sample_drawn() {
  samples_done.fetch_add(1, std::memory_order_relaxed);
}

} // namespace Lumina
