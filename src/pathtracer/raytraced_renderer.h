#ifndef LUMINA_RAYTRACED_RENDERER_H
#define LUMINA_RAYTRACED_RENDERER_H

#include "framebuffer.h"
#include "pathtracer.h"
#include "render_config.h"

#include "scene/scene.h"
#include "util/work_queue.h"

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace Lumina {

// A tile whose rendering threw. The rectangle is [x0, x1) x [y0, y1).
struct TileFailure {
  size_t x0, y0, x1, y1;
  std::string message;
  int pass;
};

struct RenderReport {

  RenderReport()
      : cancelled(false), timed_out(false), total_samples(0),
        degenerate_samples(0), seconds(0) {}

  // True when every tile finished all its passes.
  bool ok() const { return !cancelled && !timed_out && failed_tiles.empty(); }

  bool cancelled;
  bool timed_out;
  std::vector<TileFailure> failed_tiles;
  size_t total_samples;
  size_t degenerate_samples;
  double seconds;
};

/**
 * Renders a built scene into a framebuffer with a pool of worker threads
 * pulling square tiles from a shared queue. Adaptive renders run a second
 * pass once every tile has finished the first one.
 */
class RaytracedRenderer : private SampleObserver {
 public:
  explicit RaytracedRenderer(const RenderConfig& config);

  /**
   * Render the scene. Throws ConfigurationError for an invalid
   * configuration, an unbuilt scene or a scene without camera; every other
   * failure is reported per tile in the returned report.
   */
  RenderReport render(const Scene& scene);

  /**
   * Ask the running render to stop. Workers notice before their next
   * camera sample. A cancel issued while no render is running stops the
   * next one as soon as it starts.
   */
  void cancel() { cancel_requested = true; }

  // Pixel samples drawn so far in the current render.
  size_t completed_samples() const { return samples_done.load(); }

  const Framebuffer& get_framebuffer() const { return framebuffer; }
  const RenderConfig& get_config() const { return config; }

 private:
  struct WorkItem {
    WorkItem() : tile(0), x0(0), y0(0), x1(0), y1(0) {}
    WorkItem(size_t tile, size_t x0, size_t y0, size_t x1, size_t y1)
        : tile(tile), x0(x0), y0(y0), x1(x1), y1(y1) {}

    size_t tile;
    size_t x0, y0, x1, y1;
  };

  void run_pass(int pass, const PathTracer& pt);
  void worker_thread(int pass, const PathTracer* pt);
  void render_tile(const WorkItem& item, int pass, const PathTracer& pt,
                   PathStats* stats);
  void record_failure(const WorkItem& item, int pass,
                      const std::string& message);
  bool should_stop() override;
  void sample_drawn() override;

  RenderConfig config;
  Framebuffer framebuffer;

  std::vector<WorkItem> tiles;
  std::vector<char> tile_failed;
  WorkQueue<WorkItem> work_queue;

  std::atomic<size_t> samples_done;
  std::atomic<bool> cancel_requested;
  std::atomic<bool> timed_out;
  // set when a pass could not start all of its workers
  std::atomic<bool> aborted;

  bool has_deadline;
  std::chrono::steady_clock::time_point deadline;

  std::mutex report_mutex;
  RenderReport report;
};

} // namespace Lumina

#endif // LUMINA_RAYTRACED_RENDERER_H
