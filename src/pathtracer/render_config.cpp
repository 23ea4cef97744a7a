#include "render_config.h"

#include "util/error.h"

#include <sstream>

namespace Lumina {

void RenderConfig::validate() const {
  if (width == 0 || height == 0) {
    std::ostringstream msg;
    msg << "image size must be non zero, got " << width << "x" << height;
    throw ConfigurationError(msg.str());
  }
  if (tile_size == 0) {
    throw ConfigurationError("tile size must be non zero");
  }
  if (adaptive) {
    if (min_samples == 0 || max_samples == 0) {
      throw ConfigurationError("adaptive sample counts must be non zero");
    }
    if (min_samples > max_samples) {
      std::ostringstream msg;
      msg << "min_samples (" << min_samples << ") exceeds max_samples ("
          << max_samples << ")";
      throw ConfigurationError(msg.str());
    }
    if (samples_per_batch == 0) {
      throw ConfigurationError("samples per batch must be non zero");
    }
    if (!(max_tolerance >= 0)) {
      throw ConfigurationError("max tolerance must be >= 0");
    }
  } else if (samples_per_pixel == 0) {
    throw ConfigurationError("samples per pixel must be non zero");
  }
  if (!(time_limit_seconds >= 0)) {
    throw ConfigurationError("time limit must be >= 0");
  }
}

} // namespace Lumina
