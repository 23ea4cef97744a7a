#include "bvh.h"

#include "util/error.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <future>
#include <sstream>

namespace Lumina {
namespace SceneObjects {

static const int kNumBuckets = 12;
static const int kStackSize = 128;
// Beyond this depth splits fall back to the median so the depth stays
// logarithmic and fits the traversal stack.
static const int kMaxSahDepth = 48;

BVHAccel::BVHAccel(const std::vector<const Primitive*>& _primitives,
                   const BVHBuildParams& params)
    : params(params) {

  if (_primitives.empty()) {
    throw BuildError("cannot build a BVH over an empty primitive list");
  }
  if (this->params.max_leaf_size == 0) this->params.max_leaf_size = 1;

  auto t_start = std::chrono::steady_clock::now();

  items.reserve(_primitives.size());
  for (const Primitive* p : _primitives) {
    BuildItem item;
    item.primitive = p;
    item.bb = p->get_bbox();
    item.centroid = item.bb.centroid();
    items.push_back(item);
  }

  nodes.reserve(2 * items.size() / this->params.max_leaf_size + 1);
  construct_bvh(nodes, 0, items.size(), 0);

  primitives.reserve(items.size());
  for (const BuildItem& item : items) primitives.push_back(item.primitive);
  items.clear();
  items.shrink_to_fit();

  if (this->params.verbose) {
    double ms = std::chrono::duration<double, std::milli>(
                    std::chrono::steady_clock::now() - t_start).count();
    printf("[BVH] Built over %zu primitives: %zu nodes, %zu leaves, depth "
           "%zu (%.2f ms)\n",
           primitives.size(), nodes.size(), num_leaves(), depth(), ms);
  }
}

BBox BVHAccel::get_bbox() const { return nodes[0].bb; }

size_t BVHAccel::num_leaves() const {
  size_t n = 0;
  for (const BVHNode& node : nodes) {
    if (node.is_leaf()) n++;
  }
  return n;
}

size_t BVHAccel::depth() const {
  // children always follow their parent, so one forward sweep suffices
  std::vector<size_t> level(nodes.size(), 1);
  size_t deepest = 0;
  for (size_t i = 0; i < nodes.size(); ++i) {
    deepest = std::max(deepest, level[i]);
    if (!nodes[i].is_leaf()) {
      level[nodes[i].l] = level[i] + 1;
      level[nodes[i].r] = level[i] + 1;
    }
  }
  return deepest;
}

uint32_t BVHAccel::construct_bvh(std::vector<BVHNode>& out, size_t start,
                                 size_t end, int depth) {

  BBox bbox;
  BBox centroid_bounds;
  for (size_t i = start; i < end; ++i) {
    bbox.expand(items[i].bb);
    centroid_bounds.expand(items[i].centroid);
  }

  uint32_t index = (uint32_t)out.size();
  out.push_back(BVHNode(bbox));

  size_t count = end - start;
  if (count <= params.max_leaf_size) {
    out[index].start = (uint32_t)start;
    out[index].count = (uint32_t)count;
    return index;
  }

  int axis = centroid_bounds.max_extent_axis();

  size_t mid;
  if (centroid_bounds.extent[axis] <= 0) {
    // all centroids coincide, split by count
    mid = start + count / 2;
  } else if (params.split_method == SplitMethod::SAH &&
             depth <= kMaxSahDepth) {
    mid = split_sah(start, end, axis, centroid_bounds);
  } else {
    mid = split_median(start, end, axis);
  }
  out[index].axis = axis;

  uint32_t left, right;
  if (count > params.parallel_threshold) {
    // The right half builds into its own arena on another thread and is
    // appended once both halves are done.
    std::vector<BVHNode> right_nodes;
    std::future<uint32_t> right_root =
        std::async(std::launch::async, [&]() {
          return construct_bvh(right_nodes, mid, end, depth + 1);
        });
    left = construct_bvh(out, start, mid, depth + 1);
    uint32_t local_root = right_root.get();

    uint32_t offset = (uint32_t)out.size();
    for (BVHNode node : right_nodes) {
      if (!node.is_leaf()) {
        node.l += offset;
        node.r += offset;
      }
      out.push_back(node);
    }
    right = offset + local_root;
  } else {
    left = construct_bvh(out, start, mid, depth + 1);
    right = construct_bvh(out, mid, end, depth + 1);
  }

  out[index].l = left;
  out[index].r = right;
  return index;
}

size_t BVHAccel::split_sah(size_t start, size_t end, int axis,
                           const BBox& centroid_bounds) {

  struct Bucket {
    Bucket() : count(0) {}
    size_t count;
    BBox bb;
  };
  Bucket buckets[kNumBuckets];

  double lo = centroid_bounds.min[axis];
  double scale = kNumBuckets / centroid_bounds.extent[axis];
  auto bucket_of = [&](const BuildItem& item) {
    int b = (int)((item.centroid[axis] - lo) * scale);
    return std::max(0, std::min(kNumBuckets - 1, b));
  };

  for (size_t i = start; i < end; ++i) {
    Bucket& b = buckets[bucket_of(items[i])];
    b.count++;
    b.bb.expand(items[i].bb);
  }

  // sweep from the right to get the suffix areas, then from the left
  double right_area[kNumBuckets];
  size_t right_count[kNumBuckets];
  BBox acc;
  size_t n = 0;
  for (int b = kNumBuckets - 1; b > 0; --b) {
    acc.expand(buckets[b].bb);
    n += buckets[b].count;
    right_area[b] = acc.surface_area();
    right_count[b] = n;
  }

  int best = -1;
  double best_cost = INF_D;
  acc = BBox();
  n = 0;
  for (int b = 0; b < kNumBuckets - 1; ++b) {
    acc.expand(buckets[b].bb);
    n += buckets[b].count;
    if (n == 0 || right_count[b + 1] == 0) continue;
    double cost = n * acc.surface_area() +
                  right_count[b + 1] * right_area[b + 1];
    if (cost < best_cost) {
      best_cost = cost;
      best = b;
    }
  }

  if (best < 0) return split_median(start, end, axis);

  auto it = std::partition(
      items.begin() + start, items.begin() + end,
      [&](const BuildItem& item) { return bucket_of(item) <= best; });
  size_t mid = it - items.begin();
  if (mid == start || mid == end) return split_median(start, end, axis);
  return mid;
}

size_t BVHAccel::split_median(size_t start, size_t end, int axis) {
  size_t mid = start + (end - start) / 2;
  std::nth_element(items.begin() + start, items.begin() + mid,
                   items.begin() + end,
                   [axis](const BuildItem& a, const BuildItem& b) {
                     return a.centroid[axis] < b.centroid[axis];
                   });
  return mid;
}

bool BVHAccel::intersect(const Ray& ray, Intersection* i) const {

  uint32_t stack[kStackSize];
  int top = 0;
  stack[top++] = 0;
  bool hit = false;

  while (top > 0) {
    const BVHNode& node = nodes[stack[--top]];

    // ray.max_t shrinks with every hit, pruning farther boxes
    double t0 = ray.min_t, t1 = ray.max_t;
    if (!node.bb.intersect(ray, t0, t1)) continue;

    if (node.is_leaf()) {
      for (uint32_t p = node.start; p < node.start + node.count; ++p) {
        if (primitives[p]->intersect(ray, i)) hit = true;
      }
    } else if (ray.sign[node.axis]) {
      // direction is negative on the split axis, the right child is nearer
      stack[top++] = node.l;
      stack[top++] = node.r;
    } else {
      stack[top++] = node.r;
      stack[top++] = node.l;
    }
  }

  return hit;
}

bool BVHAccel::has_intersection(const Ray& ray) const {

  uint32_t stack[kStackSize];
  int top = 0;
  stack[top++] = 0;

  while (top > 0) {
    const BVHNode& node = nodes[stack[--top]];

    double t0 = ray.min_t, t1 = ray.max_t;
    if (!node.bb.intersect(ray, t0, t1)) continue;

    if (node.is_leaf()) {
      for (uint32_t p = node.start; p < node.start + node.count; ++p) {
        if (primitives[p]->has_intersection(ray)) return true;
      }
    } else {
      stack[top++] = node.r;
      stack[top++] = node.l;
    }
  }

  return false;
}

bool BVHAccel::validate(std::string* error) const {
  std::ostringstream msg;
  std::vector<int> seen(primitives.size(), 0);

  for (size_t i = 0; i < nodes.size() && msg.str().empty(); ++i) {
    const BVHNode& node = nodes[i];
    BBox expected;
    if (node.is_leaf()) {
      if (node.start + node.count > primitives.size()) {
        msg << "leaf " << i << " range out of bounds";
        break;
      }
      for (uint32_t p = node.start; p < node.start + node.count; ++p) {
        expected.expand(primitives[p]->get_bbox());
        seen[p]++;
      }
    } else {
      if (node.l <= i || node.r <= i || node.l >= nodes.size() ||
          node.r >= nodes.size()) {
        msg << "node " << i << " has invalid children " << node.l << ", "
            << node.r;
        break;
      }
      expected.expand(nodes[node.l].bb);
      expected.expand(nodes[node.r].bb);
    }
    if (!node.bb.equals(expected, 1e-9)) {
      msg << "node " << i << " box " << node.bb
          << " differs from the union " << expected;
    }
  }

  for (size_t p = 0; p < seen.size() && msg.str().empty(); ++p) {
    if (seen[p] != 1) {
      msg << "primitive " << p << " is in " << seen[p] << " leaves";
    }
  }

  if (msg.str().empty()) return true;
  if (error) *error = msg.str();
  return false;
}

} // namespace SceneObjects
} // namespace Lumina
