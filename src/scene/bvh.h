#ifndef LUMINA_SCENE_BVH_H
#define LUMINA_SCENE_BVH_H

#include "primitive.h"

#include <cstdint>
#include <string>
#include <vector>

namespace Lumina {
namespace SceneObjects {

/**
 * A node of the BVH. Nodes live in a flat array; children are referenced by
 * index and always come after their parent. A node with count > 0 is a leaf
 * owning primitives [start, start + count).
 */
struct BVHNode {

  BVHNode() : l(0), r(0), start(0), count(0), axis(0) {}

  BVHNode(BBox bb) : bb(bb), l(0), r(0), start(0), count(0), axis(0) {}

  inline bool is_leaf() const { return count > 0; }

  BBox bb;         ///< bounding box of the node
  uint32_t l;      ///< left child index
  uint32_t r;      ///< right child index
  uint32_t start;  ///< first primitive of a leaf
  uint32_t count;  ///< number of primitives of a leaf
  int axis;        ///< split axis of an interior node
};

enum class SplitMethod { SAH, MEDIAN };

struct BVHBuildParams {
  size_t max_leaf_size = 4;
  SplitMethod split_method = SplitMethod::SAH;
  // Subtrees with more primitives than this build their children on
  // separate threads.
  size_t parallel_threshold = 4096;
  bool verbose = false;
};

/**
 * Bounding Volume Hierarchy for fast Ray - Primitive intersection.
 * The primitives are not owned; they must outlive the BVH.
 */
class BVHAccel {
 public:

  /**
   * Build the hierarchy. Throws BuildError when the list is empty.
   */
  BVHAccel(const std::vector<const Primitive*>& primitives,
           const BVHBuildParams& params = BVHBuildParams());

  BBox get_bbox() const;

  /**
   * Nearest hit along the ray. On a hit the intersection record is filled
   * in and ray.max_t is shrunk to the hit distance.
   */
  bool intersect(const Ray& ray, Intersection* i) const;

  /**
   * Any hit along the ray. Returns as soon as one primitive is hit.
   */
  bool has_intersection(const Ray& ray) const;

  size_t num_nodes() const { return nodes.size(); }
  size_t num_leaves() const;
  size_t depth() const;

  const std::vector<BVHNode>& get_nodes() const { return nodes; }

  // Primitives in leaf order.
  const std::vector<const Primitive*>& get_primitives() const {
    return primitives;
  }

  /**
   * Check the structural invariants: node boxes equal the union of their
   * children or primitives, children follow their parent, and every
   * primitive sits in exactly one leaf. On failure a description is written
   * to *error when it is not null.
   */
  bool validate(std::string* error = NULL) const;

 private:
  struct BuildItem {
    const Primitive* primitive;
    BBox bb;
    Vector3D centroid;
  };

  uint32_t construct_bvh(std::vector<BVHNode>& out, size_t start, size_t end,
                         int depth);

  size_t split_sah(size_t start, size_t end, int axis,
                   const BBox& centroid_bounds);
  size_t split_median(size_t start, size_t end, int axis);

  BVHBuildParams params;
  std::vector<BuildItem> items;  ///< scratch space, only used while building
  std::vector<const Primitive*> primitives;
  std::vector<BVHNode> nodes;
};

} // namespace SceneObjects
} // namespace Lumina

#endif // LUMINA_SCENE_BVH_H
