#include "scene/primitive.h"
#include "pathtracer/bsdf.h"
#include "pathtracer/medium.h"
#include "util/random_util.h"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

using namespace Lumina;
using namespace Lumina::SceneObjects;

namespace {

const double kTol = 1e-9;

void expect_vec_near(const Vector3D& a, const Vector3D& b, double tol) {
  EXPECT_NEAR(a.x, b.x, tol);
  EXPECT_NEAR(a.y, b.y, tol);
  EXPECT_NEAR(a.z, b.z, tol);
}

} // namespace

TEST(SphereTest, HitsFromOutside) {
  Sphere s(Vector3D(0, 0, 0), 1.0);
  Ray r(Vector3D(0, 0, 5), Vector3D(0, 0, -1));
  Intersection isect;
  ASSERT_TRUE(s.intersect(r, &isect));
  EXPECT_NEAR(isect.t, 4.0, kTol);
  EXPECT_NEAR(r.max_t, 4.0, kTol);
  expect_vec_near(isect.p, Vector3D(0, 0, 1), kTol);
  expect_vec_near(isect.n, Vector3D(0, 0, 1), kTol);
  EXPECT_TRUE(isect.front_face);
}

TEST(SphereTest, HitsFromInsideOnBackFace) {
  Sphere s(Vector3D(0, 0, 0), 1.0);
  Ray r(Vector3D(0, 0, 0), Vector3D(1, 0, 0));
  Intersection isect;
  ASSERT_TRUE(s.intersect(r, &isect));
  EXPECT_NEAR(isect.t, 1.0, kTol);
  expect_vec_near(isect.n, Vector3D(1, 0, 0), kTol);
  EXPECT_FALSE(isect.front_face);
}

TEST(SphereTest, OcclusionQueryKeepsRayRange) {
  Sphere s(Vector3D(0, 0, 0), 1.0);
  Ray r(Vector3D(0, 0, 5), Vector3D(0, 0, -1));
  EXPECT_TRUE(s.has_intersection(r));
  EXPECT_EQ(r.max_t, INF_D);

  Ray short_ray(Vector3D(0, 0, 5), Vector3D(0, 0, -1), 3.0, 0.0);
  EXPECT_FALSE(s.has_intersection(short_ray));
}

TEST(SphereTest, MovingSphereFollowsTime) {
  Sphere s(Vector3D(0, 0, 0), Vector3D(2, 0, 0), 0.0, 1.0, 0.5);
  Ray late(Vector3D(2, 0, 5), Vector3D(0, 0, -1), 1.0);
  Intersection isect;
  ASSERT_TRUE(s.intersect(late, &isect));
  EXPECT_NEAR(isect.t, 4.5, kTol);

  Ray early(Vector3D(2, 0, 5), Vector3D(0, 0, -1), 0.0);
  EXPECT_FALSE(s.has_intersection(early));

  BBox bb = s.get_bbox();
  EXPECT_TRUE(bb.contains(BBox(Vector3D(-0.5, -0.5, -0.5),
                               Vector3D(2.5, 0.5, 0.5)), kTol));
}

TEST(PlaneTest, HitAndParallelMiss) {
  Plane plane(Vector3D(0, 0, 0), Vector3D(0, 2, 0));
  Ray r(Vector3D(0.25, 1, 3.5), Vector3D(0, -1, 0));
  Intersection isect;
  ASSERT_TRUE(plane.intersect(r, &isect));
  EXPECT_NEAR(isect.t, 1.0, kTol);
  expect_vec_near(isect.n, Vector3D(0, 1, 0), kTol);

  Ray parallel(Vector3D(0, 1, 0), Vector3D(1, 0, 0));
  EXPECT_FALSE(plane.has_intersection(parallel));
}

TEST(TriangleTest, BarycentricHit) {
  Triangle tri(Vector3D(0, 0, 0), Vector3D(1, 0, 0), Vector3D(0, 1, 0));
  Ray r(Vector3D(0.25, 0.25, 1), Vector3D(0, 0, -1));
  Intersection isect;
  ASSERT_TRUE(tri.intersect(r, &isect));
  EXPECT_NEAR(isect.t, 1.0, kTol);
  EXPECT_NEAR(isect.uv.x, 0.25, kTol);
  EXPECT_NEAR(isect.uv.y, 0.25, kTol);
  expect_vec_near(isect.n, Vector3D(0, 0, 1), kTol);

  Ray miss(Vector3D(1, 1, 1), Vector3D(0, 0, -1));
  EXPECT_FALSE(tri.has_intersection(miss));
}

TEST(TriangleTest, InterpolatesVertexData) {
  Vector3D n1 = Vector3D(-1, 0, 1).unit();
  Vector3D n2 = Vector3D(1, 0, 1).unit();
  Vector3D n3(0, 0, 1);
  Triangle tri(Vector3D(0, 0, 0), Vector3D(1, 0, 0), Vector3D(0, 1, 0), n1,
               n2, n3);
  tri.set_uvs(Vector2D(0, 0), Vector2D(2, 0), Vector2D(0, 2));

  Ray r(Vector3D(0.5, 0.0, 1), Vector3D(0, 0, -1));
  Intersection isect;
  ASSERT_TRUE(tri.intersect(r, &isect));
  // halfway between n1 and n2
  expect_vec_near(isect.shading_n, Vector3D(0, 0, 1), 1e-9);
  expect_vec_near(isect.n, Vector3D(0, 0, 1), kTol);
  EXPECT_NEAR(isect.uv.x, 1.0, kTol);
  EXPECT_NEAR(isect.uv.y, 0.0, kTol);

  EXPECT_TRUE(tri.get_bbox().contains(
      BBox(Vector3D(0, 0, 0), Vector3D(1, 1, 0))));
}

TEST(BoxTest, FaceNormals) {
  Box box(Vector3D(1, 1, 1), Vector3D(-1, -1, -1));
  Ray r(Vector3D(0.2, 0.3, 5), Vector3D(0, 0, -1));
  Intersection isect;
  ASSERT_TRUE(box.intersect(r, &isect));
  EXPECT_NEAR(isect.t, 4.0, kTol);
  expect_vec_near(isect.n, Vector3D(0, 0, 1), kTol);
  EXPECT_TRUE(isect.front_face);

  Ray inside(Vector3D(0, 0, 0), Vector3D(0, -1, 0));
  Intersection back;
  ASSERT_TRUE(box.intersect(inside, &back));
  EXPECT_NEAR(back.t, 1.0, kTol);
  expect_vec_near(back.n, Vector3D(0, -1, 0), kTol);
  EXPECT_FALSE(back.front_face);

  Ray miss(Vector3D(2, 0, 5), Vector3D(0, 0, -1));
  EXPECT_FALSE(box.has_intersection(miss));
}

TEST(CylinderTest, SideAndCaps) {
  Cylinder cyl(Vector3D(0, 0, 0), Vector3D(0, 1, 0), 1.0, 2.0);

  Ray side(Vector3D(5, 1, 0), Vector3D(-1, 0, 0));
  Intersection isect;
  ASSERT_TRUE(cyl.intersect(side, &isect));
  EXPECT_NEAR(isect.t, 4.0, kTol);
  expect_vec_near(isect.n, Vector3D(1, 0, 0), kTol);

  Ray top(Vector3D(0.3, 5, 0.2), Vector3D(0, -1, 0));
  Intersection cap;
  ASSERT_TRUE(cyl.intersect(top, &cap));
  EXPECT_NEAR(cap.t, 3.0, kTol);
  expect_vec_near(cap.n, Vector3D(0, 1, 0), kTol);

  Ray above(Vector3D(5, 3, 0), Vector3D(-1, 0, 0));
  EXPECT_FALSE(cyl.has_intersection(above));
}

TEST(CylinderTest, TiltedBoundsContainRims) {
  Vector3D axis = Vector3D(1, 1, 0).unit();
  Cylinder cyl(Vector3D(1, 2, 3), axis, 0.5, 2.0);
  BBox bb = cyl.get_bbox();

  Vector3D a = Vector3D(0, 0, 1);
  Vector3D b = cross(axis, a);
  for (int i = 0; i < 32; ++i) {
    double phi = 2.0 * PI * i / 32;
    Vector3D rim = 0.5 * (std::cos(phi) * a + std::sin(phi) * b);
    EXPECT_TRUE(bb.contains(BBox(cyl.base + rim), 1e-9));
    EXPECT_TRUE(bb.contains(BBox(cyl.base + 2.0 * axis + rim), 1e-9));
  }
}

TEST(ConeTest, SlantAndBase) {
  Cone cone(Vector3D(0, 0, 0), Vector3D(0, 1, 0), 1.0, 1.0);

  Ray side(Vector3D(5, 0.5, 0), Vector3D(-1, 0, 0));
  Intersection isect;
  ASSERT_TRUE(cone.intersect(side, &isect));
  EXPECT_NEAR(isect.t, 4.5, kTol);
  expect_vec_near(isect.n, Vector3D(1, 1, 0).unit(), 1e-9);

  Ray from_top(Vector3D(0.2, 5, 0), Vector3D(0, -1, 0));
  Intersection slant;
  ASSERT_TRUE(cone.intersect(from_top, &slant));
  EXPECT_NEAR(slant.t, 4.2, 1e-9);

  Ray from_below(Vector3D(0.1, -5, 0), Vector3D(0, 1, 0));
  Intersection base;
  ASSERT_TRUE(cone.intersect(from_below, &base));
  EXPECT_NEAR(base.t, 5.0, kTol);
  expect_vec_near(base.n, Vector3D(0, -1, 0), kTol);

  // passes above the apex
  Ray miss(Vector3D(5, 1.5, 0), Vector3D(-1, 0, 0));
  EXPECT_FALSE(cone.has_intersection(miss));
}

TEST(QuadTest, ParallelogramCoordinates) {
  Quad quad(Vector3D(0, 0, 0), Vector3D(2, 0, 0), Vector3D(0, 1, 0));
  EXPECT_NEAR(quad.area(), 2.0, kTol);

  Ray front(Vector3D(0.5, 0.25, 1), Vector3D(0, 0, -1));
  Intersection isect;
  ASSERT_TRUE(quad.intersect(front, &isect));
  EXPECT_NEAR(isect.t, 1.0, kTol);
  EXPECT_NEAR(isect.uv.x, 0.25, kTol);
  EXPECT_NEAR(isect.uv.y, 0.25, kTol);
  EXPECT_TRUE(isect.front_face);

  Ray back(Vector3D(0.5, 0.25, -1), Vector3D(0, 0, 1));
  Intersection back_isect;
  ASSERT_TRUE(quad.intersect(back, &back_isect));
  EXPECT_FALSE(back_isect.front_face);

  Ray outside(Vector3D(2.5, 0.5, 1), Vector3D(0, 0, -1));
  EXPECT_FALSE(quad.has_intersection(outside));
}

TEST(PrimitiveTest, FillsMaterialAndPrimitive) {
  BSDF white = BSDF::lambertian(Vector3D(1, 1, 1));
  Primitive p(Sphere(Vector3D(0, 0, 0), 1.0), &white);
  Ray r(Vector3D(0, 0, 5), Vector3D(0, 0, -1));
  Intersection isect;
  ASSERT_TRUE(p.intersect(r, &isect));
  EXPECT_EQ(isect.primitive, &p);
  EXPECT_EQ(isect.bsdf, &white);
  EXPECT_TRUE(p.is_bounded());
  EXPECT_EQ(p.get_light_index(), -1);
  EXPECT_EQ(p.get_type(), Primitive::Type::SPHERE);
  EXPECT_DOUBLE_EQ(p.as_sphere().r, 1.0);
}

TEST(PrimitiveTest, EveryShapeConstructorSetsTagAndDefaults) {
  BSDF white = BSDF::lambertian(Vector3D(1, 1, 1));
  Medium fog = Medium::fog(0.5, Vector3D(1, 1, 1));
  std::vector<Primitive> prims;
  prims.push_back(Primitive(Sphere(Vector3D(0, 0, 0), 1.0), &white, &fog));
  prims.push_back(Primitive(Plane(Vector3D(0, 0, 0), Vector3D(0, 1, 0)),
                            &white, &fog));
  prims.push_back(Primitive(
      Triangle(Vector3D(0, 0, 0), Vector3D(1, 0, 0), Vector3D(0, 1, 0)),
      &white, &fog));
  prims.push_back(Primitive(Box(Vector3D(0, 0, 0), Vector3D(1, 1, 1)),
                            &white, &fog));
  prims.push_back(Primitive(
      Cylinder(Vector3D(0, 0, 0), Vector3D(0, 1, 0), 0.5, 1.0), &white,
      &fog));
  prims.push_back(Primitive(
      Cone(Vector3D(0, 0, 0), Vector3D(0, 1, 0), 0.5, 1.0), &white, &fog));
  prims.push_back(Primitive(
      Quad(Vector3D(0, 0, 0), Vector3D(1, 0, 0), Vector3D(0, 1, 0)), &white,
      &fog));

  const Primitive::Type expected[] = {
      Primitive::Type::SPHERE, Primitive::Type::PLANE,
      Primitive::Type::TRIANGLE, Primitive::Type::BOX,
      Primitive::Type::CYLINDER, Primitive::Type::CONE,
      Primitive::Type::QUAD};
  ASSERT_EQ(prims.size(), 7u);
  for (size_t i = 0; i < prims.size(); ++i) {
    EXPECT_EQ(prims[i].get_type(), expected[i]);
    EXPECT_EQ(prims[i].get_bsdf(), &white);
    EXPECT_EQ(prims[i].get_interior(), &fog);
    EXPECT_EQ(prims[i].get_light_index(), -1);
    EXPECT_EQ(prims[i].get_id(), 0u);
    EXPECT_EQ(prims[i].is_bounded(), expected[i] != Primitive::Type::PLANE);
  }
}

TEST(PrimitiveTest, CopyKeepsShape) {
  Primitive a(Quad(Vector3D(0, 0, 0), Vector3D(1, 0, 0), Vector3D(0, 1, 0)),
              NULL);
  Primitive b(Plane(Vector3D(0, 0, 0), Vector3D(0, 1, 0)), NULL);
  EXPECT_FALSE(b.is_bounded());

  b = a;
  EXPECT_EQ(b.get_type(), Primitive::Type::QUAD);
  EXPECT_TRUE(b.is_bounded());
  expect_vec_near(b.as_quad().edge1, Vector3D(1, 0, 0), kTol);

  Primitive c(a);
  Ray r(Vector3D(0.5, 0.5, 1), Vector3D(0, 0, -1));
  Intersection isect;
  ASSERT_TRUE(c.intersect(r, &isect));
  EXPECT_EQ(isect.primitive, &c);
  EXPECT_EQ(isect.bsdf, nullptr);
}

TEST(PrimitiveTest, BoundsContainRandomHits) {
  std::vector<Primitive> prims;
  prims.push_back(Primitive(Sphere(Vector3D(1, 0, 0), 0.7), NULL));
  prims.push_back(Primitive(Box(Vector3D(-2, 0, 1), Vector3D(-1, 2, 2)),
                            NULL));
  prims.push_back(Primitive(
      Cylinder(Vector3D(0, 0, 0), Vector3D(1, 2, 3), 0.4, 1.5), NULL));
  prims.push_back(Primitive(
      Cone(Vector3D(0, 1, 0), Vector3D(-1, 1, 0), 0.6, 1.2), NULL));
  prims.push_back(Primitive(
      Triangle(Vector3D(0, 0, 0), Vector3D(1, 2, 0), Vector3D(0, 1, 3)),
      NULL));

  RandomStream rng(7);
  for (const Primitive& p : prims) {
    BBox bb = p.get_bbox();
    Vector3D c = bb.centroid();
    for (int i = 0; i < 500; ++i) {
      Vector3D d(rng.random_uniform() - 0.5, rng.random_uniform() - 0.5,
                 rng.random_uniform() - 0.5);
      if (d.norm2() <= 0) continue;
      d.normalize();
      Ray r(c - 20.0 * d, d);
      Intersection isect;
      if (p.intersect(r, &isect)) {
        EXPECT_TRUE(bb.contains(BBox(isect.p), 1e-7));
      }
    }
  }
}
