#include "pathtracer/pathtracer.h"
#include "util/error.h"

#include <gtest/gtest.h>

#include <cmath>

using namespace Lumina;
using namespace Lumina::SceneObjects;

namespace {

RenderConfig make_config(size_t max_ray_depth, bool russian_roulette) {
  RenderConfig config;
  config.max_ray_depth = max_ray_depth;
  config.russian_roulette = russian_roulette;
  return config;
}

// Mean radiance over n independent streams.
Vector3D average_radiance(const PathTracer& pt, const Ray& ray, int n,
                          uint64_t seed) {
  Vector3D sum;
  for (int i = 0; i < n; ++i) {
    RandomStream rng = RandomStream::for_sample(seed, 0, 0, i);
    sum += pt.est_radiance_global_illumination(ray, rng);
  }
  return sum / static_cast<double>(n);
}

} // namespace

TEST(PathTracerTest, DirectLightingFromPointLight) {
  Scene scene;
  const BSDF* grey = scene.add_material(BSDF::lambertian(Vector3D(0.5, 0.5,
                                                                   0.5)));
  scene.add_primitive(Primitive(Sphere(Vector3D(0, 0, 0), 1.0), grey));
  scene.add_light(SceneLight::point(Vector3D(2, 0, 3), Vector3D(1, 1, 1),
                                    8.0));
  scene.build();

  // hit point (0, 0, 1), light at distance sqrt(8) and 45 degrees
  double expected = 0.5 / PI * (8.0 / 8.0) * std::sqrt(0.5);
  Ray ray(Vector3D(0, 0, 5), Vector3D(0, 0, -1));

  PathTracer direct(&scene, NULL, make_config(1, false));
  for (int i = 0; i < 20; ++i) {
    RandomStream rng = RandomStream::for_sample(3, 0, 0, i);
    Vector3D L = direct.est_radiance_global_illumination(ray, rng);
    EXPECT_NEAR(L.x, expected, 1e-9);
    EXPECT_NEAR(L.z, expected, 1e-9);
  }

  PathTracer none(&scene, NULL, make_config(0, false));
  RandomStream rng(1);
  EXPECT_TRUE(is_black(none.est_radiance_global_illumination(ray, rng)));
}

TEST(PathTracerTest, EscapingRayReturnsEnvironment) {
  Scene scene;
  scene.set_environment([](const Vector3D& d) {
    return d.y > 0 ? Vector3D(0.3, 0.6, 0.9) : Vector3D(0.1, 0.1, 0.1);
  });
  scene.build();
  EXPECT_TRUE(scene.has_environment());

  PathTracer pt(&scene, NULL, make_config(8, true));
  RandomStream rng(2);
  Vector3D up = pt.est_radiance_global_illumination(
      Ray(Vector3D(0, 0, 0), Vector3D(0, 1, 0)), rng);
  EXPECT_DOUBLE_EQ(up.x, 0.3);
  EXPECT_DOUBLE_EQ(up.y, 0.6);
  EXPECT_DOUBLE_EQ(up.z, 0.9);

  Vector3D down = pt.est_radiance_global_illumination(
      Ray(Vector3D(0, 0, 0), Vector3D(0, -1, 0)), rng);
  EXPECT_DOUBLE_EQ(down.y, 0.1);
}

TEST(PathTracerTest, MirrorReflectsEnvironment) {
  Scene scene;
  const BSDF* mirror = scene.add_material(BSDF::metal(Vector3D(1, 1, 1), 0));
  scene.add_primitive(Primitive(Plane(Vector3D(0, 0, 0), Vector3D(0, 1, 0)),
                                mirror));
  scene.set_environment([](const Vector3D& d) {
    return d.y > 0 ? Vector3D(1, 1, 1) : Vector3D();
  });
  scene.build();

  PathTracer pt(&scene, NULL, make_config(4, false));
  RandomStream rng(3);
  Vector3D L = pt.est_radiance_global_illumination(
      Ray(Vector3D(0, 1, 0), Vector3D(0, -1, 0)), rng);
  // Schlick reflectance with a white base color is 1 at normal incidence
  EXPECT_NEAR(L.x, 1.0, 1e-9);
}

// A point light at the center of a closed diffuse sphere. Every wall point
// receives unit irradiance, so the radiance seen from the center is
// albedo / (pi (1 - albedo)).
class EnclosureTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const BSDF* grey =
        scene.add_material(BSDF::lambertian(Vector3D(0.5, 0.5, 0.5)));
    scene.add_primitive(Primitive(Sphere(Vector3D(0, 0, 0), 1.0), grey));
    scene.add_light(SceneLight::point(Vector3D(0, 0, 0), Vector3D(1, 1, 1)));
    scene.build();
  }

  Scene scene;
};

TEST_F(EnclosureTest, WithoutRouletteEverySampleIsExact) {
  PathTracer pt(&scene, NULL, make_config(64, false));
  Ray ray(Vector3D(0, 0, 0), Vector3D(0.6, 0.0, 0.8));
  for (int i = 0; i < 200; ++i) {
    RandomStream rng = RandomStream::for_sample(5, 0, 0, i);
    Vector3D L = pt.est_radiance_global_illumination(ray, rng);
    EXPECT_NEAR(L.y, 1.0 / PI, 1e-9);
  }
}

TEST_F(EnclosureTest, RouletteIsUnbiased) {
  RenderConfig config = make_config(64, true);
  config.rr_min_depth = 2;
  PathTracer pt(&scene, NULL, config);
  Ray ray(Vector3D(0, 0, 0), Vector3D(0.6, 0.0, 0.8));
  Vector3D L = average_radiance(pt, ray, 20000, 6);
  EXPECT_NEAR(L.x, 1.0 / PI, 0.03 / PI);
}

TEST(PathTracerTest, SphereLightAboveDiffusePlane) {
  Scene scene;
  const BSDF* floor = scene.add_material(BSDF::lambertian(Vector3D(0.8, 0.8,
                                                                    0.8)));
  scene.add_primitive(Primitive(Plane(Vector3D(0, 0, 0), Vector3D(0, 1, 0)),
                                floor));
  scene.add_sphere_light(Vector3D(0, 2, 0), 0.5, Vector3D(1, 1, 1), 4.0);
  scene.build();

  // rho * Le * (r / D)^2 for the point below the center
  double expected = 0.8 * 4.0 * 0.0625;
  PathTracer pt(&scene, NULL, make_config(1, false));
  Ray ray(Vector3D(0, 1, 3), Vector3D(0, -1, -3).unit());
  Vector3D L = average_radiance(pt, ray, 20000, 7);
  EXPECT_NEAR(L.x, expected, 0.02 * expected);
}

TEST(PathTracerTest, EmitterSeenDirectly) {
  Scene scene;
  scene.add_area_light(Vector3D(-1, -1, 0), Vector3D(2, 0, 0),
                       Vector3D(0, 2, 0), Vector3D(1, 0.5, 0.25), 2.0);
  scene.build();

  PathTracer pt(&scene, NULL, make_config(4, true));
  RandomStream rng(8);
  // emits towards +z only
  Vector3D front = pt.est_radiance_global_illumination(
      Ray(Vector3D(0, 0, 2), Vector3D(0, 0, -1)), rng);
  EXPECT_DOUBLE_EQ(front.x, 2.0);
  EXPECT_DOUBLE_EQ(front.z, 0.5);

  Vector3D back = pt.est_radiance_global_illumination(
      Ray(Vector3D(0, 0, -2), Vector3D(0, 0, 1)), rng);
  EXPECT_TRUE(is_black(back));
}

TEST(PathTracerTest, AbsorbingVolumeAttenuatesEnvironment) {
  Scene scene;
  const Medium* ink =
      scene.add_medium(Medium(1.0, Vector3D(1, 1, 1), Vector3D()));
  scene.add_primitive(Primitive(Box(Vector3D(-1, -1, -0.5),
                                    Vector3D(1, 1, 0.5)),
                                NULL, ink));
  scene.set_environment([](const Vector3D&) { return Vector3D(1, 1, 1); });
  scene.build();

  PathTracer pt(&scene, NULL, make_config(8, true));
  Ray ray(Vector3D(0, 0, -5), Vector3D(0, 0, 1));
  Vector3D L = average_radiance(pt, ray, 20000, 9);
  EXPECT_NEAR(L.x, std::exp(-1.0), 0.015);

  // rays missing the volume are untouched
  RandomStream rng(10);
  Vector3D clear = pt.est_radiance_global_illumination(
      Ray(Vector3D(3, 0, -5), Vector3D(0, 0, 1)), rng);
  EXPECT_DOUBLE_EQ(clear.x, 1.0);
}

TEST(PathTracerTest, RefractionEntersInteriorMedium) {
  Scene scene;
  // an index matched shell, so the path goes straight through it
  const BSDF* shell = scene.add_material(BSDF::dielectric(1.0));
  const Medium* ink =
      scene.add_medium(Medium(1.0, Vector3D(1, 1, 1), Vector3D()));
  scene.add_primitive(Primitive(Sphere(Vector3D(0, 0, 0), 1.0), shell, ink));
  scene.set_environment([](const Vector3D&) { return Vector3D(1, 1, 1); });
  scene.build();

  PathTracer pt(&scene, NULL, make_config(8, false));
  Ray ray(Vector3D(0, 0, -5), Vector3D(0, 0, 1));
  Vector3D L = average_radiance(pt, ray, 20000, 21);
  EXPECT_NEAR(L.x, std::exp(-2.0), 0.01);
  EXPECT_NEAR(L.z, std::exp(-2.0), 0.01);

  // without the interior medium the shell is invisible
  Scene clear_scene;
  const BSDF* clear_shell = clear_scene.add_material(BSDF::dielectric(1.0));
  clear_scene.add_primitive(
      Primitive(Sphere(Vector3D(0, 0, 0), 1.0), clear_shell));
  clear_scene.set_environment(
      [](const Vector3D&) { return Vector3D(1, 1, 1); });
  clear_scene.build();
  PathTracer clear_pt(&clear_scene, NULL, make_config(8, false));
  RandomStream rng(22);
  Vector3D clear = clear_pt.est_radiance_global_illumination(ray, rng);
  EXPECT_NEAR(clear.x, 1.0, 1e-9);
}

namespace {

// Fog filled box under a downward facing quad emitter. When the emitter is
// registered as a light it is also reached by next event estimation.
void build_fog_scene(Scene* scene, bool register_light) {
  const Medium* fog =
      scene->add_medium(Medium::fog(1.0, Vector3D(0.8, 0.8, 0.8)));
  scene->add_primitive(Primitive(Box(Vector3D(-1, -1, -1),
                                     Vector3D(1, 1, 1)),
                                 NULL, fog));
  Vector3D corner(-1, 1.5, -1), e1(2, 0, 0), e2(0, 0, 2);
  if (register_light) {
    scene->add_area_light(corner, e1, e2, Vector3D(1, 1, 1), 4.0);
  } else {
    const BSDF* emitter =
        scene->add_material(BSDF::emissive(Vector3D(1, 1, 1), 4.0));
    scene->add_primitive(Primitive(Quad(corner, e1, e2), emitter));
  }
  scene->build();
}

} // namespace

TEST(PathTracerTest, FogLightingAgreesWithAndWithoutLightSampling) {
  Scene sampled;
  build_fog_scene(&sampled, true);
  Scene unsampled;
  build_fog_scene(&unsampled, false);
  ASSERT_EQ(sampled.get_lights().size(), 1u);
  ASSERT_TRUE(unsampled.get_lights().empty());

  Ray ray(Vector3D(0, 0, -5), Vector3D(0, 0, 1));
  PathTracer with_nee(&sampled, NULL, make_config(32, false));
  PathTracer phase_only(&unsampled, NULL, make_config(32, false));
  Vector3D L_nee = average_radiance(with_nee, ray, 50000, 23);
  Vector3D L_phase = average_radiance(phase_only, ray, 100000, 24);

  EXPECT_GT(L_nee.x, 0.02);
  EXPECT_NEAR(L_phase.x, L_nee.x, 0.1 * L_nee.x);
  EXPECT_NEAR(L_phase.y, L_nee.y, 0.1 * L_nee.y);
}

TEST(PathTracerTest, NegativeThroughputIsReported) {
  Scene scene;
  const BSDF* broken =
      scene.add_material(BSDF::lambertian(Vector3D(-0.5, 0.5, 0.5)));
  scene.add_primitive(Primitive(Sphere(Vector3D(0, 0, 0), 1.0), broken));
  scene.add_light(SceneLight::point(Vector3D(0, 0, 4), Vector3D(1, 1, 1)));
  scene.build();

  PathTracer pt(&scene, NULL, make_config(4, false));
  RandomStream rng(11);
  EXPECT_THROW(pt.est_radiance_global_illumination(
                   Ray(Vector3D(0, 0, 5), Vector3D(0, 0, -1)), rng),
               InvalidStateError);
}

TEST(PathTracerTest, PixelSamplingNeedsCamera) {
  Scene scene;
  scene.set_environment([](const Vector3D&) { return Vector3D(1, 1, 1); });
  scene.build();

  PathTracer pt(&scene, NULL, RenderConfig());
  Framebuffer fb;
  fb.resize(4, 4, false);
  PathStats stats;
  EXPECT_THROW(pt.raytrace_pixel(0, 0, 1, &fb, &stats), InvalidStateError);
}

TEST(PathTracerTest, NonFiniteSamplesAreDropped) {
  Scene scene;
  scene.set_environment([](const Vector3D& d) {
    return d.x > 0 ? Vector3D(INF_D, 0, 0) : Vector3D(1, 1, 1);
  });
  scene.build();

  RenderConfig config;
  config.width = 2;
  config.height = 1;
  Camera camera(Vector3D(0, 0, 0), Vector3D(0, 0, -1), Vector3D(0, 1, 0),
                60.0, 2.0);
  PathTracer pt(&scene, &camera, config);
  Framebuffer fb;
  fb.resize(2, 1, false);
  PathStats stats;

  pt.raytrace_pixel(0, 0, 8, &fb, &stats);
  pt.raytrace_pixel(1, 0, 8, &fb, &stats);
  EXPECT_EQ(stats.samples, 16u);
  EXPECT_EQ(stats.degenerate, 8u);
  EXPECT_EQ(fb.pixel(0, 0).n, 8u);
  EXPECT_EQ(fb.pixel(1, 0).n, 0u);
  EXPECT_EQ(fb.pixel(1, 0).drawn, 8u);
  EXPECT_DOUBLE_EQ(fb.pixel(0, 0).mean.y, 1.0);
}

TEST(PathTracerTest, ConvergenceNeedsTightInterval) {
  Scene scene;
  scene.set_environment([](const Vector3D&) { return Vector3D(1, 1, 1); });
  scene.build();
  RenderConfig config;
  config.max_tolerance = 0.05;
  PathTracer pt(&scene, NULL, config);

  PixelAccumulator flat;
  flat.add(Vector3D(1, 1, 1));
  EXPECT_FALSE(pt.is_converged(flat));
  flat.add(Vector3D(1, 1, 1));
  EXPECT_TRUE(pt.is_converged(flat));

  PixelAccumulator noisy;
  for (int i = 0; i < 16; ++i) {
    noisy.add(i % 2 ? Vector3D(2, 2, 2) : Vector3D());
  }
  EXPECT_FALSE(pt.is_converged(noisy));
}
