#include "pathtracer/medium.h"
#include "scene/scene.h"
#include "util/error.h"
#include "util/random_util.h"

#include <gtest/gtest.h>

#include <cmath>

using namespace Lumina;
using namespace Lumina::SceneObjects;

TEST(MediumTest, BeerLambertTransmittance) {
  Medium m(2.0, Vector3D(0.25, 0.5, 1.0), Vector3D(0.25, 0, 0));
  Vector3D st = m.sigma_t();
  EXPECT_DOUBLE_EQ(st.x, 1.0);
  EXPECT_DOUBLE_EQ(st.y, 1.0);
  EXPECT_DOUBLE_EQ(st.z, 2.0);

  Vector3D tr = m.transmittance(0.5);
  EXPECT_NEAR(tr.x, std::exp(-0.5), 1e-12);
  EXPECT_NEAR(tr.z, std::exp(-1.0), 1e-12);

  Medium vacuum(0.0, Vector3D(1, 1, 1), Vector3D(1, 1, 1));
  EXPECT_DOUBLE_EQ(vacuum.transmittance(100.0).y, 1.0);
}

TEST(MediumTest, RejectsInvalidParameters) {
  EXPECT_THROW(Medium(-1.0, Vector3D(1, 1, 1), Vector3D()),
               ConfigurationError);
  EXPECT_THROW(Medium(1.0, Vector3D(-0.1, 0, 0), Vector3D()),
               ConfigurationError);
  EXPECT_THROW(Medium(1.0, Vector3D(), Vector3D(1, 1, 1),
                      Medium::PhaseType::HENYEY_GREENSTEIN, 1.0),
               ConfigurationError);
  EXPECT_THROW(Medium(1.0, Vector3D(), Vector3D(1, 1, 1),
                      Medium::PhaseType::HENYEY_GREENSTEIN, -1.5),
               ConfigurationError);
  EXPECT_THROW(Medium::subsurface(Vector3D(0.8, 0.8, 0.8), 0.0),
               ConfigurationError);
  EXPECT_NO_THROW(Medium::subsurface(Vector3D(0.8, 0.8, 0.8), 0.1, 0.3));
}

TEST(MediumTest, PresetsScaleWithDensity) {
  Medium fog = Medium::fog(0.5, Vector3D(1, 1, 1));
  EXPECT_DOUBLE_EQ(fog.sigma_t().x, 0.5);
  EXPECT_DOUBLE_EQ(fog.sigma_s().x, 0.5);
  EXPECT_EQ(fog.get_phase_type(), Medium::PhaseType::ISOTROPIC);

  Medium jade = Medium::subsurface(Vector3D(0.6, 0.9, 0.7), 0.25);
  EXPECT_DOUBLE_EQ(jade.get_density(), 4.0);
  EXPECT_NEAR(jade.sigma_t().y, 4.0, 1e-12);
  EXPECT_NEAR(jade.sigma_s().y, 3.6, 1e-12);

  Medium smoke = Medium::smoke(1.0, Vector3D(0.5, 0.5, 0.5), 0.4);
  EXPECT_EQ(smoke.get_phase_type(), Medium::PhaseType::HENYEY_GREENSTEIN);
  EXPECT_DOUBLE_EQ(smoke.get_g(), 0.4);
}

class PhaseTest : public ::testing::TestWithParam<double> {};

TEST_P(PhaseTest, MeanCosineEqualsAsymmetry) {
  double g = GetParam();
  Medium m(1.0, Vector3D(), Vector3D(1, 1, 1),
           Medium::PhaseType::HENYEY_GREENSTEIN, g);
  Vector3D d_in = Vector3D(0.2, -0.6, 0.4).unit();
  RandomStream rng(11);

  const int n = 200000;
  double sum = 0;
  for (int i = 0; i < n; ++i) {
    Vector3D d_out;
    double pdf = m.sample_phase(d_in, &d_out, rng);
    ASSERT_NEAR(d_out.norm(), 1.0, 1e-9);
    if (i < 1000) {
      EXPECT_NEAR(pdf, m.phase(d_in, d_out), 1e-6 * pdf);
    }
    sum += dot(d_in, d_out);
  }
  EXPECT_NEAR(sum / n, g, 0.01);
}

INSTANTIATE_TEST_SUITE_P(Asymmetry, PhaseTest,
                         ::testing::Values(-0.5, 0.0, 0.3, 0.8));

TEST(MediumTest, IsotropicPhaseIsUniform) {
  Medium m = Medium::fog(1.0, Vector3D(1, 1, 1));
  Vector3D d_in(0, 0, 1);
  RandomStream rng(12);
  const int n = 100000;
  double sum = 0;
  for (int i = 0; i < n; ++i) {
    Vector3D d_out;
    double pdf = m.sample_phase(d_in, &d_out, rng);
    EXPECT_DOUBLE_EQ(pdf, 1.0 / (4.0 * PI));
    sum += d_out.z;
  }
  EXPECT_NEAR(sum / n, 0.0, 0.01);
  EXPECT_DOUBLE_EQ(m.phase(d_in, Vector3D(1, 0, 0)), 1.0 / (4.0 * PI));
}

TEST(MediumTest, ScatterWeightIsSingleScatteringAlbedo) {
  Medium m(1.0, Vector3D(0.5, 0.5, 0.5), Vector3D(1.5, 1.5, 1.5));
  RandomStream rng(13);
  int scatters = 0;
  for (int i = 0; i < 1000; ++i) {
    double t;
    bool scattered;
    Vector3D w = m.sample_distance(10.0, rng, &t, &scattered);
    if (!scattered) continue;
    scatters++;
    EXPECT_LT(t, 10.0);
    EXPECT_NEAR(w.x, 0.75, 1e-9);
    EXPECT_NEAR(w.z, 0.75, 1e-9);
  }
  EXPECT_GT(scatters, 900);
}

TEST(MediumTest, FreeFlightIsUnbiasedForChromaticExtinction) {
  Medium m(1.0, Vector3D(0.5, 1.0, 2.0), Vector3D());
  double t_max = 0.7;
  RandomStream rng(14);

  const int n = 400000;
  Vector3D sum;
  for (int i = 0; i < n; ++i) {
    double t;
    bool scattered;
    Vector3D w = m.sample_distance(t_max, rng, &t, &scattered);
    if (!scattered) {
      EXPECT_DOUBLE_EQ(t, t_max);
      sum += w;
    }
  }
  Vector3D expected = m.transmittance(t_max);
  EXPECT_NEAR(sum.x / n, expected.x, 0.01);
  EXPECT_NEAR(sum.y / n, expected.y, 0.01);
  EXPECT_NEAR(sum.z / n, expected.z, 0.01);
}

TEST(SceneTransmittanceTest, AbsorbingBoxAttenuatesShadowRay) {
  Scene scene;
  const Medium* ink =
      scene.add_medium(Medium(1.0, Vector3D(1, 1, 1), Vector3D()));
  scene.add_primitive(Primitive(Box(Vector3D(-1, -1, -0.5),
                                    Vector3D(1, 1, 0.5)),
                                NULL, ink));
  scene.add_light(SceneLight::point(Vector3D(0, 5, 0), Vector3D(1, 1, 1)));
  scene.build();

  Ray through(Vector3D(0, 0, -5), Vector3D(0, 0, 1), 10.0, 0.0);
  Vector3D tr = scene.transmittance(through, NULL);
  EXPECT_NEAR(tr.x, std::exp(-1.0), 1e-9);
  EXPECT_NEAR(tr.y, std::exp(-1.0), 1e-9);

  // ending inside the box only pays for the travelled distance
  Ray into(Vector3D(0, 0, -5), Vector3D(0, 0, 1), 4.75, 0.0);
  EXPECT_NEAR(scene.transmittance(into, NULL).x, std::exp(-0.25), 1e-9);

  // starting inside with the interior medium
  Ray out(Vector3D(0, 0, 0), Vector3D(0, 0, 1), 10.0, 0.0);
  EXPECT_NEAR(scene.transmittance(out, ink).x, std::exp(-0.5), 1e-9);

  Ray beside(Vector3D(3, 0, -5), Vector3D(0, 0, 1), 10.0, 0.0);
  EXPECT_DOUBLE_EQ(scene.transmittance(beside, NULL).x, 1.0);
}

TEST(SceneTransmittanceTest, OpaqueSurfaceBlocks) {
  Scene scene;
  const BSDF* white = scene.add_material(BSDF::lambertian(Vector3D(1, 1, 1)));
  scene.add_primitive(Primitive(Sphere(Vector3D(0, 0, 0), 1.0), white));
  scene.add_light(SceneLight::point(Vector3D(0, 5, 0), Vector3D(1, 1, 1)));
  scene.build();

  Ray blocked(Vector3D(0, 0, -5), Vector3D(0, 0, 1), 10.0, 0.0);
  EXPECT_TRUE(is_black(scene.transmittance(blocked, NULL)));

  Ray short_of(Vector3D(0, 0, -5), Vector3D(0, 0, 1), 3.0, 0.0);
  EXPECT_DOUBLE_EQ(scene.transmittance(short_of, NULL).x, 1.0);
}
