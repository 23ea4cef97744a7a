#include "pathtracer/raytraced_renderer.h"
#include "scene/scene.h"
#include "util/error.h"

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <unistd.h>

using namespace Lumina;
using namespace Lumina::SceneObjects;

static void usage(const char* binary_name) {
  printf("Usage: %s [options]\n", binary_name);
  printf("Program Options:\n");
  printf("  -t  <INT>                 Number of render threads (0 = all cores)\n");
  printf("  -s  <INT>                 Number of camera rays per pixel\n");
  printf("  -a  <INT> <INT> <FLOAT>   Adaptive sampling: min samples, max samples, tolerance\n");
  printf("  -b  <INT>                 Samples per adaptive batch\n");
  printf("  -m  <INT>                 Maximum ray depth\n");
  printf("  -r  <INT> <INT>           Output image resolution\n");
  printf("  -x  <INT>                 Random seed\n");
  printf("  -l  <FLOAT>               Time limit in seconds\n");
  printf("  -d                        Disable Russian roulette\n");
  printf("  -v                        Verbose logging\n");
  printf("  -h                        Print this help message\n");
  printf("\n");
}

// Cornell box with a ceiling light, a mirror ball, a glass ball with a
// scattering interior and a small fog volume.
static void build_demo_scene(Scene* scene, bool verbose) {
  const BSDF* white = scene->add_material(
      BSDF::lambertian(Vector3D(0.73, 0.73, 0.73)));
  const BSDF* red = scene->add_material(
      BSDF::lambertian(Vector3D(0.65, 0.05, 0.05)));
  const BSDF* green = scene->add_material(
      BSDF::lambertian(Vector3D(0.12, 0.45, 0.15)));
  const BSDF* mirror = scene->add_material(
      BSDF::metal(Vector3D(0.95, 0.95, 0.95), 0.0));
  const BSDF* brushed = scene->add_material(
      BSDF::pbr(Vector3D(0.9, 0.6, 0.2), 1.0, 0.3));
  const BSDF* glass = scene->add_material(BSDF::dielectric(1.5));

  const Medium* jade = scene->add_medium(
      Medium::subsurface(Vector3D(0.6, 0.9, 0.7), 0.2));
  const Medium* fog = scene->add_medium(
      Medium::fog(0.4, Vector3D(1, 1, 1)));

  // walls of a unit box spanning [-1, 1]^2 x [-1, 1], open towards +z
  scene->add_primitive(Primitive(
      Quad(Vector3D(-1, -1, -1), Vector3D(0, 0, 2), Vector3D(2, 0, 0)),
      white));  // floor
  scene->add_primitive(Primitive(
      Quad(Vector3D(-1, 1, -1), Vector3D(2, 0, 0), Vector3D(0, 0, 2)),
      white));  // ceiling
  scene->add_primitive(Primitive(
      Quad(Vector3D(-1, -1, -1), Vector3D(2, 0, 0), Vector3D(0, 2, 0)),
      white));  // back
  scene->add_primitive(Primitive(
      Quad(Vector3D(-1, -1, -1), Vector3D(0, 2, 0), Vector3D(0, 0, 2)),
      red));  // left
  scene->add_primitive(Primitive(
      Quad(Vector3D(1, -1, -1), Vector3D(0, 0, 2), Vector3D(0, 2, 0)),
      green));  // right

  scene->add_area_light(Vector3D(-0.25, 0.999, -0.25), Vector3D(0.5, 0, 0),
                        Vector3D(0, 0, 0.5), Vector3D(1.0, 0.85, 0.6),
                        15.0);

  scene->add_primitive(Primitive(Sphere(Vector3D(-0.45, -0.65, -0.3), 0.35),
                                 mirror));
  scene->add_primitive(Primitive(Sphere(Vector3D(0.45, -0.65, 0.2), 0.35),
                                 glass, jade));
  scene->add_primitive(Primitive(
      Cylinder(Vector3D(0.5, -1, -0.6), Vector3D(0, 1, 0), 0.15, 0.5),
      brushed));
  scene->add_primitive(Primitive(
      Box(Vector3D(-0.9, -1, 0.3), Vector3D(-0.3, -0.4, 0.9)), NULL, fog));

  scene->set_camera(Camera(Vector3D(0, 0, 3.8), Vector3D(0, 0, 0),
                           Vector3D(0, 1, 0), 40.0));

  BVHBuildParams params;
  params.verbose = verbose;
  scene->build(params);
}

int main(int argc, char** argv) {

  RenderConfig config;
  config.width = 320;
  config.height = 320;

  int opt;
  while ((opt = getopt(argc, argv, "t:s:a:b:m:r:x:l:dvh")) != -1) {
    switch (opt) {
      case 't':
        config.num_threads = atoi(optarg);
        break;
      case 's':
        config.samples_per_pixel = atoi(optarg);
        break;
      case 'a':
        if (optind + 1 >= argc) {
          usage(argv[0]);
          return 1;
        }
        config.adaptive = true;
        config.min_samples = atoi(optarg);
        config.max_samples = atoi(argv[optind]);
        config.max_tolerance = atof(argv[optind + 1]);
        optind += 2;
        break;
      case 'b':
        config.samples_per_batch = atoi(optarg);
        break;
      case 'm':
        config.max_ray_depth = atoi(optarg);
        break;
      case 'r':
        if (optind >= argc) {
          usage(argv[0]);
          return 1;
        }
        config.width = atoi(optarg);
        config.height = atoi(argv[optind]);
        optind++;
        break;
      case 'x':
        config.seed = strtoull(optarg, NULL, 10);
        break;
      case 'l':
        config.time_limit_seconds = atof(optarg);
        break;
      case 'd':
        config.russian_roulette = false;
        break;
      case 'v':
        config.verbose = true;
        break;
      case 'h':
        usage(argv[0]);
        return 0;
      default:
        usage(argv[0]);
        return 1;
    }
  }

  try {
    Scene scene;
    build_demo_scene(&scene, config.verbose);

    RaytracedRenderer renderer(config);
    RenderReport report = renderer.render(scene);

    const Framebuffer& fb = renderer.get_framebuffer();
    std::vector<float> rgb = fb.to_float_rgb();
    double sum = 0;
    for (size_t i = 0; i < rgb.size(); i += 3) {
      sum += Vector3D(rgb[i], rgb[i + 1], rgb[i + 2]).illum();
    }

    printf("[Lumina] %zux%zu, %zu samples (%zu degenerate), %zu failed "
           "tiles, %.3f sec\n",
           config.width, config.height, report.total_samples,
           report.degenerate_samples, report.failed_tiles.size(),
           report.seconds);
    printf("[Lumina] Mean luminance %.5f\n",
           sum / (fb.width() * fb.height()));
    for (const TileFailure& f : report.failed_tiles) {
      printf("[Lumina] Tile (%zu, %zu)-(%zu, %zu): %s\n", f.x0, f.y0, f.x1,
             f.y1, f.message.c_str());
    }
    return report.ok() ? 0 : 2;
  } catch (const std::exception& e) {
    printf("[Lumina] %s\n", e.what());
    return 1;
  }
}
