#include "codecs/scene.hpp"
#include "accel/predictor.hpp"
#include "film/file.hpp"
#include "jobs/progress.hpp"
#include "jobs/tiles.hpp"
#include "options.hpp"
#include "scene.hpp"
#include "state.hpp"
#include "xpu.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <getopt.h>
#include <sys/time.h>

/* available arguments to the renderer */
static option options[] = {
  { "output",    required_argument, NULL, 'o' },
  { "spp",       required_argument, NULL, 's' },
  { "depth",     required_argument, NULL, 'd' },
  { "threads",   required_argument, NULL, 't' },
  { "tile-size", required_argument, NULL, 'T' },
  { "seed",      required_argument, NULL, 'S' },
  { "gamma",     required_argument, NULL, 'g' },
  { "predictor", no_argument,       NULL, 'p' },
  { "list",      no_argument,       NULL, 'l' },
  { "verbose",   no_argument,       NULL, 'v' },
  { NULL,        0,                 NULL, 0 }
};

void usage() {
  std::cerr
    << "usage: lumen <options> scene"
    << std::endl
    << "-o <path>    Output path for the renderer" << std::endl
    << "-s <samples> Anti Aliasing samples per pixel" << std::endl
    << "-d <depth>   Maximum number of bounces of a single path" << std::endl
    << "-t <threads> Number of render threads" << std::endl
    << "-T <size>    Edge length of a tile in pixels" << std::endl
    << "-S <seed>    Seed for all random numbers of the frame" << std::endl
    << "-g <gamma>   Display gamma" << std::endl
    << "-p           Order bvh traversal with the traversal predictor" << std::endl
    << "-l           Test every primitive instead of building a bvh" << std::endl
    << "-v           Print progress and statistics while rendering" << std::endl;
}

/* render settings given on the command line. they are applied after
 * the scene file has been read, so they take precedence */
typedef std::vector<std::pair<int, std::string>> overrides_t;

void apply(const overrides_t& overrides, render_config_t& config) {
  for (const auto& o : overrides) {
    const auto& arg = o.second;
    switch (o.first) {
    case 's':
      config.samples_per_pixel = std::atoi(arg.c_str());
      break;
    case 'd':
      config.max_depth = std::atoi(arg.c_str());
      break;
    case 't':
      config.thread_count = std::atoi(arg.c_str());
      break;
    case 'T':
      config.tile_size = std::atoi(arg.c_str());
      break;
    case 'S':
      config.random_seed = std::strtoull(arg.c_str(), nullptr, 10);
      break;
    case 'g':
      config.gamma = std::atof(arg.c_str());
      break;
    case 'p':
      config.predictor = true;
      break;
    case 'l':
      config.accel = render_config_t::LIST;
      break;
    }
  }
}

bool parse_args(int argc, char** argv, parsed_options_t& parsed, overrides_t& overrides) {
  int ch;

  while ((ch = getopt_long(argc, argv, "o:s:d:t:T:S:g:plv", options, nullptr)) != -1) {
    switch (ch) {
    case 'o':
      parsed.output = optarg;
      break;
    case 's':
    case 'd':
    case 't':
    case 'T':
    case 'S':
    case 'g':
      overrides.emplace_back(ch, optarg);
      break;
    case 'p':
    case 'l':
      overrides.emplace_back(ch, "");
      break;
    case 'v':
      parsed.verbose = true;
      break;
    case '?':
    default:
      return false;
    }
  }

  const auto remaining = argc - optind;

  if (remaining < 1) {
    std::cerr << "Need a scene file" << std::endl;
    return false;
  }

  if (remaining != 1) {
    std::cerr << "Unrecognized extra arguments: " << remaining - 1 << std::endl;
    return false;
  }

  // the last argument passed is the scene file we want to render
  parsed.scene = argv[argc-1];

  return true;
}

template<typename T>
void start_devices(const T& devices, const scene_t& scene, frame_state_t& state) {
  for(auto& device: devices) {
    device->start(scene, state);
  }
}

template<typename T>
void join(const T& devices) {
  for(auto& device : devices) {
    device->join();
  }
}

void print_stats(predictor_t& predictor) {
  const auto stats = predictor.stats();
  const auto ratio = [](uint64_t a, uint64_t b) {
    return b > 0 ? (double) a / (double) b : 0.0;
  };

  std::cout
    << "Predictor lookups:   " << stats.lookups << std::endl
    << "Predictor hints:     " << stats.hints
    << " (" << ratio(stats.hints, stats.lookups) << ")" << std::endl
    << "Predictor confirmed: " << stats.confirmed
    << " (" << ratio(stats.confirmed, stats.updates) << ")" << std::endl
    << "Predictor entries:   " << stats.entries << std::endl;
}

int render(const parsed_options_t& parsed, const overrides_t& overrides) {
  auto config = parsed.config;

  std::cout << "Importing scene: " << parsed.scene << std::endl;
  scene_t scene;
  codec::scene::import(parsed.scene, scene, config, [&overrides](render_config_t& c) {
    apply(overrides, c);
  });

  config.validate();

  std::cout
    << "Image: " << config.image_width << "x" << config.image_height
    << ", samples per pixel: " << config.samples_per_pixel
    << ", max depth: " << config.max_depth
    << ", threads: " << config.thread_count
    << std::endl;

  std::cout << "Preprocessing" << std::endl;
  scene.preprocess(config.accel);

  std::cout << "Discovering devices" << std::endl;
  const auto devices = xpu_t::discover(config);

  film::file_t sink(config.image_width, config.image_height, parsed.output);

  std::unique_ptr<job::tiles_t> tiles(job::tiles_t::make(
    config.image_width
  , config.image_height
  , config.tile_size));

  std::unique_ptr<predictor_t> predictor;
  if (config.predictor) {
    predictor.reset(new predictor_t());
  }

  frame_state_t state(tiles.get(), &sink, predictor.get());

  std::cout << "Rendering..." << std::endl;

  timeval start;
  gettimeofday(&start, 0);

  {
    std::unique_ptr<job::progress_t> progress;
    if (parsed.verbose) {
      progress.reset(new job::progress_t(*tiles, std::cout));
    }

    start_devices(devices, scene, state);
    join(devices);
  }

  timeval end;
  gettimeofday(&end, 0);

  std::cout
    << "Rendering time: "
    << ((end.tv_sec - start.tv_sec) +
        ((end.tv_usec - start.tv_usec) / 1000000.0))
    << std::endl;

  if (parsed.verbose && predictor) {
    print_stats(*predictor);
  }

  std::cout << "Writing " << parsed.output << std::endl;
  sink.finalize();

  std::cout << "Done" << std::endl;

  return 0;
}

int main(int argc, char** argv) {
  parsed_options_t parsed;
  overrides_t overrides;

  if (!parse_args(argc, argv, parsed, overrides)) {
    usage();
    return -1;
  }

  try {
    return render(parsed, overrides);
  }
  catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
