#define SDL_MAIN_HANDLED
#include "../sources/tint/clusterer.hh"
#include <SDL2/SDL.h>

using namespace tint;

namespace {

bool near(double expected, double actual, double epsilon)
{
  return SDL_fabs(expected - actual) <= epsilon;
}

std::vector<uint8_t> solid_image(uint32_t width, uint32_t height, uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255)
{
  std::vector<uint8_t> result(width * height * 4);
  for (uint32_t i = 0; i < (width * height); ++i)
  {
    result[4 * i + 0] = r;
    result[4 * i + 1] = g;
    result[4 * i + 2] = b;
    result[4 * i + 3] = a;
  }
  return result;
}

void paint(std::vector<uint8_t>& image, uint32_t first_pixel, uint32_t count, uint8_t r, uint8_t g, uint8_t b,
           uint8_t a = 255)
{
  for (uint32_t i = first_pixel; i < (first_pixel + count); ++i)
  {
    image[4 * i + 0] = r;
    image[4 * i + 1] = g;
    image[4 * i + 2] = b;
    image[4 * i + 3] = a;
  }
}

// deterministic noise, good enough to spread samples over the cube
std::vector<RGB> noisy_samples(uint32_t count)
{
  std::vector<RGB> result;
  uint32_t         state = 12345;
  for (uint32_t i = 0; i < count; ++i)
  {
    state = state * 1664525u + 1013904223u;
    result.push_back({.r = int((state >> 8) & 0xFF), .g = int((state >> 16) & 0xFF), .b = int((state >> 24) & 0xFF)});
  }
  return result;
}

void sampling()
{
  std::vector<uint8_t> image = solid_image(100, 100, 10, 20, 30);

  SampleOptions options;
  options.max_samples = 1000;
  SDL_assert(1000 == sample_pixels(image.data(), 100, 100, options).size());
  SDL_assert(10000 == sample_pixels(image.data(), 100, 100).size());

  // first row transparent, second row white, third row black
  paint(image, 0, 100, 10, 20, 30, 0);
  paint(image, 100, 100, 250, 250, 250);
  paint(image, 200, 100, 5, 5, 5);

  SDL_assert(9900 == sample_pixels(image.data(), 100, 100).size());

  options.max_samples  = 10000;
  options.ignore_white = true;
  SDL_assert(9800 == sample_pixels(image.data(), 100, 100, options).size());

  options.ignore_black = true;
  SDL_assert(9700 == sample_pixels(image.data(), 100, 100, options).size());

  SDL_assert(sample_pixels(nullptr, 100, 100).empty());
  SDL_assert(sample_pixels(image.data(), 0, 100).empty());
}

void redmean()
{
  const RGB black = {.r = 0, .g = 0, .b = 0};
  const RGB white = {.r = 255, .g = 255, .b = 255};
  const RGB red   = {.r = 255, .g = 0, .b = 0};

  SDL_assert(0.0 == redmean_distance(red, red));
  SDL_assert(redmean_distance(black, white) == redmean_distance(white, black));
  SDL_assert(redmean_distance(black, white) > redmean_distance(black, red));

  // green carries the highest weight
  const RGB green = {.r = 0, .g = 255, .b = 0};
  const RGB blue  = {.r = 0, .g = 0, .b = 255};
  SDL_assert(redmean_distance(black, green) > redmean_distance(black, blue));
}

void seeding()
{
  // green distances from black: near is 20 away, far is 200 away
  const RGB              black    = {.r = 0, .g = 0, .b = 0};
  const RGB              near_one = {.r = 0, .g = 10, .b = 0};
  const RGB              far_one  = {.r = 0, .g = 100, .b = 0};
  const std::vector<RGB> samples  = {black, near_one, far_one};

  const uint32_t runs        = 20000;
  uint32_t       first_black = 0;
  uint32_t       then_near   = 0;
  uint32_t       then_far    = 0;

  for (uint32_t seed = 1; seed <= runs; ++seed)
  {
    const std::vector<RGB> centers = kmeans_plus_plus_seeds(samples, 2, seed);
    SDL_assert(2 == centers.size());

    if (not((black.r == centers[0].r) and (black.g == centers[0].g) and (black.b == centers[0].b)))
      continue;

    first_black += 1;
    if (near_one.g == centers[1].g)
      then_near += 1;
    else if (far_one.g == centers[1].g)
      then_far += 1;
  }

  // first center is uniform
  SDL_assert(near(1.0 / 3.0, double(first_black) / runs, 0.03));

  // second center follows squared distance: 400 / (400 + 40000) ~ 0.0099 for the near one
  const double near_fraction = double(then_near) / first_black;
  SDL_assert(near(0.0099, near_fraction, 0.005));
  SDL_assert(first_black == (then_near + then_far));

  // seeding never asks for more centers than there are samples
  SDL_assert(3 == kmeans_plus_plus_seeds(samples, 7, 1).size());
  SDL_assert(kmeans_plus_plus_seeds({}, 2, 1).empty());
}

void uniform_image()
{
  const std::vector<uint8_t> image   = solid_image(64, 64, 24, 144, 255);
  const std::vector<RGB>     samples = sample_pixels(image.data(), 64, 64);
  const std::vector<Cluster> result  = kmeans_clusters(samples, 3, 7);

  SDL_assert(1 == result.size());
  SDL_assert(Color::from_hex(0x1890FF) == result[0].center);
  SDL_assert(4096 == result[0].members);
  SDL_assert(1.0 == result[0].weight);

  const std::vector<Color> palette = extract_palette(samples, 3, 7);
  SDL_assert(1 == palette.size());
  SDL_assert(Color::from_hex(0x1890FF) == palette[0]);
}

void two_color_image()
{
  std::vector<uint8_t> image = solid_image(10, 10, 255, 0, 0);
  paint(image, 0, 25, 0, 0, 255);

  const std::vector<RGB>     samples = sample_pixels(image.data(), 10, 10);
  const std::vector<Cluster> result  = kmeans_clusters(samples, 2, 1);

  SDL_assert(2 == result.size());
  SDL_assert(Color::from_hex(0xFF0000) == result[0].center);
  SDL_assert(Color::from_hex(0x0000FF) == result[1].center);
  SDL_assert(near(0.75, result[0].weight, 1e-12));
  SDL_assert(near(0.25, result[1].weight, 1e-12));
  SDL_assert(100 == (result[0].members + result[1].members));
}

void determinism_and_edges()
{
  const std::vector<RGB> samples = noisy_samples(2000);

  const std::vector<Cluster> first  = kmeans_clusters(samples, 5, 42);
  const std::vector<Cluster> second = kmeans_clusters(samples, 5, 42);

  SDL_assert(first.size() == second.size());
  SDL_assert(0 < first.size());
  SDL_assert(5 >= first.size());

  uint32_t members = 0;
  for (uint32_t i = 0; i < first.size(); ++i)
  {
    SDL_assert(first[i].center == second[i].center);
    SDL_assert(first[i].members == second[i].members);
    members += first[i].members;
    if (0 < i)
      SDL_assert(first[i - 1].weight >= first[i].weight);
  }
  SDL_assert(samples.size() == members);

  SDL_assert(kmeans_clusters({}, 3, 1).empty());
  SDL_assert(kmeans_clusters(samples, 0, 1).empty());

  // more clusters than samples, every sample is its own cluster
  const std::vector<RGB>     few        = {{.r = 1, .g = 2, .b = 3}, {.r = 200, .g = 100, .b = 0}};
  const std::vector<Cluster> singletons = kmeans_clusters(few, 5, 1);
  SDL_assert(2 == singletons.size());
  SDL_assert(0.5 == singletons[0].weight);
  SDL_assert(Color::from_rgb(1, 2, 3) == singletons[0].center);
}

void dominant_colors()
{
  std::vector<uint8_t> image = solid_image(10, 10, 255, 0, 0);
  paint(image, 0, 25, 128, 128, 128);

  const std::vector<RGB>           samples  = sample_pixels(image.data(), 10, 10);
  const std::vector<DominantColor> dominant = find_dominant_colors(samples);

  SDL_assert(2 == dominant.size());
  SDL_assert(Color::from_hex(0xFF0000) == dominant[0].color);
  SDL_assert(75 == dominant[0].count);
  SDL_assert(near(75.0, dominant[0].percentage, 1e-9));
  SDL_assert(near(75.0, dominant[0].prominence, 1e-9));

  // quantized to steps of 10
  SDL_assert(Color::from_rgb(130, 130, 130) == dominant[1].color);
  SDL_assert(near(25.0, dominant[1].percentage, 1e-9));
  SDL_assert(0.0 == dominant[1].prominence);

  SDL_assert(1 == find_dominant_colors(samples, 1).size());
  SDL_assert(find_dominant_colors({}).empty());
}

void distribution()
{
  const std::vector<uint8_t> blue_image = solid_image(8, 8, 0, 0, 255);
  const ColorDistribution    blue       = analyze_distribution(sample_pixels(blue_image.data(), 8, 8));

  SDL_assert(1.0 == blue.hue[240]);
  SDL_assert(0.0 == blue.hue[0]);
  SDL_assert(1.0 == blue.saturation[100]);
  SDL_assert(1.0 == blue.lightness[50]);
  SDL_assert(near(100.0, blue.average_saturation, 1e-9));
  SDL_assert(near(50.0, blue.average_lightness, 1e-9));
  SDL_assert(1 == blue.dominant_hue_count);
  SDL_assert(240 == blue.dominant_hues[0]);
  SDL_assert(ColorTemperature::Cool == blue.temperature);

  const std::vector<uint8_t> orange_image = solid_image(8, 8, 255, 128, 0);
  const ColorDistribution    orange       = analyze_distribution(sample_pixels(orange_image.data(), 8, 8));
  SDL_assert(ColorTemperature::Warm == orange.temperature);

  const std::vector<uint8_t> gray_image = solid_image(8, 8, 128, 128, 128);
  const ColorDistribution    gray       = analyze_distribution(sample_pixels(gray_image.data(), 8, 8));
  SDL_assert(0 == gray.dominant_hue_count);
  SDL_assert(ColorTemperature::Neutral == gray.temperature);
  SDL_assert(0 == SDL_strcmp("neutral", to_string(gray.temperature)));

  const ColorDistribution empty = analyze_distribution({});
  SDL_assert(0.0 == empty.average_lightness);
  SDL_assert(ColorTemperature::Neutral == empty.temperature);
}

} // namespace

int main()
{
  SDL_Log("sampling");
  sampling();
  SDL_Log("redmean");
  redmean();
  SDL_Log("seeding");
  seeding();
  SDL_Log("uniform image");
  uniform_image();
  SDL_Log("two color image");
  two_color_image();
  SDL_Log("determinism and edges");
  determinism_and_edges();
  SDL_Log("dominant colors");
  dominant_colors();
  SDL_Log("distribution");
  distribution();
  SDL_Log("Clusterer OK");
  return 0;
}
