#include "clusterer.hh"
#include "math.hh"
#include <SDL2/SDL_log.h>
#include <algorithm>
#include <random>

namespace tint {

namespace {

struct ClusterState
{
  RGB      center;
  uint64_t sum_r;
  uint64_t sum_g;
  uint64_t sum_b;
  uint32_t members;
};

uint32_t nearest_center(const RGB& pixel, const std::vector<ClusterState>& clusters)
{
  uint32_t result       = 0;
  double   min_distance = redmean_distance(pixel, clusters[0].center);

  for (uint32_t i = 1; i < clusters.size(); ++i)
  {
    const double distance = redmean_distance(pixel, clusters[i].center);
    if (distance < min_distance)
    {
      min_distance = distance;
      result       = i;
    }
  }

  return result;
}

uint32_t quantize(int channel, int factor)
{
  return static_cast<uint32_t>(clamp(round_to_int(double(channel) / factor) * factor, 0, 255));
}

} // namespace

std::vector<RGB> sample_pixels(const uint8_t* rgba, uint32_t width, uint32_t height, const SampleOptions& options)
{
  std::vector<RGB> result;

  const uint64_t total = uint64_t(width) * uint64_t(height);
  if ((nullptr == rgba) or (0 == total) or (0 == options.max_samples))
    return result;

  const uint64_t stride = (total + options.max_samples - 1) / options.max_samples;
  result.reserve(static_cast<size_t>(SDL_min(total, uint64_t(options.max_samples))));

  for (uint64_t i = 0; i < total; i += stride)
  {
    const uint8_t* pixel = &rgba[i * 4];

    if (TINT_SAMPLE_ALPHA_CUTOFF > pixel[3])
      continue;

    const uint8_t r = pixel[0];
    const uint8_t g = pixel[1];
    const uint8_t b = pixel[2];

    const bool white = (TINT_SAMPLE_WHITE_THRESHOLD < r) and (TINT_SAMPLE_WHITE_THRESHOLD < g) and
                       (TINT_SAMPLE_WHITE_THRESHOLD < b);
    const bool black = (TINT_SAMPLE_BLACK_THRESHOLD > r) and (TINT_SAMPLE_BLACK_THRESHOLD > g) and
                       (TINT_SAMPLE_BLACK_THRESHOLD > b);

    if ((options.ignore_white and white) or (options.ignore_black and black))
      continue;

    result.push_back({.r = r, .g = g, .b = b});
  }

  return result;
}

double redmean_distance(const RGB& lhs, const RGB& rhs)
{
  const double r_mean   = (lhs.r + rhs.r) / 2.0;
  const double weight_r = 2.0 + r_mean / 256.0;
  const double weight_g = 4.0;
  const double weight_b = 2.0 + (255.0 - r_mean) / 256.0;

  return SDL_sqrt(weight_r * square(lhs.r - rhs.r) + weight_g * square(lhs.g - rhs.g) +
                  weight_b * square(lhs.b - rhs.b));
}

std::vector<RGB> kmeans_plus_plus_seeds(const std::vector<RGB>& samples, uint32_t k, uint32_t seed)
{
  std::vector<RGB> centers;
  if (samples.empty() or (0 == k))
    return centers;

  std::mt19937        generator(seed);
  std::vector<double> distances(samples.size(), 0.0);
  centers.reserve(k);

  std::uniform_int_distribution<size_t> first_pick(0, samples.size() - 1);
  centers.push_back(samples[first_pick(generator)]);

  std::uniform_real_distribution<double> unit(0.0, 1.0);

  while ((centers.size() < k) and (centers.size() < samples.size()))
  {
    double sum = 0.0;
    for (size_t i = 0; i < samples.size(); ++i)
    {
      double min_distance = redmean_distance(samples[i], centers[0]);
      for (size_t c = 1; c < centers.size(); ++c)
        min_distance = SDL_min(min_distance, redmean_distance(samples[i], centers[c]));
      distances[i] = square(min_distance);
      sum += distances[i];
    }

    // every sample is picked with probability proportional to its squared distance from the closest center
    double remaining = unit(generator) * sum;
    size_t picked    = samples.size() - 1;
    for (size_t i = 0; i < samples.size(); ++i)
    {
      remaining -= distances[i];
      if (remaining <= 0.0)
      {
        picked = i;
        break;
      }
    }

    centers.push_back(samples[picked]);
  }

  return centers;
}

std::vector<Cluster> kmeans_clusters(const std::vector<RGB>& samples, uint32_t k, uint32_t seed)
{
  std::vector<Cluster> result;

  if (samples.empty() or (0 == k))
    return result;

  const double sample_count = static_cast<double>(samples.size());

  if (k >= samples.size())
  {
    result.reserve(samples.size());
    for (const RGB& sample : samples)
      result.push_back({.center = Color::from_rgb(sample), .members = 1, .weight = 1.0 / sample_count});
    return result;
  }

  std::vector<ClusterState> clusters;
  clusters.reserve(k);
  for (const RGB& center : kmeans_plus_plus_seeds(samples, k, seed))
    clusters.push_back({.center = center, .sum_r = 0, .sum_g = 0, .sum_b = 0, .members = 0});

  uint32_t iteration = 0;
  bool     changed   = true;

  while (changed and (TINT_KMEANS_MAX_ITERATIONS > iteration))
  {
    changed = false;

    for (ClusterState& cluster : clusters)
    {
      cluster.sum_r   = 0;
      cluster.sum_g   = 0;
      cluster.sum_b   = 0;
      cluster.members = 0;
    }

    for (const RGB& sample : samples)
    {
      ClusterState& cluster = clusters[nearest_center(sample, clusters)];
      cluster.sum_r += sample.r;
      cluster.sum_g += sample.g;
      cluster.sum_b += sample.b;
      cluster.members += 1;
    }

    for (ClusterState& cluster : clusters)
    {
      if (0 == cluster.members)
        continue;

      const RGB centroid = {
          .r = round_to_int(double(cluster.sum_r) / cluster.members),
          .g = round_to_int(double(cluster.sum_g) / cluster.members),
          .b = round_to_int(double(cluster.sum_b) / cluster.members),
      };

      if (redmean_distance(centroid, cluster.center) > TINT_KMEANS_MOVE_EPSILON)
      {
        cluster.center = centroid;
        changed        = true;
      }
    }

    iteration += 1;
  }

  SDL_LogVerbose(SDL_LOG_CATEGORY_APPLICATION, "k-means: %zu samples, k = %u, %u iterations, %s", samples.size(), k,
                 iteration, changed ? "iteration cap reached" : "converged");

  for (const ClusterState& cluster : clusters)
  {
    if (0 == cluster.members)
      continue;

    result.push_back({
        .center  = Color::from_rgb(cluster.center),
        .members = cluster.members,
        .weight  = cluster.members / sample_count,
    });
  }

  auto by_weight = [](const Cluster& lhs, const Cluster& rhs) { return lhs.weight > rhs.weight; };
  std::stable_sort(result.begin(), result.end(), by_weight);

  return result;
}

std::vector<Color> extract_palette(const std::vector<RGB>& samples, uint32_t k, uint32_t seed)
{
  std::vector<Color> result;
  for (const Cluster& cluster : kmeans_clusters(samples, k, seed))
    result.push_back(cluster.center);
  return result;
}

std::vector<DominantColor> find_dominant_colors(const std::vector<RGB>& samples, uint32_t count, int threshold)
{
  std::vector<DominantColor> result;

  if (samples.empty())
    return result;

  const int factor = SDL_max(1, threshold);

  std::vector<uint32_t> keys;
  keys.reserve(samples.size());
  for (const RGB& sample : samples)
    keys.push_back((quantize(sample.r, factor) << 16u) | (quantize(sample.g, factor) << 8u) | quantize(sample.b, factor));

  std::sort(keys.begin(), keys.end());

  const double total = static_cast<double>(samples.size());

  for (size_t begin = 0; begin < keys.size();)
  {
    size_t end = begin;
    while ((end < keys.size()) and (keys[end] == keys[begin]))
      ++end;

    const Color    color      = Color::from_hex(keys[begin]);
    const HSL      hsl        = color.hsl();
    const uint32_t occurrence = static_cast<uint32_t>(end - begin);
    const double   percentage = 100.0 * occurrence / total;

    result.push_back({
        .color      = color,
        .count      = occurrence,
        .percentage = percentage,
        .prominence = percentage * (hsl.s / 100.0) * (1.0 - SDL_fabs(hsl.l - 50.0) / 50.0),
    });

    begin = end;
  }

  auto by_prominence = [](const DominantColor& lhs, const DominantColor& rhs) {
    return lhs.prominence > rhs.prominence;
  };
  std::stable_sort(result.begin(), result.end(), by_prominence);

  if (result.size() > count)
    result.resize(count);

  return result;
}

const char* to_string(ColorTemperature temperature)
{
  switch (temperature)
  {
  case ColorTemperature::Warm:
    return "warm";
  case ColorTemperature::Cool:
    return "cool";
  case ColorTemperature::Neutral:
    return "neutral";
  default:
    return "N/A";
  }
}

ColorDistribution analyze_distribution(const std::vector<RGB>& samples)
{
  ColorDistribution result;

  if (samples.empty())
    return result;

  double total_saturation = 0.0;
  double total_lightness  = 0.0;

  for (const RGB& sample : samples)
  {
    const HSL hsl = rgb_to_hsl(sample);
    result.hue[round_to_int(hsl.h) % 360] += 1.0;
    result.saturation[clamp(round_to_int(hsl.s), 0, 100)] += 1.0;
    result.lightness[clamp(round_to_int(hsl.l), 0, 100)] += 1.0;
    total_saturation += hsl.s;
    total_lightness += hsl.l;
  }

  result.average_saturation = total_saturation / samples.size();
  result.average_lightness  = total_lightness / samples.size();

  auto normalize = [](double* bins, uint32_t n) {
    const double max = *std::max_element(bins, bins + n);
    if (0.0 < max)
      for (uint32_t i = 0; i < n; ++i)
        bins[i] /= max;
  };

  normalize(result.hue, 360);
  normalize(result.saturation, 101);
  normalize(result.lightness, 101);

  //
  // Peaks are strict local maxima of the hue histogram, first and last bin excluded.
  //
  struct Peak
  {
    uint32_t index;
    double   value;
  };

  std::vector<Peak> peaks;
  for (uint32_t i = 1; i < 359; ++i)
    if ((result.hue[i] > result.hue[i - 1]) and (result.hue[i] > result.hue[i + 1]))
      peaks.push_back({.index = i, .value = result.hue[i]});

  std::stable_sort(peaks.begin(), peaks.end(), [](const Peak& lhs, const Peak& rhs) { return lhs.value > rhs.value; });

  uint32_t warm = 0;
  uint32_t cool = 0;

  for (const Peak& peak : peaks)
  {
    if (3 == result.dominant_hue_count)
      break;

    result.dominant_hues[result.dominant_hue_count++] = peak.index;

    if ((60 >= peak.index) or (300 <= peak.index))
      warm += 1;
    else if ((120 <= peak.index) and (240 >= peak.index))
      cool += 1;
  }

  if (warm > cool)
    result.temperature = ColorTemperature::Warm;
  else if (cool > warm)
    result.temperature = ColorTemperature::Cool;

  return result;
}

} // namespace tint
