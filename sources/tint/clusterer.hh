#pragma once

#include "color.hh"
#include "tint_constants.hh"
#include <vector>

namespace tint {

struct SampleOptions
{
  uint32_t max_samples  = TINT_DEFAULT_MAX_SAMPLES;
  bool     ignore_white = false;
  bool     ignore_black = false;
};

//
// Walks a tightly packed RGBA8 buffer (width * height * 4 bytes) with a fixed stride so that at most
// max_samples pixels are visited. Mostly transparent pixels are always skipped.
//
std::vector<RGB> sample_pixels(const uint8_t* rgba, uint32_t width, uint32_t height,
                               const SampleOptions& options = SampleOptions());

// "redmean" weighted euclidean distance, cheap approximation of perceived difference
double redmean_distance(const RGB& lhs, const RGB& rhs);

//
// k-means++ seeding: the first center is drawn uniformly, every next one with probability proportional to the
// squared redmean distance from the closest center picked so far.
//
std::vector<RGB> kmeans_plus_plus_seeds(const std::vector<RGB>& samples, uint32_t k, uint32_t seed);

struct Cluster
{
  Color    center;
  uint32_t members;
  double   weight; // members / samples
};

//
// K-means with k-means++ seeding. Same samples, k and seed always give the same clusters.
// Only clusters with members are returned, heaviest first.
//
std::vector<Cluster> kmeans_clusters(const std::vector<RGB>& samples, uint32_t k, uint32_t seed);

// cluster centers of kmeans_clusters, heaviest first
std::vector<Color> extract_palette(const std::vector<RGB>& samples, uint32_t k, uint32_t seed);

struct DominantColor
{
  Color    color;
  uint32_t count;
  double   percentage;
  double   prominence;
};

std::vector<DominantColor> find_dominant_colors(const std::vector<RGB>& samples, uint32_t count = 3,
                                                int threshold = TINT_DOMINANT_QUANTIZE_STEP);

enum class ColorTemperature
{
  Warm,
  Cool,
  Neutral
};

const char* to_string(ColorTemperature temperature);

struct ColorDistribution
{
  double           hue[360]           = {};
  double           saturation[101]    = {};
  double           lightness[101]     = {};
  double           average_saturation = 0.0;
  double           average_lightness  = 0.0;
  uint32_t         dominant_hues[3]   = {};
  uint32_t         dominant_hue_count = 0;
  ColorTemperature temperature        = ColorTemperature::Neutral;
};

// histograms are normalized so their highest bin reads 1
ColorDistribution analyze_distribution(const std::vector<RGB>& samples);

} // namespace tint
