#pragma once

#include "color.hh"
#include "status.hh"
#include <vector>

namespace tint {

enum class DeltaEAlgorithm
{
  CIE76,
  CIE94,
  CIEDE2000,
  CMC,
  OKLAB
};

enum class Cie94Application
{
  GraphicArts,
  Textiles
};

struct DeltaEOptions
{
  DeltaEAlgorithm  algorithm     = DeltaEAlgorithm::CIEDE2000;
  Cie94Application application   = Cie94Application::GraphicArts;
  double           cmc_lightness = 2.0;
  double           cmc_chroma    = 1.0;
};

double delta_e_76(const Color& a, const Color& b);
double delta_e_94(const Color& a, const Color& b, Cie94Application application = Cie94Application::GraphicArts);
double delta_e_2000(const Color& a, const Color& b);
// CMC(l:c) is asymmetric, "reference" is the standard the "sample" is judged against
double delta_e_cmc(const Color& reference, const Color& sample, double lightness = 2.0, double chroma = 1.0);
double delta_e_oklab(const Color& a, const Color& b);
double delta_e(const Color& a, const Color& b, const DeltaEOptions& options = DeltaEOptions());

const char* to_string(DeltaEAlgorithm algorithm);
bool        parse_delta_e_algorithm(const char* name, DeltaEAlgorithm& out);

// just noticeable difference: 2.3 for CIEDE2000, 2.5 for CIE94, 2.3 for everything else
double jnd_threshold(DeltaEAlgorithm algorithm);

enum class DifferenceBand
{
  Identical,
  Imperceptible,     // < 1
  BarelyPerceptible, // 1 - 2
  Visible,           // 2 - 10
  Distinct           // > 10
};

DifferenceBand classify_difference(double delta_e);
const char*    to_string(DifferenceBand band);

struct ColorSimilarity
{
  double          similarity; // exp(-dE / 10), 1 for identical colors
  double          delta_e;
  DeltaEAlgorithm algorithm;
  bool            perceptible;
};

ColorSimilarity color_similarity(const Color& a, const Color& b, const DeltaEOptions& options = DeltaEOptions());
bool            are_colors_distinguishable(const Color& a, const Color& b, double threshold = 2.3,
                                           const DeltaEOptions& options = DeltaEOptions());

struct NearestColor
{
  Color    color;
  uint32_t index;
  double   delta_e;
};

// ArgumentError for an empty candidate list
Status find_nearest_color(const Color& target, const std::vector<Color>& candidates, const DeltaEOptions& options,
                          NearestColor& out);

// ascending by dE, at most "count" entries, stable for equal distances
std::vector<NearestColor> find_nearest_colors(const Color& target, const std::vector<Color>& candidates,
                                              uint32_t count = 5, const DeltaEOptions& options = DeltaEOptions());

// Symmetric NxN, row-major, zero diagonal.
struct DistanceMatrix
{
  [[nodiscard]] double at(uint32_t row, uint32_t column) const { return values[row * size + column]; }

  uint32_t            size = 0;
  std::vector<double> values;
};

DistanceMatrix color_distance_matrix(const std::vector<Color>& colors, const DeltaEOptions& options = DeltaEOptions());

struct PaletteDiversity
{
  double   diversity_score            = 0.0;
  double   average_delta_e            = 0.0;
  double   min_delta_e                = 0.0;
  double   max_delta_e                = 0.0;
  double   standard_deviation         = 0.0;
  double   distinguishable_percentage = 0.0;
  uint32_t cluster_count              = 1;
};

PaletteDiversity analyze_palette_diversity(const std::vector<Color>& colors,
                                           const DeltaEOptions&      options = DeltaEOptions());

} // namespace tint
