#include "delta_e.hh"
#include "math.hh"
#include "tint_constants.hh"
#include <SDL2/SDL_error.h>
#include <algorithm>

namespace tint {

namespace {

double chroma(const LAB& lab)
{
  return SDL_sqrt(square(lab.a) + square(lab.b));
}

// hue difference term shared by CIE94 and CMC, never negative
double hue_difference(const LAB& lab1, const LAB& lab2, double dc)
{
  return SDL_sqrt(SDL_max(0.0, square(lab1.a - lab2.a) + square(lab1.b - lab2.b) - square(dc)));
}

double pow7(double val)
{
  const double cubed = val * val * val;
  return cubed * cubed * val;
}

} // namespace

double delta_e_76(const Color& a, const Color& b)
{
  const LAB lab1 = a.lab();
  const LAB lab2 = b.lab();
  return Vec3d(lab1.l - lab2.l, lab1.a - lab2.a, lab1.b - lab2.b).len();
}

double delta_e_94(const Color& a, const Color& b, Cie94Application application)
{
  const LAB lab1 = a.lab();
  const LAB lab2 = b.lab();

  const double c1 = chroma(lab1);
  const double c2 = chroma(lab2);
  const double dl = lab1.l - lab2.l;
  const double dc = c1 - c2;
  const double dh = hue_difference(lab1, lab2, dc);

  const bool   textiles = (Cie94Application::Textiles == application);
  const double k1       = textiles ? 0.048 : 0.045;
  const double k2       = textiles ? 0.014 : 0.015;

  const double sc = 1.0 + k1 * c1;
  const double sh = 1.0 + k2 * c1;

  return Vec3d(dl, dc / sc, dh / sh).len();
}

double delta_e_2000(const Color& a, const Color& b)
{
  const LAB lab1 = a.lab();
  const LAB lab2 = b.lab();

  const double c_mean = (chroma(lab1) + chroma(lab2)) / 2.0;
  const double g      = 0.5 * (1.0 - SDL_sqrt(pow7(c_mean) / (pow7(c_mean) + pow7(25.0))));

  const double a1p = lab1.a * (1.0 + g);
  const double a2p = lab2.a * (1.0 + g);
  const double c1p = SDL_sqrt(square(a1p) + square(lab1.b));
  const double c2p = SDL_sqrt(square(a2p) + square(lab2.b));
  const double h1p = normalize_hue(to_deg(SDL_atan2(lab1.b, a1p)));
  const double h2p = normalize_hue(to_deg(SDL_atan2(lab2.b, a2p)));

  const double dlp = lab2.l - lab1.l;
  const double dcp = c2p - c1p;

  double dhp = 0.0;
  if (0.0 != (c1p * c2p))
  {
    dhp = h2p - h1p;
    if (dhp > 180.0)
      dhp -= 360.0;
    else if (dhp < -180.0)
      dhp += 360.0;
  }

  const double dHp = 2.0 * SDL_sqrt(c1p * c2p) * SDL_sin(to_rad(dhp / 2.0));

  const double lp = (lab1.l + lab2.l) / 2.0;
  const double cp = (c1p + c2p) / 2.0;

  double hp = h1p + h2p;
  if (0.0 != (c1p * c2p))
  {
    if (SDL_fabs(h1p - h2p) <= 180.0)
      hp = (h1p + h2p) / 2.0;
    else if ((h1p + h2p) < 360.0)
      hp = (h1p + h2p + 360.0) / 2.0;
    else
      hp = (h1p + h2p - 360.0) / 2.0;
  }

  const double t = 1.0 - 0.17 * SDL_cos(to_rad(hp - 30.0)) + 0.24 * SDL_cos(to_rad(2.0 * hp)) +
                   0.32 * SDL_cos(to_rad(3.0 * hp + 6.0)) - 0.20 * SDL_cos(to_rad(4.0 * hp - 63.0));

  const double d_theta = 30.0 * SDL_exp(-square((hp - 275.0) / 25.0));
  const double rc      = 2.0 * SDL_sqrt(pow7(cp) / (pow7(cp) + pow7(25.0)));
  const double sl      = 1.0 + (0.015 * square(lp - 50.0)) / SDL_sqrt(20.0 + square(lp - 50.0));
  const double sc      = 1.0 + 0.045 * cp;
  const double sh      = 1.0 + 0.015 * cp * t;
  const double rt      = -SDL_sin(to_rad(2.0 * d_theta)) * rc;

  const double lightness_term = dlp / sl;
  const double chroma_term    = dcp / sc;
  const double hue_term       = dHp / sh;

  const double sum = square(lightness_term) + square(chroma_term) + square(hue_term) + rt * chroma_term * hue_term;
  return SDL_sqrt(SDL_max(0.0, sum));
}

double delta_e_cmc(const Color& reference, const Color& sample, double lightness, double chroma_weight)
{
  const LAB lab1 = reference.lab();
  const LAB lab2 = sample.lab();

  const double c1 = chroma(lab1);
  const double c2 = chroma(lab2);
  const double dl = lab1.l - lab2.l;
  const double dc = c1 - c2;
  const double dh = hue_difference(lab1, lab2, dc);
  const double h1 = normalize_hue(to_deg(SDL_atan2(lab1.b, lab1.a)));

  const double c1_4 = square(square(c1));
  const double f    = SDL_sqrt(c1_4 / (c1_4 + 1900.0));
  const double t    = ((164.0 <= h1) and (345.0 >= h1)) ? 0.56 + SDL_fabs(0.2 * SDL_cos(to_rad(h1 + 168.0)))
                                                        : 0.36 + SDL_fabs(0.4 * SDL_cos(to_rad(h1 + 35.0)));

  const double sl = (lab1.l < 16.0) ? 0.511 : (0.040975 * lab1.l) / (1.0 + 0.01765 * lab1.l);
  const double sc = (0.0638 * c1) / (1.0 + 0.0131 * c1) + 0.638;
  const double sh = sc * (f * t + 1.0 - f);

  return Vec3d(dl / (lightness * sl), dc / (chroma_weight * sc), dh / sh).len();
}

double delta_e_oklab(const Color& a, const Color& b)
{
  const OKLAB lab1 = a.oklab();
  const OKLAB lab2 = b.oklab();
  return Vec3d(lab1.l - lab2.l, lab1.a - lab2.a, lab1.b - lab2.b).len();
}

double delta_e(const Color& a, const Color& b, const DeltaEOptions& options)
{
  switch (options.algorithm)
  {
  case DeltaEAlgorithm::CIE76:
    return delta_e_76(a, b);
  case DeltaEAlgorithm::CIE94:
    return delta_e_94(a, b, options.application);
  case DeltaEAlgorithm::CMC:
    return delta_e_cmc(a, b, options.cmc_lightness, options.cmc_chroma);
  case DeltaEAlgorithm::OKLAB:
    return delta_e_oklab(a, b);
  case DeltaEAlgorithm::CIEDE2000:
  default:
    return delta_e_2000(a, b);
  }
}

const char* to_string(DeltaEAlgorithm algorithm)
{
  switch (algorithm)
  {
  case DeltaEAlgorithm::CIE76:
    return "76";
  case DeltaEAlgorithm::CIE94:
    return "94";
  case DeltaEAlgorithm::CIEDE2000:
    return "2000";
  case DeltaEAlgorithm::CMC:
    return "cmc";
  case DeltaEAlgorithm::OKLAB:
    return "oklab";
  default:
    return "N/A";
  }
}

bool parse_delta_e_algorithm(const char* name, DeltaEAlgorithm& out)
{
  const DeltaEAlgorithm all[] = {DeltaEAlgorithm::CIE76, DeltaEAlgorithm::CIE94, DeltaEAlgorithm::CIEDE2000,
                                 DeltaEAlgorithm::CMC, DeltaEAlgorithm::OKLAB};

  for (DeltaEAlgorithm algorithm : all)
  {
    if (0 == SDL_strcasecmp(name, to_string(algorithm)))
    {
      out = algorithm;
      return true;
    }
  }

  SDL_SetError("unknown delta E algorithm '%s'", name);
  return false;
}

double jnd_threshold(DeltaEAlgorithm algorithm)
{
  return (DeltaEAlgorithm::CIE94 == algorithm) ? TINT_JND_DE94 : TINT_JND_DE2000;
}

DifferenceBand classify_difference(double delta_e)
{
  if (delta_e < 1e-9)
    return DifferenceBand::Identical;
  if (delta_e < 1.0)
    return DifferenceBand::Imperceptible;
  if (delta_e < 2.0)
    return DifferenceBand::BarelyPerceptible;
  if (delta_e <= 10.0)
    return DifferenceBand::Visible;
  return DifferenceBand::Distinct;
}

const char* to_string(DifferenceBand band)
{
  switch (band)
  {
  case DifferenceBand::Identical:
    return "identical";
  case DifferenceBand::Imperceptible:
    return "imperceptible";
  case DifferenceBand::BarelyPerceptible:
    return "barely perceptible";
  case DifferenceBand::Visible:
    return "visible";
  case DifferenceBand::Distinct:
    return "distinct";
  default:
    return "N/A";
  }
}

ColorSimilarity color_similarity(const Color& a, const Color& b, const DeltaEOptions& options)
{
  const double de = delta_e(a, b, options);

  return {
      .similarity  = SDL_exp(-de / TINT_SIMILARITY_FALLOFF),
      .delta_e     = de,
      .algorithm   = options.algorithm,
      .perceptible = de > jnd_threshold(options.algorithm),
  };
}

bool are_colors_distinguishable(const Color& a, const Color& b, double threshold, const DeltaEOptions& options)
{
  return delta_e(a, b, options) > threshold;
}

Status find_nearest_color(const Color& target, const std::vector<Color>& candidates, const DeltaEOptions& options,
                          NearestColor& out)
{
  if (candidates.empty())
  {
    SDL_SetError("no candidate colors to search");
    return Status::ArgumentError;
  }

  out = {.color = candidates[0], .index = 0, .delta_e = delta_e(target, candidates[0], options)};

  for (uint32_t i = 1; i < candidates.size(); ++i)
  {
    const double de = delta_e(target, candidates[i], options);
    if (de < out.delta_e)
      out = {.color = candidates[i], .index = i, .delta_e = de};
  }

  return Status::Ok;
}

std::vector<NearestColor> find_nearest_colors(const Color& target, const std::vector<Color>& candidates,
                                              uint32_t count, const DeltaEOptions& options)
{
  std::vector<NearestColor> result;
  result.reserve(candidates.size());

  for (uint32_t i = 0; i < candidates.size(); ++i)
    result.push_back({.color = candidates[i], .index = i, .delta_e = delta_e(target, candidates[i], options)});

  auto by_distance = [](const NearestColor& lhs, const NearestColor& rhs) { return lhs.delta_e < rhs.delta_e; };
  std::stable_sort(result.begin(), result.end(), by_distance);

  if (result.size() > count)
    result.resize(count);

  return result;
}

DistanceMatrix color_distance_matrix(const std::vector<Color>& colors, const DeltaEOptions& options)
{
  const auto n = static_cast<uint32_t>(colors.size());

  DistanceMatrix matrix;
  matrix.size = n;
  matrix.values.assign(n * n, 0.0);

  for (uint32_t i = 0; i < n; ++i)
  {
    for (uint32_t j = i + 1; j < n; ++j)
    {
      const double de           = delta_e(colors[i], colors[j], options);
      matrix.values[i * n + j] = de;
      matrix.values[j * n + i] = de;
    }
  }

  return matrix;
}

PaletteDiversity analyze_palette_diversity(const std::vector<Color>& colors, const DeltaEOptions& options)
{
  PaletteDiversity result;

  if (2 > colors.size())
    return result;

  const DistanceMatrix matrix = color_distance_matrix(colors, options);
  const uint32_t       n      = matrix.size;

  std::vector<double> distances;
  distances.reserve(n * (n - 1) / 2);
  for (uint32_t i = 0; i < n; ++i)
    for (uint32_t j = i + 1; j < n; ++j)
      distances.push_back(matrix.at(i, j));

  const double jnd = (DeltaEAlgorithm::CIEDE2000 == options.algorithm) ? TINT_JND_DE2000 : TINT_JND_DE94;

  double   sum                   = 0.0;
  uint32_t distinguishable_pairs = 0;
  result.min_delta_e             = distances[0];
  result.max_delta_e             = distances[0];

  for (double d : distances)
  {
    sum += d;
    result.min_delta_e = SDL_min(result.min_delta_e, d);
    result.max_delta_e = SDL_max(result.max_delta_e, d);
    if (d > jnd)
      distinguishable_pairs += 1;
  }

  result.average_delta_e = sum / distances.size();

  double variance = 0.0;
  for (double d : distances)
    variance += square(d - result.average_delta_e);
  result.standard_deviation = SDL_sqrt(variance / distances.size());

  result.distinguishable_percentage = 100.0 * distinguishable_pairs / distances.size();

  //
  // Connected components over the "closer than cutoff" graph, breadth first.
  //
  const double          cutoff = jnd * TINT_DIVERSITY_CLUSTER_MUL;
  std::vector<bool>     visited(n, false);
  std::vector<uint32_t> queue;
  queue.reserve(n);
  result.cluster_count = 0;

  for (uint32_t start = 0; start < n; ++start)
  {
    if (visited[start])
      continue;

    result.cluster_count += 1;
    visited[start] = true;
    queue.clear();
    queue.push_back(start);

    for (uint32_t head = 0; head < queue.size(); ++head)
    {
      const uint32_t current = queue[head];
      for (uint32_t j = 0; j < n; ++j)
      {
        if (not visited[j] and (matrix.at(current, j) < cutoff))
        {
          visited[j] = true;
          queue.push_back(j);
        }
      }
    }
  }

  const double normalized_average = SDL_min(result.average_delta_e / 50.0, 1.0);
  const double normalized_std     = SDL_min(result.standard_deviation / 30.0, 1.0);
  const double score = 0.4 * normalized_average + 0.3 * normalized_std + 0.3 * (result.distinguishable_percentage / 100.0);

  result.diversity_score = SDL_min(score, 1.0);
  return result;
}

} // namespace tint
