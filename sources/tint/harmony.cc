#include "harmony.hh"
#include "math.hh"
#include <SDL2/SDL_error.h>
#include <SDL2/SDL_log.h>
#include <algorithm>
#include <random>

namespace tint {

namespace {

struct SchemeAngles
{
  double   offsets[4];
  uint32_t count;
};

SchemeAngles scheme_angles(HarmonyType type)
{
  switch (type)
  {
  case HarmonyType::Analogous:
    return {.offsets = {-30, 0, 30}, .count = 3};
  case HarmonyType::Complementary:
    return {.offsets = {0, 180}, .count = 2};
  case HarmonyType::SplitComplementary:
    return {.offsets = {0, 150, 210}, .count = 3};
  case HarmonyType::Triadic:
    return {.offsets = {0, 120, 240}, .count = 3};
  case HarmonyType::Tetradic:
    return {.offsets = {0, 60, 180, 240}, .count = 4};
  case HarmonyType::Square:
    return {.offsets = {0, 90, 180, 270}, .count = 4};
  case HarmonyType::DoubleComplementary:
    return {.offsets = {0, 30, 180, 210}, .count = 4};
  case HarmonyType::Clash:
    return {.offsets = {0, 77, 154, 308}, .count = 4};
  default:
    return {.offsets = {0}, .count = 1};
  }
}

struct NatureShift
{
  double hue[5];
  double saturation[5];
  double lightness[5];
};

NatureShift nature_shift(NatureTheme theme)
{
  switch (theme)
  {
  case NatureTheme::Forest:
    return {{0, 15, -15, 30, 45}, {1, 0.8, 1.2, 0.7, 0.9}, {0, 10, -10, 15, -5}};
  case NatureTheme::Ocean:
    return {{0, -20, 20, -40, 10}, {1, 0.7, 1.1, 0.6, 0.9}, {0, 15, -10, 20, 5}};
  case NatureTheme::Sunset:
    return {{0, -30, 30, -60, 15}, {1, 1.2, 1.1, 0.8, 1.15}, {0, -10, 10, 15, -5}};
  case NatureTheme::Earth:
    return {{0, 10, -10, 20, -5}, {1, 0.6, 0.7, 0.5, 0.8}, {0, -15, 10, -20, 5}};
  case NatureTheme::Sky:
  default:
    return {{0, 30, -15, 45, 15}, {1, 0.7, 0.8, 0.6, 0.75}, {0, 20, 10, 25, 15}};
  }
}

Color from_hsl_clamped(double h, double s, double l)
{
  return Color::from_hsl({.h = normalize_hue(h), .s = clamp(s, 0.0, 100.0), .l = clamp(l, 0.0, 100.0)});
}

double color_balance(const HSL* hsl, uint32_t n)
{
  if (3 > n)
    return 100.0;

  double hues[TINT_MAX_HARMONY_COLORS] = {};
  for (uint32_t i = 0; i < n; ++i)
    hues[i] = hsl[i].h;
  std::sort(hues, hues + n);

  const double ideal    = 360.0 / n;
  double       variance = 0.0;

  for (uint32_t i = 0; i < n; ++i)
  {
    const uint32_t next = (i + 1) % n;
    const double   gap  = (0 == next) ? (360.0 - hues[i] + hues[0]) : (hues[next] - hues[i]);
    variance += square(gap - ideal);
  }
  variance /= n;

  return SDL_max(0.0, 100.0 - (SDL_sqrt(variance) / ideal) * 100.0);
}

double contrast_range(const HarmonyColors& colors)
{
  double min_contrast = 21.0;
  double max_contrast = 1.0;

  for (uint32_t i = 0; i < colors.count; ++i)
  {
    for (uint32_t j = i + 1; j < colors.count; ++j)
    {
      const double contrast = colors[i].contrast(colors[j]);
      min_contrast          = SDL_min(min_contrast, contrast);
      max_contrast          = SDL_max(max_contrast, contrast);
    }
  }

  // usable contrasts sit between 3 and 15
  if ((3.0 <= min_contrast) and (15.0 >= max_contrast))
    return 100.0;

  const double penalty = SDL_fabs(min_contrast - 3.0) + SDL_fabs(max_contrast - 15.0);
  return SDL_max(0.0, 100.0 - penalty * 5.0);
}

// best when the standard deviation of the channel matches the ideal one
double spread_harmony(const double* values, uint32_t n, double ideal_deviation)
{
  double mean = 0.0;
  for (uint32_t i = 0; i < n; ++i)
    mean += values[i];
  mean /= n;

  double variance = 0.0;
  for (uint32_t i = 0; i < n; ++i)
    variance += square(values[i] - mean);
  variance /= n;

  return clamp(100.0 - SDL_fabs(SDL_sqrt(variance) - ideal_deviation) * 2.0, 0.0, 100.0);
}

double hue_relation(const HSL* hsl, uint32_t n)
{
  const double intervals[] = {30, 60, 90, 120, 150, 180};
  double       score       = 100.0;

  for (uint32_t i = 0; i < n; ++i)
  {
    for (uint32_t j = i + 1; j < n; ++j)
    {
      const double difference = SDL_fabs(hsl[i].h - hsl[j].h);
      const double distance   = SDL_min(difference, 360.0 - difference);

      double closest = intervals[0];
      for (double interval : intervals)
        if (SDL_fabs(interval - distance) < SDL_fabs(closest - distance))
          closest = interval;

      score -= SDL_fabs(closest - distance) * 0.5;
    }
  }

  return clamp(score, 0.0, 100.0);
}

void fill_suggestions(HarmonyResult& result)
{
  const HarmonyMetrics& m = result.metrics;

  if (TINT_HARMONY_WEAK_METRIC > m.color_balance)
    result.suggestions.push(HarmonySuggestion::AdjustHueAngles);
  if (TINT_HARMONY_WEAK_METRIC > m.contrast_range)
    result.suggestions.push(HarmonySuggestion::IncreaseContrastRange);
  if (TINT_HARMONY_WEAK_METRIC > m.saturation_harmony)
    result.suggestions.push(HarmonySuggestion::HarmonizeSaturation);
  if (TINT_HARMONY_WEAK_METRIC > m.lightness_harmony)
    result.suggestions.push(HarmonySuggestion::BalanceLightness);
  if ((TINT_HARMONY_WEAK_METRIC > m.hue_relation) and (HarmonyType::Custom != result.type))
    result.suggestions.push(HarmonySuggestion::TuneHueIntervals);
}

HarmonyResult scored(HarmonyType type, const Color& base, const HarmonyColors& colors)
{
  HarmonyResult result;
  result.type    = type;
  result.base    = base;
  result.colors  = colors;
  result.metrics = evaluate_harmony(colors);
  result.score   = harmony_score(result.metrics);
  return result;
}

} // namespace

const char* to_string(HarmonyType type)
{
  switch (type)
  {
  case HarmonyType::Monochromatic:
    return "monochromatic";
  case HarmonyType::Analogous:
    return "analogous";
  case HarmonyType::Complementary:
    return "complementary";
  case HarmonyType::SplitComplementary:
    return "split-complementary";
  case HarmonyType::Triadic:
    return "triadic";
  case HarmonyType::Tetradic:
    return "tetradic";
  case HarmonyType::Square:
    return "square";
  case HarmonyType::DoubleComplementary:
    return "double-complementary";
  case HarmonyType::Clash:
    return "clash";
  case HarmonyType::Custom:
    return "custom";
  default:
    return "N/A";
  }
}

bool parse_harmony_type(const char* name, HarmonyType& out)
{
  const HarmonyType all[] = {
      HarmonyType::Monochromatic,       HarmonyType::Analogous, HarmonyType::Complementary,
      HarmonyType::SplitComplementary,  HarmonyType::Triadic,   HarmonyType::Tetradic,
      HarmonyType::Square,              HarmonyType::Clash,     HarmonyType::DoubleComplementary,
      HarmonyType::Custom,
  };

  for (HarmonyType type : all)
  {
    if (0 == SDL_strcasecmp(name, to_string(type)))
    {
      out = type;
      return true;
    }
  }

  SDL_SetError("unknown harmony '%s'", name);
  return false;
}

const char* to_string(NatureTheme theme)
{
  switch (theme)
  {
  case NatureTheme::Forest:
    return "forest";
  case NatureTheme::Ocean:
    return "ocean";
  case NatureTheme::Sunset:
    return "sunset";
  case NatureTheme::Earth:
    return "earth";
  case NatureTheme::Sky:
    return "sky";
  default:
    return "N/A";
  }
}

bool parse_nature_theme(const char* name, NatureTheme& out)
{
  const NatureTheme all[] = {NatureTheme::Forest, NatureTheme::Ocean, NatureTheme::Sunset, NatureTheme::Earth,
                             NatureTheme::Sky};

  for (NatureTheme theme : all)
  {
    if (0 == SDL_strcasecmp(name, to_string(theme)))
    {
      out = theme;
      return true;
    }
  }

  SDL_SetError("unknown nature theme '%s'", name);
  return false;
}

const char* to_string(HarmonySuggestion suggestion)
{
  switch (suggestion)
  {
  case HarmonySuggestion::AdjustHueAngles:
    return "adjust hue angles for a more even hue distribution";
  case HarmonySuggestion::IncreaseContrastRange:
    return "vary lightness more for a wider contrast range";
  case HarmonySuggestion::HarmonizeSaturation:
    return "bring saturation levels closer together";
  case HarmonySuggestion::BalanceLightness:
    return "balance lightness values";
  case HarmonySuggestion::TuneHueIntervals:
    return "move hue angles towards harmonic intervals";
  default:
    return "N/A";
  }
}

Status generate_harmony(const Color& base, const HarmonyOptions& options, HarmonyResult& out)
{
  const HSL     hsl = base.hsl_rounded();
  HarmonyColors colors;

  if (HarmonyType::Monochromatic == options.type)
  {
    if ((2 > options.count) or (TINT_MAX_HARMONY_COLORS < options.count))
    {
      SDL_SetError("monochromatic harmony needs between 2 and %u colors, got %u", TINT_MAX_HARMONY_COLORS,
                   options.count);
      return Status::ArgumentError;
    }

    for (uint32_t i = 0; i < options.count; ++i)
    {
      const double t          = double(i) / double(options.count - 1);
      const double lightness  = hsl.l + (t - 0.5) * options.variation;
      const double saturation = hsl.s * (1.0 - SDL_fabs(t - 0.5) * 0.3);
      colors.push(from_hsl_clamped(hsl.h, saturation, lightness));
    }
  }
  else
  {
    HarmonyAngles angles;

    if (HarmonyType::Custom == options.type)
    {
      angles = options.angles;
      if (angles.empty())
        angles.push(0.0);
    }
    else
    {
      const SchemeAngles scheme = scheme_angles(options.type);
      for (uint32_t i = 0; i < scheme.count; ++i)
        angles.push(scheme.offsets[i]);
    }

    std::mt19937                           generator(options.seed);
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    for (double angle : angles)
    {
      double saturation = hsl.s;
      double lightness  = hsl.l;

      if (0.0 < options.variation)
      {
        const double factor = (unit(generator) - 0.5) * (options.variation / 100.0);
        lightness           = clamp(lightness * (1.0 + factor), 0.0, 100.0);
        saturation          = clamp(saturation * (1.0 + factor * 0.5), 0.0, 100.0);
      }

      colors.push(from_hsl_clamped(hsl.h + angle, saturation, lightness));
    }
  }

  out = scored(options.type, base, colors);
  fill_suggestions(out);
  return Status::Ok;
}

HarmonyMetrics evaluate_harmony(const HarmonyColors& colors)
{
  const uint32_t n = colors.count;

  if (2 > n)
    return {
        .color_balance      = 100.0,
        .contrast_range     = 100.0,
        .saturation_harmony = 100.0,
        .lightness_harmony  = 100.0,
        .hue_relation       = 100.0,
    };

  HSL    hsl[TINT_MAX_HARMONY_COLORS]        = {};
  double saturation[TINT_MAX_HARMONY_COLORS] = {};
  double lightness[TINT_MAX_HARMONY_COLORS]  = {};

  for (uint32_t i = 0; i < n; ++i)
  {
    hsl[i]        = colors[i].hsl_rounded();
    saturation[i] = hsl[i].s;
    lightness[i]  = hsl[i].l;
  }

  return {
      .color_balance      = color_balance(hsl, n),
      .contrast_range     = contrast_range(colors),
      .saturation_harmony = spread_harmony(saturation, n, 20.0),
      .lightness_harmony  = spread_harmony(lightness, n, SDL_sqrt(300.0)),
      .hue_relation       = hue_relation(hsl, n),
  };
}

int harmony_score(const HarmonyMetrics& metrics)
{
  return round_to_int(0.25 * metrics.color_balance + 0.20 * metrics.contrast_range +
                      0.20 * metrics.saturation_harmony + 0.20 * metrics.lightness_harmony +
                      0.15 * metrics.hue_relation);
}

HarmonyResult find_best_harmony(const Color& base)
{
  const HarmonyType candidates[] = {HarmonyType::Monochromatic,      HarmonyType::Analogous,
                                    HarmonyType::Complementary,      HarmonyType::SplitComplementary,
                                    HarmonyType::Triadic,            HarmonyType::Tetradic,
                                    HarmonyType::Square};

  HarmonyResult best;
  bool          found = false;

  for (HarmonyType type : candidates)
  {
    HarmonyOptions options;
    options.type = type;

    HarmonyResult candidate;
    if (Status::Ok != generate_harmony(base, options, candidate))
      continue;

    SDL_LogVerbose(SDL_LOG_CATEGORY_APPLICATION, "harmony %s scores %d", to_string(type), candidate.score);

    if ((not found) or (candidate.score > best.score))
    {
      best  = candidate;
      found = true;
    }
  }

  return best;
}

HarmonyResult generate_accented_monochromatic(const Color& base, double accent_hue_shift)
{
  const HSL hsl = base.hsl_rounded();

  HarmonyColors colors;
  colors.push(from_hsl_clamped(hsl.h, hsl.s * 0.6, hsl.l + 20.0));
  colors.push(from_hsl_clamped(hsl.h, hsl.s * 0.8, hsl.l + 10.0));
  colors.push(base);
  colors.push(from_hsl_clamped(hsl.h, hsl.s * 1.1, hsl.l - 10.0));
  colors.push(from_hsl_clamped(hsl.h, hsl.s * 1.2, hsl.l - 20.0));
  colors.push(from_hsl_clamped(hsl.h + accent_hue_shift, hsl.s * 1.2, hsl.l));

  HarmonyResult result = scored(HarmonyType::Monochromatic, base, colors);
  fill_suggestions(result);
  return result;
}

HarmonyResult generate_nature_harmony(const Color& base, NatureTheme theme)
{
  const HSL         hsl   = base.hsl_rounded();
  const NatureShift shift = nature_shift(theme);

  HarmonyColors colors;
  for (uint32_t i = 0; i < 5; ++i)
    colors.push(from_hsl_clamped(hsl.h + shift.hue[i], hsl.s * shift.saturation[i], hsl.l + shift.lightness[i]));

  return scored(HarmonyType::Custom, base, colors);
}

HarmonyColors optimize_harmony(const HarmonyColors& colors, int target_score, uint32_t seed)
{
  HarmonyColors current       = colors;
  int           current_score = harmony_score(evaluate_harmony(current));

  std::mt19937                           generator(seed);
  std::uniform_real_distribution<double> jitter(-5.0, 5.0);

  for (uint32_t attempt = 0; (attempt < TINT_HARMONY_OPTIMIZE_ATTEMPTS) and (current_score < target_score); ++attempt)
  {
    HarmonyColors adjusted = current;

    // first color is the base and stays put
    for (uint32_t i = 1; i < adjusted.count; ++i)
    {
      const HSL hsl = adjusted[i].hsl_rounded();
      adjusted[i]   = from_hsl_clamped(hsl.h + jitter(generator), hsl.s + jitter(generator), hsl.l + jitter(generator));
    }

    const int adjusted_score = harmony_score(evaluate_harmony(adjusted));
    if (adjusted_score > current_score)
    {
      current       = adjusted;
      current_score = adjusted_score;
    }
  }

  return current;
}

} // namespace tint
