#pragma once

#include "color.hh"
#include "element_stack.hh"
#include "status.hh"
#include "tint_constants.hh"

namespace tint {

enum class HarmonyType
{
  Monochromatic,
  Analogous,
  Complementary,
  SplitComplementary,
  Triadic,
  Tetradic,
  Square,
  DoubleComplementary,
  Clash,
  Custom
};

const char* to_string(HarmonyType type);
bool        parse_harmony_type(const char* name, HarmonyType& out);

enum class NatureTheme
{
  Forest,
  Ocean,
  Sunset,
  Earth,
  Sky
};

const char* to_string(NatureTheme theme);
bool        parse_nature_theme(const char* name, NatureTheme& out);

using HarmonyColors = ElementStack<Color, TINT_MAX_HARMONY_COLORS>;
using HarmonyAngles = ElementStack<double, TINT_MAX_HARMONY_COLORS>;

struct HarmonyOptions
{
  HarmonyType   type      = HarmonyType::Complementary;
  uint32_t      count     = 5;   // monochromatic only
  double        variation = 0.0; // 0 .. 100, jitters lightness / saturation of every color
  uint32_t      seed      = 1;   // jitter source, same seed gives the same colors
  HarmonyAngles angles;          // custom only, hue offsets in degrees
};

// every metric is in [0, 100], higher is better
struct HarmonyMetrics
{
  double color_balance;
  double contrast_range;
  double saturation_harmony;
  double lightness_harmony;
  double hue_relation;
};

enum class HarmonySuggestion
{
  AdjustHueAngles,
  IncreaseContrastRange,
  HarmonizeSaturation,
  BalanceLightness,
  TuneHueIntervals
};

const char* to_string(HarmonySuggestion suggestion);

struct HarmonyResult
{
  HarmonyType                        type    = HarmonyType::Complementary;
  Color                              base;
  HarmonyColors                      colors;
  int                                score   = 0;
  HarmonyMetrics                     metrics = {};
  ElementStack<HarmonySuggestion, 5> suggestions;
};

//
// Colors at fixed hue offsets from the (rounded HSL) base, scored on hue balance, contrast spread,
// saturation and lightness spread and closeness to harmonic intervals.
// ArgumentError for a monochromatic count outside 2 .. TINT_MAX_HARMONY_COLORS.
//
Status generate_harmony(const Color& base, const HarmonyOptions& options, HarmonyResult& out);

HarmonyMetrics evaluate_harmony(const HarmonyColors& colors);
int            harmony_score(const HarmonyMetrics& metrics); // weighted, rounded

// highest scoring of the seven classic schemes, earlier scheme wins on ties
HarmonyResult find_best_harmony(const Color& base);

// five lightness / saturation variations of the base plus one accent color
HarmonyResult generate_accented_monochromatic(const Color& base, double accent_hue_shift = 180.0);

HarmonyResult generate_nature_harmony(const Color& base, NatureTheme theme);

//
// Random walk over every color but the first, keeping a step only when it raises the score.
// Stops at target_score or after TINT_HARMONY_OPTIMIZE_ATTEMPTS attempts.
//
HarmonyColors optimize_harmony(const HarmonyColors& colors, int target_score, uint32_t seed);

} // namespace tint
