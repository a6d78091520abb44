#include "scale.hh"
#include "math.hh"
#include <SDL2/SDL_error.h>
#include <SDL2/SDL_log.h>

namespace tint {

namespace {

struct ChromaticBounds
{
  double saturation_min;
  double saturation_max;
  double value_max;
  double value_min;
};

constexpr ChromaticBounds light_bounds = {
    .saturation_min = 3.0,
    .saturation_max = 95.0,
    .value_max      = 98.0,
    .value_min      = 18.0,
};

constexpr ChromaticBounds dark_bounds = {
    .saturation_min = 8.0,
    .saturation_max = 90.0,
    .value_max      = 85.0,
    .value_min      = 12.0,
};

//
// Lightness curves of the natural 12 shade scale ("50" .. "1000") and of the dark mode shades, darkest first.
// N-step scales resample them linearly, so a 12 step scale lands exactly on the table.
//
constexpr double natural_light_curve[TINT_CHROMATIC_STEPS] = {98, 95, 90, 82, 71, 60, 48, 37, 27, 18, 10, 4};
constexpr double natural_dark_curve[TINT_CHROMATIC_STEPS]  = {4, 8, 12, 18, 25, 35, 45, 55, 65, 75, 85, 90};

double curve_lightness(const double* curve, uint32_t step, uint32_t steps)
{
  const double   position = double(step) * (TINT_CHROMATIC_STEPS - 1) / double(steps - 1);
  const uint32_t lower    = static_cast<uint32_t>(SDL_floor(position));
  const uint32_t upper    = SDL_min(lower + 1, TINT_CHROMATIC_STEPS - 1);
  const double   t        = position - lower;

  return curve[lower] + (curve[upper] - curve[lower]) * t;
}

struct GrayCurve
{
  double center;
  double max;
  double min;
  double saturation_mul;
};

constexpr GrayCurve light_gray_curve = {.center = 50.0, .max = 98.0, .min = 15.0, .saturation_mul = 8.0};
constexpr GrayCurve dark_gray_curve  = {.center = 35.0, .max = 85.0, .min = 12.0, .saturation_mul = 12.0};

constexpr double hue_step = 1.2;

void step_label(uint32_t step, char (&label)[TINT_MAX_LABEL_LENGTH])
{
  SDL_snprintf(label, TINT_MAX_LABEL_LENGTH, "%u", step);
}

double shifted_hue(double h, bool lighter, uint32_t distance)
{
  const bool   cool  = (60.0 <= h) and (240.0 >= h);
  const double shift = hue_step * distance;

  double hue = (cool == lighter) ? (h - shift) : (h + shift);
  if (hue < 0.0)
    hue += 360.0;
  else if (hue >= 360.0)
    hue -= 360.0;

  return round_half_up(hue);
}

Color chromatic_step(const Color& seed, const HSV& hsv, uint32_t step, const ChromaticBounds& bounds)
{
  const uint32_t center = TINT_CHROMATIC_CENTER_STEP;

  if (center == step)
    return Color::from_rgb(seed.rgb());

  const bool     lighter  = step < center;
  const uint32_t distance = lighter ? (center - step) : (step - center);
  const double   s        = hsv.s;
  const double   v        = hsv.v;

  HSV result = {.h = shifted_hue(hsv.h, lighter, distance), .s = 0.0, .v = 0.0};

  if (lighter)
  {
    result.s = SDL_max(bounds.saturation_min, s - ((s - bounds.saturation_min) / 6.0) * distance);
    result.v = SDL_min(bounds.value_max, v + ((bounds.value_max - v) / 6.0) * distance);
  }
  else
  {
    result.s = SDL_min(bounds.saturation_max, s + ((bounds.saturation_max - s) / 5.0) * distance);
    result.v = SDL_max(bounds.value_min, v - ((v - bounds.value_min) / 5.0) * distance);
  }

  return Color::from_hsv(result);
}

double gray_lightness(uint32_t step, const GrayCurve& curve)
{
  const double center_step = TINT_GRAY_CENTER_STEP;
  const double last_step   = TINT_GRAY_STEPS;

  if (step < TINT_GRAY_CENTER_STEP)
    return curve.center + (curve.max - curve.center) * ((center_step - step) / (center_step - 1.0));
  if (step > TINT_GRAY_CENTER_STEP)
    return curve.center - (curve.center - curve.min) * ((step - center_step) / (last_step - center_step));
  return curve.center;
}

} // namespace

const char* to_string(ThemeMode mode)
{
  return (ThemeMode::Dark == mode) ? "dark" : "light";
}

void Palette::push(const char* label, const Color& color)
{
  PaletteEntry entry = {};
  SDL_strlcpy(entry.label, label, TINT_MAX_LABEL_LENGTH);
  entry.color = color;
  entries.push(entry);
}

const PaletteEntry* Palette::find(const char* label) const
{
  for (const PaletteEntry& entry : entries)
    if (0 == SDL_strcmp(entry.label, label))
      return &entry;
  return nullptr;
}

uint32_t Palette::count_matching(const Color& color) const
{
  uint32_t result = 0;
  for (const PaletteEntry& entry : entries)
    if (entry.color.packed() == color.packed())
      result += 1;
  return result;
}

Palette generate_chromatic_palette(const Color& seed, ThemeMode mode)
{
  const bool             dark   = (ThemeMode::Dark == mode);
  const ChromaticBounds& bounds = dark ? dark_bounds : light_bounds;
  const HSV              hsv    = seed.hsv();

  Color colors[TINT_CHROMATIC_STEPS] = {};
  for (uint32_t step = 1; step <= TINT_CHROMATIC_STEPS; ++step)
    colors[step - 1] = chromatic_step(seed, hsv, step, bounds);

  Palette result;
  char    label[TINT_MAX_LABEL_LENGTH] = {};

  for (uint32_t i = 0; i < TINT_CHROMATIC_STEPS; ++i)
  {
    // dark palettes read from the darkest step up
    const uint32_t source = dark ? (TINT_CHROMATIC_STEPS - 1 - i) : i;
    step_label(i + 1, label);
    result.push(label, colors[source]);
  }

  result.center = dark ? (TINT_CHROMATIC_STEPS - TINT_CHROMATIC_CENTER_STEP) : (TINT_CHROMATIC_CENTER_STEP - 1);
  return result;
}

Palette generate_gray_palette(const Color& seed, ThemeMode mode, bool mix_primary, double mix_ratio)
{
  const GrayCurve& curve          = (ThemeMode::Dark == mode) ? dark_gray_curve : light_gray_curve;
  const double     max_saturation = curve.saturation_mul * clamp(mix_ratio, 0.0, 1.0);
  const double     hue            = seed.hsl().h;

  Palette result;
  char    label[TINT_MAX_LABEL_LENGTH] = {};

  for (uint32_t step = 1; step <= TINT_GRAY_STEPS; ++step)
  {
    const double lightness = round_half_up(gray_lightness(step, curve));
    HSL          hsl       = {.h = 0.0, .s = 0.0, .l = lightness};

    if (mix_primary)
    {
      const double distance = SDL_fabs(double(step) - double(TINT_GRAY_CENTER_STEP)) / TINT_GRAY_CENTER_STEP;
      hsl.h                 = hue;
      hsl.s                 = round_half_up(clamp(max_saturation * (1.0 - distance), 0.0, max_saturation));
    }

    step_label(step, label);
    result.push(label, Color::from_hsl(hsl));
  }

  result.center = TINT_GRAY_CENTER_STEP - 1;
  return result;
}

HSL adjust_for_lightness(const HSL& base, double lightness)
{
  HSL result = {.h = base.h, .s = base.s, .l = lightness};

  if (lightness > 90.0)
    result.s *= 0.3 + (100.0 - lightness) * 0.07;
  else if (lightness > 70.0)
    result.s *= 0.7 + (90.0 - lightness) * 0.015;
  else if (lightness < 20.0)
    result.s *= 0.8 + lightness * 0.01;
  else if (lightness < 40.0)
    result.s *= 0.9 + (lightness - 20.0) * 0.005;

  if (lightness > 85.0)
    result.h = normalize_hue(result.h + 2.0);
  else if (lightness < 15.0)
    result.h = normalize_hue(result.h - 2.0);

  return result;
}

Status generate_scale(const Color& seed, uint32_t steps, ThemeMode mode, bool preserve, Palette& out)
{
  if ((2 > steps) or (TINT_MAX_PALETTE_STEPS < steps))
  {
    SDL_SetError("scale needs between 2 and %u steps, got %u", TINT_MAX_PALETTE_STEPS, steps);
    return Status::ArgumentError;
  }

  const double* curve = (ThemeMode::Dark == mode) ? natural_dark_curve : natural_light_curve;
  const HSL     base  = seed.hsl_rounded();

  Palette  result;
  char     label[TINT_MAX_LABEL_LENGTH] = {};
  uint32_t closest                      = 0;
  double   closest_delta                = 1000.0;

  for (uint32_t i = 0; i < steps; ++i)
  {
    const double target = curve_lightness(curve, i, steps);
    const double delta  = SDL_fabs(base.l - target);

    if (delta < closest_delta)
    {
      closest_delta = delta;
      closest       = i;
    }

    step_label(i + 1, label);
    result.push(label, Color::from_hsl(adjust_for_lightness(base, target)));
  }

  if (preserve)
    result.entries[closest].color = Color::from_rgb(seed.rgb());

  result.center = closest;
  SDL_LogVerbose(SDL_LOG_CATEGORY_APPLICATION, "%u step %s scale, center %u", steps, to_string(mode), closest + 1);

  out = result;
  return Status::Ok;
}

} // namespace tint
