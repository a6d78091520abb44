#include "tailwind.hh"
#include "math.hh"

namespace tint {

namespace {

struct Shade
{
  const char* label;
  double      lightness;
};

constexpr Shade light_shades[TINT_TAILWIND_STEPS] = {
    {"50", 98},  {"100", 95}, {"200", 90}, {"300", 82}, {"400", 64}, {"500", 46},
    {"600", 35}, {"700", 27}, {"800", 20}, {"900", 15}, {"950", 10}, {"1000", 7},
};

constexpr Shade dark_shades[TINT_TAILWIND_STEPS] = {
    {"50", 90},  {"100", 85}, {"200", 75}, {"300", 65}, {"400", 55}, {"500", 45},
    {"600", 35}, {"700", 25}, {"800", 18}, {"900", 12}, {"950", 8},  {"1000", 4},
};

constexpr Shade light_gray_shades[TINT_TAILWIND_GRAY_STEPS] = {
    {"50", 98},  {"100", 95}, {"150", 93}, {"200", 88}, {"300", 80}, {"400", 71}, {"500", 60},
    {"600", 48}, {"700", 37}, {"800", 27}, {"850", 20}, {"900", 14}, {"950", 9},  {"1000", 5},
};

constexpr Shade dark_gray_shades[TINT_TAILWIND_GRAY_STEPS] = {
    {"50", 97},  {"100", 94}, {"150", 90}, {"200", 85}, {"300", 70}, {"400", 58}, {"500", 45},
    {"600", 32}, {"700", 22}, {"800", 16}, {"850", 12}, {"900", 10}, {"950", 7},  {"1000", 4},
};

// first shade with the smallest lightness distance wins
uint32_t closest_shade(const Shade* shades, uint32_t count, double lightness)
{
  uint32_t result     = 0;
  double   best_delta = SDL_fabs(shades[0].lightness - lightness);

  for (uint32_t i = 1; i < count; ++i)
  {
    const double delta = SDL_fabs(shades[i].lightness - lightness);
    if (delta < best_delta)
    {
      best_delta = delta;
      result     = i;
    }
  }

  return result;
}

double dark_saturation(double saturation, double lightness)
{
  if (lightness < 20.0)
    return SDL_max(20.0, saturation * 0.7);
  if (lightness > 70.0)
    return SDL_min(100.0, saturation * 1.15);
  if ((40.0 <= lightness) and (60.0 >= lightness))
    return saturation;
  return saturation * 0.95;
}

} // namespace

Palette generate_tailwind_scale(const Color& seed, bool preserve)
{
  const HSL base = seed.hsl_rounded();

  Palette result;
  for (const Shade& shade : light_shades)
    result.push(shade.label, Color::from_hsl({.h = base.h, .s = base.s, .l = shade.lightness}));

  result.center = closest_shade(light_shades, TINT_TAILWIND_STEPS, base.l);

  if (preserve)
    result.entries[result.center].color = Color::from_rgb(seed.rgb());

  return result;
}

Palette generate_tailwind_dark_scale(const Color& seed)
{
  const HSL base = seed.hsl_rounded();

  Palette result;
  for (const Shade& shade : dark_shades)
  {
    const HSL hsl = {.h = base.h, .s = dark_saturation(base.s, shade.lightness), .l = shade.lightness};
    result.push(shade.label, Color::from_hsl(hsl));
  }

  result.center = closest_shade(dark_shades, TINT_TAILWIND_STEPS, base.l);
  return result;
}

Palette generate_tailwind_gray_scale(ThemeMode mode)
{
  const Shade* shades = (ThemeMode::Dark == mode) ? dark_gray_shades : light_gray_shades;

  Palette result;
  for (uint32_t i = 0; i < TINT_TAILWIND_GRAY_STEPS; ++i)
    result.push(shades[i].label, Color::from_hsl({.h = 0.0, .s = 0.0, .l = shades[i].lightness}));

  result.center = closest_shade(shades, TINT_TAILWIND_GRAY_STEPS, 50.0);
  return result;
}

TailwindBases derive_tailwind_bases(const Color& primary)
{
  const double s = primary.hsl_rounded().s;

  return {
      .primary = primary,
      .success = Color::from_hsl({.h = 142.0, .s = clamp(s * 0.9, 45.0, 70.0), .l = 45.0}),
      .warning = Color::from_hsl({.h = 38.0, .s = clamp(s * 1.1, 60.0, 85.0), .l = 50.0}),
      .danger  = Color::from_hsl({.h = 4.0, .s = clamp(s, 50.0, 75.0), .l = 50.0}),
      .info    = Color::from_hsl({.h = 210.0, .s = clamp(s * 0.85, 40.0, 70.0), .l = 50.0}),
  };
}

} // namespace tint
