#define SDL_MAIN_HANDLED
#include "../sources/tint/scale.hh"
#include <SDL2/SDL.h>

using namespace tint;

namespace {

bool near(double expected, double actual, double epsilon)
{
  return SDL_fabs(expected - actual) <= epsilon;
}

bool is_gray(const Color& color)
{
  return (color.r == color.g) and (color.g == color.b);
}

const uint32_t seeds[] = {0x1890FF, 0xFF0000, 0x00B96B, 0x000000, 0xFFFFFF, 0x7F7F7F, 0xFAAD14, 0x722ED1};

void chromatic_light()
{
  const Color   seed    = Color::from_hex(0x1890FF);
  const Palette palette = generate_chromatic_palette(seed, ThemeMode::Light);

  SDL_assert(TINT_CHROMATIC_STEPS == palette.size());
  SDL_assert(6 == palette.center);
  SDL_assert(0 == SDL_strcmp("1", palette[0].label));
  SDL_assert(0 == SDL_strcmp("7", palette[palette.center].label));
  SDL_assert(0 == SDL_strcmp("12", palette[11].label));
  SDL_assert(seed == palette.find("7")->color);
  SDL_assert(nullptr == palette.find("13"));

  // lightest first
  SDL_assert(palette[0].color.luminance() > palette[6].color.luminance());
  SDL_assert(palette[6].color.luminance() > palette[11].color.luminance());
  SDL_assert(near(98.0, palette[0].color.hsv().v, 0.5));
}

void chromatic_dark()
{
  const Color   seed  = Color::from_hex(0x1890FF);
  const Palette light = generate_chromatic_palette(seed, ThemeMode::Light);
  const Palette dark  = generate_chromatic_palette(seed, ThemeMode::Dark);

  SDL_assert(TINT_CHROMATIC_STEPS == dark.size());
  SDL_assert(5 == dark.center);
  SDL_assert(0 == SDL_strcmp("6", dark[dark.center].label));
  SDL_assert(seed == dark[dark.center].color);

  // darkest first
  SDL_assert(dark[0].color.luminance() < dark[11].color.luminance());

  // same hue at the center, different value bounds at the extremes
  SDL_assert(light[light.center].color.hsl().h == dark[dark.center].color.hsl().h);
  SDL_assert(near(85.0, dark[11].color.hsv().v, 0.5));
  SDL_assert(light[0].color.hsv().v > dark[11].color.hsv().v);
  SDL_assert(light[11].color.hsv().v > dark[0].color.hsv().v);

  for (uint32_t hex : seeds)
  {
    const Color color = Color::from_hex(hex);
    SDL_assert(color == generate_chromatic_palette(color, ThemeMode::Light)[6].color);
    SDL_assert(color == generate_chromatic_palette(color, ThemeMode::Dark)[5].color);
  }
}

void gray_palettes()
{
  const Color seed = Color::from_hex(0x1890FF);

  const Palette neutral = generate_gray_palette(seed, ThemeMode::Light, false);
  SDL_assert(TINT_GRAY_STEPS == neutral.size());
  SDL_assert(7 == neutral.center);
  SDL_assert(0 == SDL_strcmp("8", neutral[neutral.center].label));
  SDL_assert(0 == SDL_strcmp("14", neutral[13].label));

  for (const PaletteEntry& entry : neutral.entries)
    SDL_assert(is_gray(entry.color));

  SDL_assert(near(50.0, neutral[7].color.hsl().l, 0.5));
  SDL_assert(near(98.0, neutral[0].color.hsl().l, 0.5));
  SDL_assert(near(15.0, neutral[13].color.hsl().l, 0.5));

  const Palette dark = generate_gray_palette(seed, ThemeMode::Dark, false);
  SDL_assert(near(35.0, dark[7].color.hsl().l, 0.5));
  SDL_assert(near(85.0, dark[0].color.hsl().l, 0.5));
  SDL_assert(near(12.0, dark[13].color.hsl().l, 0.5));

  // tinted grays carry the seed hue, strongest at the center step
  const Palette tinted = generate_gray_palette(seed, ThemeMode::Light, true, 1.0);
  SDL_assert(not is_gray(tinted[7].color));
  SDL_assert(tinted[7].color.hsl().s >= tinted[0].color.hsl().s);
  SDL_assert(tinted[7].color.hsl().s < 10.0);
  SDL_assert(tinted[7].color.hsl().h > 180.0);
  SDL_assert(tinted[7].color.hsl().h < 240.0);

  const Palette untinted = generate_gray_palette(seed, ThemeMode::Light, true, 0.0);
  for (const PaletteEntry& entry : untinted.entries)
    SDL_assert(is_gray(entry.color));
}

void generic_scales()
{
  const Color seed = Color::from_hex(0x1890FF);
  Palette     palette;

  SDL_assert(Status::ArgumentError == generate_scale(seed, 0, ThemeMode::Light, true, palette));
  SDL_assert(Status::ArgumentError == generate_scale(seed, 1, ThemeMode::Light, true, palette));
  SDL_assert(Status::ArgumentError == generate_scale(seed, TINT_MAX_PALETTE_STEPS + 1, ThemeMode::Light, true, palette));
  SDL_assert(0 < SDL_strlen(SDL_GetError()));

  SDL_assert(Status::Ok == generate_scale(seed, 10, ThemeMode::Light, false, palette));
  SDL_assert(10 == palette.size());
  SDL_assert(0 == SDL_strcmp("10", palette[9].label));
  SDL_assert(near(98.0, palette[0].color.hsl().l, 0.5));
  SDL_assert(near(4.0, palette[9].color.hsl().l, 0.5));

  SDL_assert(Status::Ok == generate_scale(seed, 10, ThemeMode::Dark, false, palette));
  SDL_assert(near(4.0, palette[0].color.hsl().l, 0.5));
  SDL_assert(near(90.0, palette[9].color.hsl().l, 0.5));

  // seed lightness 55 sits closest to the 5th of 10 light targets (61.2)
  SDL_assert(Status::Ok == generate_scale(seed, 10, ThemeMode::Light, true, palette));
  SDL_assert(4 == palette.center);
  SDL_assert(seed == palette[4].color);

  // and to the 7th of 10 dark targets (58.3)
  SDL_assert(Status::Ok == generate_scale(seed, 10, ThemeMode::Dark, true, palette));
  SDL_assert(6 == palette.center);
  SDL_assert(seed == palette[6].color);

  // twelve light steps land exactly on the natural shade curve
  const double natural[] = {98, 95, 90, 82, 71, 60, 48, 37, 27, 18, 10, 4};
  SDL_assert(Status::Ok == generate_scale(seed, 12, ThemeMode::Light, false, palette));
  for (uint32_t i = 0; i < 12; ++i)
    SDL_assert(near(natural[i], palette[i].color.hsl().l, 0.5));
}

void preserve_keeps_exactly_one_seed()
{
  const uint32_t  step_counts[] = {2, 3, 5, 10, 11, 32};
  const ThemeMode modes[]       = {ThemeMode::Light, ThemeMode::Dark};

  for (uint32_t hex : seeds)
  {
    const Color seed = Color::from_hex(hex);
    for (uint32_t steps : step_counts)
    {
      for (ThemeMode mode : modes)
      {
        Palette palette;
        SDL_assert(Status::Ok == generate_scale(seed, steps, mode, true, palette));
        SDL_assert(steps == palette.size());
        SDL_assert(1 == palette.count_matching(seed));
        SDL_assert(seed == palette[palette.center].color);
      }
    }
  }
}

void lightness_adjustment()
{
  const HSL base = {.h = 0.0, .s = 100.0, .l = 50.0};

  const HSL mid = adjust_for_lightness(base, 50.0);
  SDL_assert(0.0 == mid.h);
  SDL_assert(100.0 == mid.s);
  SDL_assert(50.0 == mid.l);

  const HSL bright = adjust_for_lightness(base, 95.0);
  SDL_assert(near(65.0, bright.s, 1e-9));
  SDL_assert(2.0 == bright.h);

  const HSL light = adjust_for_lightness(base, 80.0);
  SDL_assert(near(85.0, light.s, 1e-9));
  SDL_assert(0.0 == light.h);

  const HSL deep = adjust_for_lightness(base, 10.0);
  SDL_assert(near(90.0, deep.s, 1e-9));
  SDL_assert(358.0 == deep.h);

  const HSL shade = adjust_for_lightness(base, 30.0);
  SDL_assert(near(95.0, shade.s, 1e-9));
}

} // namespace

int main()
{
  SDL_Log("chromatic light");
  chromatic_light();
  SDL_Log("chromatic dark");
  chromatic_dark();
  SDL_Log("gray palettes");
  gray_palettes();
  SDL_Log("generic scales");
  generic_scales();
  SDL_Log("preserve keeps exactly one seed");
  preserve_keeps_exactly_one_seed();
  SDL_Log("lightness adjustment");
  lightness_adjustment();
  SDL_Log("Scales OK");
  return 0;
}
