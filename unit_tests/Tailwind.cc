#define SDL_MAIN_HANDLED
#include "../sources/tint/tailwind.hh"
#include <SDL2/SDL.h>

using namespace tint;

namespace {

const char* labels[] = {"50", "100", "200", "300", "400", "500", "600", "700", "800", "900", "950", "1000"};

void light_scale()
{
  const Color   seed    = Color::from_hex(0x1890FF);
  const Palette palette = generate_tailwind_scale(seed);

  SDL_assert(TINT_TAILWIND_STEPS == palette.size());
  for (uint32_t i = 0; i < TINT_TAILWIND_STEPS; ++i)
    SDL_assert(0 == SDL_strcmp(labels[i], palette[i].label));

  // lightness 55 is as far from "400" (64) as from "500" (46), the lighter shade wins
  SDL_assert(4 == palette.center);
  SDL_assert(seed == palette.find("400")->color);
  SDL_assert(1 == palette.count_matching(seed));

  const Palette generated = generate_tailwind_scale(seed, false);
  SDL_assert(4 == generated.center);
  SDL_assert(Color::from_hsl({.h = 209.0, .s = 100.0, .l = 64.0}) == generated[4].color);
  SDL_assert(Color::from_hsl({.h = 209.0, .s = 100.0, .l = 98.0}) == generated[0].color);
  SDL_assert(Color::from_hsl({.h = 209.0, .s = 100.0, .l = 7.0}) == generated[11].color);

  for (uint32_t i = 1; i < TINT_TAILWIND_STEPS; ++i)
    SDL_assert(generated[i - 1].color.luminance() >= generated[i].color.luminance());
}

void dark_scale()
{
  const Palette palette = generate_tailwind_dark_scale(Color::from_hex(0x1890FF));

  SDL_assert(TINT_TAILWIND_STEPS == palette.size());
  SDL_assert(4 == palette.center);
  SDL_assert(0 == SDL_strcmp("400", palette[palette.center].label));

  SDL_assert(Color::from_hsl({.h = 209.0, .s = 100.0, .l = 55.0}) == palette[4].color);
  SDL_assert(Color::from_hsl({.h = 209.0, .s = 100.0, .l = 90.0}) == palette[0].color);
  SDL_assert(Color::from_hsl({.h = 209.0, .s = 70.0, .l = 4.0}) == palette[11].color);
  SDL_assert(Color::from_hsl({.h = 209.0, .s = 95.0, .l = 35.0}) == palette[6].color);
}

void gray_scales()
{
  const char* gray_labels[] = {"50",  "100", "150", "200", "300", "400", "500",
                               "600", "700", "800", "850", "900", "950", "1000"};

  const Palette light = generate_tailwind_gray_scale(ThemeMode::Light);
  const Palette dark  = generate_tailwind_gray_scale(ThemeMode::Dark);

  SDL_assert(TINT_TAILWIND_GRAY_STEPS == light.size());
  SDL_assert(TINT_TAILWIND_GRAY_STEPS == dark.size());

  for (uint32_t i = 0; i < TINT_TAILWIND_GRAY_STEPS; ++i)
  {
    SDL_assert(0 == SDL_strcmp(gray_labels[i], light[i].label));
    SDL_assert(0 == SDL_strcmp(gray_labels[i], dark[i].label));
    SDL_assert((light[i].color.r == light[i].color.g) and (light[i].color.g == light[i].color.b));
    SDL_assert((dark[i].color.r == dark[i].color.g) and (dark[i].color.g == dark[i].color.b));
  }

  SDL_assert(0 == SDL_strcmp("600", light[light.center].label));
  SDL_assert(0 == SDL_strcmp("500", dark[dark.center].label));
}

void semantic_bases()
{
  const Color         primary = Color::from_hex(0x1890FF);
  const TailwindBases bases   = derive_tailwind_bases(primary);

  SDL_assert(primary == bases.primary);
  SDL_assert(Color::from_hsl({.h = 142.0, .s = 70.0, .l = 45.0}) == bases.success);
  SDL_assert(Color::from_hsl({.h = 38.0, .s = 85.0, .l = 50.0}) == bases.warning);
  SDL_assert(Color::from_hsl({.h = 4.0, .s = 75.0, .l = 50.0}) == bases.danger);
  SDL_assert(Color::from_hsl({.h = 210.0, .s = 70.0, .l = 50.0}) == bases.info);

  // low saturation seeds still get usable semantic bases
  const TailwindBases muted = derive_tailwind_bases(Color::from_hex(0x808080));
  SDL_assert(Color::from_hsl({.h = 142.0, .s = 45.0, .l = 45.0}) == muted.success);
  SDL_assert(Color::from_hsl({.h = 4.0, .s = 50.0, .l = 50.0}) == muted.danger);
}

} // namespace

int main()
{
  SDL_Log("light scale");
  light_scale();
  SDL_Log("dark scale");
  dark_scale();
  SDL_Log("gray scales");
  gray_scales();
  SDL_Log("semantic bases");
  semantic_bases();
  SDL_Log("Tailwind OK");
  return 0;
}
