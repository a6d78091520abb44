#define SDL_MAIN_HANDLED
#include "../sources/tint/semantic.hh"
#include <SDL2/SDL.h>

using namespace tint;

namespace {

bool same_hsl(const HSL& hsl, double h, double s, double l)
{
  return (h == hsl.h) and (s == hsl.s) and (l == hsl.l);
}

void derived_from_blue()
{
  const Color          primary = Color::from_hex(0x1890FF);
  const SemanticColors colors  = derive_semantic_colors(primary);

  SDL_assert(primary == colors.primary);
  SDL_assert(0 == SDL_strcmp("#99E052", colors.success.hex().text));
  SDL_assert(not colors.has_info);

  const HSL seed = primary.hsl_rounded();
  SDL_assert(same_hsl(success_target(seed), 90.0, 70.0, 60.0));
  SDL_assert(same_hsl(warning_target(seed), 38.0, 100.0, 65.0));
  SDL_assert(same_hsl(danger_target(seed), 0.0, 85.0, 55.0));
  SDL_assert(same_hsl(info_target(seed), 210.0, 70.0, 50.0));
  SDL_assert(same_hsl(gray_target(seed, true, 0.2), 209.0, 6.0, 50.0));
  SDL_assert(same_hsl(gray_target(seed, false, 0.2), 0.0, 0.0, 50.0));

  SDL_assert(Color::from_hsl(warning_target(seed)) == colors.warning);
  SDL_assert(Color::from_hsl(danger_target(seed)) == colors.danger);
  SDL_assert(Color::from_hsl(gray_target(seed, true, 0.2)) == colors.gray);
}

void hue_buckets()
{
  auto success_hue = [](double h) { return success_target({.h = h, .s = 50.0, .l = 50.0}).h; };
  auto warning_hue = [](double h) { return warning_target({.h = h, .s = 50.0, .l = 50.0}).h; };
  auto danger_hue  = [](double h) { return danger_target({.h = h, .s = 50.0, .l = 50.0}).h; };

  SDL_assert(120.0 == success_hue(0.0));
  SDL_assert(80.0 == success_hue(25.0));
  SDL_assert(100.0 == success_hue(100.0));
  SDL_assert(90.0 == success_hue(150.0));
  SDL_assert(100.0 == success_hue(210.0));
  SDL_assert(130.0 == success_hue(285.0));
  SDL_assert(120.0 == success_hue(335.0));

  SDL_assert(42.0 == warning_hue(0.0));
  SDL_assert(40.0 == warning_hue(60.0));
  SDL_assert(38.0 == warning_hue(140.0));
  SDL_assert(42.0 == warning_hue(240.0));

  SDL_assert(5.0 == danger_hue(15.0));
  SDL_assert(10.0 == danger_hue(60.0));
  SDL_assert(357.0 == danger_hue(140.0));
  SDL_assert(0.0 == danger_hue(190.0));
  SDL_assert(355.0 == danger_hue(240.0));
  SDL_assert(355.0 == danger_hue(355.0));
  SDL_assert(10.0 == danger_hue(10.0));
}

void saturation_and_lightness_bands()
{
  const HSL pale = {.h = 200.0, .s = 5.0, .l = 95.0};
  SDL_assert(same_hsl(success_target(pale), 90.0, 55.0, 60.0));
  SDL_assert(same_hsl(warning_target(pale), 38.0, 80.0, 65.0));
  SDL_assert(same_hsl(danger_target(pale), 0.0, 75.0, 55.0));
  SDL_assert(same_hsl(gray_target(pale, true, 0.2), 200.0, 3.0, 50.0));

  const HSL dark = {.h = 200.0, .s = 100.0, .l = 5.0};
  SDL_assert(same_hsl(success_target(dark), 90.0, 70.0, 45.0));
  SDL_assert(same_hsl(warning_target(dark), 38.0, 100.0, 55.0));
  SDL_assert(same_hsl(danger_target(dark), 0.0, 85.0, 45.0));

  // mix ratio above 1 behaves like 1
  SDL_assert(same_hsl(gray_target(dark, true, 4.0), 200.0, 8.0, 50.0));
}

void options_and_purity()
{
  const Color primary = Color::from_hex(0x722ED1);

  SemanticOptions options;
  options.include_info     = true;
  options.gray_mix_primary = false;

  const SemanticColors first  = derive_semantic_colors(primary, options);
  const SemanticColors second = derive_semantic_colors(primary, options);

  SDL_assert(first.has_info);
  SDL_assert(first.info == Color::from_hsl(info_target(primary.hsl_rounded())));
  SDL_assert(first.gray.r == first.gray.g);
  SDL_assert(first.gray.g == first.gray.b);

  SDL_assert(first.primary == second.primary);
  SDL_assert(first.success == second.success);
  SDL_assert(first.warning == second.warning);
  SDL_assert(first.danger == second.danger);
  SDL_assert(first.gray == second.gray);
  SDL_assert(first.info == second.info);

  // achromatic seeds work too
  const SemanticColors gray = derive_semantic_colors(Color::from_hex(0x808080));
  SDL_assert(gray.success == Color::from_hsl(success_target({.h = 0.0, .s = 0.0, .l = 50.0})));
}

} // namespace

int main()
{
  SDL_Log("derived from blue");
  derived_from_blue();
  SDL_Log("hue buckets");
  hue_buckets();
  SDL_Log("saturation and lightness bands");
  saturation_and_lightness_bands();
  SDL_Log("options and purity");
  options_and_purity();
  SDL_Log("SemanticColors OK");
  return 0;
}
