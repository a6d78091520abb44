#define SDL_MAIN_HANDLED
#include "../sources/tint/harmony.hh"
#include <SDL2/SDL.h>

using namespace tint;

namespace {

bool near(double expected, double actual, double epsilon)
{
  return SDL_fabs(expected - actual) <= epsilon;
}

bool has_suggestion(const HarmonyResult& result, HarmonySuggestion suggestion)
{
  for (HarmonySuggestion s : result.suggestions)
    if (suggestion == s)
      return true;
  return false;
}

HarmonyResult generate(const Color& base, HarmonyType type)
{
  HarmonyOptions options;
  options.type = type;

  HarmonyResult result;
  const Status  status = generate_harmony(base, options, result);
  SDL_assert(Status::Ok == status);
  return result;
}

void classic_schemes()
{
  const Color red = Color::from_hex(0xFF0000);

  const HarmonyResult complementary = generate(red, HarmonyType::Complementary);
  SDL_assert(2 == complementary.colors.count);
  SDL_assert(0xFF0000 == complementary.colors[0].packed());
  SDL_assert(0x00FFFF == complementary.colors[1].packed());
  SDL_assert(85 == complementary.score);
  SDL_assert(100.0 == complementary.metrics.color_balance);
  SDL_assert(100.0 == complementary.metrics.contrast_range);
  SDL_assert(complementary.suggestions.empty());
  SDL_assert(red == complementary.base);

  const HarmonyResult triadic = generate(red, HarmonyType::Triadic);
  SDL_assert(3 == triadic.colors.count);
  SDL_assert(0xFF0000 == triadic.colors[0].packed());
  SDL_assert(0x00FF00 == triadic.colors[1].packed());
  SDL_assert(0x0000FF == triadic.colors[2].packed());
  SDL_assert(75 == triadic.score);
  SDL_assert(near(100.0, triadic.metrics.color_balance, 1e-9));
  SDL_assert(near(52.054, triadic.metrics.contrast_range, 0.01));
  SDL_assert(near(60.0, triadic.metrics.saturation_harmony, 1e-9));
  SDL_assert(1 == triadic.suggestions.count);
  SDL_assert(HarmonySuggestion::IncreaseContrastRange == triadic.suggestions[0]);

  const HarmonyResult analogous = generate(red, HarmonyType::Analogous);
  SDL_assert(3 == analogous.colors.count);
  SDL_assert(0xFF0080 == analogous.colors[0].packed());
  SDL_assert(0xFF8000 == analogous.colors[2].packed());
  SDL_assert(45 == analogous.score);

  SDL_assert(62 == generate(red, HarmonyType::SplitComplementary).score);
  SDL_assert(68 == generate(red, HarmonyType::Tetradic).score);
  SDL_assert(73 == generate(red, HarmonyType::Square).score);
  SDL_assert(4 == generate(red, HarmonyType::Clash).colors.count);
  SDL_assert(4 == generate(red, HarmonyType::DoubleComplementary).colors.count);
}

void monochromatic()
{
  const Color red = Color::from_hex(0xFF0000);

  const HarmonyResult result     = generate(red, HarmonyType::Monochromatic);
  const uint32_t      expected[] = {0xEC1313, 0xF50A0A, 0xFF0000, 0xF50A0A, 0xEC1313};

  SDL_assert(5 == result.colors.count);
  for (uint32_t i = 0; i < 5; ++i)
    SDL_assert(expected[i] == result.colors[i].packed());

  SDL_assert(31 == result.score);
  SDL_assert(has_suggestion(result, HarmonySuggestion::AdjustHueAngles));
  SDL_assert(has_suggestion(result, HarmonySuggestion::IncreaseContrastRange));
  SDL_assert(has_suggestion(result, HarmonySuggestion::TuneHueIntervals));
  SDL_assert(not has_suggestion(result, HarmonySuggestion::HarmonizeSaturation));

  HarmonyOptions options;
  options.type = HarmonyType::Monochromatic;
  HarmonyResult rejected;

  options.count         = 1;
  const Status too_few  = generate_harmony(red, options, rejected);
  options.count         = TINT_MAX_HARMONY_COLORS + 1;
  const Status too_many = generate_harmony(red, options, rejected);
  options.count         = TINT_MAX_HARMONY_COLORS;
  const Status at_limit = generate_harmony(red, options, rejected);

  SDL_assert(Status::ArgumentError == too_few);
  SDL_assert(Status::ArgumentError == too_many);
  SDL_assert(Status::Ok == at_limit);
  SDL_assert(TINT_MAX_HARMONY_COLORS == rejected.colors.count);

  // lightness spreads from darker to lighter around the base
  options.count     = 3;
  options.variation = 40.0;
  HarmonyResult spread;
  const Status  status = generate_harmony(red, options, spread);
  SDL_assert(Status::Ok == status);
  SDL_assert(near(30.0, spread.colors[0].hsl_rounded().l, 1.0));
  SDL_assert(near(70.0, spread.colors[2].hsl_rounded().l, 1.0));
}

void best_scheme()
{
  const HarmonyResult red = find_best_harmony(Color::from_hex(0xFF0000));
  SDL_assert(HarmonyType::Complementary == red.type);
  SDL_assert(85 == red.score);

  const HarmonyResult blue = find_best_harmony(Color::from_hex(0x1890FF));
  SDL_assert(HarmonyType::Triadic == blue.type);
  SDL_assert(71 == blue.score);
  SDL_assert(0x1A90FF == blue.colors[0].packed());
  SDL_assert(0xFF1A90 == blue.colors[1].packed());
  SDL_assert(0x90FF1A == blue.colors[2].packed());
}

void variation_and_custom_angles()
{
  const Color base = Color::from_hex(0x1890FF);

  HarmonyOptions options;
  options.type      = HarmonyType::Triadic;
  options.variation = 40.0;
  options.seed      = 3;

  HarmonyResult first;
  HarmonyResult second;
  const Status  first_status  = generate_harmony(base, options, first);
  const Status  second_status = generate_harmony(base, options, second);

  SDL_assert(Status::Ok == first_status);
  SDL_assert(Status::Ok == second_status);
  SDL_assert(3 == first.colors.count);
  for (uint32_t i = 0; i < first.colors.count; ++i)
    SDL_assert(first.colors[i] == second.colors[i]);
  SDL_assert(first.score == second.score);

  HarmonyOptions custom;
  custom.type = HarmonyType::Custom;
  custom.angles.push(0.0);
  custom.angles.push(90.0);

  HarmonyResult result;
  const Status  custom_status = generate_harmony(Color::from_hex(0xFF0000), custom, result);
  SDL_assert(Status::Ok == custom_status);
  SDL_assert(2 == result.colors.count);
  SDL_assert(0xFF0000 == result.colors[0].packed());
  SDL_assert(0x80FF00 == result.colors[1].packed());
  SDL_assert(not has_suggestion(result, HarmonySuggestion::TuneHueIntervals));

  // no angles at all still gives the base hue
  HarmonyOptions empty;
  empty.type = HarmonyType::Custom;
  const Status empty_status = generate_harmony(Color::from_hex(0xFF0000), empty, result);
  SDL_assert(Status::Ok == empty_status);
  SDL_assert(1 == result.colors.count);
  SDL_assert(0xFF0000 == result.colors[0].packed());
  SDL_assert(100 == result.score);
}

void accents_and_nature()
{
  const Color red = Color::from_hex(0xFF0000);

  const HarmonyResult accented = generate_accented_monochromatic(red);
  SDL_assert(HarmonyType::Monochromatic == accented.type);
  SDL_assert(6 == accented.colors.count);
  SDL_assert(red == accented.colors[2]);
  SDL_assert(0x00FFFF == accented.colors[5].packed());
  SDL_assert(near(70.0, accented.colors[0].hsl_rounded().l, 1.0));
  SDL_assert(near(30.0, accented.colors[4].hsl_rounded().l, 1.0));

  const HarmonyResult shifted = generate_accented_monochromatic(red, 120.0);
  SDL_assert(0x00FF00 == shifted.colors[5].packed());

  const NatureTheme themes[] = {NatureTheme::Forest, NatureTheme::Ocean, NatureTheme::Sunset, NatureTheme::Earth,
                                NatureTheme::Sky};
  for (NatureTheme theme : themes)
  {
    const HarmonyResult nature = generate_nature_harmony(red, theme);
    SDL_assert(HarmonyType::Custom == nature.type);
    SDL_assert(5 == nature.colors.count);
    SDL_assert(0xFF0000 == nature.colors[0].packed());
    SDL_assert(nature.suggestions.empty());
    SDL_assert((0 <= nature.score) and (100 >= nature.score));
  }
}

void optimization()
{
  const HarmonyResult mono    = generate(Color::from_hex(0xFF0000), HarmonyType::Monochromatic);
  const HarmonyColors tweaked = optimize_harmony(mono.colors, 100, 7);

  SDL_assert(mono.colors.count == tweaked.count);
  SDL_assert(mono.colors[0] == tweaked[0]);
  SDL_assert(harmony_score(evaluate_harmony(tweaked)) >= mono.score);

  // target already reached, nothing moves
  const HarmonyColors untouched = optimize_harmony(mono.colors, 0, 7);
  for (uint32_t i = 0; i < untouched.count; ++i)
    SDL_assert(mono.colors[i] == untouched[i]);

  HarmonyColors single;
  single.push(Color::from_hex(0x336699));
  const HarmonyMetrics metrics = evaluate_harmony(single);
  SDL_assert(100.0 == metrics.color_balance);
  SDL_assert(100.0 == metrics.hue_relation);
  SDL_assert(100 == harmony_score(metrics));
}

void names()
{
  const HarmonyType types[] = {HarmonyType::Monochromatic,      HarmonyType::Analogous,
                               HarmonyType::Complementary,      HarmonyType::SplitComplementary,
                               HarmonyType::Triadic,            HarmonyType::Tetradic,
                               HarmonyType::Square,             HarmonyType::DoubleComplementary,
                               HarmonyType::Clash,              HarmonyType::Custom};

  for (HarmonyType type : types)
  {
    HarmonyType parsed = HarmonyType::Custom;
    SDL_assert(parse_harmony_type(to_string(type), parsed));
    SDL_assert(type == parsed);
  }

  HarmonyType type = HarmonyType::Custom;
  SDL_assert(parse_harmony_type("Split-Complementary", type));
  SDL_assert(HarmonyType::SplitComplementary == type);
  SDL_assert(not parse_harmony_type("pentadic", type));

  NatureTheme theme = NatureTheme::Forest;
  SDL_assert(parse_nature_theme("ocean", theme));
  SDL_assert(NatureTheme::Ocean == theme);
  SDL_assert(not parse_nature_theme("desert", theme));

  SDL_assert(0 < SDL_strlen(to_string(HarmonySuggestion::BalanceLightness)));
}

} // namespace

int main()
{
  SDL_Log("classic schemes");
  classic_schemes();
  SDL_Log("monochromatic");
  monochromatic();
  SDL_Log("best scheme");
  best_scheme();
  SDL_Log("variation and custom angles");
  variation_and_custom_angles();
  SDL_Log("accents and nature");
  accents_and_nature();
  SDL_Log("optimization");
  optimization();
  SDL_Log("names");
  names();
  SDL_Log("Harmony OK");
  return 0;
}
