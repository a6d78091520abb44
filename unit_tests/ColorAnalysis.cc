#define SDL_MAIN_HANDLED
#include "../sources/tint/color.hh"
#include <SDL2/SDL.h>

using namespace tint;

namespace {

bool near(double expected, double actual, double epsilon)
{
  return SDL_fabs(expected - actual) <= epsilon;
}

bool same_rgb(const Color& color, int r, int g, int b)
{
  return (r == color.r) and (g == color.g) and (b == color.b);
}

void luminance_and_contrast()
{
  const Color white = Color::from_hex(0xFFFFFF);
  const Color black = Color::from_hex(0x000000);
  const Color gray  = Color::from_hex(0x777777);

  SDL_assert(near(1.0, white.luminance(), 1e-9));
  SDL_assert(near(0.0, black.luminance(), 1e-9));
  SDL_assert(near(21.0, contrast_ratio(white, black), 1e-9));
  SDL_assert(near(21.0, contrast_ratio(black, white), 1e-9));
  SDL_assert(near(1.0, white.contrast(white), 1e-9));

  SDL_assert(white.is_light());
  SDL_assert(black.is_dark());

  SDL_assert(is_wcag_compliant(black, white));
  SDL_assert(is_wcag_compliant(black, white, WcagLevel::AAA));

  // #777 on white sits just under 4.5:1
  SDL_assert(not is_wcag_compliant(gray, white, WcagLevel::AA, TextSize::Normal));
  SDL_assert(is_wcag_compliant(gray, white, WcagLevel::AA, TextSize::Large));
  SDL_assert(not is_wcag_compliant(gray, white, WcagLevel::AAA, TextSize::Large));
}

void manipulations()
{
  const Color red = Color::from_hex(0xFF0000);

  SDL_assert(same_rgb(red.lighten(10.0), 255, 51, 51));
  SDL_assert(same_rgb(red.darken(10.0), 204, 0, 0));
  SDL_assert(same_rgb(red.lighten(80.0), 255, 255, 255));
  SDL_assert(same_rgb(red.rotate(120.0), 0, 255, 0));
  SDL_assert(same_rgb(red.rotate(-120.0), 0, 0, 255));
  SDL_assert(same_rgb(red.grayscale(), 128, 128, 128));
  SDL_assert(same_rgb(red.desaturate(100.0), 128, 128, 128));

  const Color seed = Color::from_hex(0x1890FF);
  SDL_assert(same_rgb(seed.invert(), 231, 111, 0));
  SDL_assert(seed == seed.invert().invert());

  const Color mixed = Color::from_hex(0x000000).mix(Color::from_hex(0xFFFFFF));
  SDL_assert(same_rgb(mixed, 128, 128, 128));
  SDL_assert(Color::from_hex(0x000000) == Color::from_hex(0x000000).mix(Color::from_hex(0xFFFFFF), 0.0));
  SDL_assert(Color::from_hex(0xFFFFFF) == Color::from_hex(0x000000).mix(Color::from_hex(0xFFFFFF), 100.0));

  SDL_assert(1.0 == seed.with_alpha(2.0).alpha);
  SDL_assert(0.0 == seed.with_alpha(-1.0).alpha);
  SDL_assert(0.5 == seed.fade(50.0).alpha);
  SDL_assert(0.25 == seed.fade(50.0).fade(50.0).alpha);

  // manipulations never touch the source value
  SDL_assert(same_rgb(seed, 24, 144, 255));
  SDL_assert(1.0 == seed.alpha);
}

void encodings()
{
  const Color seed = Color::from_hex(0x1890FF);

  SDL_assert(0 == SDL_strcmp("#1890FF", seed.hex().text));
  SDL_assert(0 == SDL_strcmp("#1890FFFF", seed.hex(true).text));
  SDL_assert(0 == SDL_strcmp("rgb(24, 144, 255)", seed.rgb_string().text));
  SDL_assert(0 == SDL_strcmp("rgba(24, 144, 255, 1)", seed.rgb_string(true).text));
  SDL_assert(0 == SDL_strcmp("hsl(209, 100%, 55%)", seed.hsl_string().text));

  const Color half = seed.with_alpha(0.5);
  SDL_assert(0 == SDL_strcmp("rgba(24, 144, 255, 0.5)", half.rgb_string().text));
  SDL_assert(0 == SDL_strcmp("hsla(209, 100%, 55%, 0.5)", half.hsl_string().text));
  SDL_assert(0 == SDL_strcmp("#1890FF80", format_color(half, ColorFormat::Hex).text));
  SDL_assert(0 == SDL_strcmp("#1890FF", format_color(seed, ColorFormat::Hex).text));
  SDL_assert(0 == SDL_strcmp("rgb(24, 144, 255)", format_color(seed, ColorFormat::Rgb).text));

  const Color third = seed.with_alpha(1.0 / 3.0);
  SDL_assert(0 == SDL_strcmp("rgba(24, 144, 255, 0.333)", third.rgb_string().text));

  ColorFormat format = ColorFormat::Hex;
  SDL_assert(parse_color_format("HSL", format));
  SDL_assert(ColorFormat::Hsl == format);
  SDL_assert(not parse_color_format("cmyk", format));
  SDL_assert(ColorFormat::Hsl == format);
}

} // namespace

int main()
{
  SDL_Log("luminance and contrast");
  luminance_and_contrast();
  SDL_Log("manipulations");
  manipulations();
  SDL_Log("encodings");
  encodings();
  SDL_Log("ColorAnalysis OK");
  return 0;
}
