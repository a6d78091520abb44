#define SDL_MAIN_HANDLED
#include "../sources/tint/color.hh"
#include <SDL2/SDL.h>

using namespace tint;

namespace {

bool near(double expected, double actual, double epsilon)
{
  return SDL_fabs(expected - actual) <= epsilon;
}

bool close_rgb(const RGB& lhs, const RGB& rhs)
{
  return (1 >= SDL_abs(lhs.r - rhs.r)) and (1 >= SDL_abs(lhs.g - rhs.g)) and (1 >= SDL_abs(lhs.b - rhs.b));
}

const RGB samples[] = {
    {.r = 24, .g = 144, .b = 255}, {.r = 255, .g = 0, .b = 0},     {.r = 0, .g = 185, .b = 107},
    {.r = 250, .g = 173, .b = 20}, {.r = 114, .g = 46, .b = 209},  {.r = 1, .g = 2, .b = 3},
    {.r = 254, .g = 254, .b = 253}, {.r = 128, .g = 128, .b = 0},  {.r = 0, .g = 0, .b = 0},
    {.r = 255, .g = 255, .b = 255}, {.r = 77, .g = 77, .b = 77},   {.r = 200, .g = 30, .b = 150},
};

void achromatic_inputs()
{
  for (int value = 0; value <= 255; ++value)
  {
    const RGB gray = {.r = value, .g = value, .b = value};
    const HSL hsl  = rgb_to_hsl(gray);
    const HSV hsv  = rgb_to_hsv(gray);

    SDL_assert(0.0 == hsl.h);
    SDL_assert(0.0 == hsl.s);
    SDL_assert(0.0 == hsv.h);
    SDL_assert(0.0 == hsv.s);
    SDL_assert(near(value / 2.55, hsl.l, 1e-9));
  }
}

void cylindrical_round_trips()
{
  for (const RGB& rgb : samples)
  {
    SDL_assert(close_rgb(rgb, hsl_to_rgb(rgb_to_hsl(rgb))));
    SDL_assert(close_rgb(rgb, hsv_to_rgb(rgb_to_hsv(rgb))));
    SDL_assert(close_rgb(rgb, hwb_to_rgb(rgb_to_hwb(rgb))));
    SDL_assert(close_rgb(rgb, hsl_to_rgb(hsv_to_hsl(rgb_to_hsv(rgb)))));
    SDL_assert(close_rgb(rgb, hsv_to_rgb(hsl_to_hsv(rgb_to_hsl(rgb)))));
  }

  const HSL blue = rgb_to_hsl({.r = 24, .g = 144, .b = 255});
  SDL_assert(near(208.83, blue.h, 0.01));
  SDL_assert(near(100.0, blue.s, 1e-9));
  SDL_assert(near(54.71, blue.l, 0.01));

  // hue wraps, out of range saturation clamps
  SDL_assert(close_rgb({.r = 255, .g = 0, .b = 0}, hsl_to_rgb({.h = 360.0, .s = 150.0, .l = 50.0})));
  SDL_assert(close_rgb({.r = 0, .g = 0, .b = 255}, hsl_to_rgb({.h = -120.0, .s = 100.0, .l = 50.0})));
}

void hwb_gray_collapse()
{
  const RGB gray = hwb_to_rgb({.h = 200.0, .w = 60.0, .b = 60.0});
  SDL_assert(gray.r == gray.g);
  SDL_assert(gray.g == gray.b);
  SDL_assert(128 == gray.r);

  const HWB white = rgb_to_hwb({.r = 255, .g = 255, .b = 255});
  SDL_assert(near(100.0, white.w, 1e-9));
  SDL_assert(near(0.0, white.b, 1e-9));
}

void cie_spaces()
{
  const LAB white = rgb_to_lab({.r = 255, .g = 255, .b = 255});
  SDL_assert(near(100.0, white.l, 0.01));
  SDL_assert(near(0.0, white.a, 0.01));
  SDL_assert(near(0.0, white.b, 0.01));

  const LAB black = rgb_to_lab({.r = 0, .g = 0, .b = 0});
  SDL_assert(near(0.0, black.l, 1e-9));

  const LAB red = rgb_to_lab({.r = 255, .g = 0, .b = 0});
  SDL_assert(near(53.24, red.l, 0.05));
  SDL_assert(near(80.09, red.a, 0.05));
  SDL_assert(near(67.20, red.b, 0.05));

  const XYZ red_xyz = rgb_to_xyz({.r = 255, .g = 0, .b = 0});
  SDL_assert(near(41.246, red_xyz.x, 0.01));
  SDL_assert(near(21.267, red_xyz.y, 0.01));
  SDL_assert(near(1.933, red_xyz.z, 0.01));

  const LCH gray = rgb_to_lch({.r = 77, .g = 77, .b = 77});
  SDL_assert(near(0.0, gray.c, 0.01));

  const LCH red_lch = rgb_to_lch({.r = 255, .g = 0, .b = 0});
  SDL_assert(near(104.55, red_lch.c, 0.05));
  SDL_assert(near(40.0, red_lch.h, 0.1));

  for (const RGB& rgb : samples)
  {
    SDL_assert(close_rgb(rgb, xyz_to_rgb(rgb_to_xyz(rgb))));
    SDL_assert(close_rgb(rgb, lab_to_rgb(rgb_to_lab(rgb))));
    SDL_assert(close_rgb(rgb, lch_to_rgb(rgb_to_lch(rgb))));
  }
}

void ok_spaces()
{
  const OKLAB white = rgb_to_oklab({.r = 255, .g = 255, .b = 255});
  SDL_assert(near(1.0, white.l, 1e-3));
  SDL_assert(near(0.0, white.a, 1e-3));
  SDL_assert(near(0.0, white.b, 1e-3));

  const OKLAB red = rgb_to_oklab({.r = 255, .g = 0, .b = 0});
  SDL_assert(near(0.628, red.l, 1e-3));
  SDL_assert(near(0.2249, red.a, 1e-3));
  SDL_assert(near(0.1258, red.b, 1e-3));

  const OKLCH red_lch = rgb_to_oklch({.r = 255, .g = 0, .b = 0});
  SDL_assert(near(0.2577, red_lch.c, 1e-3));
  SDL_assert(near(29.23, red_lch.h, 0.1));

  for (const RGB& rgb : samples)
  {
    SDL_assert(close_rgb(rgb, oklab_to_rgb(rgb_to_oklab(rgb))));
    SDL_assert(close_rgb(rgb, oklch_to_rgb(rgb_to_oklch(rgb))));
  }
}

void color_factories()
{
  const Color seed = Color::from_hex(0x1890FF);

  SDL_assert(seed == Color::from_hsl(seed.hsl()));
  SDL_assert(seed == Color::from_hsv(seed.hsv()));
  SDL_assert(seed == Color::from_lab(seed.lab()));
  SDL_assert(seed == Color::from_oklch(seed.oklch()));

  const Color clamped = Color::from_rgb(-10, 300, 128, 5.0);
  SDL_assert(0 == clamped.r);
  SDL_assert(255 == clamped.g);
  SDL_assert(1.0 == clamped.alpha);

  // out of gamut LCH lands on the sRGB cube
  const Color vivid = Color::from_lch({.l = 50.0, .c = 230.0, .h = 140.0});
  SDL_assert((0 <= vivid.r) and (255 >= vivid.r));
  SDL_assert((0 <= vivid.g) and (255 >= vivid.g));
  SDL_assert((0 <= vivid.b) and (255 >= vivid.b));

  const HSL rounded = seed.hsl_rounded();
  SDL_assert(209.0 == rounded.h);
  SDL_assert(100.0 == rounded.s);
  SDL_assert(55.0 == rounded.l);
}

} // namespace

int main()
{
  SDL_Log("achromatic inputs");
  achromatic_inputs();
  SDL_Log("cylindrical round trips");
  cylindrical_round_trips();
  SDL_Log("hwb gray collapse");
  hwb_gray_collapse();
  SDL_Log("cie spaces");
  cie_spaces();
  SDL_Log("ok spaces");
  ok_spaces();
  SDL_Log("color factories");
  color_factories();
  SDL_Log("Conversions OK");
  return 0;
}
