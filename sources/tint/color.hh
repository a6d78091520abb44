#pragma once

#include "color_spaces.hh"
#include <SDL2/SDL_stdinc.h>

namespace tint {

enum class WcagLevel
{
  AA,
  AAA
};

enum class TextSize
{
  Normal,
  Large
};

enum class ColorFormat
{
  Hex,
  Rgb,
  Hsl
};

// Fixed size text buffer for encoded colors. Longest output is "hsla(360, 100%, 100%, 0.123)".
struct ColorText
{
  char text[48] = {};
};

//
// Canonical color value: 8-bit sRGB channels plus alpha in [0, 1].
// All "modifying" methods return a new Color, the original value is never touched.
//
struct Color
{
  static Color from_rgb(int r, int g, int b, double alpha = 1.0);
  static Color from_rgb(const RGB& rgb, double alpha = 1.0);
  static Color from_hex(uint32_t rgb, double alpha = 1.0); // 0xRRGGBB
  static Color from_hsl(const HSL& hsl, double alpha = 1.0);
  static Color from_hsv(const HSV& hsv, double alpha = 1.0);
  static Color from_hwb(const HWB& hwb, double alpha = 1.0);
  static Color from_xyz(const XYZ& xyz, double alpha = 1.0);
  static Color from_lab(const LAB& lab, double alpha = 1.0);
  static Color from_lch(const LCH& lch, double alpha = 1.0);
  static Color from_oklab(const OKLAB& oklab, double alpha = 1.0);
  static Color from_oklch(const OKLCH& oklch, double alpha = 1.0);

  [[nodiscard]] RGB   rgb() const { return {.r = r, .g = g, .b = b}; }
  [[nodiscard]] HSL   hsl() const { return rgb_to_hsl(rgb()); }
  [[nodiscard]] HSL   hsl_rounded() const; // integer h, s, l with h in [0, 360)
  [[nodiscard]] HSV   hsv() const { return rgb_to_hsv(rgb()); }
  [[nodiscard]] HWB   hwb() const { return rgb_to_hwb(rgb()); }
  [[nodiscard]] XYZ   xyz() const { return rgb_to_xyz(rgb()); }
  [[nodiscard]] LAB   lab() const { return rgb_to_lab(rgb()); }
  [[nodiscard]] LCH   lch() const { return rgb_to_lch(rgb()); }
  [[nodiscard]] OKLAB oklab() const { return rgb_to_oklab(rgb()); }
  [[nodiscard]] OKLCH oklch() const { return rgb_to_oklch(rgb()); }

  [[nodiscard]] uint32_t packed() const { return (uint32_t(r) << 16u) | (uint32_t(g) << 8u) | uint32_t(b); }

  // "#RRGGBB" or "#RRGGBBAA", uppercase
  [[nodiscard]] ColorText hex(bool with_alpha = false) const;
  // "rgb(r, g, b)", switches to "rgba(r, g, b, a)" when alpha < 1 or forced
  [[nodiscard]] ColorText rgb_string(bool with_alpha = false) const;
  // "hsl(h, s%, l%)", switches to "hsla(h, s%, l%, a)" when alpha < 1 or forced
  [[nodiscard]] ColorText hsl_string(bool with_alpha = false) const;

  // WCAG 2.x relative luminance in [0, 1]
  [[nodiscard]] double luminance() const;
  [[nodiscard]] double contrast(const Color& other) const;
  [[nodiscard]] bool   is_light() const { return luminance() > 0.5; }
  [[nodiscard]] bool   is_dark() const { return not is_light(); }

  [[nodiscard]] Color lighten(double amount) const;
  [[nodiscard]] Color darken(double amount) const;
  [[nodiscard]] Color saturate(double amount) const;
  [[nodiscard]] Color desaturate(double amount) const;
  [[nodiscard]] Color rotate(double degrees) const;
  [[nodiscard]] Color grayscale() const;
  [[nodiscard]] Color invert() const;
  [[nodiscard]] Color mix(const Color& other, double amount = 50.0) const;
  [[nodiscard]] Color with_alpha(double new_alpha) const;
  [[nodiscard]] Color fade(double amount) const;

  bool operator==(const Color& rhs) const = default;

  int    r     = 0;
  int    g     = 0;
  int    b     = 0;
  double alpha = 1.0;
};

ColorText   format_color(const Color& color, ColorFormat format);
const char* to_string(ColorFormat format);
bool        parse_color_format(const char* name, ColorFormat& out);

double contrast_ratio(const Color& a, const Color& b);
bool   is_wcag_compliant(const Color& foreground, const Color& background, WcagLevel level = WcagLevel::AA,
                         TextSize size = TextSize::Normal);

} // namespace tint
