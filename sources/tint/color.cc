#include "color.hh"
#include "math.hh"
#include <SDL2/SDL_error.h>

namespace tint {

namespace {

double clamp_alpha(double alpha)
{
  // NaN falls through both comparisons of clamp, treat it as opaque
  if (alpha != alpha)
    return 1.0;
  return clamp(alpha, 0.0, 1.0);
}

// alpha printed with at most three decimals, "1" / "0.5" / "0.333"
double printable_alpha(double alpha)
{
  return round_half_up(alpha * 1000.0) / 1000.0;
}

double wcag_channel(int channel)
{
  const double c = channel / 255.0;
  return (c <= 0.03928) ? (c / 12.92) : SDL_pow((c + 0.055) / 1.055, 2.4);
}

} // namespace

Color Color::from_rgb(int r, int g, int b, double alpha)
{
  return {
      .r     = clamp(r, 0, 255),
      .g     = clamp(g, 0, 255),
      .b     = clamp(b, 0, 255),
      .alpha = clamp_alpha(alpha),
  };
}

Color Color::from_rgb(const RGB& rgb, double alpha)
{
  return from_rgb(rgb.r, rgb.g, rgb.b, alpha);
}

Color Color::from_hex(uint32_t rgb, double alpha)
{
  return from_rgb(int((rgb >> 16u) & 0xFFu), int((rgb >> 8u) & 0xFFu), int(rgb & 0xFFu), alpha);
}

Color Color::from_hsl(const HSL& hsl, double alpha) { return from_rgb(hsl_to_rgb(hsl), alpha); }
Color Color::from_hsv(const HSV& hsv, double alpha) { return from_rgb(hsv_to_rgb(hsv), alpha); }
Color Color::from_hwb(const HWB& hwb, double alpha) { return from_rgb(hwb_to_rgb(hwb), alpha); }
Color Color::from_xyz(const XYZ& xyz, double alpha) { return from_rgb(xyz_to_rgb(xyz), alpha); }
Color Color::from_lab(const LAB& lab, double alpha) { return from_rgb(lab_to_rgb(lab), alpha); }
Color Color::from_lch(const LCH& lch, double alpha) { return from_rgb(lch_to_rgb(lch), alpha); }
Color Color::from_oklab(const OKLAB& oklab, double alpha) { return from_rgb(oklab_to_rgb(oklab), alpha); }
Color Color::from_oklch(const OKLCH& oklch, double alpha) { return from_rgb(oklch_to_rgb(oklch), alpha); }

HSL Color::hsl_rounded() const
{
  const HSL precise = hsl();
  return {
      .h = double(round_to_int(precise.h) % 360),
      .s = round_half_up(precise.s),
      .l = round_half_up(precise.l),
  };
}

ColorText Color::hex(bool with_alpha) const
{
  ColorText result;
  if (with_alpha)
    SDL_snprintf(result.text, sizeof(result.text), "#%02X%02X%02X%02X", r, g, b, round_to_int(alpha * 255.0));
  else
    SDL_snprintf(result.text, sizeof(result.text), "#%02X%02X%02X", r, g, b);
  return result;
}

ColorText Color::rgb_string(bool with_alpha) const
{
  ColorText result;
  if (with_alpha or (1.0 > alpha))
    SDL_snprintf(result.text, sizeof(result.text), "rgba(%d, %d, %d, %g)", r, g, b, printable_alpha(alpha));
  else
    SDL_snprintf(result.text, sizeof(result.text), "rgb(%d, %d, %d)", r, g, b);
  return result;
}

ColorText Color::hsl_string(bool with_alpha) const
{
  const HSL hsl_value = hsl();
  const int h         = round_to_int(hsl_value.h) % 360;
  const int s         = round_to_int(hsl_value.s);
  const int l         = round_to_int(hsl_value.l);

  ColorText result;
  if (with_alpha or (1.0 > alpha))
    SDL_snprintf(result.text, sizeof(result.text), "hsla(%d, %d%%, %d%%, %g)", h, s, l, printable_alpha(alpha));
  else
    SDL_snprintf(result.text, sizeof(result.text), "hsl(%d, %d%%, %d%%)", h, s, l);
  return result;
}

double Color::luminance() const
{
  return 0.2126 * wcag_channel(r) + 0.7152 * wcag_channel(g) + 0.0722 * wcag_channel(b);
}

double Color::contrast(const Color& other) const
{
  return contrast_ratio(*this, other);
}

Color Color::lighten(double amount) const
{
  HSL hsl_value = hsl();
  hsl_value.l   = clamp(hsl_value.l + amount, 0.0, 100.0);
  return from_hsl(hsl_value, alpha);
}

Color Color::darken(double amount) const
{
  return lighten(-amount);
}

Color Color::saturate(double amount) const
{
  HSL hsl_value = hsl();
  hsl_value.s   = clamp(hsl_value.s + amount, 0.0, 100.0);
  return from_hsl(hsl_value, alpha);
}

Color Color::desaturate(double amount) const
{
  return saturate(-amount);
}

Color Color::rotate(double degrees) const
{
  HSL hsl_value = hsl();
  hsl_value.h   = normalize_hue(hsl_value.h + degrees);
  return from_hsl(hsl_value, alpha);
}

Color Color::grayscale() const
{
  return desaturate(100.0);
}

Color Color::invert() const
{
  return {.r = 255 - r, .g = 255 - g, .b = 255 - b, .alpha = alpha};
}

Color Color::mix(const Color& other, double amount) const
{
  const double t = clamp(amount, 0.0, 100.0) / 100.0;
  return from_rgb(round_to_int(r + (other.r - r) * t), round_to_int(g + (other.g - g) * t),
                  round_to_int(b + (other.b - b) * t), alpha + (other.alpha - alpha) * t);
}

Color Color::with_alpha(double new_alpha) const
{
  return {.r = r, .g = g, .b = b, .alpha = clamp_alpha(new_alpha)};
}

Color Color::fade(double amount) const
{
  return with_alpha(alpha * (1.0 - clamp(amount, 0.0, 100.0) / 100.0));
}

ColorText format_color(const Color& color, ColorFormat format)
{
  switch (format)
  {
  case ColorFormat::Rgb:
    return color.rgb_string();
  case ColorFormat::Hsl:
    return color.hsl_string();
  case ColorFormat::Hex:
  default:
    return color.hex(1.0 > color.alpha);
  }
}

const char* to_string(ColorFormat format)
{
  switch (format)
  {
  case ColorFormat::Hex:
    return "hex";
  case ColorFormat::Rgb:
    return "rgb";
  case ColorFormat::Hsl:
    return "hsl";
  default:
    return "N/A";
  }
}

bool parse_color_format(const char* name, ColorFormat& out)
{
  const ColorFormat all[] = {ColorFormat::Hex, ColorFormat::Rgb, ColorFormat::Hsl};

  for (ColorFormat format : all)
  {
    if (0 == SDL_strcasecmp(name, to_string(format)))
    {
      out = format;
      return true;
    }
  }

  SDL_SetError("unknown color format '%s', expected hex, rgb or hsl", name);
  return false;
}

double contrast_ratio(const Color& a, const Color& b)
{
  const double la = a.luminance();
  const double lb = b.luminance();
  return (SDL_max(la, lb) + 0.05) / (SDL_min(la, lb) + 0.05);
}

bool is_wcag_compliant(const Color& foreground, const Color& background, WcagLevel level, TextSize size)
{
  const bool   large    = (TextSize::Large == size);
  const double required = (WcagLevel::AAA == level) ? (large ? 4.5 : 7.0) : (large ? 3.0 : 4.5);
  return contrast_ratio(foreground, background) >= required;
}

} // namespace tint
