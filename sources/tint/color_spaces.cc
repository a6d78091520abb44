#include "color_spaces.hh"
#include "math.hh"
#include <cmath>

namespace tint {

namespace {

constexpr Mat3x3 srgb_to_xyz_matrix = {{
    Vec3d(0.4124564, 0.3575761, 0.1804375),
    Vec3d(0.2126729, 0.7151522, 0.0721750),
    Vec3d(0.0193339, 0.1191920, 0.9503041),
}};

constexpr Mat3x3 xyz_to_srgb_matrix = {{
    Vec3d(3.2404542, -1.5371385, -0.4985314),
    Vec3d(-0.9692660, 1.8760108, 0.0415560),
    Vec3d(0.0556434, -0.2040259, 1.0572252),
}};

constexpr Mat3x3 linear_to_lms_matrix = {{
    Vec3d(0.4122214708, 0.5363325363, 0.0514459929),
    Vec3d(0.2119034982, 0.6806995451, 0.1073969566),
    Vec3d(0.0883024619, 0.2817188376, 0.6299787005),
}};

constexpr Mat3x3 lms_to_oklab_matrix = {{
    Vec3d(0.2104542553, 0.7936177850, -0.0040720468),
    Vec3d(1.9779984951, -2.4285922050, 0.4505937099),
    Vec3d(0.0259040371, 0.7827717662, -0.8086757660),
}};

constexpr Mat3x3 oklab_to_lms_matrix = {{
    Vec3d(1.0, 0.3963377774, 0.2158037573),
    Vec3d(1.0, -0.1055613458, -0.0638541728),
    Vec3d(1.0, -0.0894841775, -1.2914855480),
}};

constexpr Mat3x3 lms_to_linear_matrix = {{
    Vec3d(4.0767416621, -3.3077115913, 0.2309699292),
    Vec3d(-1.2684380046, 2.6097574011, -0.3413193965),
    Vec3d(-0.0041960863, -0.7034186147, 1.7076147010),
}};

constexpr Vec3d d65_white = Vec3d(95.047, 100.0, 108.883);

constexpr double lab_epsilon = 216.0 / 24389.0;
constexpr double lab_kappa   = 24389.0 / 27.0;

double lab_f(double t)
{
  return (t > lab_epsilon) ? std::cbrt(t) : ((lab_kappa * t + 16.0) / 116.0);
}

double lab_f_inv(double t)
{
  const double cubed = t * t * t;
  return (cubed > lab_epsilon) ? cubed : ((116.0 * t - 16.0) / lab_kappa);
}

Vec3d rgb_to_linear(const RGB& rgb)
{
  return Vec3d(srgb_to_linear(rgb.r / 255.0), srgb_to_linear(rgb.g / 255.0), srgb_to_linear(rgb.b / 255.0));
}

RGB linear_to_rgb(const Vec3d& linear)
{
  return {
      .r = to_channel(linear_to_srgb(linear.x)),
      .g = to_channel(linear_to_srgb(linear.y)),
      .b = to_channel(linear_to_srgb(linear.z)),
  };
}

// shared hue computation for the cylindrical sRGB models, channels normalized to [0, 1]
double hue_from_rgb(double r, double g, double b, double max, double delta)
{
  double h = 0.0;

  if (max == r)
    h = SDL_fmod((g - b) / delta, 6.0);
  else if (max == g)
    h = (b - r) / delta + 2.0;
  else
    h = (r - g) / delta + 4.0;

  return normalize_hue(h * 60.0);
}

double polar_hue(double a, double b)
{
  return normalize_hue(to_deg(SDL_atan2(b, a)));
}

} // namespace

double srgb_to_linear(double channel)
{
  if (channel <= 0.04045)
    return channel / 12.92;
  return SDL_pow((channel + 0.055) / 1.055, 2.4);
}

double linear_to_srgb(double channel)
{
  if (channel <= 0.0031308)
    return 12.92 * channel;
  return 1.055 * SDL_pow(channel, 1.0 / 2.4) - 0.055;
}

int to_channel(double normalized)
{
  return clamp(round_to_int(normalized * 255.0), 0, 255);
}

HSL rgb_to_hsl(const RGB& rgb)
{
  const double r     = rgb.r / 255.0;
  const double g     = rgb.g / 255.0;
  const double b     = rgb.b / 255.0;
  const double max   = SDL_max(r, SDL_max(g, b));
  const double min   = SDL_min(r, SDL_min(g, b));
  const double delta = max - min;
  const double l     = (max + min) / 2.0;

  if (0.0 == delta)
    return {.h = 0.0, .s = 0.0, .l = l * 100.0};

  const double s = delta / (1.0 - SDL_fabs(2.0 * l - 1.0));
  return {.h = hue_from_rgb(r, g, b, max, delta), .s = clamp(s * 100.0, 0.0, 100.0), .l = l * 100.0};
}

RGB hsl_to_rgb(const HSL& hsl)
{
  const double h = normalize_hue(hsl.h);
  const double s = clamp(hsl.s, 0.0, 100.0) / 100.0;
  const double l = clamp(hsl.l, 0.0, 100.0) / 100.0;

  const double c = (1.0 - SDL_fabs(2.0 * l - 1.0)) * s;
  const double x = c * (1.0 - SDL_fabs(SDL_fmod(h / 60.0, 2.0) - 1.0));
  const double m = l - c / 2.0;

  double r = 0.0, g = 0.0, b = 0.0;

  if (h < 60.0)
  {
    r = c;
    g = x;
  }
  else if (h < 120.0)
  {
    r = x;
    g = c;
  }
  else if (h < 180.0)
  {
    g = c;
    b = x;
  }
  else if (h < 240.0)
  {
    g = x;
    b = c;
  }
  else if (h < 300.0)
  {
    r = x;
    b = c;
  }
  else
  {
    r = c;
    b = x;
  }

  return {.r = to_channel(r + m), .g = to_channel(g + m), .b = to_channel(b + m)};
}

HSV rgb_to_hsv(const RGB& rgb)
{
  const double r     = rgb.r / 255.0;
  const double g     = rgb.g / 255.0;
  const double b     = rgb.b / 255.0;
  const double max   = SDL_max(r, SDL_max(g, b));
  const double min   = SDL_min(r, SDL_min(g, b));
  const double delta = max - min;

  if (0.0 == delta)
    return {.h = 0.0, .s = 0.0, .v = max * 100.0};

  return {.h = hue_from_rgb(r, g, b, max, delta), .s = (delta / max) * 100.0, .v = max * 100.0};
}

RGB hsv_to_rgb(const HSV& hsv)
{
  const double h = normalize_hue(hsv.h);
  const double s = clamp(hsv.s, 0.0, 100.0) / 100.0;
  const double v = clamp(hsv.v, 0.0, 100.0) / 100.0;

  const double c = v * s;
  const double x = c * (1.0 - SDL_fabs(SDL_fmod(h / 60.0, 2.0) - 1.0));
  const double m = v - c;

  double r = 0.0, g = 0.0, b = 0.0;

  switch (static_cast<int>(h / 60.0))
  {
  case 0:
    r = c;
    g = x;
    break;
  case 1:
    r = x;
    g = c;
    break;
  case 2:
    g = c;
    b = x;
    break;
  case 3:
    g = x;
    b = c;
    break;
  case 4:
    r = x;
    b = c;
    break;
  default:
    r = c;
    b = x;
    break;
  }

  return {.r = to_channel(r + m), .g = to_channel(g + m), .b = to_channel(b + m)};
}

HWB rgb_to_hwb(const RGB& rgb)
{
  const HSV    hsv   = rgb_to_hsv(rgb);
  const double white = SDL_min(rgb.r, SDL_min(rgb.g, rgb.b)) / 255.0;
  const double black = 1.0 - SDL_max(rgb.r, SDL_max(rgb.g, rgb.b)) / 255.0;
  return {.h = hsv.h, .w = white * 100.0, .b = black * 100.0};
}

RGB hwb_to_rgb(const HWB& hwb)
{
  const double w = clamp(hwb.w, 0.0, 100.0) / 100.0;
  const double b = clamp(hwb.b, 0.0, 100.0) / 100.0;

  if ((w + b) >= 1.0)
  {
    const int gray = to_channel(w / (w + b));
    return {.r = gray, .g = gray, .b = gray};
  }

  const double v = 1.0 - b;
  const double s = (0.0 == v) ? 0.0 : (1.0 - w / v);
  return hsv_to_rgb({.h = hwb.h, .s = s * 100.0, .v = v * 100.0});
}

HSV hsl_to_hsv(const HSL& hsl)
{
  const double s = clamp(hsl.s, 0.0, 100.0) / 100.0;
  const double l = clamp(hsl.l, 0.0, 100.0) / 100.0;
  const double v = l + s * SDL_min(l, 1.0 - l);

  return {.h = normalize_hue(hsl.h), .s = (0.0 == v) ? 0.0 : (2.0 * (1.0 - l / v)) * 100.0, .v = v * 100.0};
}

HSL hsv_to_hsl(const HSV& hsv)
{
  const double s = clamp(hsv.s, 0.0, 100.0) / 100.0;
  const double v = clamp(hsv.v, 0.0, 100.0) / 100.0;
  const double l = v * (1.0 - s / 2.0);

  double sl = 0.0;
  if ((0.0 < l) and (1.0 > l))
    sl = (v - l) / SDL_min(l, 1.0 - l);

  return {.h = normalize_hue(hsv.h), .s = sl * 100.0, .l = l * 100.0};
}

XYZ rgb_to_xyz(const RGB& rgb)
{
  const Vec3d xyz = (srgb_to_xyz_matrix * rgb_to_linear(rgb)).scale(100.0);
  return {.x = xyz.x, .y = xyz.y, .z = xyz.z};
}

RGB xyz_to_rgb(const XYZ& xyz)
{
  return linear_to_rgb(xyz_to_srgb_matrix * Vec3d(xyz.x, xyz.y, xyz.z).scale(0.01));
}

LAB xyz_to_lab(const XYZ& xyz)
{
  const double fx = lab_f(xyz.x / d65_white.x);
  const double fy = lab_f(xyz.y / d65_white.y);
  const double fz = lab_f(xyz.z / d65_white.z);

  return {
      .l = clamp(116.0 * fy - 16.0, 0.0, 100.0),
      .a = clamp(500.0 * (fx - fy), -128.0, 127.0),
      .b = clamp(200.0 * (fy - fz), -128.0, 127.0),
  };
}

XYZ lab_to_xyz(const LAB& lab)
{
  const double fy = (lab.l + 16.0) / 116.0;
  const double fx = lab.a / 500.0 + fy;
  const double fz = fy - lab.b / 200.0;

  return {
      .x = lab_f_inv(fx) * d65_white.x,
      .y = lab_f_inv(fy) * d65_white.y,
      .z = lab_f_inv(fz) * d65_white.z,
  };
}

LCH lab_to_lch(const LAB& lab)
{
  return {.l = lab.l, .c = SDL_sqrt(square(lab.a) + square(lab.b)), .h = polar_hue(lab.a, lab.b)};
}

LAB lch_to_lab(const LCH& lch)
{
  const double rad = to_rad(lch.h);
  return {.l = lch.l, .a = lch.c * SDL_cos(rad), .b = lch.c * SDL_sin(rad)};
}

LAB rgb_to_lab(const RGB& rgb) { return xyz_to_lab(rgb_to_xyz(rgb)); }
RGB lab_to_rgb(const LAB& lab) { return xyz_to_rgb(lab_to_xyz(lab)); }
LCH rgb_to_lch(const RGB& rgb) { return lab_to_lch(rgb_to_lab(rgb)); }
RGB lch_to_rgb(const LCH& lch) { return lab_to_rgb(lch_to_lab(lch)); }

OKLAB rgb_to_oklab(const RGB& rgb)
{
  const Vec3d lms = linear_to_lms_matrix * rgb_to_linear(rgb);
  const Vec3d lab = lms_to_oklab_matrix * Vec3d(std::cbrt(lms.x), std::cbrt(lms.y), std::cbrt(lms.z));
  return {.l = lab.x, .a = lab.y, .b = lab.z};
}

RGB oklab_to_rgb(const OKLAB& oklab)
{
  const Vec3d lms_ = oklab_to_lms_matrix * Vec3d(oklab.l, oklab.a, oklab.b);
  const Vec3d lms  = Vec3d(lms_.x * lms_.x * lms_.x, lms_.y * lms_.y * lms_.y, lms_.z * lms_.z * lms_.z);
  return linear_to_rgb(lms_to_linear_matrix * lms);
}

OKLCH oklab_to_oklch(const OKLAB& oklab)
{
  return {.l = oklab.l, .c = SDL_sqrt(square(oklab.a) + square(oklab.b)), .h = polar_hue(oklab.a, oklab.b)};
}

OKLAB oklch_to_oklab(const OKLCH& oklch)
{
  const double rad = to_rad(oklch.h);
  return {.l = oklch.l, .a = oklch.c * SDL_cos(rad), .b = oklch.c * SDL_sin(rad)};
}

OKLCH rgb_to_oklch(const RGB& rgb) { return oklab_to_oklch(rgb_to_oklab(rgb)); }
RGB   oklch_to_rgb(const OKLCH& oklch) { return oklab_to_rgb(oklch_to_oklab(oklch)); }

} // namespace tint
