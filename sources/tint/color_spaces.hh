#pragma once

//
// Pure conversions between the supported color spaces. sRGB is the hub: every other space converts
// to and from 8-bit RGB, the perceptual spaces go through linear light and CIE XYZ (D65).
//
// Ranges:
//  RGB   0..255 integers
//  HSL   h [0, 360)  s, l [0, 100]
//  HSV   h [0, 360)  s, v [0, 100]
//  HWB   h [0, 360)  w, b [0, 100]
//  XYZ   D65, Y of white = 100
//  LAB   l [0, 100]  a, b [-128, 127]
//  LCH   l [0, 100]  c >= 0  h [0, 360)
//  OKLAB l ~[0, 1]   a, b ~[-0.4, 0.4]
//  OKLCH l ~[0, 1]   c >= 0  h [0, 360)
//

namespace tint {

struct RGB
{
  int r = 0;
  int g = 0;
  int b = 0;
};

struct HSL
{
  double h = 0.0;
  double s = 0.0;
  double l = 0.0;
};

struct HSV
{
  double h = 0.0;
  double s = 0.0;
  double v = 0.0;
};

struct HWB
{
  double h = 0.0;
  double w = 0.0;
  double b = 0.0;
};

struct XYZ
{
  double x = 0.0;
  double y = 0.0;
  double z = 0.0;
};

struct LAB
{
  double l = 0.0;
  double a = 0.0;
  double b = 0.0;
};

struct LCH
{
  double l = 0.0;
  double c = 0.0;
  double h = 0.0;
};

struct OKLAB
{
  double l = 0.0;
  double a = 0.0;
  double b = 0.0;
};

struct OKLCH
{
  double l = 0.0;
  double c = 0.0;
  double h = 0.0;
};

// single channel transfer functions, input / output in [0, 1]
double srgb_to_linear(double channel);
double linear_to_srgb(double channel);

// rounds and clamps a [0, 1] channel into the 0..255 integer range
int to_channel(double normalized);

HSL rgb_to_hsl(const RGB& rgb);
RGB hsl_to_rgb(const HSL& hsl);
HSV rgb_to_hsv(const RGB& rgb);
RGB hsv_to_rgb(const HSV& hsv);
HWB rgb_to_hwb(const RGB& rgb);
RGB hwb_to_rgb(const HWB& hwb);
HSV hsl_to_hsv(const HSL& hsl);
HSL hsv_to_hsl(const HSV& hsv);

XYZ rgb_to_xyz(const RGB& rgb);
RGB xyz_to_rgb(const XYZ& xyz);
LAB xyz_to_lab(const XYZ& xyz);
XYZ lab_to_xyz(const LAB& lab);
LCH lab_to_lch(const LAB& lab);
LAB lch_to_lab(const LCH& lch);
LAB rgb_to_lab(const RGB& rgb);
RGB lab_to_rgb(const LAB& lab);
LCH rgb_to_lch(const RGB& rgb);
RGB lch_to_rgb(const LCH& lch);

OKLAB rgb_to_oklab(const RGB& rgb);
RGB   oklab_to_rgb(const OKLAB& oklab);
OKLCH oklab_to_oklch(const OKLAB& oklab);
OKLAB oklch_to_oklab(const OKLCH& oklch);
OKLCH rgb_to_oklch(const RGB& rgb);
RGB   oklch_to_rgb(const OKLCH& oklch);

} // namespace tint
