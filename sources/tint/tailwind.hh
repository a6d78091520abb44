#pragma once

#include "scale.hh"

namespace tint {

//
// Tailwind style scales, labeled "50", "100" ... "900", "950", "1000". Only the lightness follows the
// fixed table, hue and saturation come from the seed (read as integer HSL).
//
Palette generate_tailwind_scale(const Color& seed, bool preserve = true);
Palette generate_tailwind_dark_scale(const Color& seed);

// fourteen pure grays, "150" and "850" included
Palette generate_tailwind_gray_scale(ThemeMode mode);

struct TailwindBases
{
  Color primary;
  Color success;
  Color warning;
  Color danger;
  Color info;
};

TailwindBases derive_tailwind_bases(const Color& primary);

} // namespace tint
