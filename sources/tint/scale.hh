#pragma once

#include "color.hh"
#include "element_stack.hh"
#include "status.hh"
#include "tint_constants.hh"

namespace tint {

enum class ThemeMode
{
  Light,
  Dark
};

const char* to_string(ThemeMode mode);

struct PaletteEntry
{
  char  label[TINT_MAX_LABEL_LENGTH];
  Color color;
};

//
// Ordered step label -> color mapping. "center" indexes the entry that equals (or most closely
// approximates) the seed the palette was generated from.
//
struct Palette
{
  void push(const char* label, const Color& color);

  [[nodiscard]] uint32_t            size() const { return entries.count; }
  [[nodiscard]] const PaletteEntry& operator[](uint32_t idx) const { return entries[idx]; }
  [[nodiscard]] const PaletteEntry* find(const char* label) const;

  // how many entries share the RGB value of "color"
  [[nodiscard]] uint32_t count_matching(const Color& color) const;

  ElementStack<PaletteEntry, TINT_MAX_PALETTE_STEPS> entries;
  uint32_t                                           center = 0;
};

// 12 steps labeled "1".."12", step 7 is the seed. Dark palettes run from darkest to lightest.
Palette generate_chromatic_palette(const Color& seed, ThemeMode mode);

// 14 steps labeled "1".."14", step 8 sits at the mid lightness of the mode
Palette generate_gray_palette(const Color& seed, ThemeMode mode, bool mix_primary = true,
                              double mix_ratio = TINT_DEFAULT_GRAY_MIX_RATIO);

//
// Generic N step scale (2 <= N <= TINT_MAX_PALETTE_STEPS). Target lightness follows the natural shade curve,
// 98 -> 4 in light mode and 4 -> 90 in dark mode. With "preserve" the step closest in lightness to the seed
// is replaced by the seed itself.
//
Status generate_scale(const Color& seed, uint32_t steps, ThemeMode mode, bool preserve, Palette& out);

// saturation / hue correction applied to every step of the natural scales
HSL adjust_for_lightness(const HSL& base, double lightness);

} // namespace tint
