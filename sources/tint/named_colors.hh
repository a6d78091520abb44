#pragma once

#include <SDL2/SDL_stdinc.h>

namespace tint {

struct NamedColor
{
  const char* name;
  uint32_t    rgb; // 0xRRGGBB
  double      alpha;
};

// CSS keyword lookup, case-insensitive. Returns nullptr for unknown names.
const NamedColor* find_named_color(const char* name);

// Reverse lookup, first keyword (alphabetically) with the exact RGB value. Only opaque colors are matched.
const NamedColor* find_color_name(uint32_t rgb);

} // namespace tint
