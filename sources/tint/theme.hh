#pragma once

#include "cache.hh"
#include "scale.hh"
#include "semantic.hh"

namespace tint {

struct ThemeOptions
{
  bool   gray_mix_primary = true;
  double gray_mix_ratio   = TINT_DEFAULT_GRAY_MIX_RATIO;
  bool   include_info     = false;
};

struct RolePalettes
{
  Palette primary;
  Palette success;
  Palette warning;
  Palette danger;
  Palette gray;
  Palette info;
  bool    has_info = false;
};

struct ThemePalettes
{
  RolePalettes light;
  RolePalettes dark;
};

// 12 step palettes for every role plus the 14 step gray, for both modes
ThemePalettes generate_theme(const Color& primary, const ThemeOptions& options = ThemeOptions());

// Tailwind scales for primary and the Tailwind semantic bases, info always included
ThemePalettes generate_tailwind_theme(const Color& primary, bool preserve = true);

CacheKey theme_cache_key(const Color& primary, const ThemeOptions& options);
CacheKey tailwind_theme_cache_key(const Color& primary, bool preserve);

ThemePalettes generate_theme_cached(const Color& primary, const ThemeOptions& options, Cache<ThemePalettes>& cache);
ThemePalettes generate_tailwind_theme_cached(const Color& primary, bool preserve, Cache<ThemePalettes>& cache);

} // namespace tint
