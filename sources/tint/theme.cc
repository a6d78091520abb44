#include "theme.hh"
#include "tailwind.hh"
#include <SDL2/SDL_log.h>

namespace tint {

namespace {

RolePalettes chromatic_roles(const SemanticColors& semantic, const ThemeOptions& options, ThemeMode mode)
{
  RolePalettes result;
  result.primary  = generate_chromatic_palette(semantic.primary, mode);
  result.success  = generate_chromatic_palette(semantic.success, mode);
  result.warning  = generate_chromatic_palette(semantic.warning, mode);
  result.danger   = generate_chromatic_palette(semantic.danger, mode);
  result.gray     = generate_gray_palette(semantic.gray, mode, options.gray_mix_primary, options.gray_mix_ratio);
  result.has_info = semantic.has_info;

  if (semantic.has_info)
    result.info = generate_chromatic_palette(semantic.info, mode);

  return result;
}

} // namespace

ThemePalettes generate_theme(const Color& primary, const ThemeOptions& options)
{
  const SemanticOptions semantic_options = {
      .gray_mix_primary = options.gray_mix_primary,
      .gray_mix_ratio   = options.gray_mix_ratio,
      .include_info     = options.include_info,
  };

  const SemanticColors semantic = derive_semantic_colors(primary, semantic_options);

  return {
      .light = chromatic_roles(semantic, options, ThemeMode::Light),
      .dark  = chromatic_roles(semantic, options, ThemeMode::Dark),
  };
}

ThemePalettes generate_tailwind_theme(const Color& primary, bool preserve)
{
  const TailwindBases bases = derive_tailwind_bases(primary);

  ThemePalettes result;

  result.light.primary  = generate_tailwind_scale(bases.primary, preserve);
  result.light.success  = generate_tailwind_scale(bases.success);
  result.light.warning  = generate_tailwind_scale(bases.warning);
  result.light.danger   = generate_tailwind_scale(bases.danger);
  result.light.info     = generate_tailwind_scale(bases.info);
  result.light.gray     = generate_tailwind_gray_scale(ThemeMode::Light);
  result.light.has_info = true;

  result.dark.primary  = generate_tailwind_dark_scale(bases.primary);
  result.dark.success  = generate_tailwind_dark_scale(bases.success);
  result.dark.warning  = generate_tailwind_dark_scale(bases.warning);
  result.dark.danger   = generate_tailwind_dark_scale(bases.danger);
  result.dark.info     = generate_tailwind_dark_scale(bases.info);
  result.dark.gray     = generate_tailwind_gray_scale(ThemeMode::Dark);
  result.dark.has_info = true;

  return result;
}

CacheKey theme_cache_key(const Color& primary, const ThemeOptions& options)
{
  CacheKey key;
  SDL_snprintf(key.text, sizeof(key.text), "theme:%s:%d:%.4f:%d", primary.hex().text, options.gray_mix_primary ? 1 : 0,
               options.gray_mix_ratio, options.include_info ? 1 : 0);
  return key;
}

CacheKey tailwind_theme_cache_key(const Color& primary, bool preserve)
{
  CacheKey key;
  SDL_snprintf(key.text, sizeof(key.text), "tailwind:%s:%d", primary.hex().text, preserve ? 1 : 0);
  return key;
}

ThemePalettes generate_theme_cached(const Color& primary, const ThemeOptions& options, Cache<ThemePalettes>& cache)
{
  const CacheKey key = theme_cache_key(primary, options);
  ThemePalettes  result;

  if (cache.Lookup(key, result))
  {
    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "theme cache hit '%s'", key.text);
    return result;
  }

  result = generate_theme(primary, options);
  cache.Store(key, result);
  return result;
}

ThemePalettes generate_tailwind_theme_cached(const Color& primary, bool preserve, Cache<ThemePalettes>& cache)
{
  const CacheKey key = tailwind_theme_cache_key(primary, preserve);
  ThemePalettes  result;

  if (cache.Lookup(key, result))
  {
    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "theme cache hit '%s'", key.text);
    return result;
  }

  result = generate_tailwind_theme(primary, preserve);
  cache.Store(key, result);
  return result;
}

} // namespace tint
