#define SDL_MAIN_HANDLED
#include "../sources/tint/theme.hh"
#include <SDL2/SDL.h>
#include <vector>

using namespace tint;

namespace {

class RecordingCache : public Cache<ThemePalettes>
{
public:
  bool Lookup(const CacheKey& key, ThemePalettes& out) override
  {
    lookups += 1;
    for (const Entry& entry : entries)
    {
      if (0 == SDL_strcmp(entry.key.text, key.text))
      {
        hits += 1;
        out = entry.value;
        return true;
      }
    }
    return false;
  }

  void Store(const CacheKey& key, const ThemePalettes& in) override
  {
    entries.push_back({.key = key, .value = in});
  }

  struct Entry
  {
    CacheKey      key;
    ThemePalettes value;
  };

  std::vector<Entry> entries;
  uint32_t           lookups = 0;
  uint32_t           hits    = 0;
};

bool same_palette(const Palette& lhs, const Palette& rhs)
{
  if ((lhs.size() != rhs.size()) or (lhs.center != rhs.center))
    return false;

  for (uint32_t i = 0; i < lhs.size(); ++i)
    if ((0 != SDL_strcmp(lhs[i].label, rhs[i].label)) or not(lhs[i].color == rhs[i].color))
      return false;

  return true;
}

bool same_roles(const RolePalettes& lhs, const RolePalettes& rhs)
{
  return same_palette(lhs.primary, rhs.primary) and same_palette(lhs.success, rhs.success) and
         same_palette(lhs.warning, rhs.warning) and same_palette(lhs.danger, rhs.danger) and
         same_palette(lhs.gray, rhs.gray) and (lhs.has_info == rhs.has_info) and
         ((not lhs.has_info) or same_palette(lhs.info, rhs.info));
}

void natural_theme()
{
  const Color         primary = Color::from_hex(0x1890FF);
  const ThemePalettes theme   = generate_theme(primary);

  SDL_assert(TINT_CHROMATIC_STEPS == theme.light.primary.size());
  SDL_assert(TINT_GRAY_STEPS == theme.light.gray.size());
  SDL_assert(TINT_GRAY_STEPS == theme.dark.gray.size());
  SDL_assert(not theme.light.has_info);
  SDL_assert(not theme.dark.has_info);

  SDL_assert(primary == theme.light.primary[theme.light.primary.center].color);
  SDL_assert(primary == theme.dark.primary[theme.dark.primary.center].color);

  const SemanticColors semantic = derive_semantic_colors(primary);
  SDL_assert(semantic.success == theme.light.success[theme.light.success.center].color);
  SDL_assert(semantic.warning == theme.dark.warning[theme.dark.warning.center].color);
  SDL_assert(semantic.danger == theme.light.danger[theme.light.danger.center].color);

  ThemeOptions options;
  options.include_info          = true;
  options.gray_mix_primary      = false;
  const ThemePalettes with_info = generate_theme(primary, options);

  SDL_assert(with_info.light.has_info);
  SDL_assert(TINT_CHROMATIC_STEPS == with_info.dark.info.size());
  for (const PaletteEntry& entry : with_info.light.gray.entries)
    SDL_assert((entry.color.r == entry.color.g) and (entry.color.g == entry.color.b));
}

void tailwind_theme()
{
  const Color         primary = Color::from_hex(0x1890FF);
  const ThemePalettes theme   = generate_tailwind_theme(primary);

  SDL_assert(theme.light.has_info);
  SDL_assert(theme.dark.has_info);
  SDL_assert(TINT_TAILWIND_STEPS == theme.light.primary.size());
  SDL_assert(TINT_TAILWIND_GRAY_STEPS == theme.dark.gray.size());
  SDL_assert(primary == theme.light.primary.find("400")->color);
  SDL_assert(0 == SDL_strcmp("1000", theme.dark.info[11].label));

  const ThemePalettes generated = generate_tailwind_theme(primary, false);
  SDL_assert(0 == generated.light.primary.count_matching(primary));
}

void cached_generation()
{
  const Color  primary = Color::from_hex(0x1890FF);
  ThemeOptions options;

  RecordingCache      cache;
  const ThemePalettes first  = generate_theme_cached(primary, options, cache);
  const ThemePalettes second = generate_theme_cached(primary, options, cache);

  SDL_assert(2 == cache.lookups);
  SDL_assert(1 == cache.hits);
  SDL_assert(1 == cache.entries.size());
  SDL_assert(same_roles(first.light, second.light));
  SDL_assert(same_roles(first.dark, second.dark));
  SDL_assert(same_roles(first.light, generate_theme(primary, options).light));

  options.include_info = true;
  const ThemePalettes third = generate_theme_cached(primary, options, cache);
  SDL_assert(1 == cache.hits);
  SDL_assert(2 == cache.entries.size());
  SDL_assert(third.light.has_info);

  const ThemePalettes tailwind = generate_tailwind_theme_cached(primary, true, cache);
  SDL_assert(3 == cache.entries.size());
  SDL_assert(same_roles(tailwind.dark, generate_tailwind_theme(primary, true).dark));
  generate_tailwind_theme_cached(primary, true, cache);
  SDL_assert(2 == cache.hits);
}

void cache_keys()
{
  const Color  primary = Color::from_hex(0x1890FF);
  ThemeOptions options;

  const CacheKey plain = theme_cache_key(primary, options);
  options.include_info = true;
  const CacheKey info  = theme_cache_key(primary, options);
  options.include_info   = false;
  options.gray_mix_ratio = 0.5;
  const CacheKey ratio   = theme_cache_key(primary, options);

  SDL_assert(0 != SDL_strcmp(plain.text, info.text));
  SDL_assert(0 != SDL_strcmp(plain.text, ratio.text));
  SDL_assert(0 != SDL_strcmp(plain.text, tailwind_theme_cache_key(primary, true).text));
  SDL_assert(0 != SDL_strcmp(tailwind_theme_cache_key(primary, false).text, tailwind_theme_cache_key(primary, true).text));
  SDL_assert(nullptr != SDL_strstr(plain.text, "#1890FF"));
}

} // namespace

int main()
{
  SDL_Log("natural theme");
  natural_theme();
  SDL_Log("tailwind theme");
  tailwind_theme();
  SDL_Log("cached generation");
  cached_generation();
  SDL_Log("cache keys");
  cache_keys();
  SDL_Log("Theme OK");
  return 0;
}
