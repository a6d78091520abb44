#include "semantic.hh"
#include "math.hh"

namespace tint {

HSL success_target(const HSL& seed)
{
  const double h = seed.h;
  double       target;

  if ((h < 25.0) or (h >= 335.0))
    target = 120.0;
  else if (h < 75.0)
    target = 80.0;
  else if ((150.0 <= h) and (h < 210.0))
    target = 90.0;
  else if ((210.0 <= h) and (h < 285.0))
    target = 100.0;
  else if ((285.0 <= h) and (h < 335.0))
    target = 130.0;
  else
    target = h; // 75 - 150 is green already

  return {.h = target, .s = clamp(seed.s - 5.0, 55.0, 70.0), .l = clamp(seed.l + 5.0, 45.0, 60.0)};
}

HSL warning_target(const HSL& seed)
{
  const double h = seed.h;
  double       target;

  if ((h >= 240.0) or (h < 60.0))
    target = 42.0;
  else if (h < 140.0)
    target = 40.0;
  else
    target = 38.0;

  return {.h = target, .s = clamp(seed.s + 5.0, 80.0, 100.0), .l = clamp(seed.l + 15.0, 55.0, 65.0)};
}

HSL danger_target(const HSL& seed)
{
  const double h = seed.h;
  double       target;

  if ((15.0 <= h) and (h < 60.0))
    target = 5.0;
  else if ((60.0 <= h) and (h < 140.0))
    target = 10.0;
  else if ((140.0 <= h) and (h < 190.0))
    target = 357.0;
  else if ((190.0 <= h) and (h < 240.0))
    target = 0.0;
  else if ((240.0 <= h) and (h < 350.0))
    target = 355.0;
  else
    target = h; // reds stay where they are

  return {.h = target, .s = clamp(seed.s, 75.0, 85.0), .l = clamp(seed.l + 5.0, 45.0, 55.0)};
}

HSL info_target(const HSL& seed)
{
  return {.h = 210.0, .s = clamp(seed.s * 0.85, 40.0, 70.0), .l = 50.0};
}

HSL gray_target(const HSL& seed, bool mix_primary, double mix_ratio)
{
  if (not mix_primary)
    return {.h = 0.0, .s = 0.0, .l = 50.0};

  const double ratio = clamp(mix_ratio, 0.0, 1.0);
  return {.h = seed.h, .s = clamp(seed.s * ratio * 0.3, 3.0, 8.0), .l = 50.0};
}

SemanticColors derive_semantic_colors(const Color& primary, const SemanticOptions& options)
{
  const HSL seed = primary.hsl_rounded();

  SemanticColors result = {
      .primary  = primary,
      .success  = Color::from_hsl(success_target(seed)),
      .warning  = Color::from_hsl(warning_target(seed)),
      .danger   = Color::from_hsl(danger_target(seed)),
      .gray     = Color::from_hsl(gray_target(seed, options.gray_mix_primary, options.gray_mix_ratio)),
      .info     = Color(),
      .has_info = options.include_info,
  };

  if (options.include_info)
    result.info = Color::from_hsl(info_target(seed));

  return result;
}

} // namespace tint
