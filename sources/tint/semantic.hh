#pragma once

#include "color.hh"

namespace tint {

struct SemanticOptions
{
  bool   gray_mix_primary = true;
  double gray_mix_ratio   = 0.2;
  bool   include_info     = false;
};

struct SemanticColors
{
  Color primary;
  Color success;
  Color warning;
  Color danger;
  Color gray;
  Color info;
  bool  has_info = false;
};

//
// Role colors derived from one seed. The seed is read as integer HSL, every role picks its hue from a fixed
// table of hue buckets and clamps saturation / lightness into its own band.
// Pure: identical input always yields identical output.
//
SemanticColors derive_semantic_colors(const Color& primary, const SemanticOptions& options = SemanticOptions());

// per role targets in HSL, input is the rounded seed HSL
HSL success_target(const HSL& seed);
HSL warning_target(const HSL& seed);
HSL danger_target(const HSL& seed);
HSL info_target(const HSL& seed);
HSL gray_target(const HSL& seed, bool mix_primary, double mix_ratio);

} // namespace tint
