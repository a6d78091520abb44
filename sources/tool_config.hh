#pragma once

#include "tint/color.hh"
#include "tint/delta_e.hh"
#include "tint/tint_constants.hh"

struct ToolConfig
{
  bool                  gray_mix_primary = true;
  double                gray_mix_ratio   = TINT_DEFAULT_GRAY_MIX_RATIO;
  bool                  preserve         = true;
  bool                  include_info     = false;
  tint::ColorFormat     format           = tint::ColorFormat::Hex;
  uint32_t              steps            = 10;
  uint32_t              cluster_count    = 5;
  uint32_t              random_seed      = 1;
  uint32_t              max_samples      = TINT_DEFAULT_MAX_SAMPLES;
  bool                  ignore_white     = false;
  bool                  ignore_black     = false;
  tint::DeltaEAlgorithm delta_e          = tint::DeltaEAlgorithm::CIEDE2000;
};

//
// Overrides fields of "config" with the keys found in a json object. Unknown keys are only logged,
// a known key holding the wrong type fails the whole load and leaves "config" untouched.
//
bool parse_tool_config(const char* text, size_t size, ToolConfig& config);
bool load_tool_config(const char* path, ToolConfig& config);

// Flags that have to take effect before the config file is read.
struct StartupFlags
{
  const char* config_path = nullptr;
  bool        verbose     = false;
};

// argv[1] is the command, flags start at argv[2]
StartupFlags scan_startup_flags(int argc, char* argv[]);

// INFO for the application category, VERBOSE when asked for
void apply_log_priority(bool verbose);
