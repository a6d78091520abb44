#define SDL_MAIN_HANDLED
#include "color_argument.hh"
#include "image_source.hh"
#include "json_export.hh"
#include "tool_config.hh"
#include "tint/harmony.hh"
#include "tint/tailwind.hh"
#include <SDL2/SDL.h>
#include <vector>

namespace {

struct CommandLine
{
  const char*              command     = nullptr;
  const char*              output_path = nullptr;
  const char*              harmony     = nullptr;
  const char*              nature      = nullptr;
  std::vector<const char*> positional;
  double                   variation = 0.0;
  bool                     dark      = false;
  bool                     gray      = false;
  bool                     tailwind  = false;
  bool                     dominant  = false;
  bool                     accent    = false;
};

using CommandFunction = bool (*)(const CommandLine& cmd, const ToolConfig& config, JsonDocument& doc,
                                 json_value_s*& root);

struct Command
{
  const char*     name;
  CommandFunction function;
  uint32_t        min_arguments;
  uint32_t        max_arguments;
};

void print_usage()
{
  SDL_Log("usage: tint_tool <command> [arguments] [options]\n"
          "  convert   <color>\n"
          "  semantic  <color> [--no-gray-mix] [--gray-ratio R] [--info]\n"
          "  scale     <color> [--steps N] [--dark] [--no-preserve]\n"
          "  palette   <color> [--dark] [--gray]\n"
          "  tailwind  <color> [--dark] [--no-preserve]\n"
          "  theme     <color> [--tailwind] [--info] [--no-gray-mix]\n"
          "  diff      <color> <color> [--algorithm 76|94|2000|cmc|oklab]\n"
          "  diversity <color> <color> [...] [--algorithm 76|94|2000|cmc|oklab]\n"
          "  extract   <image> [--count K] [--seed S] [--max-samples N] [--ignore-white] [--ignore-black] "
          "[--dominant]\n"
          "  harmony   <color> [--type NAME] [--variation V] [--count N] [--seed S] [--accent] [--nature THEME]\n"
          "common: --config <file.json> --output <file.json> --format hex|rgb|hsl --verbose");
}

tint::ThemeMode mode_of(const CommandLine& cmd)
{
  return cmd.dark ? tint::ThemeMode::Dark : tint::ThemeMode::Light;
}

bool parse_count(const char* flag, const char* text, uint32_t& out)
{
  char*               end   = nullptr;
  const unsigned long value = SDL_strtoul(text, &end, 10);

  if ((end == text) or ('\0' != *end) or ('-' == text[0]) or (UINT32_MAX < value))
  {
    SDL_SetError("%s expects a non negative integer, got '%s'", flag, text);
    return false;
  }

  out = static_cast<uint32_t>(value);
  return true;
}

bool parse_ratio(const char* flag, const char* text, double& out)
{
  char*        end   = nullptr;
  const double value = SDL_strtod(text, &end);

  if ((end == text) or ('\0' != *end))
  {
    SDL_SetError("%s expects a number, got '%s'", flag, text);
    return false;
  }

  out = value;
  return true;
}

bool flag_value(int argc, char* argv[], int& i, const char*& out)
{
  if ((i + 1) >= argc)
  {
    SDL_SetError("%s needs a value", argv[i]);
    return false;
  }

  out = argv[++i];
  return true;
}

bool parse_command_line(int argc, char* argv[], CommandLine& cmd, ToolConfig& config)
{
  for (int i = 2; i < argc; ++i)
  {
    const char* arg   = argv[i];
    const char* value = nullptr;

    if ('-' != arg[0] or '-' != arg[1])
    {
      cmd.positional.push_back(arg);
      continue;
    }

    // --verbose and --config were already applied by scan_startup_flags
    if (0 == SDL_strcmp(arg, "--verbose"))
      continue;
    else if (0 == SDL_strcmp(arg, "--dark"))
      cmd.dark = true;
    else if (0 == SDL_strcmp(arg, "--gray"))
      cmd.gray = true;
    else if (0 == SDL_strcmp(arg, "--tailwind"))
      cmd.tailwind = true;
    else if (0 == SDL_strcmp(arg, "--dominant"))
      cmd.dominant = true;
    else if (0 == SDL_strcmp(arg, "--accent"))
      cmd.accent = true;
    else if (0 == SDL_strcmp(arg, "--info"))
      config.include_info = true;
    else if (0 == SDL_strcmp(arg, "--no-gray-mix"))
      config.gray_mix_primary = false;
    else if (0 == SDL_strcmp(arg, "--no-preserve"))
      config.preserve = false;
    else if (0 == SDL_strcmp(arg, "--ignore-white"))
      config.ignore_white = true;
    else if (0 == SDL_strcmp(arg, "--ignore-black"))
      config.ignore_black = true;
    else if (not flag_value(argc, argv, i, value))
      return false;
    else if (0 == SDL_strcmp(arg, "--config"))
      continue;
    else if (0 == SDL_strcmp(arg, "--output"))
      cmd.output_path = value;
    else if (0 == SDL_strcmp(arg, "--type"))
      cmd.harmony = value;
    else if (0 == SDL_strcmp(arg, "--nature"))
      cmd.nature = value;
    else if (0 == SDL_strcmp(arg, "--variation"))
    {
      if (not parse_ratio(arg, value, cmd.variation))
        return false;
    }
    else if (0 == SDL_strcmp(arg, "--format"))
    {
      if (not tint::parse_color_format(value, config.format))
        return false;
    }
    else if (0 == SDL_strcmp(arg, "--algorithm"))
    {
      if (not tint::parse_delta_e_algorithm(value, config.delta_e))
        return false;
    }
    else if (0 == SDL_strcmp(arg, "--gray-ratio"))
    {
      if (not parse_ratio(arg, value, config.gray_mix_ratio))
        return false;
    }
    else if (0 == SDL_strcmp(arg, "--steps"))
    {
      if (not parse_count(arg, value, config.steps))
        return false;
    }
    else if (0 == SDL_strcmp(arg, "--count"))
    {
      if (not parse_count(arg, value, config.cluster_count))
        return false;
    }
    else if (0 == SDL_strcmp(arg, "--seed"))
    {
      if (not parse_count(arg, value, config.random_seed))
        return false;
    }
    else if (0 == SDL_strcmp(arg, "--max-samples"))
    {
      if (not parse_count(arg, value, config.max_samples))
        return false;
    }
    else
    {
      SDL_SetError("unknown option '%s'", arg);
      return false;
    }
  }

  return true;
}

bool parse_colors(const CommandLine& cmd, std::vector<tint::Color>& out)
{
  for (const char* argument : cmd.positional)
  {
    tint::Color color;
    if (not parse_color_argument(argument, color))
      return false;
    out.push_back(color);
  }
  return true;
}

//
// commands
//

bool convert_command(const CommandLine& cmd, const ToolConfig&, JsonDocument& doc, json_value_s*& root)
{
  tint::Color color;
  if (not parse_color_argument(cmd.positional[0], color))
    return false;

  root = color_report_json(doc, color);
  return true;
}

bool semantic_command(const CommandLine& cmd, const ToolConfig& config, JsonDocument& doc, json_value_s*& root)
{
  tint::Color primary;
  if (not parse_color_argument(cmd.positional[0], primary))
    return false;

  const tint::SemanticOptions options = {
      .gray_mix_primary = config.gray_mix_primary,
      .gray_mix_ratio   = config.gray_mix_ratio,
      .include_info     = config.include_info,
  };

  root = semantic_json(doc, tint::derive_semantic_colors(primary, options), config.format);
  return true;
}

bool scale_command(const CommandLine& cmd, const ToolConfig& config, JsonDocument& doc, json_value_s*& root)
{
  tint::Color seed;
  if (not parse_color_argument(cmd.positional[0], seed))
    return false;

  tint::Palette palette;
  if (tint::Status::Ok != tint::generate_scale(seed, config.steps, mode_of(cmd), config.preserve, palette))
    return false;

  root = scale_json(doc, palette, mode_of(cmd), config.format);
  return true;
}

bool palette_command(const CommandLine& cmd, const ToolConfig& config, JsonDocument& doc, json_value_s*& root)
{
  tint::Color seed;
  if (not parse_color_argument(cmd.positional[0], seed))
    return false;

  const tint::Palette palette =
      cmd.gray ? tint::generate_gray_palette(seed, mode_of(cmd), config.gray_mix_primary, config.gray_mix_ratio)
               : tint::generate_chromatic_palette(seed, mode_of(cmd));

  root = scale_json(doc, palette, mode_of(cmd), config.format);
  return true;
}

bool tailwind_command(const CommandLine& cmd, const ToolConfig& config, JsonDocument& doc, json_value_s*& root)
{
  tint::Color seed;
  if (not parse_color_argument(cmd.positional[0], seed))
    return false;

  const tint::Palette palette =
      cmd.dark ? tint::generate_tailwind_dark_scale(seed) : tint::generate_tailwind_scale(seed, config.preserve);

  root = scale_json(doc, palette, mode_of(cmd), config.format);
  return true;
}

bool theme_command(const CommandLine& cmd, const ToolConfig& config, JsonDocument& doc, json_value_s*& root)
{
  tint::Color primary;
  if (not parse_color_argument(cmd.positional[0], primary))
    return false;

  const tint::ThemeOptions options = {
      .gray_mix_primary = config.gray_mix_primary,
      .gray_mix_ratio   = config.gray_mix_ratio,
      .include_info     = config.include_info,
  };

  const tint::ThemePalettes theme =
      cmd.tailwind ? tint::generate_tailwind_theme(primary, config.preserve) : tint::generate_theme(primary, options);

  root = theme_json(doc, theme, config.format);
  return true;
}

bool diff_command(const CommandLine& cmd, const ToolConfig& config, JsonDocument& doc, json_value_s*& root)
{
  std::vector<tint::Color> colors;
  if (not parse_colors(cmd, colors))
    return false;

  const tint::DeltaEOptions options = {.algorithm = config.delta_e};

  root = similarity_json(doc, tint::color_similarity(colors[0], colors[1], options));
  doc.add(root, "contrast_ratio", doc.number(tint::contrast_ratio(colors[0], colors[1])));
  return true;
}

bool diversity_command(const CommandLine& cmd, const ToolConfig& config, JsonDocument& doc, json_value_s*& root)
{
  std::vector<tint::Color> colors;
  if (not parse_colors(cmd, colors))
    return false;

  const tint::DeltaEOptions options = {.algorithm = config.delta_e};

  root = diversity_json(doc, tint::analyze_palette_diversity(colors, options));
  doc.add(root, "algorithm", doc.string(tint::to_string(config.delta_e)));
  doc.add(root, "distance_matrix", distance_matrix_json(doc, tint::color_distance_matrix(colors, options)));
  return true;
}

bool extract_command(const CommandLine& cmd, const ToolConfig& config, JsonDocument& doc, json_value_s*& root)
{
  Image image;
  if (not image.load(cmd.positional[0]))
    return false;

  const tint::SampleOptions sample_options = {
      .max_samples  = config.max_samples,
      .ignore_white = config.ignore_white,
      .ignore_black = config.ignore_black,
  };

  const std::vector<tint::RGB> samples = tint::sample_pixels(image.pixels, image.width, image.height, sample_options);
  image.release();

  SDL_LogVerbose(SDL_LOG_CATEGORY_APPLICATION, "%zu pixels sampled", samples.size());

  root = doc.object();
  doc.add(root, "samples", doc.number(static_cast<uint32_t>(samples.size())));

  if (cmd.dominant)
  {
    const std::vector<tint::DominantColor> dominant = tint::find_dominant_colors(samples, config.cluster_count);
    doc.add(root, "dominant", dominant_colors_json(doc, dominant, config.format));
  }
  else
  {
    const std::vector<tint::Cluster> clusters =
        tint::kmeans_clusters(samples, config.cluster_count, config.random_seed);
    doc.add(root, "clusters", clusters_json(doc, clusters, config.format));
  }

  doc.add(root, "distribution", distribution_json(doc, tint::analyze_distribution(samples)));
  return true;
}

// best scoring classic scheme unless a scheme, an accent or a nature theme is asked for
bool harmony_command(const CommandLine& cmd, const ToolConfig& config, JsonDocument& doc, json_value_s*& root)
{
  tint::Color base;
  if (not parse_color_argument(cmd.positional[0], base))
    return false;

  tint::HarmonyResult result;

  if (cmd.nature)
  {
    tint::NatureTheme theme = tint::NatureTheme::Forest;
    if (not tint::parse_nature_theme(cmd.nature, theme))
      return false;
    result = tint::generate_nature_harmony(base, theme);
  }
  else if (cmd.accent)
  {
    result = tint::generate_accented_monochromatic(base);
  }
  else if (cmd.harmony)
  {
    tint::HarmonyOptions options;
    if (not tint::parse_harmony_type(cmd.harmony, options.type))
      return false;

    options.count     = config.cluster_count;
    options.variation = cmd.variation;
    options.seed      = config.random_seed;

    if (tint::Status::Ok != tint::generate_harmony(base, options, result))
      return false;
  }
  else
  {
    result = tint::find_best_harmony(base);
  }

  root = harmony_json(doc, result, config.format);
  return true;
}

constexpr Command commands[] = {
    {"convert", convert_command, 1, 1},     {"semantic", semantic_command, 1, 1},
    {"scale", scale_command, 1, 1},         {"palette", palette_command, 1, 1},
    {"tailwind", tailwind_command, 1, 1},   {"theme", theme_command, 1, 1},
    {"diff", diff_command, 2, 2},           {"diversity", diversity_command, 2, UINT32_MAX},
    {"extract", extract_command, 1, 1},     {"harmony", harmony_command, 1, 1},
};

const Command* find_command(const char* name)
{
  for (const Command& command : commands)
    if (0 == SDL_strcmp(command.name, name))
      return &command;
  return nullptr;
}

bool write_output(const CommandLine& cmd, const JsonDocument& doc, const json_value_s* root)
{
  SDL_RWops* handle = cmd.output_path ? SDL_RWFromFile(cmd.output_path, "wb") : SDL_RWFromFP(stdout, SDL_FALSE);
  if (nullptr == handle)
    return false;

  const bool written = doc.write(handle, root);
  const bool closed  = (0 == SDL_RWclose(handle));
  return written and closed;
}

int fail()
{
  SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "%s", SDL_GetError());
  return 1;
}

} // namespace

int main(int argc, char* argv[])
{
  const StartupFlags startup = scan_startup_flags(argc, argv);
  apply_log_priority(startup.verbose);

  if (argc < 2)
  {
    print_usage();
    return 1;
  }

  const Command* command = find_command(argv[1]);
  if (nullptr == command)
  {
    SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "unknown command '%s'", argv[1]);
    print_usage();
    return 1;
  }

  // ----- DEFAULT CONFIGS -----
  ToolConfig config;
  // ---------------------------

  if (startup.config_path and (not load_tool_config(startup.config_path, config)))
    return fail();

  CommandLine cmd;
  cmd.command = command->name;
  if (not parse_command_line(argc, argv, cmd, config))
  {
    print_usage();
    return fail();
  }

  const uint32_t positional = static_cast<uint32_t>(cmd.positional.size());
  if ((command->min_arguments > positional) or (command->max_arguments < positional))
  {
    SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "'%s' got %u arguments", cmd.command, positional);
    print_usage();
    return 1;
  }

  JsonDocument  doc;
  json_value_s* root = nullptr;

  if (not command->function(cmd, config, doc, root))
    return fail();

  if (not write_output(cmd, doc, root))
    return fail();

  return 0;
}
