#define SDL_MAIN_HANDLED
#include "../sources/color_argument.hh"
#include "../sources/json_export.hh"
#include "../sources/tool_config.hh"
#include <SDL2/SDL.h>
#include <cstdio>
#include <limits>

using namespace tint;

namespace {

bool parse(const char* text, ToolConfig& config)
{
  return parse_tool_config(text, SDL_strlen(text), config);
}

void full_config()
{
  const char* text = R"({
  "gray_mix_primary": false,
  "gray_mix_ratio": 0.35,
  "preserve": false,
  "include_info": true,
  "format": "hsl",
  "steps": 14,
  "cluster_count": 8,
  "random_seed": 99,
  "max_samples": 500,
  "ignore_white": true,
  "ignore_black": true,
  "delta_e": "cmc"
})";

  ToolConfig config;
  SDL_assert(parse(text, config));
  SDL_assert(not config.gray_mix_primary);
  SDL_assert(0.35 == config.gray_mix_ratio);
  SDL_assert(not config.preserve);
  SDL_assert(config.include_info);
  SDL_assert(ColorFormat::Hsl == config.format);
  SDL_assert(14 == config.steps);
  SDL_assert(8 == config.cluster_count);
  SDL_assert(99 == config.random_seed);
  SDL_assert(500 == config.max_samples);
  SDL_assert(config.ignore_white);
  SDL_assert(config.ignore_black);
  SDL_assert(DeltaEAlgorithm::CMC == config.delta_e);
}

void partial_and_unknown_keys()
{
  ToolConfig config;
  SDL_assert(parse(R"({"steps": 5, "colour": "red"})", config));
  SDL_assert(5 == config.steps);
  SDL_assert(config.preserve);
  SDL_assert(ColorFormat::Hex == config.format);
  SDL_assert(DeltaEAlgorithm::CIEDE2000 == config.delta_e);

  SDL_assert(parse("{}", config));
  SDL_assert(5 == config.steps);
}

void rejected_configs()
{
  ToolConfig config;
  config.steps = 7;

  SDL_assert(not parse(R"({"cluster_count": 3, "steps": "many"})", config));
  SDL_assert(0 < SDL_strlen(SDL_GetError()));
  SDL_assert(7 == config.steps);
  SDL_assert(5 == config.cluster_count);

  SDL_assert(not parse(R"({"preserve": 1})", config));
  SDL_assert(config.preserve);
  SDL_assert(not parse(R"({"steps": -3})", config));
  SDL_assert(not parse(R"({"steps": 2.5})", config));
  SDL_assert(not parse(R"({"format": "cmyk"})", config));
  SDL_assert(not parse(R"({"delta_e": 2000})", config));
  SDL_assert(not parse(R"([1, 2, 3])", config));
  SDL_assert(not parse(R"({"steps": )", config));
  SDL_assert(7 == config.steps);

  SDL_assert(not load_tool_config("this/file/does/not/exist.json", config));
}

void color_arguments()
{
  Color color;

  SDL_assert(parse_color_argument("#1890ff", color));
  SDL_assert(0x1890FF == color.packed());

  SDL_assert(parse_color_argument("[24, 144, 255]", color));
  SDL_assert(0x1890FF == color.packed());

  SDL_assert(parse_color_argument("[24, 144, 255, 0.5]", color));
  SDL_assert(0.5 == color.alpha);

  SDL_assert(parse_color_argument(R"({"h": 120, "s": 100, "l": 50})", color));
  SDL_assert(0x00FF00 == color.packed());

  SDL_assert(parse_color_argument(R"( {"b": 255, "g": 0, "r": 0, "alpha": 0.25})", color));
  SDL_assert(0x0000FF == color.packed());
  SDL_assert(0.25 == color.alpha);

  SDL_assert(not parse_color_argument("[1, 2]", color));
  SDL_assert(not parse_color_argument(R"(["a", 2, 3])", color));
  SDL_assert(not parse_color_argument(R"({"r": 1, "g": 2})", color));
  SDL_assert(not parse_color_argument("[1, 2, 3", color));
  SDL_assert(not parse_color_argument("nope", color));
}

void json_output()
{
  JsonDocument  doc;
  json_value_s* root = doc.object();

  doc.add(root, "color", color_json(doc, Color::from_hex(0x1890FF), ColorFormat::Hex));
  doc.add(root, "steps", doc.number(12u));
  doc.add(root, "ratio", doc.number(0.25));
  doc.add(root, "dark", doc.boolean(true));

  json_value_s* list = doc.array();
  doc.append(list, doc.string("first"));
  doc.append(list, doc.string("second"));
  doc.add(root, "list", list);

  SDL_assert(5 == reinterpret_cast<json_object_s*>(root->payload)->length);
  SDL_assert(2 == reinterpret_cast<json_array_s*>(list->payload)->length);

  char       buffer[1024] = {};
  SDL_RWops* handle       = SDL_RWFromMem(buffer, sizeof(buffer) - 1);
  SDL_assert(doc.write(handle, root));
  const Sint64 written = SDL_RWtell(handle);
  SDL_RWclose(handle);

  SDL_assert(0 < written);
  SDL_assert('\n' == buffer[written - 1]);
  SDL_assert(nullptr != SDL_strstr(buffer, "\"#1890FF\""));
  SDL_assert(nullptr != SDL_strstr(buffer, "\"steps\""));
  SDL_assert(nullptr != SDL_strstr(buffer, "0.25"));
  SDL_assert(nullptr != SDL_strstr(buffer, "true"));
  SDL_Log("%s", buffer);

  // written document parses back
  json_value_s* parsed = json_parse(buffer, static_cast<size_t>(written));
  SDL_assert(nullptr != parsed);
  SDL_assert(json_type_object == parsed->type);
  SDL_assert(5 == reinterpret_cast<json_object_s*>(parsed->payload)->length);
  free(parsed);
}

void palette_output()
{
  JsonDocument         doc;
  const Palette        palette = generate_chromatic_palette(Color::from_hex(0x1890FF), ThemeMode::Light);
  json_value_s*        root    = scale_json(doc, palette, ThemeMode::Light, ColorFormat::Rgb);
  const json_object_s* object  = reinterpret_cast<json_object_s*>(root->payload);

  SDL_assert(3 == object->length);
  SDL_assert(0 == SDL_strcmp("mode", object->start->name->string));

  const json_object_element_s* steps_element = object->start->next->next;
  SDL_assert(0 == SDL_strcmp("steps", steps_element->name->string));
  SDL_assert(TINT_CHROMATIC_STEPS == reinterpret_cast<json_object_s*>(steps_element->value->payload)->length);

  const json_object_element_s* center_element = object->start->next;
  SDL_assert(0 == SDL_strcmp("7", reinterpret_cast<json_string_s*>(center_element->value->payload)->string));

  const ThemePalettes theme = generate_theme(Color::from_hex(0x1890FF));
  json_value_s*       tree  = theme_json(doc, theme, ColorFormat::Hex);
  SDL_assert(2 == reinterpret_cast<json_object_s*>(tree->payload)->length);

  // nan has no json form
  SDL_assert(json_type_null == doc.number(std::numeric_limits<double>::quiet_NaN())->type);
}

struct CapturedLog
{
  uint32_t verbose_lines = 0;
  bool     config_loaded = false;
};

void capture_log(void* userdata, int, SDL_LogPriority priority, const char* message)
{
  CapturedLog* captured = reinterpret_cast<CapturedLog*>(userdata);
  if (SDL_LOG_PRIORITY_VERBOSE == priority)
    captured->verbose_lines += 1;
  if (SDL_strstr(message, "config loaded"))
    captured->config_loaded = true;
}

void startup_flags()
{
  char  command[]  = "tint_tool";
  char  convert[]  = "convert";
  char  color[]    = "#1890FF";
  char  config[]   = "--config";
  char  path[]     = "tint_startup_config.json";
  char  verbose[]  = "--verbose";
  char* argv[]     = {command, convert, color, config, path, verbose};
  char* no_flags[] = {command, convert, color};

  // --verbose comes after --config and still has to be seen first
  const StartupFlags flags = scan_startup_flags(6, argv);
  SDL_assert(flags.verbose);
  SDL_assert(0 == SDL_strcmp(path, flags.config_path));

  const StartupFlags plain = scan_startup_flags(3, no_flags);
  SDL_assert(not plain.verbose);
  SDL_assert(nullptr == plain.config_path);

  // dangling --config has no path
  SDL_assert(nullptr == scan_startup_flags(4, argv).config_path);

  const char* text   = R"({"steps": 7})";
  SDL_RWops*  handle = SDL_RWFromFile(path, "wb");
  SDL_assert(nullptr != handle);
  const size_t written = SDL_RWwrite(handle, text, SDL_strlen(text), 1);
  SDL_RWclose(handle);
  SDL_assert(1 == written);

  SDL_LogOutputFunction previous_function = nullptr;
  void*                 previous_userdata = nullptr;
  SDL_LogGetOutputFunction(&previous_function, &previous_userdata);

  CapturedLog captured;
  SDL_LogSetOutputFunction(capture_log, &captured);

  apply_log_priority(flags.verbose);
  SDL_assert(SDL_LOG_PRIORITY_VERBOSE == SDL_LogGetPriority(SDL_LOG_CATEGORY_APPLICATION));

  ToolConfig loaded;
  bool       ok = load_tool_config(flags.config_path, loaded);
  SDL_assert(ok);
  SDL_assert(7 == loaded.steps);
  SDL_assert(captured.config_loaded);

  apply_log_priority(plain.verbose);
  SDL_assert(SDL_LOG_PRIORITY_INFO == SDL_LogGetPriority(SDL_LOG_CATEGORY_APPLICATION));

  captured = CapturedLog();
  ok       = load_tool_config(flags.config_path, loaded);
  SDL_assert(ok);
  SDL_assert(not captured.config_loaded);
  SDL_assert(0 == captured.verbose_lines);

  SDL_LogSetOutputFunction(previous_function, previous_userdata);
  const int removed = std::remove(path);
  SDL_assert(0 == removed);
}

} // namespace

int main()
{
  SDL_Log("full config");
  full_config();
  SDL_Log("partial and unknown keys");
  partial_and_unknown_keys();
  SDL_Log("rejected configs");
  rejected_configs();
  SDL_Log("color arguments");
  color_arguments();
  SDL_Log("json output");
  json_output();
  SDL_Log("palette output");
  palette_output();
  SDL_Log("startup flags");
  startup_flags();
  SDL_Log("ToolConfig OK");
  return 0;
}
