#include "tool_config.hh"
#include <SDL2/SDL_error.h>
#include <SDL2/SDL_log.h>
#include <SDL2/SDL_rwops.h>
#include <cmath>
#include <cstdlib>
#include <json.h>
#include <vector>

namespace {

bool read_bool(const json_object_element_s* element, bool& out)
{
  if (json_type_true == element->value->type)
  {
    out = true;
    return true;
  }

  if (json_type_false == element->value->type)
  {
    out = false;
    return true;
  }

  SDL_SetError("config: '%s' has to be true or false", element->name->string);
  return false;
}

bool read_number(const json_object_element_s* element, double& out)
{
  if (json_type_number != element->value->type)
  {
    SDL_SetError("config: '%s' has to be a number", element->name->string);
    return false;
  }

  const json_number_s* number     = reinterpret_cast<const json_number_s*>(element->value->payload);
  char                 buffer[64] = {};
  SDL_memcpy(buffer, number->number, SDL_min(sizeof(buffer) - 1, number->number_size));
  out = SDL_strtod(buffer, nullptr);
  return true;
}

bool read_count(const json_object_element_s* element, uint32_t& out)
{
  double value = 0.0;
  if (not read_number(element, value))
    return false;

  if ((0.0 > value) or (UINT32_MAX < value) or (value != std::floor(value)))
  {
    SDL_SetError("config: '%s' has to be a non negative integer", element->name->string);
    return false;
  }

  out = static_cast<uint32_t>(value);
  return true;
}

const char* read_string(const json_object_element_s* element)
{
  if (json_type_string != element->value->type)
  {
    SDL_SetError("config: '%s' has to be a string", element->name->string);
    return nullptr;
  }

  return reinterpret_cast<const json_string_s*>(element->value->payload)->string;
}

bool apply_element(const json_object_element_s* element, ToolConfig& config)
{
  const char* name = element->name->string;

  if (0 == SDL_strcmp("gray_mix_primary", name))
    return read_bool(element, config.gray_mix_primary);
  if (0 == SDL_strcmp("gray_mix_ratio", name))
    return read_number(element, config.gray_mix_ratio);
  if (0 == SDL_strcmp("preserve", name))
    return read_bool(element, config.preserve);
  if (0 == SDL_strcmp("include_info", name))
    return read_bool(element, config.include_info);
  if (0 == SDL_strcmp("steps", name))
    return read_count(element, config.steps);
  if (0 == SDL_strcmp("cluster_count", name))
    return read_count(element, config.cluster_count);
  if (0 == SDL_strcmp("random_seed", name))
    return read_count(element, config.random_seed);
  if (0 == SDL_strcmp("max_samples", name))
    return read_count(element, config.max_samples);
  if (0 == SDL_strcmp("ignore_white", name))
    return read_bool(element, config.ignore_white);
  if (0 == SDL_strcmp("ignore_black", name))
    return read_bool(element, config.ignore_black);

  if (0 == SDL_strcmp("format", name))
  {
    const char* format = read_string(element);
    return format and tint::parse_color_format(format, config.format);
  }

  if (0 == SDL_strcmp("delta_e", name))
  {
    const char* algorithm = read_string(element);
    return algorithm and tint::parse_delta_e_algorithm(algorithm, config.delta_e);
  }

  SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "config: unknown key '%s' ignored", name);
  return true;
}

} // namespace

bool parse_tool_config(const char* text, size_t size, ToolConfig& config)
{
  json_parse_result_s parse_result = {};
  json_value_s*       root = json_parse_ex(text, size, json_parse_flags_default, nullptr, nullptr, &parse_result);

  if (nullptr == root)
  {
    SDL_SetError("config: malformed json at line %u, column %u", static_cast<uint32_t>(parse_result.error_line_no),
                 static_cast<uint32_t>(parse_result.error_row_no));
    return false;
  }

  if (json_type_object != root->type)
  {
    free(root);
    SDL_SetError("config: top level value has to be an object");
    return false;
  }

  ToolConfig     updated     = config;
  json_object_s* main_object = reinterpret_cast<json_object_s*>(root->payload);
  bool           ok          = true;

  for (json_object_element_s* element = main_object->start; ok and (nullptr != element); element = element->next)
    ok = apply_element(element, updated);

  free(root);

  if (ok)
    config = updated;

  return ok;
}

bool load_tool_config(const char* path, ToolConfig& config)
{
  SDL_RWops* handle = SDL_RWFromFile(path, "rb");
  if (nullptr == handle)
    return false;

  const Sint64 file_length = SDL_RWsize(handle);
  if (0 > file_length)
  {
    SDL_RWclose(handle);
    return false;
  }

  std::vector<char> buffer(static_cast<size_t>(file_length));
  const size_t      read = buffer.empty() ? 0 : SDL_RWread(handle, buffer.data(), buffer.size(), 1);
  SDL_RWclose(handle);

  if ((not buffer.empty()) and (1 != read))
  {
    SDL_SetError("config: can't read '%s'", path);
    return false;
  }

  if (not parse_tool_config(buffer.data(), buffer.size(), config))
    return false;

  SDL_LogVerbose(SDL_LOG_CATEGORY_APPLICATION, "config loaded from '%s'", path);
  return true;
}

StartupFlags scan_startup_flags(int argc, char* argv[])
{
  StartupFlags result;

  for (int i = 2; i < argc; ++i)
  {
    if (0 == SDL_strcmp(argv[i], "--verbose"))
    {
      result.verbose = true;
    }
    else if ((0 == SDL_strcmp(argv[i], "--config")) and ((i + 1) < argc))
    {
      result.config_path = argv[i + 1];
      i += 1;
    }
  }

  return result;
}

void apply_log_priority(bool verbose)
{
  SDL_LogSetPriority(SDL_LOG_CATEGORY_APPLICATION, verbose ? SDL_LOG_PRIORITY_VERBOSE : SDL_LOG_PRIORITY_INFO);
}
