#include "color_argument.hh"
#include "tint/color_input.hh"
#include <SDL2/SDL_error.h>
#include <cstdlib>
#include <json.h>

namespace {

constexpr uint32_t max_fields = 8;

bool number_value(const json_value_s* value, double& out)
{
  if (json_type_number != value->type)
  {
    SDL_SetError("color values have to be numbers");
    return false;
  }

  const json_number_s* number     = reinterpret_cast<const json_number_s*>(value->payload);
  char                 buffer[64] = {};
  SDL_memcpy(buffer, number->number, SDL_min(sizeof(buffer) - 1, number->number_size));
  out = SDL_strtod(buffer, nullptr);
  return true;
}

bool tuple_input(const json_array_s* array, tint::ColorInput& out)
{
  double   values[max_fields] = {};
  uint32_t count              = 0;

  for (const json_array_element_s* it = array->start; nullptr != it; it = it->next)
  {
    if (max_fields == count)
    {
      SDL_SetError("color tuple has too many values");
      return false;
    }

    if (not number_value(it->value, values[count++]))
      return false;
  }

  out = tint::ColorInput::tuple(values, count);
  return true;
}

bool record_input(const json_object_s* object, tint::ColorInput& out)
{
  const char* names[max_fields]  = {};
  double      values[max_fields] = {};
  uint32_t    count              = 0;

  for (const json_object_element_s* it = object->start; nullptr != it; it = it->next)
  {
    if (max_fields == count)
    {
      SDL_SetError("color record has too many fields");
      return false;
    }

    names[count] = it->name->string;
    if (not number_value(it->value, values[count++]))
      return false;
  }

  return tint::Status::Ok == tint::classify_color_record(names, values, count, out);
}

} // namespace

bool parse_color_argument(const char* argument, tint::Color& out)
{
  const char* first = argument;
  while (SDL_isspace(*first))
    ++first;

  if (('[' != *first) and ('{' != *first))
    return tint::Status::Ok == tint::parse_color(argument, out);

  json_value_s* root = json_parse(argument, SDL_strlen(argument));
  if (nullptr == root)
  {
    SDL_SetError("malformed json color '%s'", argument);
    return false;
  }

  tint::ColorInput input = {};
  bool             ok    = false;

  if (json_type_array == root->type)
    ok = tuple_input(reinterpret_cast<const json_array_s*>(root->payload), input);
  else if (json_type_object == root->type)
    ok = record_input(reinterpret_cast<const json_object_s*>(root->payload), input);
  else
    SDL_SetError("color has to be a json array or object");

  ok = ok and (tint::Status::Ok == tint::resolve(input, out));

  free(root);
  return ok;
}
