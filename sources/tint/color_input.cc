#include "color_input.hh"
#include "math.hh"
#include "named_colors.hh"
#include <SDL2/SDL_error.h>

namespace tint {

namespace {

constexpr uint32_t max_text_length = 256;

struct TrimmedText
{
  char     data[max_text_length] = {};
  uint32_t length                = 0;
};

bool trim(const char* text, TrimmedText& out)
{
  while (SDL_isspace(*text))
    ++text;

  size_t length = SDL_strlen(text);
  while ((0 < length) and SDL_isspace(text[length - 1]))
    --length;

  if (length >= max_text_length)
    return false;

  SDL_memcpy(out.data, text, length);
  out.data[length] = '\0';
  out.length       = static_cast<uint32_t>(length);
  return true;
}

int hex_digit(char c)
{
  if (('0' <= c) and ('9' >= c))
    return c - '0';
  if (('a' <= c) and ('f' >= c))
    return 10 + c - 'a';
  if (('A' <= c) and ('F' >= c))
    return 10 + c - 'A';
  return -1;
}

bool is_hex_body(const char* digits, uint32_t length)
{
  if ((3 != length) and (4 != length) and (6 != length) and (8 != length))
    return false;

  for (uint32_t i = 0; i < length; ++i)
    if (0 > hex_digit(digits[i]))
      return false;

  return true;
}

// expects is_hex_body to be true
Color decode_hex_body(const char* digits, uint32_t length)
{
  int channels[4] = {0, 0, 0, 255};

  if (4 >= length)
  {
    for (uint32_t i = 0; i < length; ++i)
      channels[i] = hex_digit(digits[i]) * 17;
  }
  else
  {
    for (uint32_t i = 0; i < (length / 2); ++i)
      channels[i] = hex_digit(digits[2 * i]) * 16 + hex_digit(digits[2 * i + 1]);
  }

  return Color::from_rgb(channels[0], channels[1], channels[2], channels[3] / 255.0);
}

Status parse_hex(const char* text, Color& out)
{
  TrimmedText trimmed;
  if (not trim(text, trimmed))
  {
    SDL_SetError("color text too long");
    return Status::InvalidColorInput;
  }

  const char* digits = ('#' == trimmed.data[0]) ? &trimmed.data[1] : trimmed.data;
  const auto  length = static_cast<uint32_t>(SDL_strlen(digits));

  if (not is_hex_body(digits, length))
  {
    SDL_SetError("invalid hex color '%s'", trimmed.data);
    return Status::InvalidColorInput;
  }

  out = decode_hex_body(digits, length);
  return Status::Ok;
}

Status parse_named(const char* text, Color& out)
{
  TrimmedText trimmed;
  if (not trim(text, trimmed))
  {
    SDL_SetError("color text too long");
    return Status::InvalidColorInput;
  }

  const NamedColor* named = find_named_color(trimmed.data);
  if (named)
  {
    out = Color::from_hex(named->rgb, named->alpha);
    return Status::Ok;
  }

  // bare hex digits without the leading '#'
  if (is_hex_body(trimmed.data, trimmed.length))
  {
    out = decode_hex_body(trimmed.data, trimmed.length);
    return Status::Ok;
  }

  SDL_SetError("unknown color keyword '%s'", trimmed.data);
  return Status::InvalidColorInput;
}

bool parse_number(char* token, double& out, bool& percent)
{
  TrimmedText trimmed;
  if (not trim(token, trimmed) or (0 == trimmed.length))
    return false;

  percent = ('%' == trimmed.data[trimmed.length - 1]);
  if (percent)
    trimmed.data[--trimmed.length] = '\0';

  if (0 == trimmed.length)
    return false;

  char* end = nullptr;
  out       = SDL_strtod(trimmed.data, &end);
  return (nullptr != end) and ('\0' == *end) and (out == out);
}

Status parse_functional(const char* text, Color& out)
{
  TrimmedText trimmed;
  if (not trim(text, trimmed))
  {
    SDL_SetError("color text too long");
    return Status::InvalidColorInput;
  }

  char* open = SDL_strchr(trimmed.data, '(');
  if ((nullptr == open) or (')' != trimmed.data[trimmed.length - 1]))
  {
    SDL_SetError("malformed color function '%s'", trimmed.data);
    return Status::InvalidColorInput;
  }

  *open                            = '\0';
  trimmed.data[trimmed.length - 1] = '\0';
  char* arguments                  = open + 1;

  TrimmedText name;
  if (not trim(trimmed.data, name))
  {
    SDL_SetError("color text too long");
    return Status::InvalidColorInput;
  }

  const bool is_rgb = (0 == SDL_strcasecmp(name.data, "rgb")) or (0 == SDL_strcasecmp(name.data, "rgba"));
  const bool is_hsl = (0 == SDL_strcasecmp(name.data, "hsl")) or (0 == SDL_strcasecmp(name.data, "hsla"));

  if (not is_rgb and not is_hsl)
  {
    SDL_SetError("unknown color function '%s'", name.data);
    return Status::InvalidColorInput;
  }

  double   values[4]   = {};
  bool     percents[4] = {};
  uint32_t count       = 0;
  char*    token       = arguments;

  while (true)
  {
    char* comma = SDL_strchr(token, ',');
    if (comma)
      *comma = '\0';

    if (4 == count)
    {
      SDL_SetError("color function takes at most 4 arguments");
      return Status::InvalidColorInput;
    }

    if (not parse_number(token, values[count], percents[count]))
    {
      SDL_SetError("non numeric color function argument '%s'", token);
      return Status::InvalidColorInput;
    }

    count += 1;

    if (nullptr == comma)
      break;
    token = comma + 1;
  }

  if (3 > count)
  {
    SDL_SetError("color function needs at least 3 arguments, got %u", count);
    return Status::InvalidColorInput;
  }

  // "50%" alpha reads as 0.5, a plain number is taken as is
  double alpha = 1.0;
  if (4 == count)
    alpha = percents[3] ? (values[3] / 100.0) : values[3];

  if (is_rgb)
    out = Color::from_rgb(round_to_int(clamp(values[0], 0.0, 255.0)), round_to_int(clamp(values[1], 0.0, 255.0)),
                          round_to_int(clamp(values[2], 0.0, 255.0)), alpha);
  else
    out = Color::from_hsl({.h = values[0], .s = values[1], .l = values[2]}, alpha);

  return Status::Ok;
}

bool is_identifier_char(char c)
{
  return SDL_isalpha(c) or SDL_isdigit(c) or ('_' == c) or ('-' == c);
}

} // namespace

ColorInput ColorInput::text(const char* text)
{
  ColorInput result = {};
  result.kind       = classify_color_text(text);
  result.as.text    = text;
  return result;
}

ColorInput ColorInput::tuple(const double* values, uint32_t count)
{
  ColorInput result     = {};
  result.kind           = ColorInputKind::Tuple;
  result.as.tuple.count = count;
  for (uint32_t i = 0; i < SDL_min(count, 4u); ++i)
    result.as.tuple.values[i] = values[i];
  return result;
}

ColorInput ColorInput::rgb(double r, double g, double b, double alpha)
{
  ColorInput result = {};
  result.kind       = ColorInputKind::RGBRecord;
  result.as.record  = {.fields = {r, g, b}, .alpha = alpha};
  return result;
}

ColorInput ColorInput::hsl(double h, double s, double l, double alpha)
{
  ColorInput result = {};
  result.kind       = ColorInputKind::HSLRecord;
  result.as.record  = {.fields = {h, s, l}, .alpha = alpha};
  return result;
}

ColorInput ColorInput::hsv(double h, double s, double v, double alpha)
{
  ColorInput result = {};
  result.kind       = ColorInputKind::HSVRecord;
  result.as.record  = {.fields = {h, s, v}, .alpha = alpha};
  return result;
}

ColorInput ColorInput::hwb(double h, double w, double b, double alpha)
{
  ColorInput result = {};
  result.kind       = ColorInputKind::HWBRecord;
  result.as.record  = {.fields = {h, w, b}, .alpha = alpha};
  return result;
}

ColorInputKind classify_color_text(const char* text)
{
  while (SDL_isspace(*text))
    ++text;

  if ('#' == *text)
    return ColorInputKind::Hex;

  const char* iter = text;
  while (is_identifier_char(*iter))
    ++iter;

  while (SDL_isspace(*iter))
    ++iter;

  if ((iter != text) and ('(' == *iter))
    return ColorInputKind::FunctionalString;

  return ColorInputKind::NamedKeyword;
}

Status classify_color_record(const char* const* names, const double* values, uint32_t count, ColorInput& out)
{
  enum Field
  {
    R,
    G,
    B,
    H,
    S,
    L,
    V,
    W,
    A,
    FieldCount
  };

  const char* field_names[FieldCount] = {"r", "g", "b", "h", "s", "l", "v", "w", "a"};
  bool        present[FieldCount]     = {};
  double      fields[FieldCount]      = {};

  for (uint32_t i = 0; i < count; ++i)
  {
    const char* name = (0 == SDL_strcmp(names[i], "alpha")) ? "a" : names[i];
    for (int field = 0; field < FieldCount; ++field)
    {
      if (0 == SDL_strcmp(name, field_names[field]))
      {
        present[field] = true;
        fields[field]  = values[i];
      }
    }
  }

  const double alpha = present[A] ? fields[A] : 1.0;

  if (present[R] and present[G] and present[B])
    out = ColorInput::rgb(fields[R], fields[G], fields[B], alpha);
  else if (present[H] and present[S] and present[L])
    out = ColorInput::hsl(fields[H], fields[S], fields[L], alpha);
  else if (present[H] and present[S] and present[V])
    out = ColorInput::hsv(fields[H], fields[S], fields[V], alpha);
  else if (present[H] and present[W] and present[B])
    out = ColorInput::hwb(fields[H], fields[W], fields[B], alpha);
  else
  {
    SDL_SetError("color record needs one of the field sets {r,g,b} {h,s,l} {h,s,v} {h,w,b}");
    return Status::InvalidColorInput;
  }

  return Status::Ok;
}

Status resolve(const ColorInput& input, Color& out)
{
  switch (input.kind)
  {
  case ColorInputKind::Hex:
    return parse_hex(input.as.text, out);
  case ColorInputKind::FunctionalString:
    return parse_functional(input.as.text, out);
  case ColorInputKind::NamedKeyword:
    return parse_named(input.as.text, out);
  case ColorInputKind::Tuple: {
    const ColorTuple& tuple = input.as.tuple;
    if ((3 != tuple.count) and (4 != tuple.count))
    {
      SDL_SetError("color tuple must have 3 or 4 elements, got %u", tuple.count);
      return Status::InvalidColorInput;
    }
    out = Color::from_rgb(round_to_int(clamp(tuple.values[0], 0.0, 255.0)),
                          round_to_int(clamp(tuple.values[1], 0.0, 255.0)),
                          round_to_int(clamp(tuple.values[2], 0.0, 255.0)), (4 == tuple.count) ? tuple.values[3] : 1.0);
    return Status::Ok;
  }
  case ColorInputKind::RGBRecord: {
    const ColorRecord& record = input.as.record;
    out = Color::from_rgb(round_to_int(clamp(record.fields[0], 0.0, 255.0)),
                          round_to_int(clamp(record.fields[1], 0.0, 255.0)),
                          round_to_int(clamp(record.fields[2], 0.0, 255.0)), record.alpha);
    return Status::Ok;
  }
  case ColorInputKind::HSLRecord: {
    const ColorRecord& record = input.as.record;
    out = Color::from_hsl({.h = record.fields[0], .s = record.fields[1], .l = record.fields[2]}, record.alpha);
    return Status::Ok;
  }
  case ColorInputKind::HSVRecord: {
    const ColorRecord& record = input.as.record;
    out = Color::from_hsv({.h = record.fields[0], .s = record.fields[1], .v = record.fields[2]}, record.alpha);
    return Status::Ok;
  }
  case ColorInputKind::HWBRecord: {
    const ColorRecord& record = input.as.record;
    out = Color::from_hwb({.h = record.fields[0], .w = record.fields[1], .b = record.fields[2]}, record.alpha);
    return Status::Ok;
  }
  default:
    SDL_SetError("unknown color input kind");
    return Status::InvalidColorInput;
  }
}

Status parse_color(const char* text, Color& out)
{
  if (nullptr == text)
  {
    SDL_SetError("missing color text");
    return Status::InvalidColorInput;
  }

  return resolve(ColorInput::text(text), out);
}

} // namespace tint
