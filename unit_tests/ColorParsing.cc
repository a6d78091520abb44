#define SDL_MAIN_HANDLED
#include "../sources/tint/color_input.hh"
#include "../sources/tint/named_colors.hh"
#include <SDL2/SDL.h>

using namespace tint;

namespace {

bool same_rgb(const Color& color, int r, int g, int b)
{
  return (r == color.r) and (g == color.g) and (b == color.b);
}

bool rejects(const char* text)
{
  Color color;
  return Status::InvalidColorInput == parse_color(text, color);
}

void hex_strings()
{
  Color color;

  SDL_assert(Status::Ok == parse_color("#1890ff", color));
  SDL_assert(same_rgb(color, 24, 144, 255));
  SDL_assert(1.0 == color.alpha);
  SDL_assert(0 == SDL_strcmp("#1890FF", color.hex().text));

  SDL_assert(Status::Ok == parse_color("#abc", color));
  SDL_assert(same_rgb(color, 170, 187, 204));

  SDL_assert(Status::Ok == parse_color("#abcd", color));
  SDL_assert(same_rgb(color, 170, 187, 204));
  SDL_assert(SDL_fabs(color.alpha - (221.0 / 255.0)) < 1e-9);

  SDL_assert(Status::Ok == parse_color("  #1890FF80 ", color));
  SDL_assert(same_rgb(color, 24, 144, 255));
  SDL_assert(SDL_fabs(color.alpha - (128.0 / 255.0)) < 1e-9);
  SDL_assert(0 == SDL_strcmp("#1890FF80", color.hex(true).text));

  SDL_assert(rejects("#12"));
  SDL_assert(rejects("#12345"));
  SDL_assert(rejects("#ggg"));
  SDL_assert(rejects("#"));

  // keyword position, but valid hex digits
  SDL_assert(Status::Ok == parse_color("1890ff", color));
  SDL_assert(same_rgb(color, 24, 144, 255));
}

void hex_round_trip()
{
  char  lower[16] = {};
  char  upper[16] = {};
  Color color;

  for (uint32_t value = 0; value <= 0xFFFFFF; value += 0x010307)
  {
    SDL_snprintf(lower, sizeof(lower), "#%06x", value);
    SDL_snprintf(upper, sizeof(upper), "#%06X", value);

    SDL_assert(Status::Ok == parse_color(lower, color));
    SDL_assert(value == color.packed());
    SDL_assert(0 == SDL_strcmp(upper, color.hex().text));
  }
}

void functional_strings()
{
  Color color;

  SDL_assert(Status::Ok == parse_color("rgb(24, 144, 255)", color));
  SDL_assert(same_rgb(color, 24, 144, 255));

  SDL_assert(Status::Ok == parse_color("rgba(0, 0, 255, 0.5)", color));
  SDL_assert(same_rgb(color, 0, 0, 255));
  SDL_assert(0.5 == color.alpha);

  SDL_assert(Status::Ok == parse_color("rgba(0, 0, 0, 50%)", color));
  SDL_assert(same_rgb(color, 0, 0, 0));
  SDL_assert(0.5 == color.alpha);

  SDL_assert(Status::Ok == parse_color("hsla(0, 100%, 50%, 25%)", color));
  SDL_assert(0.25 == color.alpha);

  SDL_assert(Status::Ok == parse_color("RGB(300, -5, 10.4)", color));
  SDL_assert(same_rgb(color, 255, 0, 10));

  SDL_assert(Status::Ok == parse_color("hsl(120, 100%, 50%)", color));
  SDL_assert(same_rgb(color, 0, 255, 0));

  SDL_assert(Status::Ok == parse_color("hsla(0, 100%, 50%, 2)", color));
  SDL_assert(same_rgb(color, 255, 0, 0));
  SDL_assert(1.0 == color.alpha);

  SDL_assert(rejects("rgb(1, 2)"));
  SDL_assert(rejects("rgb(1, 2, 3, 4, 5)"));
  SDL_assert(rejects("rgb(a, b, c)"));
  SDL_assert(rejects("rgb(1, , 3)"));
  SDL_assert(rejects("rgb(1, 2, 3"));
  SDL_assert(rejects("cmyk(1, 2, 3, 4)"));
}

void named_keywords()
{
  Color color;

  SDL_assert(Status::Ok == parse_color("dodgerblue", color));
  SDL_assert(same_rgb(color, 30, 144, 255));

  SDL_assert(Status::Ok == parse_color("DodgerBlue", color));
  SDL_assert(same_rgb(color, 30, 144, 255));

  SDL_assert(Status::Ok == parse_color("transparent", color));
  SDL_assert(0.0 == color.alpha);

  SDL_assert(rejects("notacolor"));
  SDL_assert(rejects(""));

  SDL_assert(0 == SDL_strcmp("red", find_color_name(0xFF0000)->name));
  SDL_assert(0 == SDL_strcmp("aqua", find_color_name(0x00FFFF)->name));
  SDL_assert(nullptr == find_color_name(0x1890FF));
  SDL_assert(nullptr == find_named_color("blurple"));
}

void text_classification()
{
  SDL_assert(ColorInputKind::Hex == classify_color_text("#fff"));
  SDL_assert(ColorInputKind::Hex == classify_color_text("  #fff"));
  SDL_assert(ColorInputKind::FunctionalString == classify_color_text("rgb(1, 2, 3)"));
  SDL_assert(ColorInputKind::FunctionalString == classify_color_text("hsl (1, 2, 3)"));
  SDL_assert(ColorInputKind::NamedKeyword == classify_color_text("red"));
  SDL_assert(ColorInputKind::NamedKeyword == classify_color_text("(1, 2, 3)"));
}

void tuples_and_records()
{
  Color color;

  const double rgb[]  = {24.0, 144.0, 255.0};
  const double rgba[] = {24.0, 144.0, 255.0, 0.25};
  SDL_assert(Status::Ok == resolve(ColorInput::tuple(rgb, 3), color));
  SDL_assert(same_rgb(color, 24, 144, 255));
  SDL_assert(Status::Ok == resolve(ColorInput::tuple(rgba, 4), color));
  SDL_assert(0.25 == color.alpha);
  SDL_assert(Status::InvalidColorInput == resolve(ColorInput::tuple(rgb, 2), color));

  ColorInput input = {};

  const char*  hsl_names[]  = {"l", "h", "s"};
  const double hsl_values[] = {50.0, 120.0, 100.0};
  SDL_assert(Status::Ok == classify_color_record(hsl_names, hsl_values, 3, input));
  SDL_assert(ColorInputKind::HSLRecord == input.kind);
  SDL_assert(Status::Ok == resolve(input, color));
  SDL_assert(same_rgb(color, 0, 255, 0));

  const char*  rgb_names[]  = {"r", "g", "b", "alpha"};
  const double rgb_values[] = {255.0, 0.0, 0.0, 0.5};
  SDL_assert(Status::Ok == classify_color_record(rgb_names, rgb_values, 4, input));
  SDL_assert(ColorInputKind::RGBRecord == input.kind);
  SDL_assert(Status::Ok == resolve(input, color));
  SDL_assert(same_rgb(color, 255, 0, 0));
  SDL_assert(0.5 == color.alpha);

  const char*  hsv_names[]  = {"h", "s", "v"};
  const double hsv_values[] = {240.0, 100.0, 100.0};
  SDL_assert(Status::Ok == classify_color_record(hsv_names, hsv_values, 3, input));
  SDL_assert(ColorInputKind::HSVRecord == input.kind);
  SDL_assert(Status::Ok == resolve(input, color));
  SDL_assert(same_rgb(color, 0, 0, 255));

  const char*  hwb_names[]  = {"h", "w", "b"};
  const double hwb_values[] = {0.0, 0.0, 0.0};
  SDL_assert(Status::Ok == classify_color_record(hwb_names, hwb_values, 3, input));
  SDL_assert(ColorInputKind::HWBRecord == input.kind);
  SDL_assert(Status::Ok == resolve(input, color));
  SDL_assert(same_rgb(color, 255, 0, 0));

  const char*  broken_names[]  = {"r", "g", "x"};
  const double broken_values[] = {1.0, 2.0, 3.0};
  SDL_assert(Status::InvalidColorInput == classify_color_record(broken_names, broken_values, 3, input));
  SDL_assert(0 < SDL_strlen(SDL_GetError()));

  SDL_assert(Status::Ok == resolve(ColorInput::rgb(-20.0, 300.0, 127.6), color));
  SDL_assert(same_rgb(color, 0, 255, 128));
}

} // namespace

int main()
{
  SDL_Log("hex strings");
  hex_strings();
  SDL_Log("hex round trip");
  hex_round_trip();
  SDL_Log("functional strings");
  functional_strings();
  SDL_Log("named keywords");
  named_keywords();
  SDL_Log("text classification");
  text_classification();
  SDL_Log("tuples and records");
  tuples_and_records();
  SDL_Log("ColorParsing OK");
  return 0;
}
