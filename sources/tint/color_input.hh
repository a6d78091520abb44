#pragma once

#include "color.hh"
#include "status.hh"

//
// Heterogeneous color input, classified once at the boundary and resolved into a Color.
//
// Text kinds keep a pointer to the caller's string, it has to outlive the ColorInput.
// Record kinds store their three fields in declaration order:
//  RGBRecord {r, g, b}   HSLRecord {h, s, l}   HSVRecord {h, s, v}   HWBRecord {h, w, b}
//

namespace tint {

enum class ColorInputKind
{
  Hex,
  FunctionalString,
  NamedKeyword,
  Tuple,
  RGBRecord,
  HSLRecord,
  HSVRecord,
  HWBRecord
};

struct ColorTuple
{
  double   values[4];
  uint32_t count;
};

struct ColorRecord
{
  double fields[3];
  double alpha;
};

struct ColorInput
{
  static ColorInput text(const char* text);
  static ColorInput tuple(const double* values, uint32_t count);
  static ColorInput rgb(double r, double g, double b, double alpha = 1.0);
  static ColorInput hsl(double h, double s, double l, double alpha = 1.0);
  static ColorInput hsv(double h, double s, double v, double alpha = 1.0);
  static ColorInput hwb(double h, double w, double b, double alpha = 1.0);

  ColorInputKind kind;
  union
  {
    const char* text;
    ColorTuple  tuple;
    ColorRecord record;
  } as;
};

// leading '#' is Hex, identifier followed by '(' is FunctionalString, anything else is NamedKeyword
ColorInputKind classify_color_text(const char* text);

//
// Chooses the record kind by field set: {r,g,b} | {h,s,l} | {h,s,v} | {h,w,b}, optionally with "a" or "alpha".
// Fields are matched by name, so any order works. Fails with InvalidColorInput when no set is complete.
//
Status classify_color_record(const char* const* names, const double* values, uint32_t count, ColorInput& out);

Status resolve(const ColorInput& input, Color& out);

// classify_color_text + resolve in one go
Status parse_color(const char* text, Color& out);

} // namespace tint
