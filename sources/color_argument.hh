#pragma once

#include "tint/color.hh"

//
// Command line color: any color text ("#1890ff", "rgb(24, 144, 255)", "dodgerblue"), a json array
// tuple ("[24, 144, 255]") or a json record ("{"h": 209, "s": 100, "l": 55}").
//
bool parse_color_argument(const char* argument, tint::Color& out);
