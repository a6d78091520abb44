#include "named_colors.hh"

namespace tint {

namespace {

//
// The 148 CSS named colors sorted by name, followed by "transparent".
//
const NamedColor named_colors[] = {
    {"aliceblue", 0xF0F8FF, 1.0},
    {"antiquewhite", 0xFAEBD7, 1.0},
    {"aqua", 0x00FFFF, 1.0},
    {"aquamarine", 0x7FFFD4, 1.0},
    {"azure", 0xF0FFFF, 1.0},
    {"beige", 0xF5F5DC, 1.0},
    {"bisque", 0xFFE4C4, 1.0},
    {"black", 0x000000, 1.0},
    {"blanchedalmond", 0xFFEBCD, 1.0},
    {"blue", 0x0000FF, 1.0},
    {"blueviolet", 0x8A2BE2, 1.0},
    {"brown", 0xA52A2A, 1.0},
    {"burlywood", 0xDEB887, 1.0},
    {"cadetblue", 0x5F9EA0, 1.0},
    {"chartreuse", 0x7FFF00, 1.0},
    {"chocolate", 0xD2691E, 1.0},
    {"coral", 0xFF7F50, 1.0},
    {"cornflowerblue", 0x6495ED, 1.0},
    {"cornsilk", 0xFFF8DC, 1.0},
    {"crimson", 0xDC143C, 1.0},
    {"cyan", 0x00FFFF, 1.0},
    {"darkblue", 0x00008B, 1.0},
    {"darkcyan", 0x008B8B, 1.0},
    {"darkgoldenrod", 0xB8860B, 1.0},
    {"darkgray", 0xA9A9A9, 1.0},
    {"darkgreen", 0x006400, 1.0},
    {"darkgrey", 0xA9A9A9, 1.0},
    {"darkkhaki", 0xBDB76B, 1.0},
    {"darkmagenta", 0x8B008B, 1.0},
    {"darkolivegreen", 0x556B2F, 1.0},
    {"darkorange", 0xFF8C00, 1.0},
    {"darkorchid", 0x9932CC, 1.0},
    {"darkred", 0x8B0000, 1.0},
    {"darksalmon", 0xE9967A, 1.0},
    {"darkseagreen", 0x8FBC8F, 1.0},
    {"darkslateblue", 0x483D8B, 1.0},
    {"darkslategray", 0x2F4F4F, 1.0},
    {"darkslategrey", 0x2F4F4F, 1.0},
    {"darkturquoise", 0x00CED1, 1.0},
    {"darkviolet", 0x9400D3, 1.0},
    {"deeppink", 0xFF1493, 1.0},
    {"deepskyblue", 0x00BFFF, 1.0},
    {"dimgray", 0x696969, 1.0},
    {"dimgrey", 0x696969, 1.0},
    {"dodgerblue", 0x1E90FF, 1.0},
    {"firebrick", 0xB22222, 1.0},
    {"floralwhite", 0xFFFAF0, 1.0},
    {"forestgreen", 0x228B22, 1.0},
    {"fuchsia", 0xFF00FF, 1.0},
    {"gainsboro", 0xDCDCDC, 1.0},
    {"ghostwhite", 0xF8F8FF, 1.0},
    {"gold", 0xFFD700, 1.0},
    {"goldenrod", 0xDAA520, 1.0},
    {"gray", 0x808080, 1.0},
    {"green", 0x008000, 1.0},
    {"greenyellow", 0xADFF2F, 1.0},
    {"grey", 0x808080, 1.0},
    {"honeydew", 0xF0FFF0, 1.0},
    {"hotpink", 0xFF69B4, 1.0},
    {"indianred", 0xCD5C5C, 1.0},
    {"indigo", 0x4B0082, 1.0},
    {"ivory", 0xFFFFF0, 1.0},
    {"khaki", 0xF0E68C, 1.0},
    {"lavender", 0xE6E6FA, 1.0},
    {"lavenderblush", 0xFFF0F5, 1.0},
    {"lawngreen", 0x7CFC00, 1.0},
    {"lemonchiffon", 0xFFFACD, 1.0},
    {"lightblue", 0xADD8E6, 1.0},
    {"lightcoral", 0xF08080, 1.0},
    {"lightcyan", 0xE0FFFF, 1.0},
    {"lightgoldenrodyellow", 0xFAFAD2, 1.0},
    {"lightgray", 0xD3D3D3, 1.0},
    {"lightgreen", 0x90EE90, 1.0},
    {"lightgrey", 0xD3D3D3, 1.0},
    {"lightpink", 0xFFB6C1, 1.0},
    {"lightsalmon", 0xFFA07A, 1.0},
    {"lightseagreen", 0x20B2AA, 1.0},
    {"lightskyblue", 0x87CEFA, 1.0},
    {"lightslategray", 0x778899, 1.0},
    {"lightslategrey", 0x778899, 1.0},
    {"lightsteelblue", 0xB0C4DE, 1.0},
    {"lightyellow", 0xFFFFE0, 1.0},
    {"lime", 0x00FF00, 1.0},
    {"limegreen", 0x32CD32, 1.0},
    {"linen", 0xFAF0E6, 1.0},
    {"magenta", 0xFF00FF, 1.0},
    {"maroon", 0x800000, 1.0},
    {"mediumaquamarine", 0x66CDAA, 1.0},
    {"mediumblue", 0x0000CD, 1.0},
    {"mediumorchid", 0xBA55D3, 1.0},
    {"mediumpurple", 0x9370DB, 1.0},
    {"mediumseagreen", 0x3CB371, 1.0},
    {"mediumslateblue", 0x7B68EE, 1.0},
    {"mediumspringgreen", 0x00FA9A, 1.0},
    {"mediumturquoise", 0x48D1CC, 1.0},
    {"mediumvioletred", 0xC71585, 1.0},
    {"midnightblue", 0x191970, 1.0},
    {"mintcream", 0xF5FFFA, 1.0},
    {"mistyrose", 0xFFE4E1, 1.0},
    {"moccasin", 0xFFE4B5, 1.0},
    {"navajowhite", 0xFFDEAD, 1.0},
    {"navy", 0x000080, 1.0},
    {"oldlace", 0xFDF5E6, 1.0},
    {"olive", 0x808000, 1.0},
    {"olivedrab", 0x6B8E23, 1.0},
    {"orange", 0xFFA500, 1.0},
    {"orangered", 0xFF4500, 1.0},
    {"orchid", 0xDA70D6, 1.0},
    {"palegoldenrod", 0xEEE8AA, 1.0},
    {"palegreen", 0x98FB98, 1.0},
    {"paleturquoise", 0xAFEEEE, 1.0},
    {"palevioletred", 0xDB7093, 1.0},
    {"papayawhip", 0xFFEFD5, 1.0},
    {"peachpuff", 0xFFDAB9, 1.0},
    {"peru", 0xCD853F, 1.0},
    {"pink", 0xFFC0CB, 1.0},
    {"plum", 0xDDA0DD, 1.0},
    {"powderblue", 0xB0E0E6, 1.0},
    {"purple", 0x800080, 1.0},
    {"rebeccapurple", 0x663399, 1.0},
    {"red", 0xFF0000, 1.0},
    {"rosybrown", 0xBC8F8F, 1.0},
    {"royalblue", 0x4169E1, 1.0},
    {"saddlebrown", 0x8B4513, 1.0},
    {"salmon", 0xFA8072, 1.0},
    {"sandybrown", 0xF4A460, 1.0},
    {"seagreen", 0x2E8B57, 1.0},
    {"seashell", 0xFFF5EE, 1.0},
    {"sienna", 0xA0522D, 1.0},
    {"silver", 0xC0C0C0, 1.0},
    {"skyblue", 0x87CEEB, 1.0},
    {"slateblue", 0x6A5ACD, 1.0},
    {"slategray", 0x708090, 1.0},
    {"slategrey", 0x708090, 1.0},
    {"snow", 0xFFFAFA, 1.0},
    {"springgreen", 0x00FF7F, 1.0},
    {"steelblue", 0x4682B4, 1.0},
    {"tan", 0xD2B48C, 1.0},
    {"teal", 0x008080, 1.0},
    {"thistle", 0xD8BFD8, 1.0},
    {"tomato", 0xFF6347, 1.0},
    {"turquoise", 0x40E0D0, 1.0},
    {"violet", 0xEE82EE, 1.0},
    {"wheat", 0xF5DEB3, 1.0},
    {"white", 0xFFFFFF, 1.0},
    {"whitesmoke", 0xF5F5F5, 1.0},
    {"yellow", 0xFFFF00, 1.0},
    {"yellowgreen", 0x9ACD32, 1.0},
    {"transparent", 0x000000, 0.0},
};

} // namespace

const NamedColor* find_named_color(const char* name)
{
  for (const NamedColor& it : named_colors)
    if (0 == SDL_strcasecmp(it.name, name))
      return &it;
  return nullptr;
}

const NamedColor* find_color_name(uint32_t rgb)
{
  for (const NamedColor& it : named_colors)
    if ((rgb == it.rgb) and (1.0 == it.alpha))
      return &it;
  return nullptr;
}

} // namespace tint
