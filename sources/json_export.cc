#include "json_export.hh"
#include "tint/named_colors.hh"
#include <SDL2/SDL_assert.h>
#include <SDL2/SDL_error.h>
#include <cmath>
#include <cstdlib>

json_string_s* JsonDocument::make_string(const char* text)
{
  Text& copy = texts.emplace_back();
  SDL_strlcpy(copy.text, text, sizeof(copy.text));
  return &strings.emplace_back(json_string_s{copy.text, SDL_strlen(copy.text)});
}

json_value_s* JsonDocument::object()
{
  json_object_s* payload = &objects.emplace_back(json_object_s{nullptr, 0});
  return &values.emplace_back(json_value_s{payload, json_type_object});
}

json_value_s* JsonDocument::array()
{
  json_array_s* payload = &arrays.emplace_back(json_array_s{nullptr, 0});
  return &values.emplace_back(json_value_s{payload, json_type_array});
}

json_value_s* JsonDocument::string(const char* text)
{
  return &values.emplace_back(json_value_s{make_string(text), json_type_string});
}

json_value_s* JsonDocument::number(double value)
{
  // json has no representation for nan / inf
  if (not std::isfinite(value))
    return &values.emplace_back(json_value_s{nullptr, json_type_null});

  Text& text = texts.emplace_back();
  SDL_snprintf(text.text, sizeof(text.text), "%.6g", value);

  json_number_s* payload = &numbers.emplace_back(json_number_s{text.text, SDL_strlen(text.text)});
  return &values.emplace_back(json_value_s{payload, json_type_number});
}

json_value_s* JsonDocument::number(uint32_t value)
{
  Text& text = texts.emplace_back();
  SDL_snprintf(text.text, sizeof(text.text), "%u", value);

  json_number_s* payload = &numbers.emplace_back(json_number_s{text.text, SDL_strlen(text.text)});
  return &values.emplace_back(json_value_s{payload, json_type_number});
}

json_value_s* JsonDocument::boolean(bool value)
{
  const size_t type = value ? json_type_true : json_type_false;
  return &values.emplace_back(json_value_s{nullptr, type});
}

void JsonDocument::add(json_value_s* object, const char* name, json_value_s* value)
{
  SDL_assert(json_type_object == object->type);

  json_object_s*         payload = reinterpret_cast<json_object_s*>(object->payload);
  json_object_element_s* element = &object_elements.emplace_back(json_object_element_s{make_string(name), value, nullptr});

  if (nullptr == payload->start)
  {
    payload->start = element;
  }
  else
  {
    json_object_element_s* last = payload->start;
    while (nullptr != last->next)
      last = last->next;
    last->next = element;
  }

  payload->length += 1;
}

void JsonDocument::append(json_value_s* array, json_value_s* value)
{
  SDL_assert(json_type_array == array->type);

  json_array_s*         payload = reinterpret_cast<json_array_s*>(array->payload);
  json_array_element_s* element = &array_elements.emplace_back(json_array_element_s{value, nullptr});

  if (nullptr == payload->start)
  {
    payload->start = element;
  }
  else
  {
    json_array_element_s* last = payload->start;
    while (nullptr != last->next)
      last = last->next;
    last->next = element;
  }

  payload->length += 1;
}

bool JsonDocument::write(SDL_RWops* handle, const json_value_s* root) const
{
  size_t size       = 0;
  char*  serialized = reinterpret_cast<char*>(json_write_pretty(root, "  ", "\n", &size));

  if (nullptr == serialized)
  {
    SDL_SetError("json serialization failed");
    return false;
  }

  // size counts the null terminator
  const size_t length  = (0 < size) ? size - 1 : 0;
  const bool   written = (0 == length) or (1 == SDL_RWwrite(handle, serialized, length, 1));
  const bool   newline = written and (1 == SDL_RWwrite(handle, "\n", 1, 1));
  free(serialized);

  if (not newline)
  {
    SDL_SetError("can't write json output: %s", SDL_GetError());
    return false;
  }

  return true;
}

namespace {

json_value_s* triple_json(JsonDocument& doc, const char* n0, double v0, const char* n1, double v1, const char* n2,
                          double v2)
{
  json_value_s* result = doc.object();
  doc.add(result, n0, doc.number(v0));
  doc.add(result, n1, doc.number(v1));
  doc.add(result, n2, doc.number(v2));
  return result;
}

json_value_s* role_palettes_json(JsonDocument& doc, const tint::RolePalettes& roles, tint::ColorFormat format)
{
  json_value_s* result = doc.object();
  doc.add(result, "primary", palette_json(doc, roles.primary, format));
  doc.add(result, "success", palette_json(doc, roles.success, format));
  doc.add(result, "warning", palette_json(doc, roles.warning, format));
  doc.add(result, "danger", palette_json(doc, roles.danger, format));
  doc.add(result, "gray", palette_json(doc, roles.gray, format));
  if (roles.has_info)
    doc.add(result, "info", palette_json(doc, roles.info, format));
  return result;
}

} // namespace

json_value_s* color_json(JsonDocument& doc, const tint::Color& color, tint::ColorFormat format)
{
  return doc.string(tint::format_color(color, format).text);
}

json_value_s* color_report_json(JsonDocument& doc, const tint::Color& color)
{
  const tint::HSL   hsl   = color.hsl();
  const tint::HSV   hsv   = color.hsv();
  const tint::HWB   hwb   = color.hwb();
  const tint::XYZ   xyz   = color.xyz();
  const tint::LAB   lab   = color.lab();
  const tint::LCH   lch   = color.lch();
  const tint::OKLAB oklab = color.oklab();
  const tint::OKLCH oklch = color.oklch();

  json_value_s* result = doc.object();
  doc.add(result, "hex", doc.string(color.hex(1.0 > color.alpha).text));
  doc.add(result, "rgb_string", doc.string(color.rgb_string().text));
  doc.add(result, "hsl_string", doc.string(color.hsl_string().text));
  doc.add(result, "alpha", doc.number(color.alpha));

  json_value_s* rgb = doc.object();
  doc.add(rgb, "r", doc.number(static_cast<uint32_t>(color.r)));
  doc.add(rgb, "g", doc.number(static_cast<uint32_t>(color.g)));
  doc.add(rgb, "b", doc.number(static_cast<uint32_t>(color.b)));
  doc.add(result, "rgb", rgb);

  doc.add(result, "hsl", triple_json(doc, "h", hsl.h, "s", hsl.s, "l", hsl.l));
  doc.add(result, "hsv", triple_json(doc, "h", hsv.h, "s", hsv.s, "v", hsv.v));
  doc.add(result, "hwb", triple_json(doc, "h", hwb.h, "w", hwb.w, "b", hwb.b));
  doc.add(result, "xyz", triple_json(doc, "x", xyz.x, "y", xyz.y, "z", xyz.z));
  doc.add(result, "lab", triple_json(doc, "l", lab.l, "a", lab.a, "b", lab.b));
  doc.add(result, "lch", triple_json(doc, "l", lch.l, "c", lch.c, "h", lch.h));
  doc.add(result, "oklab", triple_json(doc, "l", oklab.l, "a", oklab.a, "b", oklab.b));
  doc.add(result, "oklch", triple_json(doc, "l", oklch.l, "c", oklch.c, "h", oklch.h));

  doc.add(result, "luminance", doc.number(color.luminance()));
  doc.add(result, "is_light", doc.boolean(color.is_light()));
  doc.add(result, "contrast_white", doc.number(color.contrast(tint::Color::from_hex(0xFFFFFF))));
  doc.add(result, "contrast_black", doc.number(color.contrast(tint::Color::from_hex(0x000000))));

  if (1.0 <= color.alpha)
  {
    const tint::NamedColor* named = tint::find_color_name(color.packed());
    if (named)
      doc.add(result, "name", doc.string(named->name));
  }

  return result;
}

json_value_s* palette_json(JsonDocument& doc, const tint::Palette& palette, tint::ColorFormat format)
{
  json_value_s* result = doc.object();
  for (const tint::PaletteEntry& entry : palette.entries)
    doc.add(result, entry.label, color_json(doc, entry.color, format));
  return result;
}

json_value_s* scale_json(JsonDocument& doc, const tint::Palette& palette, tint::ThemeMode mode,
                         tint::ColorFormat format)
{
  json_value_s* result = doc.object();
  doc.add(result, "mode", doc.string(tint::to_string(mode)));
  doc.add(result, "center", doc.string(palette[palette.center].label));
  doc.add(result, "steps", palette_json(doc, palette, format));
  return result;
}

json_value_s* semantic_json(JsonDocument& doc, const tint::SemanticColors& colors, tint::ColorFormat format)
{
  json_value_s* result = doc.object();
  doc.add(result, "primary", color_json(doc, colors.primary, format));
  doc.add(result, "success", color_json(doc, colors.success, format));
  doc.add(result, "warning", color_json(doc, colors.warning, format));
  doc.add(result, "danger", color_json(doc, colors.danger, format));
  doc.add(result, "gray", color_json(doc, colors.gray, format));
  if (colors.has_info)
    doc.add(result, "info", color_json(doc, colors.info, format));
  return result;
}

json_value_s* theme_json(JsonDocument& doc, const tint::ThemePalettes& theme, tint::ColorFormat format)
{
  json_value_s* result = doc.object();
  doc.add(result, "light", role_palettes_json(doc, theme.light, format));
  doc.add(result, "dark", role_palettes_json(doc, theme.dark, format));
  return result;
}

json_value_s* similarity_json(JsonDocument& doc, const tint::ColorSimilarity& similarity)
{
  json_value_s* result = doc.object();
  doc.add(result, "algorithm", doc.string(tint::to_string(similarity.algorithm)));
  doc.add(result, "delta_e", doc.number(similarity.delta_e));
  doc.add(result, "similarity", doc.number(similarity.similarity));
  doc.add(result, "perceptible", doc.boolean(similarity.perceptible));
  doc.add(result, "band", doc.string(tint::to_string(tint::classify_difference(similarity.delta_e))));
  return result;
}

json_value_s* diversity_json(JsonDocument& doc, const tint::PaletteDiversity& diversity)
{
  json_value_s* result = doc.object();
  doc.add(result, "diversity_score", doc.number(diversity.diversity_score));
  doc.add(result, "average_delta_e", doc.number(diversity.average_delta_e));
  doc.add(result, "min_delta_e", doc.number(diversity.min_delta_e));
  doc.add(result, "max_delta_e", doc.number(diversity.max_delta_e));
  doc.add(result, "standard_deviation", doc.number(diversity.standard_deviation));
  doc.add(result, "distinguishable_percentage", doc.number(diversity.distinguishable_percentage));
  doc.add(result, "cluster_count", doc.number(diversity.cluster_count));
  return result;
}

json_value_s* distance_matrix_json(JsonDocument& doc, const tint::DistanceMatrix& matrix)
{
  json_value_s* result = doc.array();
  for (uint32_t row = 0; row < matrix.size; ++row)
  {
    json_value_s* line = doc.array();
    for (uint32_t column = 0; column < matrix.size; ++column)
      doc.append(line, doc.number(matrix.at(row, column)));
    doc.append(result, line);
  }
  return result;
}

json_value_s* clusters_json(JsonDocument& doc, const std::vector<tint::Cluster>& clusters, tint::ColorFormat format)
{
  json_value_s* result = doc.array();
  for (const tint::Cluster& cluster : clusters)
  {
    json_value_s* item = doc.object();
    doc.add(item, "color", color_json(doc, cluster.center, format));
    doc.add(item, "members", doc.number(cluster.members));
    doc.add(item, "weight", doc.number(cluster.weight));
    doc.append(result, item);
  }
  return result;
}

json_value_s* dominant_colors_json(JsonDocument& doc, const std::vector<tint::DominantColor>& colors,
                                   tint::ColorFormat format)
{
  json_value_s* result = doc.array();
  for (const tint::DominantColor& dominant : colors)
  {
    json_value_s* item = doc.object();
    doc.add(item, "color", color_json(doc, dominant.color, format));
    doc.add(item, "count", doc.number(dominant.count));
    doc.add(item, "percentage", doc.number(dominant.percentage));
    doc.add(item, "prominence", doc.number(dominant.prominence));
    doc.append(result, item);
  }
  return result;
}

json_value_s* distribution_json(JsonDocument& doc, const tint::ColorDistribution& distribution)
{
  json_value_s* hues = doc.array();
  for (uint32_t i = 0; i < distribution.dominant_hue_count; ++i)
    doc.append(hues, doc.number(distribution.dominant_hues[i]));

  json_value_s* result = doc.object();
  doc.add(result, "average_saturation", doc.number(distribution.average_saturation));
  doc.add(result, "average_lightness", doc.number(distribution.average_lightness));
  doc.add(result, "dominant_hues", hues);
  doc.add(result, "temperature", doc.string(tint::to_string(distribution.temperature)));
  return result;
}

json_value_s* harmony_json(JsonDocument& doc, const tint::HarmonyResult& harmony, tint::ColorFormat format)
{
  json_value_s* colors = doc.array();
  for (const tint::Color& color : harmony.colors)
    doc.append(colors, color_json(doc, color, format));

  json_value_s* metrics = doc.object();
  doc.add(metrics, "color_balance", doc.number(harmony.metrics.color_balance));
  doc.add(metrics, "contrast_range", doc.number(harmony.metrics.contrast_range));
  doc.add(metrics, "saturation_harmony", doc.number(harmony.metrics.saturation_harmony));
  doc.add(metrics, "lightness_harmony", doc.number(harmony.metrics.lightness_harmony));
  doc.add(metrics, "hue_relation", doc.number(harmony.metrics.hue_relation));

  json_value_s* suggestions = doc.array();
  for (tint::HarmonySuggestion suggestion : harmony.suggestions)
    doc.append(suggestions, doc.string(tint::to_string(suggestion)));

  json_value_s* result = doc.object();
  doc.add(result, "type", doc.string(tint::to_string(harmony.type)));
  doc.add(result, "base", color_json(doc, harmony.base, format));
  doc.add(result, "colors", colors);
  doc.add(result, "score", doc.number(static_cast<uint32_t>(harmony.score)));
  doc.add(result, "metrics", metrics);
  doc.add(result, "suggestions", suggestions);
  return result;
}
