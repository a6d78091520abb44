#pragma once

#include "tint/clusterer.hh"
#include "tint/delta_e.hh"
#include "tint/harmony.hh"
#include "tint/semantic.hh"
#include "tint/theme.hh"
#include <SDL2/SDL_rwops.h>
#include <deque>
#include <json.h>

//
// Owns every json.h node of one document. Nodes point at each other, so the storage can only grow
// and nothing is released until the document goes away.
//
class JsonDocument
{
public:
  json_value_s* object();
  json_value_s* array();
  json_value_s* string(const char* text);
  json_value_s* number(double value);
  json_value_s* number(uint32_t value);
  json_value_s* boolean(bool value);

  // "object" and "array" have to be values created by this document
  void add(json_value_s* object, const char* name, json_value_s* value);
  void append(json_value_s* array, json_value_s* value);

  // pretty printed, trailing newline included
  bool write(SDL_RWops* handle, const json_value_s* root) const;

private:
  struct Text
  {
    char text[64];
  };

  json_string_s* make_string(const char* text);

  std::deque<Text>                  texts;
  std::deque<json_string_s>         strings;
  std::deque<json_number_s>         numbers;
  std::deque<json_object_s>         objects;
  std::deque<json_array_s>          arrays;
  std::deque<json_object_element_s> object_elements;
  std::deque<json_array_element_s>  array_elements;
  std::deque<json_value_s>          values;
};

json_value_s* color_json(JsonDocument& doc, const tint::Color& color, tint::ColorFormat format);
json_value_s* color_report_json(JsonDocument& doc, const tint::Color& color);
json_value_s* palette_json(JsonDocument& doc, const tint::Palette& palette, tint::ColorFormat format);
json_value_s* scale_json(JsonDocument& doc, const tint::Palette& palette, tint::ThemeMode mode,
                         tint::ColorFormat format);
json_value_s* semantic_json(JsonDocument& doc, const tint::SemanticColors& colors, tint::ColorFormat format);
json_value_s* theme_json(JsonDocument& doc, const tint::ThemePalettes& theme, tint::ColorFormat format);
json_value_s* similarity_json(JsonDocument& doc, const tint::ColorSimilarity& similarity);
json_value_s* diversity_json(JsonDocument& doc, const tint::PaletteDiversity& diversity);
json_value_s* distance_matrix_json(JsonDocument& doc, const tint::DistanceMatrix& matrix);
json_value_s* clusters_json(JsonDocument& doc, const std::vector<tint::Cluster>& clusters, tint::ColorFormat format);
json_value_s* dominant_colors_json(JsonDocument& doc, const std::vector<tint::DominantColor>& colors,
                                   tint::ColorFormat format);
json_value_s* distribution_json(JsonDocument& doc, const tint::ColorDistribution& distribution);
json_value_s* harmony_json(JsonDocument& doc, const tint::HarmonyResult& harmony, tint::ColorFormat format);
