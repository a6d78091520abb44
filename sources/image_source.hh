#pragma once

#include <SDL2/SDL_stdinc.h>

//
// Decoded image, always tightly packed RGBA8. Pixels belong to stb_image and have to be handed
// back with release().
//
struct Image
{
  bool load(const char* path);
  void release();

  [[nodiscard]] bool empty() const { return nullptr == pixels; }

  uint8_t* pixels = nullptr;
  uint32_t width  = 0;
  uint32_t height = 0;
};
