#include "image_source.hh"
#include <SDL2/SDL_error.h>
#include <SDL2/SDL_log.h>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

bool Image::load(const char* path)
{
  release();

  int      x           = 0;
  int      y           = 0;
  int      real_format = 0;
  stbi_uc* data        = stbi_load(path, &x, &y, &real_format, STBI_rgb_alpha);

  if (nullptr == data)
  {
    SDL_SetError("can't load image '%s': %s", path, stbi_failure_reason());
    return false;
  }

  pixels = data;
  width  = static_cast<uint32_t>(x);
  height = static_cast<uint32_t>(y);

  SDL_LogVerbose(SDL_LOG_CATEGORY_APPLICATION, "image '%s': %ux%u, %d channels in file", path, width, height,
                 real_format);
  return true;
}

void Image::release()
{
  if (pixels)
    stbi_image_free(pixels);

  pixels = nullptr;
  width  = 0;
  height = 0;
}
