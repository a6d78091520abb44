#pragma once

#include <SDL2/SDL_assert.h>
#include <SDL2/SDL_stdinc.h>

namespace tint {

// Fixed capacity, value semantic stack. Copying it copies all N slots.
template <typename T, uint32_t N> struct ElementStack
{
  void push(const T& input)
  {
    SDL_assert(N != count);
    data[count++] = input;
  }

  T& operator[](const uint32_t idx)
  {
    SDL_assert(count > idx);
    return data[idx];
  }

  const T& operator[](const uint32_t idx) const
  {
    SDL_assert(count > idx);
    return data[idx];
  }

  [[nodiscard]] bool empty() const { return 0 == count; }

  T*       begin() { return &data[0]; }
  T*       end() { return &data[count]; }
  const T* begin() const { return &data[0]; }
  const T* end() const { return &data[count]; }

  T        data[N] = {};
  uint32_t count   = 0;
};

} // namespace tint
