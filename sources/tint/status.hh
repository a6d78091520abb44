#pragma once

//
// Every fallible call in tint returns a Status. The human readable reason is stored with SDL_SetError, so callers
// are expected to pull it out with SDL_GetError() right after a non-Ok result.
//

namespace tint {

enum class Status
{
  Ok,
  InvalidColorInput,
  ArgumentError,
  IoError
};

const char* to_string(Status status);

} // namespace tint
