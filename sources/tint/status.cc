#include "status.hh"

namespace tint {

const char* to_string(Status status)
{
  switch (status)
  {
  case Status::Ok:
    return "Ok";
  case Status::InvalidColorInput:
    return "InvalidColorInput";
  case Status::ArgumentError:
    return "ArgumentError";
  case Status::IoError:
    return "IoError";
  default:
    return "N/A";
  }
}

} // namespace tint
