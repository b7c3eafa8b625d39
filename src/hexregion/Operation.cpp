#include "hexregion/Operation.hpp"

namespace hexregion {

const char* ToString(OpStatus s)
{
  switch (s) {
  case OpStatus::Ok: return "ok";
  case OpStatus::Cancelled: return "cancelled";
  case OpStatus::ValidationFailed: return "validation_failed";
  case OpStatus::IoFailed: return "io_failed";
  case OpStatus::Busy: return "busy";
  default: return "unknown";
  }
}

} // namespace hexregion
