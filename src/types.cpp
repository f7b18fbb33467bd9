#include "pqstudio/types.h"

namespace pqstudio {

std::string LogicalType::to_string() const {
  switch (id) {
  case TypeId::TIMESTAMP: {
    std::string s = "TIMESTAMP(";
    s += time_unit_name(unit);
    if (adjusted_to_utc)
      s += ", UTC";
    s += ")";
    return s;
  }
  case TypeId::DECIMAL:
    return "DECIMAL(" + std::to_string(precision) + ", " + std::to_string(scale) + ")";
  default:
    return type_name(id);
  }
}

} // namespace pqstudio
