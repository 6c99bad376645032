#include "types.h"

#include <magic_enum/magic_enum.hpp>

namespace multisplit {

std::string_view to_string(LayoutError error) {
  return magic_enum::enum_name(error);
}

std::string_view to_string(Orientation orientation) {
  return orientation == Orientation::Horizontal ? "horizontal" : "vertical";
}

} // namespace multisplit
