//===- dispatch.cpp - Shape classification for either-types ---------------===//

#include "either/dispatch.h"

namespace either {

Shape shapeOf(const Value &value) noexcept {
  switch (value.kind()) {
  case ValueKind::String:
  case ValueKind::Bytes:
    return Shape::String;
  case ValueKind::Seq:
    return Shape::Seq;
  case ValueKind::Map:
    return Shape::Map;
  default:
    return Shape::Other;
  }
}

} // namespace either
