#pragma once
#include <cstdint>

namespace kintree::core {

// Outcome of a load stage. Everything except Success aborts the load.
enum class Status : std::uint8_t {
  Success = 0,
  Failure = 1,
  InvalidParameter = 2,
  ParseError = 3,
  StructuralViolation = 4,
  SchemaViolation = 5,
  MissingAttribute = 6,
  InvalidAttribute = 7,
  ConflictingOrientation = 8,
  UnknownJointType = 9,
  UnknownGeomShape = 10,
  DuplicateName = 11,
  NonContiguousIds = 12
};

inline constexpr bool ok(Status s) { return s == Status::Success; }

const char* statusToString(Status s);

}  // namespace kintree::core
