#include "kintree/core/common/status.hpp"

namespace kintree::core {

const char* statusToString(Status s) {
  switch (s) {
    case Status::Success: return "Success";
    case Status::Failure: return "Failure";
    case Status::InvalidParameter: return "InvalidParameter";
    case Status::ParseError: return "ParseError";
    case Status::StructuralViolation: return "StructuralViolation";
    case Status::SchemaViolation: return "SchemaViolation";
    case Status::MissingAttribute: return "MissingAttribute";
    case Status::InvalidAttribute: return "InvalidAttribute";
    case Status::ConflictingOrientation: return "ConflictingOrientation";
    case Status::UnknownJointType: return "UnknownJointType";
    case Status::UnknownGeomShape: return "UnknownGeomShape";
    case Status::DuplicateName: return "DuplicateName";
    case Status::NonContiguousIds: return "NonContiguousIds";
  }
  return "Unknown";
}

}  // namespace kintree::core
