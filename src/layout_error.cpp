#include "layout_error.h"

#include "layout_utils.h"

namespace offsetgen {

char LayoutError::ID = 0;

const char *error_kind_name(LayoutErrorKind kind) {
  switch (kind) {
  case LayoutErrorKind::Syntax:
    return "Syntax";
  case LayoutErrorKind::UnknownType:
    return "UnknownType";
  case LayoutErrorKind::DuplicateStruct:
    return "DuplicateStruct";
  case LayoutErrorKind::DuplicateField:
    return "DuplicateField";
  case LayoutErrorKind::ReservedName:
    return "ReservedName";
  case LayoutErrorKind::UnorderedOrDuplicateOffset:
    return "UnorderedOrDuplicateOffset";
  case LayoutErrorKind::FieldOverlap:
    return "FieldOverlap";
  case LayoutErrorKind::StructOverflow:
    return "StructOverflow";
  case LayoutErrorKind::OffsetMismatch:
    return "OffsetMismatch";
  case LayoutErrorKind::SizeMismatch:
    return "SizeMismatch";
  }
  return "Unknown";
}

LayoutError::LayoutError(LayoutErrorKind kind, std::string struct_name, std::string field_name,
                         std::string message, unsigned line)
    : kind_(kind), struct_name_(std::move(struct_name)), field_name_(std::move(field_name)),
      message_(std::move(message)), line_(line) {}

void LayoutError::log(llvm::raw_ostream &os) const {
  os << error_kind_name(kind_) << ": ";
  if (!struct_name_.empty()) {
    os << struct_name_;
    if (!field_name_.empty()) {
      os << "." << field_name_;
    }
    os << ": ";
  }
  os << message_;
  if (declared_ && actual_) {
    os << " (declared " << format_hex_const(*declared_) << ", actual "
       << format_hex_const(*actual_) << ")";
  }
}

std::error_code LayoutError::convertToErrorCode() const {
  return llvm::inconvertibleErrorCode();
}

llvm::Error make_layout_error(LayoutErrorKind kind, const std::string &struct_name,
                              const std::string &field_name, const std::string &message,
                              unsigned line) {
  return llvm::make_error<LayoutError>(kind, struct_name, field_name, message, line);
}

llvm::Error make_mismatch_error(LayoutErrorKind kind, const std::string &struct_name,
                                const std::string &field_name, int64_t declared, int64_t actual,
                                unsigned line) {
  auto error = std::make_unique<LayoutError>(kind, struct_name, field_name,
                                             kind == LayoutErrorKind::SizeMismatch
                                                 ? "host size differs from declared size"
                                                 : "host offset differs from declared offset",
                                             line);
  error->with_values(declared, actual);
  return llvm::Error(std::move(error));
}

} // namespace offsetgen
