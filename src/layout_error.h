#ifndef OFFSETGEN_LAYOUT_ERROR_H
#define OFFSETGEN_LAYOUT_ERROR_H

#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>

#include <cstdint>
#include <optional>
#include <string>

namespace offsetgen {

enum class LayoutErrorKind {
  Syntax,
  UnknownType,
  DuplicateStruct,
  DuplicateField,
  ReservedName,
  UnorderedOrDuplicateOffset,
  FieldOverlap,
  StructOverflow,
  OffsetMismatch,
  SizeMismatch,
};

const char *error_kind_name(LayoutErrorKind kind);

class LayoutError : public llvm::ErrorInfo<LayoutError> {
public:
  static char ID;

  LayoutError(LayoutErrorKind kind, std::string struct_name, std::string field_name,
              std::string message, unsigned line = 0);

  LayoutError &with_values(int64_t declared, int64_t actual) {
    declared_ = declared;
    actual_ = actual;
    return *this;
  }

  void log(llvm::raw_ostream &os) const override;
  std::error_code convertToErrorCode() const override;

  LayoutErrorKind kind() const { return kind_; }
  const std::string &struct_name() const { return struct_name_; }
  const std::string &field_name() const { return field_name_; }
  const std::string &description() const { return message_; }
  unsigned line() const { return line_; }
  std::optional<int64_t> declared() const { return declared_; }
  std::optional<int64_t> actual() const { return actual_; }

private:
  LayoutErrorKind kind_;
  std::string struct_name_;
  std::string field_name_;
  std::string message_;
  unsigned line_;
  std::optional<int64_t> declared_;
  std::optional<int64_t> actual_;
};

llvm::Error make_layout_error(LayoutErrorKind kind, const std::string &struct_name,
                              const std::string &field_name, const std::string &message,
                              unsigned line = 0);

llvm::Error make_mismatch_error(LayoutErrorKind kind, const std::string &struct_name,
                                const std::string &field_name, int64_t declared, int64_t actual,
                                unsigned line = 0);

} // namespace offsetgen

#endif // OFFSETGEN_LAYOUT_ERROR_H
