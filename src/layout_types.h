#ifndef OFFSETGEN_LAYOUT_TYPES_H
#define OFFSETGEN_LAYOUT_TYPES_H

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace offsetgen {

enum class TypeKind {
  Named,
  Pointer,
  Array,
};

enum class Visibility {
  Public,
  Private,
};

enum class GenerationMode {
  Plain,
  Debug,
};

struct CType;
using TypeRef = std::shared_ptr<CType>;

struct CType {
  TypeKind kind = TypeKind::Named;
  std::string name;
  TypeRef target;
  std::optional<int64_t> count;
  std::vector<std::string> qualifiers;

  bool needs_parens() const { return kind == TypeKind::Array; }
};

struct FieldSpec {
  int64_t offset = 0;
  std::string name;
  Visibility visibility = Visibility::Public;
  TypeRef type;
  unsigned line = 0;
};

struct StructSpec {
  std::string name;
  Visibility visibility = Visibility::Public;
  GenerationMode mode = GenerationMode::Plain;
  bool checked = false;
  std::vector<FieldSpec> fields;
  std::optional<int64_t> total_size;
  unsigned line = 0;
};

enum class SegmentKind {
  Field,
  Padding,
};

struct Segment {
  SegmentKind kind = SegmentKind::Padding;
  int64_t offset = 0;
  int64_t size = 0;
  std::string name;
  FieldSpec field;

  int64_t end() const { return offset + size; }
  bool is_padding() const { return kind == SegmentKind::Padding; }
};

struct LayoutPlan {
  std::string struct_name;
  Visibility visibility = Visibility::Public;
  std::vector<Segment> segments;
  std::optional<int64_t> declared_total_size;
  int64_t size = 0;
};

struct BaseTypeInfo {
  int64_t size = 0;
  int64_t alignment = 1;
};

struct StructEntry {
  Visibility visibility = Visibility::Public;
  GenerationMode mode = GenerationMode::Plain;
  int64_t size = 0;
  int64_t host_size = 0;
  int64_t host_alignment = 1;
};

struct TypeRegistry {
  std::map<std::string, BaseTypeInfo> base_types;
  std::map<std::string, StructEntry> structs;
  int64_t pointer_size = 8;
};

inline TypeRef make_named(const std::string &name) {
  auto ref = std::make_shared<CType>();
  ref->kind = TypeKind::Named;
  ref->name = name;
  return ref;
}

inline TypeRef make_pointer(const TypeRef &target) {
  auto ref = std::make_shared<CType>();
  ref->kind = TypeKind::Pointer;
  ref->target = target;
  return ref;
}

inline TypeRef make_array(const TypeRef &target, int64_t count) {
  auto ref = std::make_shared<CType>();
  ref->kind = TypeKind::Array;
  ref->target = target;
  ref->count = count;
  return ref;
}

bool same_type(const TypeRef &lhs, const TypeRef &rhs);

bool operator==(const FieldSpec &lhs, const FieldSpec &rhs);
bool operator==(const Segment &lhs, const Segment &rhs);
bool operator==(const LayoutPlan &lhs, const LayoutPlan &rhs);

} // namespace offsetgen

#endif // OFFSETGEN_LAYOUT_TYPES_H
