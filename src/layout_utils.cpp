#include "layout_utils.h"

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/StringExtras.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/MathExtras.h>
#include <llvm/Support/SHA1.h>

namespace offsetgen {

static constexpr int64_t kSignedIntMax = 0x7fffffff;

std::string sanitize_identifier(const std::string &name) {
  std::string out;
  if (!name.empty() && llvm::isDigit(name.front())) {
    out.push_back('_');
  }
  for (char ch : name) {
    out.push_back(llvm::isAlnum(ch) || ch == '_' ? ch : '_');
  }
  return out;
}

std::string format_hex_const(int64_t value) {
  if (value < 0) {
    return "-0x" + llvm::utohexstr(static_cast<uint64_t>(-value));
  }
  std::string out = "0x" + llvm::utohexstr(static_cast<uint64_t>(value));
  if (value > kSignedIntMax) {
    out += "U";
  }
  return out;
}

std::string format_int_const(int64_t value) {
  if (value > -16 && value < 16) {
    return std::to_string(value);
  }
  return format_hex_const(value);
}

const char *visibility_name(Visibility visibility) {
  return visibility == Visibility::Private ? "private" : "public";
}

const char *mode_name(GenerationMode mode) {
  return mode == GenerationMode::Debug ? "debug" : "plain";
}

std::string sig_digest(const std::string &input) {
  auto hash = llvm::SHA1::hash(llvm::arrayRefFromStringRef(input));
  llvm::ArrayRef<uint8_t> bytes(hash.data(), hash.size());
  std::string hex = llvm::toHex(bytes, true);
  if (hex.size() <= 8) {
    return hex;
  }
  return hex.substr(0, 8);
}

TypeRegistry make_default_registry(int64_t pointer_size) {
  TypeRegistry registry;
  registry.pointer_size = pointer_size;
  auto add = [&](const char *name, int64_t size) {
    registry.base_types[name] = BaseTypeInfo{size, size};
  };
  add("bool", 1);
  add("char", 1);
  add("int8_t", 1);
  add("uint8_t", 1);
  add("int16_t", 2);
  add("uint16_t", 2);
  add("int32_t", 4);
  add("uint32_t", 4);
  add("int64_t", 8);
  add("uint64_t", 8);
  add("float", 4);
  add("double", 8);
  add("size_t", pointer_size);
  add("uintptr_t", pointer_size);
  add("intptr_t", pointer_size);
  add("ptrdiff_t", pointer_size);
  return registry;
}

bool is_base_type(const TypeRegistry &registry, const std::string &name) {
  return registry.base_types.count(name) != 0;
}

const StructEntry *find_struct(const TypeRegistry &registry, const TypeRef &type_ref) {
  if (!type_ref || type_ref->kind != TypeKind::Named) {
    return nullptr;
  }
  auto it = registry.structs.find(type_ref->name);
  if (it == registry.structs.end()) {
    return nullptr;
  }
  return &it->second;
}

std::optional<int64_t> type_size(const TypeRegistry &registry, const TypeRef &type_ref) {
  if (!type_ref) {
    return std::nullopt;
  }
  switch (type_ref->kind) {
  case TypeKind::Named: {
    auto base = registry.base_types.find(type_ref->name);
    if (base != registry.base_types.end()) {
      return base->second.size;
    }
    if (const StructEntry *entry = find_struct(registry, type_ref)) {
      return entry->size;
    }
    return std::nullopt;
  }
  case TypeKind::Pointer:
    return registry.pointer_size;
  case TypeKind::Array: {
    if (!type_ref->count || *type_ref->count <= 0) {
      return std::nullopt;
    }
    auto element = type_size(registry, type_ref->target);
    int64_t total = 0;
    if (!element || llvm::MulOverflow(*element, *type_ref->count, total)) {
      return std::nullopt;
    }
    return total;
  }
  }
  return std::nullopt;
}

std::optional<int64_t> host_type_size(const TypeRegistry &registry, const TypeRef &type_ref) {
  if (!type_ref) {
    return std::nullopt;
  }
  if (type_ref->kind == TypeKind::Named) {
    if (const StructEntry *entry = find_struct(registry, type_ref)) {
      return entry->host_size;
    }
    return type_size(registry, type_ref);
  }
  if (type_ref->kind == TypeKind::Array) {
    if (!type_ref->count || *type_ref->count <= 0) {
      return std::nullopt;
    }
    auto element = host_type_size(registry, type_ref->target);
    int64_t total = 0;
    if (!element || llvm::MulOverflow(*element, *type_ref->count, total)) {
      return std::nullopt;
    }
    return total;
  }
  return registry.pointer_size;
}

std::optional<int64_t> host_type_alignment(const TypeRegistry &registry, const TypeRef &type_ref) {
  if (!type_ref) {
    return std::nullopt;
  }
  switch (type_ref->kind) {
  case TypeKind::Named: {
    auto base = registry.base_types.find(type_ref->name);
    if (base != registry.base_types.end()) {
      return base->second.alignment;
    }
    if (const StructEntry *entry = find_struct(registry, type_ref)) {
      return entry->host_alignment;
    }
    return std::nullopt;
  }
  case TypeKind::Pointer:
    return registry.pointer_size;
  case TypeKind::Array:
    return host_type_alignment(registry, type_ref->target);
  }
  return std::nullopt;
}

bool same_type(const TypeRef &lhs, const TypeRef &rhs) {
  if (!lhs || !rhs) {
    return !lhs && !rhs;
  }
  return lhs->kind == rhs->kind && lhs->name == rhs->name && lhs->count == rhs->count &&
         lhs->qualifiers == rhs->qualifiers && same_type(lhs->target, rhs->target);
}

bool operator==(const FieldSpec &lhs, const FieldSpec &rhs) {
  return lhs.offset == rhs.offset && lhs.name == rhs.name && lhs.visibility == rhs.visibility &&
         same_type(lhs.type, rhs.type);
}

bool operator==(const Segment &lhs, const Segment &rhs) {
  if (lhs.kind != rhs.kind || lhs.offset != rhs.offset || lhs.size != rhs.size ||
      lhs.name != rhs.name) {
    return false;
  }
  return lhs.kind == SegmentKind::Padding || lhs.field == rhs.field;
}

bool operator==(const LayoutPlan &lhs, const LayoutPlan &rhs) {
  return lhs.struct_name == rhs.struct_name && lhs.visibility == rhs.visibility &&
         lhs.segments == rhs.segments && lhs.declared_total_size == rhs.declared_total_size &&
         lhs.size == rhs.size;
}

} // namespace offsetgen
