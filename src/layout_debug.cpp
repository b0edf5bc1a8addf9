#include "layout_debug.h"

#include "layout_emitter.h"
#include "layout_utils.h"

#include <vector>

namespace offsetgen {

std::string render_debug_support() {
  std::vector<std::string> lines = {
      "#ifndef OFFSETGEN_DEBUG_SUPPORT",
      "#define OFFSETGEN_DEBUG_SUPPORT",
      "namespace offsetgen_debug {",
      "",
      "template <typename T>",
      "inline void read_field(const void *base, std::size_t offset, T &out) {",
      "    std::memcpy(&out, static_cast<const unsigned char *>(base) + offset, sizeof(T));",
      "}",
      "",
      "template <typename T>",
      "inline void write_value(std::ostream &os, const T &value) {",
      "    if constexpr (std::is_array_v<T>) {",
      "        os << '[';",
      "        bool first = true;",
      "        for (const auto &element : value) {",
      "            if (!first) {",
      "                os << \", \";",
      "            }",
      "            first = false;",
      "            write_value(os, element);",
      "        }",
      "        os << ']';",
      "    } else if constexpr (std::is_pointer_v<T>) {",
      "        if (value == nullptr) {",
      "            os << \"null\";",
      "            return;",
      "        }",
      "        std::ios_base::fmtflags flags = os.flags();",
      "        os << \"0x\" << std::hex << reinterpret_cast<std::uintptr_t>(value);",
      "        os.flags(flags);",
      "    } else if constexpr (std::is_same_v<T, bool>) {",
      "        os << (value ? \"true\" : \"false\");",
      "    } else if constexpr (std::is_integral_v<T> && sizeof(T) == 1) {",
      "        if constexpr (std::is_signed_v<T>) {",
      "            os << static_cast<int>(value);",
      "        } else {",
      "            os << static_cast<unsigned>(value);",
      "        }",
      "    } else {",
      "        os << value;",
      "    }",
      "}",
      "",
      "} // namespace offsetgen_debug",
      "#endif // OFFSETGEN_DEBUG_SUPPORT",
  };
  return join_lines(lines);
}

bool debug_printable(const TypeRegistry &registry, const TypeRef &type_ref) {
  if (!type_ref) {
    return false;
  }
  switch (type_ref->kind) {
  case TypeKind::Pointer:
    return true;
  case TypeKind::Array:
    return debug_printable(registry, type_ref->target);
  case TypeKind::Named:
    if (const StructEntry *entry = find_struct(registry, type_ref)) {
      return entry->mode == GenerationMode::Debug;
    }
    return is_base_type(registry, type_ref->name);
  }
  return false;
}

// Element type that stands in for an unprintable value, e.g. Inner for Inner[4].
static TypeRef innermost_element(const TypeRef &type_ref) {
  TypeRef current = type_ref;
  while (current && current->kind == TypeKind::Array) {
    current = current->target;
  }
  return current;
}

// The printer copies each field into a local, so const on the value itself
// (not on a pointee) has to go.
static TypeRef strip_value_qualifiers(const TypeRef &type_ref) {
  if (!type_ref || type_ref->kind == TypeKind::Pointer) {
    return type_ref;
  }
  auto copy = std::make_shared<CType>(*type_ref);
  if (copy->kind == TypeKind::Named) {
    copy->qualifiers.clear();
  } else {
    copy->target = strip_value_qualifiers(copy->target);
  }
  return copy;
}

std::string render_debug_printer(const LayoutPlan &plan, const TypeRegistry &registry) {
  std::vector<std::string> lines;
  lines.emplace_back("inline std::ostream &operator<<(std::ostream &os, const " + plan.struct_name +
                     " &value) {");
  lines.emplace_back("    os << \"" + plan.struct_name + "\";");

  bool first = true;
  for (const auto &segment : plan.segments) {
    if (segment.is_padding()) {
      continue;
    }
    lines.emplace_back(first ? "    os << \" { \";" : "    os << \", \";");
    first = false;

    const TypeRef &type = segment.field.type;
    if (!debug_printable(registry, type)) {
      std::string placeholder = innermost_element(type)->name + " { .. }";
      if (type->kind == TypeKind::Array) {
        placeholder = "[" + placeholder + "; " + format_int_const(*type->count) + "]";
      }
      lines.emplace_back("    os << \"" + segment.name + ": " + placeholder + "\";");
      continue;
    }
    lines.emplace_back("    {");
    lines.emplace_back("        " + render_type(registry, strip_value_qualifiers(type), "field_value") + ";");
    lines.emplace_back("        offsetgen_debug::read_field(&value, " +
                       format_hex_const(segment.offset) + ", field_value);");
    lines.emplace_back("        os << \"" + segment.name + ": \";");
    lines.emplace_back("        offsetgen_debug::write_value(os, field_value);");
    lines.emplace_back("    }");
  }
  if (!first) {
    lines.emplace_back("    os << \" }\";");
  }
  lines.emplace_back("    return os;");
  lines.emplace_back("}");
  return join_lines(lines);
}

} // namespace offsetgen
