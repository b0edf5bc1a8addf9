#include "layout_emitter.h"

#include "layout_utils.h"

#include <sstream>

namespace offsetgen {

std::string qualified_struct_name(const TypeRegistry &registry, const std::string &name) {
  auto it = registry.structs.find(name);
  if (it != registry.structs.end() && it->second.visibility == Visibility::Private) {
    return "detail::" + name;
  }
  return name;
}

std::string render_type(const TypeRegistry &registry, const TypeRef &type_ref,
                        const std::string &name) {
  if (!type_ref) {
    return name.empty() ? "void" : "void " + name;
  }

  if (type_ref->kind == TypeKind::Named) {
    std::string base = type_ref->name.empty() ? "void" : type_ref->name;
    if (!is_base_type(registry, base)) {
      base = qualified_struct_name(registry, base);
    }
    if (!type_ref->qualifiers.empty()) {
      std::ostringstream oss;
      for (size_t i = 0; i < type_ref->qualifiers.size(); ++i) {
        if (i) {
          oss << ' ';
        }
        oss << type_ref->qualifiers[i];
      }
      base = oss.str() + " " + base;
    }
    if (!name.empty()) {
      return base + " " + name;
    }
    return base;
  }

  if (type_ref->kind == TypeKind::Pointer) {
    std::string inner = "*" + name;
    if (type_ref->target && type_ref->target->needs_parens()) {
      inner = "(" + inner + ")";
    }
    return render_type(registry, type_ref->target, inner);
  }

  if (type_ref->kind == TypeKind::Array) {
    std::string count = type_ref->count ? format_int_const(*type_ref->count) : "";
    std::string inner = name + "[" + count + "]";
    return render_type(registry, type_ref->target, inner);
  }

  return "void";
}

bool has_private_fields(const LayoutPlan &plan) {
  for (const auto &segment : plan.segments) {
    if (!segment.is_padding() && segment.field.visibility == Visibility::Private) {
      return true;
    }
  }
  return false;
}

std::string layout_check_name(const LayoutPlan &plan) {
  return plan.struct_name + "_layout_check";
}

std::string render_struct(const LayoutPlan &plan, const TypeRegistry &registry,
                          const EmitOptions &options) {
  std::vector<std::string> lines;
  bool packed = options.strategy == EmissionStrategy::Packed;
  if (packed) {
    lines.emplace_back("#pragma pack(push, 1)");
  }
  lines.emplace_back("struct " + plan.struct_name + " {");

  Visibility access = Visibility::Public;
  for (const auto &segment : plan.segments) {
    Visibility wanted = segment.is_padding() ? Visibility::Private : segment.field.visibility;
    if (wanted != access) {
      lines.emplace_back(std::string(visibility_name(wanted)) + ":");
      access = wanted;
    }
    if (segment.is_padding()) {
      lines.emplace_back("    uint8_t " + segment.name + "[" + format_int_const(segment.size) + "];");
      continue;
    }
    lines.emplace_back("    " + render_type(registry, segment.field.type, segment.name) + ";");
  }

  if (options.checked && has_private_fields(plan)) {
    lines.emplace_back("    friend struct " + layout_check_name(plan) + ";");
  }
  lines.emplace_back("};");
  if (packed) {
    lines.emplace_back("#pragma pack(pop)");
  }
  return join_lines(lines);
}

std::string join_lines(const std::vector<std::string> &lines) {
  std::ostringstream oss;
  for (const auto &line : lines) {
    oss << line << '\n';
  }
  return oss.str();
}

} // namespace offsetgen
