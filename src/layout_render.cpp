#include "layout_render.h"

#include "layout_debug.h"
#include "layout_utils.h"
#include "layout_verifier.h"

#include <llvm/ADT/StringExtras.h>
#include <llvm/Support/FormatVariadic.h>

#include <functional>
#include <set>

namespace offsetgen {

std::string make_include_guard(const std::string &stem, const std::string &input_text) {
  std::string name = llvm::StringRef(sanitize_identifier(stem)).upper();
  std::string digest = llvm::StringRef(sig_digest(input_text)).upper();
  if (name.empty()) {
    return "OFFSETGEN_" + digest + "_H";
  }
  return "OFFSETGEN_" + name + "_" + digest + "_H";
}

// Struct names reached only through pointers; these need a declaration
// ahead of every definition.
static std::set<std::string> collect_pointer_targets(const std::vector<GeneratedStruct> &structs,
                                                     const TypeRegistry &registry) {
  std::set<std::string> targets;
  std::function<void(const TypeRef &, bool)> visit = [&](const TypeRef &type_ref, bool via_pointer) {
    if (!type_ref) {
      return;
    }
    if (type_ref->kind == TypeKind::Named) {
      if (via_pointer && type_ref->name != "void" && !is_base_type(registry, type_ref->name)) {
        targets.insert(type_ref->name);
      }
      return;
    }
    visit(type_ref->target, via_pointer || type_ref->kind == TypeKind::Pointer);
  };
  for (const auto &generated : structs) {
    for (const auto &segment : generated.plan.segments) {
      if (!segment.is_padding()) {
        visit(segment.field.type, false);
      }
    }
  }
  return targets;
}

std::string render_header(const std::vector<GeneratedStruct> &structs, const TypeRegistry &registry,
                          const RenderOptions &options) {
  std::vector<std::string> lines;
  if (options.source_name.empty()) {
    lines.emplace_back("/* Generated by offsetgen. Do not edit. */");
  } else {
    lines.emplace_back("/* Generated by offsetgen from " + options.source_name + ". Do not edit. */");
  }
  if (options.include_guard) {
    lines.emplace_back("#ifndef " + *options.include_guard);
    lines.emplace_back("#define " + *options.include_guard);
  }
  lines.emplace_back("");

  bool any_debug = false;
  for (const auto &generated : structs) {
    any_debug |= generated.mode == GenerationMode::Debug;
  }
  lines.emplace_back("#include <cstddef>");
  lines.emplace_back("#include <cstdint>");
  if (any_debug) {
    lines.emplace_back("#include <cstring>");
    lines.emplace_back("#include <ostream>");
    lines.emplace_back("#include <type_traits>");
  }
  lines.emplace_back("");

  std::string text = join_lines(lines);
  lines.clear();
  if (any_debug) {
    text += render_debug_support();
    text += "\n";
  }

  if (!options.namespace_name.empty()) {
    lines.emplace_back("namespace " + options.namespace_name + " {");
    lines.emplace_back("");
  }

  std::vector<std::string> public_decls;
  std::vector<std::string> private_decls;
  for (const auto &name : collect_pointer_targets(structs, registry)) {
    auto it = registry.structs.find(name);
    if (it != registry.structs.end() && it->second.visibility == Visibility::Private) {
      private_decls.push_back("struct " + name + ";");
    } else {
      public_decls.push_back("struct " + name + ";");
    }
  }
  lines.insert(lines.end(), public_decls.begin(), public_decls.end());
  if (!private_decls.empty()) {
    lines.emplace_back("namespace detail {");
    lines.insert(lines.end(), private_decls.begin(), private_decls.end());
    lines.emplace_back("} // namespace detail");
  }
  if (!public_decls.empty() || !private_decls.empty()) {
    lines.emplace_back("");
  }
  text += join_lines(lines);
  lines.clear();

  EmitOptions emit;
  emit.strategy = options.strategy;
  for (const auto &generated : structs) {
    bool is_private = generated.plan.visibility == Visibility::Private;
    emit.checked = generated.checked;
    if (is_private) {
      text += "namespace detail {\n\n";
    }
    text += render_struct(generated.plan, registry, emit);
    if (generated.checked) {
      text += render_offset_checks(generated.plan);
    }
    if (generated.mode == GenerationMode::Debug) {
      text += "\n";
      text += render_debug_printer(generated.plan, registry);
    }
    if (is_private) {
      text += "\n} // namespace detail\n";
    }
    text += "\n";
  }

  if (!options.namespace_name.empty()) {
    lines.emplace_back("} // namespace " + options.namespace_name);
  }
  if (options.include_guard) {
    if (!options.namespace_name.empty()) {
      lines.emplace_back("");
    }
    lines.emplace_back("#endif // " + *options.include_guard);
  }
  text += join_lines(lines);
  return text;
}

std::string render_plan_dump(const std::vector<GeneratedStruct> &structs,
                             const TypeRegistry &registry) {
  std::vector<std::string> lines;
  for (const auto &generated : structs) {
    const LayoutPlan &plan = generated.plan;
    std::string header = llvm::formatv("struct {0} /* size {1}, {2}, {3}{4} */ {{", plan.struct_name,
                                       format_hex_const(plan.size), visibility_name(plan.visibility),
                                       mode_name(generated.mode),
                                       generated.checked ? ", checked" : "")
                             .str();
    lines.push_back(header);
    for (size_t i = 0; i < plan.segments.size(); ++i) {
      const Segment &segment = plan.segments[i];
      std::string what = segment.is_padding()
                             ? "<padding>"
                             : std::string(visibility_name(segment.field.visibility)) + " " +
                                   render_type(registry, segment.field.type, segment.name);
      std::string host;
      if (i < generated.host.members.size() &&
          generated.host.members[i].actual_offset != segment.offset) {
        host = "  /* host " + format_hex_const(generated.host.members[i].actual_offset) + " */";
      }
      lines.push_back(llvm::formatv("    {0,-10} {1,-8} {2}{3}", format_hex_const(segment.offset),
                                    format_hex_const(segment.size), what, host)
                          .str());
    }
    lines.emplace_back("}");
    lines.emplace_back("");
  }
  return join_lines(lines);
}

} // namespace offsetgen
