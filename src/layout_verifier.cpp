#include "layout_verifier.h"

#include "layout_error.h"
#include "layout_utils.h"

#include <llvm/Support/FormatVariadic.h>

#include <algorithm>

namespace offsetgen {

static int64_t align_up(int64_t value, int64_t alignment) {
  if (alignment <= 1) {
    return value;
  }
  return (value + alignment - 1) / alignment * alignment;
}

llvm::Expected<HostLayout> compute_host_layout(const LayoutPlan &plan, const TypeRegistry &registry,
                                               EmissionStrategy strategy) {
  HostLayout host;
  int64_t cursor = 0;
  int64_t max_alignment = 1;
  for (const auto &segment : plan.segments) {
    MemberPlacement member;
    member.name = segment.name;
    member.padding = segment.is_padding();
    member.declared_offset = segment.offset;
    int64_t alignment = 1;
    if (segment.is_padding()) {
      member.size = segment.size;
    } else {
      member.line = segment.field.line;
      auto size = host_type_size(registry, segment.field.type);
      auto natural = host_type_alignment(registry, segment.field.type);
      if (!size || !natural) {
        return make_layout_error(LayoutErrorKind::UnknownType, plan.struct_name, segment.name,
                                 "type '" + render_type(registry, segment.field.type, "") +
                                     "' has no known host layout",
                                 segment.field.line);
      }
      member.size = *size;
      if (strategy == EmissionStrategy::Natural) {
        alignment = *natural;
      }
    }
    cursor = align_up(cursor, alignment);
    member.actual_offset = cursor;
    cursor += member.size;
    max_alignment = std::max(max_alignment, alignment);
    host.members.push_back(member);
  }
  host.alignment = max_alignment;
  host.size = std::max<int64_t>(align_up(cursor, max_alignment), 1);
  return host;
}

llvm::Error verify_layout(const LayoutPlan &plan, const HostLayout &host, const VerifyLog &log) {
  llvm::Error result = llvm::Error::success();
  for (const auto &member : host.members) {
    if (member.padding) {
      continue;
    }
    bool matches = member.actual_offset == member.declared_offset;
    if (log) {
      log(llvm::formatv("{0}.{1}: declared {2}, host {3}{4}", plan.struct_name, member.name,
                        format_hex_const(member.declared_offset),
                        format_hex_const(member.actual_offset), matches ? "" : " MISMATCH")
              .str());
    }
    if (!matches) {
      result = llvm::joinErrors(
          std::move(result),
          make_mismatch_error(LayoutErrorKind::OffsetMismatch, plan.struct_name, member.name,
                              member.declared_offset, member.actual_offset, member.line));
    }
  }
  if (plan.declared_total_size && host.size != *plan.declared_total_size) {
    if (log) {
      log(llvm::formatv("{0}: declared size {1}, host size {2} MISMATCH", plan.struct_name,
                        format_hex_const(*plan.declared_total_size), format_hex_const(host.size))
              .str());
    }
    result = llvm::joinErrors(std::move(result),
                              make_mismatch_error(LayoutErrorKind::SizeMismatch, plan.struct_name, "",
                                                  *plan.declared_total_size, host.size));
  }
  return result;
}

std::string render_offset_checks(const LayoutPlan &plan) {
  std::vector<std::string> lines;
  lines.emplace_back("#if defined(__GNUC__)");
  lines.emplace_back("#pragma GCC diagnostic push");
  lines.emplace_back("#pragma GCC diagnostic ignored \"-Winvalid-offsetof\"");
  lines.emplace_back("#endif");

  bool scoped = has_private_fields(plan);
  std::string indent = scoped ? "    " : "";
  if (scoped) {
    lines.emplace_back("struct " + layout_check_name(plan) + " {");
  }
  for (const auto &segment : plan.segments) {
    if (segment.is_padding()) {
      continue;
    }
    std::string offset = format_hex_const(segment.offset);
    lines.emplace_back(indent + "static_assert(offsetof(" + plan.struct_name + ", " + segment.name +
                       ") == " + offset + ", \"OffsetMismatch: " + plan.struct_name + "." +
                       segment.name + " declared at " + offset + "\");");
  }
  if (plan.declared_total_size) {
    std::string size = format_hex_const(*plan.declared_total_size);
    lines.emplace_back(indent + "static_assert(sizeof(" + plan.struct_name + ") == " + size +
                       ", \"SizeMismatch: " + plan.struct_name + " declared as " + size +
                       " bytes\");");
  }
  if (scoped) {
    lines.emplace_back("};");
  }

  lines.emplace_back("#if defined(__GNUC__)");
  lines.emplace_back("#pragma GCC diagnostic pop");
  lines.emplace_back("#endif");
  return join_lines(lines);
}

} // namespace offsetgen
