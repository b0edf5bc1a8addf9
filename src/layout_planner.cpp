#include "layout_planner.h"

#include "layout_emitter.h"
#include "layout_error.h"
#include "layout_parser.h"
#include "layout_utils.h"

#include <llvm/ADT/StringExtras.h>
#include <llvm/Support/MathExtras.h>

namespace offsetgen {

std::string padding_name(int64_t offset) {
  return std::string(kPaddingPrefix) + "0x" + llvm::utohexstr(static_cast<uint64_t>(offset), true);
}

static Segment make_padding(int64_t offset, int64_t size) {
  Segment segment;
  segment.kind = SegmentKind::Padding;
  segment.offset = offset;
  segment.size = size;
  segment.name = padding_name(offset);
  return segment;
}

static Segment make_field(const FieldSpec &field, int64_t size) {
  Segment segment;
  segment.kind = SegmentKind::Field;
  segment.offset = field.offset;
  segment.size = size;
  segment.name = field.name;
  segment.field = field;
  return segment;
}

llvm::Expected<LayoutPlan> plan_layout(const StructSpec &spec, const TypeRegistry &registry) {
  const FieldSpec *previous = nullptr;
  for (const auto &field : spec.fields) {
    if (field.offset < 0) {
      return make_layout_error(LayoutErrorKind::UnorderedOrDuplicateOffset, spec.name, field.name,
                               "offset " + format_hex_const(field.offset) + " is negative",
                               field.line);
    }
    if (previous && field.offset <= previous->offset) {
      std::string relation = field.offset == previous->offset ? "duplicates" : "precedes";
      return make_layout_error(LayoutErrorKind::UnorderedOrDuplicateOffset, spec.name, field.name,
                               "offset " + format_hex_const(field.offset) + " " + relation +
                                   " the offset of '" + previous->name + "' (" +
                                   format_hex_const(previous->offset) + ")",
                               field.line);
    }
    previous = &field;
  }

  LayoutPlan plan;
  plan.struct_name = spec.name;
  plan.visibility = spec.visibility;
  plan.declared_total_size = spec.total_size;

  int64_t cursor = 0;
  const FieldSpec *last = nullptr;
  for (const auto &field : spec.fields) {
    auto size = type_size(registry, field.type);
    if (!size) {
      return make_layout_error(LayoutErrorKind::UnknownType, spec.name, field.name,
                               "type '" + render_type(registry, field.type, "") +
                                   "' has no known size",
                               field.line);
    }
    if (*size == 0) {
      return make_layout_error(LayoutErrorKind::UnknownType, spec.name, field.name,
                               "type '" + render_type(registry, field.type, "") +
                                   "' has size 0 and cannot be embedded by value",
                               field.line);
    }
    int64_t end = 0;
    if (llvm::AddOverflow(field.offset, *size, end)) {
      return make_layout_error(LayoutErrorKind::StructOverflow, spec.name, field.name,
                               "field at " + format_hex_const(field.offset) +
                                   " ends past the largest representable offset",
                               field.line);
    }

    int64_t gap = field.offset - cursor;
    if (gap < 0) {
      return make_layout_error(LayoutErrorKind::FieldOverlap, spec.name, field.name,
                               "field at " + format_hex_const(field.offset) + " overlaps '" +
                                   last->name + "', which ends at " + format_hex_const(cursor),
                               field.line);
    }
    if (gap > 0) {
      plan.segments.push_back(make_padding(cursor, gap));
    }
    plan.segments.push_back(make_field(field, *size));
    cursor = end;
    last = &field;
  }

  if (spec.total_size) {
    int64_t trailing = *spec.total_size - cursor;
    if (trailing < 0) {
      std::string field_name = last ? last->name : "";
      return make_layout_error(LayoutErrorKind::StructOverflow, spec.name, field_name,
                               "fields end at " + format_hex_const(cursor) +
                                   ", past the declared size " +
                                   format_hex_const(*spec.total_size),
                               last ? last->line : spec.line);
    }
    if (trailing > 0) {
      plan.segments.push_back(make_padding(cursor, trailing));
    }
    cursor = *spec.total_size;
  }

  plan.size = cursor;
  return plan;
}

} // namespace offsetgen
