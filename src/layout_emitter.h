#ifndef OFFSETGEN_LAYOUT_EMITTER_H
#define OFFSETGEN_LAYOUT_EMITTER_H

#include "layout_types.h"

#include <string>
#include <vector>

namespace offsetgen {

enum class EmissionStrategy {
  Packed,
  Natural,
};

struct EmitOptions {
  EmissionStrategy strategy = EmissionStrategy::Packed;
  bool checked = false;
};

// Name under which a struct is reachable from the generated namespace.
std::string qualified_struct_name(const TypeRegistry &registry, const std::string &name);

std::string render_type(const TypeRegistry &registry, const TypeRef &type_ref,
                        const std::string &name);

bool has_private_fields(const LayoutPlan &plan);

std::string layout_check_name(const LayoutPlan &plan);

std::string render_struct(const LayoutPlan &plan, const TypeRegistry &registry,
                          const EmitOptions &options);

std::string join_lines(const std::vector<std::string> &lines);

} // namespace offsetgen

#endif // OFFSETGEN_LAYOUT_EMITTER_H
