#ifndef OFFSETGEN_LAYOUT_DEBUG_H
#define OFFSETGEN_LAYOUT_DEBUG_H

#include "layout_types.h"

#include <string>

namespace offsetgen {

// Formatting helpers shared by every generated printer; guarded so several
// generated headers can be included together.
std::string render_debug_support();

bool debug_printable(const TypeRegistry &registry, const TypeRef &type_ref);

std::string render_debug_printer(const LayoutPlan &plan, const TypeRegistry &registry);

} // namespace offsetgen

#endif // OFFSETGEN_LAYOUT_DEBUG_H
