#ifndef OFFSETGEN_LAYOUT_PLANNER_H
#define OFFSETGEN_LAYOUT_PLANNER_H

#include "layout_types.h"

#include <llvm/Support/Error.h>

#include <string>

namespace offsetgen {

std::string padding_name(int64_t offset);

// Turns an offset-ordered field list into contiguous field and padding
// segments starting at offset 0. Field types must be sizable through the
// registry; structs are sizable once an earlier plan has been registered.
llvm::Expected<LayoutPlan> plan_layout(const StructSpec &spec, const TypeRegistry &registry);

} // namespace offsetgen

#endif // OFFSETGEN_LAYOUT_PLANNER_H
