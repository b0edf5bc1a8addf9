#ifndef OFFSETGEN_LAYOUT_UTILS_H
#define OFFSETGEN_LAYOUT_UTILS_H

#include "layout_types.h"

#include <optional>
#include <string>

namespace offsetgen {

std::string sanitize_identifier(const std::string &name);

std::string format_hex_const(int64_t value);

std::string format_int_const(int64_t value);

const char *visibility_name(Visibility visibility);

const char *mode_name(GenerationMode mode);

std::string sig_digest(const std::string &input);

TypeRegistry make_default_registry(int64_t pointer_size);

bool is_base_type(const TypeRegistry &registry, const std::string &name);

const StructEntry *find_struct(const TypeRegistry &registry, const TypeRef &type_ref);

// Size as the planner sees it: declared struct sizes, registry pointer size.
std::optional<int64_t> type_size(const TypeRegistry &registry, const TypeRef &type_ref);

// Size and alignment as the host compiler lays the emitted type out.
std::optional<int64_t> host_type_size(const TypeRegistry &registry, const TypeRef &type_ref);
std::optional<int64_t> host_type_alignment(const TypeRegistry &registry, const TypeRef &type_ref);

} // namespace offsetgen

#endif // OFFSETGEN_LAYOUT_UTILS_H
