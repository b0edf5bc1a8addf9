#include "layout_rename.h"

#include "layout_utils.h"

#include <llvm/ADT/StringRef.h>

#include <functional>
#include <map>

namespace offsetgen {

void apply_type_prefix(LayoutFile &file, const std::string &prefix_input) {
  std::string prefix = sanitize_identifier(llvm::StringRef(prefix_input).trim().str());
  if (prefix.empty()) {
    return;
  }

  std::map<std::string, std::string> renames;
  for (const auto &spec : file.structs) {
    renames[spec.name] = prefix + spec.name;
  }

  // Pointers to undeclared types keep their names; they refer to types
  // defined outside the layout file.
  std::function<void(TypeRef &)> rewrite_type_ref = [&](TypeRef &type_ref) {
    if (!type_ref) {
      return;
    }
    if (type_ref->kind == TypeKind::Named) {
      auto it = renames.find(type_ref->name);
      if (it != renames.end()) {
        type_ref->name = it->second;
      }
      return;
    }
    rewrite_type_ref(type_ref->target);
  };

  for (auto &spec : file.structs) {
    spec.name = renames[spec.name];
    for (auto &field : spec.fields) {
      rewrite_type_ref(field.type);
    }
  }
}

} // namespace offsetgen
