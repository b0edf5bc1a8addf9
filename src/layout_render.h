#ifndef OFFSETGEN_LAYOUT_RENDER_H
#define OFFSETGEN_LAYOUT_RENDER_H

#include "layout_emitter.h"
#include "layout_pipeline.h"
#include "layout_types.h"

#include <optional>
#include <string>
#include <vector>

namespace offsetgen {

struct RenderOptions {
  EmissionStrategy strategy = EmissionStrategy::Packed;
  std::string namespace_name;
  std::optional<std::string> include_guard;
  std::string source_name;
};

std::string make_include_guard(const std::string &stem, const std::string &input_text);

std::string render_header(const std::vector<GeneratedStruct> &structs, const TypeRegistry &registry,
                          const RenderOptions &options);

std::string render_plan_dump(const std::vector<GeneratedStruct> &structs,
                             const TypeRegistry &registry);

} // namespace offsetgen

#endif // OFFSETGEN_LAYOUT_RENDER_H
