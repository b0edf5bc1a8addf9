#ifndef OFFSETGEN_LAYOUT_PIPELINE_H
#define OFFSETGEN_LAYOUT_PIPELINE_H

#include "layout_emitter.h"
#include "layout_parser.h"
#include "layout_types.h"
#include "layout_verifier.h"

#include <llvm/Support/Error.h>

#include <set>
#include <string>
#include <vector>

namespace offsetgen {

struct PipelineOptions {
  EmissionStrategy strategy = EmissionStrategy::Packed;
  bool checked = false;
  std::set<std::string> verbose;
};

struct GeneratedStruct {
  LayoutPlan plan;
  HostLayout host;
  GenerationMode mode = GenerationMode::Plain;
  bool checked = false;
};

struct PipelineResult {
  std::vector<GeneratedStruct> structs;
  std::vector<std::string> warnings;
};

bool log_enabled(const std::set<std::string> &verbose, const std::string &channel);

void log_line(const std::string &channel, const std::string &message);

// Plans every struct in declaration order and registers it in the registry,
// so later structs may embed earlier ones by value. A planning error stops
// the run; verification errors are collected across all structs.
llvm::Expected<PipelineResult> build_layouts(const LayoutFile &file, TypeRegistry &registry,
                                             const PipelineOptions &options);

} // namespace offsetgen

#endif // OFFSETGEN_LAYOUT_PIPELINE_H
