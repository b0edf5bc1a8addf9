#include "layout_pipeline.h"

#include "layout_planner.h"
#include "layout_utils.h"

#include <llvm/Support/FormatVariadic.h>

#include <iostream>

namespace offsetgen {

bool log_enabled(const std::set<std::string> &verbose, const std::string &channel) {
  return verbose.count(channel) || verbose.count("all");
}

void log_line(const std::string &channel, const std::string &message) {
  std::cerr << "[offsetgen:" << channel << "] " << message << "\n";
}

static void log_plan(const LayoutPlan &plan) {
  log_line("plan", llvm::formatv("{0}: {1} segments, size {2}", plan.struct_name,
                                 plan.segments.size(), format_hex_const(plan.size))
                       .str());
  for (const auto &segment : plan.segments) {
    log_line("plan", llvm::formatv("  {0,-8} +{1,-6} {2}{3}", format_hex_const(segment.offset),
                                   format_hex_const(segment.size), segment.name,
                                   segment.is_padding() ? " (padding)" : "")
                         .str());
  }
}

static bool has_wide_alignment(const LayoutPlan &plan, const TypeRegistry &registry) {
  for (const auto &segment : plan.segments) {
    if (segment.is_padding()) {
      continue;
    }
    auto alignment = host_type_alignment(registry, segment.field.type);
    if (alignment && *alignment > 1) {
      return true;
    }
  }
  return false;
}

llvm::Expected<PipelineResult> build_layouts(const LayoutFile &file, TypeRegistry &registry,
                                             const PipelineOptions &options) {
  PipelineResult result;
  llvm::Error verify_errors = llvm::Error::success();
  VerifyLog verify_log;
  if (log_enabled(options.verbose, "verify")) {
    verify_log = [](const std::string &message) { log_line("verify", message); };
  }

  for (const auto &spec : file.structs) {
    auto plan = plan_layout(spec, registry);
    if (!plan) {
      return llvm::joinErrors(std::move(verify_errors), plan.takeError());
    }
    if (log_enabled(options.verbose, "plan")) {
      log_plan(*plan);
    }

    auto host = compute_host_layout(*plan, registry, options.strategy);
    if (!host) {
      return llvm::joinErrors(std::move(verify_errors), host.takeError());
    }

    GeneratedStruct generated;
    generated.mode = spec.mode;
    generated.checked = spec.checked || options.checked;
    if (generated.checked) {
      if (auto err = verify_layout(*plan, *host, verify_log)) {
        verify_errors = llvm::joinErrors(std::move(verify_errors), std::move(err));
      }
    } else if (options.strategy == EmissionStrategy::Natural && has_wide_alignment(*plan, registry)) {
      result.warnings.push_back(spec.name +
                                " uses natural layout with fields aligned wider than one byte but "
                                "is not checked; enable --checked to verify its offsets");
    }

    StructEntry entry;
    entry.visibility = spec.visibility;
    entry.mode = spec.mode;
    entry.size = plan->size;
    entry.host_size = host->size;
    entry.host_alignment = host->alignment;
    registry.structs[spec.name] = entry;

    generated.plan = std::move(*plan);
    generated.host = std::move(*host);
    result.structs.push_back(std::move(generated));
  }

  if (verify_errors) {
    return std::move(verify_errors);
  }
  return result;
}

} // namespace offsetgen
