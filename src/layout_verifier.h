#ifndef OFFSETGEN_LAYOUT_VERIFIER_H
#define OFFSETGEN_LAYOUT_VERIFIER_H

#include "layout_emitter.h"
#include "layout_types.h"

#include <llvm/Support/Error.h>

#include <functional>
#include <string>
#include <vector>

namespace offsetgen {

struct MemberPlacement {
  std::string name;
  bool padding = false;
  int64_t declared_offset = 0;
  int64_t actual_offset = 0;
  int64_t size = 0;
  unsigned line = 0;
};

struct HostLayout {
  std::vector<MemberPlacement> members;
  int64_t size = 0;
  int64_t alignment = 1;
};

using VerifyLog = std::function<void(const std::string &)>;

// Places the emitted members the way a C++ compiler lays out a struct
// under the given strategy.
llvm::Expected<HostLayout> compute_host_layout(const LayoutPlan &plan, const TypeRegistry &registry,
                                               EmissionStrategy strategy);

// One OffsetMismatch per drifted field and a SizeMismatch for a declared
// total size the host does not reproduce, joined into a single error.
llvm::Error verify_layout(const LayoutPlan &plan, const HostLayout &host, const VerifyLog &log = {});

// static_assert checks evaluated by the compiler that includes the header.
std::string render_offset_checks(const LayoutPlan &plan);

} // namespace offsetgen

#endif // OFFSETGEN_LAYOUT_VERIFIER_H
