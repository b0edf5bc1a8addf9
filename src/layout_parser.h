#ifndef OFFSETGEN_LAYOUT_PARSER_H
#define OFFSETGEN_LAYOUT_PARSER_H

#include "layout_types.h"

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <string>
#include <vector>

namespace offsetgen {

struct LayoutFile {
  std::string source_name;
  std::vector<StructSpec> structs;
};

struct ParseOptions {
  GenerationMode default_mode = GenerationMode::Plain;
};

// Field names with this prefix belong to generated padding members.
constexpr const char *kPaddingPrefix = "_pad_";

llvm::Expected<LayoutFile> parse_layout(llvm::StringRef text, llvm::StringRef source_name,
                                        const ParseOptions &options);

} // namespace offsetgen

#endif // OFFSETGEN_LAYOUT_PARSER_H
