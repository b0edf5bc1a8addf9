#include "layout_error.h"
#include "layout_parser.h"
#include "layout_pipeline.h"
#include "layout_render.h"
#include "layout_rename.h"
#include "layout_utils.h"

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/CommandLine.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/InitLLVM.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/ToolOutputFile.h>
#include <llvm/Support/WithColor.h>

#include <cstdlib>
#include <optional>
#include <set>

using namespace llvm;

namespace offsetgen {

enum class EmitKind {
  Header,
  Plan,
};

struct Options {
  std::string path;
  EmitKind emit = EmitKind::Header;
  GenerationMode mode = GenerationMode::Plain;
  EmissionStrategy strategy = EmissionStrategy::Packed;
  bool checked = false;
  int64_t pointer_size = static_cast<int64_t>(sizeof(void *));
  std::string namespace_name;
  std::optional<std::string> type_prefix;
  bool include_guard = false;
  std::set<std::string> verbose;
  std::string output;
  bool has_output = false;
};

static std::set<std::string> split_set(StringRef value) {
  SmallVector<StringRef, 4> parts;
  value.split(parts, ',', -1, false);
  std::set<std::string> out;
  for (StringRef part : parts) {
    part = part.trim();
    if (!part.empty()) {
      out.insert(part.str());
    }
  }
  return out;
}

static bool valid_namespace(StringRef name) {
  SmallVector<StringRef, 4> parts;
  name.split(parts, "::");
  for (StringRef part : parts) {
    if (part.empty() || sanitize_identifier(part.str()) != part) {
      return false;
    }
  }
  return true;
}

static void report_errors(Error err, StringRef filename) {
  handleAllErrors(
      std::move(err),
      [&](const LayoutError &error) {
        std::string prefix = filename.str();
        if (error.line()) {
          prefix += ":" + std::to_string(error.line());
        }
        raw_ostream &os = WithColor::error(errs(), prefix);
        error.log(os);
        os << "\n";
      },
      [&](const ErrorInfoBase &error) { WithColor::error(errs(), filename) << error.message() << "\n"; });
}

static Options parse_options(int argc, char **argv) {
  cl::OptionCategory category("offsetgen options");
  cl::opt<std::string> input_path(cl::Positional, cl::desc("<input .layout file, or - for stdin>"),
                                  cl::Required, cl::cat(category));
  cl::opt<EmitKind> emit("emit", cl::desc("Output kind"),
                         cl::values(clEnumValN(EmitKind::Header, "header", "C++ header (default)"),
                                    clEnumValN(EmitKind::Plan, "plan", "Human-readable layout plans")),
                         cl::init(EmitKind::Header), cl::cat(category));
  cl::opt<GenerationMode> mode("mode", cl::desc("Generation mode for structs that do not name one"),
                               cl::values(clEnumValN(GenerationMode::Plain, "plain", "Type only (default)"),
                                          clEnumValN(GenerationMode::Debug, "debug",
                                                     "Type plus a padding-free operator<<")),
                               cl::init(GenerationMode::Plain), cl::cat(category));
  cl::opt<bool> checked("checked", cl::desc("Verify every struct's offsets and emit static_assert checks"),
                        cl::init(false), cl::cat(category));
  cl::opt<EmissionStrategy> layout(
      "layout", cl::desc("How the generated structs ask the compiler to lay out members"),
      cl::values(clEnumValN(EmissionStrategy::Packed, "packed", "#pragma pack(1) (default)"),
                 clEnumValN(EmissionStrategy::Natural, "natural", "Natural member alignment")),
      cl::init(EmissionStrategy::Packed), cl::cat(category));
  cl::opt<unsigned> pointer_size("pointer-size", cl::desc("Pointer size of the target layout in bytes"),
                                 cl::init(static_cast<unsigned>(sizeof(void *))), cl::cat(category));
  cl::opt<std::string> namespace_name("namespace", cl::desc("Wrap generated types in this namespace"),
                                      cl::init(""), cl::cat(category));
  cl::opt<std::string> type_prefix("type-prefix", cl::desc("Prefix all generated struct names"),
                                   cl::init(""), cl::cat(category));
  cl::opt<bool> include_guard("include-guard", cl::desc("Emit an include guard in the generated output"),
                              cl::init(false), cl::cat(category));
  cl::opt<std::string> verbose("verbose",
                               cl::desc("Comma-separated list of logs to enable (parse, plan, verify, or 'all')"),
                               cl::init(""), cl::cat(category));
  cl::opt<std::string> output("output", cl::desc("Write generated output to this path instead of stdout"),
                              cl::init(""), cl::cat(category));
  cl::alias output_short("o", cl::desc("Alias for --output"), cl::aliasopt(output));

  cl::HideUnrelatedOptions({&category});
  cl::ParseCommandLineOptions(argc, argv, "offsetgen: generate C++ structs from byte-offset layouts\n");

  Options options;
  options.path = input_path;
  options.emit = emit;
  options.mode = mode;
  options.checked = checked;
  options.strategy = layout;
  if (pointer_size != 4 && pointer_size != 8) {
    WithColor::error() << "--pointer-size must be 4 or 8\n";
    exit(1);
  }
  options.pointer_size = pointer_size;
  if (!namespace_name.empty() && !valid_namespace(namespace_name)) {
    WithColor::error() << "--namespace must be a '::'-separated list of identifiers\n";
    exit(1);
  }
  options.namespace_name = namespace_name;
  if (!type_prefix.empty()) {
    options.type_prefix = type_prefix;
  }
  options.include_guard = include_guard;
  options.verbose = split_set(verbose);
  if (!output.empty()) {
    options.output = output;
    options.has_output = true;
  }
  return options;
}

} // namespace offsetgen

int main(int argc, char **argv) {
  InitLLVM init(argc, argv);
  auto options = offsetgen::parse_options(argc, argv);

  auto buffer_or = MemoryBuffer::getFileOrSTDIN(options.path);
  if (!buffer_or) {
    WithColor::error() << "unable to read " << options.path << ": " << buffer_or.getError().message()
                       << "\n";
    return 1;
  }
  StringRef text = (*buffer_or)->getBuffer();
  std::string source_name = options.path == "-" ? "<stdin>" : sys::path::filename(options.path).str();

  offsetgen::ParseOptions parse_options;
  parse_options.default_mode = options.mode;
  auto file = offsetgen::parse_layout(text, source_name, parse_options);
  if (!file) {
    offsetgen::report_errors(file.takeError(), options.path);
    return 1;
  }
  if (offsetgen::log_enabled(options.verbose, "parse")) {
    for (const auto &spec : file->structs) {
      offsetgen::log_line("parse", spec.name + ": " + std::to_string(spec.fields.size()) + " fields, " +
                                       offsetgen::mode_name(spec.mode) +
                                       (spec.checked ? ", checked" : ""));
    }
  }
  if (options.type_prefix) {
    offsetgen::apply_type_prefix(*file, *options.type_prefix);
  }

  offsetgen::TypeRegistry registry = offsetgen::make_default_registry(options.pointer_size);
  offsetgen::PipelineOptions pipeline_options;
  pipeline_options.strategy = options.strategy;
  pipeline_options.checked = options.checked;
  pipeline_options.verbose = options.verbose;
  auto result = offsetgen::build_layouts(*file, registry, pipeline_options);
  if (!result) {
    offsetgen::report_errors(result.takeError(), options.path);
    return 1;
  }
  for (const auto &warning : result->warnings) {
    WithColor::warning(errs(), options.path) << warning << "\n";
  }

  std::string rendered;
  if (options.emit == offsetgen::EmitKind::Plan) {
    rendered = offsetgen::render_plan_dump(result->structs, registry);
  } else {
    offsetgen::RenderOptions render_options;
    render_options.strategy = options.strategy;
    render_options.namespace_name = options.namespace_name;
    render_options.source_name = source_name;
    if (options.include_guard) {
      std::string stem = options.has_output ? sys::path::stem(options.output).str()
                                            : sys::path::stem(source_name).str();
      render_options.include_guard = offsetgen::make_include_guard(stem, text.str());
    }
    rendered = offsetgen::render_header(result->structs, registry, render_options);
  }

  if (!options.has_output) {
    outs() << rendered;
    return 0;
  }
  std::error_code ec;
  ToolOutputFile output_file(options.output, ec, sys::fs::OF_TextWithCRLF);
  if (ec) {
    WithColor::error() << "unable to open output file " << options.output << ": " << ec.message() << "\n";
    return 1;
  }
  output_file.os() << rendered;
  output_file.keep();
  return 0;
}
