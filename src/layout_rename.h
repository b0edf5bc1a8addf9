#ifndef OFFSETGEN_LAYOUT_RENAME_H
#define OFFSETGEN_LAYOUT_RENAME_H

#include "layout_parser.h"

#include <string>

namespace offsetgen {

void apply_type_prefix(LayoutFile &file, const std::string &prefix);

} // namespace offsetgen

#endif // OFFSETGEN_LAYOUT_RENAME_H
