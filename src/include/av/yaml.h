#pragma once

#include <av/value.h>
#include <string>

namespace av {

// Parse a single YAML document (block and flow collections, quoted and plain
// scalars, literal/folded block scalars). Anchors, aliases, tags and
// multi-document streams are rejected. Throws av::ParseError on errors.
Value parse_yaml(const std::string& text);

}  // namespace av
