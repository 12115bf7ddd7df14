#pragma once

#include <string>
#include <string_view>

#include "Xml/Node.h"

// Text <-> Node for one XML part.
//
// parse():
//   - prefixes are dropped; names are local names plus namespace URI, so the
//     same document under any consistent prefix parses to the same tree
//   - attribute values stay strings
//   - comments, processing instructions and namespace declarations are dropped
//   - whitespace-only text between element siblings is dropped
//   - throws PartParseError when the text is not well-formed
//
// serialize() declares every namespace the tree uses on the root element with
// conventional prefixes (w, r, ...). parse(serialize(t)) == t for any tree
// parse() can produce.
namespace PartCodec {

Node parse(std::string_view xml);
std::string serialize(const Node& root);

}  // namespace PartCodec
