#pragma once

#include <optional>
#include <string>
#include <vector>

#include "Xml/Node.h"

// Builds the output package: the rewritten document part plus the three
// companion parts a package reader needs, and nothing else.
//
//   [Content_Types].xml   defaults for rels/xml, overrides for document + settings
//   _rels/.rels           rId1 -> word/document.xml
//   word/document.xml     w:document/w:body: paragraphs, then sectPr
//   word/settings.xml     w:settings/w:trackRevisions
namespace PackageAssembler {

// sectPr defaults to an empty <w:sectPr/>.
Node buildDocument(std::vector<Node> paragraphs, std::optional<Node> sectPr = std::nullopt);

Node contentTypes();
Node rootRelationships();
Node settings();

// Fresh zip holding the four parts above. Never touches the inputs.
std::string assemble(const Node& document);

}  // namespace PackageAssembler
