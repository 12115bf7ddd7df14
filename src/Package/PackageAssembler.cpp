#include "PackageAssembler.h"

#include "Archive/ZipWriter.h"
#include "Package/PartNames.h"
#include "Utils/Debug.h"
#include "Xml/PartCodec.h"

using namespace std;

namespace PackageAssembler {

Node buildDocument(vector<Node> paragraphs, optional<Node> sectPr) {
  Node body = Node::element("body");
  body.children = std::move(paragraphs);
  body.children.push_back(sectPr ? std::move(*sectPr) : Node::element("sectPr"));

  Node document = Node::element("document");
  document.append(std::move(body));
  return document;
}

Node contentTypes() {
  auto def = [](const char* ext, const char* type) {
    Node n = Node::element("Default", Ns::CONTENT_TYPES);
    n.setAttr("Extension", ext, "");
    n.setAttr("ContentType", type, "");
    return n;
  };
  auto over = [](const string& part, const char* type) {
    Node n = Node::element("Override", Ns::CONTENT_TYPES);
    n.setAttr("PartName", "/" + part, "");
    n.setAttr("ContentType", type, "");
    return n;
  };

  Node types = Node::element("Types", Ns::CONTENT_TYPES);
  types.append(def("rels", PartNames::RELATIONSHIPS_CONTENT_TYPE));
  types.append(def("xml", "application/xml"));
  types.append(over(PartNames::DOCUMENT, PartNames::DOCUMENT_CONTENT_TYPE));
  types.append(over(PartNames::SETTINGS, PartNames::SETTINGS_CONTENT_TYPE));
  return types;
}

Node rootRelationships() {
  Node rel = Node::element("Relationship", Ns::PACKAGE_RELATIONSHIPS);
  rel.setAttr("Id", "rId1", "");
  rel.setAttr("Type", PartNames::OFFICE_DOCUMENT_REL_TYPE, "");
  rel.setAttr("Target", PartNames::DOCUMENT, "");

  Node rels = Node::element("Relationships", Ns::PACKAGE_RELATIONSHIPS);
  rels.append(std::move(rel));
  return rels;
}

Node settings() {
  Node s = Node::element("settings");
  s.append(Node::element("trackRevisions"));
  return s;
}

string assemble(const Node& document) {
  ZipWriter zip;
  zip.add(PartNames::CONTENT_TYPES, PartCodec::serialize(contentTypes()));
  zip.add(PartNames::ROOT_RELS, PartCodec::serialize(rootRelationships()));
  zip.add(PartNames::DOCUMENT, PartCodec::serialize(document));
  zip.add(PartNames::SETTINGS, PartCodec::serialize(settings()));
  string out = zip.finish();
  debug("assembled package:", out.size(), "bytes");
  return out;
}

}  // namespace PackageAssembler
