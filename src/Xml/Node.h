#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "Xml/Namespaces.h"

struct Attribute {
  std::string name;  // local name, prefix stripped
  std::string ns;    // namespace URI, empty for unqualified attributes
  std::string value; // always a string, never coerced

  bool operator==(const Attribute&) const = default;
};

// -----------------------------------------------------------------------------
// Element tree node
// -----------------------------------------------------------------------------
//
// A node is either an Element (local name + namespace URI, attributes, ordered
// children) or a Text leaf. Children keep document order, so a tag that occurs
// once and a tag that repeats are the same shape: a run of entries in
// `children`. An element's "text slot" is the concatenation of its direct Text
// children; it can sit next to attributes and element children.
//
// Invariant: Text children are never empty and never adjacent.
struct Node {
  enum class Kind { Element, Text };

  Kind kind = Kind::Element;
  std::string name;
  std::string ns;
  std::vector<Attribute> attributes;
  std::vector<Node> children;
  std::string text;  // Text nodes only

  static Node element(std::string name, std::string_view ns = Ns::W);
  static Node textNode(std::string value);

  bool isElement() const { return kind == Kind::Element; }
  bool isText() const { return kind == Kind::Text; }
  bool is(std::string_view localName) const {
    return kind == Kind::Element && name == localName;
  }

  // Attribute lookup by local name, any namespace.
  const std::string* attr(std::string_view localName) const;
  Node& setAttr(std::string localName, std::string value, std::string_view ns = Ns::W);

  const Node* child(std::string_view localName) const;
  Node* child(std::string_view localName);
  std::vector<const Node*> childrenNamed(std::string_view localName) const;

  // Depth-first, self excluded.
  const Node* findDescendant(std::string_view localName) const;

  std::string textSlot() const;
  Node& setText(std::string value);

  Node& append(Node child);
  Node& appendText(std::string value);

  bool operator==(const Node& other) const;
};
