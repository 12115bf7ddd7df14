#include "Node.h"

using namespace std;

Node Node::element(string name, string_view ns) {
  Node n;
  n.kind = Kind::Element;
  n.name = std::move(name);
  n.ns = string(ns);
  return n;
}

Node Node::textNode(string value) {
  Node n;
  n.kind = Kind::Text;
  n.text = std::move(value);
  return n;
}

bool Node::operator==(const Node& other) const = default;

const string* Node::attr(string_view localName) const {
  for (const auto& a : attributes) {
    if (a.name == localName) return &a.value;
  }
  return nullptr;
}

Node& Node::setAttr(string localName, string value, string_view attrNs) {
  for (auto& a : attributes) {
    if (a.name == localName && a.ns == attrNs) {
      a.value = std::move(value);
      return *this;
    }
  }
  attributes.push_back(Attribute{std::move(localName), string(attrNs), std::move(value)});
  return *this;
}

const Node* Node::child(string_view localName) const {
  for (const auto& c : children) {
    if (c.is(localName)) return &c;
  }
  return nullptr;
}

Node* Node::child(string_view localName) {
  for (auto& c : children) {
    if (c.is(localName)) return &c;
  }
  return nullptr;
}

vector<const Node*> Node::childrenNamed(string_view localName) const {
  vector<const Node*> out;
  for (const auto& c : children) {
    if (c.is(localName)) out.push_back(&c);
  }
  return out;
}

const Node* Node::findDescendant(string_view localName) const {
  for (const auto& c : children) {
    if (c.is(localName)) return &c;
    if (const Node* hit = c.findDescendant(localName)) return hit;
  }
  return nullptr;
}

string Node::textSlot() const {
  string out;
  for (const auto& c : children) {
    if (c.isText()) out += c.text;
  }
  return out;
}

Node& Node::setText(string value) {
  erase_if(children, [](const Node& c) { return c.isText(); });
  if (!value.empty()) children.push_back(textNode(std::move(value)));
  return *this;
}

Node& Node::append(Node c) {
  if (c.isText()) return appendText(std::move(c.text));
  children.push_back(std::move(c));
  return *this;
}

Node& Node::appendText(string value) {
  if (value.empty()) return *this;
  if (!children.empty() && children.back().isText()) {
    children.back().text += value;
  } else {
    children.push_back(textNode(std::move(value)));
  }
  return *this;
}
