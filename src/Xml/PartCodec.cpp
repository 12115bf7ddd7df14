#include "PartCodec.h"

#include <climits>
#include <map>
#include <memory>
#include <mutex>
#include <set>

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

#include "Engine/Errors.h"
#include "Utils/Debug.h"

using namespace std;

namespace PartCodec {

static void ensureLibxmlInitialized() {
  static once_flag flag;
  call_once(flag, [] { xmlInitParser(); });
}

static const char* asChars(const xmlChar* s) {
  return reinterpret_cast<const char*>(s);
}

static const xmlChar* asXml(const string& s) {
  return reinterpret_cast<const xmlChar*>(s.c_str());
}

// An undeclared prefix leaves "w:p" in the name; keep what follows the colon.
static string localName(const xmlChar* qname) {
  string_view name(asChars(qname));
  size_t colon = name.rfind(':');
  return string(colon == string_view::npos ? name : name.substr(colon + 1));
}

static string namespaceOf(const xmlNs* ns) {
  return ns && ns->href ? string(asChars(ns->href)) : string();
}

static bool isBlank(string_view s) {
  for (char c : s) {
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r') return false;
  }
  return true;
}

// =============================================================================
// Parsing
// =============================================================================

static Node convertElement(xmlNode* el) {
  Node node = Node::element(localName(el->name), namespaceOf(el->ns));

  for (xmlAttr* a = el->properties; a; a = a->next) {
    xmlChar* value = xmlNodeListGetString(el->doc, a->children, 1);
    node.attributes.push_back(Attribute{localName(a->name), namespaceOf(a->ns),
                                        value ? asChars(value) : ""});
    if (value) xmlFree(value);
  }

  bool hasElementChild = false;
  for (xmlNode* c = el->children; c; c = c->next) {
    if (c->type == XML_ELEMENT_NODE) {
      hasElementChild = true;
      break;
    }
  }

  for (xmlNode* c = el->children; c; c = c->next) {
    switch (c->type) {
      case XML_ELEMENT_NODE:
        node.children.push_back(convertElement(c));
        break;
      case XML_TEXT_NODE:
      case XML_CDATA_SECTION_NODE: {
        string content = c->content ? asChars(c->content) : "";
        if (hasElementChild && isBlank(content)) break;
        node.appendText(std::move(content));
        break;
      }
      default:
        break;
    }
  }
  return node;
}

Node parse(string_view xml) {
  ensureLibxmlInitialized();
  if (xml.size() > static_cast<size_t>(INT_MAX)) {
    throw PartParseError("part too large to parse");
  }

  unique_ptr<xmlDoc, decltype(&xmlFreeDoc)> doc(
      xmlReadMemory(xml.data(), static_cast<int>(xml.size()), nullptr, nullptr,
                    XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING |
                        XML_PARSE_NOCDATA),
      &xmlFreeDoc);
  if (!doc) {
    auto err = xmlGetLastError();
    string msg = err && err->message ? string(err->message) : string("not well-formed");
    while (!msg.empty() && (msg.back() == '\n' || msg.back() == ' ')) msg.pop_back();
    debug("parse failed:", msg);
    throw PartParseError("malformed XML: " + msg);
  }

  xmlNode* root = xmlDocGetRootElement(doc.get());
  if (!root) {
    throw PartParseError("malformed XML: no root element");
  }
  return convertElement(root);
}

// =============================================================================
// Serialization
// =============================================================================

namespace {

// URI -> libxml namespace, declared once on the root element
class NamespaceTable {
public:
  void collect(const Node& n) {
    if (!n.isElement()) return;
    if (n.ns.empty()) {
      unqualifiedElements_ = true;
    } else {
      note(n.ns);
    }
    for (const auto& a : n.attributes) {
      if (!a.ns.empty()) note(a.ns);
    }
    for (const auto& c : n.children) collect(c);
  }

  void declare(xmlDoc* doc, xmlNode* root) {
    set<string> usedPrefixes;
    bool defaultTaken = unqualifiedElements_;
    int generated = 0;

    for (const string& uri : order_) {
      if (uri == Ns::XML) {
        table_[uri] = xmlSearchNsByHref(doc, root, XML_XML_NAMESPACE);
        continue;
      }
      const char* preferred = Ns::conventionalPrefix(uri);
      string prefix;
      bool isDefault = false;
      if (preferred && *preferred == '\0' && !defaultTaken) {
        isDefault = true;
        defaultTaken = true;
      } else if (preferred && *preferred != '\0' && !usedPrefixes.count(preferred)) {
        prefix = preferred;
      } else {
        do {
          prefix = "ns" + to_string(generated++);
        } while (usedPrefixes.count(prefix));
      }
      if (!isDefault) usedPrefixes.insert(prefix);
      table_[uri] = xmlNewNs(root, asXml(uri), isDefault ? nullptr : asXml(prefix));
    }
  }

  xmlNs* lookup(const string& uri) const {
    if (uri.empty()) return nullptr;
    auto it = table_.find(uri);
    return it == table_.end() ? nullptr : it->second;
  }

private:
  void note(const string& uri) {
    if (seen_.insert(uri).second) order_.push_back(uri);
  }

  vector<string> order_;
  set<string> seen_;
  map<string, xmlNs*> table_;
  bool unqualifiedElements_ = false;
};

}  // namespace

static void fillElement(xmlDoc* doc, xmlNode* el, const Node& n, const NamespaceTable& table) {
  xmlSetNs(el, table.lookup(n.ns));
  for (const auto& a : n.attributes) {
    xmlNewNsProp(el, a.ns.empty() ? nullptr : table.lookup(a.ns), asXml(a.name),
                 asXml(a.value));
  }
  for (const auto& c : n.children) {
    if (c.isText()) {
      if (c.text.empty()) continue;
      xmlAddChild(el, xmlNewDocText(doc, asXml(c.text)));
    } else {
      xmlNode* child = xmlNewDocNode(doc, nullptr, asXml(c.name), nullptr);
      xmlAddChild(el, child);
      fillElement(doc, child, c, table);
    }
  }
}

string serialize(const Node& root) {
  ensureLibxmlInitialized();
  if (!root.isElement()) {
    throw invalid_argument("serialize: root must be an element");
  }

  unique_ptr<xmlDoc, decltype(&xmlFreeDoc)> doc(xmlNewDoc(BAD_CAST "1.0"), &xmlFreeDoc);
  doc->standalone = 1;
  xmlNode* rootEl = xmlNewDocNode(doc.get(), nullptr, asXml(root.name), nullptr);
  xmlDocSetRootElement(doc.get(), rootEl);

  NamespaceTable table;
  table.collect(root);
  table.declare(doc.get(), rootEl);
  fillElement(doc.get(), rootEl, root, table);

  xmlChar* mem = nullptr;
  int size = 0;
  xmlDocDumpMemoryEnc(doc.get(), &mem, &size, "UTF-8");
  if (!mem) {
    throw runtime_error("serialize: libxml2 failed to dump the document");
  }
  string out(asChars(mem), static_cast<size_t>(size));
  xmlFree(mem);
  return out;
}

}  // namespace PartCodec
