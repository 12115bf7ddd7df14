#include "TestUtils.h"

#include <stdexcept>

#include "Archive/ZipArchive.h"
#include "Archive/ZipWriter.h"
#include "Document/Paragraph.h"
#include "Package/PartNames.h"
#include "Xml/PartCodec.h"

using namespace std;

static const char* W_URI = "http://schemas.openxmlformats.org/wordprocessingml/2006/main";

string escapeXml(const string& s) {
  string out;
  for (char c : s) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      default: out += c; break;
    }
  }
  return out;
}

string paragraphXml(const string& text, const string& prefix) {
  const string p = prefix + ":";
  return "<" + p + "p><" + p + "r><" + p + "t xml:space=\"preserve\">" + escapeXml(text) +
         "</" + p + "t></" + p + "r></" + p + "p>";
}

string documentXmlRaw(const string& bodyXml, const string& prefix) {
  return "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n<" + prefix +
         ":document xmlns:" + prefix + "=\"" + W_URI + "\"><" + prefix + ":body>" + bodyXml +
         "</" + prefix + ":body></" + prefix + ":document>";
}

string documentXml(const vector<string>& paragraphs, const string& prefix) {
  string body;
  for (const auto& text : paragraphs) body += paragraphXml(text, prefix);
  return documentXmlRaw(body, prefix);
}

string makeDocx(const string* documentXml, const vector<pair<string, string>>& extraParts) {
  ZipWriter zip;
  zip.add(PartNames::CONTENT_TYPES,
          "<?xml version=\"1.0\"?><Types "
          "xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\"/>");
  zip.add(PartNames::ROOT_RELS,
          "<?xml version=\"1.0\"?><Relationships "
          "xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\"/>");
  if (documentXml) zip.add(PartNames::DOCUMENT, *documentXml);
  for (const auto& [path, data] : extraParts) zip.add(path, data);
  return zip.finish();
}

string makeDocx(const string& documentXml) {
  return makeDocx(&documentXml);
}

string docxOf(const vector<string>& paragraphs) {
  return makeDocx(documentXml(paragraphs));
}

Node readOutputDocument(const string& docx) {
  ZipArchive zip = ZipArchive::open(docx, ResourceLimits());
  auto xml = zip.readPart(PartNames::DOCUMENT);
  if (!xml) {
    throw runtime_error("output has no word/document.xml");
  }
  return PartCodec::parse(*xml);
}

vector<const Node*> bodyParagraphs(const Node& document) {
  vector<const Node*> out;
  const Node* body = Paragraphs::bodyOf(document);
  if (!body) return out;
  for (const auto& c : body->children) {
    if (c.is("p")) out.push_back(&c);
  }
  return out;
}

static string runText(const Node& run, const char* textTag) {
  string out;
  for (const auto& c : run.children) {
    if (c.is(textTag)) out += c.textSlot();
  }
  return out;
}

static string wrapperText(const Node& wrapper, const char* textTag) {
  string out;
  for (const auto& c : wrapper.children) {
    if (c.is("r")) out += runText(c, textTag);
  }
  return out;
}

string describe(const Node& paragraph) {
  string out;
  for (const auto& c : paragraph.children) {
    if (c.is("r")) {
      out += runText(c, "t");
    } else if (c.is("ins")) {
      out += "[+" + wrapperText(c, "t") + "+]";
    } else if (c.is("del")) {
      out += "[-" + wrapperText(c, "delText") + "-]";
    } else if (Paragraphs::isInlineRunContainer(c)) {
      out += describe(c);
    }
  }
  return out;
}

string acceptAll(const Node& paragraph) {
  string out;
  for (const auto& c : paragraph.children) {
    if (c.is("r")) out += runText(c, "t");
    else if (c.is("ins")) out += wrapperText(c, "t");
    else if (Paragraphs::isInlineRunContainer(c)) out += acceptAll(c);
  }
  return out;
}

string rejectAll(const Node& paragraph) {
  string out;
  for (const auto& c : paragraph.children) {
    if (c.is("r")) out += runText(c, "t");
    else if (c.is("del")) out += wrapperText(c, "delText");
    else if (Paragraphs::isInlineRunContainer(c)) out += rejectAll(c);
  }
  return out;
}

static void collectIds(const Node& n, vector<int>& out) {
  for (const auto& c : n.children) {
    if (c.is("ins") || c.is("del")) {
      if (const string* id = c.attr("id")) out.push_back(stoi(*id));
    }
    collectIds(c, out);
  }
}

vector<int> revisionIds(const Node& root) {
  vector<int> out;
  collectIds(root, out);
  return out;
}

size_t countNamed(const Node& root, const string& localName) {
  size_t n = 0;
  for (const auto& c : root.children) {
    if (c.is(localName)) n++;
    n += countNamed(c, localName);
  }
  return n;
}
