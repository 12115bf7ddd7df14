#include "Namespaces.h"

#include <utility>

namespace Ns {

const char* conventionalPrefix(std::string_view uri) {
  static const std::pair<std::string_view, const char*> table[] = {
      {W, "w"},
      {R, "r"},
      {MC, "mc"},
      {CONTENT_TYPES, ""},
      {PACKAGE_RELATIONSHIPS, ""},
      {"http://schemas.openxmlformats.org/drawingml/2006/wordprocessingDrawing", "wp"},
      {"http://schemas.openxmlformats.org/drawingml/2006/main", "a"},
      {"http://schemas.openxmlformats.org/drawingml/2006/picture", "pic"},
      {"http://schemas.openxmlformats.org/officeDocument/2006/math", "m"},
      {"http://schemas.microsoft.com/office/word/2010/wordml", "w14"},
      {"http://schemas.microsoft.com/office/word/2012/wordml", "w15"},
      {"http://schemas.microsoft.com/office/word/2010/wordprocessingShape", "wps"},
      {"http://schemas.microsoft.com/office/word/2010/wordprocessingGroup", "wpg"},
      {"http://schemas.microsoft.com/office/word/2010/wordprocessingDrawing", "wp14"},
      {"urn:schemas-microsoft-com:vml", "v"},
      {"urn:schemas-microsoft-com:office:office", "o"},
      {"urn:schemas-microsoft-com:office:word", "w10"},
  };
  for (const auto& [href, prefix] : table) {
    if (href == uri) return prefix;
  }
  return nullptr;
}

}  // namespace Ns
