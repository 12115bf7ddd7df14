#pragma once

namespace PartNames {

inline constexpr const char* CONTENT_TYPES = "[Content_Types].xml";
inline constexpr const char* ROOT_RELS     = "_rels/.rels";
inline constexpr const char* DOCUMENT      = "word/document.xml";
inline constexpr const char* SETTINGS      = "word/settings.xml";

inline constexpr const char* DOCUMENT_CONTENT_TYPE =
    "application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml";
inline constexpr const char* SETTINGS_CONTENT_TYPE =
    "application/vnd.openxmlformats-officedocument.wordprocessingml.settings+xml";
inline constexpr const char* RELATIONSHIPS_CONTENT_TYPE =
    "application/vnd.openxmlformats-package.relationships+xml";
inline constexpr const char* OFFICE_DOCUMENT_REL_TYPE =
    "http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument";

}  // namespace PartNames
