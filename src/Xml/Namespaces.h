#pragma once

#include <string_view>

namespace Ns {

inline constexpr std::string_view W =
    "http://schemas.openxmlformats.org/wordprocessingml/2006/main";
inline constexpr std::string_view R =
    "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
inline constexpr std::string_view MC =
    "http://schemas.openxmlformats.org/markup-compatibility/2006";
inline constexpr std::string_view XML =
    "http://www.w3.org/XML/1998/namespace";
inline constexpr std::string_view CONTENT_TYPES =
    "http://schemas.openxmlformats.org/package/2006/content-types";
inline constexpr std::string_view PACKAGE_RELATIONSHIPS =
    "http://schemas.openxmlformats.org/package/2006/relationships";

// Preferred serialization prefix for a namespace URI. Empty string means the
// default namespace; nullptr means no convention (a generated prefix is used).
const char* conventionalPrefix(std::string_view uri);

}  // namespace Ns
