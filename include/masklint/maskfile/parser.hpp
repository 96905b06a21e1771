#pragma once
#include <string>

#include "masklint/maskfile/maskfile.hpp"

namespace masklint::maskfile {

// Builds the command tree from maskfile markdown.
//
// Level 1 heading is the title; every deeper heading opens a command nested
// under the closest preceding heading of a lower level. The first fenced code
// block below a heading becomes that command's script. Throws
// SpecificationError on an unterminated code fence.
Maskfile parse_maskfile(const std::string& content);

// Reads and parses a maskfile from disk
Maskfile load_maskfile(const std::string& path);

// Strips markup and a trailing "(arg)" list from heading text
std::string command_name_from_heading(const std::string& heading_text);

}  // namespace masklint::maskfile
