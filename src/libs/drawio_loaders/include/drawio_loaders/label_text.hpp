#pragma once

#include <string>
#include <string_view>

namespace drawio_loaders {

// Separates paragraphs in extracted label text.
constexpr std::string_view paragraph_break = "\n";

// Plain text of an HTML label as draw.io stores it in a cell value.
//
// Each <div>/<p> block and each <br> delimits a line. Non-empty lines are
// concatenated as they are. A single empty line between two non-empty ones is
// a line break inside a paragraph and is dropped; a run of two or more empty
// lines is a paragraph break and becomes exactly one paragraph_break. Entities
// are decoded and the result is trimmed.
//
// Reentrant: all state is local to the call.
std::string extract_label_text(std::string_view markup);

// Decodes the HTML character references in text. &nbsp; becomes a plain space.
std::string decode_entities(std::string_view text);

std::string trim(std::string_view text);

} // namespace drawio_loaders
