#pragma once

#include <string>
#include <string_view>

namespace owl_serialise {

enum class LiteralType { Integer, Date, DateTime, String };

const char* to_string(LiteralType type);

// Tried in order: integer ("[0-9]+"), date ("YYYY-MM-DD", a real calendar
// day), date-time ("YYYY-MM-DDTHH:MM:SS", optional fraction of a second, then
// optionally "Z" or an offset "+HH:MM"/"-HH:MM"), and otherwise a plain string.
LiteralType infer_literal_type(std::string_view literal);

bool is_integer(std::string_view s);
bool is_date(std::string_view s);
bool is_date_time(std::string_view s);

// "Oslo" -> "\"Oslo\"", escaping backslashes and double quotes.
std::string quote_literal(std::string_view literal);

// Quoted literal with its xsd datatype, e.g. "\"1970-01-01\"^^xsd:date".
// Strings stay untyped.
std::string typed_literal(std::string_view literal);

} // namespace owl_serialise
