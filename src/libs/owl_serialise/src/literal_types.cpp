#include <owl_serialise/literal_types.hpp>
#include <regex>
#include <string>

namespace owl_serialise {

namespace {

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

bool is_valid_day(int year, int month, int day) {
    static const int days_in_month[] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
    if (month < 1 || month > 12 || day < 1) return false;
    if (month == 2 && is_leap_year(year)) return day <= 29;
    return day <= days_in_month[month - 1];
}

int to_int(const std::ssub_match& m) {
    return std::stoi(m.str());
}

} // namespace

const char* to_string(LiteralType type) {
    switch (type) {
    case LiteralType::Integer: return "xsd:integer";
    case LiteralType::Date: return "xsd:date";
    case LiteralType::DateTime: return "xsd:dateTime";
    case LiteralType::String: return "xsd:string";
    }
    return "xsd:string";
}

bool is_integer(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

bool is_date(std::string_view s) {
    static const std::regex pattern(R"(^(\d{4})-(\d{2})-(\d{2})$)");
    const std::string str(s);
    std::smatch m;
    if (!std::regex_match(str, m, pattern)) return false;
    return is_valid_day(to_int(m[1]), to_int(m[2]), to_int(m[3]));
}

bool is_date_time(std::string_view s) {
    static const std::regex pattern(
        R"(^(\d{4})-(\d{2})-(\d{2})T(\d{2}):(\d{2}):(\d{2})(\.\d+)?(Z|[+-](\d{2}):(\d{2}))?$)");
    const std::string str(s);
    std::smatch m;
    if (!std::regex_match(str, m, pattern)) return false;
    if (!is_valid_day(to_int(m[1]), to_int(m[2]), to_int(m[3]))) return false;
    if (to_int(m[4]) > 23 || to_int(m[5]) > 59 || to_int(m[6]) > 59) return false;
    if (m[9].matched && (to_int(m[9]) > 14 || to_int(m[10]) > 59)) return false;
    return true;
}

LiteralType infer_literal_type(std::string_view literal) {
    if (is_integer(literal)) return LiteralType::Integer;
    if (is_date(literal)) return LiteralType::Date;
    if (is_date_time(literal)) return LiteralType::DateTime;
    return LiteralType::String;
}

std::string quote_literal(std::string_view literal) {
    std::string out;
    out.reserve(literal.size() + 2);
    out += '"';
    for (char c : literal) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

std::string typed_literal(std::string_view literal) {
    const LiteralType type = infer_literal_type(literal);
    if (type == LiteralType::String) return quote_literal(literal);
    return quote_literal(literal) + "^^" + to_string(type);
}

} // namespace owl_serialise
