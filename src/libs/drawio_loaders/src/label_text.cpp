#include <drawio_loaders/label_text.hpp>
#include <cctype>
#include <cstdint>
#include <utility>
#include <vector>

namespace drawio_loaders {

namespace {

const char* const whitespace = " \t\r\n\f\v";

bool is_blank(std::string_view s) {
    return s.find_first_not_of(whitespace) == std::string_view::npos;
}

bool is_block_tag(const std::string& name) {
    return name == "div" || name == "p";
}

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// Decodes one reference ("amp", "#39", "#x27"). Returns false if unknown.
bool decode_reference(std::string_view name, std::string& out) {
    if (name == "amp") { out += '&'; return true; }
    if (name == "lt") { out += '<'; return true; }
    if (name == "gt") { out += '>'; return true; }
    if (name == "quot") { out += '"'; return true; }
    if (name == "apos") { out += '\''; return true; }
    if (name == "nbsp") { out += ' '; return true; }
    if (name.size() < 2 || name[0] != '#') return false;

    const bool hex = name[1] == 'x' || name[1] == 'X';
    const std::string_view digits = name.substr(hex ? 2 : 1);
    if (digits.empty() || digits.size() > 8) return false;
    std::uint32_t cp = 0;
    for (char c : digits) {
        const auto uc = static_cast<unsigned char>(c);
        if (hex && std::isxdigit(uc)) {
            cp = cp * 16 + static_cast<std::uint32_t>(std::isdigit(uc) ? c - '0' : (std::tolower(uc) - 'a' + 10));
        } else if (!hex && std::isdigit(uc)) {
            cp = cp * 10 + static_cast<std::uint32_t>(c - '0');
        } else {
            return false;
        }
    }
    if (cp == 0 || cp > 0x10FFFF) return false;
    if (cp == 0xA0) cp = ' ';
    append_utf8(out, cp);
    return true;
}

// Splits markup into lines following the block structure of the label.
class LineCollector {
public:
    void text(std::string_view raw) { current_ += decode_entities(raw); }

    void line_break() { end_line(); }

    void open_block() {
        if (!is_blank(current_)) end_line();
        current_.clear();
        open_blocks_.push_back(lines_.size());
    }

    void close_block() {
        if (!is_blank(current_)) {
            end_line();
        } else if (!open_blocks_.empty() && open_blocks_.back() == lines_.size()) {
            // <div></div>: an empty line of its own
            end_line();
        }
        current_.clear();
        if (!open_blocks_.empty()) open_blocks_.pop_back();
    }

    std::vector<std::string> finish() {
        if (!is_blank(current_)) end_line();
        return std::move(lines_);
    }

private:
    void end_line() {
        lines_.push_back(std::move(current_));
        current_.clear();
    }

    std::vector<std::string> lines_;
    std::string current_;
    std::vector<std::size_t> open_blocks_;
};

std::string tag_name(std::string_view tag, bool& closing) {
    std::size_t i = 0;
    closing = false;
    if (i < tag.size() && tag[i] == '/') {
        closing = true;
        ++i;
    }
    std::string name;
    for (; i < tag.size(); ++i) {
        const auto c = static_cast<unsigned char>(tag[i]);
        if (!std::isalnum(c)) break;
        name += static_cast<char>(std::tolower(c));
    }
    return name;
}

std::vector<std::string> collect_lines(std::string_view markup) {
    LineCollector lines;
    std::size_t pos = 0;
    while (pos < markup.size()) {
        const std::size_t lt = markup.find('<', pos);
        if (lt == std::string_view::npos) {
            lines.text(markup.substr(pos));
            break;
        }
        if (markup.compare(lt, 4, "<!--") == 0) {
            lines.text(markup.substr(pos, lt - pos));
            const std::size_t end = markup.find("-->", lt + 4);
            pos = end == std::string_view::npos ? markup.size() : end + 3;
            continue;
        }
        const std::size_t gt = markup.find('>', lt + 1);
        if (gt == std::string_view::npos) {
            // A lone '<' is text.
            lines.text(markup.substr(pos));
            break;
        }
        lines.text(markup.substr(pos, lt - pos));

        bool closing = false;
        const std::string name = tag_name(markup.substr(lt + 1, gt - lt - 1), closing);
        if (name == "br") {
            lines.line_break();
        } else if (is_block_tag(name)) {
            if (closing) lines.close_block();
            else lines.open_block();
        } else if (name.empty()) {
            lines.text(markup.substr(lt, gt - lt + 1));
        }
        pos = gt + 1;
    }
    return lines.finish();
}

} // namespace

std::string trim(std::string_view text) {
    const std::size_t first = text.find_first_not_of(whitespace);
    if (first == std::string_view::npos) return {};
    const std::size_t last = text.find_last_not_of(whitespace);
    return std::string(text.substr(first, last - first + 1));
}

std::string decode_entities(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        const std::size_t amp = text.find('&', pos);
        if (amp == std::string_view::npos) {
            out.append(text.substr(pos));
            break;
        }
        out.append(text.substr(pos, amp - pos));
        const std::size_t semi = text.find(';', amp + 1);
        if (semi == std::string_view::npos || semi - amp > 10
            || !decode_reference(text.substr(amp + 1, semi - amp - 1), out)) {
            out += '&';
            pos = amp + 1;
            continue;
        }
        pos = semi + 1;
    }
    return out;
}

std::string extract_label_text(std::string_view markup) {
    const std::vector<std::string> lines = collect_lines(markup);

    std::string out;
    std::size_t empty_run = 0;
    for (const auto& line : lines) {
        if (is_blank(line)) {
            ++empty_run;
            continue;
        }
        if (empty_run >= 2 && !out.empty()) out += paragraph_break;
        empty_run = 0;
        out += line;
    }
    return trim(out);
}

} // namespace drawio_loaders
