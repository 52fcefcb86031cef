#include <owl_blocks/identifier_sanitiser.hpp>
#include <drawio_model/errors.hpp>
#include <algorithm>
#include <cctype>
#include <utility>

namespace owl_blocks {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_metacharacter(char c) {
    return metacharacters.find(c) != std::string_view::npos;
}

std::vector<std::string> split_words(const std::string& label) {
    std::vector<std::string> words;
    std::string word;
    for (char c : label) {
        if (is_space(c)) {
            if (!word.empty()) words.push_back(std::move(word));
            word.clear();
        } else {
            word += c;
        }
    }
    if (!word.empty()) words.push_back(std::move(word));
    return words;
}

std::string with_first_upper(std::string word) {
    if (!word.empty() && std::isalpha(static_cast<unsigned char>(word[0])))
        word[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(word[0])));
    return word;
}

std::string with_first_lower(std::string word) {
    if (!word.empty() && std::isalpha(static_cast<unsigned char>(word[0])))
        word[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(word[0])));
    return word;
}

std::string url_escape(char c) {
    static const char hex[] = "0123456789ABCDEF";
    const auto uc = static_cast<unsigned char>(c);
    return std::string{ '%', hex[uc >> 4], hex[uc & 0x0F] };
}

} // namespace

std::optional<CapitalisationScheme> capitalisation_scheme_from_string(std::string_view s) {
    if (s == "upper-camel") return CapitalisationScheme::UpperCamel;
    if (s == "lower-camel") return CapitalisationScheme::LowerCamel;
    if (s == "flat") return CapitalisationScheme::Flat;
    if (s == "none") return CapitalisationScheme::None;
    return std::nullopt;
}

const char* to_string(CapitalisationScheme scheme) {
    switch (scheme) {
    case CapitalisationScheme::UpperCamel: return "upper-camel";
    case CapitalisationScheme::LowerCamel: return "lower-camel";
    case CapitalisationScheme::Flat: return "flat";
    case CapitalisationScheme::None: return "none";
    }
    return "none";
}

SanitiserConfig parse_substitution_rules(CapitalisationScheme scheme, const std::vector<std::string>& rules) {
    SanitiserConfig config;
    config.scheme = scheme;
    bool explicit_space = false;
    std::optional<BlanketPolicy> blanket;

    for (const auto& rule : rules) {
        std::optional<BlanketPolicy> rule_blanket;
        if (rule == "remove") rule_blanket = BlanketPolicy::Remove;
        else if (rule == "url") rule_blanket = BlanketPolicy::UrlEscape;

        if (rule_blanket) {
            if (blanket && *blanket != *rule_blanket) {
                throw drawio_model::ConfigurationError(
                    "The substitution rules 'remove' and 'url' cannot be used together");
            }
            blanket = rule_blanket;
            continue;
        }
        if (rule.size() < 2 || rule[1] != '=') {
            throw drawio_model::ConfigurationError("Malformed substitution rule '" + rule
                + "': expecting 'remove', 'url', or a character followed by '=' and its replacement");
        }
        const char c = rule[0];
        std::string replacement = rule.substr(2);
        if (c == ' ') {
            config.space_substitute = std::move(replacement);
            explicit_space = true;
        } else if (is_metacharacter(c)) {
            config.substitutions[c] = std::move(replacement);
        } else {
            throw drawio_model::ConfigurationError("Malformed substitution rule '" + rule + "': '"
                + std::string(1, c) + "' is neither a space nor one of the characters "
                + std::string(metacharacters));
        }
    }

    if (blanket) {
        config.blanket = *blanket;
        if (!explicit_space) config.space_substitute.reset();
    }
    return config;
}

IdentifierSanitiser::IdentifierSanitiser(SanitiserConfig config)
    : config_(std::move(config)) {}

std::optional<std::string> IdentifierSanitiser::substitution_for(char c) const {
    if (const auto it = config_.substitutions.find(c); it != config_.substitutions.end())
        return it->second;
    switch (config_.blanket) {
    case BlanketPolicy::Remove: return std::string();
    case BlanketPolicy::UrlEscape: return url_escape(c);
    case BlanketPolicy::None: break;
    }
    return std::nullopt;
}

std::string IdentifierSanitiser::sanitise(const std::string& label) const {
    const bool has_space = std::any_of(label.begin(), label.end(), is_space);
    if (!has_space) {
        std::string identifier = substitute_metacharacters(label, label);
        switch (config_.scheme) {
        case CapitalisationScheme::UpperCamel: return with_first_upper(std::move(identifier));
        case CapitalisationScheme::LowerCamel:
        case CapitalisationScheme::Flat: return with_first_lower(std::move(identifier));
        case CapitalisationScheme::None: break;
        }
        return identifier;
    }

    std::optional<std::string> separator = config_.space_substitute;
    if (!separator) {
        if (config_.blanket == BlanketPolicy::Remove) separator = std::string();
        else if (config_.blanket == BlanketPolicy::UrlEscape) separator = url_escape(' ');
    }
    if (!separator) {
        throw drawio_model::SanitisationError("The label '" + label + "' contains spaces, but no "
            "substitution for spaces has been configured: use a rule such as ' =_', or 'remove'");
    }

    std::string out;
    const auto words = split_words(label);
    // The separator is inserted after substitution so that it may itself
    // contain metacharacters.
    for (std::size_t i = 0; i < words.size(); ++i) {
        if (i > 0) out += *separator;
        std::string word = substitute_metacharacters(words[i], label);
        switch (config_.scheme) {
        case CapitalisationScheme::UpperCamel:
            out += with_first_upper(std::move(word));
            break;
        case CapitalisationScheme::LowerCamel:
            out += i == 0 ? with_first_lower(std::move(word)) : with_first_upper(std::move(word));
            break;
        case CapitalisationScheme::Flat:
            out += with_first_lower(std::move(word));
            break;
        case CapitalisationScheme::None:
            out += word;
            break;
        }
    }
    return out;
}

std::string IdentifierSanitiser::substitute_metacharacters(const std::string& identifier,
    const std::string& label) const
{
    std::string out;
    out.reserve(identifier.size());
    for (char c : identifier) {
        if (!is_metacharacter(c)) {
            out += c;
            continue;
        }
        const auto replacement = substitution_for(c);
        if (!replacement) {
            throw drawio_model::SanitisationError("The label '" + label + "' contains the character '"
                + std::string(1, c) + "', for which no substitution has been configured: use a rule "
                "such as '" + std::string(1, c) + "=-', or 'remove' or 'url'");
        }
        out += *replacement;
    }
    return out;
}

} // namespace owl_blocks
