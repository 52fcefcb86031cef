#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace owl_blocks {

// Characters that may not appear in an identifier unless a substitution for
// them is configured.
constexpr std::string_view metacharacters = "()[]/,:.'\"";

enum class CapitalisationScheme {
    UpperCamel, // "jane doe" -> "JaneDoe"
    LowerCamel, // "Jane Doe" -> "janeDoe"
    Flat,       // "Jane Doe" -> "janedoe" with an empty substitute
    None        // words untouched, only joined
};

// Applies to the metacharacters without an explicit substitution.
enum class BlanketPolicy {
    None,      // an unconfigured metacharacter is an error
    Remove,
    UrlEscape  // percent-encoding, e.g. '(' -> "%28"
};

struct SanitiserConfig {
    CapitalisationScheme scheme = CapitalisationScheme::UpperCamel;
    // Joins the words of a label containing spaces. nullopt: fall back on the
    // blanket policy, and fail if there is none.
    std::optional<std::string> space_substitute = std::string();
    BlanketPolicy blanket = BlanketPolicy::None;
    std::map<char, std::string> substitutions;
};

std::optional<CapitalisationScheme> capitalisation_scheme_from_string(std::string_view s);
const char* to_string(CapitalisationScheme scheme);

// Builds a configuration from rules of the form "c=replacement" (c a
// metacharacter or a space; the replacement may be empty), "remove" or "url".
// A later rule for a character replaces an earlier one; blanket rules and
// per-character rules do not interact otherwise.
// Throws ConfigurationError on a malformed rule.
SanitiserConfig parse_substitution_rules(CapitalisationScheme scheme, const std::vector<std::string>& rules);

// Turns labels into legal identifiers. Pure: the same label always gives the
// same identifier for a given configuration.
class IdentifierSanitiser {
public:
    explicit IdentifierSanitiser(SanitiserConfig config);

    // Throws SanitisationError if the label contains spaces or metacharacters
    // for which no substitution is configured.
    std::string sanitise(const std::string& label) const;

    const SanitiserConfig& config() const { return config_; }

private:
    std::string substitute_metacharacters(const std::string& identifier, const std::string& label) const;
    std::optional<std::string> substitution_for(char c) const;

    SanitiserConfig config_;
};

} // namespace owl_blocks
