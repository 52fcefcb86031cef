#include <gtest/gtest.h>

#include <drawio_model/errors.hpp>
#include <owl_blocks/identifier_sanitiser.hpp>

using owl_blocks::BlanketPolicy;
using owl_blocks::CapitalisationScheme;
using owl_blocks::IdentifierSanitiser;
using owl_blocks::SanitiserConfig;
using owl_blocks::parse_substitution_rules;

namespace {

IdentifierSanitiser with_rules(const std::vector<std::string>& rules,
    CapitalisationScheme scheme = CapitalisationScheme::UpperCamel)
{
    return IdentifierSanitiser(parse_substitution_rules(scheme, rules));
}

} // namespace

TEST(IdentifierSanitiserTests, UpperCamelByDefault)
{
    const IdentifierSanitiser sanitiser{ SanitiserConfig{} };
    EXPECT_EQ(sanitiser.sanitise("Jane Doe"), "JaneDoe");
    EXPECT_EQ(sanitiser.sanitise("jane  doe"), "JaneDoe");
    EXPECT_EQ(sanitiser.sanitise("oslo"), "Oslo");
    EXPECT_EQ(sanitiser.sanitise("1970 census"), "1970Census");
}

TEST(IdentifierSanitiserTests, CapitalisationSchemes)
{
    EXPECT_EQ(with_rules({}, CapitalisationScheme::LowerCamel).sanitise("Jane Doe"), "janeDoe");
    EXPECT_EQ(with_rules({}, CapitalisationScheme::Flat).sanitise("Jane Doe"), "janedoe");
    EXPECT_EQ(with_rules({ " =_" }, CapitalisationScheme::Flat).sanitise("Jane Doe"), "jane_doe");
    EXPECT_EQ(with_rules({}, CapitalisationScheme::None).sanitise("jane Doe"), "janeDoe");
    EXPECT_EQ(with_rules({ " =-" }, CapitalisationScheme::None).sanitise("jane Doe"), "jane-Doe");
}

TEST(IdentifierSanitiserTests, OnlyAsciiLettersChangeCase)
{
    EXPECT_EQ(with_rules({}).sanitise("\xC3\xA9mile zola"), "\xC3\xA9mileZola");
}

TEST(IdentifierSanitiserTests, UnconfiguredMetacharacterIsError)
{
    const IdentifierSanitiser sanitiser{ SanitiserConfig{} };
    try {
        sanitiser.sanitise("Doe (Jane)");
        FAIL() << "expected a SanitisationError";
    } catch (const drawio_model::SanitisationError& ex) {
        const std::string message = ex.what();
        EXPECT_NE(message.find("Doe (Jane)"), std::string::npos);
        EXPECT_NE(message.find("'('"), std::string::npos);
    }
}

TEST(IdentifierSanitiserTests, EveryMetacharacterIsSubstitutedOrRejected)
{
    const IdentifierSanitiser plain{ SanitiserConfig{} };
    const auto removing = with_rules({ "remove" });
    const auto escaping = with_rules({ "url" });

    for (const char c : owl_blocks::metacharacters) {
        const std::string label = std::string("a") + c + "b";
        EXPECT_THROW(plain.sanitise(label), drawio_model::SanitisationError) << label;

        EXPECT_EQ(removing.sanitise(label), "Ab") << label;

        const std::string escaped = escaping.sanitise(label);
        EXPECT_EQ(escaped.find(c), std::string::npos) << label;
        EXPECT_EQ(escaped.size(), 5u) << label;
        EXPECT_EQ(escaped[1], '%') << label;

        const auto explicit_rule = with_rules({ std::string(1, c) + "=_" });
        EXPECT_EQ(explicit_rule.sanitise(label), "A_b") << label;
    }
}

TEST(IdentifierSanitiserTests, UrlEscapeIsPercentEncoding)
{
    EXPECT_EQ(with_rules({ "url" }).sanitise("Doe (Jane)"), "Doe%20%28Jane%29");
    EXPECT_EQ(with_rules({ "url", " =" }).sanitise("Doe (Jane)"), "Doe%28Jane%29");
}

TEST(IdentifierSanitiserTests, RemoveDropsMetacharactersAndSpaces)
{
    EXPECT_EQ(with_rules({ "remove" }).sanitise("Doe, Jane (b. 1970)"), "DoeJaneB1970");
}

TEST(IdentifierSanitiserTests, ExplicitRulesOverrideBlanket)
{
    const auto sanitiser = with_rules({ "(=<", "remove", ")=>" });
    EXPECT_EQ(sanitiser.sanitise("Doe (Jane)."), "Doe<Jane>");
}

TEST(IdentifierSanitiserTests, EmptyReplacementRemovesTheCharacter)
{
    EXPECT_EQ(with_rules({ "'=" }).sanitise("O'Neill"), "ONeill");
}

TEST(IdentifierSanitiserTests, LaterRuleForSameCharacterWins)
{
    EXPECT_EQ(with_rules({ "/=-", "/=_" }).sanitise("a/b"), "A_b");
}

TEST(IdentifierSanitiserTests, SpaceSubstituteMayContainMetacharacters)
{
    EXPECT_EQ(with_rules({ " =." }).sanitise("jane doe"), "Jane.Doe");
}

TEST(IdentifierSanitiserTests, SpacesWithoutSubstituteIsError)
{
    SanitiserConfig config;
    config.space_substitute.reset();
    const IdentifierSanitiser sanitiser(config);
    EXPECT_EQ(sanitiser.sanitise("Oslo"), "Oslo");
    EXPECT_THROW(sanitiser.sanitise("Jane Doe"), drawio_model::SanitisationError);
}

TEST(IdentifierSanitiserTests, SanitisingIsPure)
{
    const auto sanitiser = with_rules({ "url" });
    EXPECT_EQ(sanitiser.sanitise("a (b)"), sanitiser.sanitise("a (b)"));
}

TEST(IdentifierSanitiserTests, MalformedRules)
{
    EXPECT_THROW(parse_substitution_rules(CapitalisationScheme::UpperCamel, { "remove", "url" }),
        drawio_model::ConfigurationError);
    EXPECT_THROW(parse_substitution_rules(CapitalisationScheme::UpperCamel, { "(" }),
        drawio_model::ConfigurationError);
    EXPECT_THROW(parse_substitution_rules(CapitalisationScheme::UpperCamel, { "a=b" }),
        drawio_model::ConfigurationError);
    EXPECT_THROW(parse_substitution_rules(CapitalisationScheme::UpperCamel, { "everything" }),
        drawio_model::ConfigurationError);
}

TEST(IdentifierSanitiserTests, ParsedRules)
{
    const SanitiserConfig config = parse_substitution_rules(CapitalisationScheme::Flat, { "(=[", " =_", "url" });
    EXPECT_EQ(config.scheme, CapitalisationScheme::Flat);
    EXPECT_EQ(config.blanket, BlanketPolicy::UrlEscape);
    ASSERT_TRUE(config.space_substitute.has_value());
    EXPECT_EQ(*config.space_substitute, "_");
    EXPECT_EQ(config.substitutions.at('('), "[");
}

TEST(IdentifierSanitiserTests, SchemeNames)
{
    EXPECT_EQ(owl_blocks::capitalisation_scheme_from_string("lower-camel"), CapitalisationScheme::LowerCamel);
    EXPECT_FALSE(owl_blocks::capitalisation_scheme_from_string("camel").has_value());
    EXPECT_STREQ(owl_blocks::to_string(CapitalisationScheme::Flat), "flat");
}
