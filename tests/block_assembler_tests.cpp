#include <gtest/gtest.h>

#include <drawio_model/errors.hpp>
#include <drawio_model/vocabulary.hpp>
#include <owl_blocks/block_assembler.hpp>

using drawio_model::Arrow;
using drawio_model::Individual;
using owl_blocks::BlockAssembler;
using owl_blocks::SanitiserConfig;

namespace {

const drawio_model::Vocabulary& ric() {
    return drawio_model::RicVocabulary::instance();
}

} // namespace

TEST(BlockAssemblerTests, JaneDoeAndOslo)
{
    const auto blocks = owl_blocks::individual_blocks(
        { Individual{ "Jane Doe", "Person" }, Individual{ "Oslo", "Place" } },
        { Arrow{ "hasBirthPlace", "Jane Doe", "Oslo" } }, ric(), SanitiserConfig{});

    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].identifier, "JaneDoe");
    EXPECT_EQ(blocks[0].label, "Jane Doe");
    EXPECT_EQ(blocks[0].types, (std::set<std::string>{ "Person" }));
    ASSERT_EQ(blocks[0].facts.count("hasBirthPlace"), 1u);
    EXPECT_EQ(blocks[0].facts.at("hasBirthPlace"), (std::set<std::string>{ "Oslo" }));
    EXPECT_EQ(blocks[1].identifier, "Oslo");
    EXPECT_TRUE(blocks[1].facts.empty());
}

TEST(BlockAssemblerTests, ClassesOfOneIndividualAreMerged)
{
    BlockAssembler assembler(ric(), SanitiserConfig{});
    assembler.add(Individual{ "Jane Doe", "Person" });
    assembler.add(Individual{ "Jane Doe", "Agent" });
    assembler.add(Individual{ "jane doe", "Person" });

    ASSERT_EQ(assembler.blocks().size(), 1u);
    EXPECT_EQ(assembler.blocks()[0].types, (std::set<std::string>{ "Agent", "Person" }));
    EXPECT_EQ(assembler.blocks()[0].label, "Jane Doe");
}

TEST(BlockAssemblerTests, DatatypeTargetsStayRaw)
{
    BlockAssembler assembler(ric(), SanitiserConfig{});
    assembler.add(Individual{ "Jane Doe", "Person" });
    assembler.add(Arrow{ "birthDate", "Jane Doe", "1 January 1970" });
    assembler.add(Arrow{ "hasOrHadName", "Jane Doe", "jane name" });

    const auto& facts = assembler.blocks()[0].facts;
    EXPECT_EQ(facts.at("birthDate"), (std::set<std::string>{ "1 January 1970" }));
    EXPECT_EQ(facts.at("hasOrHadName"), (std::set<std::string>{ "JaneName" }));
}

TEST(BlockAssemblerTests, DuplicateValuesAreMerged)
{
    BlockAssembler assembler(ric(), SanitiserConfig{});
    assembler.add(Arrow{ "hasBirthPlace", "Jane Doe", "Oslo" });
    assembler.add(Arrow{ "hasBirthPlace", "Jane Doe", "oslo" });
    assembler.add(Arrow{ "hasBirthPlace", "Jane Doe", "Bergen" });

    ASSERT_EQ(assembler.blocks().size(), 1u);
    EXPECT_TRUE(assembler.blocks()[0].types.empty());
    EXPECT_EQ(assembler.blocks()[0].facts.at("hasBirthPlace"), (std::set<std::string>{ "Bergen", "Oslo" }));
}

TEST(BlockAssemblerTests, BlocksKeepInsertionOrder)
{
    BlockAssembler assembler(ric(), SanitiserConfig{});
    assembler.add(Individual{ "Oslo", "Place" });
    assembler.add(Individual{ "Jane Doe", "Person" });
    assembler.add(Individual{ "Bergen", "Place" });

    const auto blocks = assembler.take_blocks();
    ASSERT_EQ(blocks.size(), 3u);
    EXPECT_EQ(blocks[0].identifier, "Oslo");
    EXPECT_EQ(blocks[1].identifier, "JaneDoe");
    EXPECT_EQ(blocks[2].identifier, "Bergen");
    EXPECT_TRUE(assembler.blocks().empty());
}

TEST(BlockAssemblerTests, UnknownRelationIsVocabularyError)
{
    BlockAssembler assembler(ric(), SanitiserConfig{});
    try {
        assembler.add(Arrow{ "wasBornIn", "Jane Doe", "Oslo" });
        FAIL() << "expected a VocabularyError";
    } catch (const drawio_model::VocabularyError& ex) {
        EXPECT_NE(std::string(ex.what()).find("rico:'wasBornIn'"), std::string::npos);
    }
    EXPECT_TRUE(assembler.blocks().empty());
}

TEST(BlockAssemblerTests, UnknownClassIsVocabularyError)
{
    BlockAssembler assembler(ric(), SanitiserConfig{});
    EXPECT_THROW(assembler.add(Individual{ "Jane Doe", "Human" }), drawio_model::VocabularyError);
}

TEST(BlockAssemblerTests, CustomVocabulary)
{
    const drawio_model::SetVocabulary vocabulary({ "Cat" }, { "chases" }, { "age" });
    BlockAssembler assembler(vocabulary, SanitiserConfig{});
    assembler.add(Individual{ "Tom", "Cat" });
    assembler.add(Arrow{ "chases", "Tom", "Jerry" });
    assembler.add(Arrow{ "age", "Tom", "3" });

    EXPECT_EQ(assembler.blocks()[0].facts.size(), 2u);
    EXPECT_THROW(assembler.add(Individual{ "Tom", "Person" }), drawio_model::VocabularyError);
}

TEST(BlockAssemblerTests, PropertiesOfEitherKind)
{
    const drawio_model::SetVocabulary vocabulary({ "Cat" }, { "chases" }, { "age" });
    EXPECT_TRUE(vocabulary.is_property("chases"));
    EXPECT_TRUE(vocabulary.is_property("age"));
    EXPECT_FALSE(vocabulary.is_property("Cat"));

    BlockAssembler assembler(vocabulary, SanitiserConfig{});
    EXPECT_THROW(assembler.add(Arrow{ "Cat", "Tom", "Jerry" }), drawio_model::VocabularyError);
}

TEST(BlockAssemblerTests, UnsanitisableSourceIsSanitisationError)
{
    BlockAssembler assembler(ric(), SanitiserConfig{});
    EXPECT_THROW(assembler.add(Individual{ "Doe (Jane)", "Person" }), drawio_model::SanitisationError);
}
