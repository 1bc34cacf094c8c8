// Unit tests for canon/composer.hpp
// Tests: starter tracking, blocking, exclusions, Hangul (via ICU data)

#include <gtest/gtest.h>

#include <canon/character_database.hpp>
#include <canon/composer.hpp>
#include <canon/test_utils.hpp>

#include <memory>

namespace canon::internal {
namespace {

Sequence Compose(const CharacterDatabase& db, Sequence s) {
  s.resize(ComposeCanonical(db, s.data(), s.size()));
  return s;
}

// =============================================================================
// Table-driven Composition Tests
// =============================================================================

class ComposerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    db_.SetCombiningClass(0x0301, 230);
    db_.SetCombiningClass(0x0302, 230);
    db_.SetCombiningClass(0x0323, 220);
    db_.SetComposite(0x0041, 0x0301, 0x00C1);
    db_.SetComposite(0x0041, 0x0302, 0x00C2);
    db_.SetComposite(0x0041, 0x0323, 0x1EA0);
    db_.SetComposite(0x1EA0, 0x0302, 0x1EAC);
    db_.SetComposite(0x0042, 0x0043, 0x0044);  // Starter + starter
  }

  testing::TableCharacterDatabase db_;
};

TEST_F(ComposerTest, EmptyInput) {
  EXPECT_TRUE(Compose(db_, {}).empty());
}

TEST_F(ComposerTest, AdjacentPair) {
  EXPECT_EQ(Compose(db_, {0x0041, 0x0301}), (Sequence{0x00C1}));
}

TEST_F(ComposerTest, ChainsThroughNewComposite) {
  EXPECT_EQ(Compose(db_, {0x0041, 0x0323, 0x0302}), (Sequence{0x1EAC}));
}

TEST_F(ComposerTest, SameClassMarkIsBlocked) {
  // 0x0308 has no composite with A and blocks the 230 mark behind it.
  db_.SetCombiningClass(0x0308, 230);
  EXPECT_EQ(Compose(db_, {0x0041, 0x0308, 0x0301}), (Sequence{0x0041, 0x0308, 0x0301}));
}

TEST_F(ComposerTest, MarkWithoutCompositeOnNewBaseStays) {
  EXPECT_EQ(Compose(db_, {0x0041, 0x0301, 0x0302}), (Sequence{0x00C1, 0x0302}));
}

TEST_F(ComposerTest, LowerClassMarkDoesNotBlock) {
  db_.SetCombiningClass(0x0316, 220);
  EXPECT_EQ(Compose(db_, {0x0041, 0x0316, 0x0301}), (Sequence{0x00C1, 0x0316}));
}

TEST_F(ComposerTest, StarterPairsComposeOnlyWhenAdjacent) {
  EXPECT_EQ(Compose(db_, {0x0042, 0x0043}), (Sequence{0x0044}));
  db_.SetCombiningClass(0x0316, 220);
  EXPECT_EQ(Compose(db_, {0x0042, 0x0316, 0x0043}), (Sequence{0x0042, 0x0316, 0x0043}));
}

TEST_F(ComposerTest, ExcludedCompositeIsNotFormed) {
  db_.SetExclusion(0x00C1);
  EXPECT_EQ(Compose(db_, {0x0041, 0x0301}), (Sequence{0x0041, 0x0301}));
}

TEST_F(ComposerTest, ExcludedStarterDoesNotCompose) {
  db_.SetExclusion(0x0041);
  EXPECT_EQ(Compose(db_, {0x0041, 0x0301}), (Sequence{0x0041, 0x0301}));
}

TEST_F(ComposerTest, ExcludedMarkDoesNotCompose) {
  db_.SetExclusion(0x0301);
  EXPECT_EQ(Compose(db_, {0x0041, 0x0301}), (Sequence{0x0041, 0x0301}));
  EXPECT_EQ(Compose(db_, {0x0041, 0x0302}), (Sequence{0x00C2}));
}

TEST_F(ComposerTest, LeadingMarksWithoutStarterPassThrough) {
  EXPECT_EQ(Compose(db_, {0x0301, 0x0041, 0x0301}), (Sequence{0x0301, 0x00C1}));
}

TEST_F(ComposerTest, NewStarterResetsContext) {
  EXPECT_EQ(Compose(db_, {0x0041, 0x0062, 0x0301}), (Sequence{0x0041, 0x0062, 0x0301}));
}

// =============================================================================
// ICU Data Composition Tests
// =============================================================================

class IcuComposerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto s = CharacterDatabase::OpenIcu(&db_);
    ASSERT_TRUE(s.ok()) << s.ToString();
  }

  std::unique_ptr<CharacterDatabase> db_;
};

TEST_F(IcuComposerTest, HangulSyllables) {
  EXPECT_EQ(Compose(*db_, {0x1100, 0x1161}), (Sequence{0xAC00}));
  EXPECT_EQ(Compose(*db_, {0x1100, 0x1161, 0x11A8}), (Sequence{0xAC01}));
}

TEST_F(IcuComposerTest, ExclusionStaysDecomposed) {
  EXPECT_EQ(Compose(*db_, {0x0915, 0x093C}), (Sequence{0x0915, 0x093C}));
}

TEST_F(IcuComposerTest, RepeatedMarkKeepsSecondCopy) {
  EXPECT_EQ(Compose(*db_, {0x0041, 0x0301, 0x0301}), (Sequence{0x00C1, 0x0301}));
}

}  // namespace
}  // namespace canon::internal
