// Unit tests for canon/canonical_order.hpp

#include <gtest/gtest.h>

#include <canon/canonical_order.hpp>
#include <canon/test_utils.hpp>

namespace canon::internal {
namespace {

class CanonicalOrderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    db_.SetCombiningClass(0x0301, 230);
    db_.SetCombiningClass(0x0308, 230);
    db_.SetCombiningClass(0x0316, 220);
    db_.SetCombiningClass(0x0323, 220);
    db_.SetCombiningClass(0x0345, 240);
    db_.SetCombiningClass(0x05B0, 10);
  }

  Sequence Reorder(Sequence s) {
    ReorderCanonical(db_, s.data(), s.size());
    return s;
  }

  testing::TableCharacterDatabase db_;
};

TEST_F(CanonicalOrderTest, EmptyAndSingle) {
  EXPECT_TRUE(Reorder({}).empty());
  EXPECT_EQ(Reorder({0x0301}), (Sequence{0x0301}));
}

TEST_F(CanonicalOrderTest, SortsMarksAfterStarter) {
  EXPECT_EQ(Reorder({0x0061, 0x0301, 0x0316}), (Sequence{0x0061, 0x0316, 0x0301}));
}

TEST_F(CanonicalOrderTest, StableForEqualClasses) {
  // 0x0301 and 0x0308 share class 230 and must keep their relative order.
  EXPECT_EQ(Reorder({0x0061, 0x0308, 0x0323, 0x0301}),
            (Sequence{0x0061, 0x0323, 0x0308, 0x0301}));
  EXPECT_EQ(Reorder({0x0061, 0x0301, 0x0323, 0x0308}),
            (Sequence{0x0061, 0x0323, 0x0301, 0x0308}));
}

TEST_F(CanonicalOrderTest, StartersAreBarriers) {
  EXPECT_EQ(Reorder({0x0301, 0x0061, 0x0316, 0x0062, 0x0345, 0x05B0}),
            (Sequence{0x0301, 0x0061, 0x0316, 0x0062, 0x05B0, 0x0345}));
}

TEST_F(CanonicalOrderTest, LeadingRunWithoutStarter) {
  EXPECT_EQ(Reorder({0x0345, 0x0301, 0x0316}), (Sequence{0x0316, 0x0301, 0x0345}));
}

TEST_F(CanonicalOrderTest, AlreadyOrderedIsUnchanged) {
  const Sequence in = {0x0061, 0x05B0, 0x0316, 0x0301, 0x0345, 0x0062};
  EXPECT_EQ(Reorder(in), in);
}

TEST_F(CanonicalOrderTest, Idempotent) {
  const Sequence once = Reorder({0x0061, 0x0345, 0x0301, 0x0316, 0x05B0});
  EXPECT_EQ(Reorder(once), once);
}

}  // namespace
}  // namespace canon::internal
