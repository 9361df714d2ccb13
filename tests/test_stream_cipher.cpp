#include <gtest/gtest.h>
#include "quantum/message_cipher.h"

using namespace qkdsim;
using namespace qkdsim::quantum;

TEST(StreamCipherTest, XorsBitwise) {
    auto out = transform({0, 0, 1, 1}, {0, 1, 0, 1});
    ASSERT_TRUE(out.ok());
    EXPECT_EQ(out.value(), (BitSequence{0, 1, 1, 0}));
}

TEST(StreamCipherTest, ApplyingTwiceRestoresInput) {
    BitSequence data = {0, 1, 0, 0, 1, 0, 0, 0, 0, 1, 0, 0, 1, 0, 0, 1};
    BitSequence key = {1, 0, 1, 1, 0, 1, 0, 1, 1, 0, 1, 0, 1, 1, 0, 1};

    auto once = transform(data, key);
    ASSERT_TRUE(once.ok());
    EXPECT_NE(once.value(), data);

    auto twice = transform(once.value(), key);
    ASSERT_TRUE(twice.ok());
    EXPECT_EQ(twice.value(), data);
}

TEST(StreamCipherTest, EmptyInputIsNoOp) {
    auto out = transform(BitSequence(), BitSequence());
    ASSERT_TRUE(out.ok());
    EXPECT_TRUE(out.value().empty());
}

TEST(StreamCipherTest, RejectsUnequalLengths) {
    auto out = transform({1, 0, 1}, {1, 0});
    ASSERT_TRUE(out.failed());
    EXPECT_EQ(out.error().code, ErrorCode::LENGTH_MISMATCH);

    auto empty = transform(BitSequence(), {1});
    ASSERT_TRUE(empty.failed());
    EXPECT_EQ(empty.error().code, ErrorCode::LENGTH_MISMATCH);
}
