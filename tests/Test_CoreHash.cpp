#include <gtest/gtest.h>
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_set>

import Core.Hash;

using namespace Core::Hash;

// -----------------------------------------------------------------------------
// Mix64
// -----------------------------------------------------------------------------

TEST(CoreHash, Mix64_ZeroIsFixedPoint)
{
    // fmix64 maps 0 to 0; Combine adds the golden-ratio constant first.
    EXPECT_EQ(Mix64(0), 0u);
}

TEST(CoreHash, Mix64_Avalanche)
{
    EXPECT_NE(Mix64(1), Mix64(2));
    EXPECT_NE(Mix64(1), 1u);
}

// -----------------------------------------------------------------------------
// Combine / HashValues
// -----------------------------------------------------------------------------

TEST(CoreHash, Combine_OrderDependent)
{
    const std::size_t ab = Combine(Combine(0, 1), 2);
    const std::size_t ba = Combine(Combine(0, 2), 1);
    EXPECT_NE(ab, ba);
}

TEST(CoreHash, HashValues_Deterministic)
{
    EXPECT_EQ(HashValues(1, 2, 3, 4), HashValues(1, 2, 3, 4));
    EXPECT_EQ(HashValues(1.5f, std::string("px")), HashValues(1.5f, std::string("px")));
}

TEST(CoreHash, HashValues_DistinguishesPermutations)
{
    EXPECT_NE(HashValues(1, 2, 3, 4), HashValues(4, 3, 2, 1));
    EXPECT_NE(HashValues(1, 2, 3, 4), HashValues(2, 1, 3, 4));
    EXPECT_NE(HashValues(0, 0, 0, 1), HashValues(1, 0, 0, 0));
}

TEST(CoreHash, HashValues_FewCollisions)
{
    std::unordered_set<std::size_t> seen;
    for (int top = 0; top < 16; ++top)
        for (int right = 0; right < 16; ++right)
            for (int bottom = 0; bottom < 16; ++bottom)
                seen.insert(HashValues(top, right, bottom, 0));

    EXPECT_EQ(seen.size(), 16u * 16u * 16u);
}
