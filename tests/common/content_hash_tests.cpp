#include <gtest/gtest.h>
#include "stepdag/common/content_hash.hpp"

using namespace stepdag;

// =============================================================================
// MD5 content hashing
// =============================================================================

TEST(ContentHashTests, HashSourceCode_EmptyString)
{
    EXPECT_EQ(hash_source_code(""), "d41d8cd98f00b204e9800998ecf8427e");
}

TEST(ContentHashTests, HashSourceCode_KnownDigests)
{
    EXPECT_EQ(hash_source_code("abc"), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(hash_source_code("The quick brown fox jumps over the lazy dog"),
              "9e107d9d372bb6826bd81d3542a419d6");
}

TEST(ContentHashTests, Md5Hasher_IncrementalMatchesOneShot)
{
    Md5Hasher hasher;
    hasher.update("The quick brown ");
    hasher.update("fox jumps over the lazy dog");
    EXPECT_EQ(hasher.hexdigest(), hash_source_code("The quick brown fox jumps over the lazy dog"));
}

TEST(ContentHashTests, Md5Hasher_DigestIsLowercaseHex)
{
    std::string digest = hash_source_code("def step() -> int: return 1");
    ASSERT_EQ(digest.size(), 32u);
    for (char c : digest)
    {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << digest;
    }
}

TEST(ContentHashTests, Md5Hasher_UpdateAfterDigest_Throws)
{
    Md5Hasher hasher;
    hasher.update("abc");
    (void)hasher.hexdigest();
    EXPECT_THROW(hasher.update("more"), std::logic_error);
    EXPECT_THROW(hasher.hexdigest(), std::logic_error);
}
