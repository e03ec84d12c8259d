#include <gtest/gtest.h>
#include <rcs/core/id_generator.hpp>

#include <set>

namespace rcs::core::test {

TEST(IdGeneratorTest, Lengths) {
    EXPECT_EQ(IdGenerator::generate().size(), 16u);
    EXPECT_EQ(IdGenerator::generate(5).size(), 5u);
    EXPECT_EQ(IdGenerator::generateTransferId().size(), 32u);
    EXPECT_EQ(IdGenerator::generateTag().size(), 8u);
}

TEST(IdGeneratorTest, LowercaseHex) {
    std::string id = IdGenerator::generateTransferId();
    EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(IdGeneratorTest, CallIdCarriesHost) {
    std::string call_id = IdGenerator::generateCallId("ims.example.com");
    EXPECT_EQ(call_id.substr(call_id.size() - 16), "@ims.example.com");
    EXPECT_EQ(IdGenerator::generateCallId("").find('@'), std::string::npos);
}

TEST(IdGeneratorTest, Unique) {
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i) {
        ids.insert(IdGenerator::generateTransferId());
    }
    EXPECT_EQ(ids.size(), 1000u);
}

} // namespace rcs::core::test
