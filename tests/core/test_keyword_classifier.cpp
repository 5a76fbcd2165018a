#include "xmastree/core/keyword_classifier.hpp"
#include <gtest/gtest.h>

namespace xmastree {

TEST(KeywordClassifierTest, EveryOpenerIsRecognized)
{
    for (auto category : {primitive_types(), kernel_typedefs(), storage_classes(),
                          type_qualifiers()}) {
        for (auto token : category) {
            EXPECT_TRUE(is_declaration_opener(token)) << token;
            EXPECT_TRUE(is_declaration(std::string(token) + " x;")) << token;
        }
    }
}

TEST(KeywordClassifierTest, CategorySizes)
{
    EXPECT_EQ(primitive_types().size(), 16);
    EXPECT_EQ(kernel_typedefs().size(), 9);
    EXPECT_EQ(storage_classes().size(), 4);
    EXPECT_EQ(type_qualifiers().size(), 3);
}

TEST(KeywordClassifierTest, TypicalDeclarations)
{
    EXPECT_TRUE(is_declaration("int rc;"));
    EXPECT_TRUE(is_declaration("struct net_device *dev = priv->dev;"));
    EXPECT_TRUE(is_declaration("unsigned long flags;"));
    EXPECT_TRUE(is_declaration("const char *name = \"eth0\";"));
    EXPECT_TRUE(is_declaration("u32 reg;"));
    EXPECT_TRUE(is_declaration("static DEFINE_MUTEX(lock);"));
}

TEST(KeywordClassifierTest, NonDeclarations)
{
    EXPECT_FALSE(is_declaration(""));
    EXPECT_FALSE(is_declaration("return 0;"));
    EXPECT_FALSE(is_declaration("rc = foo();"));
    EXPECT_FALSE(is_declaration("if (int_value) {"));
    EXPECT_FALSE(is_declaration("integer x;"));
    EXPECT_FALSE(is_declaration("INT x;"));
    // Bare struct typedefs are the known blind spot
    EXPECT_FALSE(is_declaration("spinlock_t lock;"));
}

TEST(KeywordClassifierTest, TokenEndsAtFirstSpaceOnly)
{
    // A tab does not split the token, so this is not recognized
    EXPECT_FALSE(is_declaration("int\tx;"));
    EXPECT_FALSE(is_declaration("int*p;"));
    EXPECT_TRUE(is_declaration("int"));
}

TEST(KeywordClassifierTest, FirstToken)
{
    EXPECT_EQ(first_token("unsigned long flags;"), "unsigned");
    EXPECT_EQ(first_token("x"), "x");
    EXPECT_EQ(first_token(""), "");
    EXPECT_EQ(first_token(" leading"), "");
}

} // namespace xmastree
