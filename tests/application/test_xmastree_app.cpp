#include "xmastree/application/xmastree_app.hpp"
#include "xmastree/io/input_error.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <sstream>

namespace xmastree {

class MockFileSystem : public IFileSystem {
public:
    MOCK_METHOD(std::vector<std::string>, read_lines, (const std::string& path), (override));
};

class XmastreeAppTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        mock_filesystem_ = std::make_unique<MockFileSystem>();

        // Keep a raw pointer for expectations after ownership moves to the app
        filesystem_ptr_ = mock_filesystem_.get();
    }

    auto make_app() -> XmastreeApp { return XmastreeApp(std::move(mock_filesystem_)); }

    std::unique_ptr<MockFileSystem> mock_filesystem_;
    MockFileSystem* filesystem_ptr_;

    std::vector<std::string> bad_function_{"{", "\tint x;", "\tlong long y;", "}"};
    std::vector<std::string> good_function_{"{", "\tlong long y;", "\tint x;", "}"};
};

TEST_F(XmastreeAppTest, ReadsStdinWithoutPaths)
{
    EXPECT_CALL(*filesystem_ptr_, read_lines(testing::_)).Times(0);
    auto app = make_app();
    std::istringstream in("{\n\tint x;\n\tlong long y;\n}\n");
    std::ostringstream out;

    auto exit_code = app.run(Config{}, in, out);

    EXPECT_EQ(exit_code, 0);
    EXPECT_EQ(out.str(), "WARNING: Violation(s) in input\nLine 2\n\tint x;\n\tlong long y;\n");
}

TEST_F(XmastreeAppTest, CleanStdin)
{
    auto app = make_app();
    std::istringstream in("");
    std::ostringstream out;

    EXPECT_EQ(app.run(Config{}, in, out), 0);
    EXPECT_EQ(out.str(), "No problems found in input\n");
}

TEST_F(XmastreeAppTest, ReportsEachFileInOrderByBaseName)
{
    testing::InSequence sequence;
    EXPECT_CALL(*filesystem_ptr_, read_lines("drivers/net/efx.c"))
        .WillOnce(testing::Return(bad_function_));
    EXPECT_CALL(*filesystem_ptr_, read_lines("/tmp/clean.c"))
        .WillOnce(testing::Return(good_function_));
    auto app = make_app();
    std::istringstream in;
    std::ostringstream out;

    auto exit_code = app.run(Config{.input_paths = {"drivers/net/efx.c", "/tmp/clean.c"}}, in, out);

    EXPECT_EQ(exit_code, 0);
    EXPECT_EQ(out.str(),
              "WARNING: Violation(s) in efx.c\nLine 2\n\tint x;\n\tlong long y;\n"
              "No problems found in clean.c\n");
}

TEST_F(XmastreeAppTest, StateDoesNotCarryAcrossFiles)
{
    std::vector<std::string> truncated{"{", "\tint x;"};
    std::vector<std::string> continuation{"\tlong long y;", "}"};
    EXPECT_CALL(*filesystem_ptr_, read_lines("a.c")).WillOnce(testing::Return(truncated));
    EXPECT_CALL(*filesystem_ptr_, read_lines("b.c")).WillOnce(testing::Return(continuation));
    auto app = make_app();
    std::istringstream in;
    std::ostringstream out;

    app.run(Config{.input_paths = {"a.c", "b.c"}}, in, out);

    EXPECT_EQ(out.str(), "No problems found in a.c\nNo problems found in b.c\n");
}

TEST_F(XmastreeAppTest, UnreadableFileStopsRun)
{
    EXPECT_CALL(*filesystem_ptr_, read_lines("a.c")).WillOnce(testing::Return(good_function_));
    EXPECT_CALL(*filesystem_ptr_, read_lines("missing.c"))
        .WillOnce(testing::Throw(InputError("missing.c", "cannot open file")));
    EXPECT_CALL(*filesystem_ptr_, read_lines("c.c")).Times(0);
    auto app = make_app();
    std::istringstream in;
    std::ostringstream out;

    EXPECT_THROW(app.run(Config{.input_paths = {"a.c", "missing.c", "c.c"}}, in, out),
                 InputError);
    EXPECT_EQ(out.str(), "No problems found in a.c\n");
}

TEST_F(XmastreeAppTest, UndecodableStdinThrows)
{
    auto app = make_app();
    std::istringstream in("{\n\tint caf\xe9;\n}\n");
    std::ostringstream out;

    EXPECT_THROW(app.run(Config{}, in, out), InputError);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(XmastreeAppTest, DisplayName)
{
    EXPECT_EQ(display_name("drivers/net/sfc/efx.c"), "efx.c");
    EXPECT_EQ(display_name("efx.c"), "efx.c");
    EXPECT_EQ(display_name("/tmp/patches/0001-fix.patch"), "0001-fix.patch");
}

} // namespace xmastree
