#include <gtest/gtest.h>

#include <cerrno>
#include <string>
#include <system_error>

#include "csv2tsv/io_util.h"
#include "test_helpers.h"

// Test fixture for io_util tests
class IOUtilTest : public ::testing::Test {
protected:
    TempDir dir{"io_util_test"};
};

TEST_F(IOUtilTest, DashIsStdin) {
    EXPECT_TRUE(csv2tsv::is_stdin_input("-"));
    EXPECT_FALSE(csv2tsv::is_stdin_input("--"));
    EXPECT_FALSE(csv2tsv::is_stdin_input("data.csv"));
    EXPECT_FALSE(csv2tsv::is_stdin_input(""));
}

TEST_F(IOUtilTest, DisplayName) {
    EXPECT_EQ(csv2tsv::display_name("-"), "stdin");
    EXPECT_EQ(csv2tsv::display_name("dir/data.csv"), "dir/data.csv");
}

TEST_F(IOUtilTest, OpenForReadExistingFile) {
    std::string path = dir.createFile("in.csv", "abc");
    csv2tsv::FilePtr fp = csv2tsv::open_for_read(path);
    ASSERT_TRUE(fp);
    char buf[4] = {};
    EXPECT_EQ(std::fread(buf, 1, sizeof(buf), fp.get()), 3u);
    EXPECT_EQ(std::string(buf, 3), "abc");
}

TEST_F(IOUtilTest, OpenForReadMissingFile) {
    std::string path = dir.path() + "/missing.csv";
    try {
        csv2tsv::open_for_read(path);
        FAIL() << "Expected std::system_error";
    } catch (const std::system_error& e) {
        EXPECT_EQ(e.code().value(), ENOENT);
        EXPECT_EQ(std::string(e.what()).rfind("could not open " + path, 0), 0u);
    }
}

TEST_F(IOUtilTest, OpenForWriteTruncates) {
    dir.createFile("out.tsv", "old contents");
    {
        csv2tsv::FilePtr fp = csv2tsv::open_for_write(dir.path() + "/out.tsv");
        ASSERT_TRUE(fp);
        std::fputs("new", fp.get());
    }
    EXPECT_EQ(dir.readFile("out.tsv"), "new");
}

TEST_F(IOUtilTest, OpenForWriteInMissingDirectory) {
    EXPECT_THROW(csv2tsv::open_for_write(dir.path() + "/no/such/dir/out.tsv"), std::system_error);
}

TEST_F(IOUtilTest, ThrowIoErrorUsesErrno) {
    errno = EACCES;
    try {
        csv2tsv::throw_io_error("could not read from x");
    } catch (const std::system_error& e) {
        EXPECT_EQ(e.code().value(), EACCES);
        EXPECT_EQ(std::string(e.what()).rfind("could not read from x", 0), 0u);
    }
}

TEST_F(IOUtilTest, ThrowIoErrorDefaultsToEio) {
    errno = 0;
    try {
        csv2tsv::throw_io_error("could not write to y");
    } catch (const std::system_error& e) {
        EXPECT_EQ(e.code().value(), EIO);
    }
}
