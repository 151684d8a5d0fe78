// ======================================================================
// \title  NativeFilestoreTest.cpp
// \author campuzan
// \brief  cpp file for NativeFilestore unit tests
// ======================================================================

#include <errno.h>

#include <gtest/gtest.h>

#include <Cfdpd/Filestore/NativeFilestore.hpp>
#include <Cfdpd/Filestore/test/ut/TempDirectory.hpp>

using namespace Cfdpd;

class NativeFilestoreTest : public ::testing::Test {
  protected:
    void SetUp() override { ASSERT_TRUE(this->m_dir.isValid()); }

    TempDirectory m_dir;
};

TEST_F(NativeFilestoreTest, MapPathStaysUnderRoot) {
    NativeFilestore filestore(this->m_dir.path() + "/");
    EXPECT_EQ(this->m_dir.path(), filestore.getRoot());

    std::string native;
    ASSERT_EQ(Filestore::OP_OK, filestore.mapPath("/a/./b//c.bin", native));
    EXPECT_EQ(this->m_dir.join("a/b/c.bin"), native);

    ASSERT_EQ(Filestore::OP_OK, filestore.mapPath("", native));
    EXPECT_EQ(this->m_dir.path(), native);

    EXPECT_EQ(Filestore::INVALID_PATH, filestore.mapPath("a/../../etc/passwd", native));
    EXPECT_EQ(Filestore::INVALID_PATH, filestore.mapPath("..", native));
}

TEST_F(NativeFilestoreTest, ReadExistingFile) {
    const std::vector<U8> contents = TempDirectory::pattern(300);
    ASSERT_TRUE(TempDirectory::writeFile(this->m_dir.join("src.bin"), contents));

    NativeFilestore filestore(this->m_dir.path());
    std::unique_ptr<Filestore::File> file;
    U64 size = 0;
    ASSERT_EQ(Filestore::OP_OK, filestore.openRead("/src.bin", file, size));
    ASSERT_NE(nullptr, file.get());
    EXPECT_EQ(300U, size);

    U8 buffer[64];
    FwSizeType got = sizeof(buffer);
    ASSERT_EQ(Filestore::OP_OK, file->readAt(100, buffer, got));
    ASSERT_EQ(sizeof(buffer), got);
    for (U32 i = 0; i < got; ++i) {
        EXPECT_EQ(contents[100 + i], buffer[i]);
    }

    // Short read at the end of the file
    got = sizeof(buffer);
    ASSERT_EQ(Filestore::OP_OK, file->readAt(280, buffer, got));
    EXPECT_EQ(20U, got);
}

TEST_F(NativeFilestoreTest, OpenReadFailures) {
    NativeFilestore filestore(this->m_dir.path());
    std::unique_ptr<Filestore::File> file;
    U64 size = 0;

    EXPECT_EQ(Filestore::DOESNT_EXIST, filestore.openRead("missing.bin", file, size));
    EXPECT_EQ(Filestore::INVALID_PATH, filestore.openRead("/", file, size));
    EXPECT_EQ(Filestore::INVALID_PATH, filestore.openRead("../outside", file, size));

    this->m_dir.makeDirectory("sub");
    EXPECT_EQ(Filestore::IS_DIRECTORY, filestore.openRead("sub", file, size));
    EXPECT_EQ(nullptr, file.get());
}

// Segments written out of order land at their offsets
TEST_F(NativeFilestoreTest, PositionedWritesCreateParents) {
    NativeFilestore filestore(this->m_dir.path());
    std::unique_ptr<Filestore::File> file;
    ASSERT_EQ(Filestore::OP_OK, filestore.createWrite("out/nested/dst.bin", file));

    const U8 tail[] = {5, 6, 7};
    const U8 head[] = {1, 2, 3, 4};
    ASSERT_EQ(Filestore::OP_OK, file->writeAt(4, tail, sizeof(tail)));
    ASSERT_EQ(Filestore::OP_OK, file->writeAt(0, head, sizeof(head)));
    ASSERT_EQ(Filestore::OP_OK, file->flush());

    U8 readBack[7] = {0};
    FwSizeType got = sizeof(readBack);
    ASSERT_EQ(Filestore::OP_OK, file->readAt(0, readBack, got));
    ASSERT_EQ(7U, got);
    file.reset();

    const std::vector<U8> onDisk = TempDirectory::readFile(this->m_dir.join("out/nested/dst.bin"));
    const std::vector<U8> expected = {1, 2, 3, 4, 5, 6, 7};
    EXPECT_EQ(expected, onDisk);
}

TEST_F(NativeFilestoreTest, CreateTruncatesExisting) {
    ASSERT_TRUE(TempDirectory::writeFile(this->m_dir.join("dst.bin"), TempDirectory::pattern(50)));

    NativeFilestore filestore(this->m_dir.path());
    std::unique_ptr<Filestore::File> file;
    ASSERT_EQ(Filestore::OP_OK, filestore.createWrite("dst.bin", file));
    file.reset();

    EXPECT_TRUE(TempDirectory::readFile(this->m_dir.join("dst.bin")).empty());
    EXPECT_EQ(Filestore::INVALID_PATH, filestore.createWrite("", file));
}

TEST_F(NativeFilestoreTest, EnumerateSorted) {
    ASSERT_TRUE(TempDirectory::writeFile(this->m_dir.join("b.txt"), TempDirectory::pattern(1)));
    ASSERT_TRUE(TempDirectory::writeFile(this->m_dir.join("a.txt"), TempDirectory::pattern(1)));
    this->m_dir.makeDirectory("c");

    NativeFilestore filestore(this->m_dir.path());
    std::vector<std::string> entries;
    ASSERT_EQ(Filestore::OP_OK, filestore.enumerate("/", entries));
    const std::vector<std::string> expected = {"a.txt", "b.txt", "c"};
    EXPECT_EQ(expected, entries);

    EXPECT_EQ(Filestore::DOESNT_EXIST, filestore.enumerate("nowhere", entries));
}

TEST_F(NativeFilestoreTest, ErrnoMapping) {
    EXPECT_EQ(Filestore::DOESNT_EXIST, NativeFilestore::errnoToStatus(ENOENT));
    EXPECT_EQ(Filestore::NO_SPACE, NativeFilestore::errnoToStatus(ENOSPC));
    EXPECT_EQ(Filestore::NO_PERMISSION, NativeFilestore::errnoToStatus(EACCES));
    EXPECT_EQ(Filestore::OTHER_ERROR, NativeFilestore::errnoToStatus(EIO));
    EXPECT_STREQ("INVALID_PATH", Filestore::statusName(Filestore::INVALID_PATH));
}
