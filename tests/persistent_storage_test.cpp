#include <filesystem>

#include <gtest/gtest.h>

#include "temp_storage.hpp"

namespace
{

typedef struct SampleRecord {
        int first;
        int second;
        bool flag;
} SampleRecord;

} // namespace

class PersistentStorageTest : public TempStorageTest
{
};

TEST_F(PersistentStorageTest, MissingFileReadsAsZero)
{
        PersistentStorage storage = make_storage();
        SampleRecord record = {.first = 7, .second = 8, .flag = true};

        EXPECT_FALSE(storage.get(0, record));
        EXPECT_EQ(record.first, 0);
        EXPECT_EQ(record.second, 0);
        EXPECT_FALSE(record.flag);
        EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(PersistentStorageTest, ReadsBackWhatWasWritten)
{
        PersistentStorage storage = make_storage();
        SampleRecord written = {.first = 42, .second = -3, .flag = true};
        ASSERT_TRUE(storage.put(16, written));

        SampleRecord read;
        ASSERT_TRUE(storage.get(16, read));
        EXPECT_EQ(read.first, 42);
        EXPECT_EQ(read.second, -3);
        EXPECT_TRUE(read.flag);
}

TEST_F(PersistentStorageTest, WritingPastEndPadsWithZeros)
{
        PersistentStorage storage = make_storage();
        ASSERT_TRUE(storage.put(100, 5));

        EXPECT_EQ(std::filesystem::file_size(path), 100 + sizeof(int));

        int padding = -1;
        EXPECT_TRUE(storage.get(40, padding));
        EXPECT_EQ(padding, 0);
}

TEST_F(PersistentStorageTest, ReadingPastEndFails)
{
        PersistentStorage storage = make_storage();
        ASSERT_TRUE(storage.put(0, 1));

        SampleRecord record;
        EXPECT_FALSE(storage.get(0, record));
        EXPECT_EQ(record.first, 0);
}

TEST_F(PersistentStorageTest, RegionsDoNotOverlap)
{
        PersistentStorage storage = make_storage();
        ASSERT_TRUE(storage.put(0, 11));
        ASSERT_TRUE(storage.put(sizeof(int), 22));
        ASSERT_TRUE(storage.put(0, 33));

        int first = 0;
        int second = 0;
        ASSERT_TRUE(storage.get(0, first));
        ASSERT_TRUE(storage.get(sizeof(int), second));
        EXPECT_EQ(first, 33);
        EXPECT_EQ(second, 22);
}

TEST_F(PersistentStorageTest, SurvivesReopening)
{
        {
                PersistentStorage storage = make_storage();
                ASSERT_TRUE(storage.put(8, 1234));
        }
        PersistentStorage reopened = make_storage();
        int value = 0;
        ASSERT_TRUE(reopened.get(8, value));
        EXPECT_EQ(value, 1234);
}

TEST(PersistentStorageErrorTest, UnwritablePathFailsGracefully)
{
        PersistentStorage storage(
            "/nonexistent-tilebox-directory/storage.bin");
        EXPECT_FALSE(storage.put(0, 1));
        int value = 5;
        EXPECT_FALSE(storage.get(0, value));
        EXPECT_EQ(value, 0);
}
