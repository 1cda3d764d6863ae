#include "storage/range_iterator.hpp"
#include <arrow/filesystem/localfs.h>
#include <gtest/gtest.h>
#include <filesystem>
#include "common/errors.hpp"
#include "storage/batch_file_reader.hpp"
#include "test_helpers.hpp"

using namespace batchfile;
using namespace batchfile::test;
namespace fs = std::filesystem;

class RangeIteratorTest : public ::testing::Test {
protected:
    fs::path tempDir_;
    FileMetadata metadata_;
    std::unique_ptr<BatchFileReader> reader_;

    void SetUp() override {
        tempDir_ = fs::temp_directory_path() / "batchfile_tests" / "range_iterator_test";
        fs::create_directories(tempDir_);

        BatchFileBuilder builder;
        builder.addSequenceBatches({3, 3, 4});
        builder.write(tempDir_ / "data.bf");
        metadata_ = builder.metadata("data.bf");
        reader_ = std::make_unique<BatchFileReader>(std::make_shared<arrow::fs::LocalFileSystem>(), tempDir_,
                                                    metadata_);
    }

    void TearDown() override {
        reader_.reset();
        if (fs::exists(tempDir_)) {
            fs::remove_all(tempDir_);
        }
    }
};

TEST_F(RangeIteratorTest, PagesThroughRange) {
    RangeIterator it{*reader_, 1, 9, 4};

    std::vector<int64_t> pageSizes;
    std::vector<int64_t> ids;
    while (it.hasMore()) {
        auto page = it.next();
        int64_t rows = 0;
        for (const auto& window : page)
            rows += window.size();
        pageSizes.push_back(rows);
        auto pageIds = collectIds(page);
        ids.insert(ids.end(), pageIds.begin(), pageIds.end());
    }

    EXPECT_EQ(pageSizes, (std::vector<int64_t>{4, 4, 1}));
    EXPECT_EQ(ids, idRange(1, 9));
    EXPECT_EQ(it.getPosition(), 10u);
    EXPECT_TRUE(it.next().empty());
    // all pages were served by one open file
    EXPECT_TRUE(reader_->isOpen());
}

TEST_F(RangeIteratorTest, ResetRestartsAtRangeStart) {
    RangeIterator it{*reader_, 2, 5, 2};
    it.next();
    it.next();
    EXPECT_EQ(it.getPosition(), 6u);

    it.reset();

    EXPECT_TRUE(it.hasMore());
    EXPECT_EQ(collectIds(it.next()), idRange(2, 2));
}

TEST_F(RangeIteratorTest, EmptyRangeYieldsOneEmptyPage) {
    RangeIterator it{*reader_, 5, 0, 16};

    ASSERT_TRUE(it.hasMore());
    auto page = it.next();
    ASSERT_EQ(page.size(), 1u);
    EXPECT_EQ(page[0].size(), 0);
    EXPECT_FALSE(it.hasMore());
}

TEST_F(RangeIteratorTest, RejectsZeroPageSize) {
    EXPECT_THROW((RangeIterator{*reader_, 0, 5, 0}), InvalidArgumentException);
}

TEST_F(RangeIteratorTest, InvalidRangeSurfacesFromReader) {
    RangeIterator it{*reader_, 8, 5, 4};

    EXPECT_THROW(it.next(), InvalidArgumentException);
}
