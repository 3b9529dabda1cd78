// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Test suite for MovieLensRatingSource
 */

#include <gtest/gtest.h>
#include "io/movielens_reader.hpp"
#include "similarity/exception.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace itemsim::io;
using itemsim::similarity::MalformedInputException;
using itemsim::similarity::Rating;

namespace fs = std::filesystem;

class MovieLensReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = fs::temp_directory_path() /
                ("itemsim_ratings_" +
                 std::string(::testing::UnitTest::GetInstance()
                                 ->current_test_info()
                                 ->name()) +
                 ".data");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    void writeFile(const std::string& content) {
        std::ofstream out(path_, std::ios::binary);
        out << content;
    }

    auto readAll(MovieLensRatingSource& source) -> std::vector<Rating> {
        std::vector<Rating> ratings;
        while (auto rating = source.next()) {
            ratings.push_back(*rating);
        }
        return ratings;
    }

    fs::path path_;
};

TEST_F(MovieLensReaderTest, ReadsTabSeparatedRatings) {
    writeFile("196\t242\t3\t881250949\n186\t302\t3\t891717742\n");
    auto source = MovieLensRatingSource::open(path_.string());
    ASSERT_TRUE(source.has_value()) << source.error();

    auto ratings = readAll(**source);
    std::vector<Rating> expected{{196, 242, 3}, {186, 302, 3}};
    EXPECT_EQ(ratings, expected);
    EXPECT_EQ((*source)->lineNumber(), 2);
}

TEST_F(MovieLensReaderTest, SkipsBlankLinesAndCarriageReturns) {
    writeFile("1\t10\t5\t0\r\n\r\n   \n2\t11\t4\t0\r\n");
    auto source = MovieLensRatingSource::open(path_.string());
    ASSERT_TRUE(source.has_value());

    auto ratings = readAll(**source);
    std::vector<Rating> expected{{1, 10, 5}, {2, 11, 4}};
    EXPECT_EQ(ratings, expected);
}

TEST_F(MovieLensReaderTest, CustomFormat) {
    writeFile("5,50,4\n6,60,2\n");
    RatingFileFormat format;
    format.delimiter = ',';
    auto source = MovieLensRatingSource::open(path_.string(), format);
    ASSERT_TRUE(source.has_value());

    auto ratings = readAll(**source);
    ASSERT_EQ(ratings.size(), 2);
    EXPECT_EQ(ratings[1], (Rating{6, 60, 2}));
}

TEST_F(MovieLensReaderTest, TooFewFieldsThrows) {
    writeFile("1\t10\t5\n2\t11\n");
    auto source = MovieLensRatingSource::open(path_.string());
    ASSERT_TRUE(source.has_value());

    EXPECT_TRUE((*source)->next().has_value());
    try {
        (void)(*source)->next();
        FAIL() << "expected MalformedInputException";
    } catch (const MalformedInputException& e) {
        EXPECT_NE(std::string(e.what()).find(":2:"), std::string::npos);
    }
}

TEST_F(MovieLensReaderTest, NonNumericFieldThrows) {
    writeFile("1\tten\t5\n");
    auto source = MovieLensRatingSource::open(path_.string());
    ASSERT_TRUE(source.has_value());
    EXPECT_THROW((void)(*source)->next(), MalformedInputException);
}

TEST_F(MovieLensReaderTest, MissingFileIsError) {
    auto source = MovieLensRatingSource::open(
        (fs::temp_directory_path() / "itemsim_does_not_exist.data").string());
    ASSERT_FALSE(source.has_value());
    EXPECT_NE(source.error().find("itemsim_does_not_exist"), std::string::npos);
}

TEST_F(MovieLensReaderTest, EmptyFile) {
    writeFile("");
    auto source = MovieLensRatingSource::open(path_.string());
    ASSERT_TRUE(source.has_value());
    EXPECT_FALSE((*source)->next().has_value());
}
