// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Test suite for RecommendationPrinter
 */

#include <gtest/gtest.h>
#include "io/recommendation_printer.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace itemsim::io;
using itemsim::similarity::Recommendation;
using itemsim::similarity::RecommendationResult;

class RecommendationPrinterTest : public ::testing::Test {
protected:
    void SetUp() override {
        catalog_.add(50, "Star Wars (1977)");
        catalog_.add(172, "Empire Strikes Back, The (1980)");
        catalog_.add(181, "Return of the Jedi (1983)");
    }

    ItemCatalog catalog_;
};

TEST_F(RecommendationPrinterTest, DisplayName) {
    RecommendationPrinter printer(catalog_);
    EXPECT_EQ(printer.displayName(50), "Star Wars (1977)");
    EXPECT_EQ(printer.displayName(9999), "Item #9999");
}

TEST_F(RecommendationPrinterTest, PrintList) {
    RecommendationPrinter printer(catalog_);
    std::vector<Recommendation> list{{172, 0.9898, 345}};

    std::ostringstream out;
    printer.printList(out, list);

    std::string expected = std::string(80, '-') + "\n" +
                           "345 viewers also watched:\n"
                           "Empire Strikes Back, The (1980)\n"
                           "Similarity Score: 0.989800\n\n";
    EXPECT_EQ(out.str(), expected);
}

TEST_F(RecommendationPrinterTest, PrintBothViews) {
    RecommendationPrinter printer(catalog_);
    RecommendationResult result;
    result.byScore = {{172, 0.99, 345}, {181, 0.98, 480}};
    result.bySupport = {{181, 0.98, 480}, {172, 0.99, 345}};

    std::ostringstream out;
    printer.print(out, 50, result);
    auto text = out.str();

    auto scoreHeading = text.find(
        "Top 2 recommendations for Star Wars (1977) based on cosine "
        "similarity score of ratings:");
    auto rule = text.find(std::string(80, '='));
    auto supportHeading = text.find(
        "Top 2 recommendations for Star Wars (1977) based on the number of "
        "shared viewers:");

    ASSERT_NE(scoreHeading, std::string::npos);
    ASSERT_NE(rule, std::string::npos);
    ASSERT_NE(supportHeading, std::string::npos);
    EXPECT_LT(scoreHeading, rule);
    EXPECT_LT(rule, supportHeading);

    // Support view lists Return of the Jedi first
    auto jedi = text.find("480 viewers also watched:", supportHeading);
    auto empire = text.find("345 viewers also watched:", supportHeading);
    EXPECT_LT(jedi, empire);
}

TEST_F(RecommendationPrinterTest, EmptyViews) {
    RecommendationPrinter printer(catalog_);
    std::ostringstream out;
    printer.print(out, 9999, RecommendationResult{});
    auto text = out.str();

    EXPECT_NE(text.find("Top 0 recommendations for Item #9999"),
              std::string::npos);
    auto first = text.find("No items passed");
    ASSERT_NE(first, std::string::npos);
    EXPECT_NE(text.find("No items passed", first + 1), std::string::npos);
    EXPECT_EQ(text.find("viewers also watched"), std::string::npos);
}
