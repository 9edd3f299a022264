#include "ResultGenerator.hpp"

#include <gtest/gtest.h>

#include <set>

TEST(ResultGeneratorTest, ShapeMatchesConstruction) {
    ResultGenerator gen(3, 5, 6, 42u);
    Grid g = gen.generate();
    EXPECT_EQ(g.rows(), 3);
    EXPECT_EQ(g.cols(), 5);
}

TEST(ResultGeneratorTest, SymbolsStayInRange) {
    ResultGenerator gen(4, 7, 6, 7u);
    std::set<Symbol> seen;
    for (int i = 0; i < 200; ++i) {
        Grid g = gen.generate();
        for (int r = 0; r < g.rows(); ++r) {
            for (int c = 0; c < g.cols(); ++c) {
                ASSERT_GE(g.at(r, c), 0);
                ASSERT_LT(g.at(r, c), 6);
                seen.insert(g.at(r, c));
            }
        }
    }
    // 5600 uniform draws cover all six symbols
    EXPECT_EQ(seen.size(), 6u);
}

TEST(ResultGeneratorTest, SameSeedSameSequence) {
    ResultGenerator a(3, 5, 6, 1234u);
    ResultGenerator b(3, 5, 6, 1234u);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(a.generate(), b.generate());
    }
}

TEST(ResultGeneratorTest, SingleSymbolFillsTheGrid) {
    ResultGenerator gen(3, 5, 1, 99u);
    EXPECT_EQ(gen.generate(), Grid(3, 5, 0));
}
