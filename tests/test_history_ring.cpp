#include <gtest/gtest.h>
#include "audio/HistoryRing.hpp"
#include <vector>

TEST(HistoryRingTest, StartsZeroed) {
    HistoryRing<double> ring(4);
    EXPECT_EQ(ring.capacity(), 4u);
    EXPECT_EQ(ring.size(), 0u);
    for (size_t lag = 0; lag < 4; lag++)
        EXPECT_DOUBLE_EQ(ring.at(lag), 0.0);
}

TEST(HistoryRingTest, LagZeroIsNewest) {
    HistoryRing<double> ring(4);
    ring.push(1.0);
    ring.push(2.0);
    ring.push(3.0);

    EXPECT_DOUBLE_EQ(ring.at(0), 3.0);
    EXPECT_DOUBLE_EQ(ring.at(1), 2.0);
    EXPECT_DOUBLE_EQ(ring.at(2), 1.0);
    EXPECT_DOUBLE_EQ(ring.at(3), 0.0);  // never written
    EXPECT_EQ(ring.size(), 3u);
}

TEST(HistoryRingTest, OverwritesOldestWhenFull) {
    HistoryRing<double> ring(3);
    for (int i = 1; i <= 5; i++) ring.push(i);

    // Holds 5, 4, 3; 1 and 2 were overwritten
    EXPECT_DOUBLE_EQ(ring.at(0), 5.0);
    EXPECT_DOUBLE_EQ(ring.at(1), 4.0);
    EXPECT_DOUBLE_EQ(ring.at(2), 3.0);
    EXPECT_EQ(ring.size(), 3u);
    EXPECT_EQ(ring.writeIndex(), 2u);
}

TEST(HistoryRingTest, ForEachNewestMatchesAt) {
    HistoryRing<double> ring(5);
    for (int i = 1; i <= 7; i++) ring.push(i * 10.0);  // wraps

    std::vector<size_t> lags;
    std::vector<double> values;
    ring.forEachNewest([&](size_t lag, double v) {
        lags.push_back(lag);
        values.push_back(v);
    });

    ASSERT_EQ(values.size(), 5u);
    for (size_t i = 0; i < 5; i++) {
        EXPECT_EQ(lags[i], i);
        EXPECT_DOUBLE_EQ(values[i], ring.at(i));
    }
    EXPECT_DOUBLE_EQ(values.front(), 70.0);
    EXPECT_DOUBLE_EQ(values.back(), 30.0);
}

TEST(HistoryRingTest, ResetClearsEverything) {
    HistoryRing<float> ring(4);
    ring.push(1.0f);
    ring.push(2.0f);
    ring.reset();

    EXPECT_EQ(ring.size(), 0u);
    EXPECT_EQ(ring.writeIndex(), 0u);
    ring.forEachNewest([](size_t, float v) { EXPECT_FLOAT_EQ(v, 0.0f); });
}

TEST(HistoryRingTest, ZeroCapacityIsClampedToOne) {
    HistoryRing<double> ring(0);
    EXPECT_EQ(ring.capacity(), 1u);
    ring.push(4.0);
    ring.push(5.0);
    EXPECT_DOUBLE_EQ(ring.at(0), 5.0);
}
