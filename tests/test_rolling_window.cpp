#include "FpsMeter.hpp"
#include "RollingWindow.hpp"
#include <gtest/gtest.h>

TEST(RollingWindow, EvictsOldestWhenFull)
{
    RollingWindow<double> w(3);
    EXPECT_TRUE(w.empty());
    EXPECT_EQ(w.mean(), 0.0);

    w.push(1); w.push(2); w.push(3);
    EXPECT_TRUE(w.full());
    EXPECT_DOUBLE_EQ(w.mean(), 2.0);

    w.push(10);
    EXPECT_EQ(w.size(), 3u);
    EXPECT_DOUBLE_EQ(w.oldest(), 2.0);
    EXPECT_DOUBLE_EQ(w.newest(), 10.0);
    EXPECT_DOUBLE_EQ(w.sum(), 15.0);
    EXPECT_DOUBLE_EQ(w[1], 3.0);
}

TEST(RollingWindow, ClearAndZeroCapacity)
{
    RollingWindow<int> w(2);
    w.push(4);
    w.clear();
    EXPECT_TRUE(w.empty());
    EXPECT_EQ(w.capacity(), 2u);

    EXPECT_THROW(RollingWindow<int>(0), std::invalid_argument);
}

TEST(FpsMeter, AveragesRecentFrameTimes)
{
    FpsMeter m(4);
    EXPECT_EQ(m.fps(), 0.0);

    m.add(0.1);
    m.add(0.1);
    EXPECT_NEAR(m.fps(), 10.0, 1e-9);

    // older frame times drop out of the window
    for (int i = 0; i < 4; ++i) m.add(0.05);
    EXPECT_NEAR(m.fps(), 20.0, 1e-9);
}
