////////////////////////////////////////////////////////////////////////////////
//
// tests/io_buffer_test.cpp
//
////////////////////////////////////////////////////////////////////////////////


#include <codec/io/buffer.hpp>

#include <algorithm>
#include <array>
#include <numeric>
#include <string_view>
#include <utility>

#include <gtest/gtest.h>


using namespace ::codec;
using namespace ::std::literals;


TEST(io_buffer, resize)
{
    io::buffer buf;
    ASSERT_EQ(buf.size(), 0);
    ASSERT_EQ(buf.capacity(), 0);
    ASSERT_TRUE(buf.empty());

    buf.resize(128);
    ASSERT_EQ(buf.size(), 128);
    ASSERT_EQ(buf.capacity(), 128);
    ASSERT_FALSE(buf.empty());

    std::array<uint8, 128> tmp{};
    ASSERT_TRUE(std::equal(buf.begin(), buf.end(), tmp.begin()));

    std::iota(buf.begin(), buf.end(), uint8{0});
    std::iota(tmp.begin(), tmp.end(), uint8{0});
    ASSERT_TRUE(std::equal(buf.begin(), buf.end(), tmp.begin()));

    buf.resize(64, uninitialized);
    ASSERT_EQ(buf.size(), 64);
    ASSERT_EQ(buf.capacity(), 128);
    ASSERT_TRUE(std::equal(buf.begin(), buf.end(), tmp.begin()));

    buf.resize(128, uninitialized);
    ASSERT_EQ(buf.size(), 128);
    ASSERT_EQ(buf.capacity(), 128);
    ASSERT_TRUE(std::equal(buf.begin(), buf.end(), tmp.begin()));

    buf.resize(64);
    ASSERT_EQ(buf.size(), 64);
    ASSERT_EQ(buf.capacity(), 128);
    ASSERT_TRUE(std::equal(buf.begin(), buf.end(), tmp.begin()));

    buf.resize(128);
    ASSERT_EQ(buf.size(), 128);
    ASSERT_EQ(buf.capacity(), 128);
    ASSERT_FALSE(std::equal(buf.begin(), buf.end(), tmp.begin()));
}

TEST(io_buffer, reserve)
{
    io::buffer buf{"TWFu", 4};
    ASSERT_EQ(buf.capacity(), 4);

    buf.reserve(2);
    ASSERT_EQ(buf.capacity(), 4);

    buf.reserve(64);
    ASSERT_EQ(buf.size(), 4);
    ASSERT_EQ(buf.capacity(), 64);
    ASSERT_EQ(buf.str(), "TWFu"sv);

    auto const storage = buf.data();
    buf.resize(64, uninitialized);
    buf.clear();
    buf.resize(32, uninitialized);
    ASSERT_TRUE(buf.data() == storage);
    ASSERT_EQ(buf.capacity(), 64);
}

TEST(io_buffer, assign_and_compare)
{
    io::buffer x;
    x.assign("TWE=", 4);
    ASSERT_EQ(x.str(), "TWE="sv);

    io::buffer y{x};
    ASSERT_EQ(x, y);
    ASSERT_FALSE(x < y);

    y[3] = '+';
    ASSERT_NE(x, y);
    ASSERT_TRUE(y < x);
    ASSERT_GT(x.compare(y), 0);

    y.assign("TWE", 3);
    ASSERT_TRUE(y < x);
    ASSERT_LT(y.compare(x), 0);
}

TEST(io_buffer, move)
{
    io::buffer x{"TQ==", 4};
    auto const storage = x.data();

    io::buffer y{std::move(x)};
    ASSERT_TRUE(y.data() == storage);
    ASSERT_EQ(y.str(), "TQ=="sv);
    ASSERT_TRUE(x.empty());
    ASSERT_EQ(x.capacity(), 0);

    x = std::move(y);
    ASSERT_TRUE(x.data() == storage);
    ASSERT_TRUE(y.empty());

    swap(x, y);
    ASSERT_EQ(y.str(), "TQ=="sv);
    ASSERT_TRUE(x.str().empty());
}
