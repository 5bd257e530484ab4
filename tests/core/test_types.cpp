// TIERSTAKE - Core Types Tests
// Copyright (c) 2024 TIERSTAKE Developers
// MIT License

#include <gtest/gtest.h>
#include "tierstake/core/serialize.h"
#include "tierstake/core/types.h"

#include <ios>
#include <map>
#include <stdexcept>

namespace tierstake {
namespace test {

// ============================================================================
// Basic Type Tests
// ============================================================================

TEST(ByteTest, SizeIsOneByte) {
    EXPECT_EQ(sizeof(Byte), 1u);
}

TEST(AmountTest, NativeWidth) {
    EXPECT_EQ(sizeof(Amount), 8u);
    EXPECT_EQ(MAX_AMOUNT, 18446744073709551615ULL);
    EXPECT_EQ(SECONDS_PER_DAY, 86400);
}

// ============================================================================
// Hash160 Tests
// ============================================================================

TEST(Hash160Test, DefaultConstructorCreatesZeroHash) {
    Hash160 h;
    EXPECT_TRUE(h.IsNull());
    EXPECT_EQ(h.size(), 20u);
}

TEST(Hash160Test, ConstructFromShortBufferPadsWithZeros) {
    const Byte bytes[] = {0xde, 0xad};
    Hash160 h(bytes, sizeof(bytes));
    EXPECT_FALSE(h.IsNull());
    EXPECT_EQ(h[0], 0xde);
    EXPECT_EQ(h[1], 0xad);
    EXPECT_EQ(h[19], 0);
}

TEST(Hash160Test, ToHexIsLowercaseInStorageOrder) {
    Address a = MakeAddress(0xAB);
    EXPECT_EQ(a.ToHex(), "00000000000000000000000000000000000000ab");
}

TEST(Hash160Test, FromHexAcceptsPrefixAndUppercase) {
    Address a = Hash160::FromHex("0x00000000000000000000000000000000000000AB");
    EXPECT_EQ(a, MakeAddress(0xab));

    Address b = Hash160::FromHex(a.ToHex());
    EXPECT_EQ(a, b);
}

TEST(Hash160Test, FromHexRejectsBadInput) {
    EXPECT_THROW(Hash160::FromHex(""), std::invalid_argument);
    EXPECT_THROW(Hash160::FromHex("abcd"), std::invalid_argument);
    EXPECT_THROW(Hash160::FromHex("zz000000000000000000000000000000000000ab"),
                 std::invalid_argument);
}

TEST(Hash160Test, OrderingUsableAsMapKey) {
    std::map<Address, int> m;
    m[MakeAddress(3)] = 3;
    m[MakeAddress(1)] = 1;
    m[MakeAddress(2)] = 2;

    ASSERT_EQ(m.size(), 3u);
    EXPECT_EQ(m.begin()->second, 1);
    EXPECT_TRUE(MakeAddress(1) < MakeAddress(2));
    EXPECT_NE(MakeAddress(1), MakeAddress(2));
}

TEST(Hash160Test, SetNull) {
    Address a = MakeAddress(9);
    a.SetNull();
    EXPECT_TRUE(a.IsNull());
}

// ============================================================================
// Serialization Tests
// ============================================================================

TEST(SerializeTest, IntegersAreLittleEndian) {
    DataStream ss;
    ss << uint32_t{0x01020304};
    ASSERT_EQ(ss.size(), 4u);
    EXPECT_EQ(ss.data()[0], 0x04);
    EXPECT_EQ(ss.data()[3], 0x01);
}

TEST(SerializeTest, MixedFields) {
    DataStream ss;
    Address addr = MakeAddress(42);
    ss << addr << uint64_t{1050} << int64_t{-604800} << true;
    EXPECT_EQ(ss.size(), 20u + 8u + 8u + 1u);

    DataStream in(ss.str());
    Address addrOut;
    uint64_t amount = 0;
    int64_t time = 0;
    bool flag = false;
    in >> addrOut >> amount >> time >> flag;

    EXPECT_EQ(addrOut, addr);
    EXPECT_EQ(amount, 1050u);
    EXPECT_EQ(time, -604800);
    EXPECT_TRUE(flag);
    EXPECT_TRUE(in.empty());
}

TEST(SerializeTest, ReadPastEndThrows) {
    DataStream ss(std::string("\x01\x02", 2));
    uint32_t value = 0;
    EXPECT_THROW(ss >> value, std::ios_base::failure);
}

} // namespace test
} // namespace tierstake
