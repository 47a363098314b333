// StakeLedger - Reserve Tests
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#include <gtest/gtest.h>

#include <stakeledger/ledger/reserve.h>

namespace stakeledger {
namespace ledger {
namespace {

Address AdminAddress() {
    Byte bytes[] = {0xad};
    return Address(bytes, sizeof(bytes));
}

TEST(ReserveTest, StartsEmpty) {
    ReserveManager reserve(AdminAddress());
    EXPECT_TRUE(reserve.GetReserve().IsZero());
    EXPECT_TRUE(reserve.GetTotalDeposited().IsZero());
    EXPECT_TRUE(reserve.GetTotalPaidOut().IsZero());
    EXPECT_TRUE(reserve.CanCover(Amount()));
    EXPECT_FALSE(reserve.CanCover(Amount(1)));
}

TEST(ReserveTest, Administrator) {
    ReserveManager reserve(AdminAddress());
    EXPECT_EQ(reserve.GetAdministrator(), AdminAddress());
    EXPECT_TRUE(reserve.IsAdministrator(AdminAddress()));
    EXPECT_FALSE(reserve.IsAdministrator(Address()));
}

TEST(ReserveTest, CreditAndDebit) {
    ReserveManager reserve(AdminAddress());
    ASSERT_TRUE(reserve.Credit(Tokens(100)));
    ASSERT_TRUE(reserve.Debit(Tokens(30)));
    EXPECT_EQ(reserve.GetReserve(), Tokens(70));
    EXPECT_EQ(reserve.GetTotalDeposited(), Tokens(100));
    EXPECT_EQ(reserve.GetTotalPaidOut(), Tokens(30));
    EXPECT_TRUE(reserve.CanCover(Tokens(70)));
    EXPECT_FALSE(reserve.CanCover(Tokens(71)));
}

TEST(ReserveTest, DebitBeyondReserveRejected) {
    ReserveManager reserve(AdminAddress());
    ASSERT_TRUE(reserve.Credit(Tokens(10)));
    EXPECT_FALSE(reserve.Debit(Tokens(11)));
    EXPECT_EQ(reserve.GetReserve(), Tokens(10));
    EXPECT_TRUE(reserve.GetTotalPaidOut().IsZero());
}

TEST(ReserveTest, CreditOverflowRejected) {
    ReserveManager reserve(AdminAddress());
    ASSERT_TRUE(reserve.Credit(Amount::Max()));
    EXPECT_FALSE(reserve.Credit(Amount(1)));
    EXPECT_EQ(reserve.GetReserve(), Amount::Max());
}

TEST(ReserveTest, CopiesAreIndependent) {
    ReserveManager reserve(AdminAddress());
    ASSERT_TRUE(reserve.Credit(Tokens(5)));
    ReserveManager working = reserve;
    ASSERT_TRUE(working.Debit(Tokens(5)));
    EXPECT_EQ(reserve.GetReserve(), Tokens(5));
    EXPECT_TRUE(working.GetReserve().IsZero());
}

TEST(ReserveTest, Restore) {
    ReserveManager reserve(AdminAddress());
    reserve.Restore(Tokens(7), Tokens(10), Tokens(3));
    EXPECT_EQ(reserve.GetReserve(), Tokens(7));
    EXPECT_EQ(reserve.GetTotalDeposited(), Tokens(10));
    EXPECT_EQ(reserve.GetTotalPaidOut(), Tokens(3));
}

} // namespace
} // namespace ledger
} // namespace stakeledger
