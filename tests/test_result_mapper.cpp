#include <gtest/gtest.h>
#include "data/result_mapper.hpp"
#include "fake_connection.hpp"
#include <functional>

using namespace sqlgraph::data;
using namespace sqlgraph::test;

namespace {

struct Account {
    int64_t account_id = 0;
    std::string owner_name;
    std::optional<double> balance;
    bool active = false;
};

// Only used by the collision tests, so their cache entries stay apart
struct Pair {
    int32_t a = 0;
    int32_t b = 0;
};

} // anonymous namespace

template<>
struct sqlgraph::data::RecordTraits<Account> {
    static auto fields() {
        return std::make_tuple(field("account_id", &Account::account_id),
                               field("owner_name", &Account::owner_name),
                               field("balance", &Account::balance),
                               field("active", &Account::active));
    }
};

template<>
struct sqlgraph::data::RecordTraits<Pair> {
    static auto fields() {
        return std::make_tuple(field("a", &Pair::a), field("b", &Pair::b));
    }
};

TEST(ColumnKeyTest, MatchesMultiplicativeFormula) {
    std::hash<std::string> h;
    size_t expected = (size_t(17) * 31 + h("a")) * 31 + h("b");
    EXPECT_EQ(compute_column_key({"a", "b"}), expected);
}

TEST(ColumnKeyTest, EmptySequenceIsSeed) {
    EXPECT_EQ(compute_column_key({}), 17u);
}

TEST(ColumnKeyTest, IsOrderSensitive) {
    EXPECT_NE(compute_column_key({"a", "b"}), compute_column_key({"b", "a"}));
}

TEST(NormalizeColumnNameTest, StripsSeparatorsAndCase) {
    EXPECT_EQ(normalize_column_name("Owner_Name"), "ownername");
    EXPECT_EQ(normalize_column_name("owner-name"), "ownername");
    EXPECT_EQ(normalize_column_name("OWNER NAME"), "ownername");
    EXPECT_EQ(normalize_column_name("ownername"), "ownername");
}

TEST(ResultMapperTest, SameColumnsReuseBindings) {
    auto first = ResultMapper<Account>::bindings_for({"account_id", "owner_name"});
    auto second = ResultMapper<Account>::bindings_for({"account_id", "owner_name"});

    EXPECT_EQ(first.get(), second.get());
    ASSERT_EQ(first->bindings.size(), 2u);
    EXPECT_EQ(first->bindings[0].ordinal, 0u);
    EXPECT_STREQ(first->bindings[1].field_name, "owner_name");
}

TEST(ResultMapperTest, DifferentOrderGetsOwnBindings) {
    auto forward = ResultMapper<Account>::bindings_for({"account_id", "active"});
    auto reverse = ResultMapper<Account>::bindings_for({"active", "account_id"});

    EXPECT_NE(forward.get(), reverse.get());
    EXPECT_STREQ(reverse->bindings[0].field_name, "active");
}

TEST(ResultMapperTest, KeyCollisionDoesNotReuseForeignBindings) {
    const size_t key = 4242;
    size_t before = ResultMapper<Pair>::cached_sets();

    auto ab = ResultMapper<Pair>::bindings_for({"a", "b"}, key);
    auto ba = ResultMapper<Pair>::bindings_for({"b", "a"}, key);

    EXPECT_NE(ab.get(), ba.get());
    EXPECT_EQ(ab->bindings[0].ordinal, 0u);
    EXPECT_STREQ(ab->bindings[0].field_name, "a");
    EXPECT_STREQ(ba->bindings[0].field_name, "b");
    EXPECT_EQ(ResultMapper<Pair>::cached_sets(), before + 2);

    // Both colliding entries are served from the cache afterwards
    EXPECT_EQ(ResultMapper<Pair>::bindings_for({"b", "a"}, key).get(), ba.get());
    EXPECT_EQ(ResultMapper<Pair>::bindings_for({"a", "b"}, key).get(), ab.get());
}

TEST(ResultMapperTest, MapsRowsByNormalizedName) {
    auto state = std::make_shared<FakeState>();
    FakeResult result;
    result.columns = {"AccountId", "OWNER-NAME", "Balance", "Active"};
    result.rows.push_back({int64_t{1}, std::string("ada"), 12.5, true});
    result.rows.push_back({int32_t{2}, std::string("bob"), SqlValue{}, false});
    FakeCursor cursor(state, result);

    std::vector<Account> rows;
    ResultMapper<Account>(cursor).map([&](Account a) { rows.push_back(a); });

    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].account_id, 1);
    EXPECT_EQ(rows[0].owner_name, "ada");
    ASSERT_TRUE(rows[0].balance.has_value());
    EXPECT_DOUBLE_EQ(*rows[0].balance, 12.5);
    EXPECT_TRUE(rows[0].active);
    EXPECT_EQ(rows[1].account_id, 2);
    EXPECT_FALSE(rows[1].balance.has_value());
}

TEST(ResultMapperTest, UnmatchedColumnsAreIgnored) {
    auto state = std::make_shared<FakeState>();
    FakeResult result;
    result.columns = {"account_id", "created_by", "owner_name"};
    result.rows.push_back({int64_t{7}, std::string("system"), std::string("eve")});
    FakeCursor cursor(state, result);

    std::vector<Account> rows;
    ResultMapper<Account>(cursor).map([&](Account a) { rows.push_back(a); });

    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].account_id, 7);
    EXPECT_EQ(rows[0].owner_name, "eve");
    EXPECT_FALSE(rows[0].balance.has_value());
    EXPECT_FALSE(rows[0].active);
}

TEST(ResultMapperTest, NullAssignsDefault) {
    auto state = std::make_shared<FakeState>();
    FakeResult result;
    result.columns = {"account_id", "owner_name", "balance"};
    result.rows.push_back({SqlValue{}, SqlValue{}, SqlValue{}});
    FakeCursor cursor(state, result);

    ResultMapper<Account> mapper(cursor);
    ASSERT_TRUE(cursor.read());
    Account a = mapper.map_current_row();

    EXPECT_EQ(a.account_id, 0);
    EXPECT_EQ(a.owner_name, "");
    EXPECT_FALSE(a.balance.has_value());
}

TEST(ResultMapperTest, MapAsyncYieldsAfterEveryRow) {
    auto state = std::make_shared<FakeState>();
    FakeResult result;
    result.columns = {"account_id"};
    result.rows = {{int64_t{1}}, {int64_t{2}}};
    FakeCursor cursor(state, result);

    std::vector<int64_t> ids;
    auto step = ResultMapper<Account>::map_async([&](Account a) { ids.push_back(a.account_id); });

    EXPECT_EQ(step(cursor), PollStatus::Yielded);
    EXPECT_EQ(ids.size(), 1u);
    EXPECT_EQ(step(cursor), PollStatus::Yielded);
    EXPECT_EQ(step(cursor), PollStatus::Ready);
    EXPECT_EQ(ids, (std::vector<int64_t>{1, 2}));
}
