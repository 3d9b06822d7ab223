#include <gtest/gtest.h>
#include "data/parameter_binder.hpp"
#include "core/errors.hpp"

using namespace sqlgraph::data;

namespace {

struct Person {
    int32_t age = 0;
    std::string name;
    std::optional<double> score;
};

struct Label {
    std::string text;
};

std::ostream& operator<<(std::ostream& os, const Label& label) {
    return os << "<" << label.text << ">";
}

struct Tagged {
    int64_t id = 0;
    Label label;
};

} // anonymous namespace

template<>
struct sqlgraph::data::RecordTraits<Person> {
    static auto fields() {
        return std::make_tuple(field("age", &Person::age),
                               field("name", &Person::name),
                               field("score", &Person::score));
    }
};

template<>
struct sqlgraph::data::RecordTraits<Tagged> {
    static auto fields() {
        return std::make_tuple(field("id", &Tagged::id),
                               field("label", &Tagged::label));
    }
};

TEST(ParameterBagTest, KeepsInsertionOrder) {
    ParameterBag bag{{"b", int32_t{2}}, {"a", int32_t{1}}, {"c", std::string("x")}};

    std::vector<std::string> names;
    for (const auto& entry : bag) {
        names.push_back(entry.name);
    }
    EXPECT_EQ(names, (std::vector<std::string>{"b", "a", "c"}));
}

TEST(ParameterBagTest, SetReplacesExistingEntry) {
    ParameterBag bag;
    bag.set("name", std::string("alice"));
    bag.set("name", int32_t{5});

    ASSERT_EQ(bag.size(), 1u);
    EXPECT_EQ(bag.find("name")->type, DbType::Int32);
}

TEST(ParameterBagTest, FindIsCaseInsensitive) {
    ParameterBag bag{{"NodeName", std::string("x")}};
    EXPECT_TRUE(bag.contains("nodename"));
    EXPECT_TRUE(bag.contains("NODENAME"));
    EXPECT_FALSE(bag.contains("node_name"));
}

TEST(ParameterBagTest, EmptyNameIsContractViolation) {
    ParameterBag bag;
    EXPECT_THROW(bag.set("", int32_t{1}), sqlgraph::core::ContractViolation);
}

TEST(ParameterBagTest, WithPrefixRenamesEveryEntry) {
    ParameterBag bag{{"name", std::string("a")}, {"age", int32_t{3}}};
    ParameterBag prefixed = bag.with_prefix("w_");

    ASSERT_EQ(prefixed.size(), 2u);
    EXPECT_TRUE(prefixed.contains("w_name"));
    EXPECT_TRUE(prefixed.contains("w_age"));
    EXPECT_FALSE(prefixed.contains("name"));
}

TEST(MakeParameterBagTest, UsesRecordTraits) {
    Person p;
    p.age = 31;
    p.name = "alice";

    ParameterBag bag = make_parameter_bag(p);
    ASSERT_EQ(bag.size(), 3u);

    const auto* age = bag.find("age");
    ASSERT_NE(age, nullptr);
    EXPECT_EQ(age->type, DbType::Int32);
    EXPECT_FALSE(age->nullable);

    const auto* score = bag.find("score");
    ASSERT_NE(score, nullptr);
    EXPECT_TRUE(is_null(score->value));
    EXPECT_EQ(score->type, DbType::Double);
    EXPECT_TRUE(score->nullable);
}

TEST(MakeParameterBagTest, NonScalarMembersBindAsText) {
    Tagged t;
    t.id = 9;
    t.label.text = "hot";

    ParameterBag bag = make_parameter_bag(t);
    const auto* label = bag.find("label");
    ASSERT_NE(label, nullptr);
    EXPECT_EQ(label->type, DbType::String);
    EXPECT_EQ(std::get<std::string>(label->value), "<hot>");
}

TEST(ToParameterBagTest, NullSourcesGiveNoBag) {
    const Person* none = nullptr;
    EXPECT_FALSE(to_parameter_bag(none).has_value());
    EXPECT_FALSE(to_parameter_bag(nullptr).has_value());
    EXPECT_FALSE(to_parameter_bag(std::optional<Person>{}).has_value());

    Person p;
    EXPECT_TRUE(to_parameter_bag(&p).has_value());
}

TEST(ParameterBinderTest, BindsInputsInBagOrder) {
    ParameterBag bag{{"x", int64_t{1}}, {"y", SqlValue{}}};
    auto params = ParameterBinder::bind(bag);

    ASSERT_EQ(params.size(), 2u);
    EXPECT_EQ(params[0].name, "x");
    EXPECT_EQ(params[0].direction, ParameterDirection::Input);
    EXPECT_EQ(params[0].type, DbType::Int64);
    EXPECT_FALSE(params[0].nullable);
    EXPECT_EQ(params[1].name, "y");
    EXPECT_TRUE(params[1].nullable);
}

TEST(ParameterBinderTest, RecordSource) {
    Person p;
    p.name = "bob";
    auto params = ParameterBinder::bind(p);

    ASSERT_EQ(params.size(), 3u);
    EXPECT_EQ(params[1].name, "name");
    EXPECT_EQ(std::get<std::string>(params[1].value), "bob");
}

TEST(ParameterBinderTest, NullSourceBindsNothing) {
    std::optional<ParameterBag> none;
    EXPECT_TRUE(ParameterBinder::bind(none).empty());
}
