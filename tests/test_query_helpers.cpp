#include <gtest/gtest.h>
#include "data/query_helpers.hpp"
#include "fake_connection.hpp"

using namespace sqlgraph::data;
using namespace sqlgraph::test;
using sqlgraph::core::InvalidStateError;

namespace {

struct Tag {
    int32_t id = 0;
    std::string label;
};

FakeResult tags(std::initializer_list<const char*> labels) {
    FakeResult result;
    result.columns = {"id", "label"};
    int32_t id = 0;
    for (const char* label : labels) {
        result.rows.push_back({++id, std::string(label)});
    }
    return result;
}

} // anonymous namespace

template<>
struct sqlgraph::data::RecordTraits<Tag> {
    static auto fields() {
        return std::make_tuple(field("id", &Tag::id), field("label", &Tag::label));
    }
};

class QueryHelpersTest : public ::testing::Test {
protected:
    FakeConnection conn;
    ExecutionContext context{conn};
};

TEST_F(QueryHelpersTest, BuildQueryBindsBagInOrder) {
    ParameterBag bag{{"label", std::string("red")}, {"id", int32_t{3}}};
    auto executor = build_query(context, "SELECT * FROM Tag WHERE label = @label AND id = @id", bag);

    ASSERT_EQ(executor.parameters().size(), 2u);
    EXPECT_EQ(executor.parameters()[0]->name, "label");
    EXPECT_EQ(executor.parameters()[1]->name, "id");
}

TEST_F(QueryHelpersTest, BuildEdgeQueryOrdersFromToThenEdge) {
    ParameterBag from{{"f", int32_t{1}}};
    ParameterBag to{{"t", int32_t{2}}};
    ParameterBag edge{{"e", int32_t{3}}};
    auto executor = build_edge_query(context, "SELECT 1", from, to, edge);

    ASSERT_EQ(executor.parameters().size(), 3u);
    EXPECT_EQ(executor.parameters()[0]->name, "f");
    EXPECT_EQ(executor.parameters()[1]->name, "t");
    EXPECT_EQ(executor.parameters()[2]->name, "e");
}

TEST_F(QueryHelpersTest, BuildEdgeQuerySkipsNullBags) {
    auto executor = build_edge_query(context, "SELECT 1", std::nullopt, ParameterBag{{"t", int32_t{2}}},
                                     std::nullopt);
    ASSERT_EQ(executor.parameters().size(), 1u);
    EXPECT_EQ(executor.parameters()[0]->name, "t");
}

TEST_F(QueryHelpersTest, ExecuteListMapsEveryRow) {
    conn.state().results.push_back(tags({"red", "green", "blue"}));
    auto rows = execute_list<Tag>(context, "SELECT id, label FROM Tag");

    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[2].label, "blue");
    EXPECT_EQ(rows[2].id, 3);
}

TEST_F(QueryHelpersTest, ExecuteListAsync) {
    FakeResult result = tags({"a", "b"});
    result.pending_steps = 1;
    conn.state().results.push_back(result);

    auto op = execute_list_async<Tag>(context, "SELECT id, label FROM Tag");
    auto rows = op.get();
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].label, "a");
}

TEST_F(QueryHelpersTest, FirstOrDefault) {
    conn.state().results.push_back(tags({"x", "y"}));
    auto first = first_or_default<Tag>(context, "SELECT id, label FROM Tag");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->label, "x");

    conn.state().results.push_back(tags({}));
    EXPECT_FALSE(first_or_default<Tag>(context, "SELECT id, label FROM Tag").has_value());
}

TEST_F(QueryHelpersTest, SingleOrDefaultRejectsSecondRow) {
    conn.state().results.push_back(tags({"only"}));
    auto single = single_or_default<Tag>(context, "SELECT id, label FROM Tag");
    ASSERT_TRUE(single.has_value());
    EXPECT_EQ(single->label, "only");

    conn.state().results.push_back(tags({"one", "two"}));
    EXPECT_THROW(single_or_default<Tag>(context, "SELECT id, label FROM Tag"), InvalidStateError);
    EXPECT_FALSE(conn.is_open());
}

TEST_F(QueryHelpersTest, ExecuteScalar) {
    conn.state().results.push_back(single_column("n", {int64_t{41}}));
    EXPECT_EQ(execute_scalar<int64_t>(context, "SELECT COUNT(*) FROM Tag"), 41);

    conn.state().results.push_back(single_column("n", {SqlValue{}}));
    EXPECT_EQ(execute_scalar<int32_t>(context, "SELECT MAX(id) FROM Tag"), 0);
}

TEST_F(QueryHelpersTest, ExecuteScalarAsync) {
    conn.state().results.push_back(single_column("n", {int32_t{5}}));
    EXPECT_EQ(execute_scalar_async<int32_t>(context, "SELECT 5").get(), 5);
}

TEST_F(QueryHelpersTest, ExecuteScalarAsyncStoredProcedure) {
    conn.state().results.push_back(single_column("n", {int64_t{12}}));
    auto op = execute_scalar_async<int64_t>(context, "usp_count_tags",
                                            ParameterBag{{"prefix", std::string("a")}}, {},
                                            CommandType::StoredProcedure);

    EXPECT_EQ(op.get(), 12);
    EXPECT_EQ(conn.state().commands.at(0).definition.type, CommandType::StoredProcedure);
    EXPECT_EQ(conn.state().commands.at(0).definition.text, "usp_count_tags");
}

TEST_F(QueryHelpersTest, ExecuteNonQueryWithParameters) {
    conn.state().results.push_back(affected(2));
    int64_t rows = execute_non_query(context, "DELETE FROM Tag WHERE label = @label",
                                     ParameterBag{{"label", std::string("old")}});

    EXPECT_EQ(rows, 2);
    EXPECT_EQ(conn.state().commands.at(0).parameters.at(0).name, "label");
}

TEST_F(QueryHelpersTest, ExecuteNonQueryAsyncStoredProcedure) {
    conn.state().results.push_back(affected(1));
    auto op = execute_non_query_async(context, "usp_purge", std::nullopt, {}, CommandType::StoredProcedure);

    EXPECT_EQ(op.get(), 1);
    EXPECT_EQ(conn.state().commands.at(0).definition.type, CommandType::StoredProcedure);
}

TEST_F(QueryHelpersTest, ExecuteStream) {
    conn.state().results.push_back(tags({"p", "q", "r"}));
    auto stream = execute_stream<Tag>(context, "SELECT id, label FROM Tag");

    std::string joined;
    for (const Tag& tag : stream) {
        joined += tag.label;
    }
    EXPECT_EQ(joined, "pqr");
}
