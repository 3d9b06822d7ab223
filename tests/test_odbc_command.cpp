#include <gtest/gtest.h>
#include "core/odbc_command.hpp"
#include "core/odbc_connection.hpp"
#include "data/query_helpers.hpp"
#include <cstdlib>

using namespace sqlgraph::core;

TEST(RewriteNamedMarkersTest, ReplacesKnownNamesInTextOrder) {
    auto rewrite = rewrite_named_markers("SELECT * FROM t WHERE b = @b AND a = @a", {"a", "b"});
    EXPECT_EQ(rewrite.sql, "SELECT * FROM t WHERE b = ? AND a = ?");
    EXPECT_EQ(rewrite.markers, (std::vector<std::string>{"b", "a"}));
}

TEST(RewriteNamedMarkersTest, RepeatedMarkerBindsEachTime) {
    auto rewrite = rewrite_named_markers("SELECT @x + @x", {"x"});
    EXPECT_EQ(rewrite.sql, "SELECT ? + ?");
    EXPECT_EQ(rewrite.markers.size(), 2u);
}

TEST(RewriteNamedMarkersTest, MatchesCaseInsensitivelyAndKeepsCanonicalName) {
    auto rewrite = rewrite_named_markers("WHERE name = @NAME", {"Name"});
    EXPECT_EQ(rewrite.sql, "WHERE name = ?");
    ASSERT_EQ(rewrite.markers.size(), 1u);
    EXPECT_EQ(rewrite.markers[0], "Name");
}

TEST(RewriteNamedMarkersTest, UnknownNamesAreLeftInPlace) {
    auto rewrite = rewrite_named_markers("DECLARE @local INT; SET @local = @v", {"v"});
    EXPECT_EQ(rewrite.sql, "DECLARE @local INT; SET @local = ?");
}

TEST(RewriteNamedMarkersTest, PrefixOfLongerNameIsNotReplaced) {
    auto rewrite = rewrite_named_markers("SELECT @id_2", {"id"});
    EXPECT_EQ(rewrite.sql, "SELECT @id_2");
    EXPECT_TRUE(rewrite.markers.empty());
}

TEST(RewriteNamedMarkersTest, SystemFunctionsAreUntouched) {
    auto rewrite = rewrite_named_markers("SELECT @@ROWCOUNT, @rowcount", {"rowcount"});
    EXPECT_EQ(rewrite.sql, "SELECT @@ROWCOUNT, ?");
}

TEST(RewriteNamedMarkersTest, LiteralsAndCommentsAreUntouched) {
    std::string text =
        "SELECT '@a', \"@a\", [@a] -- @a\n"
        "/* @a */ FROM t WHERE c = @a";
    auto rewrite = rewrite_named_markers(text, {"a"});
    EXPECT_EQ(rewrite.sql,
              "SELECT '@a', \"@a\", [@a] -- @a\n"
              "/* @a */ FROM t WHERE c = ?");
    EXPECT_EQ(rewrite.markers.size(), 1u);
}

TEST(RewriteNamedMarkersTest, EscapedQuoteInsideLiteral) {
    auto rewrite = rewrite_named_markers("SELECT 'it''s @a' , @a", {"a"});
    EXPECT_EQ(rewrite.sql, "SELECT 'it''s @a' , ?");
}

TEST(BuildCallEscapeTest, Shapes) {
    EXPECT_EQ(build_call_escape("usp_a", 0, false), "{call usp_a}");
    EXPECT_EQ(build_call_escape("usp_a", 2, false), "{call usp_a(?,?)}");
    EXPECT_EQ(build_call_escape("dbo.usp_b", 1, true), "{? = call dbo.usp_b(?)}");
    EXPECT_EQ(build_call_escape("usp_c", 0, true), "{? = call usp_c}");
}

TEST(OdbcCommandTest, RoundTripsNamedParameters) {
    const char* conn_str = std::getenv("SQLGRAPH_ODBC_CONNECTION");
    if (!conn_str) {
        GTEST_SKIP() << "SQLGRAPH_ODBC_CONNECTION not set";
    }

    OdbcConnection conn(OdbcEnvironment::shared(), conn_str);
    sqlgraph::data::ExecutionContext context(conn);
    sqlgraph::data::ParameterBag bag{{"b", int32_t{40}}, {"a", int32_t{2}}};

    EXPECT_EQ(sqlgraph::data::execute_scalar<int32_t>(context, "SELECT @a + @b", bag), 42);
    EXPECT_FALSE(conn.is_open());
}

TEST(OdbcCommandTest, RowCountOfNonQuery) {
    const char* conn_str = std::getenv("SQLGRAPH_ODBC_CONNECTION");
    if (!conn_str) {
        GTEST_SKIP() << "SQLGRAPH_ODBC_CONNECTION not set";
    }

    OdbcConnection conn(OdbcEnvironment::shared(), conn_str);
    sqlgraph::data::ExecutionContext context(conn);
    auto rows = sqlgraph::data::execute_non_query(
        context, "DECLARE @t TABLE (v INT); INSERT INTO @t VALUES (1), (2), (3)");
    EXPECT_GE(rows, 0);
}
