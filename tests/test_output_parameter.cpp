#include <gtest/gtest.h>
#include "data/query_executor.hpp"
#include "fake_connection.hpp"

using namespace sqlgraph::data;
using namespace sqlgraph::test;
using sqlgraph::core::InvalidStateError;
using sqlgraph::core::NullValueError;

TEST(OutputParameterTest, UnboundAccessIsInvalidState) {
    OutputParameter<int32_t> out;
    EXPECT_FALSE(out.is_bound());
    EXPECT_FALSE(out.has_value());
    EXPECT_THROW(out.value(), InvalidStateError);
}

TEST(OutputParameterTest, ValueBeforeExecutionIsInvalidState) {
    FakeConnection conn;
    QueryExecutor executor(ExecutionContext(conn), "usp_count", CommandType::StoredProcedure);

    OutputParameter<int32_t> total;
    executor.add_output_parameter("total", total);

    EXPECT_TRUE(total.is_bound());
    EXPECT_EQ(total.name(), "total");
    EXPECT_THROW(total.value(), InvalidStateError);
}

TEST(OutputParameterTest, AvailableAfterNonQuery) {
    FakeConnection conn;
    FakeResult result;
    result.outputs["total"] = int32_t{12};
    result.outputs[QueryExecutor::kReturnValueName] = int32_t{0};
    conn.state().results.push_back(result);

    QueryExecutor executor(ExecutionContext(conn), "usp_count", CommandType::StoredProcedure);
    OutputParameter<int32_t> total;
    OutputParameter<int32_t> status;
    executor.add_parameter("filter", std::string("a%"))
            .add_output_parameter("total", total)
            .return_value(status);

    executor.execute_non_query();

    EXPECT_TRUE(total.has_value());
    EXPECT_EQ(total.value(), 12);
    EXPECT_EQ(status.value(), 0);

    const auto& recorded = conn.state().commands.at(0);
    EXPECT_EQ(recorded.definition.type, CommandType::StoredProcedure);
    ASSERT_EQ(recorded.parameters.size(), 3u);
    EXPECT_EQ(recorded.parameters[1].direction, ParameterDirection::Output);
    EXPECT_EQ(recorded.parameters[2].direction, ParameterDirection::ReturnValue);
}

TEST(OutputParameterTest, AvailableAfterReaderCompletes) {
    FakeConnection conn;
    FakeResult result = single_column("id", {int32_t{1}, int32_t{2}});
    result.outputs["rows"] = int64_t{2};
    conn.state().results.push_back(result);

    QueryExecutor executor(ExecutionContext(conn), "usp_list", CommandType::StoredProcedure);
    OutputParameter<int64_t> rows;
    executor.add_output_parameter("rows", rows);

    executor.execute([&](ResultCursor& cursor) {
        while (cursor.read()) {
        }
        // The cursor is still open, outputs have not arrived
        EXPECT_FALSE(rows.has_value());
    });

    EXPECT_EQ(rows.value(), 2);
}

TEST(OutputParameterTest, InputOutputKeepsSentValue) {
    FakeConnection conn;
    FakeResult result;
    result.outputs["counter"] = int32_t{8};
    conn.state().results.push_back(result);

    QueryExecutor executor(ExecutionContext(conn), "usp_bump", CommandType::StoredProcedure);
    OutputParameter<int32_t> counter;
    executor.add_parameter("counter", int32_t{7}, counter);
    executor.execute_non_query();

    const auto& sent = conn.state().commands.at(0).parameters.at(0);
    EXPECT_EQ(sent.direction, ParameterDirection::InputOutput);
    EXPECT_EQ(std::get<int32_t>(sent.value), 7);
    EXPECT_EQ(counter.value(), 8);
}

TEST(OutputParameterTest, NullIntoNonNullableThrows) {
    FakeConnection conn;
    QueryExecutor executor(ExecutionContext(conn), "usp_nothing", CommandType::StoredProcedure);

    OutputParameter<int32_t> strict;
    OutputParameter<std::optional<int32_t>> lenient;
    executor.add_output_parameter("strict", strict)
            .add_output_parameter("lenient", lenient);
    executor.execute_non_query();

    EXPECT_THROW(strict.value(), NullValueError);
    EXPECT_FALSE(lenient.value().has_value());
    EXPECT_EQ(strict.to_string(), "");
}
