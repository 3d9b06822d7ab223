#include <gtest/gtest.h>
#include "data/query_executor.hpp"
#include "data/result_mapper.hpp"
#include "fake_connection.hpp"
#include <stdexcept>

using namespace sqlgraph::data;
using namespace sqlgraph::test;
using sqlgraph::core::ContractViolation;
using sqlgraph::core::InvalidStateError;
using sqlgraph::core::OperationCancelled;

namespace {

struct City {
    int32_t id = 0;
    std::string name;
};

} // anonymous namespace

template<>
struct sqlgraph::data::RecordTraits<City> {
    static auto fields() {
        return std::make_tuple(field("id", &City::id), field("name", &City::name));
    }
};

class QueryExecutorTest : public ::testing::Test {
protected:
    FakeResult cities(size_t count) {
        FakeResult result;
        result.columns = {"id", "name"};
        for (size_t i = 1; i <= count; ++i) {
            result.rows.push_back({int32_t(i), std::string("city") + std::to_string(i)});
        }
        return result;
    }

    FakeState& state() { return conn.state(); }

    FakeConnection conn;
};

TEST_F(QueryExecutorTest, EmptyCommandTextIsContractViolation) {
    EXPECT_THROW(QueryExecutor(ExecutionContext(conn), ""), ContractViolation);
    EXPECT_TRUE(state().events.empty());
}

TEST_F(QueryExecutorTest, EmptyParameterNameIsContractViolation) {
    QueryExecutor executor(ExecutionContext(conn), "SELECT 1");
    EXPECT_THROW(executor.add_parameter("", int32_t{1}), ContractViolation);
}

TEST_F(QueryExecutorTest, EmptyCallbackIsContractViolation) {
    QueryExecutor executor(ExecutionContext(conn), "SELECT 1");
    EXPECT_THROW(executor.execute(ReaderCallback{}), ContractViolation);
    EXPECT_TRUE(state().events.empty());
}

TEST_F(QueryExecutorTest, OpensAndClosesConnectionItOwns) {
    state().results.push_back(cities(2));

    QueryExecutor executor(ExecutionContext(conn), "SELECT id, name FROM City");
    size_t rows = 0;
    executor.execute([&](ResultCursor& cursor) {
        EXPECT_TRUE(conn.is_open());
        while (cursor.read()) {
            ++rows;
        }
    });

    EXPECT_EQ(rows, 2u);
    EXPECT_FALSE(conn.is_open());
    EXPECT_EQ(state().count("open"), 1u);
    EXPECT_EQ(state().count("close"), 1u);
}

TEST_F(QueryExecutorTest, LeavesCallerConnectionOpen) {
    conn.open();
    QueryExecutor executor(ExecutionContext(conn), "DELETE FROM City");
    executor.execute_non_query();

    EXPECT_TRUE(conn.is_open());
    EXPECT_EQ(state().count("open"), 1u);
    EXPECT_EQ(state().count("close"), 0u);
}

TEST_F(QueryExecutorTest, ClosesOwnedConnectionWhenCallbackThrows) {
    state().results.push_back(cities(3));
    QueryExecutor executor(ExecutionContext(conn), "SELECT id, name FROM City");

    EXPECT_THROW(executor.execute([](ResultCursor&) { throw std::runtime_error("boom"); }),
                 std::runtime_error);
    EXPECT_FALSE(conn.is_open());
    EXPECT_LT(state().index_of("cancel"), state().index_of("close_cursor"));
}

TEST_F(QueryExecutorTest, IsSingleUse) {
    QueryExecutor executor(ExecutionContext(conn), "DELETE FROM City");
    executor.execute_non_query();

    EXPECT_THROW(executor.execute_non_query(), InvalidStateError);
    EXPECT_THROW(executor.add_parameter("late", int32_t{1}), InvalidStateError);
    EXPECT_EQ(state().commands.size(), 1u);
}

TEST_F(QueryExecutorTest, PassesParametersAndDefinition) {
    QueryExecutor executor(ExecutionContext(conn, nullptr, 30), "UPDATE City SET name = @name WHERE id = @id");
    executor.add_parameter("name", std::string("Lyon"))
            .add_parameter("id", int64_t{4});
    executor.execute_non_query();

    const auto& recorded = state().commands.at(0);
    EXPECT_EQ(recorded.definition.text, "UPDATE City SET name = @name WHERE id = @id");
    EXPECT_EQ(recorded.definition.timeout_seconds, 30);
    ASSERT_EQ(recorded.parameters.size(), 2u);
    EXPECT_EQ(recorded.parameters[0].type, DbType::String);
    EXPECT_EQ(recorded.parameters[1].type, DbType::Int64);
}

TEST_F(QueryExecutorTest, SetTimeoutOverridesContext) {
    QueryExecutor executor(ExecutionContext(conn, nullptr, 30), "SELECT 1");
    executor.set_timeout(5);
    EXPECT_EQ(executor.command().timeout_seconds, 5);
}

TEST_F(QueryExecutorTest, NonQueryReturnsAffectedRows) {
    state().results.push_back(affected(7));
    QueryExecutor executor(ExecutionContext(conn), "DELETE FROM City");
    EXPECT_EQ(executor.execute_non_query(), 7);
}

TEST_F(QueryExecutorTest, ScalarNullGivesZeroValue) {
    state().results.push_back(single_column("n", {SqlValue{}}));
    QueryExecutor executor(ExecutionContext(conn), "SELECT MAX(id) FROM City");
    EXPECT_EQ(executor.execute_scalar<int32_t>(), 0);
}

TEST_F(QueryExecutorTest, ScalarEmptyResultGivesZeroValue) {
    state().results.push_back(single_column("n", {}));
    QueryExecutor executor(ExecutionContext(conn), "SELECT id FROM City WHERE 1 = 0");
    EXPECT_EQ(executor.execute_scalar<std::string>(), "");
}

TEST_F(QueryExecutorTest, ScalarReadsFirstColumnOfFirstRow) {
    state().results.push_back(cities(3));
    QueryExecutor executor(ExecutionContext(conn), "SELECT id, name FROM City");
    EXPECT_EQ(executor.execute_scalar<int64_t>(), 1);
}

TEST_F(QueryExecutorTest, ScalarAsyncNullGivesZeroValue) {
    FakeResult result = single_column("n", {SqlValue{}});
    result.pending_steps = 2;
    state().results.push_back(result);

    QueryExecutor executor(ExecutionContext(conn), "SELECT MAX(id) FROM City");
    auto op = executor.execute_scalar_async<int32_t>();
    EXPECT_EQ(op.poll(), PollStatus::Pending);
    EXPECT_EQ(op.get(), 0);
    EXPECT_FALSE(conn.is_open());
}

TEST_F(QueryExecutorTest, AsyncNonQuerySuspendsUntilDone) {
    FakeResult result = affected(3);
    result.pending_steps = 2;
    state().results.push_back(result);

    QueryExecutor executor(ExecutionContext(conn), "DELETE FROM City");
    auto op = executor.execute_non_query_async();

    EXPECT_EQ(op.poll(), PollStatus::Pending);
    EXPECT_EQ(op.poll(), PollStatus::Pending);
    EXPECT_EQ(op.poll(), PollStatus::Ready);
    EXPECT_EQ(op.result(), 3);
}

TEST_F(QueryExecutorTest, AsyncOpenConnectionSuspends) {
    state().open_pending_steps = 1;
    QueryExecutor executor(ExecutionContext(conn), "DELETE FROM City");
    auto op = executor.execute_non_query_async();

    EXPECT_EQ(op.poll(), PollStatus::Pending);
    EXPECT_FALSE(conn.is_open());
    EXPECT_EQ(op.poll(), PollStatus::Ready);
    EXPECT_FALSE(conn.is_open());
}

TEST_F(QueryExecutorTest, CancelWhileOpeningCancelsTheConnect) {
    state().open_pending_steps = 3;
    CancellationSource source;

    QueryExecutor executor(ExecutionContext(conn), "DELETE FROM City");
    auto op = executor.execute_non_query_async(source.token());

    EXPECT_EQ(op.poll(), PollStatus::Pending);
    source.cancel();
    EXPECT_THROW(op.poll(), OperationCancelled);

    EXPECT_EQ(state().count("cancel_open"), 1u);
    EXPECT_EQ(state().count("open"), 0u);
    EXPECT_EQ(state().open_connections, 0);
    EXPECT_TRUE(state().commands.empty());
}

TEST_F(QueryExecutorTest, AbandonedWhileOpeningCancelsTheConnect) {
    state().open_pending_steps = 3;
    {
        QueryExecutor executor(ExecutionContext(conn), "DELETE FROM City");
        auto op = executor.execute_non_query_async();
        EXPECT_EQ(op.poll(), PollStatus::Pending);
    }
    EXPECT_EQ(state().count("cancel_open"), 1u);
    EXPECT_FALSE(conn.is_open());
}

TEST_F(QueryExecutorTest, AsyncCancelledBeforeStartIssuesNoCommand) {
    CancellationSource source;
    source.cancel();

    QueryExecutor executor(ExecutionContext(conn), "DELETE FROM City");
    auto op = executor.execute_non_query_async(source.token());

    EXPECT_THROW(op.poll(), OperationCancelled);
    EXPECT_TRUE(state().commands.empty());
}

TEST_F(QueryExecutorTest, AsyncReaderCancelledMidStream) {
    state().results.push_back(cities(5));
    CancellationSource source;
    std::vector<City> seen;

    QueryExecutor executor(ExecutionContext(conn), "SELECT id, name FROM City");
    auto op = executor.execute_async(ResultMapper<City>::map_async([&](City c) {
        seen.push_back(c);
        if (seen.size() == 2) {
            source.cancel();
        }
    }), source.token());

    EXPECT_THROW(op.wait(), OperationCancelled);
    EXPECT_EQ(seen.size(), 2u);
    EXPECT_LT(state().index_of("cancel"), state().index_of("close_cursor"));
    EXPECT_FALSE(conn.is_open());
}

TEST_F(QueryExecutorTest, StreamYieldsRowsLazily) {
    state().results.push_back(cities(3));

    QueryExecutor executor(ExecutionContext(conn), "SELECT id, name FROM City");
    auto stream = executor.execute_stream(ResultMapper<City>::rows());
    EXPECT_TRUE(state().commands.empty());

    std::vector<std::string> names;
    for (const City& city : stream) {
        names.push_back(city.name);
    }

    EXPECT_EQ(names, (std::vector<std::string>{"city1", "city2", "city3"}));
    EXPECT_TRUE(stream.is_finished());
    EXPECT_EQ(state().count("cancel"), 0u);
    EXPECT_FALSE(conn.is_open());
}

TEST_F(QueryExecutorTest, StreamCancelledMidIterationCancelsBeforeClosingCursor) {
    state().results.push_back(cities(10));
    CancellationSource source;

    QueryExecutor executor(ExecutionContext(conn), "SELECT id, name FROM City");
    auto stream = executor.execute_stream(ResultMapper<City>::rows(), source.token());

    ASSERT_TRUE(stream.next().has_value());
    ASSERT_TRUE(stream.next().has_value());
    source.cancel();

    EXPECT_THROW(stream.next(), OperationCancelled);

    size_t cancel_at = state().index_of("cancel");
    size_t close_at = state().index_of("close_cursor");
    ASSERT_LT(cancel_at, state().events.size());
    EXPECT_LT(cancel_at, close_at);
    EXPECT_FALSE(conn.is_open());
    EXPECT_FALSE(stream.next().has_value());
}

TEST_F(QueryExecutorTest, AbandonedStreamCancelsRemoteOperation) {
    state().results.push_back(cities(10));
    {
        QueryExecutor executor(ExecutionContext(conn), "SELECT id, name FROM City");
        auto stream = executor.execute_stream(ResultMapper<City>::rows());
        ASSERT_TRUE(stream.next().has_value());
    }

    EXPECT_LT(state().index_of("cancel"), state().index_of("close_cursor"));
    EXPECT_FALSE(conn.is_open());
}

TEST_F(QueryExecutorTest, StreamMovedMidIterationKeepsItsPosition) {
    state().results.push_back(cities(3));

    QueryExecutor executor(ExecutionContext(conn), "SELECT id, name FROM City");
    std::optional<RowStream<City>> original(executor.execute_stream(ResultMapper<City>::rows()));
    ASSERT_EQ(original->next()->name, "city1");

    RowStream<City> moved(std::move(*original));
    original.reset();

    EXPECT_EQ(state().count("cancel"), 0u);
    EXPECT_EQ(moved.next()->name, "city2");
    EXPECT_EQ(moved.next()->name, "city3");
    EXPECT_FALSE(moved.next().has_value());
    EXPECT_FALSE(conn.is_open());
}

TEST_F(QueryExecutorTest, MoveAssignedStreamAbandonsItsOwnRows) {
    state().results.push_back(cities(5));
    state().results.push_back(cities(2));

    QueryExecutor first(ExecutionContext(conn), "SELECT id, name FROM City");
    auto target = first.execute_stream(ResultMapper<City>::rows());
    ASSERT_TRUE(target.next().has_value());

    QueryExecutor second(ExecutionContext(conn), "SELECT id, name FROM City");
    auto source = second.execute_stream(ResultMapper<City>::rows());

    target = std::move(source);
    EXPECT_EQ(state().count("cancel"), 1u);
    EXPECT_TRUE(source.is_finished());
    EXPECT_THROW(source.next(), InvalidStateError);

    size_t count = 0;
    while (target.next()) {
        ++count;
    }
    EXPECT_EQ(count, 2u);
}

TEST_F(QueryExecutorTest, IteratorSurvivesStreamMove) {
    state().results.push_back(cities(3));

    QueryExecutor executor(ExecutionContext(conn), "SELECT id, name FROM City");
    auto stream = executor.execute_stream(ResultMapper<City>::rows());
    auto it = stream.begin();
    EXPECT_EQ(it->name, "city1");

    RowStream<City> moved(std::move(stream));
    ++it;
    EXPECT_EQ(it->name, "city2");
    ++it;
    ++it;
    EXPECT_TRUE(it == moved.end());
}

TEST_F(QueryExecutorTest, StreamPollNext) {
    FakeResult result = cities(2);
    result.pending_steps = 1;
    state().results.push_back(result);

    QueryExecutor executor(ExecutionContext(conn), "SELECT id, name FROM City");
    auto stream = executor.execute_stream(ResultMapper<City>::rows());

    std::optional<City> row;
    EXPECT_EQ(stream.poll_next(row), PollStatus::Pending);
    EXPECT_FALSE(row.has_value());

    ASSERT_EQ(stream.poll_next(row), PollStatus::Ready);
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->id, 1);

    ASSERT_EQ(stream.poll_next(row), PollStatus::Ready);
    ASSERT_TRUE(row.has_value());

    ASSERT_EQ(stream.poll_next(row), PollStatus::Ready);
    EXPECT_FALSE(row.has_value());
    EXPECT_TRUE(stream.is_finished());
}

TEST_F(QueryExecutorTest, FinishedTransactionIsContractViolation) {
    auto transaction = conn.begin_transaction();
    transaction->commit();

    QueryExecutor executor(ExecutionContext(conn, transaction.get()), "DELETE FROM City");
    EXPECT_THROW(executor.execute_non_query(), ContractViolation);
    EXPECT_TRUE(state().commands.empty());
}

TEST_F(QueryExecutorTest, CommandCarriesTransaction) {
    auto transaction = conn.begin_transaction();
    QueryExecutor executor(ExecutionContext(conn, transaction.get()), "DELETE FROM City");
    executor.execute_non_query();

    EXPECT_EQ(state().commands.at(0).definition.transaction, transaction.get());
}

TEST_F(QueryExecutorTest, BackendFailurePropagates) {
    FakeResult result;
    result.fail_with = "deadlock";
    state().results.push_back(result);

    QueryExecutor executor(ExecutionContext(conn), "DELETE FROM City");
    EXPECT_THROW(executor.execute_non_query(), std::runtime_error);
    EXPECT_FALSE(conn.is_open());
}
