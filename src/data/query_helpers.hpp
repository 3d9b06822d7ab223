#pragma once

#include "query_executor.hpp"
#include "result_mapper.hpp"
#include <optional>
#include <string>
#include <vector>

namespace sqlgraph::data {

using OptionalBag = std::optional<ParameterBag>;

// Executor for `text` with every entry of `parameters` bound as input
QueryExecutor build_query(const ExecutionContext& context, std::string text,
                          const OptionalBag& parameters = std::nullopt,
                          CommandType type = CommandType::Text);

// Executor binding the from-node, to-node and edge bags in that order
QueryExecutor build_edge_query(const ExecutionContext& context, std::string text,
                               const OptionalBag& from_parameters,
                               const OptionalBag& to_parameters,
                               const OptionalBag& parameters,
                               CommandType type = CommandType::Text);

int64_t execute_non_query(const ExecutionContext& context, std::string text,
                          const OptionalBag& parameters = std::nullopt,
                          CommandType type = CommandType::Text);

AsyncOperation<int64_t> execute_non_query_async(const ExecutionContext& context, std::string text,
                                                const OptionalBag& parameters = std::nullopt,
                                                CancellationToken token = {},
                                                CommandType type = CommandType::Text);

template<typename T>
std::vector<T> execute_list(const ExecutionContext& context, std::string text,
                            const OptionalBag& parameters = std::nullopt,
                            CommandType type = CommandType::Text) {
    std::vector<T> rows;
    build_query(context, std::move(text), parameters, type).execute([&](ResultCursor& cursor) {
        ResultMapper<T>(cursor).map([&](T row) { rows.push_back(std::move(row)); });
    });
    return rows;
}

template<typename T>
AsyncOperation<std::vector<T>> execute_list_async(const ExecutionContext& context, std::string text,
                                                  const OptionalBag& parameters = std::nullopt,
                                                  CancellationToken token = {},
                                                  CommandType type = CommandType::Text) {
    auto rows = std::make_shared<std::vector<T>>();
    auto inner = std::make_shared<AsyncOperation<void>>(
        build_query(context, std::move(text), parameters, type)
            .execute_async(ResultMapper<T>::map_async([rows](T row) { rows->push_back(std::move(row)); }),
                           std::move(token)));
    return AsyncOperation<std::vector<T>>([inner, rows](std::vector<T>& result) {
        if (PollStatus status = inner->poll(); status != PollStatus::Ready) {
            return status;
        }
        result = std::move(*rows);
        return PollStatus::Ready;
    });
}

template<typename T>
std::optional<T> first_or_default(const ExecutionContext& context, std::string text,
                                  const OptionalBag& parameters = std::nullopt,
                                  CommandType type = CommandType::Text) {
    std::optional<T> result;
    build_query(context, std::move(text), parameters, type).execute([&](ResultCursor& cursor) {
        if (cursor.read()) {
            result = ResultMapper<T>(cursor).map_current_row();
        }
    });
    return result;
}

// Throws InvalidStateError when the result has more than one row
template<typename T>
std::optional<T> single_or_default(const ExecutionContext& context, std::string text,
                                   const OptionalBag& parameters = std::nullopt,
                                   CommandType type = CommandType::Text) {
    std::optional<T> result;
    build_query(context, std::move(text), parameters, type).execute([&](ResultCursor& cursor) {
        if (!cursor.read()) {
            return;
        }
        result = ResultMapper<T>(cursor).map_current_row();
        if (cursor.read()) {
            throw core::InvalidStateError("Sequence contains more than one row");
        }
    });
    return result;
}

template<typename T>
T execute_scalar(const ExecutionContext& context, std::string text,
                 const OptionalBag& parameters = std::nullopt,
                 CommandType type = CommandType::Text) {
    return build_query(context, std::move(text), parameters, type).execute_scalar<T>();
}

template<typename T>
AsyncOperation<T> execute_scalar_async(const ExecutionContext& context, std::string text,
                                       const OptionalBag& parameters = std::nullopt,
                                       CancellationToken token = {},
                                       CommandType type = CommandType::Text) {
    return build_query(context, std::move(text), parameters, type).execute_scalar_async<T>(std::move(token));
}

template<typename T>
RowStream<T> execute_stream(const ExecutionContext& context, std::string text,
                            const OptionalBag& parameters = std::nullopt,
                            CancellationToken token = {},
                            CommandType type = CommandType::Text) {
    return build_query(context, std::move(text), parameters, type)
        .execute_stream<T>(ResultMapper<T>::rows(), std::move(token));
}

} // namespace sqlgraph::data
