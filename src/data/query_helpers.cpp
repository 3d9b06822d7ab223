#include "query_helpers.hpp"

namespace sqlgraph::data {

QueryExecutor build_query(const ExecutionContext& context, std::string text,
                          const OptionalBag& parameters, CommandType type) {
    QueryExecutor executor(context, std::move(text), type);
    if (parameters) {
        executor.add_parameters(*parameters);
    }
    return executor;
}

QueryExecutor build_edge_query(const ExecutionContext& context, std::string text,
                               const OptionalBag& from_parameters,
                               const OptionalBag& to_parameters,
                               const OptionalBag& parameters,
                               CommandType type) {
    QueryExecutor executor(context, std::move(text), type);
    for (const OptionalBag* bag : {&from_parameters, &to_parameters, &parameters}) {
        if (*bag) {
            executor.add_parameters(**bag);
        }
    }
    return executor;
}

int64_t execute_non_query(const ExecutionContext& context, std::string text,
                          const OptionalBag& parameters, CommandType type) {
    return build_query(context, std::move(text), parameters, type).execute_non_query();
}

AsyncOperation<int64_t> execute_non_query_async(const ExecutionContext& context, std::string text,
                                                const OptionalBag& parameters,
                                                CancellationToken token, CommandType type) {
    return build_query(context, std::move(text), parameters, type)
        .execute_non_query_async(std::move(token));
}

} // namespace sqlgraph::data
