#include "crud_service.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <exception>

namespace sqlgraph::graph {

using data::PollStatus;

namespace {

// Keeps the connection alive for as long as the operation using it. The
// operation is destroyed first, so an abandoned execution can still cancel
// and close on a live connection.
template<typename T>
AsyncOperation<T> holding(std::shared_ptr<DbConnection> connection, AsyncOperation<T> operation) {
    struct Holder {
        std::shared_ptr<DbConnection> connection;
        AsyncOperation<T> operation;
    };
    auto holder = std::make_shared<Holder>(Holder{std::move(connection), std::move(operation)});
    return AsyncOperation<T>([holder](T& result) {
        if (PollStatus status = holder->operation.poll(); status != PollStatus::Ready) {
            return status;
        }
        result = holder->operation.result();
        return PollStatus::Ready;
    });
}

ParameterBag endpoint_bag(const SqlValue& from_id, const SqlValue& to_id) {
    ParameterBag ids;
    if (!data::is_null(from_id)) {
        ids.set(kFromIdParam, from_id);
    }
    if (!data::is_null(to_id)) {
        ids.set(kToIdParam, to_id);
    }
    return ids;
}

bool is_empty(const OptionalBag& bag) {
    return !bag || bag->empty();
}

AsyncOperation<int64_t> nothing_done() {
    return AsyncOperation<int64_t>::from_result(0);
}

} // anonymous namespace

CrudService::CrudService(ConnectionFactory factory, int timeout_seconds)
    : factory_(std::move(factory)), timeout_seconds_(timeout_seconds) {
    if (!factory_) {
        throw core::ContractViolation("Connection factory must not be empty");
    }
}

CrudService::~CrudService() {
    try {
        release_resources();
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Failed to release resources: ") + e.what());
    }
}

std::shared_ptr<DbConnection> CrudService::connect() {
    std::shared_ptr<DbConnection> connection = factory_();
    if (!connection) {
        throw core::InvalidStateError("Connection factory returned no connection");
    }

    // Forget connections whose operations are gone
    connections_.erase(std::remove_if(connections_.begin(), connections_.end(),
                                      [](const std::weak_ptr<DbConnection>& c) { return c.expired(); }),
                       connections_.end());
    connections_.push_back(connection);
    return connection;
}

data::ExecutionContext CrudService::context_for(DbConnection& connection) const {
    return data::ExecutionContext(connection, nullptr, timeout_seconds_);
}

void CrudService::release_resources() {
    std::exception_ptr first_failure;
    for (auto& weak : connections_) {
        auto connection = weak.lock();
        if (!connection || !connection->is_open()) {
            continue;
        }
        LOG_INFO("Closing connection of an operation that did not complete");
        try {
            connection->close();
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("Failed to close connection: ") + e.what());
            if (!first_failure) {
                first_failure = std::current_exception();
            }
        }
    }
    connections_.clear();
    if (first_failure) {
        std::rethrow_exception(first_failure);
    }
}

AsyncOperation<int64_t> CrudService::non_query_async(std::string text, std::vector<ParameterBag> bags,
                                                     CancellationToken token) {
    auto connection = connect();
    data::QueryExecutor executor(context_for(*connection), std::move(text));
    for (const auto& bag : bags) {
        executor.add_parameters(bag);
    }
    return holding(connection, executor.execute_non_query_async(std::move(token)));
}

SqlValue CrudService::resolve_node_id(GraphEntityReference& reference) {
    if (reference.resolved) {
        return reference.id;
    }

    if (is_empty(reference.parameters)) {
        reference.id = SqlValue{};
    } else if (auto id = GraphQuerySynthesizer::find_identifier(reference.parameters)) {
        reference.id = *id;
    } else {
        core::require_name(reference.table, "Node table");
        auto connection = connect();
        reference.id = data::execute_scalar<SqlValue>(
            context_for(*connection),
            GraphQuerySynthesizer::build_node_id_query(reference.table, *reference.parameters),
            reference.parameters);
    }
    reference.resolved = true;
    return reference.id;
}

AsyncOperation<SqlValue> CrudService::resolve_node_id_async(GraphEntityReference reference,
                                                            CancellationToken token) {
    if (reference.resolved) {
        return AsyncOperation<SqlValue>::from_result(reference.id);
    }
    if (is_empty(reference.parameters)) {
        return AsyncOperation<SqlValue>::from_result(SqlValue{});
    }
    if (auto id = GraphQuerySynthesizer::find_identifier(reference.parameters)) {
        return AsyncOperation<SqlValue>::from_result(*id);
    }

    core::require_name(reference.table, "Node table");
    auto connection = connect();
    auto executor = data::build_query(
        context_for(*connection),
        GraphQuerySynthesizer::build_node_id_query(reference.table, *reference.parameters),
        reference.parameters);
    return holding(connection, executor.execute_scalar_async<SqlValue>(std::move(token)));
}

AsyncOperation<int64_t> CrudService::with_endpoints(
    GraphEntityReference from, GraphEntityReference to, CancellationToken token,
    std::function<AsyncOperation<int64_t>(const SqlValue&, const SqlValue&)> next) {
    return data::then<int64_t>(
        resolve_node_id_async(std::move(from), token),
        [this, to = std::move(to), token, next = std::move(next)](const SqlValue& from_id) {
            return data::then<int64_t>(resolve_node_id_async(to, token),
                                       [from_id, next](const SqlValue& to_id) { return next(from_id, to_id); });
        });
}

bool CrudService::any_node(const std::string& node, const OptionalBag& parameters) {
    core::require_name(node, "Node table");
    if (is_empty(parameters)) {
        return false;
    }

    auto connection = connect();
    std::string query = GraphQuerySynthesizer::build_exists(
        node, GraphQuerySynthesizer::build_where_clause(parameters));
    return data::execute_scalar<int64_t>(context_for(*connection), query, parameters) > 0;
}

bool CrudService::any_edge(const std::string& edge, GraphEntityReference from,
                           GraphEntityReference to, const OptionalBag& parameters) {
    core::require_name(edge, "Edge table");
    if (!parameters) {
        return false;
    }

    SqlValue from_id = resolve_node_id(from);
    SqlValue to_id = resolve_node_id(to);
    if (data::is_null(from_id) && data::is_null(to_id)) {
        LOG_DEBUG("Neither endpoint of " + edge + " resolved");
        return false;
    }

    std::string query = GraphQuerySynthesizer::build_exists(
        edge, GraphQuerySynthesizer::build_edge_where_clause(from_id, to_id, parameters));

    auto connection = connect();
    data::QueryExecutor executor(context_for(*connection), query);
    executor.add_parameters(endpoint_bag(from_id, to_id)).add_parameters(*parameters);
    return executor.execute_scalar<int64_t>() > 0;
}

int64_t CrudService::insert_node(const std::string& node, const OptionalBag& parameters) {
    core::require_name(node, "Node table");
    if (is_empty(parameters)) {
        return 0;
    }

    auto connection = connect();
    return data::execute_non_query(context_for(*connection),
                                   GraphQuerySynthesizer::build_insert(node, *parameters, true),
                                   parameters);
}

AsyncOperation<int64_t> CrudService::insert_node_async(const std::string& node,
                                                       const OptionalBag& parameters,
                                                       CancellationToken token) {
    core::require_name(node, "Node table");
    if (is_empty(parameters)) {
        return nothing_done();
    }
    return non_query_async(GraphQuerySynthesizer::build_insert(node, *parameters), {*parameters},
                           std::move(token));
}

AsyncOperation<int64_t> CrudService::insert_edge_async(const std::string& edge,
                                                       GraphEntityReference from,
                                                       GraphEntityReference to,
                                                       const OptionalBag& parameters,
                                                       CancellationToken token) {
    core::require_name(edge, "Edge table");
    if (!parameters) {
        return nothing_done();
    }

    return with_endpoints(
        std::move(from), std::move(to), token,
        [this, edge, parameters, token](const SqlValue& from_id, const SqlValue& to_id) {
            if (data::is_null(from_id) || data::is_null(to_id)) {
                LOG_WARN("Edge " + edge + " not inserted: endpoint not found");
                return nothing_done();
            }
            return non_query_async(GraphQuerySynthesizer::build_edge_insert(edge, parameters),
                                   {endpoint_bag(from_id, to_id), *parameters}, token);
        });
}

AsyncOperation<int64_t> CrudService::update_node_async(const std::string& node,
                                                       const OptionalBag& parameters,
                                                       const OptionalBag& where_parameters,
                                                       CancellationToken token) {
    core::require_name(node, "Node table");
    if (is_empty(parameters)) {
        return nothing_done();
    }
    auto assignments = GraphQuerySynthesizer::build_assignments(*parameters);
    if (assignments.empty()) {
        LOG_DEBUG("Update of " + node + " has no non-null value to assign");
        return nothing_done();
    }

    std::vector<ParameterBag> bags{*parameters};
    if (where_parameters) {
        bags.push_back(where_parameters->with_prefix(kWherePrefix));
    }
    std::string where = GraphQuerySynthesizer::build_where_clause(where_parameters, true, kWherePrefix);
    return non_query_async(GraphQuerySynthesizer::build_update(node, assignments, where),
                           std::move(bags), std::move(token));
}

AsyncOperation<int64_t> CrudService::update_node_by_node_id_async(const std::string& node,
                                                                  const OptionalBag& parameters,
                                                                  const SqlValue& node_id,
                                                                  CancellationToken token) {
    core::require_name(node, "Node table");
    if (is_empty(parameters)) {
        return nothing_done();
    }
    if (data::is_null(node_id)) {
        throw core::ContractViolation("Node id must not be null");
    }
    auto assignments = GraphQuerySynthesizer::build_assignments(*parameters);
    if (assignments.empty()) {
        return nothing_done();
    }

    ParameterBag id;
    id.set(kNodeIdParam, node_id);
    std::string where = std::string(" WHERE $node_id = @") + kNodeIdParam;
    return non_query_async(GraphQuerySynthesizer::build_update(node, assignments, where),
                           {*parameters, id}, std::move(token));
}

AsyncOperation<int64_t> CrudService::update_edge_async(const std::string& edge,
                                                       GraphEntityReference from,
                                                       GraphEntityReference to,
                                                       const OptionalBag& parameters,
                                                       const OptionalBag& where_parameters,
                                                       CancellationToken token) {
    core::require_name(edge, "Edge table");
    if (!parameters) {
        return nothing_done();
    }
    auto assignments = GraphQuerySynthesizer::build_assignments(*parameters);
    if (assignments.empty()) {
        return nothing_done();
    }

    return with_endpoints(
        std::move(from), std::move(to), token,
        [this, edge, parameters, where_parameters, assignments, token](const SqlValue& from_id,
                                                                       const SqlValue& to_id) {
            if (data::is_null(from_id) || data::is_null(to_id)) {
                LOG_DEBUG("Edge " + edge + " not updated: endpoint not found");
                return nothing_done();
            }
            std::vector<ParameterBag> bags{endpoint_bag(from_id, to_id), *parameters};
            if (where_parameters) {
                bags.push_back(where_parameters->with_prefix(kWherePrefix));
            }
            std::string where = GraphQuerySynthesizer::build_edge_where_clause(
                from_id, to_id, where_parameters, kWherePrefix);
            return non_query_async(GraphQuerySynthesizer::build_update(edge, assignments, where),
                                   std::move(bags), token);
        });
}

AsyncOperation<int64_t> CrudService::delete_node_async(const std::string& node,
                                                       const OptionalBag& parameters,
                                                       CancellationToken token) {
    core::require_name(node, "Node table");
    if (is_empty(parameters)) {
        return nothing_done();
    }
    return non_query_async(GraphQuerySynthesizer::build_delete(
                               node, GraphQuerySynthesizer::build_where_clause(parameters)),
                           {*parameters}, std::move(token));
}

AsyncOperation<int64_t> CrudService::delete_edge_async(const std::string& edge,
                                                       GraphEntityReference from,
                                                       GraphEntityReference to,
                                                       const OptionalBag& parameters,
                                                       CancellationToken token) {
    core::require_name(edge, "Edge table");
    if (!parameters) {
        return nothing_done();
    }

    return with_endpoints(
        std::move(from), std::move(to), token,
        [this, edge, parameters, token](const SqlValue& from_id, const SqlValue& to_id) {
            if (data::is_null(from_id) || data::is_null(to_id)) {
                LOG_DEBUG("Edge " + edge + " not deleted: endpoint not found");
                return nothing_done();
            }
            return delete_edge_async(edge, parameters, from_id, to_id, token);
        });
}

AsyncOperation<int64_t> CrudService::delete_edge_async(const std::string& edge,
                                                       const OptionalBag& parameters,
                                                       const SqlValue& from_id,
                                                       const SqlValue& to_id,
                                                       CancellationToken token) {
    core::require_name(edge, "Edge table");
    std::string where = GraphQuerySynthesizer::build_edge_where_clause(from_id, to_id, parameters);
    if (where.empty()) {
        return nothing_done();
    }

    std::vector<ParameterBag> bags{endpoint_bag(from_id, to_id)};
    if (parameters) {
        bags.push_back(*parameters);
    }
    return non_query_async(GraphQuerySynthesizer::build_delete(edge, where), std::move(bags),
                           std::move(token));
}

AsyncOperation<int64_t> CrudService::delete_by_id_async(const std::string& entity, const SqlValue& id,
                                                        bool is_node, CancellationToken token) {
    core::require_name(entity, "Table");
    if (data::is_null(id)) {
        throw core::ContractViolation("Identifier must not be null");
    }

    ParameterBag bag;
    bag.set(kIdParam, id);
    return non_query_async(GraphQuerySynthesizer::build_delete_by_id(entity, is_node), {bag},
                           std::move(token));
}

} // namespace sqlgraph::graph
