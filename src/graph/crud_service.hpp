#pragma once

#include "graph_query_synthesizer.hpp"
#include "data/query_helpers.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sqlgraph::graph {

using data::AsyncOperation;
using data::CancellationToken;
using data::DbConnection;

using ConnectionFactory = std::function<std::unique_ptr<DbConnection>()>;

/**
 * @brief Node and edge CRUD over SQL Server graph tables
 *
 * Every operation works on a fresh connection from the factory; the
 * executor opens it and closes it again when the operation ends.
 * Connections of operations still pending are closed by
 * release_resources() and on destruction. Operations returned by the
 * service must not outlive it.
 *
 * Operations given a null (or, for nodes, empty) parameter bag return 0 or
 * false without issuing a command.
 */
class CrudService {
public:
    explicit CrudService(ConnectionFactory factory, int timeout_seconds = 0);
    ~CrudService();

    CrudService(const CrudService&) = delete;
    CrudService& operator=(const CrudService&) = delete;

    // Existence checks
    bool any_node(const std::string& node, const OptionalBag& parameters);
    bool any_edge(const std::string& edge, GraphEntityReference from, GraphEntityReference to,
                  const OptionalBag& parameters);

    // Positional insert: values follow the table's declared column order
    int64_t insert_node(const std::string& node, const OptionalBag& parameters);
    AsyncOperation<int64_t> insert_node_async(const std::string& node, const OptionalBag& parameters,
                                              CancellationToken token = {});
    AsyncOperation<int64_t> insert_edge_async(const std::string& edge, GraphEntityReference from,
                                              GraphEntityReference to, const OptionalBag& parameters,
                                              CancellationToken token = {});

    AsyncOperation<int64_t> update_node_async(const std::string& node, const OptionalBag& parameters,
                                              const OptionalBag& where_parameters,
                                              CancellationToken token = {});
    AsyncOperation<int64_t> update_node_by_node_id_async(const std::string& node,
                                                         const OptionalBag& parameters,
                                                         const SqlValue& node_id,
                                                         CancellationToken token = {});
    AsyncOperation<int64_t> update_edge_async(const std::string& edge, GraphEntityReference from,
                                              GraphEntityReference to, const OptionalBag& parameters,
                                              const OptionalBag& where_parameters,
                                              CancellationToken token = {});

    AsyncOperation<int64_t> delete_node_async(const std::string& node, const OptionalBag& parameters,
                                              CancellationToken token = {});
    AsyncOperation<int64_t> delete_edge_async(const std::string& edge, GraphEntityReference from,
                                              GraphEntityReference to, const OptionalBag& parameters,
                                              CancellationToken token = {});
    // Endpoints already resolved; nothing is deleted without any predicate
    AsyncOperation<int64_t> delete_edge_async(const std::string& edge, const OptionalBag& parameters,
                                              const SqlValue& from_id, const SqlValue& to_id,
                                              CancellationToken token = {});
    AsyncOperation<int64_t> delete_by_id_async(const std::string& entity, const SqlValue& id,
                                               bool is_node = true, CancellationToken token = {});

    // Resolves the reference's identifier: a system column of its bag, or
    // else the $node_id selected by the bag. Null when nothing matched.
    SqlValue resolve_node_id(GraphEntityReference& reference);
    AsyncOperation<SqlValue> resolve_node_id_async(GraphEntityReference reference,
                                                   CancellationToken token = {});

    // Closes connections of operations that have not completed
    void release_resources();

    size_t tracked_connections() const noexcept { return connections_.size(); }

private:
    std::shared_ptr<DbConnection> connect();
    data::ExecutionContext context_for(DbConnection& connection) const;

    AsyncOperation<int64_t> non_query_async(std::string text, std::vector<ParameterBag> bags,
                                            CancellationToken token);
    AsyncOperation<int64_t> with_endpoints(GraphEntityReference from, GraphEntityReference to,
                                           CancellationToken token,
                                           std::function<AsyncOperation<int64_t>(const SqlValue&,
                                                                                 const SqlValue&)> next);

    ConnectionFactory factory_;
    int timeout_seconds_;
    std::vector<std::weak_ptr<DbConnection>> connections_;
};

} // namespace sqlgraph::graph
