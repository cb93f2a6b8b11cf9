#include "RelationshipGrapher.hpp"
#include <set>

namespace querymind {

RelationshipGrapher::Graph RelationshipGrapher::build(const std::vector<ForeignKeyRow>& rows) {
    Graph graph;
    for (const auto& row : rows) {
        graph[row.fromTable].push_back(RelationshipEdge{row.fromColumn, row.toTable, row.toColumn});
    }
    return graph;
}

std::vector<std::string> RelationshipGrapher::referencedTables(const Graph& graph) {
    std::set<std::string> targets;
    for (const auto& [table, edges] : graph) {
        for (const auto& edge : edges) {
            targets.insert(edge.toTable);
        }
    }
    return {targets.begin(), targets.end()};
}

}  // namespace querymind
