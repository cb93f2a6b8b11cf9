#pragma once

#include "SchemaProber.hpp"
#include <map>
#include <string>
#include <vector>

namespace querymind {

// Groups foreign key rows by their source table.
// Tables with no outgoing foreign key are absent from the result; edges keep
// the order in which the rows were discovered and are not de-duplicated.
class RelationshipGrapher {
public:
    using Graph = std::map<std::string, std::vector<RelationshipEdge>>;

    static Graph build(const std::vector<ForeignKeyRow>& rows);

    // Tables referenced by at least one other table, for diagnostics
    static std::vector<std::string> referencedTables(const Graph& graph);
};

}  // namespace querymind
