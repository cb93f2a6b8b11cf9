#include "SchemaFormatter.hpp"
#include "FormatConverter.hpp"
#include <cstdio>
#include <sstream>

namespace querymind {

namespace {

const std::string kHeavyRule(SchemaFormatter::RULE_WIDTH, '=');
const std::string kLightRule(SchemaFormatter::RULE_WIDTH, '-');

std::string upper(const std::string& text) {
    std::string result = text;
    for (auto& c : result) {
        if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    }
    return result;
}

std::string joinNames(const std::vector<std::string>& names) {
    std::string result;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) result += ", ";
        result += names[i];
    }
    return result;
}

std::string percentage(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    return buf;
}

void writeRelationshipDiagram(std::ostringstream& out, const Snapshot& snapshot) {
    out << "\n" << kHeavyRule << "\n";
    out << "DATABASE RELATIONSHIP DIAGRAM\n";
    out << kHeavyRule << "\n\n";

    if (snapshot.relationships.empty()) {
        out << "No foreign key relationships found in the database.\n\n";
        return;
    }

    for (const auto& [table, edges] : snapshot.relationships) {
        out << "\n" << upper(table) << "\n";
        for (const auto& edge : edges) {
            out << "   └─→ " << edge.fromColumn << " references "
                << edge.toTable << "." << edge.toColumn << "\n";
        }
    }
    out << "\n" << kHeavyRule << "\n\n";
}

void writeSampleRows(std::ostringstream& out, const std::vector<SampleRow>& rows) {
    for (size_t i = 0; i < rows.size(); ++i) {
        out << "  Row " << (i + 1) << ": " << SchemaFormatter::formatRow(rows[i]) << "\n";
    }
}

void writeTable(std::ostringstream& out, const std::string& name, const TableMeta& table) {
    out << "\n" << kHeavyRule << "\n";
    out << "TABLE: " << name << "\n";
    out << kHeavyRule << "\n";
    out << "Type: " << table.tableType << "\n";
    out << "Row Count: ~" << SchemaFormatter::groupThousands(table.rowCount) << "\n";
    out << "Size: " << table.tableSize << "\n";

    if (table.comment && !table.comment->empty()) {
        out << "Description: " << *table.comment << "\n";
    }

    if (!table.primaryKeys.empty()) {
        out << "\nPrimary Key(s): " << joinNames(table.primaryKeys) << "\n";
    }

    out << "\nCOLUMNS (" << table.columns.size() << "):\n";
    for (const auto& col : table.columns) {
        const ColumnStats* stats = nullptr;
        if (table.columnStatistics) {
            auto it = table.columnStatistics->find(col.name);
            if (it != table.columnStatistics->end()) {
                stats = &it->second;
            }
        }
        out << SchemaFormatter::formatColumn(col, stats) << "\n";
    }

    if (!table.foreignKeys.empty()) {
        out << "\nFOREIGN KEYS:\n";
        for (const auto& fk : table.foreignKeys) {
            out << "  • " << fk.column << " → " << fk.foreignTable << "." << fk.foreignColumn << "\n";
            out << "    ON UPDATE: " << referentialActionToString(fk.onUpdate)
                << ", ON DELETE: " << referentialActionToString(fk.onDelete) << "\n";
        }
    }

    if (!table.indexes.empty()) {
        out << "\nINDEXES:\n";
        for (const auto& idx : table.indexes) {
            out << "  • " << idx.name << " (" << SchemaFormatter::indexRole(idx) << ", "
                << (idx.type.empty() ? "btree" : idx.type) << ") on ["
                << joinNames(idx.columns) << "]\n";
        }
    }

    if (table.sampleData && !table.sampleData->empty()) {
        out << "\nSAMPLE DATA (first " << table.sampleData->size() << " rows):\n";
        writeSampleRows(out, *table.sampleData);
    }
}

void writeView(std::ostringstream& out, const std::string& name, const ViewMeta& view) {
    out << "\n" << kLightRule << "\n";
    out << "VIEW: " << name << "\n";
    out << kLightRule << "\n";
    out << "Type: " << view.viewType << "\n";

    if (view.comment && !view.comment->empty()) {
        out << "Description: " << *view.comment << "\n";
    }

    out << "\nDefinition:\n" << view.definition << "\n";

    out << "\nCOLUMNS (" << view.columns.size() << "):\n";
    for (const auto& col : view.columns) {
        out << "  • " << col.name << ": " << col.dataType << "\n";
    }

    if (view.sampleData && !view.sampleData->empty()) {
        out << "\nSAMPLE DATA:\n";
        writeSampleRows(out, *view.sampleData);
    }
}

}  // namespace

std::string SchemaFormatter::groupThousands(int64_t value) {
    std::string digits = std::to_string(value < 0 ? -value : value);
    std::string result;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) result.insert(result.begin(), ',');
        result.insert(result.begin(), *it);
        ++count;
    }
    return value < 0 ? "-" + result : result;
}

std::string SchemaFormatter::indexRole(const IndexMeta& index) {
    if (index.primary) return "PRIMARY KEY";
    if (index.unique) return "UNIQUE";
    return "INDEX";
}

std::string SchemaFormatter::formatRow(const SampleRow& row) {
    return row.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

std::string SchemaFormatter::formatColumn(const ColumnMeta& column, const ColumnStats* stats) {
    std::string line = "  • " + column.name + ": " + column.dataType;

    // A zero length or precision carries no information
    if (column.maxLength && *column.maxLength != 0) {
        line += "(" + std::to_string(*column.maxLength) + ")";
    } else if (column.numericPrecision && *column.numericPrecision != 0) {
        line += "(" + std::to_string(*column.numericPrecision);
        if (column.numericScale && *column.numericScale != 0) {
            line += "," + std::to_string(*column.numericScale);
        }
        line += ")";
    }

    line += column.nullable ? " NULL" : " NOT NULL";

    if (column.defaultValue && !column.defaultValue->empty()) {
        line += " DEFAULT " + *column.defaultValue;
    }

    if (stats && !stats->error) {
        line += " [Nulls: " + percentage(stats->nullPercentage) + "%, Distinct: " +
                std::to_string(stats->distinctCount) + "]";
    }

    if (column.comment && !column.comment->empty()) {
        line += "\n    Comment: " + *column.comment;
    }

    return line;
}

std::string SchemaFormatter::format(const Snapshot& snapshot) {
    if (snapshot.connectionFailed) {
        return "No metadata available. The database could not be reached.";
    }

    std::ostringstream out;

    out << "DATABASE: " << snapshot.databaseName << "\n";
    out << "Extracted: " << FormatConverter::formatTimestamp(snapshot.extractedAt) << "\n";
    out << "Total Tables: " << snapshot.totalTables() << "\n";
    out << "Total Views: " << snapshot.totalViews() << "\n\n";

    writeRelationshipDiagram(out, snapshot);

    out << kHeavyRule << "\n";
    out << "DETAILED SCHEMA INFORMATION\n";
    out << kHeavyRule << "\n";

    for (const auto& [name, table] : snapshot.tables) {
        writeTable(out, name, table);
    }

    if (!snapshot.views.empty()) {
        out << "\n\n" << kHeavyRule << "\n";
        out << "VIEWS AND MATERIALIZED VIEWS\n";
        out << kHeavyRule << "\n";
        for (const auto& [name, view] : snapshot.views) {
            writeView(out, name, view);
        }
    }

    std::string text = out.str();
    while (!text.empty() && text.back() == '\n') {
        text.pop_back();
    }
    return text;
}

}  // namespace querymind
