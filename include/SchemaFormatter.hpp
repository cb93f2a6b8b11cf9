#pragma once

#include "SchemaProber.hpp"
#include <string>

namespace querymind {

// Renders a Snapshot as the plain-text schema description handed to the
// language model. Output depends only on the snapshot, so the same snapshot
// always produces byte-identical text. Not cache-aware.
class SchemaFormatter {
public:
    static std::string format(const Snapshot& snapshot);

    // Same as format(); the name the query layer uses
    static std::string formatForAi(const Snapshot& snapshot) { return format(snapshot); }

    // "  • email: character varying(255) NOT NULL [Nulls: 0.00%, Distinct: 42]"
    static std::string formatColumn(const ColumnMeta& column, const ColumnStats* stats);

    // PRIMARY KEY, UNIQUE or INDEX; primary wins over unique
    static std::string indexRole(const IndexMeta& index);

    // 1234567 -> "1,234,567"
    static std::string groupThousands(int64_t value);

    // One-line JSON object, keys in query column order
    static std::string formatRow(const SampleRow& row);

    static constexpr size_t RULE_WIDTH = 80;
};

}  // namespace querymind
