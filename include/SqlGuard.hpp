#pragma once

#include <string>
#include <vector>

namespace querymind {

// Safety gate between the language model and the database.
//
// check() accepts a single SELECT (or WITH ... SELECT) statement. Keywords
// are matched as whole words outside string literals, quoted identifiers,
// dollar-quoted bodies and comments, so `created_at` or 'drop me' pass.
// The executor additionally runs every statement in a READ ONLY transaction.
class SqlGuard {
public:
    // Strip markdown code fences, surrounding whitespace and a trailing ';'
    static std::string clean(const std::string& text);

    // Throws UnsafeQueryError with the reason when the statement is rejected
    static void check(const std::string& sql);

    // Upper-cased words of @p sql outside literals and comments, in order.
    // A ";" entry marks each statement separator.
    static std::vector<std::string> tokens(const std::string& sql);

    static const std::vector<std::string>& forbiddenKeywords();
};

}  // namespace querymind
