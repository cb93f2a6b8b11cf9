#include "SqlGuard.hpp"
#include "ErrorHandler.hpp"
#include <algorithm>
#include <cctype>

namespace querymind {

namespace {

bool isWordChar(char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '_' || c == '$' || uc >= 0x80;
}

std::string trimWhitespace(const std::string& text) {
    auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

// Skip a quoted run starting at text[i] == quote; doubled quotes are escapes
size_t skipQuoted(const std::string& text, size_t i, char quote) {
    ++i;
    while (i < text.size()) {
        if (text[i] == quote) {
            if (i + 1 < text.size() && text[i + 1] == quote) {
                i += 2;
                continue;
            }
            return i + 1;
        }
        ++i;
    }
    return i;
}

// $tag$ ... $tag$; returns npos when text[i] does not open a dollar quote
size_t skipDollarQuoted(const std::string& text, size_t i) {
    size_t j = i + 1;

    // $1 is a parameter reference, not a tag
    if (j < text.size() && std::isdigit(static_cast<unsigned char>(text[j]))) {
        return std::string::npos;
    }
    while (j < text.size() && (std::isalnum(static_cast<unsigned char>(text[j])) || text[j] == '_')) {
        ++j;
    }
    if (j >= text.size() || text[j] != '$') {
        return std::string::npos;
    }

    std::string tag = text.substr(i, j - i + 1);
    size_t close = text.find(tag, j + 1);
    return close == std::string::npos ? text.size() : close + tag.size();
}

// Block comments nest in PostgreSQL
size_t skipBlockComment(const std::string& text, size_t i) {
    int depth = 0;
    while (i < text.size()) {
        if (text.compare(i, 2, "/*") == 0) {
            ++depth;
            i += 2;
        } else if (text.compare(i, 2, "*/") == 0) {
            i += 2;
            if (--depth == 0) return i;
        } else {
            ++i;
        }
    }
    return i;
}

}  // namespace

const std::vector<std::string>& SqlGuard::forbiddenKeywords() {
    static const std::vector<std::string> keywords = {
        "DROP", "DELETE", "UPDATE", "INSERT", "ALTER",
        "CREATE", "TRUNCATE", "GRANT", "REVOKE", "COPY"
    };
    return keywords;
}

std::string SqlGuard::clean(const std::string& text) {
    std::string sql = trimWhitespace(text);

    // Keep only the body of the first ``` fence, dropping any prose around it
    auto open = sql.find("```");
    if (open != std::string::npos) {
        sql = sql.substr(open + 3);
        auto close = sql.find("```");
        if (close != std::string::npos) {
            sql = sql.substr(0, close);
        }

        // Language tag right after the opening fence
        size_t tag_end = 0;
        while (tag_end < sql.size() && std::isalpha(static_cast<unsigned char>(sql[tag_end]))) {
            ++tag_end;
        }
        std::string tag = sql.substr(0, tag_end);
        std::transform(tag.begin(), tag.end(), tag.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if ((tag == "sql" || tag == "postgresql" || tag == "postgres" || tag == "pgsql") &&
            (tag_end == sql.size() || std::isspace(static_cast<unsigned char>(sql[tag_end])))) {
            sql = sql.substr(tag_end);
        }
    }

    sql = trimWhitespace(sql);
    while (!sql.empty() && sql.back() == ';') {
        sql.pop_back();
        sql = trimWhitespace(sql);
    }
    return sql;
}

std::vector<std::string> SqlGuard::tokens(const std::string& sql) {
    std::vector<std::string> words;
    size_t i = 0;

    while (i < sql.size()) {
        char c = sql[i];

        if (c == '\'' || c == '"') {
            i = skipQuoted(sql, i, c);
        } else if (c == '-' && i + 1 < sql.size() && sql[i + 1] == '-') {
            auto eol = sql.find('\n', i);
            i = eol == std::string::npos ? sql.size() : eol + 1;
        } else if (c == '/' && i + 1 < sql.size() && sql[i + 1] == '*') {
            i = skipBlockComment(sql, i);
        } else if (c == '$') {
            size_t end = skipDollarQuoted(sql, i);
            i = end == std::string::npos ? i + 1 : end;
        } else if (c == ';') {
            words.emplace_back(";");
            ++i;
        } else if (isWordChar(c)) {
            size_t start = i;
            while (i < sql.size() && isWordChar(sql[i])) ++i;

            // E'...' and similar prefixed literals: the prefix is not a word
            if (i < sql.size() && sql[i] == '\'' && i - start == 1) {
                continue;
            }

            std::string word = sql.substr(start, i - start);
            std::transform(word.begin(), word.end(), word.begin(),
                           [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
            words.push_back(std::move(word));
        } else {
            ++i;
        }
    }

    return words;
}

void SqlGuard::check(const std::string& sql) {
    auto words = tokens(sql);

    // A trailing separator is harmless
    while (!words.empty() && words.back() == ";") {
        words.pop_back();
    }

    if (words.empty()) {
        throw UnsafeQueryError("Generated SQL is empty");
    }

    if (std::find(words.begin(), words.end(), ";") != words.end()) {
        throw UnsafeQueryError("Only a single statement is allowed");
    }

    if (words.front() != "SELECT" && words.front() != "WITH") {
        throw UnsafeQueryError("Query must start with SELECT or WITH, got " + words.front());
    }

    const auto& forbidden = forbiddenKeywords();
    for (const auto& word : words) {
        if (std::find(forbidden.begin(), forbidden.end(), word) != forbidden.end()) {
            throw UnsafeQueryError("Query contains forbidden operation: " + word);
        }
    }
}

}  // namespace querymind
