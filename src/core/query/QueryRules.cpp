#include "core/query/QueryRules.hpp"
#include "core/common/Hash.hpp"
#include <algorithm>
#include <cctype>
#include <set>

namespace cachepilot {
namespace core {
namespace query {

namespace {

constexpr auto ICASE = std::regex::ECMAScript | std::regex::icase;

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return std::string();
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

QueryOptimizationRule makeRule(const char* id, const char* name, const char* description,
                               const char* pattern, const char* exclude, const char* severity,
                               const char* suggestion, double impact) {
    QueryOptimizationRule rule;
    rule.id = id;
    rule.name = name;
    rule.description = description;
    rule.pattern = std::regex(pattern, ICASE);
    if (exclude) {
        rule.exclude = std::regex(exclude, ICASE);
    }
    rule.severity = severity;
    rule.suggestion = suggestion;
    rule.impact = impact;
    return rule;
}

std::vector<QueryOptimizationRule> buildRules() {
    std::vector<QueryOptimizationRule> rules;
    rules.push_back(makeRule("select_star", "Avoid SELECT *",
        "SELECT * can be inefficient and return unnecessary data",
        R"(SELECT\s+\*\s+FROM)", nullptr, "medium",
        "Specify only the columns you need instead of using SELECT *", 6));
    rules.push_back(makeRule("missing_where", "Missing WHERE clause",
        "UPDATE or DELETE without WHERE clause touches every row",
        R"(^\s*(UPDATE|DELETE)\b)", R"(\bWHERE\b)", "high",
        "Add a WHERE clause to limit the affected rows", 8));
    rules.push_back(makeRule("function_in_where", "Function in WHERE clause",
        "Functions on columns in WHERE clause prevent index usage",
        R"(\b(WHERE|AND|OR)\s+(?!EXISTS\b|NOT\b)\w+\s*\()", nullptr, "high",
        "Avoid functions on columns in WHERE clause", 8));
    rules.push_back(makeRule("not_equals", "NOT EQUAL operator",
        "NOT EQUAL (!=, <>) operators can be slow",
        R"((!=|<>))", nullptr, "medium",
        "Consider using positive conditions instead of NOT EQUAL", 5));

    QueryOptimizationRule orRule = makeRule("or_conditions", "Multiple OR conditions",
        "Multiple OR conditions can prevent efficient index usage",
        R"(\bOR\b[\s\S]*\bOR\b)", nullptr, "medium",
        "Consider using UNION or IN clause instead of multiple ORs", 6);
    orRule.autoFix = optimizeOrConditions;
    rules.push_back(std::move(orRule));

    rules.push_back(makeRule("like_prefix", "LIKE with leading wildcard",
        "LIKE patterns starting with % prevent index usage",
        R"(LIKE\s+['"]%)", nullptr, "high",
        "Avoid leading wildcards in LIKE patterns", 8));
    rules.push_back(makeRule("subquery_in_select", "Subquery in SELECT",
        "Subqueries in the SELECT list can be inefficient",
        R"(^\s*SELECT\s+((?!\bFROM\b)[\s\S])*\(\s*SELECT\b)", nullptr, "medium",
        "Consider using JOINs instead of subqueries in SELECT", 7));
    rules.push_back(makeRule("missing_limit", "Missing LIMIT clause",
        "Sorted queries without LIMIT may return too many rows",
        R"(^\s*SELECT\b[\s\S]*\bORDER\s+BY\b)", R"(\bLIMIT\b)", "low",
        "Add LIMIT clause for large result sets", 4));
    return rules;
}

void pushUnique(std::vector<std::string>& out, std::set<std::string>& seen, const std::string& value) {
    if (seen.insert(value).second) {
        out.push_back(value);
    }
}

} // namespace

const std::vector<QueryOptimizationRule>& optimizationRules() {
    static const std::vector<QueryOptimizationRule> rules = buildRules();
    return rules;
}

bool ruleMatches(const QueryOptimizationRule& rule, const std::string& sql) {
    if (!std::regex_search(sql, rule.pattern)) {
        return false;
    }
    return !(rule.exclude && std::regex_search(sql, *rule.exclude));
}

std::string normalizeQuery(const std::string& sql) {
    static const std::regex numbers(R"(\b\d+\b)");
    static const std::regex strings(R"('[^']*')");
    static const std::regex spaces(R"(\s+)");
    std::string result = std::regex_replace(sql, numbers, "?");
    result = std::regex_replace(result, strings, "?");
    result = std::regex_replace(result, spaces, " ");
    return toLower(trim(result));
}

std::string makeQueryId(const std::string& sql, const nlohmann::json& params) {
    bool hasParams = (params.is_array() || params.is_object()) ? !params.empty() : !params.is_null();
    std::string raw = normalizeQuery(sql) + "_" + (hasParams ? params.dump() : std::string());
    return common::shortHash(raw, 16);
}

std::string optimizeOrConditions(const std::string& sql) {
    static const std::regex orPair(R"((\w+)\s*=\s*'([^']+)'\s+OR\s+(\w+)\s*=\s*'([^']+)')", ICASE);
    std::string result;
    auto last = sql.cbegin();
    for (std::sregex_iterator it(sql.begin(), sql.end(), orPair), end; it != end; ++it) {
        const std::smatch& m = *it;
        result.append(last, m[0].first);
        if (m[1].str() == m[3].str()) {
            result += m[1].str() + " IN ('" + m[2].str() + "', '" + m[4].str() + "')";
        } else {
            result += m[0].str();
        }
        last = m[0].second;
    }
    result.append(last, sql.cend());
    return result;
}

std::string applyAutoFixes(const std::string& sql) {
    std::string result = sql;
    for (const auto& rule : optimizationRules()) {
        if (rule.autoFix && ruleMatches(rule, result)) {
            result = rule.autoFix(result);
        }
    }
    return result;
}

std::vector<std::string> generateIndexSuggestions(const std::string& pattern) {
    static const std::regex fromRe(R"(\bfrom\s+(\w+))", ICASE);
    static const std::regex whereRe(R"(\bwhere\s+([\s\S]*?)(\bgroup\s+by\b|\border\s+by\b|\blimit\b|$))", ICASE);
    static const std::regex columnRe(R"((?:(\w+)\.)?(\w+)\s*(=|<|>|!=|\blike\b|\bin\b))", ICASE);
    static const std::regex joinRe(
        R"(\bjoin\s+\w+(?:\s+(?:as\s+)?\w+)?\s+on\s+(\w+)\.(\w+)\s*=\s*(\w+)\.(\w+))", ICASE);
    static const std::set<std::string> keywords = {"and", "or", "not", "where", "select", "in", "like", "is", "null"};

    std::vector<std::string> suggestions;
    std::set<std::string> seen;

    std::vector<std::string> tables;
    for (std::sregex_iterator it(pattern.begin(), pattern.end(), fromRe), end; it != end; ++it) {
        tables.push_back((*it)[1].str());
    }
    if (tables.empty()) {
        return suggestions;
    }

    std::vector<std::string> columns;
    std::set<std::string> seenColumns;
    for (std::sregex_iterator it(pattern.begin(), pattern.end(), whereRe), end; it != end; ++it) {
        std::string clause = (*it)[1].str();
        for (std::sregex_iterator c(clause.begin(), clause.end(), columnRe), cend; c != cend; ++c) {
            std::string column = toLower((*c)[2].str());
            bool numeric = std::all_of(column.begin(), column.end(), [](unsigned char ch) { return std::isdigit(ch); });
            if (numeric || keywords.count(column)) {
                continue;
            }
            pushUnique(columns, seenColumns, column);
        }
    }
    for (const auto& table : tables) {
        for (const auto& column : columns) {
            pushUnique(suggestions, seen, "CREATE INDEX idx_" + table + "_" + column + " ON " + table + "(" + column + ")");
        }
    }

    for (std::sregex_iterator it(pattern.begin(), pattern.end(), joinRe), end; it != end; ++it) {
        const std::smatch& m = *it;
        pushUnique(suggestions, seen, "CREATE INDEX idx_" + m[1].str() + "_" + m[2].str() + " ON " + m[1].str() + "(" + m[2].str() + ")");
        pushUnique(suggestions, seen, "CREATE INDEX idx_" + m[3].str() + "_" + m[4].str() + " ON " + m[3].str() + "(" + m[4].str() + ")");
    }
    return suggestions;
}

std::optional<DatabaseIndex> parseIndexSuggestion(const std::string& suggestion, uint64_t usage) {
    static const std::regex indexRe(R"(CREATE INDEX (\w+) ON (\w+)\(([^)]+)\))");
    std::smatch m;
    if (!std::regex_search(suggestion, m, indexRe)) {
        return std::nullopt;
    }
    DatabaseIndex idx;
    idx.table = m[2].str();
    std::string columns = m[3].str();
    size_t start = 0;
    while (start <= columns.size()) {
        size_t comma = columns.find(',', start);
        std::string column = trim(columns.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
        if (!column.empty()) {
            idx.columns.push_back(column);
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    idx.usage = usage;
    return idx;
}

bool isWriteStatement(const std::string& sql) {
    static const std::regex writeRe(R"(^\s*(INSERT|UPDATE|DELETE)\b)", ICASE);
    return std::regex_search(sql, writeRe);
}

bool shouldCacheQuery(const std::string& sql, const nlohmann::json& result, size_t maxResultSetSize) {
    static const std::regex volatileRe(R"(NOW\(\)|CURRENT_TIMESTAMP)", ICASE);
    if (isWriteStatement(sql)) {
        return false;
    }
    if (result.is_array() && result.size() > maxResultSetSize) {
        return false;
    }
    return !std::regex_search(sql, volatileRe);
}

double estimateQueryTime(const std::string& sql) {
    std::string lower = toLower(sql);
    double time = 50.0;
    if (lower.find("join") != std::string::npos) time += 100.0;
    if (lower.find("group by") != std::string::npos) time += 80.0;
    if (lower.find("order by") != std::string::npos) time += 60.0;
    if (lower.find("subquery") != std::string::npos || lower.find("(select") != std::string::npos) time += 200.0;
    return time;
}

double patternOptimizationScore(const std::string& pattern, double averageExecutionTime, double slowQueryThreshold) {
    double score = 10.0;
    if (averageExecutionTime > slowQueryThreshold) {
        score -= 4.0;
    }
    for (const auto& rule : optimizationRules()) {
        if (ruleMatches(rule, pattern)) {
            score -= rule.impact * 0.1;
        }
    }
    return std::clamp(score, 0.0, 10.0);
}

QueryAnalysis analyzeQuery(const std::string& sql) {
    QueryAnalysis analysis;
    double score = 10.0;
    for (const auto& rule : optimizationRules()) {
        if (ruleMatches(rule, sql)) {
            analysis.issues.push_back({rule.id, rule.name, rule.severity, rule.suggestion});
            score -= rule.impact * 0.1;
        }
    }
    analysis.optimizationScore = std::clamp(score, 0.0, 10.0);
    analysis.estimatedTime = estimateQueryTime(sql);
    analysis.indexSuggestions = generateIndexSuggestions(normalizeQuery(sql));
    return analysis;
}

} // namespace query
} // namespace core
} // namespace cachepilot
