#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/query/QueryTypes.hpp"

namespace cachepilot {
namespace core {
namespace query {

// Фиксированная упорядоченная таблица правил:
// select_star, missing_where, function_in_where, not_equals,
// or_conditions, like_prefix, subquery_in_select, missing_limit
const std::vector<QueryOptimizationRule>& optimizationRules();

bool ruleMatches(const QueryOptimizationRule& rule, const std::string& sql);

// Числа и строки в кавычках -> ?, пробелы схлопнуты, нижний регистр
std::string normalizeQuery(const std::string& sql);

// 16 hex SHA-256 от нормализованного текста и параметров
std::string makeQueryId(const std::string& sql, const nlohmann::json& params);

// a = 'x' OR a = 'y'  ->  a IN ('x', 'y')
std::string optimizeOrConditions(const std::string& sql);
std::string applyAutoFixes(const std::string& sql); // Только сработавшие правила с autoFix

std::vector<std::string> generateIndexSuggestions(const std::string& pattern);
std::optional<DatabaseIndex> parseIndexSuggestion(const std::string& suggestion, uint64_t usage);

bool isWriteStatement(const std::string& sql);
bool shouldCacheQuery(const std::string& sql, const nlohmann::json& result, size_t maxResultSetSize);
double estimateQueryTime(const std::string& sql); // Детерминированная оценка сложности, мс

// 10, -4 если медленный, -0.1*impact за каждое правило; в пределах [0,10]
double patternOptimizationScore(const std::string& pattern, double averageExecutionTime, double slowQueryThreshold);

QueryAnalysis analyzeQuery(const std::string& sql);

} // namespace query
} // namespace core
} // namespace cachepilot
