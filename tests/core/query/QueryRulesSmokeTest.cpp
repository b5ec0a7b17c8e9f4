#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include "core/query/QueryRules.hpp"

using namespace cachepilot::core::query;

namespace {

bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) < eps;
}

bool hasIssue(const QueryAnalysis& analysis, const std::string& ruleId) {
    return std::any_of(analysis.issues.begin(), analysis.issues.end(),
                       [&ruleId](const QueryIssue& issue) { return issue.ruleId == ruleId; });
}

bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

} // namespace

void testRuleTable() {
    std::cout << "Testing optimization rule table...\n";

    const auto& rules = optimizationRules();
    assert(rules.size() == 8);
    assert(rules.front().id == "select_star");
    assert(rules.back().id == "missing_limit");
    size_t withAutoFix = std::count_if(rules.begin(), rules.end(),
                                       [](const QueryOptimizationRule& r) { return static_cast<bool>(r.autoFix); });
    assert(withAutoFix == 1);

    std::cout << "[OK] rule table test\n";
}

void testAnalyzeQuery() {
    std::cout << "Testing static query analysis...\n";

    auto star = analyzeQuery("SELECT * FROM pets");
    assert(star.issues.size() == 1);
    assert(star.issues[0].ruleId == "select_star");
    assert(star.issues[0].severity == "medium");
    assert(near(star.optimizationScore, 9.4));

    auto clean = analyzeQuery("SELECT name FROM pets WHERE id = ?");
    assert(clean.issues.empty());
    assert(near(clean.optimizationScore, 10.0));
    assert(near(clean.estimatedTime, 50.0));
    assert(contains(clean.indexSuggestions, "CREATE INDEX idx_pets_id ON pets(id)"));

    // Повторный анализ даёт тот же результат
    assert(analyzeQuery("SELECT * FROM pets").toJson() == star.toJson());

    assert(hasIssue(analyzeQuery("DELETE FROM pets"), "missing_where"));
    assert(!hasIssue(analyzeQuery("DELETE FROM pets WHERE id = 1"), "missing_where"));
    assert(!hasIssue(analyzeQuery("SELECT name FROM pets"), "missing_where"));
    assert(hasIssue(analyzeQuery("SELECT name FROM pets WHERE LOWER(name) = 'rex'"), "function_in_where"));
    assert(!hasIssue(analyzeQuery("SELECT name FROM pets WHERE EXISTS (SELECT 1 FROM owners)"), "function_in_where"));
    assert(hasIssue(analyzeQuery("SELECT name FROM pets WHERE id != 3"), "not_equals"));
    assert(hasIssue(analyzeQuery("SELECT name FROM pets WHERE a = 1 OR b = 2 OR c = 3"), "or_conditions"));
    assert(hasIssue(analyzeQuery("SELECT name FROM pets WHERE name LIKE '%rex'"), "like_prefix"));
    assert(!hasIssue(analyzeQuery("SELECT name FROM pets WHERE name LIKE 'rex%'"), "like_prefix"));
    assert(hasIssue(analyzeQuery("SELECT name, (SELECT COUNT(*) FROM visits) FROM pets"), "subquery_in_select"));
    assert(hasIssue(analyzeQuery("SELECT name FROM pets ORDER BY name"), "missing_limit"));
    assert(!hasIssue(analyzeQuery("SELECT name FROM pets ORDER BY name LIMIT 10"), "missing_limit"));

    auto worst = analyzeQuery("SELECT * FROM pets WHERE LOWER(name) LIKE '%rex' ORDER BY name");
    assert(worst.issues.size() == 4);
    assert(near(worst.optimizationScore, 10.0 - 0.6 - 0.8 - 0.8 - 0.4));
    assert(near(worst.estimatedTime, 110.0));

    std::cout << "[OK] static query analysis test\n";
}

void testNormalizationAndIds() {
    std::cout << "Testing query normalization...\n";

    assert(normalizeQuery("  SELECT *   FROM pets\n WHERE id = 42 AND name = 'Rex' ") ==
           "select * from pets where id = ? and name = ?");

    std::string sql = "SELECT name FROM pets WHERE id = ?";
    std::string id = makeQueryId(sql, nlohmann::json::array({1}));
    assert(id.size() == 16);
    assert(id == makeQueryId("select name  from pets where id = ?", nlohmann::json::array({1})));
    assert(id != makeQueryId(sql, nlohmann::json::array({2})));
    assert(makeQueryId(sql, nlohmann::json::array()) == makeQueryId(sql, nullptr));

    std::cout << "[OK] query normalization test\n";
}

void testRewrites() {
    std::cout << "Testing query rewriting...\n";

    assert(optimizeOrConditions("SELECT * FROM pets WHERE species = 'dog' OR species = 'cat'") ==
           "SELECT * FROM pets WHERE species IN ('dog', 'cat')");
    // Разные колонки не сворачиваются
    assert(optimizeOrConditions("SELECT * FROM pets WHERE species = 'dog' OR name = 'Rex'") ==
           "SELECT * FROM pets WHERE species = 'dog' OR name = 'Rex'");

    // autoFix применяется только при срабатывании правила (два OR и больше)
    assert(applyAutoFixes("SELECT * FROM pets WHERE species = 'dog' OR species = 'cat'") ==
           "SELECT * FROM pets WHERE species = 'dog' OR species = 'cat'");
    assert(applyAutoFixes("SELECT id FROM pets WHERE species = 'dog' OR species = 'cat' OR species = 'bird'") ==
           "SELECT id FROM pets WHERE species IN ('dog', 'cat') OR species = 'bird'");

    std::cout << "[OK] query rewriting test\n";
}

void testIndexSuggestions() {
    std::cout << "Testing index suggestions...\n";

    auto suggestions = generateIndexSuggestions(
        normalizeQuery("SELECT name FROM pets WHERE owner_id = 7 AND species = 'dog' ORDER BY name"));
    assert(suggestions.size() == 2);
    assert(suggestions[0] == "CREATE INDEX idx_pets_owner_id ON pets(owner_id)");
    assert(suggestions[1] == "CREATE INDEX idx_pets_species ON pets(species)");

    auto joins = generateIndexSuggestions("select * from pets join owners on pets.owner_id = owners.id");
    assert(contains(joins, "CREATE INDEX idx_pets_owner_id ON pets(owner_id)"));
    assert(contains(joins, "CREATE INDEX idx_owners_id ON owners(id)"));

    assert(generateIndexSuggestions("update pets set name = ?").empty());

    auto index = parseIndexSuggestion("CREATE INDEX idx_pets_species ON pets(species, owner_id)", 12);
    assert(index);
    assert(index->table == "pets");
    assert(index->columns.size() == 2);
    assert(index->columns[1] == "owner_id");
    assert(index->usage == 12);
    assert(index->type == "btree");
    assert(!parseIndexSuggestion("DROP INDEX idx_pets_species", 1));

    std::cout << "[OK] index suggestions test\n";
}

void testCachingAndScoring() {
    std::cout << "Testing cacheability and scoring...\n";

    auto rows = nlohmann::json::array({1, 2, 3});
    assert(isWriteStatement("  insert into pets values (1)"));
    assert(!isWriteStatement("SELECT * FROM updates"));
    assert(shouldCacheQuery("SELECT name FROM pets", rows, 10));
    assert(!shouldCacheQuery("UPDATE pets SET name = 'x' WHERE id = 1", rows, 10));
    assert(!shouldCacheQuery("SELECT NOW()", rows, 10));
    assert(!shouldCacheQuery("SELECT name FROM pets", rows, 2));

    assert(near(estimateQueryTime("SELECT a FROM t JOIN u ON t.id = u.id GROUP BY a ORDER BY a"), 290.0));
    assert(near(estimateQueryTime("SELECT a FROM t WHERE b IN (SELECT b FROM u)"), 250.0));

    assert(near(patternOptimizationScore("select * from pets", 1500.0, 1000.0), 5.4));
    assert(near(patternOptimizationScore("select name from pets where id = ?", 10.0, 1000.0), 10.0));

    std::cout << "[OK] cacheability and scoring test\n";
}

int main() {
    try {
        testRuleTable();
        testAnalyzeQuery();
        testNormalizationAndIds();
        testRewrites();
        testIndexSuggestions();
        testCachingAndScoring();
        std::cout << "All QueryRules tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "QueryRules test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
