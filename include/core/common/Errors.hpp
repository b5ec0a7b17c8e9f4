#pragma once

#include <stdexcept>
#include <string>

namespace cachepilot {
namespace core {

// Ошибка чтения/записи хранилища. Компоненты ловят её и пишут в лог
class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& message) : std::runtime_error(message) {}
};

// Ошибка выполнения запроса, пробрасывается вызывающему executeQuery/batchQuery
class QueryExecutionError : public std::runtime_error {
public:
    QueryExecutionError(const std::string& queryId, const std::string& message)
        : std::runtime_error(message), queryId_(queryId) {}
    const std::string& queryId() const { return queryId_; }
private:
    std::string queryId_;
};

} // namespace core
} // namespace cachepilot
