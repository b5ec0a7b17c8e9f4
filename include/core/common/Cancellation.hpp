#pragma once

#include <atomic>
#include <memory>

namespace cachepilot {
namespace core {
namespace common {

// Токен отмены. Пустой токен никогда не отменяется
class CancellationToken {
public:
    CancellationToken() = default;
    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag) : flag_(std::move(flag)) {}
    bool isCancelled() const { return flag_ && flag_->load(); }
private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

class CancellationSource {
public:
    CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}
    CancellationToken token() const { return CancellationToken(flag_); }
    void cancel() { flag_->store(true); }
    bool isCancelled() const { return flag_->load(); }
private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace common
} // namespace core
} // namespace cachepilot
