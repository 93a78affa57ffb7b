#include "execution/order_gateway.hpp"
#include <algorithm>
#include <chrono>
#include <thread>
#include <spdlog/spdlog.h>

namespace hedge {

RetryingGateway::RetryingGateway(std::shared_ptr<OrderGateway> inner,
                                 const ExecutionConfig& config,
                                 Sleeper sleeper)
    : inner_(std::move(inner))
    , max_attempts_(std::max(1, config.max_attempts))
    , backoff_ms_(config.retry_backoff_ms)
    , sleep_(std::move(sleeper)) {
    if (!sleep_) {
        sleep_ = [](int ms) {
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
        };
    }
}

OrderResponse RetryingGateway::submit(const OrderRequest& request) {
    std::string last_error;

    for (int attempt = 1; attempt <= max_attempts_; ++attempt) {
        try {
            OrderResponse response = inner_->submit(request);
            response.attempts = attempt;
            return response;
        } catch (const TransportError& e) {
            last_error = e.what();
            spdlog::warn("Order attempt {}/{} failed: {}", attempt, max_attempts_, last_error);
        }

        if (attempt < max_attempts_) {
            sleep_(backoff_ms_);
        }
    }

    spdlog::error("Order abandoned after {} attempts: {}", max_attempts_, last_error);

    OrderResponse failed;
    failed.success = false;
    failed.error_message = last_error;
    failed.attempts = max_attempts_;
    return failed;
}

OrderResponse PaperGateway::submit(const OrderRequest& request) {
    OrderResponse response;
    response.success = true;
    response.order_id = id_prefix_ + std::to_string(++counter_);
    response.attempts = 1;

    spdlog::info("[PAPER] {} {:.0f} @ {:.3f} token={} -> {}",
                 side_to_string(request.side), request.size, request.price,
                 request.token_id, response.order_id);
    return response;
}

} // namespace hedge
