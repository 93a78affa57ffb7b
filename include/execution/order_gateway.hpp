#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include "common/types.hpp"
#include "config/config.hpp"

namespace hedge {

struct OrderRequest {
    std::string token_id;
    Side side{Side::BUY};
    Price price{0.0};
    Size size{0.0};
    OrderType type{OrderType::GTC};
};

struct OrderResponse {
    bool success{false};
    std::string order_id;
    std::string error_message;
    int attempts{0};
};

/**
 * Thrown by a gateway when the request never reached the venue
 * (connection refused, timeout). Only these are retried.
 */
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Order submission boundary. Signing and transport live behind it.
 */
class OrderGateway {
public:
    virtual ~OrderGateway() = default;

    virtual OrderResponse submit(const OrderRequest& request) = 0;
    virtual std::string name() const = 0;
};

/**
 * Wraps a gateway with the fixed-backoff retry policy.
 * A venue rejection is returned as-is; transport errors are retried up to
 * max_attempts times and then reported as a failed response.
 */
class RetryingGateway : public OrderGateway {
public:
    using Sleeper = std::function<void(int /*ms*/)>;

    RetryingGateway(std::shared_ptr<OrderGateway> inner,
                    const ExecutionConfig& config,
                    Sleeper sleeper = nullptr);

    OrderResponse submit(const OrderRequest& request) override;
    std::string name() const override { return "retrying(" + inner_->name() + ")"; }

private:
    std::shared_ptr<OrderGateway> inner_;
    int max_attempts_;
    int backoff_ms_;
    Sleeper sleep_;
};

/**
 * Simulated venue: every order fills immediately with a local id.
 */
class PaperGateway : public OrderGateway {
public:
    /**
     * Ids are id_prefix followed by a counter that starts at 1. Give each
     * process its own prefix so ids of reloaded positions stay unique.
     */
    explicit PaperGateway(std::string id_prefix = "paper-")
        : id_prefix_(std::move(id_prefix)) {}

    OrderResponse submit(const OrderRequest& request) override;
    std::string name() const override { return "paper"; }

    int64_t orders_submitted() const { return counter_.load(); }

private:
    std::string id_prefix_;
    std::atomic<int64_t> counter_{0};
};

} // namespace hedge
