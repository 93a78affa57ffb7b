#pragma once

#include <algorithm>
#include <cmath>
#include "common/types.hpp"
#include "config/config.hpp"

namespace hedge {

// Quote plus slippage, never above the hard ceiling, rounded to 0.001
inline Price limit_price_for(Price quoted, const ExecutionConfig& config) {
    double raw = std::min(config.max_limit_price, quoted + config.slippage);
    return std::round(raw * 1000.0) / 1000.0;
}

// floor(dollars / price) with the exchange's minimum share floor
inline Size shares_for(Notional dollars, Price limit_price, const ExecutionConfig& config) {
    if (limit_price <= 0.0) return 0.0;
    // Epsilon keeps 3.8 / 0.38 from flooring to 9
    double shares = std::floor(dollars / limit_price + 1e-9);
    return std::max(shares, static_cast<double>(config.min_shares));
}

} // namespace hedge
