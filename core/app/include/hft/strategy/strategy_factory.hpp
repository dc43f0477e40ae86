#pragma once

#include "hft/concurrent/order_id_generator.hpp"
#include "hft/config/pipeline_config.hpp"
#include "hft/strategy/i_strategy.hpp"

#include <memory>

namespace hft {

// Builds the strategy named by config.strategy. Both arguments must outlive
// the returned strategy.
std::unique_ptr<IStrategy> makeStrategy(const PipelineConfig& config,
                                        OrderIdGenerator& id_gen);

}  // namespace hft
