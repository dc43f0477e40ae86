#include "hft/strategy/strategy_factory.hpp"
#include "hft/strategy/arbitrage_strategy.hpp"
#include "hft/strategy/market_making_strategy.hpp"

namespace hft {

std::unique_ptr<IStrategy> makeStrategy(const PipelineConfig& config,
                                        OrderIdGenerator& id_gen) {
  switch (config.strategy) {
    case StrategyKind::MarketMaking:
      return std::make_unique<MarketMakingStrategy>(config, id_gen);
    case StrategyKind::Arbitrage:
      return std::make_unique<ArbitrageStrategy>(config, id_gen);
  }
  throw ConfigError("[" + config.symbol + "] unsupported strategy kind");
}

}  // namespace hft
