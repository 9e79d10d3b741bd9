#ifndef INDICATOR_PROVIDER_HPP
#define INDICATOR_PROVIDER_HPP

#include <vector>
#include <memory>
#include "configs/indicator_config.hpp"
#include "trader/data_structures/data_structures.hpp"

namespace ConfluenceScalper {
namespace Core {

/**
 * Fills the derived feature set of a bar series in place.
 * Implementations must be causal: the features of bar i may only depend on bars 0..i.
 */
class IndicatorProviderInterface {
public:
    virtual ~IndicatorProviderInterface() = default;

    virtual void enrich(std::vector<Bar>& bars) const = 0;
};

using IndicatorProviderPtr = std::unique_ptr<IndicatorProviderInterface>;

// EMA, RSI, MACD, stochastic, ATR and Bollinger features followed by swing and trend structure
class TechnicalIndicatorProvider : public IndicatorProviderInterface {
public:
    explicit TechnicalIndicatorProvider(const Config::IndicatorConfig& indicator_config);

    void enrich(std::vector<Bar>& bars) const override;

private:
    const Config::IndicatorConfig& config;
};

} // namespace Core
} // namespace ConfluenceScalper

#endif // INDICATOR_PROVIDER_HPP
