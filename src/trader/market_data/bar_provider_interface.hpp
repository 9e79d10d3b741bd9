#ifndef BAR_PROVIDER_INTERFACE_HPP
#define BAR_PROVIDER_INTERFACE_HPP

#include "trader/data_structures/data_structures.hpp"
#include <vector>
#include <string>
#include <memory>

namespace ConfluenceScalper {
namespace MarketData {

/**
 * Source of closed bars and account state. Broker-side positions are translated
 * into BrokerPositionView so stop management never sees vendor types.
 */
class BarProviderInterface {
public:
    virtual ~BarProviderInterface() = default;

    // Most recent count closed bars of the given width, oldest first
    virtual std::vector<Core::Bar> get_bars(int timeframe_minutes, size_t count) const = 0;
    virtual Core::AccountSummary get_account_summary() const = 0;
    virtual std::vector<Core::BrokerPositionView> get_open_positions() const = 0;

    virtual std::string get_provider_name() const = 0;
};

using BarProviderPtr = std::unique_ptr<BarProviderInterface>;

} // namespace MarketData
} // namespace ConfluenceScalper

#endif // BAR_PROVIDER_INTERFACE_HPP
