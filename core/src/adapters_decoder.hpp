#pragma once

#include <localip/decoder.hpp>
#include <string>

namespace localip {

// Windows backend: GetAdaptersAddresses for the adapter table and
// GetIpForwardTable2 to find the default-route interfaces.
class AdaptersDecoder : public Decoder {
public:
    explicit AdaptersDecoder(const Options& options);
    ~AdaptersDecoder() override = default;

    std::string strategy_name() const override { return "GetAdaptersAddresses"; }
    SelectionPolicy selection_policy() const override { return SelectionPolicy::DEFAULT_ROUTE; }

    Snapshot decode() override;

private:
    Options options_;
};

} // namespace localip
