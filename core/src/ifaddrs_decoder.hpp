#pragma once

#include <localip/decoder.hpp>
#include <functional>
#include <string>

struct ifaddrs;

namespace localip {

// Entry points used to obtain and free the kernel's interface address list.
// Defaults to ::getifaddrs / ::freeifaddrs; tests substitute fabricated lists.
struct IfAddrsApi {
    std::function<int(ifaddrs**)> acquire;
    std::function<void(ifaddrs*)> release;

    static IfAddrsApi system();
};

// Owns a list returned by IfAddrsApi::acquire and releases it exactly once
class IfAddrsList {
public:
    explicit IfAddrsList(const IfAddrsApi& api);
    ~IfAddrsList();

    IfAddrsList(const IfAddrsList&) = delete;
    IfAddrsList& operator=(const IfAddrsList&) = delete;

    const ifaddrs* head() const { return head_; }

private:
    const IfAddrsApi& api_;
    ifaddrs* head_ = nullptr;
};

// Walks getifaddrs() output. Used on the BSD family, macOS, Android and iOS,
// and available on Linux through Decoder::create_for().
class IfAddrsDecoder : public Decoder {
public:
    explicit IfAddrsDecoder(const Options& options, IfAddrsApi api = IfAddrsApi::system());
    ~IfAddrsDecoder() override = default;

    std::string strategy_name() const override { return "getifaddrs"; }
    SelectionPolicy selection_policy() const override { return SelectionPolicy::FIRST_NON_LOOPBACK; }

    Snapshot decode() override;

private:
    Options options_;
    IfAddrsApi api_;
};

} // namespace localip
