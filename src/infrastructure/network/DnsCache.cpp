#include "infrastructure/network/DnsCache.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace tcpscan::infra {

struct DnsCache::PendingLookup {
    explicit PendingLookup(asio::io_context& io) : strand(asio::make_strand(io)), timer(strand) {}

    asio::strand<asio::io_context::executor_type> strand;
    asio::steady_timer timer;
    LookupCallback onComplete;
    bool completed = false;
};

DnsCache::DnsCache(AsioContext& context, core::IHostResolver& resolver, size_t lookupThreads)
    : context_(context), resolver_(resolver), lookupPool_(std::max<size_t>(lookupThreads, 1)) {}

DnsCache::~DnsCache() {
    lookupPool_.join();
}

std::string DnsCache::lookup(const std::string& address) {
    if (auto name = cached(address)) {
        return *name;
    }
    return resolveAndStore(address);
}

void DnsCache::lookupAsync(const std::string& address, std::chrono::milliseconds timeout,
                           LookupCallback onComplete) {
    if (auto name = cached(address)) {
        if (onComplete) {
            onComplete(*name);
        }
        return;
    }

    auto pending = std::make_shared<PendingLookup>(context_.getContext());
    pending->onComplete = std::move(onComplete);

    // Armed through the strand before any answer can be posted to it
    asio::post(pending->strand, [pending, address, timeout]() {
        pending->timer.expires_after(timeout);
        pending->timer.async_wait([pending, address](const asio::error_code& ec) {
            if (ec) {
                return;
            }
            spdlog::debug("Reverse lookup of {} timed out", address);
            finishLookup(pending, "");
        });
    });

    asio::post(lookupPool_, [this, pending, address]() {
        auto name = resolveAndStore(address);
        asio::post(pending->strand, [pending, name = std::move(name)]() {
            finishLookup(pending, name);
        });
    });
}

std::string DnsCache::resolveAndStore(const std::string& address) {
    std::string name;
    try {
        name = resolver_.reverseLookup(address).value_or("");
    } catch (const std::exception& e) {
        spdlog::debug("Reverse lookup of {} raised: {}", address, e.what());
    }

    std::lock_guard lock(mutex_);
    names_[address] = name;
    return name;
}

void DnsCache::finishLookup(const std::shared_ptr<PendingLookup>& pending, const std::string& name) {
    if (pending->completed) {
        return;
    }
    pending->completed = true;
    pending->timer.cancel();
    if (pending->onComplete) {
        pending->onComplete(name);
    }
}

std::optional<std::string> DnsCache::cached(const std::string& address) const {
    std::lock_guard lock(mutex_);
    auto it = names_.find(address);
    if (it == names_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t DnsCache::size() const {
    std::lock_guard lock(mutex_);
    return names_.size();
}

} // namespace tcpscan::infra
