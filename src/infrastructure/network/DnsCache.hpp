#pragma once

#include "core/services/IHostResolver.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace tcpscan::infra {

/**
 * @brief Process-lifetime cache of reverse DNS names, keyed by address.
 *
 * Shared by concurrent port probes and the connection listener. Two threads
 * missing on the same address may both query the resolver; the second
 * answer simply overwrites the first.
 *
 * Resolver calls block, so lookupAsync() runs them on a small pool of its
 * own and races each one against a timer on the I/O context. The handler
 * threads never wait on the resolver.
 */
class DnsCache {
public:
    using LookupCallback = std::function<void(const std::string&)>;

    /**
     * @brief Constructs a cache.
     * @param context Runs the lookup deadlines.
     * @param resolver Performs the reverse lookups.
     * @param lookupThreads Number of threads allowed to block on the resolver.
     */
    DnsCache(AsioContext& context, core::IHostResolver& resolver, size_t lookupThreads = 2);

    /**
     * @brief Joins the lookup threads, waiting for resolver calls in progress.
     */
    ~DnsCache();

    DnsCache(const DnsCache&) = delete;
    DnsCache& operator=(const DnsCache&) = delete;

    /**
     * @brief Returns the name for an address, resolving it on first use.
     *
     * Blocks the caller for as long as the resolver takes.
     *
     * @param address Dotted-quad IPv4 address.
     * @return The hostname, or an empty string if the lookup failed.
     */
    std::string lookup(const std::string& address);

    /**
     * @brief Resolves an address without blocking the caller.
     *
     * A cached name is delivered synchronously. Otherwise the callback
     * runs exactly once on an I/O thread, with the resolved name or with
     * an empty string if the lookup failed or did not finish within
     * @p timeout. An answer arriving after the deadline is still cached.
     *
     * @param address Dotted-quad IPv4 address.
     * @param timeout Longest time to wait for the resolver.
     * @param onComplete Receives the hostname.
     */
    void lookupAsync(const std::string& address, std::chrono::milliseconds timeout,
                     LookupCallback onComplete);

    /**
     * @brief Returns the cached entry without issuing a lookup.
     */
    [[nodiscard]] std::optional<std::string> cached(const std::string& address) const;

    [[nodiscard]] size_t size() const;

private:
    struct PendingLookup;

    std::string resolveAndStore(const std::string& address);
    static void finishLookup(const std::shared_ptr<PendingLookup>& pending, const std::string& name);

    AsioContext& context_;
    core::IHostResolver& resolver_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> names_;
    // Last member: joined before the map it writes to is destroyed
    asio::thread_pool lookupPool_;
};

} // namespace tcpscan::infra
