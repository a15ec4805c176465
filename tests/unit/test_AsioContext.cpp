#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/AsioContext.hpp"

#include <algorithm>
#include <future>
#include <stdexcept>

using namespace tcpscan::infra;

TEST_CASE("AsioContext lifecycle", "[AsioContext]") {
    AsioContext context(2);
    REQUIRE(context.threadCount() == 2);
    REQUIRE_FALSE(context.isRunning());

    context.start();
    REQUIRE(context.isRunning());

    std::promise<int> done;
    context.post([&done]() { done.set_value(42); });
    auto future = done.get_future();
    REQUIRE(future.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    REQUIRE(future.get() == 42);

    context.stop();
    REQUIRE_FALSE(context.isRunning());

    SECTION("Restarts after stop") {
        context.start();
        std::promise<void> again;
        context.post([&again]() { again.set_value(); });
        REQUIRE(again.get_future().wait_for(std::chrono::seconds(5)) ==
                std::future_status::ready);
        context.stop();
    }
}

TEST_CASE("AsioContext survives a throwing handler", "[AsioContext]") {
    AsioContext context(1);
    context.start();

    context.post([]() { throw std::runtime_error("boom"); });

    std::promise<void> after;
    context.post([&after]() { after.set_value(); });

    REQUIRE(after.get_future().wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    REQUIRE(context.handlerFailures() == 1);
}

TEST_CASE("AsioContext thread count for a worker pool", "[AsioContext]") {
    REQUIRE(AsioContext::threadCountFor(0) == 1);
    REQUIRE(AsioContext::threadCountFor(1) == 1);
    REQUIRE(AsioContext::threadCountFor(3) == 3);
    REQUIRE(AsioContext::threadCountFor(100000) >= 4);
    REQUIRE(AsioContext::threadCountFor(100000) <= std::max(4u, std::thread::hardware_concurrency()));

    AsioContext zero(0);
    REQUIRE(zero.threadCount() == 1);
}
