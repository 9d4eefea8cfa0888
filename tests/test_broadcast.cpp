#include <catch2/catch_test_macros.hpp>

#include <thread>

#include "utils.hpp"

using namespace eematrix::test;

TEST_CASE("Every subscriber sees every item", "[broadcast]") {
    Broadcast<int> b{"numbers", 10, LagPolicy::drop};

    auto early = b.subscribe();
    b.send(1);
    auto late = b.subscribe();
    b.send(2);
    b.send(3);

    CHECK(b.subscriber_count() == 2);

    CHECK(early.try_next() == 1);
    CHECK(early.try_next() == 2);
    CHECK(early.try_next() == 3);
    CHECK_FALSE(early.try_next());

    // Subscribers only see what was sent after they subscribed.
    CHECK(late.try_next() == 2);
    CHECK(late.try_next() == 3);
    CHECK_FALSE(late.try_next());
}

TEST_CASE("Dropping lagging items", "[broadcast][lag]") {
    Broadcast<int> b{"numbers", 2, LagPolicy::drop};
    std::vector<std::string> warnings;
    b.logger = [&warnings](LogLevel lvl, std::string msg) {
        if (lvl == LogLevel::warning)
            warnings.push_back(std::move(msg));
    };

    auto slow = b.subscribe();
    auto fast = b.subscribe();

    for (int i = 1; i <= 2; i++) {
        b.send(i);
        CHECK(fast.try_next() == i);
    }
    b.send(3);
    CHECK(fast.try_next() == 3);

    // The slow subscriber keeps what fit and misses the rest, but stays subscribed.
    CHECK(slow.try_next() == 1);
    CHECK(slow.try_next() == 2);
    CHECK_FALSE(slow.try_next());
    CHECK_FALSE(slow.ended());

    REQUIRE(warnings.size() == 1);
    CHECK(warnings.front().find("numbers") != std::string::npos);

    b.send(4);
    CHECK(slow.try_next() == 4);
}

TEST_CASE("Erroring on lag", "[broadcast][lag]") {
    Broadcast<int> b{"numbers", 2, LagPolicy::error};

    auto slow = b.subscribe();
    auto fast = b.subscribe();
    for (int i = 1; i <= 4; i++) {
        b.send(i);
        CHECK(fast.try_next() == i);
    }

    try {
        slow.try_next();
        FAIL("a lagging subscriber should throw");
    } catch (const stream_lagged& e) {
        CHECK(e.skipped == 3);
    }
    CHECK(slow.ended());
    CHECK_FALSE(slow.try_next());

    // The ended subscriber no longer counts.
    b.send(5);
    CHECK(b.subscriber_count() == 1);
    CHECK(fast.try_next() == 5);
}

TEST_CASE("Waiting for items", "[broadcast]") {
    Broadcast<std::string> b{"words", 4, LagPolicy::drop};
    auto sub = b.subscribe();

    CHECK_FALSE(sub.next(20ms));

    std::thread sender{[&b] {
        std::this_thread::sleep_for(50ms);
        b.send("hello");
    }};
    auto word = sub.next(5s);
    sender.join();
    CHECK(word == "hello");
}

TEST_CASE("Subscriptions end with the channel", "[broadcast]") {
    auto b = std::make_unique<Broadcast<int>>("numbers", 4, LagPolicy::drop);
    auto sub = b->subscribe();
    b->send(1);
    b.reset();

    // Queued items are still delivered after the channel is gone.
    CHECK_FALSE(sub.ended());
    CHECK(sub.next(1s) == 1);
    CHECK(sub.ended());
    CHECK_FALSE(sub.next(1s));
}

TEST_CASE("Dropping a subscription unsubscribes", "[broadcast]") {
    Broadcast<int> b{"numbers", 4, LagPolicy::drop};
    {
        auto sub = b.subscribe();
        CHECK(b.subscriber_count() == 1);
    }
    CHECK(b.subscriber_count() == 0);
    CHECK_NOTHROW(b.send(1));
}
