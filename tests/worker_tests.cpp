// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <modfetch/core/worker_channels.hpp>
#include <modfetch/core/worker_pool.hpp>
#include <atomic>
#include <chrono>
#include <latch>
#include <thread>

using namespace modfetch::core;
using namespace std::chrono_literals;

TEST_CASE("WorkerChannels - ordering", "[channels]") {
    WorkerChannels channels;

    SECTION("data is served before failures") {
        REQUIRE(channels.send_failure({{0, 9}, make_error_code(DownloadErrc::connection_lost)}));
        REQUIRE(channels.send_data({{0, 9}, 0, std::vector<std::byte>(4)}));
        REQUIRE(channels.send_completed({10, 19}));

        std::stop_source stop;
        auto first = channels.receive(stop.get_token());
        auto second = channels.receive(stop.get_token());
        auto third = channels.receive(stop.get_token());

        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        REQUIRE(third.has_value());
        CHECK(std::holds_alternative<ChunkData>(*first));
        CHECK(std::holds_alternative<ChunkCompleted>(*second));
        REQUIRE(std::holds_alternative<ChunkFailure>(*third));
        CHECK(std::get<ChunkFailure>(*third).chunk == Chunk{0, 9});
        CHECK(channels.pending() == 0);
    }

    SECTION("try_receive on empty channels") {
        CHECK_FALSE(channels.try_receive().has_value());
    }

    SECTION("sends fail once closed") {
        channels.close();
        CHECK(channels.closed());
        CHECK_FALSE(channels.send_data({{0, 1}, 0, {}}));
        CHECK_FALSE(channels.send_completed({0, 1}));
        CHECK_FALSE(channels.send_failure({{0, 1}, {}}));
    }
}

TEST_CASE("WorkerChannels - blocking receive", "[channels]") {
    WorkerChannels channels;

    SECTION("wakes up on a message from another thread") {
        std::jthread producer([&] {
            std::this_thread::sleep_for(20ms);
            (void)channels.send_completed({5, 6});
        });

        std::stop_source stop;
        auto message = channels.receive(stop.get_token());
        REQUIRE(message.has_value());
        CHECK(std::get<ChunkCompleted>(*message).chunk == Chunk{5, 6});
    }

    SECTION("returns empty when stop is requested") {
        std::stop_source stop;
        std::jthread canceller([&] {
            std::this_thread::sleep_for(20ms);
            stop.request_stop();
        });

        CHECK_FALSE(channels.receive(stop.get_token()).has_value());
    }

    SECTION("returns empty once closed and drained") {
        REQUIRE(channels.send_completed({0, 0}));
        channels.close();

        std::stop_source stop;
        CHECK(channels.receive(stop.get_token()).has_value());
        CHECK_FALSE(channels.receive(stop.get_token()).has_value());
    }
}

TEST_CASE("WorkerPool - bounded concurrency", "[pool]") {
    constexpr std::size_t workers = 3;
    constexpr int tasks = 24;

    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    std::latch done(tasks);

    {
        WorkerPool pool(workers);
        CHECK(pool.size() == workers);

        for (int i = 0; i < tasks; ++i) {
            pool.submit([&](std::stop_token) {
                int now = ++running;
                int seen = peak.load();
                while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
                std::this_thread::sleep_for(2ms);
                --running;
                done.count_down();
            });
        }
        done.wait();
    }

    CHECK(peak.load() >= 1);
    CHECK(peak.load() <= static_cast<int>(workers));
}

TEST_CASE("WorkerPool - shutdown", "[pool]") {
    SECTION("running tasks see their stop token") {
        std::atomic<bool> saw_stop{false};
        std::latch started(1);
        {
            WorkerPool pool(1);
            pool.submit([&](std::stop_token stop) {
                started.count_down();
                while (!stop.stop_requested()) {
                    std::this_thread::sleep_for(1ms);
                }
                saw_stop = true;
            });
            started.wait();
        }
        CHECK(saw_stop.load());
    }

    SECTION("queued tasks are dropped") {
        std::atomic<int> ran{0};
        std::latch started(1);
        {
            WorkerPool pool(1);
            pool.submit([&](std::stop_token stop) {
                started.count_down();
                while (!stop.stop_requested()) {
                    std::this_thread::sleep_for(1ms);
                }
            });
            for (int i = 0; i < 5; ++i) {
                pool.submit([&](std::stop_token) { ++ran; });
            }
            started.wait();
            CHECK(pool.queued() == 5);
        }
        CHECK(ran.load() == 0);
    }
}
