#include <catch2/catch_test_macros.hpp>
#include "../src/candle_window.hpp"
#include <stdexcept>

namespace {

const int64_t kMinute = 60000;

Candle bar(int i, double high, double low, bool closed = true) {
    double mid = (high + low) / 2.0;
    return Candle::make(i * kMinute, i * kMinute + kMinute - 1, mid, high, low, mid, 1.0, closed);
}

} // namespace

TEST_CASE("Candle validation", "[candle]") {
    SECTION("Rejects high below low") {
        REQUIRE_THROWS_AS(Candle::make(0, 59999, 10.0, 9.0, 11.0, 10.0, 1.0),
                          std::invalid_argument);
    }

    SECTION("Rejects close outside range") {
        REQUIRE_THROWS_AS(Candle::make(0, 59999, 10.0, 12.0, 9.0, 13.0, 1.0),
                          std::invalid_argument);
    }

    SECTION("Rejects close_time before open_time") {
        REQUIRE_THROWS_AS(Candle::make(60000, 0, 10.0, 12.0, 9.0, 10.0, 1.0),
                          std::invalid_argument);
    }
}

TEST_CASE("Candle window", "[candle_window]") {
    CandleWindow window(5);

    SECTION("Capacity below three is rejected") {
        REQUIRE_THROWS_AS(CandleWindow(2), std::invalid_argument);
    }

    SECTION("Fewer than three closed candles gives no triple") {
        window.append(bar(0, 10, 8));
        window.append(bar(1, 12, 11));
        REQUIRE_FALSE(window.latest_triple().has_value());
    }

    SECTION("Latest triple is oldest first") {
        window.append(bar(0, 10, 8));
        window.append(bar(1, 12, 11));
        window.append(bar(2, 15, 13));

        auto triple = window.latest_triple();
        REQUIRE(triple.has_value());
        REQUIRE((*triple)[0].open_time_ms == 0);
        REQUIRE((*triple)[2].open_time_ms == 2 * kMinute);
    }

    SECTION("Same open_time replaces the in-progress candle") {
        window.append(bar(0, 10, 8));
        auto first = window.append(bar(1, 11, 10, false));
        REQUIRE(first.status == AppendStatus::Appended);
        REQUIRE(first.newly_closed.empty());

        auto second = window.append(bar(1, 12, 9, false));
        REQUIRE(second.status == AppendStatus::Replaced);
        REQUIRE(window.size() == 2);
        REQUIRE(window.latest().high == 12.0);

        auto final_update = window.append(bar(1, 12, 9, true));
        REQUIRE(final_update.status == AppendStatus::Replaced);
        REQUIRE(final_update.newly_closed.size() == 1);
    }

    SECTION("Resending a closed candle changes nothing") {
        window.append(bar(0, 10, 8));
        auto again = window.append(bar(0, 20, 1));
        REQUIRE(again.status == AppendStatus::Replaced);
        REQUIRE(again.newly_closed.empty());
        REQUIRE(window.latest().high == 10.0);
    }

    SECTION("In-progress candle is skipped by latest_triple") {
        window.append(bar(0, 10, 8));
        window.append(bar(1, 12, 11));
        window.append(bar(2, 15, 13));
        window.append(bar(3, 16, 14, false));

        auto triple = window.latest_triple();
        REQUIRE(triple.has_value());
        REQUIRE((*triple)[2].open_time_ms == 2 * kMinute);
    }

    SECTION("A newer candle closes the previous in-progress one") {
        window.append(bar(0, 10, 8, false));
        auto result = window.append(bar(1, 12, 11));
        REQUIRE(result.newly_closed.size() == 2);
        REQUIRE(result.newly_closed[0].open_time_ms == 0);
        REQUIRE(result.newly_closed[1].open_time_ms == kMinute);
    }

    SECTION("Oldest candles are evicted beyond capacity") {
        for (int i = 0; i < 8; i++) {
            window.append(bar(i, 10 + i, 8 + i));
        }
        REQUIRE(window.size() == 5);
        REQUIRE_FALSE(window.triple_ending_at(2 * kMinute).has_value());
        REQUIRE(window.triple_ending_at(7 * kMinute).has_value());
    }

    SECTION("Older candle is rejected as out of order") {
        window.append(bar(0, 10, 8));
        window.append(bar(1, 12, 11));
        auto result = window.append(bar(0, 10, 8));
        REQUIRE(result.status == AppendStatus::OutOfOrder);
        REQUIRE(window.size() == 2);
        REQUIRE(window.latest().open_time_ms == kMinute);
    }
}

TEST_CASE("Candle window at minimum capacity", "[candle_window]") {
    CandleWindow window(3);

    SECTION("In-progress candle does not count against capacity") {
        window.append(bar(0, 10, 8, false));
        window.append(bar(1, 12, 11, false));
        window.append(bar(2, 15, 13, false));
        auto result = window.append(bar(3, 16, 14, false));

        REQUIRE(result.newly_closed.size() == 1);
        REQUIRE(window.size() == 4);
        REQUIRE(window.triple_ending_at(2 * kMinute).has_value());

        auto triple = window.latest_triple();
        REQUIRE(triple.has_value());
        REQUIRE((*triple)[0].open_time_ms == 0);
        REQUIRE((*triple)[2].open_time_ms == 2 * kMinute);

        window.append(bar(4, 17, 15, false));
        REQUIRE(window.size() == 4);
        REQUIRE(window.triple_ending_at(3 * kMinute).has_value());
        REQUIRE_FALSE(window.triple_ending_at(2 * kMinute).has_value());
    }

    SECTION("Two candles closing at once keep both triples") {
        window.append(bar(0, 10, 8));
        window.append(bar(1, 12, 11));
        window.append(bar(2, 15, 13, false));
        auto result = window.append(bar(3, 16, 14));

        REQUIRE(result.newly_closed.size() == 2);
        REQUIRE(window.triple_ending_at(2 * kMinute).has_value());
        REQUIRE(window.triple_ending_at(3 * kMinute).has_value());

        window.append(bar(4, 17, 15));
        REQUIRE(window.size() == 3);
    }
}
