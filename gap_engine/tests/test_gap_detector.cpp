#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/gap_detector.hpp"
#include <random>
#include <stdexcept>

namespace {

const int64_t kMinute = 60000;
const StreamKey kKey{"BTCUSDT", "M1"};

Candle bar(int i, double high, double low) {
    double mid = (high + low) / 2.0;
    return Candle::make(i * kMinute, i * kMinute + kMinute - 1, mid, high, low, mid, 1.0);
}

CandleTriple triple(double h1, double l1, double h2, double l2, double h3, double l3) {
    return CandleTriple{bar(0, h1, l1), bar(1, h2, l2), bar(2, h3, l3)};
}

} // namespace

TEST_CASE("Gap detection", "[gap_detector]") {
    SECTION("Bullish gap between c1 high and c3 low") {
        auto gap = GapDetector::detect(kKey, triple(10, 8, 12, 11, 15, 13));
        REQUIRE(gap.has_value());
        REQUIRE(gap->direction() == Direction::Bullish);
        REQUIRE(gap->lower_bound() == 10.0);
        REQUIRE(gap->upper_bound() == 13.0);
        REQUIRE(gap->size() == 3.0);
        REQUIRE(gap->formed_at_ms() == 3 * kMinute - 1);
        REQUIRE(gap->state() == GapState::Active);
    }

    SECTION("Bearish gap between c3 high and c1 low") {
        auto gap = GapDetector::detect(kKey, triple(20, 18, 17, 15, 14, 12));
        REQUIRE(gap.has_value());
        REQUIRE(gap->direction() == Direction::Bearish);
        REQUIRE(gap->lower_bound() == 14.0);
        REQUIRE(gap->upper_bound() == 18.0);
    }

    SECTION("Overlapping first and third candles give nothing") {
        REQUIRE_FALSE(GapDetector::detect(kKey, triple(10, 8, 11, 9, 12, 9.5)).has_value());
    }

    SECTION("Touching boundaries are not an imbalance") {
        REQUIRE_FALSE(GapDetector::detect(kKey, triple(10, 8, 12, 10, 14, 10)).has_value());
        REQUIRE_FALSE(GapDetector::detect(kKey, triple(20, 18, 19, 17, 18, 16)).has_value());
    }

    SECTION("Gap derived values") {
        auto gap = GapDetector::detect(kKey, triple(10, 8, 12, 11, 15, 13));
        REQUIRE(gap->middle() == 11.5);
        REQUIRE(gap->size_pct() == Catch::Approx(30.0));
    }
}

TEST_CASE("Gap detection over random triples", "[gap_detector]") {
    std::mt19937 gen(42);
    std::uniform_real_distribution<> low_dist(50.0, 150.0);
    std::uniform_real_distribution<> span_dist(0.0, 20.0);

    for (int i = 0; i < 500; i++) {
        double l1 = low_dist(gen), h1 = l1 + span_dist(gen);
        double l2 = low_dist(gen), h2 = l2 + span_dist(gen);
        double l3 = low_dist(gen), h3 = l3 + span_dist(gen);

        auto gap = GapDetector::detect(kKey, triple(h1, l1, h2, l2, h3, l3));

        if (l3 > h1) {
            REQUIRE(gap.has_value());
            REQUIRE(gap->direction() == Direction::Bullish);
            REQUIRE(gap->lower_bound() == h1);
            REQUIRE(gap->upper_bound() == l3);
        } else if (h3 < l1) {
            REQUIRE(gap.has_value());
            REQUIRE(gap->direction() == Direction::Bearish);
            REQUIRE(gap->lower_bound() == h3);
            REQUIRE(gap->upper_bound() == l1);
        } else {
            REQUIRE_FALSE(gap.has_value());
        }
    }
}

TEST_CASE("Gap construction validates bounds", "[gap]") {
    REQUIRE_THROWS_AS(Gap(kKey, Direction::Bullish, 10.0, 10.0, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(Gap(kKey, Direction::Bearish, 12.0, 10.0, 0), std::invalid_argument);
    REQUIRE_NOTHROW(Gap(kKey, Direction::Bullish, 10.0, 10.5, 0));
}
