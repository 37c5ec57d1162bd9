#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "core/base62.hpp"
#include "core/ksuid.hpp"

#include <algorithm>
#include <vector>

using namespace ksuid;

namespace rc {

template<>
struct Arbitrary<Ksuid> {
    static Gen<Ksuid> arbitrary() {
        return gen::map(
            gen::tuple(gen::inRange<std::int64_t>(EPOCH, MAX_TIME + 1),
                       gen::container<std::vector<std::uint8_t>>(
                           PAYLOAD_SIZE, gen::arbitrary<std::uint8_t>())),
            [](const std::tuple<std::int64_t, std::vector<std::uint8_t>>& parts) {
                const auto& [timestamp, payload] = parts;
                return Ksuid::create(timestamp, std::span<const std::uint8_t>(payload)).unwrap();
            });
    }
};

} // namespace rc

TEST_CASE("Property: construct round-trips through accessors and base62", "[property][ksuid]") {
    REQUIRE(rc::check("decode(encode(k)) == k and fields are preserved",
        []() {
            const auto timestamp = *rc::gen::inRange<std::int64_t>(EPOCH, MAX_TIME + 1);
            const auto payload = *rc::gen::container<std::vector<std::uint8_t>>(
                PAYLOAD_SIZE, rc::gen::arbitrary<std::uint8_t>());

            const auto id = Ksuid::create(timestamp, std::span<const std::uint8_t>(payload)).unwrap();
            RC_ASSERT(id.timestamp() == timestamp);
            RC_ASSERT(std::equal(payload.begin(), payload.end(), id.payload().begin()));
            RC_ASSERT(base62::decode(base62::encode(id.bytes())).unwrap() == id.bytes());
            RC_ASSERT(Ksuid::parse(id.to_string()).unwrap() == id);
        }
    ));
}

TEST_CASE("Property: string order equals byte order", "[property][ksuid]") {
    REQUIRE(rc::check("a.to_string() < b.to_string() iff a < b",
        [](const Ksuid& a, const Ksuid& b) {
            RC_ASSERT((a.to_string() < b.to_string()) == (a < b));
            RC_ASSERT((a.to_string() == b.to_string()) == (a == b));
        }
    ));
}

TEST_CASE("Property: strings are 27 base-62 characters", "[property][ksuid]") {
    REQUIRE(rc::check("to_string() is always valid",
        [](const Ksuid& id) {
            const auto text = id.to_string();
            RC_ASSERT(text.size() == base62::STRING_SIZE);
            RC_ASSERT(is_valid_string(text));
        }
    ));
}

TEST_CASE("Property: next and previous are inverse", "[property][ksuid]") {
    REQUIRE(rc::check("next(previous(k)) == k == previous(next(k)) inside (MIN, MAX)",
        [](const Ksuid& id) {
            RC_PRE(id != Ksuid::min() && id != Ksuid::max());

            const auto prev = id.previous();
            const auto next = id.next();
            // Timestamps at the very ends have no neighbour on one side.
            RC_PRE(prev.is_ok() && next.is_ok());

            RC_ASSERT(prev.unwrap() < id);
            RC_ASSERT(id < next.unwrap());
            RC_ASSERT(prev.unwrap().next().unwrap() == id);
            RC_ASSERT(next.unwrap().previous().unwrap() == id);
        }
    ));
}

TEST_CASE("Property: carry and borrow cross into the timestamp", "[property][ksuid]") {
    REQUIRE(rc::check("saturated payloads step the timestamp by one",
        []() {
            const auto timestamp = *rc::gen::inRange<std::int64_t>(EPOCH + 1, MAX_TIME);
            Payload zeros{};
            Payload ones{};
            ones.fill(0xFF);

            const auto high = Ksuid::create(timestamp, std::span<const std::uint8_t>(ones)).unwrap();
            const auto low = Ksuid::create(timestamp, std::span<const std::uint8_t>(zeros)).unwrap();

            const auto carried = high.next().unwrap();
            RC_ASSERT(carried.timestamp() == timestamp + 1);
            RC_ASSERT(carried.payload() == zeros);

            const auto borrowed = low.previous().unwrap();
            RC_ASSERT(borrowed.timestamp() == timestamp - 1);
            RC_ASSERT(borrowed.payload() == ones);
        }
    ));
}
