// test_zero.cpp - Tests for the zero-value classifier
// Module 4: Zero values

#include <catch2/catch_all.hpp>
#include <docupdate/zero.h>

#include "test_records.h"

using namespace docupdate;
using namespace fixtures;

TEST_CASE("is_zero scalars", "[zero][scalar]") {
    SECTION("numbers") {
        REQUIRE(is_zero(0));
        REQUIRE_FALSE(is_zero(-1));
        REQUIRE(is_zero(uint64_t{0}));
        REQUIRE(is_zero(0.0));
        REQUIRE_FALSE(is_zero(0.25f));
    }

    SECTION("bool") {
        REQUIRE(is_zero(false));
        REQUIRE_FALSE(is_zero(true));
    }

    SECTION("text") {
        REQUIRE(is_zero(std::string{}));
        REQUIRE_FALSE(is_zero(std::string("x")));
        REQUIRE(is_zero(std::string_view{}));
        const char* none = nullptr;
        REQUIRE(is_zero(none));
    }

    SECTION("time point") {
        using clock = std::chrono::system_clock;
        REQUIRE(is_zero(clock::time_point{}));
        REQUIRE_FALSE(is_zero(clock::time_point{std::chrono::milliseconds{1}}));
    }

    SECTION("enum") {
        enum class Color : uint8_t { None, Red };
        REQUIRE(is_zero(Color::None));
        REQUIRE_FALSE(is_zero(Color::Red));
    }
}

TEST_CASE("is_zero pointers and containers", "[zero][container]") {
    SECTION("pointers are zero when absent") {
        Pair pair;
        Pair* none = nullptr;
        REQUIRE(is_zero(none));
        REQUIRE_FALSE(is_zero(&pair));
        REQUIRE(is_zero(std::shared_ptr<Pair>{}));
        REQUIRE(is_zero(std::optional<int>{}));
        REQUIRE_FALSE(is_zero(std::optional<int>{0}));
    }

    SECTION("sequences and maps are zero when empty") {
        REQUIRE(is_zero(std::vector<int>{}));
        REQUIRE_FALSE(is_zero(std::vector<int>{0}));
        REQUIRE(is_zero(std::map<std::string, int>{}));
        REQUIRE_FALSE(is_zero(std::map<std::string, int>{{"", 0}}));
    }
}

TEST_CASE("is_zero dynamic values", "[zero][value]") {
    REQUIRE(is_zero(Value{}));
    REQUIRE_FALSE(is_zero(Value{0}));
    REQUIRE_FALSE(is_zero(RawValue{TypeTag::Null, ByteBuffer{}}));
}

TEST_CASE("is_zero records", "[zero][record]") {
    SECTION("all fields zero") {
        REQUIRE(is_zero(Pair{}));
        REQUIRE_FALSE(is_zero(Pair{0, 1}));
    }

    SECTION("nested record") {
        REQUIRE(is_zero(InlinePair{}));
        REQUIRE_FALSE(is_zero(InlinePair{Pair{1, 0}}));
    }

    SECTION("hidden fields are ignored") {
        Secretive s;
        s.secret = 42;
        REQUIRE(is_zero(s));
    }

    SECTION("excluded fields still count") {
        Secretive s;
        s.skipped = "kept";
        REQUIRE_FALSE(is_zero(s));
    }

    SECTION("embedded base counts") {
        Player p;
        REQUIRE(is_zero(p));
        p.name = "ann";
        REQUIRE_FALSE(is_zero(p));
    }

    SECTION("privately embedded base counts") {
        REQUIRE(is_zero(Guest{}));
        REQUIRE_FALSE(is_zero(Guest("bob")));
    }
}

TEST_CASE("is_zero never holds for functions", "[zero][func]") {
    REQUIRE_FALSE(is_zero(std::function<void()>{}));
    REQUIRE_FALSE(is_zero(Handler{}));
}
