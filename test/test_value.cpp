// test_value.cpp - Tests for Value construction, access and builders
// Module 1: Dynamic document value

#include <catch2/catch_all.hpp>
#include <docupdate/builders.h>
#include <docupdate/value.h>

using namespace docupdate;

// ============================================================
// Construction Tests
// ============================================================

TEST_CASE("Value default construction", "[value][construction]") {
    Value v;
    REQUIRE(v.is_null());
    REQUIRE(kind_name(v) == "null");
}

TEST_CASE("Value primitive construction", "[value][construction]") {
    SECTION("int8_t") {
        Value v{int8_t{-42}};
        REQUIRE(v.is<int8_t>());
        REQUIRE(kind_name(v) == "int8");
    }

    SECTION("int32_t") {
        Value v{42};
        REQUIRE(v.is<int32_t>());
        REQUIRE(v.as_int() == 42);
        REQUIRE(kind_name(v) == "int32");
    }

    SECTION("int64_t") {
        Value v{int64_t{9999999999LL}};
        REQUIRE(v.is<int64_t>());
        REQUIRE(v.as_int64() == 9999999999LL);
    }

    SECTION("uint16_t") {
        Value v{uint16_t{65535}};
        REQUIRE(v.is<uint16_t>());
        REQUIRE(v.get_or<uint16_t>() == 65535);
    }

    SECTION("double") {
        Value v{3.14159265358979};
        REQUIRE(v.is<double>());
        REQUIRE(v.as_double() == Catch::Approx(3.14159265358979));
    }

    SECTION("bool") {
        Value v{true};
        REQUIRE(v.is<bool>());
        REQUIRE(v.as_bool());
    }
}

TEST_CASE("Value string construction", "[value][construction]") {
    SECTION("from const char*") {
        Value v{"hello"};
        REQUIRE(v.is_string());
        REQUIRE(v.as_string() == "hello");
    }

    SECTION("from std::string rvalue") {
        Value v{std::string("moved")};
        REQUIRE(v.as_string_view() == "moved");
    }
}

TEST_CASE("Value raw fragment", "[value][raw]") {
    RawValue raw{TypeTag::Bool, ByteBuffer{0x01}};
    Value v{raw};

    REQUIRE(v.is_raw());
    REQUIRE(kind_name(v) == "raw");
    REQUIRE_FALSE(raw.is_document());
    REQUIRE(value_to_string(v) == "raw(0x04, 1 bytes)");
    REQUIRE(raw.unmarshal() == Value{true});
}

// ============================================================
// Access Tests
// ============================================================

TEST_CASE("Value map access", "[value][access]") {
    Value v = Value::map({{"name", "ann"}, {"level", 3}});

    SECTION("existing key") {
        REQUIRE(v.at("name").as_string() == "ann");
        REQUIRE(v.contains("level"));
        REQUIRE(v.size() == 2);
    }

    SECTION("missing key yields null") {
        REQUIRE(v.at("missing").is_null());
        REQUIRE_FALSE(v.contains("missing"));
    }

    SECTION("at on a non-map yields null") {
        REQUIRE(Value{5}.at("name").is_null());
    }
}

TEST_CASE("Value vector access", "[value][access]") {
    Value v = Value::vector({1, 2, 3});

    REQUIRE(v.is_vector());
    REQUIRE(v.size() == 3);
    REQUIRE(v.at(std::size_t{1}).as_int() == 2);
    REQUIRE(v.at(std::size_t{10}).is_null());
}

TEST_CASE("Value set is persistent", "[value][modify]") {
    Value original = Value::map({{"a", 1}});
    Value updated = original.set("b", 2);

    REQUIRE(original.size() == 1);
    REQUIRE(updated.size() == 2);
    REQUIRE(updated.at("b").as_int() == 2);

    SECTION("set on null creates a map") {
        Value v = Value{}.set("x", true);
        REQUIRE(v.is_map());
        REQUIRE(v.at("x").as_bool());
    }
}

TEST_CASE("Value equality", "[value][compare]") {
    REQUIRE(Value::map({{"a", 1}}) == Value::map({{"a", 1}}));
    REQUIRE_FALSE(Value::map({{"a", 1}}) == Value::map({{"a", 2}}));
    REQUIRE_FALSE(Value{1} == Value{int64_t{1}});
}

// ============================================================
// Builder Tests
// ============================================================

TEST_CASE("MapBuilder", "[value][builder]") {
    MapBuilder builder;
    builder.set("x", 1).set("y", std::string("two")).set("z", Value{});

    REQUIRE(builder.size() == 3);
    REQUIRE(builder.contains("y"));
    REQUIRE(builder.get("x") == Value{1});

    builder.erase("z");
    Value result = builder.finish();

    REQUIRE(result.is_map());
    REQUIRE(result.size() == 2);
    REQUIRE(result.at("y").as_string() == "two");
}

TEST_CASE("VectorBuilder", "[value][builder]") {
    VectorBuilder builder;
    for (int i = 0; i < 100; ++i) {
        builder.push_back(i);
    }
    REQUIRE(builder.size() == 100);

    ValueVector items = builder.finish_vector();
    REQUIRE(items.size() == 100);
    REQUIRE(items[99].get().as_int() == 99);
}
