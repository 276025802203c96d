// test_struct_info.cpp - Tests for record descriptors and the descriptor cache
// Module 3: Type introspection

#include <catch2/catch_all.hpp>
#include <docupdate/errors.h>
#include <docupdate/struct_info.h>

#include "test_records.h"

#include <thread>

using namespace docupdate;
using namespace fixtures;

namespace {

std::vector<std::string> keys_of(const StructInfo& info) {
    std::vector<std::string> keys;
    for (const auto& field : info.fields_list) {
        keys.push_back(field.key);
    }
    return keys;
}

/// Only described by the concurrency test
struct Contended {
    int a = 0;
    std::string b;
};

} // namespace

namespace docupdate {

template <>
struct RecordTraits<Contended> {
    static constexpr std::string_view name = "Contended";
    static std::vector<FieldInfo> fields() {
        return {
            field<&Contended::a>("A"),
            field<&Contended::b>("B", ",omitempty"),
        };
    }
};

} // namespace docupdate

// ============================================================
// Type Model
// ============================================================

TEST_CASE("type_of classifies C++ types", "[struct_info][type]") {
    REQUIRE(type_of<std::string>().kind == Kind::String);
    REQUIRE(type_of<const char*>().kind == Kind::String);
    REQUIRE(type_of<bool>().kind == Kind::Bool);
    REQUIRE(type_of<int16_t>().kind == Kind::Int);
    REQUIRE(type_of<uint64_t>().kind == Kind::Uint);
    REQUIRE(type_of<float>().kind == Kind::Float);
    REQUIRE(type_of<std::chrono::system_clock::time_point>().kind == Kind::Time);
    REQUIRE(type_of<std::shared_ptr<Pair>>().kind == Kind::Pointer);
    REQUIRE(type_of<std::optional<int>>().kind == Kind::Pointer);
    REQUIRE(type_of<std::vector<int>>().kind == Kind::Sequence);
    REQUIRE(type_of<std::map<std::string, int>>().kind == Kind::Map);
    REQUIRE(type_of<Pair>().kind == Kind::Record);
    REQUIRE(type_of<Value>().kind == Kind::Dynamic);
    REQUIRE(type_of<RawValue>().kind == Kind::Raw);
    REQUIRE(type_of<std::function<void()>>().kind == Kind::Func);
    REQUIRE(type_of<Getter>().kind == Kind::Opaque);
}

TEST_CASE("type_of names and hooks", "[struct_info][type]") {
    REQUIRE(type_of<Pair>().name == "Pair");
    REQUIRE(type_of<int>().name == "int");
    REQUIRE(type_of<Pair*>().elem().name == "Pair");
    REQUIRE(type_of<std::map<int, int>>().key().kind == Kind::Int);

    SECTION("hook on the type itself") {
        REQUIRE(type_of<Price>().represent != nullptr);
        REQUIRE(type_of<Pair>().represent == nullptr);
    }

    SECTION("hook reached through a pointer") {
        REQUIRE(type_of<Getter*>().represent != nullptr);
        REQUIRE(type_of<std::unique_ptr<Price>>().represent != nullptr);
        REQUIRE(type_of<Pair*>().represent == nullptr);
    }
}

// ============================================================
// Descriptors
// ============================================================

TEST_CASE("describe lowercases field names", "[struct_info][describe]") {
    auto info = describe<Pair>();

    REQUIRE(keys_of(*info) == std::vector<std::string>{"a", "b"});
    REQUIRE(info->find("a")->num == 0);
    REQUIRE(info->find("b")->num == 1);
    REQUIRE(info->find("A") == nullptr);
    REQUIRE_FALSE(info->has_inline_map());
}

TEST_CASE("describe applies tags", "[struct_info][describe]") {
    SECTION("explicit key") {
        REQUIRE(keys_of(*describe<Renamed>()) == std::vector<std::string>{"y"});
    }

    SECTION("identity key") {
        REQUIRE(keys_of(*describe<WithId>()) == std::vector<std::string>{"_id", "a"});
    }

    SECTION("omitempty") {
        auto info = describe<OptionalX>();
        REQUIRE(info->find("x")->omit_empty);
        REQUIRE_FALSE(info->find("y")->omit_empty);
    }

    SECTION("omitempty and minsize") {
        const FieldDescriptor* weights = describe<Event>()->find("weights");
        REQUIRE(weights != nullptr);
        REQUIRE(weights->omit_empty);
        REQUIRE(weights->min_size);
    }

    SECTION("hidden and excluded fields") {
        REQUIRE(keys_of(*describe<Secretive>()) == std::vector<std::string>{"visible"});
    }

    SECTION("embedded record without inline is a sub-document") {
        REQUIRE(keys_of(*describe<Profile>()) == std::vector<std::string>{"named", "bio"});
    }
}

TEST_CASE("describe splices inline records", "[struct_info][inline]") {
    SECTION("inline field") {
        auto info = describe<InlinePair>();
        REQUIRE(keys_of(*info) == std::vector<std::string>{"a", "b"});
        REQUIRE(info->find("b")->inline_path == std::vector<std::size_t>{0, 1});
    }

    SECTION("embedded base") {
        auto info = describe<Player>();
        REQUIRE(keys_of(*info) == std::vector<std::string>{"name", "level"});

        Player player;
        player.name = "ann";
        player.level = 4;
        ValueRef name = field_ref(*info, *info->find("name"), &player);
        REQUIRE(name.type->kind == Kind::String);
        REQUIRE(*static_cast<const std::string*>(name.ptr) == "ann");
    }

    SECTION("privately embedded base") {
        auto info = describe<Guest>();
        REQUIRE(keys_of(*info) == std::vector<std::string>{"name", "visits"});
        REQUIRE_FALSE(type_of<Guest>().fields()[0].exported);

        Guest guest("bob", 2);
        ValueRef name = field_ref(*info, *info->find("name"), &guest);
        REQUIRE(*static_cast<const std::string*>(name.ptr) == "bob");
    }

    SECTION("inline map of an inline record") {
        auto info = describe<Outer>();
        REQUIRE(keys_of(*info) == std::vector<std::string>{"top", "a"});
        REQUIRE(info->inline_map == std::vector<std::size_t>{1, 1});

        Outer outer;
        outer.inner.m["extra"] = Value{1};
        ValueRef m = inline_map_ref(*info, &outer);
        REQUIRE(m.ptr == &outer.inner.m);
    }
}

TEST_CASE("describe inline map", "[struct_info][inline]") {
    auto info = describe<InlineMap>();

    REQUIRE(keys_of(*info) == std::vector<std::string>{"a"});
    REQUIRE(info->inline_map == std::vector<std::size_t>{1});

    InlineMap record;
    REQUIRE(inline_map_ref(*info, &record).ptr == &record.m);
    REQUIRE(inline_map_ref(*describe<Pair>(), &record).ptr == nullptr);
}

// ============================================================
// Configuration Errors
// ============================================================

TEST_CASE("describe rejects malformed records", "[struct_info][error]") {
    SECTION("duplicate key") {
        REQUIRE_THROWS_WITH(describe<DupKeys>(), "Duplicated key 'name' in struct DupKeys");
    }

    SECTION("duplicate key through inline record") {
        REQUIRE_THROWS_WITH(describe<InlineDupKeys>(),
                            "Duplicated key 'a' in struct InlineDupKeys");
    }

    SECTION("unsupported flag") {
        REQUIRE_THROWS_WITH(describe<BadFlag>(),
                            "Unsupported flag \"sparse\" in tag \"x,sparse\" of type BadFlag");
    }

    SECTION("inline map with non-text keys") {
        REQUIRE_THROWS_WITH(describe<IntKeyedInline>(),
                            "Option ,inline needs a map with string keys in struct IntKeyedInline");
    }

    SECTION("two inline maps") {
        REQUIRE_THROWS_WITH(describe<TwoInlineMaps>(),
                            "Multiple ,inline maps in struct TwoInlineMaps");
    }

    SECTION("inline scalar") {
        REQUIRE_THROWS_WITH(describe<InlineScalar>(),
                            "Option ,inline needs a struct value or map field in struct InlineScalar");
    }

    SECTION("not a record") {
        REQUIRE_THROWS_AS(describe(type_of<int>()), DescriptorError);
    }
}

TEST_CASE("describe logs configuration errors", "[struct_info][error]") {
    CerrCapture log;
    REQUIRE_THROWS_AS(describe<BadFlag>(), DescriptorError);

#if DOCUPDATE_VERBOSE_LOG
    REQUIRE(log.str().find("[describe BadFlag] Unsupported flag \"sparse\"") != std::string::npos);
#else
    REQUIRE(log.str().empty());
#endif
}

TEST_CASE("failed descriptors are not cached", "[struct_info][cache]") {
    std::size_t before = descriptor_cache_size();

    REQUIRE_THROWS_AS(describe<DupKeys>(), DescriptorError);
    REQUIRE_THROWS_AS(describe<DupKeys>(), DescriptorError);

    REQUIRE(descriptor_cache_size() == before);
}

// ============================================================
// Cache
// ============================================================

TEST_CASE("describe returns the cached descriptor", "[struct_info][cache]") {
    auto first = describe<SingleA>();
    std::size_t size = descriptor_cache_size();
    auto second = describe<SingleA>();

    REQUIRE(first.get() == second.get());
    REQUIRE(descriptor_cache_size() == size);
}

TEST_CASE("describe is safe under contention", "[struct_info][cache][concurrency]") {
    constexpr int kThreads = 8;
    std::vector<std::shared_ptr<const StructInfo>> results(kThreads);
    std::vector<std::thread> threads;

    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&results, i] { results[i] = describe<Contended>(); });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (const auto& info : results) {
        REQUIRE(info.get() == results[0].get());
        REQUIRE(keys_of(*info) == std::vector<std::string>{"a", "b"});
    }
}
