#include <catch2/catch_test_macros.hpp>

#include "window/search.hpp"

#include <string>
#include <vector>

namespace {

WindowRecord make_record(const std::string& title, const std::string& owner) {
    WindowRecord r;
    r.identity = owner + ":" + title;
    r.title = title;
    r.owner_name = owner;
    r.owner_pid = 1;
    return r;
}

std::vector<WindowRecord> sample() {
    return {
        make_record("main.cpp - project", "Code"),
        make_record("Inbox (3)", "Thunderbird"),
        make_record("Документ 1", "LibreOffice"),
        make_record("README.md", "code-oss"),
        make_record("Straße", "Maps"),
    };
}

std::vector<std::string> ids(const std::vector<WindowRecord>& records) {
    std::vector<std::string> out;
    for (const auto& r : records) out.push_back(r.identity);
    return out;
}

} // namespace

TEST_CASE("Case folding", "[search]") {

    SECTION("AsciiFolds") {
        REQUIRE(fold_case("HeLLo") == fold_case("hello"));
    }

    SECTION("CyrillicFolds") {
        REQUIRE(fold_case("ДОКУМЕНТ") == fold_case("документ"));
    }

    SECTION("GreekFolds") {
        REQUIRE(fold_case("ΑΘΗΝΑ") == fold_case("αθηνα"));
    }

    SECTION("MalformedBytesBecomeReplacement") {
        auto folded = fold_case(std::string("a\xff" "b", 3));
        REQUIRE(folded == std::u32string{U'a', U'\uFFFD', U'b'});
    }

    SECTION("TruncatedSequenceDoesNotOverrun") {
        auto folded = fold_case(std::string("\xd0", 1));
        REQUIRE(folded == std::u32string{U'\uFFFD'});
    }

    SECTION("ContainsFolded") {
        REQUIRE(contains_folded("Mozilla Firefox", "FIREFOX"));
        REQUIRE(contains_folded("anything", ""));
        REQUIRE_FALSE(contains_folded("Firefox", "chrome"));
    }
}

TEST_CASE("Search", "[search]") {
    auto records = sample();

    SECTION("EmptyQueryReturnsInputUnchanged") {
        auto results = search("", records);
        REQUIRE(ids(results) == ids(records));
    }

    SECTION("MatchesTitleCaseInsensitively") {
        auto results = search("INBOX", records);
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].owner_name == "Thunderbird");
    }

    SECTION("MatchesOwnerName") {
        auto results = search("code", records);
        REQUIRE(ids(results) == std::vector<std::string>{
            "Code:main.cpp - project", "code-oss:README.md"});
    }

    SECTION("MatchesNonLatinTitle") {
        auto results = search("документ", records);
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].owner_name == "LibreOffice");
    }

    SECTION("NoMatchReturnsEmpty") {
        REQUIRE(search("zzz-not-here", records).empty());
    }

    SECTION("ResultIsStableSubsequence") {
        auto results = search("e", records);
        REQUIRE_FALSE(results.empty());

        // Every result appears in the input, in the same relative order.
        size_t pos = 0;
        for (const auto& r : results) {
            while (pos < records.size() && records[pos].identity != r.identity) pos++;
            REQUIRE(pos < records.size());
            pos++;
        }

        // Everything left out really does not match.
        for (const auto& r : records) {
            bool included = false;
            for (const auto& m : results) included = included || m.identity == r.identity;
            bool matches = contains_folded(r.title, "e") || contains_folded(r.owner_name, "e");
            REQUIRE(included == matches);
        }
    }

    SECTION("DoesNotModifyInput") {
        auto before = ids(records);
        (void)search("inbox", records);
        REQUIRE(ids(records) == before);
    }
}
