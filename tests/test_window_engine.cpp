#include <catch2/catch_test_macros.hpp>

#include "mock_window_source.hpp"
#include "window/window_engine.hpp"

#include <string>
#include <vector>

TEST_CASE("Activation", "[engine]") {
    MockWindowSource source;

    SECTION("ProcessIsForegroundedBeforeWindowFocus") {
        WindowRecord r;
        r.title = "doc";
        r.activation = ActivationHandle{.pid = 42, .window_id = 7};

        auto res = activate_window(r, source);
        REQUIRE(res.has_value());
        REQUIRE(source.calls == std::vector<std::string>{"activate_process 42", "focus_window 7"});
    }

    SECTION("ProcessOnlyHandleSkipsWindowFocus") {
        WindowRecord r;
        r.activation = ActivationHandle{.pid = 42};

        auto res = activate_window(r, source);
        REQUIRE(res.has_value());
        REQUIRE(source.calls == std::vector<std::string>{"activate_process 42"});
    }

    SECTION("ProcessFailureStopsBeforeFocus") {
        source.activate_error = WindowError{WindowErrorKind::SourceUnavailable, "gone"};
        WindowRecord r;
        r.activation = ActivationHandle{.pid = 42, .window_id = 7};

        auto res = activate_window(r, source);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == WindowErrorKind::ActivationFailed);
        REQUIRE(source.calls == std::vector<std::string>{"activate_process 42"});
    }

    SECTION("FocusFailureIsActivationFailed") {
        source.focus_error = WindowError{WindowErrorKind::ActivationFailed, "no such window"};
        WindowRecord r;
        r.activation = ActivationHandle{.pid = 42, .window_id = 7};

        auto res = activate_window(r, source);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().message == "no such window");
    }
}

TEST_CASE("WindowEngine session", "[engine]") {
    MockWindowSource source;
    source.add_app(10, "Terminal");
    source.add_app(20, "Browser");
    source.add_server_window(10, 1, "shell");
    source.add_server_window(20, 2, "News");
    source.add_process_window(10, 1, "shell");
    source.add_process_window(20, 2, "News");

    WindowEngine engine(source, ReconcileOptions{});

    SECTION("StartsWithEmptySnapshot") {
        REQUIRE(engine.snapshot() != nullptr);
        REQUIRE(engine.snapshot()->empty());
        REQUIRE_FALSE(engine.has_snapshot());
        REQUIRE_FALSE(engine.last_refresh().has_value());
    }

    SECTION("RefreshPublishesNewList") {
        auto res = engine.refresh();
        REQUIRE(res.has_value());
        REQUIRE((*res)->size() == 2);
        REQUIRE(engine.snapshot() == *res);
        REQUIRE(engine.has_snapshot());
        REQUIRE(engine.last_refresh().has_value());
    }

    SECTION("OldSnapshotSurvivesReplacement") {
        REQUIRE(engine.refresh().has_value());
        auto old = engine.snapshot();

        source.add_server_window(10, 3, "second shell");
        REQUIRE(engine.refresh().has_value());

        REQUIRE(old->size() == 2);
        REQUIRE(engine.snapshot()->size() == 3);
    }

    SECTION("FailedRefreshPublishesEmptyList") {
        REQUIRE(engine.refresh().has_value());
        source.listing_error = WindowError{WindowErrorKind::PermissionDenied, "denied"};

        auto res = engine.refresh();
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == WindowErrorKind::PermissionDenied);
        REQUIRE(engine.snapshot()->empty());
    }

    SECTION("SearchRemembersResultsForIndexing") {
        REQUIRE(engine.refresh().has_value());
        auto results = engine.search("news");
        REQUIRE(results.size() == 1);

        auto picked = engine.result_at(0);
        REQUIRE(picked.has_value());
        REQUIRE(picked->title == "News");
        REQUIRE_FALSE(engine.result_at(1).has_value());
    }

    SECTION("FindByIdentity") {
        auto res = engine.refresh();
        REQUIRE(res.has_value());
        auto id = (*res)->at(1).identity;

        auto found = engine.find(id);
        REQUIRE(found.has_value());
        REQUIRE(found->owner_name == "Browser");
        REQUIRE_FALSE(engine.find("no-such-id").has_value());
    }

    SECTION("ActivateGoesThroughSource") {
        REQUIRE(engine.refresh().has_value());
        auto r = engine.find(engine.snapshot()->at(0).identity);
        REQUIRE(r.has_value());

        source.calls.clear();
        REQUIRE(engine.activate(*r).has_value());
        REQUIRE(source.calls == std::vector<std::string>{"activate_process 10", "focus_window 1"});
    }

    SECTION("CloseDiscardsSession") {
        REQUIRE(engine.refresh().has_value());
        engine.search("");
        engine.close();

        REQUIRE(engine.snapshot()->empty());
        REQUIRE_FALSE(engine.has_snapshot());
        REQUIRE_FALSE(engine.result_at(0).has_value());
        REQUIRE_FALSE(engine.last_refresh().has_value());
    }

    SECTION("CloseDuringRefreshDiscardsItsResult") {
        source.during_listing = [&] { engine.close(); };

        auto res = engine.refresh();
        REQUIRE(res.has_value());
        REQUIRE((*res)->size() == 2);
        REQUIRE_FALSE(engine.has_snapshot());
        REQUIRE(engine.snapshot()->empty());
    }
}
