#include <catch2/catch.hpp>
#include "store_fixture.hpp"

using namespace hoofy;

// Seven observations in s1, one per minute
static std::vector<int64_t> fill_session(StoreFixture& f) {
    std::vector<int64_t> ids;
    for (int i = 0; i < 7; i++) {
        ids.push_back(f.add("Step " + std::to_string(i), "work item " + std::to_string(i)));
        f.advance_minutes(1);
    }
    return ids;
}

TEST_CASE("Timeline: window around the focus", "[timeline]") {
    StoreFixture f;
    auto ids = fill_session(f);

    TimelineResult t = f.store.timeline(ids[3], 2, 2);
    REQUIRE(t.focus.id == ids[3]);
    REQUIRE(t.before.size() == 2);
    REQUIRE(t.before[0].id == ids[1]);
    REQUIRE(t.before[1].id == ids[2]);
    REQUIRE(t.after.size() == 2);
    REQUIRE(t.after[0].id == ids[4]);
    REQUIRE(t.after[1].id == ids[5]);
    REQUIRE(t.total_in_range == 7);
    REQUIRE(t.session.has_value());
    REQUIRE(t.session->id == "s1");
}

TEST_CASE("Timeline: non-positive counts default to five", "[timeline]") {
    StoreFixture f;
    auto ids = fill_session(f);

    TimelineResult t = f.store.timeline(ids[6], 0, -1);
    REQUIRE(t.before.size() == 5);
    REQUIRE(t.before.front().id == ids[1]);
    REQUIRE(t.after.empty());
}

TEST_CASE("Timeline: other sessions and deleted rows excluded", "[timeline]") {
    StoreFixture f;
    f.store.create_session("s2", "hoofy", "/work/hoofy");

    int64_t a = f.add("A", "first");
    AddObservationParams p;
    p.session_id = "s2";
    p.type = "decision";
    p.title = "Elsewhere";
    p.content = "other session";
    p.project = "hoofy";
    f.store.add_observation(p);
    int64_t b = f.add("B", "second");
    int64_t c = f.add("C", "third");
    f.store.delete_observation(b);

    TimelineResult t = f.store.timeline(c);
    REQUIRE(t.before.size() == 1);
    REQUIRE(t.before[0].id == a);
    REQUIRE(t.after.empty());
    REQUIRE(t.total_in_range == 2);
}

TEST_CASE("Timeline: missing session record is tolerated", "[timeline]") {
    StoreFixture f;
    int64_t id = f.add("Orphan", "session row will vanish");
    // Second connection does not enforce foreign keys
    f.raw_exec("DELETE FROM sessions WHERE id = 's1'");

    TimelineResult t = f.store.timeline(id);
    REQUIRE(t.focus.id == id);
    REQUIRE_FALSE(t.session.has_value());
    REQUIRE(t.total_in_range == 1);
}

TEST_CASE("Timeline: missing or deleted focus is NotFound", "[timeline]") {
    StoreFixture f;
    REQUIRE(error_kind_of([&] { f.store.timeline(5); }) == ErrorKind::NotFound);

    int64_t id = f.add("Gone", "soon");
    f.store.delete_observation(id);
    REQUIRE(error_kind_of([&] { f.store.timeline(id); }) == ErrorKind::NotFound);
}
