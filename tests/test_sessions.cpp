#include <catch2/catch.hpp>
#include "store_fixture.hpp"

using namespace hoofy;

TEST_CASE("Sessions: create and get", "[sessions]") {
    StoreFixture f;

    auto s = f.store.get_session("s1");
    REQUIRE(s.has_value());
    REQUIRE(s->id == "s1");
    REQUIRE(s->project == "hoofy");
    REQUIRE(s->directory == "/work/hoofy");
    REQUIRE(s->started_at == "2023-11-14 22:13:20");
    REQUIRE_FALSE(s->ended_at.has_value());
    REQUIRE_FALSE(s->summary.has_value());
}

TEST_CASE("Sessions: missing id returns nothing", "[sessions]") {
    StoreFixture f;
    REQUIRE_FALSE(f.store.get_session("nope").has_value());
}

TEST_CASE("Sessions: create is idempotent and keeps the original", "[sessions]") {
    StoreFixture f;

    f.advance_minutes(5);
    f.store.create_session("s1", "renamed", "/elsewhere");

    auto s = f.store.get_session("s1");
    REQUIRE(s.has_value());
    REQUIRE(s->project == "hoofy");
    REQUIRE(s->started_at == "2023-11-14 22:13:20");
    REQUIRE(f.raw_int("SELECT COUNT(*) FROM sessions") == 1);
}

TEST_CASE("Sessions: empty id rejected", "[sessions]") {
    StoreFixture f;
    REQUIRE(error_kind_of([&] { f.store.create_session("", "p", "/d"); }) ==
            ErrorKind::InvalidArgument);
}

TEST_CASE("Sessions: end records time and summary", "[sessions]") {
    StoreFixture f;

    f.advance_minutes(30);
    f.store.end_session("s1", "Wired up the store");

    auto s = f.store.get_session("s1");
    REQUIRE(s.has_value());
    REQUIRE(s->ended_at.value_or("") == "2023-11-14 22:43:20");
    REQUIRE(s->summary.value_or("") == "Wired up the store");
}

TEST_CASE("Sessions: end with empty summary leaves it unset", "[sessions]") {
    StoreFixture f;

    f.store.end_session("s1", "");
    auto s = f.store.get_session("s1");
    REQUIRE(s.has_value());
    REQUIRE(s->ended_at.has_value());
    REQUIRE_FALSE(s->summary.has_value());
}

TEST_CASE("Sessions: end of unknown session is NotFound", "[sessions]") {
    StoreFixture f;
    REQUIRE(error_kind_of([&] { f.store.end_session("ghost", "x"); }) == ErrorKind::NotFound);
}

TEST_CASE("Sessions: recent ordered by latest activity", "[sessions]") {
    StoreFixture f;

    f.advance_minutes(10);
    f.store.create_session("s2", "other", "/work/other");
    f.advance_minutes(10);
    f.add("Late note", "activity in s1");

    auto recent = f.store.recent_sessions();
    REQUIRE(recent.size() == 2);
    REQUIRE(recent[0].id == "s1");
    REQUIRE(recent[0].observation_count == 1);
    REQUIRE(recent[1].id == "s2");
    REQUIRE(recent[1].observation_count == 0);
}

TEST_CASE("Sessions: recent filters by project and limit", "[sessions]") {
    StoreFixture f;

    f.advance_minutes(1);
    f.store.create_session("s2", "other", "/work/other");
    f.advance_minutes(1);
    f.store.create_session("s3", "other", "/work/other");

    auto other = f.store.recent_sessions("other");
    REQUIRE(other.size() == 2);
    REQUIRE(other[0].id == "s3");

    REQUIRE(f.store.recent_sessions("", 1).size() == 1);
    REQUIRE(f.store.recent_sessions("missing").empty());
}

TEST_CASE("Sessions: deleted observations not counted", "[sessions]") {
    StoreFixture f;

    int64_t id = f.add("Gone", "soon");
    f.add("Stays", "here");
    f.store.delete_observation(id);

    auto recent = f.store.recent_sessions("hoofy");
    REQUIRE(recent.size() == 1);
    REQUIRE(recent[0].observation_count == 1);
}
