#include <catch2/catch.hpp>
#include "store_fixture.hpp"
#include <set>

using namespace hoofy;

static void relate(StoreFixture& f, int64_t from, int64_t to, const std::string& type,
                   const std::string& note = "") {
    AddRelationParams p;
    p.from_id = from;
    p.to_id = to;
    p.type = type;
    p.note = note;
    f.store.add_relation(p);
}

// Chain n[0] -> n[1] -> ... -> n[count-1]
static std::vector<int64_t> make_chain(StoreFixture& f, int count) {
    std::vector<int64_t> ids;
    for (int i = 0; i < count; i++) {
        ids.push_back(f.add("Node " + std::to_string(i), "content " + std::to_string(i)));
    }
    for (int i = 0; i + 1 < count; i++) {
        relate(f, ids[i], ids[i + 1], "next");
    }
    return ids;
}

TEST_CASE("BuildContext: two-hop chain", "[build_context]") {
    StoreFixture f;
    int64_t a = f.add("A", "alpha");
    int64_t b = f.add("B", "beta", "architecture");
    int64_t c = f.add("C", "gamma");
    relate(f, a, b, "depends_on", "needs B");
    relate(f, b, c, "implements");

    ContextResult ctx = f.store.build_context(a, 2);
    REQUIRE(ctx.root.id == a);
    REQUIRE(ctx.total_nodes == 2);
    REQUIRE(ctx.max_depth == 2);
    REQUIRE(ctx.connected.size() == 2);

    REQUIRE(ctx.connected[0].id == b);
    REQUIRE(ctx.connected[0].depth == 1);
    REQUIRE(ctx.connected[0].direction == Direction::Outgoing);
    REQUIRE(ctx.connected[0].relation_type == "depends_on");
    REQUIRE(ctx.connected[0].note == "needs B");
    REQUIRE(ctx.connected[0].title == "B");
    REQUIRE(ctx.connected[0].type == "architecture");
    REQUIRE(ctx.connected[0].project == "hoofy");

    REQUIRE(ctx.connected[1].id == c);
    REQUIRE(ctx.connected[1].depth == 2);
    REQUIRE(ctx.connected[1].relation_type == "implements");
}

TEST_CASE("BuildContext: depth one stops at neighbors", "[build_context]") {
    StoreFixture f;
    auto n = make_chain(f, 3);

    ContextResult ctx = f.store.build_context(n[0], 1);
    REQUIRE(ctx.total_nodes == 1);
    REQUIRE(ctx.connected[0].id == n[1]);
    REQUIRE(ctx.max_depth == 1);
}

TEST_CASE("BuildContext: incoming edges", "[build_context]") {
    StoreFixture f;
    auto n = make_chain(f, 3);

    ContextResult ctx = f.store.build_context(n[2], 2);
    REQUIRE(ctx.total_nodes == 2);
    REQUIRE(ctx.connected[0].id == n[1]);
    REQUIRE(ctx.connected[0].direction == Direction::Incoming);
    REQUIRE(ctx.connected[1].id == n[0]);
    REQUIRE(ctx.connected[1].direction == Direction::Incoming);
    REQUIRE(ctx.connected[1].depth == 2);
}

TEST_CASE("BuildContext: cycle never repeats a node", "[build_context]") {
    StoreFixture f;
    auto n = make_chain(f, 4);
    relate(f, n[3], n[0], "next");

    ContextResult ctx = f.store.build_context(n[0], 5);
    REQUIRE(ctx.total_nodes == 3);

    std::set<int64_t> seen;
    for (const auto& node : ctx.connected) {
        REQUIRE(node.id != n[0]);
        REQUIRE(seen.insert(node.id).second);
    }
    // n1 and n3 are both direct neighbors of the root
    REQUIRE(ctx.max_depth == 2);
}

TEST_CASE("BuildContext: depth clamped", "[build_context]") {
    StoreFixture f;
    auto n = make_chain(f, 8);

    REQUIRE(f.store.build_context(n[0], 0).total_nodes == 2);
    REQUIRE(f.store.build_context(n[0], -4).total_nodes == 2);

    ContextResult deep = f.store.build_context(n[0], 50);
    REQUIRE(deep.total_nodes == 5);
    REQUIRE(deep.max_depth == 5);
}

TEST_CASE("BuildContext: isolated node", "[build_context]") {
    StoreFixture f;
    int64_t a = f.add("Alone", "nobody around");

    ContextResult ctx = f.store.build_context(a);
    REQUIRE(ctx.connected.empty());
    REQUIRE(ctx.total_nodes == 0);
    REQUIRE(ctx.max_depth == 0);
}

TEST_CASE("BuildContext: missing or deleted root is NotFound", "[build_context]") {
    StoreFixture f;
    REQUIRE(error_kind_of([&] { f.store.build_context(42); }) == ErrorKind::NotFound);

    int64_t a = f.add("A", "alpha");
    f.store.delete_observation(a);
    REQUIRE(error_kind_of([&] { f.store.build_context(a); }) == ErrorKind::NotFound);
}

TEST_CASE("BuildContext: hard-deleted neighbor disappears", "[build_context]") {
    StoreFixture f;
    auto n = make_chain(f, 3);

    f.store.delete_observation(n[1], true);
    ContextResult ctx = f.store.build_context(n[0], 3);
    REQUIRE(ctx.total_nodes == 0);
}
