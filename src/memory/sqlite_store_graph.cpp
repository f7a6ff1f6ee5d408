#include "sqlite_store.hpp"
#include "sqlite_util.hpp"
#include "text.hpp"
#include <sqlite3.h>
#include <deque>
#include <unordered_set>

namespace hoofy {

namespace {

constexpr int kDefaultContextDepth = 2;
constexpr int kMaxContextDepth = 5;

std::string describe_edge(int64_t from, int64_t to, const std::string& type) {
    return std::to_string(from) + " -> " + std::to_string(to) + " (" + type + ")";
}

int64_t insert_relation(sqlite3* db, int64_t from, int64_t to, const std::string& type,
                        const std::string& note, const std::string& now) {
    Stmt st(db, "INSERT INTO relations (from_id, to_id, type, note, created_at)"
                " VALUES (?, ?, ?, ?, ?)");
    st.bind(from).bind(to).bind(type).bind(nullable(note)).bind(now);
    try {
        st.run();
    } catch (const MemoryError& e) {
        if (e.kind() == ErrorKind::AlreadyExists) {
            throw MemoryError(ErrorKind::AlreadyExists,
                              "relation already exists: " + describe_edge(from, to, type));
        }
        throw;
    }
    return st.last_insert_id();
}

} // namespace

std::vector<int64_t> SqliteStore::add_relation(const AddRelationParams& params) {
    if (params.from_id == params.to_id) {
        throw MemoryError(ErrorKind::InvalidArgument,
                          "cannot create self-relation: from_id and to_id are both " +
                          std::to_string(params.from_id));
    }
    std::string type = params.type.empty() ? kDefaultRelationType : params.type;

    std::lock_guard<std::mutex> lock(mutex_);
    for (int64_t id : {params.from_id, params.to_id}) {
        Stmt st(db_, "SELECT 1 FROM observations WHERE id = ? AND deleted_at IS NULL");
        st.bind(id);
        if (!st.step()) {
            throw MemoryError(ErrorKind::NotFound,
                              "observation #" + std::to_string(id) + " not found or is deleted");
        }
    }

    std::string now = now_text();
    if (!params.bidirectional) {
        return {insert_relation(db_, params.from_id, params.to_id, type, params.note, now)};
    }

    // Both legs or neither
    Transaction tx(db_);
    int64_t forward = insert_relation(db_, params.from_id, params.to_id, type, params.note, now);
    int64_t reverse = insert_relation(db_, params.to_id, params.from_id, type, params.note, now);
    tx.commit();
    return {forward, reverse};
}

void SqliteStore::remove_relation(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Stmt st(db_, "DELETE FROM relations WHERE id = ?");
    st.bind(id).run();
    if (st.changes() == 0) {
        throw MemoryError(ErrorKind::NotFound, "relation " + std::to_string(id) + " not found");
    }
}

std::vector<Relation> SqliteStore::get_relations(int64_t observation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return get_relations_locked(observation_id);
}

std::vector<Relation> SqliteStore::get_relations_locked(int64_t observation_id) {
    Stmt st(db_, "SELECT id, from_id, to_id, type, COALESCE(note, ''), created_at"
                 " FROM relations"
                 " WHERE from_id = ? OR to_id = ?"
                 " ORDER BY created_at ASC, id ASC");
    st.bind(observation_id).bind(observation_id);

    std::vector<Relation> result;
    while (st.step()) {
        Relation r;
        r.id = st.column_int64(0);
        r.from_id = st.column_int64(1);
        r.to_id = st.column_int64(2);
        r.type = st.column_text(3);
        r.note = st.column_text(4);
        r.created_at = st.column_text(5);
        result.push_back(std::move(r));
    }
    return result;
}

ContextResult SqliteStore::build_context(int64_t observation_id, int max_depth) {
    if (max_depth <= 0) max_depth = kDefaultContextDepth;
    if (max_depth > kMaxContextDepth) max_depth = kMaxContextDepth;

    std::lock_guard<std::mutex> lock(mutex_);
    ContextResult result;
    result.root = get_observation_locked(observation_id);

    struct QueueItem {
        int64_t id;
        int depth;
    };
    std::unordered_set<int64_t> visited{observation_id};
    std::deque<QueueItem> queue;
    queue.push_back({observation_id, 0});

    while (!queue.empty()) {
        QueueItem current = queue.front();
        queue.pop_front();
        if (current.depth >= max_depth) continue;

        for (const auto& rel : get_relations_locked(current.id)) {
            int64_t other = rel.to_id;
            Direction direction = Direction::Outgoing;
            if (rel.to_id == current.id) {
                other = rel.from_id;
                direction = Direction::Incoming;
            }
            if (!visited.insert(other).second) continue;

            // Metadata only; a neighbor removed since the adjacency read is skipped
            Stmt meta(db_, "SELECT id, title, type, COALESCE(project, ''), created_at"
                           " FROM observations WHERE id = ?");
            meta.bind(other);
            if (!meta.step()) continue;

            ContextNode node;
            node.id = meta.column_int64(0);
            node.title = meta.column_text(1);
            node.type = meta.column_text(2);
            node.project = meta.column_text(3);
            node.created_at = meta.column_text(4);
            node.relation_type = rel.type;
            node.direction = direction;
            node.note = rel.note;
            node.depth = current.depth + 1;

            if (node.depth > result.max_depth) result.max_depth = node.depth;
            queue.push_back({other, node.depth});
            result.connected.push_back(std::move(node));
        }
    }

    result.total_nodes = static_cast<uint32_t>(result.connected.size());
    return result;
}

} // namespace hoofy
