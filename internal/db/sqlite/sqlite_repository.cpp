#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/schema.hpp"

namespace opentimeline::db::sqlite {

using opentimeline::db::ErrorCode;
using opentimeline::db::Result;

namespace {

struct StmtDeleter {
    void operator()(sqlite3_stmt* st) const { sqlite3_finalize(st); }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

// Read paths throw: an unpreparable statement is a bug or a broken schema,
// never "no rows".
Stmt Prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
    return Stmt(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s) BindText(st, idx, *s);
    else sqlite3_bind_null(st, idx);
}

template <typename Int>
void BindOptInt(sqlite3_stmt* st, int idx, const std::optional<Int>& v) {
    if (v) sqlite3_bind_int(st, idx, static_cast<int>(*v));
    else sqlite3_bind_null(st, idx);
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColText(st, col);
}

template <typename Int>
std::optional<Int> ColOptInt(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return static_cast<Int>(sqlite3_column_int(st, col));
}

constexpr const char* kEntityColumns =
    "id,name,start_year,start_month,start_day,end_year,end_month,end_day";

model::EntityRecord ReadEntity(sqlite3_stmt* st) {
    model::EntityRecord r;
    r.id          = ColText(st, 0);
    r.name        = ColText(st, 1);
    r.start_year  = sqlite3_column_int(st, 2);
    r.start_month = ColOptInt<uint8_t>(st, 3);
    r.start_day   = ColOptInt<uint8_t>(st, 4);
    r.end_year    = ColOptInt<int32_t>(st, 5);
    r.end_month   = ColOptInt<uint8_t>(st, 6);
    r.end_day     = ColOptInt<uint8_t>(st, 7);
    return r;
}

model::TimelineRecord ReadTimeline(sqlite3_stmt* st) {
    model::TimelineRecord r;
    r.id              = ColText(st, 0);
    r.name            = ColText(st, 1);
    r.bool_expression = ColOptText(st, 2);
    return r;
}

model::TagRecord ReadTag(sqlite3_stmt* st) {
    model::TagRecord r;
    r.owner_id = ColText(st, 0);
    r.name     = ColOptText(st, 1);
    r.value    = ColText(st, 2);
    return r;
}

std::vector<std::string> ReadStrings(sqlite3_stmt* st) {
    std::vector<std::string> out;
    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ColText(st, 0));
    }
    return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

void SqliteRepository::BootstrapSchema() {
    for (const char* sql : sql::kBootstrapSchema) {
        db_->Exec(sql);
    }
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT: {
            const int ext = sqlite3_extended_errcode(db);
            if (ext == SQLITE_CONSTRAINT_UNIQUE || ext == SQLITE_CONSTRAINT_PRIMARYKEY)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        }
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Entities
// ------------------------------------------------------------------

Result SqliteRepository::InsertEntity(Transaction& t, const model::EntityRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db,
            "INSERT INTO entities(id,name,start_year,start_month,start_day,end_year,end_month,end_day) "
            "VALUES(?,?,?,?,?,?,?,?);",
            -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Stmt st(raw);

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.name);
    sqlite3_bind_int(st.get(), 3, r.start_year);
    BindOptInt(st.get(), 4, r.start_month);
    BindOptInt(st.get(), 5, r.start_day);
    BindOptInt(st.get(), 6, r.end_year);
    BindOptInt(st.get(), 7, r.end_month);
    BindOptInt(st.get(), 8, r.end_day);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::EntityRecord>
SqliteRepository::GetEntity(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, (std::string("SELECT ") + kEntityColumns + " FROM entities WHERE id=?;").c_str());
    BindText(st.get(), 1, id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadEntity(st.get());
}

std::vector<model::EntityRecord> SqliteRepository::ListEntities(Transaction& t) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, (std::string("SELECT ") + kEntityColumns + " FROM entities ORDER BY rowid;").c_str());

    std::vector<model::EntityRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadEntity(st.get()));
    }
    return out;
}

Result SqliteRepository::InsertEntityTag(Transaction& t, const model::TagRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, "INSERT INTO entity_tags(entity_id,name,value) VALUES(?,?,?);", -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Stmt st(raw);

    BindText(st.get(), 1, r.owner_id);
    BindOptText(st.get(), 2, r.name);
    BindText(st.get(), 3, r.value);

    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::TagRecord> SqliteRepository::GetEntityTags(Transaction& t, const std::string& entity_id) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, "SELECT entity_id,name,value FROM entity_tags WHERE entity_id=? ORDER BY rowid;");
    BindText(st.get(), 1, entity_id);

    std::vector<model::TagRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadTag(st.get()));
    }
    return out;
}

std::vector<model::TagRecord> SqliteRepository::ListEntityTags(Transaction& t) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, "SELECT entity_id,name,value FROM entity_tags ORDER BY rowid;");

    std::vector<model::TagRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadTag(st.get()));
    }
    return out;
}

// ------------------------------------------------------------------
// Timelines
// ------------------------------------------------------------------

Result SqliteRepository::InsertTimeline(Transaction& t, const model::TimelineRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, "INSERT INTO timelines(id,name,bool_expression) VALUES(?,?,?);", -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Stmt st(raw);

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.name);
    BindOptText(st.get(), 3, r.bool_expression);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::TimelineRecord>
SqliteRepository::GetTimeline(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, "SELECT id,name,bool_expression FROM timelines WHERE id=?;");
    BindText(st.get(), 1, id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadTimeline(st.get());
}

std::optional<model::TimelineRecord>
SqliteRepository::GetTimelineByName(Transaction& t, const std::string& name) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, "SELECT id,name,bool_expression FROM timelines WHERE name=?;");
    BindText(st.get(), 1, name);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadTimeline(st.get());
}

std::vector<model::TimelineRecord> SqliteRepository::ListTimelines(Transaction& t) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, "SELECT id,name,bool_expression FROM timelines ORDER BY rowid;");

    std::vector<model::TimelineRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadTimeline(st.get()));
    }
    return out;
}

Result SqliteRepository::InsertTimelineTag(Transaction& t, const model::TagRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, "INSERT INTO timeline_tags(timeline_id,name,value) VALUES(?,?,?);", -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Stmt st(raw);

    BindText(st.get(), 1, r.owner_id);
    BindOptText(st.get(), 2, r.name);
    BindText(st.get(), 3, r.value);

    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::TagRecord> SqliteRepository::GetTimelineTags(Transaction& t, const std::string& timeline_id) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, "SELECT timeline_id,name,value FROM timeline_tags WHERE timeline_id=? ORDER BY rowid;");
    BindText(st.get(), 1, timeline_id);

    std::vector<model::TagRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadTag(st.get()));
    }
    return out;
}

// ------------------------------------------------------------------
// Subtimelines
// ------------------------------------------------------------------

Result SqliteRepository::InsertSubtimeline(Transaction& t, const model::SubtimelineRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, "INSERT INTO subtimelines(timeline_parent_id,timeline_child_id) VALUES(?,?);", -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Stmt st(raw);

    BindText(st.get(), 1, r.parent_id);
    BindText(st.get(), 2, r.child_id);

    return Translate(db, sqlite3_step(st.get()));
}

std::vector<std::string> SqliteRepository::ListSubtimelineChildren(Transaction& t, const std::string& parent_id) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, "SELECT timeline_child_id FROM subtimelines WHERE timeline_parent_id=? ORDER BY rowid;");
    BindText(st.get(), 1, parent_id);
    return ReadStrings(st.get());
}

std::vector<model::SubtimelineRecord> SqliteRepository::ListSubtimelineEdges(Transaction& t) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, "SELECT timeline_parent_id,timeline_child_id FROM subtimelines ORDER BY rowid;");

    std::vector<model::SubtimelineRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back({ColText(st.get(), 0), ColText(st.get(), 1)});
    }
    return out;
}

// ------------------------------------------------------------------
// Timeline-entity links
// ------------------------------------------------------------------

Result SqliteRepository::InsertTimelineEntity(Transaction& t, const model::TimelineEntityRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, "INSERT INTO timeline_entities(timeline_id,entity_id) VALUES(?,?);", -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Stmt st(raw);

    BindText(st.get(), 1, r.timeline_id);
    BindText(st.get(), 2, r.entity_id);

    return Translate(db, sqlite3_step(st.get()));
}

std::vector<std::string> SqliteRepository::ListLinkedEntities(Transaction& t, const std::string& timeline_id) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, "SELECT entity_id FROM timeline_entities WHERE timeline_id=? ORDER BY rowid;");
    BindText(st.get(), 1, timeline_id);
    return ReadStrings(st.get());
}

std::vector<model::TimelineEntityRecord> SqliteRepository::ListTimelineEntityLinks(Transaction& t) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, "SELECT timeline_id,entity_id FROM timeline_entities ORDER BY rowid;");

    std::vector<model::TimelineEntityRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back({ColText(st.get(), 0), ColText(st.get(), 1)});
    }
    return out;
}

} // namespace opentimeline::db::sqlite
