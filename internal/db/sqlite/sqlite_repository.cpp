#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <type_traits>

#include "internal/db/sql/record_codec.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace tams::db::sqlite {

using tams::db::ErrorCode;
using tams::db::Result;

namespace {

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

template <typename T>
void BindOpt(sqlite3_stmt* st, int idx, const std::optional<T>& v) {
    if (!v) {
        sqlite3_bind_null(st, idx);
        return;
    }
    if constexpr (std::is_same_v<T, std::string>) {
        BindText(st, idx, *v);
    } else {
        BindI64(st, idx, static_cast<int64_t>(*v));
    }
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

bool IsNull(sqlite3_stmt* st, int col) {
    return sqlite3_column_type(st, col) == SQLITE_NULL;
}

template <typename T>
std::optional<T> ColOpt(sqlite3_stmt* st, int col) {
    if (IsNull(st, col)) return std::nullopt;
    if constexpr (std::is_same_v<T, std::string>) {
        return ColText(st, col);
    } else {
        return static_cast<T>(sqlite3_column_int64(st, col));
    }
}

// ------------------------------------------------------------------
// Row readers (column order matches sql_queries.hpp)
// ------------------------------------------------------------------

model::SourceRecord ReadSource(sqlite3_stmt* st) {
    model::SourceRecord r;
    r.id          = ColText(st, 0);
    r.format      = sql::DecodeFormat(ColText(st, 1));
    r.label       = ColText(st, 2);
    r.description = ColText(st, 3);
    r.tags        = sql::DecodeTags(ColText(st, 4));
    r.created_at  = sql::DecodeTime(ColText(st, 5));
    r.updated_at  = sql::DecodeTime(ColText(st, 6));
    return r;
}

model::FlowRecord ReadFlow(sqlite3_stmt* st) {
    model::FlowRecord r;
    r.id              = ColText(st, 0);
    r.source_id       = ColOpt<std::string>(st, 1);
    r.format          = sql::DecodeFormat(ColText(st, 2));
    r.label           = ColText(st, 3);
    r.description     = ColText(st, 4);
    r.tags            = sql::DecodeTags(ColText(st, 5));
    r.read_only       = ColI32(st, 6) != 0;
    r.max_bit_rate    = ColOpt<uint64_t>(st, 7);
    r.avg_bit_rate    = ColOpt<uint64_t>(st, 8);
    r.container       = ColText(st, 9);
    r.codec           = ColText(st, 10);
    r.frame_width     = ColOpt<uint32_t>(st, 11);
    r.frame_height    = ColOpt<uint32_t>(st, 12);
    r.sample_rate     = ColOpt<uint32_t>(st, 13);
    r.channels        = ColOpt<uint32_t>(st, 14);
    r.flow_collection = sql::DecodeFlowCollection(ColText(st, 15));
    r.available       = sql::DecodeTimeRangeSet(ColText(st, 16));
    r.created_at      = sql::DecodeTime(ColText(st, 17));
    r.updated_at      = sql::DecodeTime(ColText(st, 18));
    return r;
}

model::SegmentRecord ReadSegment(sqlite3_stmt* st) {
    model::SegmentRecord r;
    r.flow_id         = ColText(st, 0);
    r.object_id       = ColText(st, 1);
    r.timerange       = sql::DecodeTimeRange(ColText(st, 2));
    r.ts_offset       = sql::DecodeTimePoint(ColText(st, 3));
    r.sample_offset   = ColOpt<uint64_t>(st, 4);
    r.sample_count    = ColOpt<uint64_t>(st, 5);
    r.key_frame_count = ColOpt<uint64_t>(st, 6);
    r.get_urls        = sql::DecodeGetUrls(ColText(st, 7));
    r.created_at      = sql::DecodeTime(ColText(st, 8));
    return r;
}

model::MediaObjectRecord ReadMediaObject(sqlite3_stmt* st) {
    model::MediaObjectRecord r;
    r.object_id       = ColText(st, 0);
    r.size_bytes      = ColU64(st, 1);
    r.mime_type       = ColText(st, 2);
    r.flow_references = sql::DecodeFlowReferences(ColText(st, 3));
    r.created_at      = sql::DecodeTime(ColText(st, 4));
    if (!IsNull(st, 5)) r.unreferenced_since = sql::DecodeTime(ColText(st, 5));
    return r;
}

model::WebhookRecord ReadWebhook(sqlite3_stmt* st) {
    model::WebhookRecord r;
    r.url           = ColText(st, 0);
    r.api_key_name  = ColText(st, 1);
    r.api_key_value = ColText(st, 2);
    r.events        = sql::DecodeStrings(ColText(st, 3));
    return r;
}

model::DeletionRequestRecord ReadDeletionRequest(sqlite3_stmt* st) {
    model::DeletionRequestRecord r;
    r.id        = ColText(st, 0);
    r.flow_id   = ColText(st, 1);
    r.timerange = sql::DecodeTimeRange(ColText(st, 2));

    const auto status = tams::model::DeletionStatusFromString(ColText(st, 3));
    if (!status) throw util::StorageFailure("corrupt deletion request status: " + ColText(st, 3));
    r.status = *status;

    if (!IsNull(st, 4)) r.remaining = sql::DecodeTimeRange(ColText(st, 4));
    r.segments_processed = ColU64(st, 5);
    r.error              = ColText(st, 6);
    r.cancel_requested   = ColI32(st, 7) != 0;
    r.created_at         = sql::DecodeTime(ColText(st, 8));
    r.updated_at         = sql::DecodeTime(ColText(st, 9));
    return r;
}

model::EventRecord ReadEvent(sqlite3_stmt* st) {
    model::EventRecord r;
    r.id         = ColU64(st, 0);
    r.event_type = ColText(st, 1);
    r.payload    = ColText(st, 2);
    r.created_at = sql::DecodeTime(ColText(st, 3));
    r.dispatched = ColI32(st, 4) != 0;
    return r;
}

model::DeliveryRecord ReadDelivery(sqlite3_stmt* st) {
    model::DeliveryRecord r;
    r.event_id    = ColU64(st, 0);
    r.webhook_url = ColText(st, 1);
    r.status      = ColText(st, 2);
    r.attempts    = static_cast<uint32_t>(ColI32(st, 3));
    r.last_error  = ColText(st, 4);
    r.updated_at  = sql::DecodeTime(ColText(st, 5));
    return r;
}

// ------------------------------------------------------------------
// Row writers
// ------------------------------------------------------------------

void BindSource(sqlite3_stmt* st, const model::SourceRecord& r) {
    BindText(st, 1, r.id);
    BindText(st, 2, std::string(tams::model::ToUrn(r.format)));
    BindText(st, 3, r.label);
    BindText(st, 4, r.description);
    BindText(st, 5, sql::EncodeTags(r.tags));
    BindText(st, 6, util::FormatIso8601(r.created_at));
    BindText(st, 7, util::FormatIso8601(r.updated_at));
}

void BindFlow(sqlite3_stmt* st, const model::FlowRecord& r) {
    BindText(st, 1, r.id);
    BindOpt(st, 2, r.source_id);
    BindText(st, 3, std::string(tams::model::ToUrn(r.format)));
    BindText(st, 4, r.label);
    BindText(st, 5, r.description);
    BindText(st, 6, sql::EncodeTags(r.tags));
    BindI32(st, 7, r.read_only ? 1 : 0);
    BindOpt(st, 8, r.max_bit_rate);
    BindOpt(st, 9, r.avg_bit_rate);
    BindText(st, 10, r.container);
    BindText(st, 11, r.codec);
    BindOpt(st, 12, r.frame_width);
    BindOpt(st, 13, r.frame_height);
    BindOpt(st, 14, r.sample_rate);
    BindOpt(st, 15, r.channels);
    BindText(st, 16, sql::EncodeFlowCollection(r.flow_collection));
    BindText(st, 17, sql::EncodeTimeRangeSet(r.available));
    BindText(st, 18, util::FormatIso8601(r.created_at));
    BindText(st, 19, util::FormatIso8601(r.updated_at));
}

void BindMediaObject(sqlite3_stmt* st, const model::MediaObjectRecord& r) {
    BindText(st, 1, r.object_id);
    BindU64(st, 2, r.size_bytes);
    BindText(st, 3, r.mime_type);
    BindText(st, 4, sql::EncodeFlowReferences(r.flow_references));
    BindText(st, 5, util::FormatIso8601(r.created_at));
    if (r.unreferenced_since) {
        BindText(st, 6, util::FormatIso8601(*r.unreferenced_since));
    } else {
        sqlite3_bind_null(st, 6);
    }
}

void BindDeletionRequest(sqlite3_stmt* st, const model::DeletionRequestRecord& r) {
    BindText(st, 1, r.id);
    BindText(st, 2, r.flow_id);
    BindText(st, 3, r.timerange.ToString());
    BindText(st, 4, std::string(tams::model::ToString(r.status)));
    if (r.remaining) {
        BindText(st, 5, r.remaining->ToString());
    } else {
        sqlite3_bind_null(st, 5);
    }
    BindU64(st, 6, r.segments_processed);
    BindText(st, 7, r.error);
    BindI32(st, 8, r.cancel_requested ? 1 : 0);
    BindText(st, 9, util::FormatIso8601(r.created_at));
    BindText(st, 10, util::FormatIso8601(r.updated_at));
}

void BindDelivery(sqlite3_stmt* st, const model::DeliveryRecord& r) {
    BindU64(st, 1, r.event_id);
    BindText(st, 2, r.webhook_url);
    BindText(st, 3, r.status);
    BindI32(st, 4, static_cast<int>(r.attempts));
    BindText(st, 5, r.last_error);
    BindText(st, 6, util::FormatIso8601(r.updated_at));
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

Result SqliteRepository::TranslateChange(sqlite3* db, int rc, const std::string& what) {
    auto result = Translate(db, rc);
    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, what);
    return result;
}

// ------------------------------------------------------------------
// Sources
// ------------------------------------------------------------------

Result SqliteRepository::InsertSource(Transaction& t, const model::SourceRecord& r) {
    auto*     db = TX(t).Handle();
    Statement st(db, sql::INSERT_SOURCE);
    BindSource(st.get(), r);
    return Translate(db, st.Step());
}

std::optional<model::SourceRecord> SqliteRepository::GetSource(Transaction& t, const std::string& id) {
    Statement st(TX(t).Handle(), sql::SELECT_SOURCE);
    BindText(st.get(), 1, id);
    if (!st.NextRow()) return std::nullopt;
    return ReadSource(st.get());
}

std::vector<model::SourceRecord> SqliteRepository::ListSources(Transaction& t, const model::SourceFilter& filter, const Page& page) {
    Statement st(TX(t).Handle(), sql::LIST_SOURCES);
    BindOpt(st.get(), 1, page.after_id);
    BindOpt(st.get(), 2, filter.label);
    if (filter.format) {
        BindText(st.get(), 3, std::string(tams::model::ToUrn(*filter.format)));
    } else {
        sqlite3_bind_null(st.get(), 3);
    }
    BindU64(st.get(), 4, page.limit);

    std::vector<model::SourceRecord> out;
    while (st.NextRow()) out.push_back(ReadSource(st.get()));
    return out;
}

Result SqliteRepository::UpdateSource(Transaction& t, const model::SourceRecord& r) {
    auto*     db = TX(t).Handle();
    Statement st(db, sql::UPDATE_SOURCE);
    BindSource(st.get(), r);
    return TranslateChange(db, st.Step(), "source " + r.id);
}

Result SqliteRepository::DeleteSource(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();
    {
        Statement detach(db, sql::DETACH_SOURCE_FLOWS);
        BindText(detach.get(), 1, id);
        auto result = Translate(db, detach.Step());
        if (!result) return result;
    }
    Statement st(db, sql::DELETE_SOURCE);
    BindText(st.get(), 1, id);
    return TranslateChange(db, st.Step(), "source " + id);
}

// ------------------------------------------------------------------
// Flows
// ------------------------------------------------------------------

Result SqliteRepository::InsertFlow(Transaction& t, const model::FlowRecord& r) {
    auto*     db = TX(t).Handle();
    Statement st(db, sql::INSERT_FLOW);
    BindFlow(st.get(), r);
    return Translate(db, st.Step());
}

std::optional<model::FlowRecord> SqliteRepository::GetFlow(Transaction& t, const std::string& id) {
    Statement st(TX(t).Handle(), sql::SELECT_FLOW);
    BindText(st.get(), 1, id);
    if (!st.NextRow()) return std::nullopt;
    return ReadFlow(st.get());
}

std::vector<model::FlowRecord> SqliteRepository::ListFlows(Transaction& t, const model::FlowFilter& filter, const Page& page) {
    Statement st(TX(t).Handle(), sql::LIST_FLOWS);
    BindOpt(st.get(), 1, page.after_id);
    BindOpt(st.get(), 2, filter.source_id);
    if (filter.format) {
        BindText(st.get(), 3, std::string(tams::model::ToUrn(*filter.format)));
    } else {
        sqlite3_bind_null(st.get(), 3);
    }
    BindOpt(st.get(), 4, filter.label);
    BindU64(st.get(), 5, page.limit);

    std::vector<model::FlowRecord> out;
    while (st.NextRow()) out.push_back(ReadFlow(st.get()));
    return out;
}

Result SqliteRepository::UpdateFlow(Transaction& t, const model::FlowRecord& r) {
    auto*     db = TX(t).Handle();
    Statement st(db, sql::UPDATE_FLOW);
    BindFlow(st.get(), r);
    return TranslateChange(db, st.Step(), "flow " + r.id);
}

Result SqliteRepository::DeleteFlow(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();
    {
        Statement segments(db, sql::DELETE_FLOW_SEGMENTS);
        BindText(segments.get(), 1, id);
        auto result = Translate(db, segments.Step());
        if (!result) return result;
    }
    Statement st(db, sql::DELETE_FLOW);
    BindText(st.get(), 1, id);
    return TranslateChange(db, st.Step(), "flow " + id);
}

// ------------------------------------------------------------------
// Segments
// ------------------------------------------------------------------

Result SqliteRepository::InsertSegment(Transaction& t, const model::SegmentRecord& r) {
    auto*     db = TX(t).Handle();
    Statement st(db, sql::INSERT_SEGMENT);

    const auto cols = sql::ToColumns(r.timerange);
    BindText(st.get(), 1, r.flow_id);
    BindText(st.get(), 2, r.object_id);
    BindText(st.get(), 3, r.timerange.ToString());
    BindText(st.get(), 4, r.ts_offset.ToString());
    BindOpt(st.get(), 5, r.sample_offset);
    BindOpt(st.get(), 6, r.sample_count);
    BindOpt(st.get(), 7, r.key_frame_count);
    BindText(st.get(), 8, sql::EncodeGetUrls(r.get_urls));
    BindText(st.get(), 9, util::FormatIso8601(r.created_at));
    BindOpt(st.get(), 10, cols.start_sec);
    BindOpt(st.get(), 11, cols.start_nsec);
    BindI32(st.get(), 12, cols.start_excl);
    BindOpt(st.get(), 13, cols.end_sec);
    BindOpt(st.get(), 14, cols.end_nsec);
    return Translate(db, st.Step());
}

std::vector<model::SegmentRecord> SqliteRepository::FindSegments(Transaction& t, const model::SegmentQuery& query) {
    Statement st(TX(t).Handle(), sql::FIND_SEGMENTS);

    const auto range = sql::ToColumns(query.range);
    BindText(st.get(), 1, query.flow_id);
    BindOpt(st.get(), 2, range.start_sec);
    BindOpt(st.get(), 3, range.end_sec);
    if (query.after) {
        BindOpt(st.get(), 4, sql::ToColumns(*query.after).start_sec);
    } else {
        sqlite3_bind_null(st.get(), 4);
    }

    std::vector<model::SegmentRecord> out;
    while (st.NextRow()) {
        if (query.limit && out.size() >= *query.limit) break;
        auto segment = ReadSegment(st.get());
        if (model::Matches(segment, query)) out.push_back(std::move(segment));
    }
    return out;
}

Result SqliteRepository::DeleteSegment(Transaction& t, const std::string& flow_id, const std::string& object_id,
                                       const tams::model::TimeRange& timerange) {
    auto*     db = TX(t).Handle();
    Statement st(db, sql::DELETE_SEGMENT);
    BindText(st.get(), 1, flow_id);
    BindText(st.get(), 2, object_id);
    BindText(st.get(), 3, timerange.ToString());
    return TranslateChange(db, st.Step(), "segment " + object_id + " " + timerange.ToString());
}

// ------------------------------------------------------------------
// Media objects
// ------------------------------------------------------------------

Result SqliteRepository::UpsertMediaObject(Transaction& t, const model::MediaObjectRecord& r) {
    auto*     db = TX(t).Handle();
    Statement st(db, sql::UPSERT_MEDIA_OBJECT);
    BindMediaObject(st.get(), r);
    return Translate(db, st.Step());
}

std::optional<model::MediaObjectRecord> SqliteRepository::GetMediaObject(Transaction& t, const std::string& object_id) {
    Statement st(TX(t).Handle(), sql::SELECT_MEDIA_OBJECT);
    BindText(st.get(), 1, object_id);
    if (!st.NextRow()) return std::nullopt;
    return ReadMediaObject(st.get());
}

Result SqliteRepository::DeleteMediaObject(Transaction& t, const std::string& object_id) {
    auto*     db = TX(t).Handle();
    Statement st(db, sql::DELETE_MEDIA_OBJECT);
    BindText(st.get(), 1, object_id);
    return TranslateChange(db, st.Step(), "media object " + object_id);
}

std::vector<model::MediaObjectRecord> SqliteRepository::ListOrphanedMediaObjects(Transaction& t, util::WallTime cutoff, std::size_t limit) {
    Statement st(TX(t).Handle(), sql::LIST_ORPHANED_MEDIA_OBJECTS);
    BindText(st.get(), 1, util::FormatIso8601(cutoff));
    BindU64(st.get(), 2, limit);

    std::vector<model::MediaObjectRecord> out;
    while (st.NextRow()) {
        auto record = ReadMediaObject(st.get());
        if (record.flow_references.empty()) out.push_back(std::move(record));
    }
    return out;
}

// ------------------------------------------------------------------
// Webhooks
// ------------------------------------------------------------------

Result SqliteRepository::UpsertWebhook(Transaction& t, const model::WebhookRecord& r) {
    auto*     db = TX(t).Handle();
    Statement st(db, sql::UPSERT_WEBHOOK);
    BindText(st.get(), 1, r.url);
    BindText(st.get(), 2, r.api_key_name);
    BindText(st.get(), 3, r.api_key_value);
    BindText(st.get(), 4, sql::EncodeStrings(r.events));
    return Translate(db, st.Step());
}

std::optional<model::WebhookRecord> SqliteRepository::GetWebhook(Transaction& t, const std::string& url) {
    Statement st(TX(t).Handle(), sql::SELECT_WEBHOOK);
    BindText(st.get(), 1, url);
    if (!st.NextRow()) return std::nullopt;
    return ReadWebhook(st.get());
}

std::vector<model::WebhookRecord> SqliteRepository::ListWebhooks(Transaction& t) {
    Statement st(TX(t).Handle(), sql::LIST_WEBHOOKS);
    std::vector<model::WebhookRecord> out;
    while (st.NextRow()) out.push_back(ReadWebhook(st.get()));
    return out;
}

Result SqliteRepository::DeleteWebhook(Transaction& t, const std::string& url) {
    auto*     db = TX(t).Handle();
    Statement st(db, sql::DELETE_WEBHOOK);
    BindText(st.get(), 1, url);
    return TranslateChange(db, st.Step(), "webhook " + url);
}

// ------------------------------------------------------------------
// Deletion requests
// ------------------------------------------------------------------

Result SqliteRepository::InsertDeletionRequest(Transaction& t, const model::DeletionRequestRecord& r) {
    auto*     db = TX(t).Handle();
    Statement st(db, sql::INSERT_DELETION_REQUEST);
    BindDeletionRequest(st.get(), r);
    return Translate(db, st.Step());
}

std::optional<model::DeletionRequestRecord> SqliteRepository::GetDeletionRequest(Transaction& t, const std::string& id) {
    Statement st(TX(t).Handle(), sql::SELECT_DELETION_REQUEST);
    BindText(st.get(), 1, id);
    if (!st.NextRow()) return std::nullopt;
    return ReadDeletionRequest(st.get());
}

std::vector<model::DeletionRequestRecord> SqliteRepository::ListDeletionRequests(Transaction& t) {
    Statement st(TX(t).Handle(), sql::LIST_DELETION_REQUESTS);
    std::vector<model::DeletionRequestRecord> out;
    while (st.NextRow()) out.push_back(ReadDeletionRequest(st.get()));
    return out;
}

Result SqliteRepository::UpdateDeletionRequest(Transaction& t, const model::DeletionRequestRecord& r) {
    auto*     db = TX(t).Handle();
    Statement st(db, sql::UPDATE_DELETION_REQUEST);
    BindDeletionRequest(st.get(), r);
    return TranslateChange(db, st.Step(), "deletion request " + r.id);
}

// ------------------------------------------------------------------
// Event outbox
// ------------------------------------------------------------------

Result SqliteRepository::AppendEvent(Transaction& t, model::EventRecord& event) {
    auto*     db = TX(t).Handle();
    Statement st(db, sql::INSERT_EVENT);
    BindText(st.get(), 1, event.event_type);
    BindText(st.get(), 2, event.payload);
    BindText(st.get(), 3, util::FormatIso8601(event.created_at));

    const int rc = st.Step();
    if (rc != SQLITE_ROW) return Translate(db, rc);
    event.id = ColU64(st.get(), 0);
    return Translate(db, st.Step());
}

std::optional<model::EventRecord> SqliteRepository::GetEvent(Transaction& t, uint64_t id) {
    Statement st(TX(t).Handle(), sql::SELECT_EVENT);
    BindU64(st.get(), 1, id);
    if (!st.NextRow()) return std::nullopt;
    return ReadEvent(st.get());
}

std::vector<model::EventRecord> SqliteRepository::ListUndispatchedEvents(Transaction& t, std::size_t limit) {
    Statement st(TX(t).Handle(), sql::LIST_UNDISPATCHED_EVENTS);
    BindU64(st.get(), 1, limit);
    std::vector<model::EventRecord> out;
    while (st.NextRow()) out.push_back(ReadEvent(st.get()));
    return out;
}

Result SqliteRepository::MarkEventDispatched(Transaction& t, uint64_t id) {
    auto*     db = TX(t).Handle();
    Statement st(db, sql::MARK_EVENT_DISPATCHED);
    BindU64(st.get(), 1, id);
    return TranslateChange(db, st.Step(), "event " + std::to_string(id));
}

Result SqliteRepository::InsertDelivery(Transaction& t, const model::DeliveryRecord& r) {
    auto*     db = TX(t).Handle();
    Statement st(db, sql::INSERT_DELIVERY);
    BindDelivery(st.get(), r);
    return Translate(db, st.Step());
}

Result SqliteRepository::UpdateDelivery(Transaction& t, const model::DeliveryRecord& r) {
    auto*     db = TX(t).Handle();
    Statement st(db, sql::UPDATE_DELIVERY);
    BindDelivery(st.get(), r);
    return TranslateChange(db, st.Step(), "delivery for event " + std::to_string(r.event_id));
}

std::vector<model::DeliveryRecord> SqliteRepository::ListPendingDeliveries(Transaction& t) {
    Statement st(TX(t).Handle(), sql::LIST_PENDING_DELIVERIES);
    std::vector<model::DeliveryRecord> out;
    while (st.NextRow()) out.push_back(ReadDelivery(st.get()));
    return out;
}

} // namespace tams::db::sqlite
