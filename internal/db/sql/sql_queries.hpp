#pragma once

namespace tams::db::sql {

/*
  Canonical SQL used by all backends.

  IMPORTANT:
  Written in the subset shared by SQLite (>= 3.35) and PostgreSQL.
  Parameters use numbered placeholders (?1, ?2 ...); the Postgres backend
  rewrites them to $1, $2 ... before preparing. Nullable parameters are
  CAST so Postgres can infer their type.
*/

// sources

static constexpr const char* INSERT_SOURCE =
    "INSERT INTO sources(id,format,label,description,tags,created_at,updated_at)"
    " VALUES(?1,?2,?3,?4,?5,?6,?7)";

static constexpr const char* SELECT_SOURCE =
    "SELECT id,format,label,description,tags,created_at,updated_at"
    " FROM sources WHERE id=?1";

static constexpr const char* LIST_SOURCES =
    "SELECT id,format,label,description,tags,created_at,updated_at FROM sources"
    " WHERE (CAST(?1 AS TEXT) IS NULL OR id > ?1)"
    " AND (CAST(?2 AS TEXT) IS NULL OR label = ?2)"
    " AND (CAST(?3 AS TEXT) IS NULL OR format = ?3)"
    " ORDER BY id LIMIT ?4";

static constexpr const char* UPDATE_SOURCE =
    "UPDATE sources SET format=?2,label=?3,description=?4,tags=?5,created_at=?6,updated_at=?7"
    " WHERE id=?1";

static constexpr const char* DETACH_SOURCE_FLOWS = "UPDATE flows SET source_id=NULL WHERE source_id=?1";

static constexpr const char* DELETE_SOURCE = "DELETE FROM sources WHERE id=?1";

// flows

static constexpr const char* INSERT_FLOW =
    "INSERT INTO flows(id,source_id,format,label,description,tags,read_only,max_bit_rate,avg_bit_rate,"
    "container,codec,frame_width,frame_height,sample_rate,channels,flow_collection,available_timerange,"
    "created_at,updated_at)"
    " VALUES(?1,?2,?3,?4,?5,?6,?7,?8,?9,?10,?11,?12,?13,?14,?15,?16,?17,?18,?19)";

static constexpr const char* SELECT_FLOW =
    "SELECT id,source_id,format,label,description,tags,read_only,max_bit_rate,avg_bit_rate,"
    "container,codec,frame_width,frame_height,sample_rate,channels,flow_collection,available_timerange,"
    "created_at,updated_at FROM flows WHERE id=?1";

static constexpr const char* LIST_FLOWS =
    "SELECT id,source_id,format,label,description,tags,read_only,max_bit_rate,avg_bit_rate,"
    "container,codec,frame_width,frame_height,sample_rate,channels,flow_collection,available_timerange,"
    "created_at,updated_at FROM flows"
    " WHERE (CAST(?1 AS TEXT) IS NULL OR id > ?1)"
    " AND (CAST(?2 AS TEXT) IS NULL OR source_id = ?2)"
    " AND (CAST(?3 AS TEXT) IS NULL OR format = ?3)"
    " AND (CAST(?4 AS TEXT) IS NULL OR label = ?4)"
    " ORDER BY id LIMIT ?5";

static constexpr const char* UPDATE_FLOW =
    "UPDATE flows SET source_id=?2,format=?3,label=?4,description=?5,tags=?6,read_only=?7,"
    "max_bit_rate=?8,avg_bit_rate=?9,container=?10,codec=?11,frame_width=?12,frame_height=?13,"
    "sample_rate=?14,channels=?15,flow_collection=?16,available_timerange=?17,created_at=?18,updated_at=?19"
    " WHERE id=?1";

static constexpr const char* DELETE_FLOW_SEGMENTS = "DELETE FROM flow_segments WHERE flow_id=?1";

static constexpr const char* DELETE_FLOW = "DELETE FROM flows WHERE id=?1";

// segments

static constexpr const char* INSERT_SEGMENT =
    "INSERT INTO flow_segments(flow_id,object_id,timerange,ts_offset,sample_offset,sample_count,"
    "key_frame_count,get_urls,created_at,start_sec,start_nsec,start_excl,end_sec,end_nsec)"
    " VALUES(?1,?2,?3,?4,?5,?6,?7,?8,?9,?10,?11,?12,?13,?14)";

// Coarse, whole-second prefilter. Callers apply model::Matches on the rows.
static constexpr const char* FIND_SEGMENTS =
    "SELECT flow_id,object_id,timerange,ts_offset,sample_offset,sample_count,key_frame_count,get_urls,created_at"
    " FROM flow_segments WHERE flow_id=?1"
    " AND (CAST(?2 AS BIGINT) IS NULL OR end_sec IS NULL OR end_sec >= ?2)"
    " AND (CAST(?3 AS BIGINT) IS NULL OR start_sec IS NULL OR start_sec <= ?3)"
    " AND (CAST(?4 AS BIGINT) IS NULL OR start_sec IS NULL OR start_sec >= ?4)"
    " ORDER BY start_sec NULLS FIRST, start_nsec NULLS FIRST, start_excl, end_sec NULLS LAST, end_nsec NULLS LAST";

static constexpr const char* DELETE_SEGMENT =
    "DELETE FROM flow_segments WHERE flow_id=?1 AND object_id=?2 AND timerange=?3";

// media objects

static constexpr const char* UPSERT_MEDIA_OBJECT =
    "INSERT INTO media_objects(object_id,size_bytes,mime_type,flow_references,created_at,unreferenced_since)"
    " VALUES(?1,?2,?3,?4,?5,?6)"
    " ON CONFLICT(object_id) DO UPDATE SET"
    " size_bytes=excluded.size_bytes,"
    " mime_type=excluded.mime_type,"
    " flow_references=excluded.flow_references,"
    " unreferenced_since=excluded.unreferenced_since";

static constexpr const char* SELECT_MEDIA_OBJECT =
    "SELECT object_id,size_bytes,mime_type,flow_references,created_at,unreferenced_since"
    " FROM media_objects WHERE object_id=?1";

static constexpr const char* DELETE_MEDIA_OBJECT = "DELETE FROM media_objects WHERE object_id=?1";

// ISO-8601 UTC strings of fixed width order lexicographically.
static constexpr const char* LIST_ORPHANED_MEDIA_OBJECTS =
    "SELECT object_id,size_bytes,mime_type,flow_references,created_at,unreferenced_since"
    " FROM media_objects WHERE unreferenced_since IS NOT NULL AND unreferenced_since <= ?1"
    " ORDER BY unreferenced_since LIMIT ?2";

// webhooks

static constexpr const char* UPSERT_WEBHOOK =
    "INSERT INTO webhooks(url,api_key_name,api_key_value,events) VALUES(?1,?2,?3,?4)"
    " ON CONFLICT(url) DO UPDATE SET"
    " api_key_name=excluded.api_key_name,"
    " api_key_value=excluded.api_key_value,"
    " events=excluded.events";

static constexpr const char* SELECT_WEBHOOK = "SELECT url,api_key_name,api_key_value,events FROM webhooks WHERE url=?1";

static constexpr const char* LIST_WEBHOOKS = "SELECT url,api_key_name,api_key_value,events FROM webhooks ORDER BY url";

static constexpr const char* DELETE_WEBHOOK = "DELETE FROM webhooks WHERE url=?1";

// deletion requests

static constexpr const char* INSERT_DELETION_REQUEST =
    "INSERT INTO deletion_requests(id,flow_id,timerange,status,remaining,segments_processed,error,"
    "cancel_requested,created_at,updated_at) VALUES(?1,?2,?3,?4,?5,?6,?7,?8,?9,?10)";

static constexpr const char* SELECT_DELETION_REQUEST =
    "SELECT id,flow_id,timerange,status,remaining,segments_processed,error,cancel_requested,created_at,updated_at"
    " FROM deletion_requests WHERE id=?1";

static constexpr const char* LIST_DELETION_REQUESTS =
    "SELECT id,flow_id,timerange,status,remaining,segments_processed,error,cancel_requested,created_at,updated_at"
    " FROM deletion_requests ORDER BY created_at, id";

static constexpr const char* UPDATE_DELETION_REQUEST =
    "UPDATE deletion_requests SET flow_id=?2,timerange=?3,status=?4,remaining=?5,segments_processed=?6,"
    "error=?7,cancel_requested=?8,created_at=?9,updated_at=?10 WHERE id=?1";

// event outbox

static constexpr const char* INSERT_EVENT =
    "INSERT INTO events(event_type,payload,created_at,dispatched) VALUES(?1,?2,?3,0) RETURNING id";

static constexpr const char* SELECT_EVENT =
    "SELECT id,event_type,payload,created_at,dispatched FROM events WHERE id=?1";

static constexpr const char* LIST_UNDISPATCHED_EVENTS =
    "SELECT id,event_type,payload,created_at,dispatched FROM events WHERE dispatched=0 ORDER BY id LIMIT ?1";

static constexpr const char* MARK_EVENT_DISPATCHED = "UPDATE events SET dispatched=1 WHERE id=?1";

static constexpr const char* INSERT_DELIVERY =
    "INSERT INTO webhook_deliveries(event_id,webhook_url,status,attempts,last_error,updated_at)"
    " VALUES(?1,?2,?3,?4,?5,?6)";

static constexpr const char* UPDATE_DELIVERY =
    "UPDATE webhook_deliveries SET status=?3,attempts=?4,last_error=?5,updated_at=?6"
    " WHERE event_id=?1 AND webhook_url=?2";

static constexpr const char* LIST_PENDING_DELIVERIES =
    "SELECT event_id,webhook_url,status,attempts,last_error,updated_at FROM webhook_deliveries"
    " WHERE status='pending' ORDER BY event_id, webhook_url";

} // namespace tams::db::sql
