#pragma once

#include <string>
#include <vector>

namespace tams::db::sql {

/*
  Idempotent bootstrap DDL, one list per engine.

  Timestamps are ISO-8601 TEXT, time ranges their canonical string form,
  structured fields JSON TEXT. flow_segments carries the numeric start/end
  columns next to the canonical timerange for ordering.
*/

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS sources (id TEXT PRIMARY KEY, format TEXT NOT NULL, label TEXT NOT NULL DEFAULT '', description TEXT NOT NULL DEFAULT '', tags TEXT NOT NULL DEFAULT '{}', created_at TEXT NOT NULL, updated_at TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS flows (id TEXT PRIMARY KEY, source_id TEXT REFERENCES sources(id) ON DELETE SET NULL, format TEXT NOT NULL, label TEXT NOT NULL DEFAULT '', description TEXT NOT NULL DEFAULT '', tags TEXT NOT NULL DEFAULT '{}', read_only INTEGER NOT NULL DEFAULT 0, max_bit_rate INTEGER, avg_bit_rate INTEGER, container TEXT NOT NULL DEFAULT '', codec TEXT NOT NULL DEFAULT '', frame_width INTEGER, frame_height INTEGER, sample_rate INTEGER, channels INTEGER, flow_collection TEXT NOT NULL DEFAULT '[]', available_timerange TEXT NOT NULL DEFAULT '[]', created_at TEXT NOT NULL, updated_at TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS flow_segments (flow_id TEXT NOT NULL REFERENCES flows(id) ON DELETE CASCADE, object_id TEXT NOT NULL, timerange TEXT NOT NULL, ts_offset TEXT NOT NULL DEFAULT '0:0', sample_offset INTEGER, sample_count INTEGER, key_frame_count INTEGER, get_urls TEXT NOT NULL DEFAULT '[]', created_at TEXT NOT NULL, start_sec INTEGER, start_nsec INTEGER, start_excl INTEGER NOT NULL DEFAULT 0, end_sec INTEGER, end_nsec INTEGER, PRIMARY KEY (flow_id, object_id, timerange));",
      "CREATE INDEX IF NOT EXISTS idx_flow_segments_start ON flow_segments(flow_id, start_sec, start_nsec);",
      "CREATE INDEX IF NOT EXISTS idx_flow_segments_object ON flow_segments(object_id);",
      "CREATE TABLE IF NOT EXISTS media_objects (object_id TEXT PRIMARY KEY, size_bytes INTEGER NOT NULL DEFAULT 0, mime_type TEXT NOT NULL DEFAULT '', flow_references TEXT NOT NULL DEFAULT '{}', created_at TEXT NOT NULL, unreferenced_since TEXT);",
      "CREATE INDEX IF NOT EXISTS idx_media_objects_unreferenced ON media_objects(unreferenced_since);",
      "CREATE TABLE IF NOT EXISTS webhooks (url TEXT PRIMARY KEY, api_key_name TEXT NOT NULL DEFAULT '', api_key_value TEXT NOT NULL DEFAULT '', events TEXT NOT NULL DEFAULT '[]');",
      "CREATE TABLE IF NOT EXISTS deletion_requests (id TEXT PRIMARY KEY, flow_id TEXT NOT NULL, timerange TEXT NOT NULL, status TEXT NOT NULL, remaining TEXT, segments_processed INTEGER NOT NULL DEFAULT 0, error TEXT NOT NULL DEFAULT '', cancel_requested INTEGER NOT NULL DEFAULT 0, created_at TEXT NOT NULL, updated_at TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_deletion_requests_status ON deletion_requests(status);",
      "CREATE TABLE IF NOT EXISTS events (id INTEGER PRIMARY KEY AUTOINCREMENT, event_type TEXT NOT NULL, payload TEXT NOT NULL, created_at TEXT NOT NULL, dispatched INTEGER NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS idx_events_dispatched ON events(dispatched, id);",
      "CREATE TABLE IF NOT EXISTS webhook_deliveries (event_id INTEGER NOT NULL REFERENCES events(id) ON DELETE CASCADE, webhook_url TEXT NOT NULL, status TEXT NOT NULL, attempts INTEGER NOT NULL DEFAULT 0, last_error TEXT NOT NULL DEFAULT '', updated_at TEXT NOT NULL, PRIMARY KEY (event_id, webhook_url));",
  };
  return kSchema;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS sources (id TEXT PRIMARY KEY, format TEXT NOT NULL, label TEXT NOT NULL DEFAULT '', description TEXT NOT NULL DEFAULT '', tags TEXT NOT NULL DEFAULT '{}', created_at TEXT NOT NULL, updated_at TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS flows (id TEXT PRIMARY KEY, source_id TEXT REFERENCES sources(id) ON DELETE SET NULL, format TEXT NOT NULL, label TEXT NOT NULL DEFAULT '', description TEXT NOT NULL DEFAULT '', tags TEXT NOT NULL DEFAULT '{}', read_only INTEGER NOT NULL DEFAULT 0, max_bit_rate BIGINT, avg_bit_rate BIGINT, container TEXT NOT NULL DEFAULT '', codec TEXT NOT NULL DEFAULT '', frame_width BIGINT, frame_height BIGINT, sample_rate BIGINT, channels BIGINT, flow_collection TEXT NOT NULL DEFAULT '[]', available_timerange TEXT NOT NULL DEFAULT '[]', created_at TEXT NOT NULL, updated_at TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS flow_segments (flow_id TEXT NOT NULL REFERENCES flows(id) ON DELETE CASCADE, object_id TEXT NOT NULL, timerange TEXT NOT NULL, ts_offset TEXT NOT NULL DEFAULT '0:0', sample_offset BIGINT, sample_count BIGINT, key_frame_count BIGINT, get_urls TEXT NOT NULL DEFAULT '[]', created_at TEXT NOT NULL, start_sec BIGINT, start_nsec BIGINT, start_excl INTEGER NOT NULL DEFAULT 0, end_sec BIGINT, end_nsec BIGINT, PRIMARY KEY (flow_id, object_id, timerange));",
      "CREATE INDEX IF NOT EXISTS idx_flow_segments_start ON flow_segments(flow_id, start_sec, start_nsec);",
      "CREATE INDEX IF NOT EXISTS idx_flow_segments_object ON flow_segments(object_id);",
      "CREATE TABLE IF NOT EXISTS media_objects (object_id TEXT PRIMARY KEY, size_bytes BIGINT NOT NULL DEFAULT 0, mime_type TEXT NOT NULL DEFAULT '', flow_references TEXT NOT NULL DEFAULT '{}', created_at TEXT NOT NULL, unreferenced_since TEXT);",
      "CREATE INDEX IF NOT EXISTS idx_media_objects_unreferenced ON media_objects(unreferenced_since);",
      "CREATE TABLE IF NOT EXISTS webhooks (url TEXT PRIMARY KEY, api_key_name TEXT NOT NULL DEFAULT '', api_key_value TEXT NOT NULL DEFAULT '', events TEXT NOT NULL DEFAULT '[]');",
      "CREATE TABLE IF NOT EXISTS deletion_requests (id TEXT PRIMARY KEY, flow_id TEXT NOT NULL, timerange TEXT NOT NULL, status TEXT NOT NULL, remaining TEXT, segments_processed BIGINT NOT NULL DEFAULT 0, error TEXT NOT NULL DEFAULT '', cancel_requested INTEGER NOT NULL DEFAULT 0, created_at TEXT NOT NULL, updated_at TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_deletion_requests_status ON deletion_requests(status);",
      "CREATE TABLE IF NOT EXISTS events (id BIGSERIAL PRIMARY KEY, event_type TEXT NOT NULL, payload TEXT NOT NULL, created_at TEXT NOT NULL, dispatched INTEGER NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS idx_events_dispatched ON events(dispatched, id);",
      "CREATE TABLE IF NOT EXISTS webhook_deliveries (event_id BIGINT NOT NULL REFERENCES events(id) ON DELETE CASCADE, webhook_url TEXT NOT NULL, status TEXT NOT NULL, attempts INTEGER NOT NULL DEFAULT 0, last_error TEXT NOT NULL DEFAULT '', updated_at TEXT NOT NULL, PRIMARY KEY (event_id, webhook_url));",
  };
  return kSchema;
}

} // namespace tams::db::sql
