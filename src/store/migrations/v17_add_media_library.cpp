#include "store/migrations/units.hpp"
#include "common/log.hpp"

namespace dashstore::store::migrations {

namespace {

// Indexed items from media-server integrations (Plex, Jellyfin, Emby)
constexpr const char* LIBRARY_SCHEMA = R"SQL(
CREATE TABLE IF NOT EXISTS media_library (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    integration_instance_id TEXT NOT NULL,
    media_type TEXT NOT NULL CHECK(media_type IN ('movie', 'show', 'season', 'episode', 'music', 'photo')),
    library_key TEXT,
    item_key TEXT NOT NULL,
    title TEXT NOT NULL,
    original_title TEXT,
    sort_title TEXT,
    year INTEGER,
    thumb TEXT,
    art TEXT,
    summary TEXT,
    genres TEXT,
    studio TEXT,
    director TEXT,
    actors TEXT,
    rating REAL,
    content_rating TEXT,
    duration INTEGER,
    added_at INTEGER,
    updated_at INTEGER,
    tmdb_id INTEGER,
    imdb_id TEXT,
    indexed_at TEXT DEFAULT CURRENT_TIMESTAMP,
    UNIQUE(integration_instance_id, item_key)
);

CREATE INDEX IF NOT EXISTS idx_media_library_integration ON media_library(integration_instance_id);
CREATE INDEX IF NOT EXISTS idx_media_library_type ON media_library(media_type);
CREATE INDEX IF NOT EXISTS idx_media_library_title ON media_library(title);
CREATE INDEX IF NOT EXISTS idx_media_library_year ON media_library(year);
CREATE INDEX IF NOT EXISTS idx_media_library_tmdb ON media_library(tmdb_id);

CREATE TABLE IF NOT EXISTS library_sync_status (
    integration_instance_id TEXT PRIMARY KEY,
    total_items INTEGER DEFAULT 0,
    indexed_items INTEGER DEFAULT 0,
    last_sync_started TEXT,
    last_sync_completed TEXT,
    sync_status TEXT DEFAULT 'idle' CHECK(sync_status IN ('idle', 'syncing', 'error', 'completed')),
    error_message TEXT
);
)SQL";

// External-content FTS5 index kept in step with media_library by triggers
constexpr const char* SEARCH_SCHEMA = R"SQL(
CREATE VIRTUAL TABLE IF NOT EXISTS media_library_fts USING fts5(
    title,
    original_title,
    summary,
    actors,
    director,
    content=media_library,
    content_rowid=id
);

CREATE TRIGGER IF NOT EXISTS media_library_ai AFTER INSERT ON media_library BEGIN
    INSERT INTO media_library_fts(rowid, title, original_title, summary, actors, director)
    VALUES (NEW.id, NEW.title, NEW.original_title, NEW.summary, NEW.actors, NEW.director);
END;

CREATE TRIGGER IF NOT EXISTS media_library_ad AFTER DELETE ON media_library BEGIN
    INSERT INTO media_library_fts(media_library_fts, rowid, title, original_title, summary, actors, director)
    VALUES ('delete', OLD.id, OLD.title, OLD.original_title, OLD.summary, OLD.actors, OLD.director);
END;

CREATE TRIGGER IF NOT EXISTS media_library_au AFTER UPDATE ON media_library BEGIN
    INSERT INTO media_library_fts(media_library_fts, rowid, title, original_title, summary, actors, director)
    VALUES ('delete', OLD.id, OLD.title, OLD.original_title, OLD.summary, OLD.actors, OLD.director);
    INSERT INTO media_library_fts(rowid, title, original_title, summary, actors, director)
    VALUES (NEW.id, NEW.title, NEW.original_title, NEW.summary, NEW.actors, NEW.director);
END;
)SQL";

constexpr const char* DROP_SCHEMA = R"SQL(
DROP TRIGGER IF EXISTS media_library_au;
DROP TRIGGER IF EXISTS media_library_ad;
DROP TRIGGER IF EXISTS media_library_ai;
DROP TABLE IF EXISTS media_library_fts;
DROP TABLE IF EXISTS library_sync_status;
DROP TABLE IF EXISTS media_library;
)SQL";

std::expected<UnitReport, MigrationError> up(MigrationContext& ctx) {
    if (auto result = ctx.exec(LIBRARY_SCHEMA); !result) {
        return std::unexpected(result.error());
    }
    if (auto result = ctx.exec(SEARCH_SCHEMA); !result) {
        return std::unexpected(result.error());
    }
    NLOG_DEBUG(log::MIGRATE_LOGGER, "media_library, library_sync_status and media_library_fts ready");
    return UnitReport{};
}

std::expected<UnitReport, MigrationError> down(MigrationContext& ctx) {
    if (auto result = ctx.exec(DROP_SCHEMA); !result) {
        return std::unexpected(result.error());
    }
    NLOG_DEBUG(log::MIGRATE_LOGGER, "Dropped media library tables");
    return UnitReport{};
}

}  // anonymous namespace

Migration add_media_library() {
    return Migration{17, "add_media_library", up, down};
}

} // namespace dashstore::store::migrations
