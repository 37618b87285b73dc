#pragma once

/**
 * Schema constants for the Cutline job database
 * Table, pragma and resource names live here, not in the SQL call sites
 */

namespace cutline {
namespace schema {

// Schema versioning
static const int INITIAL_SCHEMA_VERSION = 1;
static const int CURRENT_SCHEMA_VERSION = 2;

// Database configuration
static const char* const WAL_JOURNAL_MODE = "WAL";
static const int BUSY_TIMEOUT_MS = 5000;
static const int PRAGMA_BUSY_RETRIES = 50;
static const int PRAGMA_BUSY_RETRY_MS = 20;

// Required tables for schema validation
static const char* const REQUIRED_TABLES[] = {
    "schema_version",
    "jobs"
};

static const int REQUIRED_TABLES_COUNT = sizeof(REQUIRED_TABLES) / sizeof(REQUIRED_TABLES[0]);

// Triggers the store relies on for row invariants
static const char* const REQUIRED_TRIGGERS[] = {
    "jobs_input_immutable"
};

static const int REQUIRED_TRIGGERS_COUNT = sizeof(REQUIRED_TRIGGERS) / sizeof(REQUIRED_TRIGGERS[0]);

// SQL pragma settings
static const char* const SET_WAL_MODE = "PRAGMA journal_mode = WAL";
static const char* const SET_SYNCHRONOUS_NORMAL = "PRAGMA synchronous = NORMAL";
static const char* const SET_BUSY_TIMEOUT = "PRAGMA busy_timeout = %1";
static const char* const CHECK_JOURNAL_MODE = "PRAGMA journal_mode";

// Schema version queries
static const char* const CHECK_SCHEMA_TABLE =
    "SELECT name FROM sqlite_master WHERE type='table' AND name='schema_version'";
static const char* const GET_MAX_VERSION =
    "SELECT MAX(version) FROM schema_version";
static const char* const CHECK_TRIGGER =
    "SELECT name FROM sqlite_master WHERE type='trigger' AND name=?";

// Resource paths
static const char* const RESOURCE_SCHEMA_PATH = ":/sql/schema.sql";
static const char* const DEV_SCHEMA_PATH = "../src/core/persistence/schema.sql";

// Migration file patterns
static const char* const MIGRATION_RESOURCE_PATTERN = ":/sql/migration_v%1.sql";
static const char* const MIGRATION_DEV_PATTERN = "../src/core/persistence/migrations/migration_v%1.sql";

// Database connection naming
static const char* const CONNECTION_PREFIX = "cutline_";

} // namespace schema
} // namespace cutline
