#pragma once

// ── Version ─────────────────────────────────────────────────
constexpr const char* GENCACHE_VERSION = "0.2.0";

// ── Config files ────────────────────────────────────────────
constexpr const char* PROJECT_CONFIG_FILE   = "gencache.yaml";
constexpr const char* GLOBAL_CONFIG_DIR     = ".gencache";
constexpr const char* GLOBAL_CONFIG_FILE    = "config.yaml";
constexpr const char* BASE_DIR_ENV          = "GENCACHE_BASE";

// ── Cache records ───────────────────────────────────────────
constexpr const char* CACHE_RECORD_FILE     = "record.yaml";
constexpr int CACHE_RECORD_FORMAT           = 1;
constexpr const char* FINGERPRINT_DOMAIN    = "gencache-fingerprint-v1";

// ── Staging layout ──────────────────────────────────────────
constexpr const char* STAGING_SUBDIR          = "staging";
constexpr const char* INTEGRATIONS_CACHE_DIR  = "integrations-cache";
constexpr const char* CLONE_REFS_DIR          = "clone-refs";
constexpr const char* CLONE_RECORD_SUBDIR     = ".gencache";
constexpr const char* PROJECT_CACHE_SUBDIR    = "target/generation-cache-file";
constexpr int CLONE_DIR_HASH_CHARS            = 20;

// ── Defaults ────────────────────────────────────────────────
constexpr const char* DEFAULT_TOOL            = "sbt";
constexpr const char* DEFAULT_SCHEMA_VERSION  = "4.2";
constexpr const char* DEFAULT_INDEX_PREFIX    = "bloop-integrations";
constexpr const char* DEFAULT_SCHEMA_FILE     = "target/schema-version.json";
constexpr const char* DEFAULT_INTEGRATIONS    = "build-integrations";
constexpr const char* DEFAULT_RESOURCES_DIR   = "frontend/src/test/resources";
constexpr const char* DEFAULT_PLUGIN_SRC_DIR  = "integrations/sbt-bloop/src/main";

// ── System properties passed to the generating tool ─────────
// Use fmt::format("-D{}={}", key, value) with these.
constexpr const char* PROP_STAGING          = "sbt.global.staging";
constexpr const char* PROP_GLOBAL_PLUGINS   = "sbt.global.plugins";
constexpr const char* PROP_GLOBAL_SETTINGS  = "sbt.global.settings";
constexpr const char* PROP_INDEX            = "bloop.integrations.index";
constexpr const char* PROP_SCHEMA_VERSION   = "bloop.integrations.schemaVersion";

// ── Process exit codes ──────────────────────────────────────
constexpr int EXIT_SPAWN_FAILED   = 127;   // exec failed or fork failed
constexpr int EXIT_CHDIR_FAILED   = 126;   // working directory unusable
constexpr int EXIT_SIGNAL_BASE    = 128;   // 128 + signal number
