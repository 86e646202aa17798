#pragma once

// ramws/version.hpp — Version manifest for every persisted or emitted format.
//
// PURPOSE:
//   A workspace created by one ramws build may be inspected by another. Every
//   reader of a versioned format checks its constant here first.
//
// INVARIANT:
//   Never accept data from a newer format version than this build writes.
//   Older versions are read only where an explicit upgrade path exists.

#include <cstdint>
#include <string>

namespace ramws {
namespace version {

constexpr const char* SEMVER = "0.1.0";

// ---------------------------------------------------------------------------
// STATE_FORMAT_VERSION
// Layout of <ram_root>/.ramws/state.json.
// Version 1 = WorkspaceRecord with per-role SyncRecord, pending counts and the
// in_flight marker.
// Version 2 = adds the per-rule RAM baseline manifest. Version 1 records are
// still read; their rules have no baseline until the next sync of each rule.
// Adding a required field requires a bump.
// ---------------------------------------------------------------------------
constexpr uint32_t STATE_FORMAT_VERSION = 2;

// ---------------------------------------------------------------------------
// AUDIT_LOG_VERSION
// NDJSON audit entries (RAMWS_AUDIT_LOG), BLAKE3-chained.
// ---------------------------------------------------------------------------
constexpr uint32_t AUDIT_LOG_VERSION = 1;

// ---------------------------------------------------------------------------
// EVENT_LOG_VERSION
// NDJSON WorkspaceEvent lines (RAMWS_EVENT_LOG).
// ---------------------------------------------------------------------------
constexpr uint32_t EVENT_LOG_VERSION = 1;

struct VersionManifest {
  uint32_t state_format{STATE_FORMAT_VERSION};
  uint32_t audit_log{AUDIT_LOG_VERSION};
  uint32_t event_log{EVENT_LOG_VERSION};
  std::string semver;
  std::string hash_primitive;     // "blake3"
  std::string hash_version;       // BLAKE3 library version
  std::string build_timestamp;    // from __DATE__/__TIME__
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace ramws
