#include "ramws/version.hpp"

#include "ramws/hash.hpp"
#include "ramws/jsonlite.hpp"

namespace ramws {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.semver = SEMVER;
  const auto info = hash_runtime_info();
  m.hash_primitive = info.primitive;
  m.hash_version = info.version;
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  jsonlite::Object o;
  o["semver"] = m.semver;
  o["state_format"] = std::uint64_t{m.state_format};
  o["audit_log"] = std::uint64_t{m.audit_log};
  o["event_log"] = std::uint64_t{m.event_log};
  o["hash_primitive"] = m.hash_primitive;
  o["hash_version"] = m.hash_version;
  o["build_timestamp"] = m.build_timestamp;
  return jsonlite::to_json(o);
}

}  // namespace version
}  // namespace ramws
