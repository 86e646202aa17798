#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include "ramws/audit.hpp"
#include "ramws/classifier.hpp"
#include "ramws/config.hpp"
#include "ramws/glob.hpp"
#include "ramws/hash.hpp"
#include "ramws/jsonlite.hpp"
#include "ramws/manifest.hpp"
#include "ramws/mirror.hpp"
#include "ramws/observability.hpp"
#include "ramws/planner.hpp"
#include "ramws/process.hpp"
#include "ramws/safety_guard.hpp"
#include "ramws/shell.hpp"
#include "ramws/state_store.hpp"
#include "ramws/version.hpp"
#include "ramws/workspace.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

fs::path fresh_dir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / ("ramws_test_" + name);
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

void write_file(const fs::path& path, const std::string& content) {
  fs::create_directories(path.parent_path());
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs << content;
}

std::string read_file(const fs::path& path) {
  std::ifstream ifs(path, std::ios::binary);
  std::ostringstream buf;
  buf << ifs.rdbuf();
  return buf.str();
}

bool contains(const std::vector<std::string>& items, const std::string& value) {
  return std::find(items.begin(), items.end(), value) != items.end();
}

// A project directory and a RAM root side by side under one temp dir, with
// the native mirror so no rsync binary is needed.
struct Fixture {
  fs::path base;
  fs::path project;
  fs::path ram;
  ramws::ResolvedConfig resolved;
  ramws::NativeMirror mirror;
};

ramws::WorkspaceConfig fixture_config() {
  ramws::WorkspaceConfig cfg;
  ramws::SourceRule root;
  root.path = ".";
  root.exclude = {".git/**", "*.tmp"};
  cfg.sources.push_back(root);
  cfg.build_dirs.push_back(ramws::BuildDirRule{"build", ramws::Role::scratch});
  cfg.build_dirs.push_back(ramws::BuildDirRule{"deps", ramws::Role::cache});
  cfg.sync.mirror = ramws::MirrorBackend::native;
  cfg.sync.lock_timeout_ms = 100;
  return cfg;
}

void make_fixture(Fixture& f, const std::string& name, ramws::WorkspaceConfig cfg = fixture_config()) {
  f.base = fresh_dir(name);
  f.project = f.base / "project";
  f.ram = f.base / "ram";
  write_file(f.project / "src" / "a.txt", "alpha");
  write_file(f.project / "README", "readme");
  write_file(f.project / ".git" / "HEAD", "ref: refs/heads/main");
  write_file(f.project / "build" / "out.o", "object");
  write_file(f.project / "deps" / "lib.a", "archive");
  cfg.root_template = f.ram.string();
  const auto r = ramws::resolve_loaded(cfg, f.project, f.project / ".ramws.yml");
  expect(r.ok, "fixture config resolves: " + r.message);
  f.resolved = r.resolved;
}

// ============================================================================
// Pattern matching
// ============================================================================

void test_glob_match() {
  using ramws::glob::match;
  expect(match("*.o", "a/b/c.o", false), "basename pattern matches at any depth");
  expect(!match("*.o", "a/b/c.oo", false), "basename pattern is whole-component");
  expect(match("/build", "build", true), "anchored pattern matches at root");
  expect(!match("/build", "x/build", true), "anchored pattern does not match deeper");
  expect(!match("cache/", "cache", false), "trailing slash matches directories only");
  expect(match("cache/", "cache", true), "trailing slash matches a directory");
  expect(match("**/tmp", "tmp", true), "**/ may match nothing");
  expect(match("**/tmp", "a/b/tmp", true), "** spans directories");
  expect(match("src/**", "src/a/b.c", false), "src/** matches nested files");
  expect(!match("?.c", "ab.c", false), "? matches exactly one character");
  expect(match("[a-c].txt", "b.txt", false), "character range");
  expect(!match("[!a-c].txt", "b.txt", false), "negated character range");
  expect(match("gen/*.c", "x/gen/y.c", false), "slashed pattern matches a path suffix");
  expect(!match("/*", "a/b", false), "single star stops at a slash");
}

void test_glob_filter_set() {
  ramws::glob::FilterSet fs_{{"keep.log"}, {"*.log", "node_modules"}};
  expect(!fs_.excluded("keep.log", false), "include wins over exclude");
  expect(fs_.excluded("x.log", false), "exclude applies");
  expect(fs_.excluded("node_modules/a/b.js", false), "excluded directory excludes its subtree");
  expect(!fs_.excluded("src/main.c", false), "unmatched path is kept");
  expect(!fs_.excluded(".", true), "root is never excluded");

  ramws::glob::FilterSet git{{}, {".git/**"}};
  expect(git.excluded(".git/HEAD", false), ".git/** excludes entries below .git");
}

void test_glob_paths() {
  using namespace ramws::glob;
  bool escapes = false;
  expect(normalize_relative("./a//b/../c/", &escapes) == "a/c", "normalize collapses components");
  expect(!escapes, "normal path does not escape");
  normalize_relative("../x", &escapes);
  expect(escapes, ".. above root escapes");
  normalize_relative("/abs", &escapes);
  expect(escapes, "absolute path escapes");
  expect(normalize_relative("") == ".", "empty path is the root");
  expect(is_under("src/a", "src"), "child is under parent");
  expect(!is_under("srcx", "src"), "prefix is not containment");
  expect(is_under("anything", "."), "root contains everything");
  expect(relative_to("src/a/b", "src") == "a/b", "relative_to strips base");
  expect(relative_to("src", "src").empty(), "relative_to of self is empty");
  expect(join(".", "a") == "a" && join("a", "") == "a" && join("a", "b") == "a/b", "join");
}

// ============================================================================
// JSON + hashing
// ============================================================================

void test_jsonlite_roundtrip() {
  std::optional<ramws::jsonlite::JsonError> err;
  const auto o = ramws::jsonlite::parse(R"({"a":1,"b":"x","c":["p","q"],"d":{"e":true}})", &err);
  expect(!err, "valid JSON parses");
  expect(ramws::jsonlite::get_u64(o, "a") == 1, "integer field");
  expect(ramws::jsonlite::get_string(o, "b") == "x", "string field");
  const auto* c = std::get_if<ramws::jsonlite::Array>(&o.at("c").v);
  expect(c && c->size() == 2 && std::get<std::string>((*c)[1].v) == "q", "string array");
  const auto* d = ramws::jsonlite::get_object(o, "d");
  expect(d && ramws::jsonlite::get_bool(*d, "e"), "nested object");

  ramws::jsonlite::Object w;
  w["b"] = std::uint64_t{1};
  w["a"] = "two";
  expect(ramws::jsonlite::to_json(w) == R"({"a":"two","b":1})", "keys serialize sorted");
}

void test_jsonlite_rejects() {
  std::optional<ramws::jsonlite::JsonError> err;
  ramws::jsonlite::parse(R"({"a":1,"a":2})", &err);
  expect(err && err->code == "json_duplicate_key", "duplicate keys rejected");
  err.reset();
  ramws::jsonlite::parse(R"({"a":1} x)", &err);
  expect(err.has_value(), "trailing data rejected");
  ramws::jsonlite::parse(R"({"a":1.5})", &err);
  expect(err && err->message.find("integers") != std::string::npos, "fractions rejected");
  ramws::jsonlite::parse(R"({"a":-1})", &err);
  expect(err.has_value(), "negative numbers rejected");
  ramws::jsonlite::parse(R"({"a":18446744073709551616})", &err);
  expect(err.has_value(), "overflow rejected");

  const auto o = ramws::jsonlite::parse(R"({"max":18446744073709551615,"s":"caf\u00e9 \ud83d\ude00\n"})", &err);
  expect(!err && ramws::jsonlite::get_u64(o, "max") == ~std::uint64_t{0}, "full uint64 range");
  expect(ramws::jsonlite::get_string(o, "s") == "caf\xc3\xa9 \xf0\x9f\x98\x80\n", "unicode escapes decode to UTF-8");
  expect(ramws::jsonlite::to_json(ramws::jsonlite::Value{std::string("a\x01\"")}) == R"("a\u0001\"")",
         "control characters escaped");
}

void test_blake3_known_vectors() {
  expect(ramws::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(ramws::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
  expect(ramws::hash_domain("proj:", "x") != ramws::hash_domain("audit:", "x"), "domains separate");

  const fs::path tmp = fresh_dir("hash");
  write_file(tmp / "f.txt", "file content");
  expect(ramws::hash_file_blake3_hex((tmp / "f.txt").string()) == ramws::blake3_hex("file content"),
         "file hash == bytes hash");
  expect(ramws::hash_file_blake3_hex((tmp / "missing").string()).empty(), "missing file hashes empty");
}

// ============================================================================
// Configuration
// ============================================================================

void test_config_parse_full() {
  const std::string yaml =
      "workspace:\n"
      "  root: /dev/shm/${USER}/${PROJECT}\n"
      "sources:\n"
      "  - path: ./src/\n"
      "    exclude: [\"*.o\"]\n"
      "    include: [\"keep.o\"]\n"
      "  - docs\n"
      "build_dirs:\n"
      "  - path: build\n"
      "    type: cache\n"
      "  - target\n"
      "sync:\n"
      "  on_exit: auto\n"
      "  delete: false\n"
      "  lock_timeout_ms: 500\n"
      "  mirror: native\n";
  const auto r = ramws::parse_config(yaml);
  expect(r.ok, "full config parses: " + r.message);
  const auto& c = r.config;
  expect(c.root_template == "/dev/shm/${USER}/${PROJECT}", "root template kept verbatim");
  expect(c.sources.size() == 2 && c.sources[0].path == "src" && c.sources[1].path == "docs", "sources normalized");
  expect(c.sources[0].exclude.size() == 1 && c.sources[0].include.size() == 1, "source filters");
  expect(c.build_dirs.size() == 2 && c.build_dirs[0].role == ramws::Role::cache, "cache build dir");
  expect(c.build_dirs[1].role == ramws::Role::scratch, "bare build dir is scratch");
  expect(c.sync.on_exit == ramws::ExitPolicy::always, "auto is an alias of always");
  expect(!c.sync.delete_mirroring, "delete flag");
  expect(c.sync.lock_timeout_ms == 500, "lock timeout");
  expect(c.sync.mirror == ramws::MirrorBackend::native, "mirror backend");
}

void test_config_parse_errors() {
  const std::vector<std::string> bad = {
      "sync:\n  on_exit: maybe\n",
      "build_dirs:\n  - path: x\n    type: source\n",
      "sources: 5\n",
      "sources:\n  - ../up\n",
      "build_dirs:\n  - .\n",
      "sync:\n  mirror: ftp\n",
      "[unterminated",
  };
  for (const auto& text : bad) {
    const auto r = ramws::parse_config(text);
    expect(!r.ok && r.error == ramws::ErrorCode::configuration_error, "rejected config: " + text);
  }
}

void test_config_defaults() {
  const auto empty = ramws::parse_config("");
  expect(empty.ok && empty.config.sources.size() == 1 && empty.config.sources[0].path == ".",
         "empty config yields the default source");
  const auto round = ramws::parse_config(ramws::default_config_yaml());
  expect(round.ok, "default yaml parses: " + round.message);
  expect(round.config.sources.size() == 1 && round.config.sources[0].exclude.size() == 4, "default excludes");
  expect(round.config.sync.on_exit == ramws::ExitPolicy::ask, "default exit policy");
}

void test_project_key_and_template() {
  const std::string key = ramws::project_key_for("/home/u/myproj");
  expect(key.rfind("myproj-", 0) == 0 && key.size() == 14, "project key is <name>-<7 hex>");
  expect(key == ramws::project_key_for("/home/u/myproj"), "project key is stable");
  expect(key != ramws::project_key_for("/home/v/myproj"), "project key depends on the full path");
  expect(ramws::expand_root_template("/dev/shm/${USER}/${PROJECT}", "alice", "p-abc") == "/dev/shm/alice/p-abc",
         "template expansion");
}

void test_resolve_rejects_bad_roots() {
  ramws::WorkspaceConfig cfg = ramws::default_config();
  cfg.root_template = "relative/${PROJECT}";
  auto r = ramws::resolve_loaded(cfg, "/srv/proj", "/srv/proj/.ramws.yml");
  expect(!r.ok && r.error == ramws::ErrorCode::configuration_error, "relative RAM root rejected");
  cfg.root_template = "/srv/proj/ram";
  r = ramws::resolve_loaded(cfg, "/srv/proj", "/srv/proj/.ramws.yml");
  expect(!r.ok, "RAM root inside the project rejected");
  cfg.root_template = "/srv";
  r = ramws::resolve_loaded(cfg, "/srv/proj", "/srv/proj/.ramws.yml");
  expect(!r.ok, "RAM root containing the project rejected");
}

void test_init_and_discover() {
  const fs::path dir = fresh_dir("init");
  auto first = ramws::init_config(dir, false);
  expect(first.ok && fs::exists(dir / ".ramws.yml"), "init writes .ramws.yml");
  auto second = ramws::init_config(dir, false);
  expect(!second.ok && second.error == ramws::ErrorCode::configuration_error, "init refuses to overwrite");
  auto forced = ramws::init_config(dir, true);
  expect(forced.ok, "init --force overwrites");

  fs::create_directories(dir / "sub" / "deeper");
  const auto r = ramws::resolve_config(dir / "sub" / "deeper", std::nullopt);
  expect(r.ok, "config discovered from a subdirectory: " + r.message);
  expect(r.resolved.config_path.filename() == ".ramws.yml", "config path found");
}

// ============================================================================
// Classifier
// ============================================================================

void test_rule_set_conflicts() {
  ramws::WorkspaceConfig cfg;
  cfg.sources.push_back(ramws::SourceRule{"out", {}, {}});
  cfg.build_dirs.push_back(ramws::BuildDirRule{"out", ramws::Role::scratch});
  expect(ramws::build_rule_set(cfg).error == ramws::ErrorCode::configuration_error, "source == build dir");

  cfg = {};
  cfg.build_dirs.push_back(ramws::BuildDirRule{"x", ramws::Role::cache});
  cfg.build_dirs.push_back(ramws::BuildDirRule{"x", ramws::Role::scratch});
  expect(!ramws::build_rule_set(cfg).ok, "build dir declared with both types");

  cfg = {};
  cfg.sources.push_back(ramws::SourceRule{"src", {}, {}});
  cfg.sources.push_back(ramws::SourceRule{"./src", {}, {}});
  const auto dedup = ramws::build_rule_set(cfg);
  expect(dedup.ok && dedup.rules.sources.size() == 1, "duplicate source dropped");
}

void test_resolution_order() {
  ramws::WorkspaceConfig cfg;
  cfg.sources.push_back(ramws::SourceRule{".", {}, {"*.log", "vendor/**"}});
  cfg.sources.push_back(ramws::SourceRule{"vendor", {}, {}});
  cfg.build_dirs.push_back(ramws::BuildDirRule{"build", ramws::Role::scratch});
  cfg.build_dirs.push_back(ramws::BuildDirRule{"build/cache", ramws::Role::cache});
  const auto rs = ramws::build_rule_set(cfg);
  expect(rs.ok, "rule set builds");

  auto pc = ramws::resolve_path(rs.rules, "build/cache/x", false);
  expect(pc.role == ramws::Role::scratch && pc.rule_index == 0, "first build dir claims its subtree");
  expect(ramws::build_dir_shadowed(rs.rules, 1), "nested later build dir is shadowed");

  pc = ramws::resolve_path(rs.rules, "a.log", false);
  expect(!pc.role, "filtered path is excluded");
  pc = ramws::resolve_path(rs.rules, "src/main.c", false);
  expect(pc.role == ramws::Role::source && pc.rule_index == 0, "source path tracked");

  pc = ramws::resolve_path(rs.rules, "vendor/lib.c", false);
  expect(!pc.role, "first claiming source decides; no fall-through");
  expect(ramws::source_rule_shadowed(rs.rules, 1), "nested later source is shadowed");
}

void test_classify_totality() {
  ramws::WorkspaceConfig cfg;
  cfg.sources.push_back(ramws::SourceRule{"src", {}, {"*.o"}});
  cfg.build_dirs.push_back(ramws::BuildDirRule{"build", ramws::Role::scratch});
  cfg.build_dirs.push_back(ramws::BuildDirRule{"cache", ramws::Role::cache});
  const ramws::Snapshot snap = {
      {"build", true}, {"build/x.o", false}, {"notes.txt", false},
      {"src", true},   {"src/a.c", false},   {"src/a.o", false},
  };
  const auto c = ramws::classify(cfg, snap);
  expect(c.ok, "classify ok");
  expect(c.paths.size() == snap.size(), "every snapshot path is classified");
  expect(c.find("src/a.c") && c.find("src/a.c")->role == ramws::Role::source, "lookup by path");
  expect(c.find("missing") == nullptr, "unknown path lookup");
  expect(contains(c.excluded, "notes.txt") && contains(c.excluded, "src/a.o"), "excluded paths listed");
  expect(c.count(ramws::Role::source) == 2, "src and src/a.c tracked");
  expect(c.count(ramws::Role::cache) == 1 && c.count(ramws::Role::scratch) == 1, "one entry per build dir");
}

void test_snapshot_tree() {
  const fs::path root = fresh_dir("snapshot");
  write_file(root / "src" / "a.c", "a");
  write_file(root / "build" / "deep" / "x.o", "x");
  write_file(root / ".ramws" / "state.json", "{}");
  ramws::WorkspaceConfig cfg;
  cfg.sources.push_back(ramws::SourceRule{".", {}, {}});
  cfg.build_dirs.push_back(ramws::BuildDirRule{"build", ramws::Role::scratch});
  const auto rs = ramws::build_rule_set(cfg);
  std::string err;
  const auto snap = ramws::snapshot_tree(root, &rs.rules, &err);
  expect(err.empty(), "snapshot without error");
  auto has = [&](const std::string& p) {
    return std::any_of(snap.begin(), snap.end(), [&](const ramws::SnapshotEntry& e) { return e.path == p; });
  };
  expect(has("src/a.c") && has("build"), "tracked paths and build dir listed");
  expect(!has("build/deep"), "build dir not descended");
  expect(!has(".ramws") && !has(".ramws/state.json"), "metadata directory hidden");
  expect(std::is_sorted(snap.begin(), snap.end(),
                        [](const ramws::SnapshotEntry& a, const ramws::SnapshotEntry& b) { return a.path < b.path; }),
         "snapshot sorted");
  expect(ramws::snapshot_tree(root / "nope", nullptr, &err).empty(), "missing root yields empty snapshot");
}

// ============================================================================
// Planner
// ============================================================================

ramws::ResolvedConfig planner_config() {
  ramws::ResolvedConfig rc;
  rc.project_root = "/p";
  rc.workspace_root = "/r";
  rc.project_key = "p-0000000";
  rc.config.sources.push_back(ramws::SourceRule{"src", {}, {"*.o", "/gen/tmp/**"}});
  rc.config.sources.push_back(ramws::SourceRule{"docs", {}, {}});
  rc.config.build_dirs.push_back(ramws::BuildDirRule{"src/gen", ramws::Role::scratch});
  rc.config.build_dirs.push_back(ramws::BuildDirRule{"cache", ramws::Role::cache});
  return rc;
}

void test_plan_roles_table() {
  const auto rc = planner_config();
  const auto cls = ramws::classify(rc.config, {});

  auto plan = ramws::plan_sync(rc, cls, ramws::Direction::to_disk, ramws::SyncScope{});
  expect(plan.ok && plan.operations.size() == 2, "to-disk plans one op per source rule");
  const auto& src = plan.operations[0];
  expect(src.path == "src" && src.from == "/r/src" && src.to == "/p/src", "to-disk goes RAM -> disk");
  expect(contains(src.excludes, "/gen"), "nested build dir excluded from source op");
  expect(contains(src.excludes, "*.o"), "rule excludes carried");
  expect(src.delete_mirroring, "source ops follow sync.delete");

  plan = ramws::plan_sync(rc, cls, ramws::Direction::from_disk,
                          ramws::SyncScope::for_roles({ramws::Role::source, ramws::Role::cache}));
  expect(plan.ok && plan.operations.size() == 3, "from-disk covers sources and caches");
  const auto& cache = plan.operations[2];
  expect(cache.role == ramws::Role::cache && cache.from == "/p/cache" && cache.delete_mirroring,
         "cache pull is delete-mirroring disk -> RAM");

  plan = ramws::plan_sync(rc, cls, ramws::Direction::to_disk, ramws::SyncScope::for_roles({ramws::Role::cache}));
  expect(!plan.ok && plan.error == ramws::ErrorCode::invalid_role, "cache cannot sync to disk");
  plan = ramws::plan_sync(rc, cls, ramws::Direction::from_disk, ramws::SyncScope::for_roles({ramws::Role::scratch}));
  expect(!plan.ok && plan.error == ramws::ErrorCode::invalid_role, "scratch never syncs");
}

void test_plan_explicit_paths() {
  const auto rc = planner_config();
  const auto cls = ramws::classify(rc.config, {});
  using ramws::SyncScope;

  auto plan = ramws::plan_sync(rc, cls, ramws::Direction::to_disk, SyncScope::for_paths({"src"}));
  expect(plan.ok && plan.operations.size() == 1, "rule path is always plannable");

  plan = ramws::plan_sync(rc, cls, ramws::Direction::to_disk, SyncScope::for_paths({"src/missing.c"}));
  expect(plan.error == ramws::ErrorCode::unknown_path, "path on neither side is unknown");
  plan = ramws::plan_sync(rc, cls, ramws::Direction::to_disk, SyncScope::for_paths({"../etc"}));
  expect(plan.error == ramws::ErrorCode::unknown_path, "escaping path is unknown");
  plan = ramws::plan_sync(rc, cls, ramws::Direction::to_disk, SyncScope::for_paths({"other"}));
  expect(plan.error == ramws::ErrorCode::unknown_path, "untracked path is unknown");
  plan = ramws::plan_sync(rc, cls, ramws::Direction::to_disk, SyncScope::for_paths({"src/gen"}));
  expect(plan.error == ramws::ErrorCode::invalid_role, "scratch path refused");

  plan = ramws::plan_sync(rc, cls, ramws::Direction::to_disk, SyncScope::for_paths({"src", "cache"}));
  expect(!plan.ok && plan.operations.empty(), "one bad path rejects the whole scope");

  plan = ramws::plan_sync(rc, cls, ramws::Direction::from_disk, SyncScope::for_paths({"docs", "src", "./src"}));
  expect(plan.ok && plan.operations.size() == 2, "duplicates collapse");
  expect(plan.operations[0].path == "src" && plan.operations[1].path == "docs", "ops follow rule order");
}

void test_plan_sub_path_filters() {
  auto rc = planner_config();
  const ramws::Snapshot snap = {{"src", true}, {"src/lib", true}};
  const auto cls = ramws::classify(rc.config, snap);
  const auto plan = ramws::plan_sync(rc, cls, ramws::Direction::to_disk, ramws::SyncScope::for_paths({"src/lib"}));
  expect(plan.ok && plan.operations.size() == 1, "sub-path planned");
  const auto& op = plan.operations[0];
  expect(op.rule_path == "src" && op.path == "src/lib" && !op.covers_whole_rule(), "sub-path op keeps its rule");
  expect(op.from == "/r/src/lib" && op.to == "/p/src/lib", "sub-path roots");
  expect(contains(op.excludes, "*.o"), "unanchored excludes unchanged");
  expect(!contains(op.excludes, "/gen/tmp/**"), "anchored exclude outside the sub-path dropped");
}

void test_rebase_pattern() {
  expect(ramws::rebase_pattern("*.o", "src") == std::optional<std::string>("*.o"), "unanchored unchanged");
  expect(ramws::rebase_pattern("/src/gen/**", "src") == std::optional<std::string>("/gen/**"), "prefix stripped");
  expect(!ramws::rebase_pattern("/docs/x", "src"), "other subtree dropped");
  expect(!ramws::rebase_pattern("/src", "src"), "pattern naming the offset itself dropped");
  expect(ramws::rebase_pattern("/**/tmp", "src/a") == std::optional<std::string>("/**/tmp"), "** stops rebasing");
  expect(ramws::rebase_pattern("/s*/out/", "src") == std::optional<std::string>("/out/"), "wildcard component");
}

void test_plan_root_excludes_metadata() {
  ramws::ResolvedConfig rc;
  rc.project_root = "/p";
  rc.workspace_root = "/r";
  rc.config = ramws::default_config();
  const auto cls = ramws::classify(rc.config, {});
  const auto plan = ramws::plan_sync(rc, cls, ramws::Direction::to_disk, ramws::SyncScope{});
  expect(plan.ok && plan.operations.size() == 1, "root source planned");
  expect(contains(plan.operations[0].excludes, "/.ramws"), "metadata dir never mirrored");
}

// Scripted mirror: records requests and fails the call with index fail_at.
class FakeMirror : public ramws::IMirror {
 public:
  explicit FakeMirror(int fail_at = -1) : fail_at_(fail_at) {}
  ramws::MirrorResult reconcile(const ramws::MirrorRequest& request) override {
    requests.push_back(request);
    ramws::MirrorResult r;
    if (static_cast<int>(requests.size()) - 1 == fail_at_) {
      r.error = "disk full";
      return r;
    }
    r.ok = true;
    if (!request.dry_run) r.updated.push_back("f");
    return r;
  }
  std::string backend_id() const override { return "fake"; }
  std::vector<ramws::MirrorRequest> requests;

 private:
  int fail_at_;
};

void test_execute_partial_failure() {
  const fs::path tmp = fresh_dir("execute");
  for (const char* d : {"a", "b", "c"}) fs::create_directories(tmp / "ram" / d);
  std::vector<ramws::MirrorOperation> ops;
  for (const char* d : {"a", "b", "c"}) {
    ramws::MirrorOperation op;
    op.role = ramws::Role::source;
    op.direction = ramws::Direction::to_disk;
    op.rule_path = op.path = d;
    op.from = (tmp / "ram" / d).string();
    op.to = (tmp / "disk" / d).string();
    ops.push_back(op);
  }
  ramws::StateStore store(tmp / "ram");
  ramws::WorkspaceRecord rec;
  rec.project_key = "k";
  rec.state = ramws::WorkspaceState::dirty;
  rec.record(ramws::Role::source).pending = {{"a", 1}, {"b", 1}, {"c", 1}};
  rec.record(ramws::Role::source).dirty = true;

  FakeMirror mirror(1);
  const auto rep = ramws::execute_plan(ops, mirror, store, rec);
  expect(!rep.ok && rep.error == ramws::ErrorCode::mirror_failure, "failure reported as mirror_failure");
  expect(rep.completed.size() == 1 && rep.completed[0].path == "a", "first op completed");
  expect(rep.failed && rep.failed->path == "b", "failed op identified");
  expect(rep.unstarted.size() == 1 && rep.unstarted[0].path == "c", "remaining op not started");
  expect(mirror.requests.size() == 2, "halted after the failure");

  const auto& src = rec.roles.at(ramws::Role::source);
  expect(!src.pending.count("a") && src.pending.count("b") && src.pending.count("c"), "only a is cleared");
  expect(src.dirty && rec.state == ramws::WorkspaceState::dirty, "record stays dirty");
  expect(!rec.in_flight, "in-flight marker cleared after failure");
  const auto loaded = store.load("k");
  expect(loaded.ok && loaded.record && !loaded.record->in_flight, "persisted without marker");
}

void test_execute_missing_origin() {
  const fs::path tmp = fresh_dir("execute_missing");
  ramws::StateStore store(tmp / "ram");
  ramws::WorkspaceRecord rec;
  rec.project_key = "k";
  FakeMirror mirror;

  ramws::MirrorOperation pull;
  pull.role = ramws::Role::cache;
  pull.direction = ramws::Direction::from_disk;
  pull.rule_path = pull.path = "deps";
  pull.from = (tmp / "disk" / "deps").string();
  pull.to = (tmp / "ram" / "deps").string();
  auto rep = ramws::execute_plan({pull}, mirror, store, rec);
  expect(rep.ok && fs::is_directory(tmp / "ram" / "deps"), "missing pull origin creates an empty dir");
  expect(mirror.requests.empty(), "nothing to reconcile");
  expect(rec.roles.at(ramws::Role::cache).last_from_disk_ms > 0, "pull timestamp recorded");

  ramws::MirrorOperation push;
  push.role = ramws::Role::source;
  push.direction = ramws::Direction::to_disk;
  push.rule_path = push.path = "src";
  push.from = (tmp / "ram" / "src").string();
  push.to = (tmp / "disk" / "src").string();
  rep = ramws::execute_plan({push}, mirror, store, rec);
  expect(!rep.ok && rep.error == ramws::ErrorCode::mirror_failure, "missing push origin fails");
}

// ============================================================================
// Mirrors
// ============================================================================

void test_itemize_parser() {
  const std::string out =
      "cd+++++++++ newdir/\n"
      ">f+++++++++ newdir/file.txt\n"
      ">f.st...... changed.txt\n"
      "*deleting   old.txt\n"
      ".d..t...... src/\n"
      "cL+++++++++ link -> target\n";
  const auto r = ramws::parse_itemized_output(out);
  expect(r.ok, "parse ok");
  expect(r.created == std::vector<std::string>({"link", "newdir", "newdir/file.txt"}), "created entries");
  expect(r.updated == std::vector<std::string>({"changed.txt"}), "updated entries");
  expect(r.deleted == std::vector<std::string>({"old.txt"}), "deleted entries");
  expect(r.changed() == 5, "directory attribute lines ignored");
}

void test_rsync_arguments() {
  ramws::MirrorRequest req;
  req.source_root = "/a";
  req.dest_root = "/b";
  req.includes = {"keep"};
  req.excludes = {"/build"};
  req.delete_mirroring = true;
  req.dry_run = true;
  const auto args = ramws::RsyncMirror::build_arguments(req, true);
  const std::vector<std::string> want = {"-a",        "--itemize-changes", "--delete", "--dry-run",
                                         "--include=keep", "--exclude=/build", "/a/",      "/b/"};
  expect(args == want, "rsync arguments: includes before excludes, trailing slashes");
  const auto file_args = ramws::RsyncMirror::build_arguments(req, false);
  expect(!contains(file_args, "--delete") && file_args.back() == "/b", "single file transfer");
}

void test_native_mirror() {
  const fs::path tmp = fresh_dir("native");
  const fs::path src = tmp / "src";
  const fs::path dst = tmp / "dst";
  write_file(src / "a.txt", "a");
  write_file(src / "sub" / "b.txt", "b");
  write_file(src / "skip.log", "s");
  write_file(dst / "stale.txt", "old");
  write_file(dst / "keep.log", "k");

  ramws::NativeMirror mirror;
  ramws::MirrorRequest req;
  req.source_root = src.string();
  req.dest_root = dst.string();
  req.excludes = {"*.log"};
  req.delete_mirroring = true;
  req.dry_run = true;

  const auto dry = mirror.reconcile(req);
  expect(dry.ok, "dry run ok: " + dry.error);
  expect(dry.created == std::vector<std::string>({"a.txt", "sub", "sub/b.txt"}), "dry run lists creations");
  expect(dry.deleted == std::vector<std::string>({"stale.txt"}), "dry run lists deletions");
  expect(!fs::exists(dst / "a.txt") && fs::exists(dst / "stale.txt"), "dry run modifies nothing");

  req.dry_run = false;
  const auto real = mirror.reconcile(req);
  expect(real.ok && real.changed() == 4, "reconcile applies the same changes");
  expect(read_file(dst / "sub" / "b.txt") == "b", "nested file copied");
  expect(!fs::exists(dst / "stale.txt"), "stale file deleted");
  expect(fs::exists(dst / "keep.log") && !fs::exists(dst / "skip.log"), "excluded entries untouched");

  req.dry_run = true;
  expect(mirror.reconcile(req).changed() == 0, "converged trees report no changes");

  write_file(src / "a.txt", "A2");
  req.dry_run = false;
  const auto upd = mirror.reconcile(req);
  expect(upd.updated == std::vector<std::string>({"a.txt"}), "modified file updated");
}

// ============================================================================
// RAM baseline manifests
// ============================================================================

void test_manifest_scan_and_diff() {
  const fs::path root = fresh_dir("manifest");
  write_file(root / "a.txt", "alpha");
  write_file(root / "sub" / "b.txt", "beta");
  write_file(root / "skip.tmp", "filtered");
  const ramws::glob::FilterSet filters{{}, {"*.tmp"}};

  const auto first = ramws::scan_tree(root.string(), filters, "", nullptr);
  expect(first.ok, "scan ok: " + first.error);
  expect(first.entries.size() == 4, "root, file, directory and nested file stamped");
  expect(first.entries.at("").kind == 'd' && first.entries.at("sub").kind == 'd', "directories stamped");
  expect(first.entries.at("a.txt").digest == ramws::blake3_hex("alpha"), "files hashed with BLAKE3");
  expect(!first.entries.contains("skip.tmp"), "filtered entries left out");

  // Same bytes, new mtime: rehashed and found unchanged.
  const auto later = fs::last_write_time(root / "a.txt") + std::chrono::seconds(5);
  write_file(root / "a.txt", "alpha");
  fs::last_write_time(root / "a.txt", later);
  auto next = ramws::scan_tree(root.string(), filters, "", &first.entries);
  expect(next.ok && ramws::diff_manifest(first.entries, next.entries).total() == 0, "touch is not a change");

  // Same size, different bytes.
  write_file(root / "a.txt", "ALPHA");
  fs::last_write_time(root / "a.txt", later + std::chrono::seconds(5));
  write_file(root / "sub" / "c.txt", "gamma");
  fs::remove(root / "sub" / "b.txt");
  next = ramws::scan_tree(root.string(), filters, "", &first.entries);
  const auto d = ramws::diff_manifest(first.entries, next.entries);
  expect(d.updated == std::vector<std::string>{"a.txt"}, "edited file updated");
  expect(d.created == std::vector<std::string>{"sub/c.txt"}, "new file created");
  expect(d.deleted == std::vector<std::string>{"sub/b.txt"}, "removed file deleted");

  const auto sub = ramws::scan_tree((root / "sub").string(), filters, "sub", nullptr);
  expect(sub.ok && sub.entries.contains("sub") && sub.entries.contains("sub/c.txt"), "prefixed sub-tree keys");
  const auto gone = ramws::scan_tree((root / "missing").string(), filters, "", nullptr);
  expect(gone.ok && gone.entries.empty(), "missing root is an empty manifest");

  expect(ramws::in_subtree("sub/c.txt", "sub") && ramws::in_subtree("sub", "sub"), "in_subtree");
  expect(!ramws::in_subtree("subway", "sub") && ramws::in_subtree("x", ""), "in_subtree boundaries");
}

// ============================================================================
// Process runner
// ============================================================================

void test_process_group_and_timeout() {
  ramws::ProcessSpec spec;
  spec.command = "/bin/sh";
  // Field 5 of /proc/<pid>/stat is the process group.
  spec.argv = {"-c", "read -r line < /proc/$$/stat; set -- $line; echo $5"};
  spec.env = ramws::current_environment();
  auto r = ramws::run_process(spec);
  expect(r.spawned() && r.exit_code == 0, "child ran: " + r.error_message + r.stderr_text);
  expect(r.stdout_text == std::to_string(getpgrp()) + "\n", "child stays in the caller's process group");

  spec.argv = {"-c", "exec sleep 5"};
  spec.timeout_ms = 100;
  const auto start = std::chrono::steady_clock::now();
  r = ramws::run_process(spec);
  expect(r.timed_out && r.exit_code == 124, "deadline kills the child");
  expect(std::chrono::steady_clock::now() - start < std::chrono::seconds(4), "killed before it finished");
}

// ============================================================================
// State store + lock
// ============================================================================

void test_record_json_roundtrip() {
  ramws::WorkspaceRecord rec;
  rec.project_key = "proj-abcdef0";
  rec.project_root = "/p";
  rec.ram_root = "/r";
  rec.state = ramws::WorkspaceState::dirty;
  rec.created_at_ms = 42;
  auto& src = rec.record(ramws::Role::source);
  src.dirty = true;
  src.pending["src"] = 3;
  src.last_to_disk_ms = 7;
  src.baseline["."][""] = ramws::FileStamp{'d', 0, 0, {}};
  src.baseline["."]["src/a.txt"] = ramws::FileStamp{'f', 5, 0xfffffffffffffff0ULL, "ab12"};
  rec.in_flight = ramws::InFlightOp{ramws::Role::source, ramws::Direction::to_disk, "src", 99};

  const std::string text = ramws::record_to_json(rec);
  std::string err;
  const auto back = ramws::record_from_json(text, &err);
  expect(back.has_value(), "record parses back: " + err);
  expect(back->state == ramws::WorkspaceState::dirty && back->created_at_ms == 42, "scalar fields");
  const auto* bsrc = back->find(ramws::Role::source);
  expect(bsrc && bsrc->dirty && bsrc->pending.at("src") == 3 && bsrc->last_to_disk_ms == 7, "sync record");
  expect(back->in_flight && back->in_flight->rule_path == "src", "in-flight marker");
  const auto& base = bsrc->baseline.at(".");
  expect(base.size() == 2 && base.at("").kind == 'd', "baseline directory stamp");
  const auto& stamp = base.at("src/a.txt");
  expect(stamp.size == 5 && stamp.mtime == 0xfffffffffffffff0ULL && stamp.digest == "ab12", "baseline file stamp");
  expect(ramws::record_to_json(*back) == text, "serialization is stable");

  const auto v1 = ramws::record_from_json(
      R"({"format_version":1,"state":"dirty","roles":{"source":{"dirty":true,"pending":{".":2}}}})", &err);
  expect(v1 && v1->find(ramws::Role::source)->baseline.empty(), "version 1 record read without a baseline");
  expect(!ramws::record_from_json(R"({"format_version":99,"state":"populated"})", &err), "newer format refused");
  expect(!ramws::record_from_json(R"({"format_version":1,"state":"bogus"})", &err), "bad state refused");
}

void test_state_store_load_save() {
  const fs::path ram = fresh_dir("store");
  ramws::StateStore store(ram);
  auto loaded = store.load("k");
  expect(loaded.ok && !loaded.record, "missing state file is NotFound");

  ramws::WorkspaceRecord rec;
  rec.project_key = "k";
  rec.state = ramws::WorkspaceState::populated;
  std::string err;
  expect(store.save(rec, &err), "save: " + err);
  expect(store.record_sync(rec, ramws::Role::cache, ramws::Direction::from_disk, 1234, &err), "record_sync");
  loaded = store.load("k");
  expect(loaded.record && loaded.record->find(ramws::Role::cache)->last_from_disk_ms == 1234, "timestamp persisted");

  expect(store.mark_dirty(rec, ramws::Role::source, &err), "mark_dirty");
  expect(rec.state == ramws::WorkspaceState::dirty, "mark_dirty moves state to dirty");

  loaded = store.load("other");
  expect(loaded.ok && !loaded.record, "foreign record treated as absent");
  expect(!store.clear("other", &err), "clear refuses a foreign record");
  expect(store.clear("k", &err) && !fs::exists(store.state_path()), "clear removes the state file");
  expect(store.clear("k", &err), "clear of nothing succeeds");

  write_file(store.state_path(), "{not json");
  loaded = store.load("k");
  expect(!loaded.ok && !loaded.error.empty(), "corrupt state is an error");
}

void test_workspace_lock() {
  const fs::path ram = fresh_dir("lock");
  ramws::WorkspaceLock idle;
  auto none = ramws::WorkspaceLock::try_acquire(ram / "absent", idle);
  expect(!none.acquired && none.error == ramws::ErrorCode::none, "no lock file means no holder");

  ramws::WorkspaceLock first;
  auto a = ramws::WorkspaceLock::acquire(ram, 100, first);
  expect(a.acquired && first.held(), "first acquire succeeds");

  ramws::WorkspaceLock second;
  auto b = ramws::WorkspaceLock::acquire(ram, 60, second);
  expect(!b.acquired && b.error == ramws::ErrorCode::workspace_busy, "second acquire times out busy");
  auto c = ramws::WorkspaceLock::try_acquire(ram, second);
  expect(!c.acquired && c.error == ramws::ErrorCode::workspace_busy, "try_acquire reports busy");

  ramws::WorkspaceLock moved(std::move(first));
  expect(moved.held() && !first.held(), "lock ownership moves");
  moved.release();
  auto d = ramws::WorkspaceLock::acquire(ram, 100, second);
  expect(d.acquired, "lock free after release");
}

void test_lock_survives_workspace_removal() {
  const fs::path ram = fresh_dir("lock_removed");
  ramws::WorkspaceLock holder;
  expect(ramws::WorkspaceLock::acquire(ram, 100, holder).acquired, "holder acquires");

  ramws::WorkspaceLock waiter;
  ramws::WorkspaceLock::Outcome waited;
  std::thread t([&] { waited = ramws::WorkspaceLock::acquire(ram, 3000, waiter); });
  std::this_thread::sleep_for(std::chrono::milliseconds(150));
  // A destroy removes the RAM root, lock file included, before releasing.
  fs::remove_all(ram);
  holder.release();
  t.join();
  expect(waited.acquired && waiter.held(), "waiter acquires after the holder leaves: " + waited.message);
  expect(fs::exists(ram / ".ramws"), "waiter recreated the lock file");

  ramws::WorkspaceLock third;
  const auto c = ramws::WorkspaceLock::acquire(ram, 100, third);
  expect(!c.acquired && c.error == ramws::ErrorCode::workspace_busy, "third invocation sees the waiter's lock");
  const auto peek = ramws::WorkspaceLock::try_acquire(ram, third);
  expect(!peek.acquired && peek.error == ramws::ErrorCode::workspace_busy, "status sees the waiter's lock");
}

// ============================================================================
// Safety guard
// ============================================================================

ramws::WorkspaceRecord dirty_record(std::uint64_t pending) {
  ramws::WorkspaceRecord rec;
  rec.state = pending ? ramws::WorkspaceState::dirty : ramws::WorkspaceState::populated;
  auto& src = rec.record(ramws::Role::source);
  if (pending) src.pending["."] = pending;
  src.dirty = pending > 0;
  return rec;
}

void test_guard_destroy_and_start() {
  auto d = ramws::check_destroy(dirty_record(3), false);
  expect(d.verdict == ramws::Verdict::deny && d.changed == 3, "destroy denied while dirty");
  expect(d.reason.find("ramws sync") != std::string::npos, "reason names the remedy");
  d = ramws::check_destroy(dirty_record(3), true);
  expect(d.allowed() && d.forced_data_loss, "forced destroy flags data loss");
  d = ramws::check_destroy(dirty_record(0), false);
  expect(d.allowed() && !d.forced_data_loss, "clean destroy allowed");

  expect(!ramws::check_start(dirty_record(1), false).allowed(), "start denied while dirty");
  expect(ramws::check_start(dirty_record(1), true).forced_data_loss, "forced start flags data loss");
  expect(ramws::check_start(dirty_record(0), false).allowed(), "clean start allowed");
}

void test_guard_sync() {
  expect(ramws::check_sync(ramws::Direction::to_disk, {{"src", 2}}, false).allowed(), "to-disk always allowed");
  auto d = ramws::check_sync(ramws::Direction::from_disk, {{"src", 2}}, false);
  expect(d.verdict == ramws::Verdict::deny && d.paths == std::vector<std::string>{"src"}, "pull over edits denied");
  d = ramws::check_sync(ramws::Direction::from_disk, {{"src", 2}}, true);
  expect(d.allowed() && d.forced_data_loss && d.changed == 2, "forced pull flags data loss");
  d = ramws::check_sync(ramws::Direction::from_disk, {{"docs", 0}}, false);
  expect(d.allowed() && !d.forced_data_loss, "pull of a clean scope allowed");
}

void test_guard_exit_policy() {
  using ramws::ExitAction;
  using ramws::ExitPolicy;
  expect(ramws::check_exit(ExitPolicy::never, true, false) == ExitAction::none, "never");
  expect(ramws::check_exit(ExitPolicy::always, true, false) == ExitAction::sync, "always");
  expect(ramws::check_exit(ExitPolicy::ask, true, false) == ExitAction::ask, "ask");
  expect(ramws::check_exit(ExitPolicy::ask, true, true) == ExitAction::sync, "noninteractive ask syncs");
  expect(ramws::check_exit(ExitPolicy::always, false, false) == ExitAction::none, "clean needs nothing");
}

// ============================================================================
// Audit + observability + version
// ============================================================================

void test_audit_chain() {
  const fs::path tmp = fresh_dir("audit");
  const std::string path = (tmp / "audit.ndjson").string();
  {
    ramws::ImmutableAuditLog log(path);
    ramws::AuditRecord a;
    a.action = "destroy";
    a.ok = true;
    expect(log.append(a), "append first");
    expect(a.sequence == 1 && a.previous_digest == std::string(64, '0'), "genesis entry");
    ramws::AuditRecord b;
    b.action = "destroy.forced";
    b.forced = true;
    b.forced_data_loss = true;
    expect(log.append(b) && b.sequence == 2 && b.previous_digest != a.previous_digest, "second entry chained");
    expect(log.entry_count() == 2 && log.failure_count() == 0, "counters");
  }
  {
    ramws::ImmutableAuditLog reopened(path);
    ramws::AuditRecord c;
    c.action = "sync.from_disk.forced";
    expect(reopened.append(c) && c.sequence == 3, "sequence resumes across opens");
  }
  auto v = ramws::verify_audit_log(path);
  expect(v.ok && v.entries == 3, "chain verifies: " + v.error);

  std::string text = read_file(path);
  const auto pos = text.find("\"action\":\"destroy.forced\"");
  expect(pos != std::string::npos, "entry present");
  text.replace(pos, 25, "\"action\":\"destroy.Forced\"");
  write_file(path, text);
  v = ramws::verify_audit_log(path);
  expect(!v.ok, "tampered entry breaks the chain");

  ramws::ImmutableAuditLog disabled("");
  ramws::AuditRecord d;
  expect(!disabled.enabled() && disabled.append(d), "disabled log accepts and drops");
}

void test_events_and_stats() {
  auto& stats = ramws::global_session_stats();
  const auto before = stats.events.load();
  const auto mirror_before = stats.mirror_operations.load();
  ramws::WorkspaceEvent ev;
  ev.name = "mirror.operation";
  ev.project_key = "k";
  ev.role = "source";
  ev.ok = true;
  ev.changed = 2;
  const std::string json = ramws::event_to_json(ev);
  expect(json.find("\"event\":\"mirror.operation\"") != std::string::npos, "event serializes its name");
  expect(json.find("\"direction\"") == std::string::npos, "empty fields omitted");
  ramws::emit_workspace_event(ev);
  expect(stats.events.load() == before + 1 && stats.mirror_operations.load() == mirror_before + 1, "stats count");
  expect(ramws::format_bytes(1536) == "1.50 KiB", "format_bytes");
}

void test_version_manifest() {
  const auto m = ramws::version::current_manifest();
  expect(m.semver == ramws::version::SEMVER && m.state_format == ramws::version::STATE_FORMAT_VERSION,
         "manifest constants");
  expect(m.hash_primitive == "blake3", "hash primitive");
  std::optional<ramws::jsonlite::JsonError> err;
  const auto o = ramws::jsonlite::parse(ramws::version::manifest_to_json(m), &err);
  expect(!err && ramws::jsonlite::get_u64(o, "state_format") == 1, "manifest JSON");
}

void test_filesystem_inspection() {
  const fs::path tmp = fresh_dir("fsinfo");
  const auto st = ramws::inspect_filesystem(tmp / "not" / "yet");
  expect(st.ok, "inspection succeeds: " + st.error);
  expect(st.inspected_path == tmp.string(), "nearest existing ancestor inspected");
  expect(!st.fs_type.empty() && st.total_bytes >= st.available_bytes, "capacity reported");
}

// ============================================================================
// Workspace lifecycle (native mirror on temp dirs)
// ============================================================================

void test_start_populates() {
  Fixture f;
  make_fixture(f, "ws_start");
  ramws::WorkspaceController ctl(f.resolved, f.mirror);
  expect(!ctl.started(), "not started before start");
  const auto r = ctl.start(ramws::StartOptions{});
  expect(r.ok, "start ok: " + r.message);
  expect(ctl.started(), "started after start");
  expect(read_file(f.ram / "src" / "a.txt") == "alpha" && fs::exists(f.ram / "README"), "sources copied");
  expect(!fs::exists(f.ram / ".git" / "HEAD"), "excluded files not copied");
  expect(read_file(f.ram / "deps" / "lib.a") == "archive", "cache pulled");
  expect(fs::is_directory(f.ram / "build") && !fs::exists(f.ram / "build" / "out.o"), "scratch created empty");

  const auto st = ctl.status();
  expect(st.ok && st.exists && st.state == ramws::WorkspaceState::populated, "status after start");
  expect(!st.source_dirty() && !st.possibly_stale, "fresh workspace is clean");
  expect(st.to_text().find("Diff summary: changed 0, added 0, deleted 0") != std::string::npos, "text status");

  std::optional<ramws::jsonlite::JsonError> err;
  const auto o = ramws::jsonlite::parse(st.to_json(), &err);
  expect(!err && ramws::jsonlite::get_string(o, "state") == "populated", "json status");

  const auto again = ctl.start(ramws::StartOptions{});
  expect(again.ok && again.changed == 0, "second start without edits changes nothing");
}

void test_refresh_sources_only() {
  Fixture f;
  make_fixture(f, "ws_refresh");
  ramws::WorkspaceController ctl(f.resolved, f.mirror);
  ramws::StartOptions opts;
  opts.refresh_sources_only = true;
  expect(ctl.start(opts).ok, "start ok");
  expect(fs::exists(f.ram / "src" / "a.txt"), "sources copied");
  expect(!fs::exists(f.ram / "deps") && !fs::exists(f.ram / "build"), "build dirs skipped");
}

void test_dirty_sync_destroy_cycle() {
  Fixture f;
  make_fixture(f, "ws_cycle");
  ramws::WorkspaceController ctl(f.resolved, f.mirror);
  expect(ctl.start(ramws::StartOptions{}).ok, "start ok");

  write_file(f.ram / "src" / "a.txt", "alpha2");
  write_file(f.ram / "src" / "new.txt", "n");
  write_file(f.ram / "build" / "obj.o", "scratch output");
  write_file(f.ram / "src" / "x.tmp", "filtered");

  auto st = ctl.status();
  expect(st.source_dirty(), "edits make the workspace dirty");
  expect(st.find(ramws::Role::source)->pending == 2, "only tracked edits count");
  expect(st.diff_updated == 1 && st.diff_created == 1, "diff summary");
  expect(st.state == ramws::WorkspaceState::dirty, "state dirty");

  auto d = ctl.destroy(ramws::DestroyOptions{});
  expect(!d.ok && d.error == ramws::ErrorCode::denied_by_safety_guard, "dirty destroy denied");
  expect(d.guard && d.guard->changed == 2, "denial carries the change count");
  expect(fs::exists(f.ram / "src" / "new.txt"), "denied destroy touches nothing");

  const auto s = ctl.sync(ramws::SyncOptions{});
  expect(s.ok && s.changed == 2, "sync ok: " + s.message);
  expect(read_file(f.project / "src" / "a.txt") == "alpha2" && fs::exists(f.project / "src" / "new.txt"),
         "edits reached disk");
  expect(!fs::exists(f.project / "src" / "x.tmp"), "filtered file stays in RAM");
  expect(read_file(f.project / "build" / "out.o") == "object" && !fs::exists(f.project / "build" / "obj.o"),
         "scratch never written to disk");
  expect(fs::exists(f.project / ".git" / "HEAD"), "excluded disk entries preserved by delete");

  st = ctl.status();
  expect(!st.source_dirty() && st.state == ramws::WorkspaceState::populated, "clean after sync");

  d = ctl.destroy(ramws::DestroyOptions{});
  expect(d.ok && !fs::exists(f.ram), "clean destroy removes the RAM root");
  expect(fs::exists(f.project / "src" / "new.txt"), "project untouched by destroy");

  d = ctl.destroy(ramws::DestroyOptions{});
  expect(d.ok && d.message.find("workspace not found") != std::string::npos, "destroy of nothing succeeds");
}

void test_deletion_is_dirty_and_mirrored() {
  Fixture f;
  make_fixture(f, "ws_delete");
  ramws::WorkspaceController ctl(f.resolved, f.mirror);
  expect(ctl.start(ramws::StartOptions{}).ok, "start ok");
  fs::remove(f.ram / "README");
  auto st = ctl.status();
  expect(st.source_dirty() && st.diff_deleted == 1, "RAM deletion is a pending change");
  expect(ctl.sync(ramws::SyncOptions{}).ok, "sync ok");
  expect(!fs::exists(f.project / "README"), "deletion mirrored to disk");
}

void test_disk_edit_is_not_dirty() {
  Fixture f;
  make_fixture(f, "ws_disk_edit");
  ramws::WorkspaceController ctl(f.resolved, f.mirror);
  expect(ctl.start(ramws::StartOptions{}).ok, "start ok");

  // Edits made on disk (another checkout, git pull) behind the workspace.
  write_file(f.project / "src" / "upstream.txt", "from upstream");
  write_file(f.project / "README", "readme v2");
  auto st = ctl.status();
  expect(st.ok && !st.source_dirty(), "disk-only edits leave the workspace clean");
  expect(st.state == ramws::WorkspaceState::populated, "state stays populated");
  expect(st.diff_created + st.diff_updated > 0, "diff summary still shows the trees differ");

  ramws::SyncOptions pull;
  pull.direction = ramws::Direction::from_disk;
  const auto r = ctl.sync(pull);
  expect(r.ok && (!r.guard || !r.guard->forced_data_loss), "plain pull allowed: " + r.message);
  expect(read_file(f.ram / "src" / "upstream.txt") == "from upstream", "upstream file pulled");
  expect(read_file(f.ram / "README") == "readme v2", "upstream edit pulled");
  expect(!ctl.status().source_dirty(), "pulled content is the new baseline");

  write_file(f.ram / "src" / "upstream.txt", "edited in RAM!");
  st = ctl.status();
  expect(st.source_dirty() && st.find(ramws::Role::source)->pending == 1, "RAM edit after a pull is pending");
  ramws::SyncOptions narrow = pull;
  narrow.scope = ramws::SyncScope::for_paths({"src"});
  const auto denied = ctl.sync(narrow);
  expect(!denied.ok && denied.error == ramws::ErrorCode::denied_by_safety_guard, "pull over the RAM edit denied");

  expect(ctl.sync(ramws::SyncOptions{}).ok, "push ok");
  const auto d = ctl.destroy(ramws::DestroyOptions{});
  expect(d.ok && !fs::exists(f.ram), "clean destroy allowed");
}

void test_only_sub_path() {
  Fixture f;
  make_fixture(f, "ws_only");
  ramws::WorkspaceController ctl(f.resolved, f.mirror);
  expect(ctl.start(ramws::StartOptions{}).ok, "start ok");
  write_file(f.ram / "src" / "a.txt", "alpha-sub");
  write_file(f.ram / "README", "readme changed");

  ramws::SyncOptions opts;
  opts.scope = ramws::SyncScope::for_paths({"src"});
  const auto r = ctl.sync(opts);
  expect(r.ok && r.changed == 1, "sub-path sync ok: " + r.message);
  expect(read_file(f.project / "src" / "a.txt") == "alpha-sub", "sub-path synced");
  expect(read_file(f.project / "README") == "readme", "paths outside the scope untouched");
  const auto st = ctl.status();
  expect(st.source_dirty() && st.find(ramws::Role::source)->pending == 1, "remaining edit still pending");
}

void test_sync_scope_errors() {
  Fixture f;
  make_fixture(f, "ws_scope");
  ramws::WorkspaceController ctl(f.resolved, f.mirror);

  auto r = ctl.sync(ramws::SyncOptions{});
  expect(!r.ok && r.error == ramws::ErrorCode::workspace_missing, "sync before start");

  expect(ctl.start(ramws::StartOptions{}).ok, "start ok");
  write_file(f.ram / "src" / "a.txt", "changed");

  ramws::SyncOptions opts;
  opts.scope = ramws::SyncScope::for_roles({ramws::Role::cache});
  r = ctl.sync(opts);
  expect(!r.ok && r.error == ramws::ErrorCode::invalid_role, "cache to disk refused");
  write_file(f.ram / "build" / "out.o", "ram object");
  opts.scope = ramws::SyncScope::for_roles({ramws::Role::scratch});
  r = ctl.sync(opts);
  expect(!r.ok && r.error == ramws::ErrorCode::invalid_role, "scratch to disk refused");
  expect(read_file(f.project / "build" / "out.o") == "object", "scratch never reaches disk");

  opts.scope = ramws::SyncScope::for_paths({"src", "build"});
  r = ctl.sync(opts);
  expect(!r.ok && r.error == ramws::ErrorCode::invalid_role, "scratch path refused");
  expect(read_file(f.project / "src" / "a.txt") == "alpha", "refused scope changes nothing");

  opts.scope = ramws::SyncScope::for_paths({"nowhere/file"});
  r = ctl.sync(opts);
  expect(!r.ok && r.error == ramws::ErrorCode::unknown_path, "unknown path refused");
  opts.scope = ramws::SyncScope::for_paths({".git/HEAD"});
  r = ctl.sync(opts);
  expect(!r.ok && r.error == ramws::ErrorCode::unknown_path, "excluded path is not tracked");
}

void test_pull_guard_and_force() {
  Fixture f;
  make_fixture(f, "ws_pull");
  const fs::path audit_path = f.base / "audit.ndjson";
  ramws::set_audit_log_path(audit_path.string());
  ramws::WorkspaceController ctl(f.resolved, f.mirror);
  expect(ctl.start(ramws::StartOptions{}).ok, "start ok");

  write_file(f.ram / "src" / "a.txt", "ram edit");
  write_file(f.project / "README", "disk edit");

  ramws::SyncOptions pull;
  pull.direction = ramws::Direction::from_disk;
  auto r = ctl.sync(pull);
  expect(!r.ok && r.error == ramws::ErrorCode::denied_by_safety_guard, "pull over RAM edits denied");
  expect(read_file(f.ram / "src" / "a.txt") == "ram edit", "denied pull keeps RAM edits");

  ramws::SyncOptions cache_pull = pull;
  cache_pull.scope = ramws::SyncScope::for_roles({ramws::Role::cache});
  write_file(f.project / "deps" / "lib2.a", "new archive");
  r = ctl.sync(cache_pull);
  expect(r.ok && fs::exists(f.ram / "deps" / "lib2.a"), "cache pull allowed while sources are dirty");

  pull.force = true;
  r = ctl.sync(pull);
  expect(r.ok && r.guard && r.guard->forced_data_loss, "forced pull proceeds");
  expect(read_file(f.ram / "src" / "a.txt") == "alpha", "RAM edit discarded");
  expect(read_file(f.ram / "README") == "disk edit", "disk edit pulled");
  expect(!ctl.status().source_dirty(), "clean after forced pull");

  const auto v = ramws::verify_audit_log(audit_path.string());
  expect(v.ok && v.entries == 1, "forced pull audited");
  expect(read_file(audit_path).find("sync.from_disk.forced") != std::string::npos, "audit action recorded");
  ramws::set_audit_log_path("");
}

void test_forced_destroy_audited() {
  Fixture f;
  make_fixture(f, "ws_force_destroy");
  const fs::path audit_path = f.base / "audit.ndjson";
  ramws::set_audit_log_path(audit_path.string());
  ramws::WorkspaceController ctl(f.resolved, f.mirror);
  expect(ctl.start(ramws::StartOptions{}).ok, "start ok");
  write_file(f.ram / "src" / "lost.txt", "unsynced");

  expect(!ctl.start(ramws::StartOptions{}).ok, "restart over dirty workspace denied");

  ramws::DestroyOptions opts;
  opts.force = true;
  const auto r = ctl.destroy(opts);
  expect(r.ok && r.guard && r.guard->forced_data_loss, "forced destroy proceeds");
  expect(!fs::exists(f.ram) && !fs::exists(f.project / "src" / "lost.txt"), "RAM root removed, disk untouched");

  const std::string log = read_file(audit_path);
  expect(log.find("\"action\":\"destroy.forced\"") != std::string::npos, "forced destroy audited");
  expect(log.find("\"forced_data_loss\":true") != std::string::npos, "data loss recorded");
  ramws::set_audit_log_path("");
}

void test_busy_workspace() {
  Fixture f;
  make_fixture(f, "ws_busy");
  ramws::WorkspaceController ctl(f.resolved, f.mirror);
  expect(ctl.start(ramws::StartOptions{}).ok, "start ok");

  ramws::WorkspaceLock held;
  expect(ramws::WorkspaceLock::acquire(f.ram, 100, held).acquired, "external holder");
  const std::string state_before = read_file(f.ram / ".ramws" / "state.json");
  const auto r = ctl.sync(ramws::SyncOptions{});
  expect(!r.ok && r.error == ramws::ErrorCode::workspace_busy, "sync waits then reports busy");
  expect(read_file(f.ram / ".ramws" / "state.json") == state_before, "busy sync leaves state untouched");
  const auto st = ctl.status();
  expect(st.ok && st.possibly_stale, "status never blocks and flags staleness");
  held.release();
  expect(ctl.sync(ramws::SyncOptions{}).ok, "sync ok once released");
}

void test_interrupted_marker_recovered() {
  Fixture f;
  make_fixture(f, "ws_interrupted");
  ramws::WorkspaceController ctl(f.resolved, f.mirror);
  expect(ctl.start(ramws::StartOptions{}).ok, "start ok");

  ramws::StateStore store(f.ram);
  auto loaded = store.load(f.resolved.project_key);
  expect(loaded.record.has_value(), "record present");
  ramws::WorkspaceRecord rec = *loaded.record;
  rec.in_flight = ramws::InFlightOp{ramws::Role::source, ramws::Direction::to_disk, ".", 1};
  std::string err;
  expect(store.save(rec, &err), "marker saved");
  write_file(f.ram / "src" / "half.txt", "half");

  const auto st = ctl.status();
  expect(st.interrupted && st.source_dirty(), "interruption reported, dirtiness re-derived");
  loaded = store.load(f.resolved.project_key);
  expect(loaded.record && !loaded.record->in_flight, "marker cleared once re-derived");
}

void test_shell_environment() {
  ramws::ResolvedConfig rc;
  rc.project_root = "/p";
  rc.workspace_root = "/r";
  rc.project_key = "p-1234567";
  rc.config_path = "/p/.ramws.yml";
  ramws::ShellOptions opts;
  auto env = ramws::shell_environment(rc, opts, {{"RAMWS_LEVEL", "1"}, {"PS1", "$ "}, {"HOME", "/h"}});
  expect(env["RAMWS_ACTIVE"] == "1" && env["RAMWS_LEVEL"] == "2", "nesting level incremented");
  expect(env["RAMWS_ORIG_ROOT"] == "/p" && env["RAMWS_WS_ROOT"] == "/r", "roots exported");
  expect(env["PS1"] == "(ramws) $ " && env["HOME"] == "/h", "prompt prefixed, rest kept");
  opts.no_prompt = true;
  env = ramws::shell_environment(rc, opts, {{"PS1", "$ "}});
  expect(env["PS1"] == "$ " && env["RAMWS_LEVEL"] == "1", "prompt untouched with no_prompt");

  expect(ramws::shell_arguments(ramws::ShellOptions{}) == std::vector<std::string>{"-i"}, "interactive args");
  ramws::ShellOptions cmd;
  cmd.command = {"make", "-j4"};
  expect(ramws::shell_arguments(cmd) == std::vector<std::string>({"-lc", "make -j4"}), "command args");
}

void test_exit_policy_prompt() {
  auto cfg = fixture_config();
  cfg.sync.on_exit = ramws::ExitPolicy::ask;
  Fixture f;
  make_fixture(f, "ws_exit", cfg);
  ramws::WorkspaceController ctl(f.resolved, f.mirror);
  expect(ctl.start(ramws::StartOptions{}).ok, "start ok");
  write_file(f.ram / "src" / "a.txt", "exit edit");

  std::istringstream no("n\n");
  std::ostringstream prompt;
  auto r = ramws::apply_exit_policy(ctl, false, no, prompt);
  expect(r.ok && contains(r.notes, "RAM changes left unsynced"), "declined prompt leaves edits");
  expect(prompt.str().find("Sync 1 change(s) back to disk?") != std::string::npos, "prompt shows count");
  expect(read_file(f.project / "src" / "a.txt") == "alpha", "disk unchanged after decline");

  std::istringstream yes("\n");
  r = ramws::apply_exit_policy(ctl, false, yes, prompt);
  expect(r.ok && read_file(f.project / "src" / "a.txt") == "exit edit", "default answer syncs");

  write_file(f.ram / "src" / "a.txt", "second edit");
  std::istringstream unused;
  r = ramws::apply_exit_policy(ctl, true, unused, prompt);
  expect(r.ok && read_file(f.project / "src" / "a.txt") == "second edit", "noninteractive syncs");
}

void test_run_shell_command() {
  auto cfg = fixture_config();
  cfg.sync.on_exit = ramws::ExitPolicy::always;
  Fixture f;
  make_fixture(f, "ws_shell", cfg);
  ramws::WorkspaceController ctl(f.resolved, f.mirror);

  ramws::ShellOptions opts;
  opts.shell = "/bin/sh";
  opts.noninteractive = true;
  opts.command = {"echo hi > made.txt && test \"$RAMWS_ACTIVE\" = 1"};
  std::istringstream in;
  std::ostringstream out;
  const auto outcome = ramws::run_shell(ctl, opts, in, out);
  expect(outcome.ok, "shell ran: " + outcome.message);
  expect(outcome.exit_status == 0, "command saw the workspace environment");
  expect(ctl.started(), "shell started the workspace");
  expect(read_file(f.project / "made.txt") == "hi\n", "file made in RAM synced on exit");
}

}  // namespace

int main() {
  ramws::set_log_level(ramws::LogLevel::error);
  ramws::set_audit_log_path("");
  std::cout << "=== ramws test suite ===\n";

  std::cout << "\n[Patterns]\n";
  run_test("glob match", test_glob_match);
  run_test("filter set", test_glob_filter_set);
  run_test("path helpers", test_glob_paths);

  std::cout << "\n[JSON + hashing]\n";
  run_test("jsonlite roundtrip", test_jsonlite_roundtrip);
  run_test("jsonlite rejects", test_jsonlite_rejects);
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);

  std::cout << "\n[Configuration]\n";
  run_test("full config", test_config_parse_full);
  run_test("config errors", test_config_parse_errors);
  run_test("config defaults", test_config_defaults);
  run_test("project key + root template", test_project_key_and_template);
  run_test("RAM root validation", test_resolve_rejects_bad_roots);
  run_test("init + discovery", test_init_and_discover);

  std::cout << "\n[Classifier]\n";
  run_test("rule conflicts", test_rule_set_conflicts);
  run_test("resolution order", test_resolution_order);
  run_test("classification totality", test_classify_totality);
  run_test("snapshot tree", test_snapshot_tree);

  std::cout << "\n[Planner]\n";
  run_test("role table", test_plan_roles_table);
  run_test("explicit paths", test_plan_explicit_paths);
  run_test("sub-path filters", test_plan_sub_path_filters);
  run_test("rebase pattern", test_rebase_pattern);
  run_test("metadata excluded at root", test_plan_root_excludes_metadata);
  run_test("partial failure halts plan", test_execute_partial_failure);
  run_test("missing origins", test_execute_missing_origin);

  std::cout << "\n[Mirrors]\n";
  run_test("itemize parser", test_itemize_parser);
  run_test("rsync arguments", test_rsync_arguments);
  run_test("native mirror", test_native_mirror);

  std::cout << "\n[RAM baseline]\n";
  run_test("scan + diff", test_manifest_scan_and_diff);

  std::cout << "\n[Process runner]\n";
  run_test("process group + timeout", test_process_group_and_timeout);

  std::cout << "\n[State store]\n";
  run_test("record JSON roundtrip", test_record_json_roundtrip);
  run_test("load/save/clear", test_state_store_load_save);
  run_test("workspace lock", test_workspace_lock);
  run_test("lock survives workspace removal", test_lock_survives_workspace_removal);

  std::cout << "\n[Safety guard]\n";
  run_test("destroy + start", test_guard_destroy_and_start);
  run_test("sync", test_guard_sync);
  run_test("exit policy", test_guard_exit_policy);

  std::cout << "\n[Audit + observability]\n";
  run_test("audit chain", test_audit_chain);
  run_test("events + stats", test_events_and_stats);
  run_test("version manifest", test_version_manifest);
  run_test("filesystem inspection", test_filesystem_inspection);

  std::cout << "\n[Workspace lifecycle]\n";
  run_test("start populates", test_start_populates);
  run_test("refresh sources only", test_refresh_sources_only);
  run_test("dirty -> sync -> destroy", test_dirty_sync_destroy_cycle);
  run_test("deletions mirrored", test_deletion_is_dirty_and_mirrored);
  run_test("disk edits are not dirty", test_disk_edit_is_not_dirty);
  run_test("--only sub-path", test_only_sub_path);
  run_test("scope errors", test_sync_scope_errors);
  run_test("pull guard + force", test_pull_guard_and_force);
  run_test("forced destroy audited", test_forced_destroy_audited);
  run_test("busy workspace", test_busy_workspace);
  run_test("interrupted marker", test_interrupted_marker_recovered);

  std::cout << "\n[Shell]\n";
  run_test("environment + arguments", test_shell_environment);
  run_test("exit policy prompt", test_exit_policy_prompt);
  run_test("command session", test_run_shell_command);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return 0;
}
