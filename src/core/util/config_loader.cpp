// src/core/util/config_loader.cpp
#include "rc/core/util/config_loader.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace rc {
namespace fs = std::filesystem;

static bool is_map(const YAML::Node& n) { return n && n.IsMap(); }

// Recursive merge: maps merge keys; scalars/sequences override.
static YAML::Node merge_yaml(const YAML::Node& base, const YAML::Node& override_) {
  if (!base) return override_;
  if (!override_) return base;

  if (base.IsMap() && override_.IsMap()) {
    YAML::Node out = YAML::Clone(base);
    for (auto it : override_) {
      const auto key = it.first.as<std::string>();
      const auto val = it.second;
      if (out[key]) out[key] = merge_yaml(out[key], val);
      else out[key] = val;
    }
    return out;
  }

  // For scalars, sequences, etc., override completely.
  return override_;
}

template <typename T>
static void maybe_set(const YAML::Node& n, const char* key, T& out) {
  if (!n || !n[key]) return;
  out = n[key].as<T>();
}

static Result<YAML::Node> load_yaml_file(const fs::path& path) {
  try {
    if (!fs::exists(path)) {
      return Result<YAML::Node>::err(Status::not_found("config not found: " + path.string()));
    }
    return Result<YAML::Node>::ok(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception& e) {
    return Result<YAML::Node>::err(Status::parse_error("YAML parse error in " + path.string() + ": " + e.what()));
  } catch (const std::exception& e) {
    return Result<YAML::Node>::err(Status::io_error("failed to load " + path.string() + ": " + e.what()));
  }
}

static Result<YAML::Node> load_with_includes(const fs::path& path, int depth) {
  if (depth > 16) {
    return Result<YAML::Node>::err(Status::invalid_argument("includes nested too deeply at " + path.string()));
  }

  auto root_r = load_yaml_file(path);
  if (!root_r.ok()) return Result<YAML::Node>::err(root_r.status());
  YAML::Node root = root_r.take_value();

  YAML::Node merged;  // empty
  const fs::path dir = path.parent_path();

  // Optional top-level includes: ["a.yaml", "b.yaml"]
  if (root.IsMap() && root["includes"]) {
    const YAML::Node inc = root["includes"];
    if (!inc.IsSequence()) {
      return Result<YAML::Node>::err(Status::invalid_argument("includes must be a YAML sequence"));
    }

    for (std::size_t i = 0; i < inc.size(); ++i) {
      const auto rel = inc[i].as<std::string>();
      const fs::path child = fs::path(rel).is_absolute() ? fs::path(rel) : (dir / rel);
      auto child_r = load_with_includes(child, depth + 1);  // recursive
      if (!child_r.ok()) return Result<YAML::Node>::err(child_r.status());
      merged = merge_yaml(merged, child_r.take_value());
    }

    root.remove("includes");
  }

  merged = merge_yaml(merged, root);
  return Result<YAML::Node>::ok(merged);
}

static std::string resolve_against(const fs::path& base_dir, const std::string& p) {
  if (p.empty() || fs::path(p).is_absolute()) return p;
  return (base_dir / p).lexically_normal().string();
}

static void apply_yaml(const YAML::Node& y, Config& cfg) {
  // --- worker
  if (is_map(y["worker"])) {
    const auto w = y["worker"];
    maybe_set(w, "program", cfg.worker.program);
    maybe_set(w, "working_dir", cfg.worker.working_dir);
    if (w["interpreters"]) cfg.worker.interpreters = w["interpreters"].as<std::vector<std::string>>();
    if (w["args"]) cfg.worker.args = w["args"].as<std::vector<std::string>>();
    if (w["program_args"]) cfg.worker.program_args = w["program_args"].as<std::vector<std::string>>();
    if (w["env"]) cfg.worker.env = w["env"].as<std::map<std::string, std::string>>();
    maybe_set(w, "pythonpath_working_dir", cfg.worker.pythonpath_working_dir);
    maybe_set(w, "prepend_virtualenv_bin", cfg.worker.prepend_virtualenv_bin);
  }

  // --- supervisor
  if (is_map(y["supervisor"])) {
    const auto s = y["supervisor"];
    if (s["stop_timeout_s"]) cfg.supervisor.stop_timeout_ms = seconds_to_ms(s["stop_timeout_s"].as<double>());
    maybe_set(s, "escalate_to_kill", cfg.supervisor.escalate_to_kill);
    if (s["kill_timeout_s"]) cfg.supervisor.kill_timeout_ms = seconds_to_ms(s["kill_timeout_s"].as<double>());
  }

  // --- relay
  if (is_map(y["relay"])) {
    const auto r = y["relay"];
    maybe_set(r, "poll_interval_ms", cfg.relay.poll_interval_ms);
    maybe_set(r, "max_line_bytes", cfg.relay.max_line_bytes);
  }

  // --- broadcast
  if (is_map(y["broadcast"])) {
    maybe_set(y["broadcast"], "observer_queue_capacity", cfg.broadcast.observer_queue_capacity);
  }

  // --- logging
  if (is_map(y["logging"])) {
    const auto l = y["logging"];
    maybe_set(l, "level", cfg.logging.level);
    maybe_set(l, "file", cfg.logging.file);
  }

  // --- output
  if (is_map(y["output"])) {
    maybe_set(y["output"], "events_path", cfg.output.events_path);
  }
}

Result<Config> load_config(const std::string& path_str) {
  const fs::path path = fs::path(path_str);

  auto yaml_r = load_with_includes(path, 0);
  if (!yaml_r.ok()) return Result<Config>::err(yaml_r.status());
  const YAML::Node y = yaml_r.take_value();

  if (y && !y.IsNull() && !y.IsMap()) {
    return Result<Config>::err(Status::invalid_argument("config root must be a YAML map: " + path_str));
  }

  Config cfg;  // defaults
  try {
    apply_yaml(y, cfg);
  } catch (const YAML::Exception& e) {
    return Result<Config>::err(Status::parse_error("bad value in " + path_str + ": " + e.what()));
  }

  // Paths in the file are relative to the file, not to the caller's cwd.
  const fs::path base_dir = fs::absolute(path).parent_path();
  cfg.worker.program = resolve_against(base_dir, cfg.worker.program);
  cfg.worker.working_dir = resolve_against(base_dir, cfg.worker.working_dir);
  cfg.output.events_path = resolve_against(base_dir, cfg.output.events_path);
  cfg.logging.file = resolve_against(base_dir, cfg.logging.file);

  // Final validation (fail early).
  const Status s = validate_config(cfg);
  if (!s.ok()) return Result<Config>::err(s);

  return Result<Config>::ok(cfg);
}

}  // namespace rc
