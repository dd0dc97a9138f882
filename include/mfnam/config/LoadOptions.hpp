#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "mfnam/app/Loader.hpp"
#include "mfnam/config/IniConfig.hpp"

namespace mfnam {

// Everything a run of the command line tool needs, read from one INI file:
//
//   [model]
//   name_file = model.nam        ; required
//   model_ws  = ./model          ; default: config directory
//   version   = mf2005
//   exe_name  = mf2005
//   load_only = WEL, RCH         ; optional
//   verbose   = false
//
//   [write]
//   output_ws = ./out            ; optional, rewrite the model there
//   threads   = 1
//   report    = load.json        ; optional
struct LoadOptions {
  LoadRequest request;
  std::optional<std::filesystem::path> output_ws;
  std::optional<std::filesystem::path> report;
  int threads = 1;

  static LoadOptions from_ini(const IniConfig& cfg);
};

inline LoadOptions LoadOptions::from_ini(const IniConfig& cfg) {
  LoadOptions o;
  LoadRequest& r = o.request;

  r.name_file = cfg.get_string("model", "name_file");
  std::filesystem::path cfg_dir = cfg.base_dir();
  if (cfg_dir.empty()) cfg_dir = ".";
  r.model_ws = cfg.get_path("model", "model_ws").value_or(cfg_dir);
  r.version = cfg.get_string("model", "version", std::string("mf2005"));
  r.exe_name = cfg.get_string("model", "exe_name", std::string("mf2005"));
  r.verbose = cfg.get_bool("model", "verbose", false);
  if (cfg.has_key("model", "load_only")) r.load_only = cfg.get_list("model", "load_only");

  o.output_ws = cfg.get_path("write", "output_ws");
  o.report = cfg.get_path("write", "report");
  const auto threads = cfg.get_int64("write", "threads", 1);
  if (threads < 1) throw ConfigError("[write] threads must be >= 1, got " + std::to_string(threads));
  o.threads = static_cast<int>(threads);
  return o;
}

} // namespace mfnam
