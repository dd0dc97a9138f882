#include "mfnam/model/Model.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#if defined(MFNAM_HAS_OPENMP) && MFNAM_HAS_OPENMP
#include <omp.h>
#endif

#include "mfnam/core/Errors.hpp"
#include "mfnam/io/NameFile.hpp"
#include "mfnam/packages/TextPackage.hpp"
#include "mfnam/util/Parse.hpp"
#include "mfnam/util/Paths.hpp"

namespace fs = std::filesystem;

namespace mfnam {

namespace {

bool is_supported_version(const std::string& v) {
  return v == "mf2k" || v == "mf2005" || v == "mfnwt" || v == "mfusg";
}

void ensure_dir(const fs::path& dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) throw IoError("failed to create directory " + dir.string() + ": " + ec.message());
}

} // namespace

Model::Model(std::string name, ModelOptions opt)
: name_(std::move(name)),
  namefile_ext_(opt.namefile_ext),
  version_(to_lower(opt.version)),
  exe_name_(opt.exe_name),
  log_(opt.verbose, opt.log_stream),
  registry_(PackageRegistry::builtin()) {
  if (!is_supported_version(version_)) {
    throw ConfigError("unsupported MODFLOW version '" + opt.version + "' (use mf2k|mf2005|mfnwt|mfusg)");
  }
  heading_ = "# Name file for " + version_ + ", generated by mfnam.";
  model_ws_ = normalize_dir(opt.model_ws);
  write_threads_ = std::max(1, opt.write_threads);

  if (version_ == "mf2k") glo_ = std::make_unique<GlobalPackage>(1, name_ + ".glo");
  lst_ = std::make_unique<ListPackage>(opt.list_unit, name_ + ".list");

  if (opt.external_path) {
    const fs::path ext = resolve_path(model_ws_, *opt.external_path);
    if (fs::exists(ext)) {
      log_.info("external_path " + ext.string() + " already exists");
    } else {
      ensure_dir(ext);
    }
    external_ = true;
    external_path_ = *opt.external_path;
  }
}

void Model::set_name(std::string name) {
  name_ = std::move(name);
  if (glo_) glo_->set_file(0, PackageFile{"GLOBAL", glo_->unit(), name_ + ".glo"});
  lst_->set_file(0, PackageFile{"LIST", lst_->unit(), name_ + ".list"});
}

void Model::change_model_ws(const fs::path& ws) {
  const fs::path dir = normalize_dir(ws);
  if (!fs::exists(dir)) {
    log_.info("creating model workspace " + dir.string());
    ensure_dir(dir);
  }
  model_ws_ = dir;
  log_.info("changing model workspace to " + dir.string());
}

Package& Model::add_package(std::unique_ptr<Package> pk) {
  if (!pk) throw std::invalid_argument("Model::add_package: null package");
  for (auto& existing : packages_) {
    if (iequals(existing->filetype(), pk->filetype())) {
      log_.warn("two packages of the same type, replacing existing '" + existing->filetype() + "' package");
      existing = std::move(pk);
      return *existing;
    }
  }
  packages_.push_back(std::move(pk));
  return *packages_.back();
}

bool Model::remove_package(std::string_view filetype) {
  auto it = std::find_if(packages_.begin(), packages_.end(),
                         [&](const auto& p) { return iequals(p->filetype(), filetype); });
  if (it == packages_.end()) return false;
  packages_.erase(it);
  return true;
}

Package* Model::get_package(std::string_view filetype) {
  return const_cast<Package*>(static_cast<const Model&>(*this).get_package(filetype));
}

const Package* Model::get_package(std::string_view filetype) const {
  for (const auto& p : packages_) {
    if (iequals(p->filetype(), filetype)) return p.get();
  }
  if (iequals(filetype, "LIST")) return lst_.get();
  if (glo_ && iequals(filetype, "GLOBAL")) return glo_.get();
  return nullptr;
}

std::vector<std::string> Model::package_names() const {
  std::vector<std::string> out;
  out.reserve(packages_.size());
  for (const auto& p : packages_) out.push_back(p->filetype());
  return out;
}

const Discretization* Model::dis() const {
  return dynamic_cast<const Discretization*>(get_package("DIS"));
}

GridShape Model::shape() const {
  const auto* d = dis();
  return d ? d->shape() : GridShape{};
}

bool Model::bas_free_format() const {
  const auto* bas = dynamic_cast<const TextPackage*>(get_package("BAS6"));
  if (!bas) return false;
  for (const auto& line : bas->lines()) {
    if (is_comment_or_blank(line)) continue;
    for (const auto tok : split_ws(line)) {
      if (iequals(tok, "FREE")) return true;
    }
    return false;
  }
  return false;
}

void Model::add_external(const fs::path& filename, int unit, bool binary) {
  const fs::path f = resolve_path(model_ws_, filename);
  auto same_file = std::find_if(externals_.begin(), externals_.end(),
                                [&](const ExternalFileEntry& e) { return e.filename == f; });
  if (same_file != externals_.end()) {
    log_.warn("add_external: replacing existing filename " + f.string());
    externals_.erase(same_file);
  }
  auto same_unit = std::find_if(externals_.begin(), externals_.end(),
                                [&](const ExternalFileEntry& e) { return e.unit == unit; });
  if (same_unit != externals_.end()) {
    log_.warn("add_external: replacing existing unit " + std::to_string(unit));
    externals_.erase(same_unit);
  }
  externals_.push_back(ExternalFileEntry{unit, f, binary});
  allocator_.reserve_through(unit);
}

bool Model::remove_external(int unit) {
  auto it = std::find_if(externals_.begin(), externals_.end(),
                         [&](const ExternalFileEntry& e) { return e.unit == unit; });
  if (it == externals_.end()) return false;
  externals_.erase(it);
  return true;
}

bool Model::remove_external(const fs::path& filename) {
  const fs::path f = resolve_path(model_ws_, filename);
  auto it = std::find_if(externals_.begin(), externals_.end(),
                         [&](const ExternalFileEntry& e) { return e.filename == f; });
  if (it == externals_.end()) return false;
  externals_.erase(it);
  return true;
}

void Model::add_pop_key(int unit) {
  if (!is_pop_key(unit)) pop_keys_.push_back(unit);
}

bool Model::is_pop_key(int unit) const {
  return std::find(pop_keys_.begin(), pop_keys_.end(), unit) != pop_keys_.end();
}

LoadContext Model::load_context(const UnitTable& working) {
  return LoadContext(model_ws_, working, params_, shape(), pop_keys_, log_);
}

void Model::write_name_file() const {
  NameFileCodec::write(*this, model_ws_ / namefile());
}

void Model::write_input() const {
  ensure_dir(model_ws_);

  const auto n = static_cast<std::int64_t>(packages_.size());
  std::vector<std::exception_ptr> errors(packages_.size());

#if defined(MFNAM_HAS_OPENMP) && MFNAM_HAS_OPENMP
  #pragma omp parallel for schedule(dynamic) num_threads(write_threads_) if(write_threads_ > 1)
#endif
  for (std::int64_t i = 0; i < n; ++i) {
    // Exceptions must not leave an OpenMP region; keep them and rethrow below.
    try {
      packages_[static_cast<std::size_t>(i)]->write(model_ws_);
    } catch (...) {
      errors[static_cast<std::size_t>(i)] = std::current_exception();
    }
  }
  for (const auto& e : errors) {
    if (e) std::rethrow_exception(e);
  }

  if (glo_) glo_->write(model_ws_);
  lst_->write(model_ws_);
  write_name_file();
}

std::string Model::describe() const {
  const GridShape s = shape();
  return "MODFLOW " + std::to_string(s.nlay) + " layer(s), " + std::to_string(s.nrow) + " row(s), " +
         std::to_string(s.ncol) + " column(s), " + std::to_string(s.nper) + " stress period(s)";
}

} // namespace mfnam
