#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "mfnam/core/Grid.hpp"
#include "mfnam/util/Parse.hpp"

namespace mfnam {

// Named parameter values, zone arrays and multiplier arrays that packages
// may reference by name instead of literal values. Names are case-insensitive.
class ParameterContext {
public:
  void set_value(std::string_view name, double v) { values_[to_lower(name)] = v; }
  void set_zone(std::string_view name, Array2D<int> a) { zones_[to_lower(name)] = std::move(a); }
  void set_mult(std::string_view name, Array2D<double> a) { mults_[to_lower(name)] = std::move(a); }

  std::optional<double> value(std::string_view name) const {
    auto it = values_.find(to_lower(name));
    if (it == values_.end()) return std::nullopt;
    return it->second;
  }

  const Array2D<int>* zone(std::string_view name) const {
    auto it = zones_.find(to_lower(name));
    return it == zones_.end() ? nullptr : &it->second;
  }

  const Array2D<double>* mult(std::string_view name) const {
    auto it = mults_.find(to_lower(name));
    return it == mults_.end() ? nullptr : &it->second;
  }

  std::size_t n_values() const { return values_.size(); }
  std::size_t n_zones() const { return zones_.size(); }
  std::size_t n_mults() const { return mults_.size(); }

  bool empty() const { return values_.empty() && zones_.empty() && mults_.empty(); }

  void clear() {
    values_.clear();
    zones_.clear();
    mults_.clear();
  }

private:
  std::map<std::string, double> values_;
  std::map<std::string, Array2D<int>> zones_;
  std::map<std::string, Array2D<double>> mults_;
};

} // namespace mfnam
