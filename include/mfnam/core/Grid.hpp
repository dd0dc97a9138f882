#pragma once

#include <algorithm>
#include <cstddef>
#include <vector>

namespace mfnam {

struct GridShape {
  int nlay = 0;
  int nrow = 0;
  int ncol = 0;
  int nper = 0;

  bool empty() const { return nlay == 0 && nrow == 0 && ncol == 0 && nper == 0; }
};

// Row-major (row, column) layer array.
template <typename T>
struct Array2D {
  int nrow = 0;
  int ncol = 0;
  std::vector<T> values;

  Array2D() = default;
  Array2D(int r, int c, T fill = T{})
  : nrow(r), ncol(c), values(static_cast<std::size_t>(r) * static_cast<std::size_t>(c), fill) {}

  T& operator()(int r, int c) { return values[static_cast<std::size_t>(r) * ncol + c]; }
  const T& operator()(int r, int c) const { return values[static_cast<std::size_t>(r) * ncol + c]; }

  std::size_t size() const { return values.size(); }

  bool uniform() const {
    return values.empty() ||
           std::all_of(values.begin(), values.end(), [&](const T& v) { return v == values.front(); });
  }
};

} // namespace mfnam
