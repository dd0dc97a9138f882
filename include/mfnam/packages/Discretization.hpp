#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "mfnam/core/Grid.hpp"
#include "mfnam/packages/Package.hpp"

namespace mfnam {

// DIS: the only source of grid shape for a model. Always loaded first.
class Discretization : public Package {
public:
  struct StressPeriod {
    double perlen = 1.0;
    int nstp = 1;
    double tsmult = 1.0;
    bool steady = true;
  };

  Discretization(int unit, std::string filename);

  static std::unique_ptr<Package> load(LoadContext& ctx, const UnitTableEntry& entry);

  void write(const std::filesystem::path& workspace) const override;
  std::string describe() const override;

  GridShape shape() const { return GridShape{nlay, nrow, ncol, nper}; }

  // Number of BOTM layers: model layers plus quasi-3D confining beds.
  int n_botm() const;

  int nlay = 1;
  int nrow = 1;
  int ncol = 1;
  int nper = 1;
  int itmuni = 4; // days
  int lenuni = 2; // meters
  std::vector<int> laycbd;
  std::vector<double> delr;
  std::vector<double> delc;
  Array2D<double> top;
  std::vector<Array2D<double>> botm;
  std::vector<StressPeriod> periods;
  std::vector<std::string> heading;
};

} // namespace mfnam
