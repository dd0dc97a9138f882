#include "mfnam/packages/Discretization.hpp"

#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

#include "mfnam/io/ArrayIO.hpp"
#include "mfnam/util/AtomicFile.hpp"
#include "mfnam/util/Parse.hpp"
#include "mfnam/util/Paths.hpp"

namespace mfnam {

Discretization::Discretization(int unit, std::string filename)
: Package(PackageKind::Dis, "DIS", {PackageFile{"DIS", unit, std::move(filename)}}) {}

int Discretization::n_botm() const {
  int n = nlay;
  for (int c : laycbd) {
    if (c != 0) ++n;
  }
  return n;
}

std::unique_ptr<Package> Discretization::load(LoadContext& ctx, const UnitTableEntry& entry) {
  LineReader in(entry.filename, "DIS");
  auto dis = std::make_unique<Discretization>(entry.unit, relative_to(entry.filename, ctx.workspace()));

  // Item 1: NLAY NROW NCOL NPER ITMUNI LENUNI
  const std::string l1 = in.require_line("NLAY NROW NCOL NPER ITMUNI LENUNI");
  const auto t = split_ws(l1);
  if (t.size() < 4) in.fail("expected NLAY NROW NCOL NPER [ITMUNI LENUNI], got: " + l1);
  int* dims[] = {&dis->nlay, &dis->nrow, &dis->ncol, &dis->nper};
  const char* dim_names[] = {"NLAY", "NROW", "NCOL", "NPER"};
  for (int i = 0; i < 4; ++i) {
    if (!parse_int(t[static_cast<std::size_t>(i)], *dims[i]) || *dims[i] <= 0) {
      in.fail(std::string(dim_names[i]) + " must be a positive integer, got '" + std::string(t[static_cast<std::size_t>(i)]) + "'");
    }
  }
  if (t.size() > 4 && !parse_int(t[4], dis->itmuni)) in.fail("invalid ITMUNI");
  if (t.size() > 5 && !parse_int(t[5], dis->lenuni)) in.fail("invalid LENUNI");
  dis->heading = in.heading();

  // Item 2: LAYCBD(NLAY)
  dis->laycbd.reserve(static_cast<std::size_t>(dis->nlay));
  for (int k = 0; k < dis->nlay; ++k) dis->laycbd.push_back(in.next_int("LAYCBD"));
  if (dis->laycbd.back() != 0) in.fail("LAYCBD of the bottom layer must be 0");

  ArrayReader arr(in, ctx, "DIS", entry.unit);
  dis->delr = arr.read_real_1d(static_cast<std::size_t>(dis->ncol), "DELR");
  dis->delc = arr.read_real_1d(static_cast<std::size_t>(dis->nrow), "DELC");
  dis->top = arr.read_real_2d(dis->nrow, dis->ncol, "MODEL TOP");
  const int nb = dis->n_botm();
  for (int k = 0; k < nb; ++k) {
    dis->botm.push_back(arr.read_real_2d(dis->nrow, dis->ncol, "BOTM LAYER " + std::to_string(k + 1)));
  }

  // Item 7: PERLEN NSTP TSMULT Ss/tr, one line per stress period.
  for (int p = 0; p < dis->nper; ++p) {
    const std::string what = "stress period " + std::to_string(p + 1);
    const std::string line = in.require_line(what);
    const auto sp = split_ws(line);
    StressPeriod per;
    if (sp.size() < 4 || !parse_double(sp[0], per.perlen) || !parse_int(sp[1], per.nstp) ||
        !parse_double(sp[2], per.tsmult)) {
      in.fail("expected PERLEN NSTP TSMULT SS|TR for " + what + ", got: " + line);
    }
    const std::string flag = to_upper(sp[3]);
    if (flag != "SS" && flag != "TR") in.fail("expected SS or TR for " + what + ", got '" + std::string(sp[3]) + "'");
    per.steady = (flag == "SS");
    if (per.nstp <= 0) in.fail("NSTP must be positive for " + what);
    dis->periods.push_back(per);
  }

  return dis;
}

void Discretization::write(const std::filesystem::path& workspace) const {
  util::atomic_write_text(workspace / filename(), [&](std::ostream& os) {
    if (heading.empty()) {
      os << "# DIS package generated by mfnam\n";
    }
    for (const auto& h : heading) os << h << "\n";

    os << std::setw(10) << nlay << std::setw(10) << nrow << std::setw(10) << ncol
       << std::setw(10) << nper << std::setw(10) << itmuni << std::setw(10) << lenuni << "\n";
    for (std::size_t k = 0; k < laycbd.size(); ++k) {
      os << (k == 0 ? "" : " ") << laycbd[k];
    }
    os << "\n";

    write_array(os, delr, "delr");
    write_array(os, delc, "delc");
    write_array(os, top, "model_top");
    for (std::size_t k = 0; k < botm.size(); ++k) {
      write_array(os, botm[k], "botm_layer_" + std::to_string(k + 1));
    }
    for (const auto& p : periods) {
      std::ostringstream line;
      line << std::setprecision(15) << ' ' << p.perlen << ' ' << p.nstp << ' ' << p.tsmult << ' '
           << (p.steady ? "SS" : "TR");
      os << line.str() << "\n";
    }
  });
}

std::string Discretization::describe() const {
  return "DIS package: " + std::to_string(nlay) + " layer(s), " + std::to_string(nrow) + " row(s), " +
         std::to_string(ncol) + " column(s), " + std::to_string(nper) + " stress period(s)";
}

} // namespace mfnam
