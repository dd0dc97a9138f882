#pragma once

#include <string_view>

namespace mfnam {

// Closed set of package kinds known to the built-in registry. Packages added
// to a model's registry at runtime use Custom.
enum class PackageKind {
  Dis,
  Bas6,
  Bcf6,
  Lpf,
  Upw,
  Hfb6,
  Chd,
  Wel,
  Drn,
  Rch,
  Evt,
  Ghb,
  Gmg,
  Riv,
  Str,
  Swi2,
  Pcg,
  Pcgn,
  Nwt,
  Pks,
  Sfr,
  Sip,
  Sor,
  De4,
  Oc,
  Uzf,
  Zone,
  Mult,
  Pval,
  Global,
  List,
  Custom,
};

// Name file filetype tag of a kind (upper case).
inline std::string_view package_kind_tag(PackageKind k) {
  switch (k) {
    case PackageKind::Dis: return "DIS";
    case PackageKind::Bas6: return "BAS6";
    case PackageKind::Bcf6: return "BCF6";
    case PackageKind::Lpf: return "LPF";
    case PackageKind::Upw: return "UPW";
    case PackageKind::Hfb6: return "HFB6";
    case PackageKind::Chd: return "CHD";
    case PackageKind::Wel: return "WEL";
    case PackageKind::Drn: return "DRN";
    case PackageKind::Rch: return "RCH";
    case PackageKind::Evt: return "EVT";
    case PackageKind::Ghb: return "GHB";
    case PackageKind::Gmg: return "GMG";
    case PackageKind::Riv: return "RIV";
    case PackageKind::Str: return "STR";
    case PackageKind::Swi2: return "SWI2";
    case PackageKind::Pcg: return "PCG";
    case PackageKind::Pcgn: return "PCGN";
    case PackageKind::Nwt: return "NWT";
    case PackageKind::Pks: return "PKS";
    case PackageKind::Sfr: return "SFR";
    case PackageKind::Sip: return "SIP";
    case PackageKind::Sor: return "SOR";
    case PackageKind::De4: return "DE4";
    case PackageKind::Oc: return "OC";
    case PackageKind::Uzf: return "UZF";
    case PackageKind::Zone: return "ZONE";
    case PackageKind::Mult: return "MULT";
    case PackageKind::Pval: return "PVAL";
    case PackageKind::Global: return "GLOBAL";
    case PackageKind::List: return "LIST";
    case PackageKind::Custom: return "";
  }
  return "";
}

// Position of the cell-by-cell budget unit on the first data line of a
// package, or -1 when the package has none.
inline int budget_unit_token(PackageKind k) {
  switch (k) {
    case PackageKind::Bcf6:
    case PackageKind::Lpf:
    case PackageKind::Upw:
      return 0;
    case PackageKind::Wel:
    case PackageKind::Drn:
    case PackageKind::Ghb:
    case PackageKind::Riv:
    case PackageKind::Rch:
    case PackageKind::Evt:
      return 1;
    default:
      return -1;
  }
}

} // namespace mfnam
