#pragma once

#include <cctype>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace rxmap {

// Atom type -> element symbol.
//
// Symbols are stored upper-case ("C", "CL", "H") so that user input such as
// "Cl" and "CL" compare equal. Types without a known element map to a
// placeholder "T<type>", which keeps them distinct from every real element.
class ElementTable {
public:
  ElementTable() = default;

  // elements[0] is the element of type 1, elements[1] of type 2, ...
  static ElementTable from_list(const std::vector<std::string>& elements) {
    ElementTable t;
    t.by_type_.assign(elements.size() + 1, std::string());
    for (std::size_t i = 0; i < elements.size(); ++i) {
      std::string s = elements[i];
      for (auto& c : s) c = static_cast<char>(::toupper(static_cast<unsigned char>(c)));
      if (s.empty()) throw std::runtime_error("ElementTable: empty element symbol for type " + std::to_string(i + 1));
      t.by_type_[i + 1] = s;
    }
    return t;
  }

  // Best-effort guess from a LAMMPS Masses section (index 0 unused).
  static ElementTable from_masses(const std::vector<double>& mass_by_type) {
    struct Ref {
      const char* symbol;
      double mass;
    };
    static const Ref kRefs[] = {
        {"H", 1.008},   {"C", 12.011},  {"N", 14.007},  {"O", 15.999}, {"F", 18.998},  {"NA", 22.990},
        {"SI", 28.085}, {"P", 30.974},  {"S", 32.06},   {"CL", 35.45}, {"K", 39.098},  {"CA", 40.078},
        {"ZN", 65.38},  {"BR", 79.904}, {"I", 126.904},
    };
    constexpr double kTol = 0.1;

    ElementTable t;
    t.by_type_.assign(mass_by_type.size(), std::string());
    for (std::size_t type = 1; type < mass_by_type.size(); ++type) {
      const double m = mass_by_type[type];
      if (m <= 0.0) continue;
      for (const auto& r : kRefs) {
        if (std::fabs(m - r.mass) <= kTol) {
          t.by_type_[type] = r.symbol;
          break;
        }
      }
    }
    return t;
  }

  bool empty() const { return by_type_.size() <= 1; }

  // Highest type with an entry slot.
  int max_type() const { return by_type_.empty() ? 0 : static_cast<int>(by_type_.size() - 1); }

  bool knows(int type) const {
    return type > 0 && static_cast<std::size_t>(type) < by_type_.size() && !by_type_[type].empty();
  }

  std::string element(int type) const {
    if (knows(type)) return by_type_[static_cast<std::size_t>(type)];
    return "T" + std::to_string(type);
  }

  bool is_hydrogen(int type) const {
    return knows(type) && by_type_[static_cast<std::size_t>(type)] == "H";
  }

private:
  std::vector<std::string> by_type_; // index 0 unused
};

} // namespace rxmap
