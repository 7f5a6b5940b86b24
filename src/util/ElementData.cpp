#include "statmech/util/ElementData.hpp"
#include "statmech/util/Constants.hpp"
#include <algorithm>
#include <cctype>

namespace Statmech {

namespace {

const char* kElementSymbols[] = {
    "", "H", "He", "Li", "Be", "B", "C", "N", "O", "F", "Ne",
    "Na", "Mg", "Al", "Si", "P", "S", "Cl", "Ar", "K", "Ca",
    "Sc", "Ti", "V", "Cr", "Mn", "Fe", "Co", "Ni", "Cu", "Zn",
    "Ga", "Ge", "As", "Se", "Br", "Kr", "Rb", "Sr", "Y", "Zr",
    "Nb", "Mo", "Tc", "Ru", "Rh", "Pd", "Ag", "Cd", "In", "Sn",
    "Sb", "Te", "I", "Xe", "Cs", "Ba", "La", "Ce", "Pr", "Nd",
    "Pm", "Sm", "Eu", "Gd", "Tb", "Dy", "Ho", "Er", "Tm", "Yb",
    "Lu", "Hf", "Ta", "W", "Re", "Os", "Ir", "Pt", "Au", "Hg",
    "Tl", "Pb", "Bi", "Po", "At", "Rn", "Fr", "Ra", "Ac", "Th",
    "Pa", "U", "Np", "Pu", "Am", "Cm", "Bk", "Cf", "Es", "Fm",
    "Md", "No", "Lr", "Rf", "Db", "Sg", "Bh", "Hs", "Mt", "Ds",
    "Rg", "Cn", "Nh", "Fl", "Mc", "Lv", "Ts", "Og"
};

std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);
    return s;
}

} // namespace

int getAtomicNumber(const std::string& symbol) {
    std::string upper = toUpper(symbol);
    for (int i = 1; i <= Constants::kNumElementsPT; ++i) {
        if (upper == toUpper(kElementSymbols[i])) {
            return i;
        }
    }
    return -1;  // Not found
}

std::string getElementSymbol(int atomicNumber) {
    if (atomicNumber >= 1 && atomicNumber <= Constants::kNumElementsPT) {
        return kElementSymbols[atomicNumber];
    }
    return "";
}

std::map<std::string, int> countElements(const std::vector<int>& atomicNumbers) {
    std::map<std::string, int> counts;
    for (int z : atomicNumbers) {
        std::string symbol = getElementSymbol(z);
        if (!symbol.empty()) {
            ++counts[symbol];
        }
    }
    return counts;
}

std::vector<std::string> hillOrder(const std::map<std::string, int>& counts) {
    std::vector<std::string> order;
    bool hasCarbon = counts.count("C") > 0;
    if (hasCarbon) {
        order.push_back("C");
        if (counts.count("H") > 0) {
            order.push_back("H");
        }
    }
    // std::map iterates alphabetically
    for (const auto& entry : counts) {
        if (hasCarbon && (entry.first == "C" || entry.first == "H")) continue;
        order.push_back(entry.first);
    }
    return order;
}

std::string molecularFormula(const std::vector<int>& atomicNumbers) {
    auto counts = countElements(atomicNumbers);
    std::string formula;
    for (const auto& symbol : hillOrder(counts)) {
        formula += symbol;
        int n = counts[symbol];
        if (n > 1) {
            formula += std::to_string(n);
        }
    }
    return formula;
}

} // namespace Statmech
