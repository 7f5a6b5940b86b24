#pragma once

#include <map>
#include <string>
#include <vector>

namespace Statmech {

/// @brief Get atomic number from element symbol
/// @param symbol Element symbol (e.g., "C", "O"), case-insensitive
/// @return Atomic number (-1 if not found)
int getAtomicNumber(const std::string& symbol);

/// @brief Get element symbol from atomic number
/// @param atomicNumber Atomic number
/// @return Element symbol (empty if invalid)
std::string getElementSymbol(int atomicNumber);

/// @brief Count atoms per element symbol
/// @param atomicNumbers One atomic number per atom
/// @return Map symbol -> count (unknown numbers are skipped)
std::map<std::string, int> countElements(const std::vector<int>& atomicNumbers);

/// @brief Element symbols in Hill order (C, H, then alphabetical; alphabetical without carbon)
std::vector<std::string> hillOrder(const std::map<std::string, int>& counts);

/// @brief Molecular formula in Hill order, e.g. "H4N2"
std::string molecularFormula(const std::vector<int>& atomicNumbers);

} // namespace Statmech
