/// @file ChemkinEntry.hpp
/// @brief Fixed-column Chemkin THERMO entry of a NASA model
/// @details Four 80-column lines: name, element counts (up to four, Hill
/// order), phase "G", Tmin/Tmax/Tmid; then the high-range coefficients a1..a7
/// followed by the low-range a1..a7, five per line in %15.8E, each line ending
/// with its line number in column 80.

#pragma once

#include "statmech/models/NASA.hpp"
#include <map>
#include <string>

namespace Statmech {

/// @brief Render a Chemkin entry
/// @param name Species name (truncated to 18 characters)
/// @param elements Element symbol -> atom count (at most four elements, 1..999 each)
/// @param model Fitted NASA model
/// @param entry Output: four newline-terminated lines (empty on error)
/// @return Error code (0 = success, kInvalidRecordFormat if the elements do not fit the header)
int writeChemkinEntry(const std::string& name, const std::map<std::string, int>& elements,
                      const NASA& model, std::string& entry);

/// @brief Read a Chemkin entry back into a NASA model
/// @param text Entry text (at least four lines)
/// @param name Output: species name
/// @param model Output: polynomials and range (E0, Cp0, CpInf untouched)
/// @return Error code (0 = success, kInvalidRecordFormat)
int parseChemkinEntry(const std::string& text, std::string& name, NASA& model);

} // namespace Statmech
