#include "statmech/postprocess/ChemkinEntry.hpp"
#include "statmech/util/ElementData.hpp"
#include "statmech/util/ErrorCodes.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace Statmech {

namespace {

constexpr int kNameWidth = 18;
constexpr int kHeaderWidth = 24;
constexpr int kElementSlots = 4;
constexpr int kMaxElementCount = 999;
constexpr int kCoeffWidth = 15;
constexpr int kLineWidth = 79;    // line number goes in column 80

void finishLine(std::ostringstream& out, int lineNumber) {
    std::string line = out.str();
    if (line.size() < static_cast<std::size_t>(kLineWidth)) {
        line.append(kLineWidth - line.size(), ' ');
    }
    out.str("");
    out << line << lineNumber << '\n';
}

double readField(const std::string& line, std::size_t start, std::size_t width) {
    if (line.size() < start + width) {
        throw std::out_of_range("short line");
    }
    return std::stod(line.substr(start, width));
}

} // namespace

int writeChemkinEntry(const std::string& name, const std::map<std::string, int>& elements,
                      const NASA& model, std::string& entry) {
    entry.clear();
    if (elements.size() > static_cast<std::size_t>(kElementSlots)) {
        return ErrorCode::kInvalidRecordFormat;
    }
    for (const auto& element : elements) {
        if (element.second < 1 || element.second > kMaxElementCount) {
            return ErrorCode::kInvalidRecordFormat;
        }
    }

    std::string result;
    std::ostringstream line;

    // Line 1: header
    line << std::left << std::setw(kHeaderWidth) << name.substr(0, kNameWidth);
    std::vector<std::string> order = hillOrder(elements);
    for (int slot = 0; slot < kElementSlots; ++slot) {
        if (slot < static_cast<int>(order.size())) {
            line << std::left << std::setw(2) << order[slot]
                 << std::right << std::setw(3) << elements.at(order[slot]);
        } else {
            line << "     ";
        }
    }
    line << 'G' << std::right << std::fixed << std::setprecision(3)
         << std::setw(10) << model.getTmin() << std::setw(10) << model.getTmax()
         << std::setprecision(2) << std::setw(8) << model.getTmid();
    finishLine(line, 1);
    result += line.str();

    // Lines 2-4: high-range a1..a7 then low-range a1..a7
    std::vector<double> coeffs(model.high.coeffs.begin(), model.high.coeffs.end());
    coeffs.insert(coeffs.end(), model.low.coeffs.begin(), model.low.coeffs.end());
    for (int lineNumber = 2; lineNumber <= 4; ++lineNumber) {
        std::ostringstream coeffLine;
        coeffLine << std::scientific << std::uppercase << std::setprecision(8) << std::right;
        std::size_t first = static_cast<std::size_t>(lineNumber - 2) * 5;
        for (std::size_t i = first; i < first + 5 && i < coeffs.size(); ++i) {
            coeffLine << std::setw(kCoeffWidth) << coeffs[i];
        }
        finishLine(coeffLine, lineNumber);
        result += coeffLine.str();
    }
    entry = result;
    return ErrorCode::kSuccess;
}

int parseChemkinEntry(const std::string& text, std::string& name, NASA& model) {
    std::istringstream in(text);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line) && lines.size() < 4) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    if (lines.size() < 4) {
        return ErrorCode::kInvalidRecordFormat;
    }

    try {
        std::istringstream header(lines[0].substr(0, kHeaderWidth));
        header >> name;
        if (name.empty()) {
            return ErrorCode::kInvalidRecordFormat;
        }

        // Tmin, Tmax, Tmid follow the 4 element slots and the phase letter
        const std::size_t tStart = kHeaderWidth + 5 * kElementSlots + 1;
        double tmin = readField(lines[0], tStart, 10);
        double tmax = readField(lines[0], tStart + 10, 10);
        double tmid = readField(lines[0], tStart + 20, 8);

        std::vector<double> coeffs;
        for (int l = 1; l <= 3; ++l) {
            int count = (l == 3) ? 4 : 5;
            for (int i = 0; i < count; ++i) {
                coeffs.push_back(readField(lines[l], static_cast<std::size_t>(i) * kCoeffWidth,
                                           kCoeffWidth));
            }
        }

        for (int k = 0; k < Constants::kNumNASACoeff; ++k) {
            model.high.coeffs[k] = coeffs[k];
            model.low.coeffs[k] = coeffs[Constants::kNumNASACoeff + k];
        }
        model.low.dTmin = tmin;
        model.low.dTmax = tmid;
        model.high.dTmin = tmid;
        model.high.dTmax = tmax;
    } catch (const std::invalid_argument&) {
        return ErrorCode::kInvalidRecordFormat;
    } catch (const std::out_of_range&) {
        return ErrorCode::kInvalidRecordFormat;
    }
    return model.validate() == 0 ? ErrorCode::kSuccess : ErrorCode::kInvalidRecordFormat;
}

} // namespace Statmech
