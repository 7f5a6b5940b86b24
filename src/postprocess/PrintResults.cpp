#include "statmech/Statmech.hpp"
#include "statmech/util/Constants.hpp"
#include <iomanip>
#include <iostream>
#include <vector>

namespace Statmech {

namespace {

void printModeBreakdown(const SpeciesState& species) {
    const PartitionFunctionEvaluator& partition = species.evaluator.getPartitionEvaluator();
    std::vector<PartitionTerms> terms;
    if (partition.evaluateModes(Constants::kStandardTemperature, terms) != 0) {
        return;
    }

    const double T = Constants::kStandardTemperature;
    const double R = Constants::kIdealGasConstant;
    std::cout << "\nMode contributions at " << std::fixed << std::setprecision(2) << T
              << " K:\n";
    std::cout << "  " << std::setw(34) << std::left << "Mode"
              << std::setw(12) << std::right << "ln Q"
              << std::setw(14) << "Cp [J/mol/K]"
              << std::setw(14) << "S [J/mol/K]" << "\n";
    const auto& labels = partition.getModeLabels();
    for (std::size_t i = 0; i < terms.size() && i < labels.size(); ++i) {
        double cp = R * (T * T * terms[i].d2lnQdT2 + 2.0 * T * terms[i].dlnQdT);
        double s = R * (terms[i].lnQ + T * terms[i].dlnQdT);
        std::cout << "  " << std::setw(34) << std::left << labels[i]
                  << std::right << std::fixed << std::setprecision(4)
                  << std::setw(12) << terms[i].lnQ
                  << std::setw(14) << cp
                  << std::setw(14) << s << "\n";
    }
}

void printPolynomial(const char* name, const NASAPolynomial& poly) {
    std::cout << "  " << name << " [" << std::fixed << std::setprecision(2) << poly.dTmin
              << ", " << poly.dTmax << "] K\n    ";
    std::cout << std::scientific << std::setprecision(8);
    for (int k = 0; k < Constants::kNumNASACoeff; ++k) {
        std::cout << std::setw(17) << poly.coeffs[k];
        if (k == 3) {
            std::cout << "\n    ";
        }
    }
    std::cout << "\n";
}

} // namespace

void printResults(const SpeciesContext& ctx) {
    const SpeciesIO& io = *ctx.io;
    const SpeciesState& species = *ctx.species;
    const SpeciesRecord& record = species.record;

    std::cout << "\n";
    std::cout << "========================================\n";
    std::cout << "        STATMECH RESULTS\n";
    std::cout << "========================================\n";

    std::cout << "\nSpecies: " << record.label << "\n";
    if (record.conformer) {
        std::cout << "  Formula:         " << record.conformer->getMolecularFormula() << "\n";
    }
    auto [mw, mwInfo] = record.getMolecularWeight();
    if (mwInfo == 0) {
        std::cout << "  Molecular weight: " << std::fixed << std::setprecision(4) << mw
                  << " amu\n";
    }
    std::cout << "  Status:          " << ErrorCode::getMessage(io.INFOSpecies);
    if (!io.cInfoDetail.empty()) {
        std::cout << " (" << io.cInfoDetail << ")";
    }
    std::cout << "\n";

    if (species.lEvaluatorPrepared) {
        std::cout << "\nE0:    " << std::scientific << std::setprecision(6)
                  << species.evaluator.getE0() << " J/mol\n";
        std::cout << "Cp0:   " << std::fixed << std::setprecision(4)
                  << species.evaluator.getCp0() << " J/mol/K\n";
        std::cout << "CpInf: " << species.evaluator.getCpInf() << " J/mol/K\n";
        if (io.iPrintResultsMode > 1) {
            printModeBreakdown(species);
        }
    }

    if (species.lFitAvailable && record.thermo) {
        std::cout << "\nNASA polynomials:\n";
        printPolynomial("low ", record.thermo->low);
        printPolynomial("high", record.thermo->high);
        std::cout << "  Tmid:       " << std::fixed << std::setprecision(2) << io.dTmidOut
                  << " K\n";
        std::cout << "  Residual:   " << std::scientific << std::setprecision(4)
                  << io.dFitResidual << "\n";
        std::cout << "  Continuity: " << io.dContinuityError << "\n";
        if (io.nFitIterations > 0) {
            std::cout << "  Iterations: " << io.nFitIterations << "\n";
        }

        if (!species.table.heatCapacities.empty()) {
            std::cout << "\nThermo table:\n";
            std::cout << "  H298: " << std::fixed << std::setprecision(3) << io.dH298
                      << " kcal/mol\n";
            std::cout << "  S298: " << io.dS298 << " cal/mol/K\n";
            for (const auto& [T, cp] : species.table.heatCapacities) {
                std::cout << "  Cp(" << std::setw(6) << std::setprecision(0) << T << " K) = "
                          << std::setw(8) << std::setprecision(3) << cp << " cal/mol/K\n";
            }
        }
    }

    std::cout << "\n========================================\n\n";
}

} // namespace Statmech
