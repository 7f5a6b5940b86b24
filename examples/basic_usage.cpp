/// Basic usage example for statmech
/// Demonstrates the SpeciesThermo object-oriented API

#include <statmech/SpeciesThermo.hpp>
#include <iomanip>
#include <iostream>

int main(int argc, char* argv[]) {
    const char* filename = (argc > 1) ? argv[1] : "N2H4.yml";

    // Create a SpeciesThermo instance (RAII - automatic cleanup)
    Statmech::SpeciesThermo species;

    int result = species.loadRecord(filename);
    if (result != 0) {
        std::cerr << "Error loading record (code " << result << "): "
                  << species.getErrorMessage() << " " << species.getInfoDetail()
                  << std::endl;
        return 1;
    }

    std::cout << "Record loaded: " << species.getRecord().label << "\n";

    // Fit range and breakpoint search
    species.setTemperatureRange(10.0, 3000.0);
    species.setTmidSearch(true);

    result = species.calculate();

    if (species.isSuccess()) {
        std::cout << "\nFit successful!\n";
        auto [cp, info] = species.getFittedHeatCapacity(500.0);
        if (info == 0) {
            std::cout << "Cp(500 K): " << std::fixed << std::setprecision(3) << cp
                      << " J/mol/K\n";
        }
        std::cout << "\n" << species.getChemkinEntry();

        species.printResults();
    } else {
        std::cerr << "Calculation failed (code " << result << "): "
                  << species.getErrorMessage() << std::endl;
        if (!species.getInfoDetail().empty()) {
            std::cerr << "  " << species.getInfoDetail() << "\n";
        }
        return 1;
    }

    return 0;
}
