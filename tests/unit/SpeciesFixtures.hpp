#pragma once

#include <statmech/models/SpeciesRecord.hpp>

namespace StatmechTest {

using namespace Statmech;

/// Hydrazine torsion: 5-term Fourier series in kJ/mol
inline HinderedRotor makeN2H4Torsion() {
    HinderedRotor rotor;
    rotor.inertia = Quantity(0.8646202553741763, "amu*angstrom^2");
    rotor.symmetry = 1;
    rotor.fourier = Quantity::fromRows(
        {{0.16222862758185147, -12.202719567707382, -0.5684005641621309,
          -0.1593956207311421, 0.48039067463325136},
         {-7.938290746826625, -1.6277540956505094, 3.258060880870518,
          0.6270040035271297, -0.25036265237321}},
        "kJ/mol");
    rotor.treatment = TorsionTreatment::Semiclassical;
    return rotor;
}

inline Conformer makeN2H4Conformer() {
    Conformer conformer;
    conformer.E0 = Quantity(89.66936378637556, "kJ/mol");
    conformer.coordinates = Quantity::fromRows(
        {{0.7033634988, 0.0974820728, -0.073047392},
         {-0.7033634988, -0.0974820728, -0.073047392},
         {1.0539960456, 0.3871635195, 0.8315583036},
         {-1.0539960456, -0.3871635195, 0.8315583036},
         {1.1434808787, -0.7765990298, -0.3202265599},
         {-1.1434808787, 0.7765990298, -0.3202265599}},
        "angstroms");
    conformer.mass = Quantity(std::vector<double>{14.00307400443, 14.00307400443,
                                                  1.00782503224, 1.00782503224,
                                                  1.00782503224, 1.00782503224},
                              "amu");
    conformer.atomicNumbers = {7, 7, 1, 1, 1, 1};

    conformer.modes.push_back(IdealGasTranslation{Quantity(32.03746, "amu")});

    NonlinearRotor rotor;
    rotor.inertia = Quantity(std::vector<double>{3.44830480556223, 20.50117361907408,
                                                 20.513920517329836},
                             "amu*angstrom^2");
    rotor.symmetry = 2;
    conformer.modes.push_back(rotor);

    HarmonicOscillator oscillator;
    oscillator.frequencies = Quantity(
        std::vector<double>{804.702684789345, 944.3708351977593, 1119.46984675033,
                            1272.463775026473, 1302.3239030062555, 1630.6811051177392,
                            1642.2431546205037, 3409.856964259825, 3418.213837435375,
                            3510.5084760011173, 3514.9269546169958},
        "cm^-1");
    conformer.modes.push_back(oscillator);

    conformer.modes.push_back(makeN2H4Torsion());
    return conformer;
}

inline SpeciesRecord makeN2H4Record() {
    SpeciesRecord record;
    record.label = "N2H4";
    record.smiles = "NN";
    record.conformer = makeN2H4Conformer();
    record.frequencyScaleFactor = 0.97;
    record.useHinderedRotors = true;

    SingleExponentialDown transfer;
    transfer.alpha0 = Quantity(3.5886, "kJ/mol");
    transfer.T0 = Quantity(300.0, "K");
    transfer.n = 0.85;
    record.energyTransfer = transfer;
    return record;
}

/// Monatomic ideal gas: translation only
inline Conformer makeAtomConformer(double massAmu) {
    Conformer conformer;
    conformer.E0 = Quantity(0.0, "kJ/mol");
    conformer.modes.push_back(IdealGasTranslation{Quantity(massAmu, "amu")});
    return conformer;
}

} // namespace StatmechTest
