#pragma once

namespace Statmech {

/// @brief ln Q and its first two temperature derivatives
/// @details Partition functions of independent modes multiply, so their
/// terms add.
struct PartitionTerms {
    double lnQ = 0.0;
    double dlnQdT = 0.0;        ///< [1/K]
    double d2lnQdT2 = 0.0;      ///< [1/K²]

    PartitionTerms& operator+=(const PartitionTerms& other) {
        lnQ += other.lnQ;
        dlnQdT += other.dlnQdT;
        d2lnQdT2 += other.d2lnQdT2;
        return *this;
    }
};

} // namespace Statmech
