#pragma once

#include <sstream>
#include <string>

namespace SyntheticCohort {

/**
 * @brief Deterministic ICU cohort CSV in the default column layout.
 * @details Subjects with three or more rule points mostly have an event between day 10 and
 *          day 79; the rest are mostly censored beyond day 100, so every horizon up to 90
 *          days after an early landmark has both cases and controls.
 */
inline std::string csv(int subjects = 120) {
    std::ostringstream out;
    out << "patient_id,MELD,SAPS_II,AGE,PLATELETS,HCC,CVVHD,VHF,time_to_event,event\n";
    for (int i = 0; i < subjects; ++i) {
        const int meld = 8 + (i * 7) % 30;
        const int saps = 20 + (i * 11) % 80;
        const int age = 25 + (i * 13) % 50;
        const int platelets = 40 + (i * 17) % 300;
        const bool hcc = i % 5 == 0;
        const bool cvvhd = i % 6 == 0;
        const bool vhf = i % 9 == 0;
        const int points = (meld > 20 ? 2 : 0) + (saps > 42) + (age > 52) + (platelets < 78) + hcc + cvvhd + vhf;
        const bool event = points >= 3 ? (i % 4 != 0) : (i % 5 == 0);
        const int time = event ? 10 + (i * 3) % 70 : 100 + i % 50;

        out << "ICU" << i << "," << meld << ",";
        if (i % 17 == 3) out << "NA"; else out << saps;
        out << "," << age << "," << platelets << "," << hcc << "," << cvvhd << "," << vhf << ","
            << time << "," << (event ? 1 : 0) << "\n";
    }
    return out.str();
}

} // namespace SyntheticCohort
