#pragma once

#include "Cohort.h"

#include <optional>

class LandmarkBuilder {
public:
    /**
     * @brief Restricts a cohort to subjects still at risk at `landmarkDay` and re-bases time there.
     * @post every subject has original time > landmarkDay and shifted time = original - landmarkDay.
     * @post the event indicator is true only for events inside (0, horizon] when a horizon is given.
     * @throws Prognos::ConfigurationException for a negative or non-finite landmark or horizon.
     */
    static Cohort build(const Cohort& cohort, double landmarkDay, std::optional<double> horizon = std::nullopt);
};
