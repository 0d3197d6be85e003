#include "LandmarkBuilder.h"
#include "PrognosExceptions.h"

#include <cmath>
#include <utility>

Cohort LandmarkBuilder::build(const Cohort& cohort, double landmarkDay, std::optional<double> horizon) {
    if (!std::isfinite(landmarkDay) || landmarkDay < 0.0) {
        throw Prognos::ConfigurationException("landmark day must be a finite value >= 0");
    }
    if (horizon && (!std::isfinite(*horizon) || *horizon <= 0.0)) {
        throw Prognos::ConfigurationException("landmark horizon must be a finite value > 0");
    }

    std::vector<Subject> atRisk;
    atRisk.reserve(cohort.size());
    for (const auto& s : cohort.subjects()) {
        if (!(s.timeToEvent > landmarkDay)) continue;
        Subject shifted = s;
        shifted.timeToEvent = s.timeToEvent - landmarkDay;
        // Guard against a difference that rounds to zero for times a hair above the landmark.
        if (!(shifted.timeToEvent > 0.0)) continue;
        shifted.event = s.event && (!horizon || shifted.timeToEvent <= *horizon);
        atRisk.push_back(std::move(shifted));
    }
    return Cohort(cohort.sharedSchema(), std::move(atRisk), cohort.landmarkDay() + landmarkDay);
}
