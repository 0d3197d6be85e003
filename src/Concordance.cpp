#include "Concordance.h"
#include "PrognosExceptions.h"

#include <algorithm>

namespace {
class FenwickTree {
public:
    explicit FenwickTree(size_t n) : tree_(n + 1, 0) {}

    void add(size_t rank) {
        for (size_t i = rank + 1; i < tree_.size(); i += i & (~i + 1)) tree_[i] += 1;
        ++total_;
    }

    // Number of inserted ranks strictly below `rank`.
    size_t countBelow(size_t rank) const {
        size_t sum = 0;
        for (size_t i = rank; i > 0; i -= i & (~i + 1)) sum += tree_[i];
        return sum;
    }

    size_t countAt(size_t rank) const { return countBelow(rank + 1) - countBelow(rank); }
    size_t total() const { return total_; }

private:
    std::vector<size_t> tree_;
    size_t total_ = 0;
};

struct Observation {
    double time;
    bool event;
    int score;
};
} // namespace

namespace Concordance {

std::optional<ConcordanceResult> harrell(const Cohort& cohort,
                                         const std::vector<std::optional<int>>& scores,
                                         std::optional<double> horizon) {
    if (scores.size() != cohort.size()) {
        throw Prognos::DatasetException("score vector does not match cohort size");
    }

    std::vector<Observation> obs;
    obs.reserve(cohort.size());
    std::vector<int> distinct;
    for (size_t i = 0; i < cohort.size(); ++i) {
        if (!scores[i]) continue;
        const Subject& s = cohort.subject(i);
        Observation o{s.timeToEvent, s.event, *scores[i]};
        if (horizon && o.time > *horizon) {
            o.time = *horizon;
            o.event = false;
        }
        obs.push_back(o);
        distinct.push_back(o.score);
    }
    std::sort(distinct.begin(), distinct.end());
    distinct.erase(std::unique(distinct.begin(), distinct.end()), distinct.end());
    auto rankOf = [&](int score) {
        return static_cast<size_t>(std::lower_bound(distinct.begin(), distinct.end(), score) - distinct.begin());
    };

    std::sort(obs.begin(), obs.end(), [](const Observation& a, const Observation& b) { return a.time > b.time; });

    FenwickTree later(distinct.size());
    ConcordanceResult out;
    size_t i = 0;
    while (i < obs.size()) {
        size_t j = i;
        while (j < obs.size() && obs[j].time == obs[i].time) ++j;

        // Censored subjects at this time count as outliving the events at this time.
        for (size_t k = i; k < j; ++k) {
            if (!obs[k].event) later.add(rankOf(obs[k].score));
        }
        for (size_t k = i; k < j; ++k) {
            if (!obs[k].event) continue;
            const size_t r = rankOf(obs[k].score);
            out.concordant += static_cast<double>(later.countBelow(r));
            out.tied += static_cast<double>(later.countAt(r));
            out.comparable += static_cast<double>(later.total());
        }
        for (size_t k = i; k < j; ++k) {
            if (obs[k].event) later.add(rankOf(obs[k].score));
        }
        i = j;
    }

    if (out.comparable <= 0.0) return std::nullopt;
    out.cIndex = (out.concordant + 0.5 * out.tied) / out.comparable;
    return out;
}

std::optional<double> cIndex(const Cohort& cohort,
                             const std::vector<std::optional<int>>& scores,
                             std::optional<double> horizon) {
    const auto result = harrell(cohort, scores, horizon);
    if (!result) return std::nullopt;
    return result->cIndex;
}

} // namespace Concordance
