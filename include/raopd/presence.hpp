#pragma once

#include <set>
#include <string>
#include <vector>

#include "raopd/concurrency.hpp"
#include "raopd/model.hpp"
#include "raopd/options.hpp"
#include "raopd/resolver.hpp"

namespace raopd {

struct ReconcileReport {
    std::vector<CandidateHost> added;
    std::vector<CandidateHost> removed;
};

// Stable view of advertised hosts with retry-count hysteresis.
// A host missing from a cycle loses one retry; it is dropped (and reported
// removed) on the first absent cycle after its budget reached zero.
// Any sighting resets the budget.
class PresenceTracker {
public:
    explicit PresenceTracker(int retries);

    ReconcileReport reconcile(const std::vector<CandidateHost> &seen);

    const std::set<CandidateHost> &stable() const { return stable_; }
    int retries() const { return retries_; }

private:
    int retries_;
    std::set<CandidateHost> stable_;
};

std::string to_string(const CandidateHost &h);

// Browse once and reconcile. false when the browse call failed and the
// cycle was abandoned (the tracker is left untouched).
bool run_presence_cycle(Resolver &resolver, PresenceTracker &tracker, const Options &opt);

// Runs until cancel is set (forever when cancel is null).
void run_presence_loop(Resolver &resolver,
                       PresenceTracker &tracker,
                       const Options &opt,
                       const Cancellation *cancel);

} // namespace raopd
