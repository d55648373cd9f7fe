// modules/reducer/reducer.h
#ifndef LOOM_MODULES_REDUCER_REDUCER_H
#define LOOM_MODULES_REDUCER_REDUCER_H

#include "core/types/run_state.h"
#include "common/config/loom_config.h"
#include <optional>
#include <string>
#include <vector>

namespace loom {

struct ReduceRequest {
    RunId run_id;
    std::string plan_hash;
    std::vector<NodeId> order;          // dependency-then-id order of the executed graph
    std::vector<NodeId> superseded;     // replaced by a re-plan; never decide the outcome
    int replans = 0;
    bool cancelled = false;
    std::optional<Error> terminating_error;
};

// run state + node results -> RunSummary
class Reducer {
public:
    explicit Reducer(ReducerConfig config = {}) : config_(config) {}

    RunSummary reduce(const RunState& run_state, const ReduceRequest& request) const;

    // Shallow key-level merge; later writes to a key replace earlier ones
    static void merge_state(Value& target, const Value& updates);

    // One "[id] text" line per node, cut at the character budget with "+N more"
    std::string compose_summary(const std::vector<std::string>& lines) const;

private:
    ReducerConfig config_;
};

} // namespace loom

#endif // LOOM_MODULES_REDUCER_REDUCER_H
