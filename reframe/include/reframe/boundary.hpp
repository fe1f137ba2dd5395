#pragma once
// BoundaryLoop: a closure over nodes with a coherence gate
//
// Two states. SEALED until a perturbation drives coherence under the
// threshold, UNSEALED until someone seals it again. Coherence climbing
// back over the threshold on its own does not reseal; auto_reseal() is
// the only conditional way back.

#include "types.hpp"
#include <string>
#include <vector>

namespace reframe {

class BoundaryLoop {
public:
    BoundaryLoop() = default;

    explicit BoundaryLoop(std::string id, double coherence = FULL_COHERENCE)
        : id_(std::move(id)), phase_coherence_(coherence) {}

    const std::string& id() const { return id_; }
    const std::vector<NodeId>& nodes() const { return nodes_; }
    double phase_coherence() const { return phase_coherence_; }
    bool sealed() const { return sealed_; }

    // Enclose a node (no duplicate check)
    void add_node(NodeId node) {
        nodes_.push_back(node);
    }

    // Reduce coherence by amount. Unbounded below; amount is not validated.
    // Returns true if this call unsealed the boundary.
    bool perturb(double amount) {
        phase_coherence_ -= amount;
        if (phase_coherence_ < COHERENCE_THRESHOLD) {
            bool was_sealed = sealed_;
            sealed_ = false;
            return was_sealed;
        }
        return false;
    }

    // Hard reset, whatever the current value
    void seal_boundary() {
        phase_coherence_ = FULL_COHERENCE;
        sealed_ = true;
    }

    // Reseal only if unsealed and coherence has already recovered
    bool auto_reseal() {
        if (!sealed_ && phase_coherence_ >= COHERENCE_THRESHOLD) {
            seal_boundary();
            return true;
        }
        return false;
    }

    bool coherent() const { return phase_coherence_ >= COHERENCE_THRESHOLD; }

    std::string render() const {
        return "Boundary(" + id_ + ", nodes=" + std::to_string(nodes_.size())
             + ", coherence=" + fixed3(phase_coherence_)
             + ", sealed=" + (sealed_ ? "true" : "false") + ")";
    }

private:
    std::string id_;
    std::vector<NodeId> nodes_;
    double phase_coherence_ = FULL_COHERENCE;
    bool sealed_ = true;
};

} // namespace reframe
