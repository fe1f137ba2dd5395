#pragma once
// FrameGraph: where frames live
//
// One arena for nodes, boundaries and frames. Two kinds of edges between
// frames: nesting (owned, walked recursively) and peer links (symmetric,
// walked exactly one hop). Nothing is ever removed; instability is
// corrected by mutating scale, phase and state in place.
//
// Nesting must be acyclic. The traversal tracks the frames on the current
// path: re-entering one of them, or going past max_nesting_depth, stops
// descent there and says so.

#include "types.hpp"
#include "events.hpp"
#include "boundary.hpp"
#include "frame.hpp"
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace reframe {

// Result of one adjust_parameters_and_normalize_nodes call
struct AdjustReport {
    size_t frames_adjusted = 0;
    size_t peers_nudged = 0;       // propagation hops, counting repeats
    size_t nodes_normalized = 0;   // node visits, counting shared nodes twice
    size_t deepest = 0;
    bool depth_limited = false;
};

class FrameGraph {
public:
    FrameGraph() = default;

    explicit FrameGraph(EventSink sink, size_t max_nesting_depth = DEFAULT_MAX_NESTING_DEPTH)
        : sink_(std::move(sink)), max_nesting_depth_(max_nesting_depth) {}

    void set_sink(EventSink sink) { sink_ = std::move(sink); }
    void set_max_nesting_depth(size_t depth) { max_nesting_depth_ = depth; }
    size_t max_nesting_depth() const { return max_nesting_depth_; }

    // ─────────────────────────────────────────────────────────────────────
    // Construction
    // ─────────────────────────────────────────────────────────────────────

    NodeId create_node(std::string label, double state) {
        nodes_.emplace_back(std::move(label), state);
        return NodeId(static_cast<uint32_t>(nodes_.size() - 1));
    }

    BoundaryId create_boundary(std::string id, double coherence = FULL_COHERENCE) {
        boundaries_.emplace_back(std::move(id), coherence);
        return BoundaryId(static_cast<uint32_t>(boundaries_.size() - 1));
    }

    FrameId create_frame(std::string id, std::optional<NodeId> origin = std::nullopt,
                         double scale = 1.0, double phase_offset = 0.0) {
        if (origin) node(*origin);  // range check
        frames_.emplace_back(std::move(id), origin, scale, phase_offset);
        return FrameId(static_cast<uint32_t>(frames_.size() - 1));
    }

    // ─────────────────────────────────────────────────────────────────────
    // Access (std::out_of_range on a handle this graph never issued)
    // ─────────────────────────────────────────────────────────────────────

    DistinctionNode& node(NodeId id) { return nodes_.at(id.index); }
    const DistinctionNode& node(NodeId id) const { return nodes_.at(id.index); }

    BoundaryLoop& boundary(BoundaryId id) { return boundaries_.at(id.index); }
    const BoundaryLoop& boundary(BoundaryId id) const { return boundaries_.at(id.index); }

    ReferenceFrame& frame(FrameId id) { return frames_.at(id.index); }
    const ReferenceFrame& frame(FrameId id) const { return frames_.at(id.index); }

    size_t node_count() const { return nodes_.size(); }
    size_t boundary_count() const { return boundaries_.size(); }
    size_t frame_count() const { return frames_.size(); }

    const std::vector<DistinctionNode>& nodes() const { return nodes_; }
    const std::vector<BoundaryLoop>& boundaries() const { return boundaries_; }
    const std::vector<ReferenceFrame>& frames() const { return frames_; }

    // Lookup by label/id (first match; labels are not unique)
    std::optional<FrameId> find_frame(const std::string& id) const {
        for (size_t i = 0; i < frames_.size(); ++i) {
            if (frames_[i].id() == id) return FrameId(static_cast<uint32_t>(i));
        }
        return std::nullopt;
    }

    std::optional<NodeId> find_node(const std::string& label) const {
        for (size_t i = 0; i < nodes_.size(); ++i) {
            if (nodes_[i].label == label) return NodeId(static_cast<uint32_t>(i));
        }
        return std::nullopt;
    }

    // ─────────────────────────────────────────────────────────────────────
    // Mutators
    // ─────────────────────────────────────────────────────────────────────

    void add_node(FrameId f, NodeId n) {
        node(n);
        frame(f).add_node(n);
    }

    void add_boundary(FrameId f, BoundaryId b) {
        boundary(b);
        frame(f).add_boundary(b);
    }

    void add_boundary_node(BoundaryId b, NodeId n) {
        node(n);
        boundary(b).add_node(n);
    }

    void add_sub_frame(FrameId parent, FrameId sub) {
        frame(sub);
        frame(parent).add_sub_frame(sub);
    }

    // Symmetric, idempotent. Returns false if the pair was already linked.
    bool link_frame(FrameId a, FrameId b) {
        ReferenceFrame& fa = frame(a);
        ReferenceFrame& fb = frame(b);
        if (!fa.add_peer(b)) return false;
        fb.add_peer(a);  // no-op for a self-link

        std::string a_id = fa.id();
        std::string b_id = fb.id();
        emit(sink_, SourceKind::Frame, a_id, EventKind::Link, "Linked with " + b_id);
        emit(sink_, SourceKind::Frame, b_id, EventKind::Link, "Linked with " + a_id);
        return true;
    }

    // ─────────────────────────────────────────────────────────────────────
    // Self-adjustment and propagation
    // ─────────────────────────────────────────────────────────────────────

    // Damp this frame, its nodes, then each sub-frame's whole subtree.
    // Each frame nudges its own peers right after its subtree is done.
    AdjustReport adjust_parameters_and_normalize_nodes(FrameId f) {
        AdjustReport report;
        std::unordered_set<uint32_t> path;
        adjust_recursive(f, 0, path, report);
        return report;
    }

    // One hop: peers are damped and normalized, their sub-frames and
    // their own peers are not touched. Returns the number of peers.
    size_t propagate_adjustment(FrameId f) {
        AdjustReport report;
        propagate(f, report);
        return report.peers_nudged;
    }

    // Scale every node this frame holds. Returns nodes visited.
    size_t normalize_nodes(FrameId f, double factor = SELF_DAMPING) {
        const ReferenceFrame& fr = frame(f);
        size_t count = fr.nodes().size();
        for (NodeId n : fr.nodes()) {
            node(n).state *= factor;
        }
        frame_event(fr, EventKind::Normalize,
                    "Normalized " + std::to_string(count) + " nodes by factor " + fixed3(factor));
        return count;
    }

    // ─────────────────────────────────────────────────────────────────────
    // Boundary triggers (event-reporting wrappers over BoundaryLoop)
    // ─────────────────────────────────────────────────────────────────────

    bool perturb_boundary(BoundaryId b, double amount) {
        BoundaryLoop& loop = boundary(b);
        bool unsealed = loop.perturb(amount);
        std::string msg = "Perturbed by " + fixed3(amount)
                        + ", coherence now " + fixed3(loop.phase_coherence());
        if (unsealed) msg += " (unsealed)";
        emit(sink_, SourceKind::Boundary, loop.id(), EventKind::Perturb, std::move(msg));
        return unsealed;
    }

    void seal_boundary(BoundaryId b) {
        BoundaryLoop& loop = boundary(b);
        loop.seal_boundary();
        emit(sink_, SourceKind::Boundary, loop.id(), EventKind::Seal, "Sealed at full coherence");
    }

    bool auto_reseal(BoundaryId b) {
        BoundaryLoop& loop = boundary(b);
        if (!loop.auto_reseal()) return false;
        emit(sink_, SourceKind::Boundary, loop.id(), EventKind::Seal, "Auto-resealed");
        return true;
    }

    // ─────────────────────────────────────────────────────────────────────
    // Aggregates
    // ─────────────────────────────────────────────────────────────────────

    // Frames that are nobody's sub-frame, in creation order
    std::vector<FrameId> top_level_frames() const {
        std::unordered_set<uint32_t> nested;
        for (const auto& fr : frames_) {
            for (FrameId sub : fr.sub_frames()) nested.insert(sub.index);
        }
        std::vector<FrameId> result;
        for (size_t i = 0; i < frames_.size(); ++i) {
            if (nested.count(static_cast<uint32_t>(i)) == 0) {
                result.push_back(FrameId(static_cast<uint32_t>(i)));
            }
        }
        return result;
    }

    double total_state() const {
        double sum = 0.0;
        for (const auto& n : nodes_) sum += n.state;
        return sum;
    }

    double total_abs_state() const {
        double sum = 0.0;
        for (const auto& n : nodes_) sum += std::fabs(n.state);
        return sum;
    }

    // Number of symmetric peer pairs (a self-link counts once)
    size_t peer_link_count() const {
        size_t ends = 0;
        size_t self = 0;
        for (size_t i = 0; i < frames_.size(); ++i) {
            ends += frames_[i].peers().size();
            if (frames_[i].has_peer(FrameId(static_cast<uint32_t>(i)))) self++;
        }
        return (ends - self) / 2 + self;
    }

    size_t sealed_count() const {
        size_t count = 0;
        for (const auto& b : boundaries_) {
            if (b.sealed()) count++;
        }
        return count;
    }

private:
    // Sinks may call back into the graph, so no frame reference is held
    // across an emit.
    void adjust_recursive(FrameId f, size_t depth, std::unordered_set<uint32_t>& path,
                          AdjustReport& report) {
        const ReferenceFrame& entered = frame(f);
        if (path.count(f.index) > 0) {
            report.depth_limited = true;
            frame_event(entered, EventKind::DepthLimit,
                        "Nesting cycle back to " + entered.id() + "; not descending");
            return;
        }
        if (depth > max_nesting_depth_) {
            report.depth_limited = true;
            frame_event(entered, EventKind::DepthLimit,
                        "Nesting depth limit " + std::to_string(max_nesting_depth_)
                        + " reached; not descending");
            return;
        }
        if (depth > report.deepest) report.deepest = depth;
        path.insert(f.index);

        ReferenceFrame& fr = frame(f);
        fr.damp(SELF_DAMPING, SELF_PHASE_STEP);
        frame_event(fr, EventKind::Adjust,
                    "Adjusted scale to " + fixed3(fr.scale())
                    + " and phase offset to " + fixed3(fr.phase_offset()));
        report.nodes_normalized += normalize_nodes(f, SELF_DAMPING);
        report.frames_adjusted++;

        std::vector<FrameId> subs = frame(f).sub_frames();
        for (FrameId sub : subs) {
            adjust_recursive(sub, depth + 1, path, report);
        }

        path.erase(f.index);
        propagate(f, report);
    }

    void propagate(FrameId f, AdjustReport& report) {
        std::vector<FrameId> peers = frame(f).peers();
        std::string acting = frame(f).id();
        for (FrameId p : peers) {
            ReferenceFrame& peer = frame(p);
            peer.damp(PEER_DAMPING, -PEER_PHASE_STEP);
            std::string received = "Received adjustment from " + acting
                                 + ": scale=" + fixed3(peer.scale())
                                 + ", phase offset=" + fixed3(peer.phase_offset());
            std::string peer_id = peer.id();

            emit(sink_, SourceKind::Frame, acting, EventKind::Propagate,
                 "Propagated adjustment to " + peer_id);
            emit(sink_, SourceKind::Frame, peer_id, EventKind::Receive, std::move(received));

            report.nodes_normalized += normalize_nodes(p, SELF_DAMPING);
            report.peers_nudged++;
        }
    }

    void frame_event(const ReferenceFrame& fr, EventKind kind, std::string message) const {
        emit(sink_, SourceKind::Frame, fr.id(), kind, std::move(message));
    }

    EventSink sink_;
    size_t max_nesting_depth_ = DEFAULT_MAX_NESTING_DEPTH;
    std::vector<DistinctionNode> nodes_;
    std::vector<BoundaryLoop> boundaries_;
    std::vector<ReferenceFrame> frames_;
};

} // namespace reframe
