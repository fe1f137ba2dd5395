#pragma once
// Scenario: the driver around a FrameGraph
//
// Seeds the graph, grows it a few nodes per round, knocks boundaries
// every few rounds and runs the three checks. The checks are not all
// read-only: instability triggers self-adjustment of every top-level
// frame as a side effect.

#include "types.hpp"
#include "events.hpp"
#include "graph.hpp"
#include "config.hpp"
#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace reframe {

// Ids created by one grown node
struct GrowthEntry {
    NodeId node;
    FrameId frame;
    BoundaryId boundary;
    FrameId sub_frame;
};

struct GrowthReport {
    std::vector<GrowthEntry> entries;
    size_t links_added = 0;
};

struct RepairReport {
    size_t auto_resealed = 0;
    size_t hard_sealed = 0;
};

// Outcome of one driver round
struct RoundReport {
    uint32_t round = 0;
    size_t grown = 0;
    bool perturbed = false;
    size_t unsealed = 0;
    bool coherent = true;
    RepairReport repair;
    bool stable = true;
    size_t frames_adjusted = 0;
    bool depth_limited = false;
    bool diverged = false;
    double total_state = 0.0;
    double total_abs_state = 0.0;
};

struct Summary {
    size_t nodes = 0;
    size_t frames = 0;
    size_t top_level_frames = 0;
    size_t boundaries = 0;
    size_t sealed = 0;
    size_t peer_links = 0;
    double total_state = 0.0;
    double total_abs_state = 0.0;
    double min_coherence = FULL_COHERENCE;
    std::vector<RoundReport> rounds;
};

class Scenario {
public:
    static constexpr const char* SOURCE = "driver";

    explicit Scenario(ScenarioConfig config = {}, EventSink sink = {})
        : config_(config), sink_(sink), graph_(sink, config.max_nesting_depth) {}

    const ScenarioConfig& config() const { return config_; }
    FrameGraph& graph() { return graph_; }
    const FrameGraph& graph() const { return graph_; }

    // Replaces the sink for driver and graph events alike
    void set_sink(EventSink sink) {
        sink_ = sink;
        graph_.set_sink(std::move(sink));
    }

    bool initialized() const { return root_.has_value(); }
    // Both throw std::bad_optional_access before initialize()
    FrameId root_frame() const { return root_.value(); }
    NodeId shared_node() const { return shared_.value(); }
    uint32_t rounds_run() const { return round_; }
    const AdjustReport& last_repair() const { return last_repair_; }

    // Two nodes (0.0, 0.05), frame F0 at phase pi/phi holding both,
    // boundary B0 at full coherence around both. False if already done.
    bool initialize() {
        if (root_) return false;

        NodeId d0 = graph_.create_node("D0", 0.0);
        NodeId d1 = graph_.create_node("D1", 0.05);

        FrameId f0 = graph_.create_frame("F0", d0, 1.0, PI / PHI);
        graph_.add_node(f0, d0);
        graph_.add_node(f0, d1);

        BoundaryId b0 = graph_.create_boundary("B0", FULL_COHERENCE);
        graph_.add_boundary_node(b0, d0);
        graph_.add_boundary_node(b0, d1);
        graph_.add_boundary(f0, b0);

        root_ = f0;
        shared_ = d1;
        return true;
    }

    // Per new node D<n>: frame F<n> holding it, boundary B<n> around it
    // alone, sub-frame S<n> under F<n> holding D1, and a peer link F0-F<n>.
    GrowthReport grow(size_t k) {
        GrowthReport report;
        if (!root_) initialize();

        for (size_t i = 0; i < k; ++i) {
            std::string suffix = std::to_string(graph_.node_count());

            GrowthEntry entry;
            entry.node = graph_.create_node("D" + suffix, config_.new_node_state);

            entry.frame = graph_.create_frame("F" + suffix, entry.node);
            graph_.add_node(entry.frame, entry.node);

            entry.boundary = graph_.create_boundary("B" + suffix);
            graph_.add_boundary_node(entry.boundary, entry.node);
            graph_.add_boundary(entry.frame, entry.boundary);

            entry.sub_frame = graph_.create_frame("S" + suffix, *shared_);
            graph_.add_node(entry.sub_frame, *shared_);
            graph_.add_sub_frame(entry.frame, entry.sub_frame);

            if (graph_.link_frame(*root_, entry.frame)) report.links_added++;
            report.entries.push_back(entry);
        }

        if (k > 0) {
            emit(sink_, SourceKind::Scenario, SOURCE, EventKind::Growth,
                 "Grew " + std::to_string(k) + " nodes; graph now has "
                 + std::to_string(graph_.node_count()) + " nodes and "
                 + std::to_string(graph_.frame_count()) + " frames");
        }
        return report;
    }

    // Knock every boundary by amount and every node by kick.
    // Returns how many boundaries this unsealed.
    size_t perturb(double amount, double kick = 0.0) {
        size_t unsealed = 0;
        for (size_t i = 0; i < graph_.boundary_count(); ++i) {
            if (graph_.perturb_boundary(BoundaryId(static_cast<uint32_t>(i)), amount)) unsealed++;
        }
        if (kick != 0.0) {
            for (size_t i = 0; i < graph_.node_count(); ++i) {
                graph_.node(NodeId(static_cast<uint32_t>(i))).state += kick;
            }
        }
        return unsealed;
    }

    // True when every boundary is at or above threshold
    bool check_coherence() {
        bool ok = true;
        // By index: the sink may add boundaries while we walk
        for (size_t i = 0; i < graph_.boundary_count(); ++i) {
            const BoundaryLoop& b = graph_.boundary(BoundaryId(static_cast<uint32_t>(i)));
            if (b.coherent()) continue;
            ok = false;
            std::string id = b.id();
            double coherence = b.phase_coherence();
            emit(sink_, SourceKind::Boundary, id, EventKind::CoherenceViolation,
                 "Coherence " + fixed3(coherence) + " below " + fixed3(COHERENCE_THRESHOLD));
        }
        return ok;
    }

    // True when aggregate |state| is within threshold. Otherwise every
    // top-level frame self-adjusts before this returns false.
    bool check_stability(double threshold) {
        last_repair_ = AdjustReport{};
        double magnitude = graph_.total_abs_state();
        if (magnitude <= threshold) return true;

        emit(sink_, SourceKind::Scenario, SOURCE, EventKind::Instability,
             "Aggregate state " + fixed3(magnitude) + " exceeds " + fixed3(threshold)
             + "; adjusting top-level frames");

        for (FrameId f : graph_.top_level_frames()) {
            AdjustReport r = graph_.adjust_parameters_and_normalize_nodes(f);
            last_repair_.frames_adjusted += r.frames_adjusted;
            last_repair_.peers_nudged += r.peers_nudged;
            last_repair_.nodes_normalized += r.nodes_normalized;
            last_repair_.deepest = std::max(last_repair_.deepest, r.deepest);
            last_repair_.depth_limited = last_repair_.depth_limited || r.depth_limited;
        }
        return false;
    }

    bool check_stability() { return check_stability(config_.stability_threshold); }

    // True when the plain sum of states exceeds the cutoff. Report only.
    bool check_divergence() const {
        double sum = graph_.total_state();
        if (sum <= config_.divergence_cutoff) return false;
        emit(sink_, SourceKind::Scenario, SOURCE, EventKind::Divergence,
             "Total state " + fixed3(sum) + " exceeds cutoff " + fixed3(config_.divergence_cutoff));
        return true;
    }

    // auto_reseal first, hard seal whatever is still open
    RepairReport repair_boundaries() {
        RepairReport report;
        for (size_t i = 0; i < graph_.boundary_count(); ++i) {
            BoundaryId b(static_cast<uint32_t>(i));
            const BoundaryLoop& loop = graph_.boundary(b);
            if (loop.sealed() && loop.coherent()) continue;
            if (graph_.auto_reseal(b)) {
                report.auto_resealed++;
            } else {
                graph_.seal_boundary(b);
                report.hard_sealed++;
            }
        }
        return report;
    }

    RoundReport run_round() {
        if (!root_) initialize();

        RoundReport report;
        report.round = ++round_;

        report.grown = grow(config_.growth_per_round).entries.size();

        if (config_.perturb_every > 0 && report.round % config_.perturb_every == 0) {
            report.perturbed = true;
            report.unsealed = perturb(config_.perturb_amount, config_.state_kick);
        }

        report.coherent = check_coherence();
        if (!report.coherent) {
            report.repair = repair_boundaries();
        }

        report.stable = check_stability(config_.stability_threshold);
        report.frames_adjusted = last_repair_.frames_adjusted;
        report.depth_limited = last_repair_.depth_limited;

        report.diverged = check_divergence();
        report.total_state = graph_.total_state();
        report.total_abs_state = graph_.total_abs_state();
        return report;
    }

    Summary run() {
        if (!root_) initialize();
        Summary summary;
        for (uint32_t i = 0; i < config_.rounds; ++i) {
            summary.rounds.push_back(run_round());
        }
        fill_summary(summary);
        return summary;
    }

    Summary summarize() const {
        Summary summary;
        fill_summary(summary);
        return summary;
    }

private:
    void fill_summary(Summary& s) const {
        s.nodes = graph_.node_count();
        s.frames = graph_.frame_count();
        s.top_level_frames = graph_.top_level_frames().size();
        s.boundaries = graph_.boundary_count();
        s.sealed = graph_.sealed_count();
        s.peer_links = graph_.peer_link_count();
        s.total_state = graph_.total_state();
        s.total_abs_state = graph_.total_abs_state();
        const auto& loops = graph_.boundaries();
        s.min_coherence = loops.empty() ? FULL_COHERENCE : loops.front().phase_coherence();
        for (const auto& b : loops) {
            s.min_coherence = std::min(s.min_coherence, b.phase_coherence());
        }
    }

    ScenarioConfig config_;
    EventSink sink_;
    FrameGraph graph_;
    std::optional<FrameId> root_;
    std::optional<NodeId> shared_;
    uint32_t round_ = 0;
    AdjustReport last_repair_;
};

} // namespace reframe
