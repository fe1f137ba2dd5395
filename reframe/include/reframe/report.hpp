#pragma once
// Reports: JSON and text views of a graph and a scenario run
//
// Output only. Nothing here is ever parsed back into a graph.

#include "graph.hpp"
#include "scenario.hpp"
#include "version.hpp"
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

namespace reframe {

using json = nlohmann::json;

inline json node_json(const DistinctionNode& n) {
    return {{"label", n.label}, {"state", n.state}};
}

inline json boundary_json(const FrameGraph& g, const BoundaryLoop& b) {
    json nodes = json::array();
    for (NodeId n : b.nodes()) nodes.push_back(g.node(n).label);
    return {
        {"id", b.id()},
        {"coherence", b.phase_coherence()},
        {"sealed", b.sealed()},
        {"nodes", nodes}
    };
}

inline json frame_json(const FrameGraph& g, const ReferenceFrame& f) {
    json nodes = json::array();
    for (NodeId n : f.nodes()) nodes.push_back(g.node(n).label);
    json boundaries = json::array();
    for (BoundaryId b : f.boundaries()) boundaries.push_back(g.boundary(b).id());
    json peers = json::array();
    for (FrameId p : f.peers()) peers.push_back(g.frame(p).id());
    json subs = json::array();
    for (FrameId s : f.sub_frames()) subs.push_back(g.frame(s).id());

    json j = {
        {"id", f.id()},
        {"scale", f.scale()},
        {"phase_offset", f.phase_offset()},
        {"nodes", nodes},
        {"boundaries", boundaries},
        {"peers", peers},
        {"sub_frames", subs}
    };
    j["origin"] = f.origin() ? json(g.node(*f.origin()).label) : json(nullptr);
    return j;
}

// Whole graph, ids resolved to labels
inline json snapshot_json(const FrameGraph& g) {
    json nodes = json::array();
    for (const auto& n : g.nodes()) nodes.push_back(node_json(n));
    json boundaries = json::array();
    for (const auto& b : g.boundaries()) boundaries.push_back(boundary_json(g, b));
    json frames = json::array();
    for (const auto& f : g.frames()) frames.push_back(frame_json(g, f));
    return {{"nodes", nodes}, {"boundaries", boundaries}, {"frames", frames}};
}

inline void to_json(json& j, const RoundReport& r) {
    j = json{
        {"round", r.round},
        {"grown", r.grown},
        {"perturbed", r.perturbed},
        {"unsealed", r.unsealed},
        {"coherent", r.coherent},
        {"auto_resealed", r.repair.auto_resealed},
        {"hard_sealed", r.repair.hard_sealed},
        {"stable", r.stable},
        {"frames_adjusted", r.frames_adjusted},
        {"depth_limited", r.depth_limited},
        {"diverged", r.diverged},
        {"total_state", r.total_state},
        {"total_abs_state", r.total_abs_state}
    };
}

inline json summary_json(const Summary& s, const ScenarioConfig& config) {
    return {
        {"version", REFRAME_VERSION},
        {"config", config},
        {"nodes", s.nodes},
        {"frames", s.frames},
        {"top_level_frames", s.top_level_frames},
        {"boundaries", s.boundaries},
        {"sealed", s.sealed},
        {"peer_links", s.peer_links},
        {"total_state", s.total_state},
        {"total_abs_state", s.total_abs_state},
        {"min_coherence", s.min_coherence},
        {"rounds", s.rounds}
    };
}

inline std::string summary_text(const Summary& s) {
    size_t unstable = 0, incoherent = 0, diverged = 0;
    for (const auto& r : s.rounds) {
        if (!r.stable) unstable++;
        if (!r.coherent) incoherent++;
        if (r.diverged) diverged++;
    }

    std::ostringstream oss;
    oss << "Scenario Summary\n";
    oss << "═══════════════════════════════\n";
    oss << "Rounds:       " << s.rounds.size() << "\n";
    oss << "  Unstable:   " << unstable << "\n";
    oss << "  Incoherent: " << incoherent << "\n";
    oss << "  Diverged:   " << diverged << "\n";
    oss << "\nGraph:\n";
    oss << "  Nodes:      " << s.nodes << "\n";
    oss << "  Frames:     " << s.frames << " (" << s.top_level_frames << " top-level)\n";
    oss << "  Boundaries: " << s.boundaries << " (" << s.sealed << " sealed)\n";
    oss << "  Peer links: " << s.peer_links << "\n";
    oss << "\nState:\n";
    oss << "  Sum:        " << fixed3(s.total_state) << "\n";
    oss << "  Sum |x|:    " << fixed3(s.total_abs_state) << "\n";
    oss << "  Min coherence: " << fixed3(s.min_coherence) << "\n";
    return oss.str();
}

} // namespace reframe
