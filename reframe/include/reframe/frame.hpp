#pragma once
// ReferenceFrame: a scoped container with its own scale and phase
//
// Holds handles only. The nodes, boundaries and other frames it refers
// to are owned by the FrameGraph; anything that has to reach through a
// handle (normalization, linking, propagation) lives there.

#include "types.hpp"
#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace reframe {

class ReferenceFrame {
public:
    ReferenceFrame() = default;

    ReferenceFrame(std::string id, std::optional<NodeId> origin,
                   double scale = 1.0, double phase_offset = 0.0)
        : id_(std::move(id)), origin_(origin), scale_(scale), phase_offset_(phase_offset) {}

    const std::string& id() const { return id_; }
    std::optional<NodeId> origin() const { return origin_; }

    double scale() const { return scale_; }
    double phase_offset() const { return phase_offset_; }
    void set_scale(double s) { scale_ = s; }
    void set_phase_offset(double p) { phase_offset_ = p; }

    const std::vector<NodeId>& nodes() const { return nodes_; }
    const std::vector<BoundaryId>& boundaries() const { return boundaries_; }
    const std::vector<FrameId>& peers() const { return peers_; }
    const std::vector<FrameId>& sub_frames() const { return sub_frames_; }

    // Append-only, duplicates allowed
    void add_node(NodeId node) { nodes_.push_back(node); }
    void add_boundary(BoundaryId boundary) { boundaries_.push_back(boundary); }
    void add_sub_frame(FrameId sub) { sub_frames_.push_back(sub); }

    bool has_peer(FrameId other) const {
        return std::find(peers_.begin(), peers_.end(), other) != peers_.end();
    }

    // One side of a peer edge. Returns false if already present.
    bool add_peer(FrameId other) {
        if (has_peer(other)) return false;
        peers_.push_back(other);
        return true;
    }

    // Scale and phase shift, no node access
    void damp(double factor, double phase_delta) {
        scale_ *= factor;
        phase_offset_ += phase_delta;
    }

    std::string render() const {
        return "Frame(" + id_
             + ", scale=" + fixed3(scale_)
             + ", phase=" + fixed3(phase_offset_)
             + ", nodes=" + std::to_string(nodes_.size())
             + ", boundaries=" + std::to_string(boundaries_.size())
             + ", peers=" + std::to_string(peers_.size())
             + ", sub_frames=" + std::to_string(sub_frames_.size()) + ")";
    }

private:
    std::string id_;
    std::optional<NodeId> origin_;
    double scale_ = 1.0;
    double phase_offset_ = 0.0;
    std::vector<NodeId> nodes_;
    std::vector<BoundaryId> boundaries_;
    std::vector<FrameId> peers_;       // symmetric, insertion ordered
    std::vector<FrameId> sub_frames_;  // nesting edges
};

} // namespace reframe
