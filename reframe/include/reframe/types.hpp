#pragma once
// Core types: the atoms of a frame graph
//
// Nodes carry state. Boundaries carry coherence. Frames carry scale and phase.
// Everything is addressed by a typed index into the graph that owns it.

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <string>
#include <utility>

namespace reframe {

// ═══════════════════════════════════════════════════════════════════════════
// Constants
// ═══════════════════════════════════════════════════════════════════════════

constexpr double PI = 3.14159265358979323846;
constexpr double PHI = 1.61803398874989484820;  // (1 + sqrt(5)) / 2

// Boundary coherence gate for sealed status
constexpr double COHERENCE_THRESHOLD = 0.618;
constexpr double FULL_COHERENCE = 1.0;

// Self-adjustment: shared by frame scale and node state
constexpr double SELF_DAMPING = 0.95;
constexpr double SELF_PHASE_STEP = PI / 180.0;

// Peer propagation: weaker, opposite phase direction
constexpr double PEER_DAMPING = 0.98;
constexpr double PEER_PHASE_STEP = PI / 360.0;

constexpr double DEFAULT_DIVERGENCE_CUTOFF = 100.0;
constexpr size_t DEFAULT_MAX_NESTING_DEPTH = 256;

// ═══════════════════════════════════════════════════════════════════════════
// Handles
// ═══════════════════════════════════════════════════════════════════════════

// Typed index into one of the graph's tables. Tag keeps the kinds apart.
template<typename Tag>
struct Handle {
    static constexpr uint32_t INVALID = std::numeric_limits<uint32_t>::max();

    uint32_t index = INVALID;

    Handle() = default;
    explicit Handle(uint32_t i) : index(i) {}

    bool valid() const { return index != INVALID; }

    bool operator==(const Handle& other) const { return index == other.index; }
    bool operator!=(const Handle& other) const { return index != other.index; }
    bool operator<(const Handle& other) const { return index < other.index; }
};

struct NodeTag {};
struct BoundaryTag {};
struct FrameTag {};

using NodeId = Handle<NodeTag>;
using BoundaryId = Handle<BoundaryTag>;
using FrameId = Handle<FrameTag>;

// ═══════════════════════════════════════════════════════════════════════════
// Utility functions
// ═══════════════════════════════════════════════════════════════════════════

// Fixed 3-decimal rendering used by every render()
inline std::string fixed3(double value) {
    char buf[64];
    snprintf(buf, sizeof(buf), "%.3f", value);
    return buf;
}

inline bool approx_equal(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) <= eps;
}

// ═══════════════════════════════════════════════════════════════════════════
// DistinctionNode
// ═══════════════════════════════════════════════════════════════════════════

// Atomic labeled scalar. Lives in the graph's node table; frames and
// boundaries refer to it by NodeId, never by copy.
struct DistinctionNode {
    std::string label;
    double state = 0.0;

    DistinctionNode() = default;
    DistinctionNode(std::string l, double s) : label(std::move(l)), state(s) {}

    std::string render() const {
        return "Node(" + label + ", state=" + fixed3(state) + ")";
    }
};

} // namespace reframe
