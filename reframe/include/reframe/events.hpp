#pragma once
// Events: what the graph reports while it changes
//
// The core never prints. Every state-changing sub-step is handed to an
// injected sink; the caller decides where it goes.

#include <functional>
#include <string>
#include <utility>

namespace reframe {

enum class SourceKind { Frame, Boundary, Scenario };

enum class EventKind {
    Link,                // peer edge added (one per side)
    Adjust,              // frame scale/phase self-adjusted
    Normalize,           // frame nodes scaled
    Propagate,           // acting frame pushed adjustment to a peer
    Receive,             // peer side of a propagation
    DepthLimit,          // nesting traversal stopped at the depth guard
    Perturb,             // boundary coherence reduced
    Seal,                // boundary reset to full coherence
    CoherenceViolation,  // boundary below threshold during a check
    Instability,         // aggregate |state| above threshold
    Divergence,          // aggregate state above cutoff
    Growth               // driver added nodes/frames
};

struct Event {
    SourceKind source_kind = SourceKind::Frame;
    std::string source;   // id of the acting frame/boundary
    EventKind kind = EventKind::Adjust;
    std::string message;
};

using EventSink = std::function<void(const Event&)>;

inline const char* source_kind_name(SourceKind kind) {
    switch (kind) {
        case SourceKind::Frame: return "Frame";
        case SourceKind::Boundary: return "Boundary";
        case SourceKind::Scenario: return "Scenario";
    }
    return "Unknown";
}

inline const char* event_kind_name(EventKind kind) {
    switch (kind) {
        case EventKind::Link: return "link";
        case EventKind::Adjust: return "adjust";
        case EventKind::Normalize: return "normalize";
        case EventKind::Propagate: return "propagate";
        case EventKind::Receive: return "receive";
        case EventKind::DepthLimit: return "depth_limit";
        case EventKind::Perturb: return "perturb";
        case EventKind::Seal: return "seal";
        case EventKind::CoherenceViolation: return "coherence_violation";
        case EventKind::Instability: return "instability";
        case EventKind::Divergence: return "divergence";
        case EventKind::Growth: return "growth";
    }
    return "unknown";
}

// "[Frame F0] message"
inline std::string format_event(const Event& e) {
    return "[" + std::string(source_kind_name(e.source_kind)) + " " + e.source + "] " + e.message;
}

// Adapt a plain message callback; the source prefix is dropped
inline EventSink message_sink(std::function<void(const std::string&)> fn) {
    return [fn = std::move(fn)](const Event& e) { fn(e.message); };
}

// Emit through a possibly-empty sink
inline void emit(const EventSink& sink, SourceKind source_kind, const std::string& source,
                 EventKind kind, std::string message) {
    if (!sink) return;
    sink(Event{source_kind, source, kind, std::move(message)});
}

} // namespace reframe
