#undef NDEBUG
#include <reframe/reframe.hpp>
#include <iostream>
#include <cassert>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace reframe;

// Collects every event for ordering checks
struct Recorder {
    std::vector<Event> events;

    EventSink sink() {
        return [this](const Event& e) { events.push_back(e); };
    }

    size_t count(EventKind kind) const {
        size_t n = 0;
        for (const auto& e : events) {
            if (e.kind == kind) n++;
        }
        return n;
    }

    // Index of the first event from source with kind, or -1
    int index_of(const std::string& source, EventKind kind) const {
        for (size_t i = 0; i < events.size(); ++i) {
            if (events[i].source == source && events[i].kind == kind) return static_cast<int>(i);
        }
        return -1;
    }
};

void test_node_render() {
    std::cout << "Testing DistinctionNode render..." << std::endl;

    DistinctionNode n("D1", 0.05);
    assert(n.render() == "Node(D1, state=0.050)");

    DistinctionNode neg("x", -1.23456);
    assert(neg.render() == "Node(x, state=-1.235)");

    std::cout << "  PASS" << std::endl;
}

void test_boundary_perturb() {
    std::cout << "Testing BoundaryLoop perturb..." << std::endl;

    BoundaryLoop b("B0");
    assert(b.sealed());
    assert(b.phase_coherence() == 1.0);

    // Above threshold: linear, still sealed
    bool unsealed = b.perturb(0.25);
    assert(!unsealed);
    assert(approx_equal(b.phase_coherence(), 0.75));
    assert(b.sealed());

    // Below threshold: unsealed
    unsealed = b.perturb(0.25);
    assert(unsealed);
    assert(approx_equal(b.phase_coherence(), 0.5));
    assert(!b.sealed());

    // No lower bound
    b.perturb(2.0);
    assert(approx_equal(b.phase_coherence(), -1.5));
    assert(!b.sealed());

    // Exactly at threshold stays sealed (strict <)
    BoundaryLoop edge("edge", COHERENCE_THRESHOLD);
    edge.perturb(0.0);
    assert(edge.phase_coherence() == COHERENCE_THRESHOLD);
    assert(edge.sealed());

    // Recovery above threshold does not reseal by itself
    BoundaryLoop r("r");
    r.perturb(0.5);
    assert(!r.sealed());
    r.perturb(-0.3);
    assert(approx_equal(r.phase_coherence(), 0.8));
    assert(!r.sealed());

    std::cout << "  PASS" << std::endl;
}

void test_boundary_seal() {
    std::cout << "Testing BoundaryLoop seal/auto_reseal..." << std::endl;

    BoundaryLoop b("B0");
    b.seal_boundary();
    assert(b.phase_coherence() == 1.0 && b.sealed());

    b.perturb(3.0);
    b.seal_boundary();
    assert(b.phase_coherence() == 1.0 && b.sealed());
    b.seal_boundary();
    assert(b.phase_coherence() == 1.0 && b.sealed());

    // Sealed: auto_reseal is a no-op
    BoundaryLoop s("s", 0.9);
    assert(!s.auto_reseal());
    assert(approx_equal(s.phase_coherence(), 0.9));

    // Unsealed and still below threshold: no-op
    BoundaryLoop low("low");
    low.perturb(0.5);
    assert(!low.auto_reseal());
    assert(approx_equal(low.phase_coherence(), 0.5));
    assert(!low.sealed());

    // Unsealed but recovered: reseals at full coherence
    low.perturb(-0.2);
    assert(low.auto_reseal());
    assert(low.phase_coherence() == 1.0);
    assert(low.sealed());

    b.add_node(NodeId(0));
    b.add_node(NodeId(0));
    assert(b.nodes().size() == 2);
    assert(b.render() == "Boundary(B0, nodes=2, coherence=1.000, sealed=true)");

    std::cout << "  PASS" << std::endl;
}

void test_link_symmetric() {
    std::cout << "Testing link_frame symmetry..." << std::endl;

    Recorder rec;
    FrameGraph g(rec.sink());
    FrameId a = g.create_frame("A");
    FrameId b = g.create_frame("B");

    assert(g.link_frame(a, b));
    assert(g.frame(a).peers().size() == 1 && g.frame(a).has_peer(b));
    assert(g.frame(b).peers().size() == 1 && g.frame(b).has_peer(a));
    assert(rec.count(EventKind::Link) == 2);
    assert(rec.index_of("A", EventKind::Link) >= 0);
    assert(rec.index_of("B", EventKind::Link) >= 0);

    // Again, from either side: nothing changes, nothing logged
    assert(!g.link_frame(a, b));
    assert(!g.link_frame(b, a));
    assert(g.frame(a).peers().size() == 1);
    assert(g.frame(b).peers().size() == 1);
    assert(rec.count(EventKind::Link) == 2);
    assert(g.peer_link_count() == 1);

    // Self-link is tolerated and recorded once
    assert(g.link_frame(a, a));
    assert(g.frame(a).peers().size() == 2);
    assert(!g.link_frame(a, a));
    assert(g.peer_link_count() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_adjust_isolated() {
    std::cout << "Testing adjust on an isolated frame..." << std::endl;

    FrameGraph g;
    NodeId n1 = g.create_node("n1", 0.5);
    NodeId n2 = g.create_node("n2", -0.2);
    FrameId f = g.create_frame("F", n1, 2.0, 0.3);
    g.add_node(f, n1);
    g.add_node(f, n2);

    AdjustReport r = g.adjust_parameters_and_normalize_nodes(f);
    assert(r.frames_adjusted == 1);
    assert(r.peers_nudged == 0);
    assert(r.nodes_normalized == 2);
    assert(!r.depth_limited);

    assert(approx_equal(g.frame(f).scale(), 2.0 * 0.95));
    assert(approx_equal(g.frame(f).phase_offset(), 0.3 + PI / 180.0));
    assert(approx_equal(g.node(n1).state, 0.5 * 0.95));
    assert(approx_equal(g.node(n2).state, -0.2 * 0.95));

    std::cout << "  PASS" << std::endl;
}

void test_propagate_one_hop() {
    std::cout << "Testing propagate_adjustment..." << std::endl;

    Recorder rec;
    FrameGraph g(rec.sink());
    NodeId own = g.create_node("own", 1.0);
    NodeId pn = g.create_node("pn", 0.4);
    NodeId far = g.create_node("far", 0.7);
    NodeId deep = g.create_node("deep", 0.9);

    FrameId a = g.create_frame("A", std::nullopt, 1.0, 0.5);
    FrameId b = g.create_frame("B", std::nullopt, 1.0, 0.0);
    FrameId c = g.create_frame("C");      // B's other peer
    FrameId bsub = g.create_frame("Bs");  // B's sub-frame
    g.add_node(a, own);
    g.add_node(b, pn);
    g.add_node(c, far);
    g.add_node(bsub, deep);
    g.add_sub_frame(b, bsub);
    g.link_frame(a, b);
    g.link_frame(b, c);

    size_t hops = g.propagate_adjustment(a);
    assert(hops == 1);

    // Peer damped, shifted backwards, normalized
    assert(approx_equal(g.frame(b).scale(), 0.98));
    assert(approx_equal(g.frame(b).phase_offset(), -PI / 360.0));
    assert(approx_equal(g.node(pn).state, 0.4 * 0.95));

    // Acting frame untouched
    assert(g.frame(a).scale() == 1.0);
    assert(g.frame(a).phase_offset() == 0.5);
    assert(g.node(own).state == 1.0);

    // Exactly one hop
    assert(g.frame(c).scale() == 1.0);
    assert(g.node(far).state == 0.7);
    assert(g.frame(bsub).scale() == 1.0);
    assert(g.node(deep).state == 0.9);

    assert(rec.index_of("A", EventKind::Propagate) >= 0);
    assert(rec.index_of("B", EventKind::Receive) >= 0);

    std::cout << "  PASS" << std::endl;
}

void test_adjust_ordering() {
    std::cout << "Testing adjust ordering (subtree before peers)..." << std::endl;

    Recorder rec;
    FrameGraph g(rec.sink());
    FrameId p = g.create_frame("P");
    FrameId c = g.create_frame("C");
    FrameId q = g.create_frame("Q");
    FrameId r = g.create_frame("R");
    g.add_sub_frame(p, c);
    g.link_frame(p, q);
    g.link_frame(c, r);
    rec.events.clear();

    AdjustReport report = g.adjust_parameters_and_normalize_nodes(p);
    assert(report.frames_adjusted == 2);
    assert(report.peers_nudged == 2);
    assert(report.deepest == 1);

    int p_adjust = rec.index_of("P", EventKind::Adjust);
    int p_norm = rec.index_of("P", EventKind::Normalize);
    int c_adjust = rec.index_of("C", EventKind::Adjust);
    int c_prop = rec.index_of("C", EventKind::Propagate);
    int r_recv = rec.index_of("R", EventKind::Receive);
    int p_prop = rec.index_of("P", EventKind::Propagate);
    int q_recv = rec.index_of("Q", EventKind::Receive);

    assert(p_adjust == 0);
    assert(p_adjust < p_norm && p_norm < c_adjust);
    assert(c_adjust < c_prop && c_prop < r_recv);
    assert(r_recv < p_prop && p_prop < q_recv);

    // Peers only nudged, sub-frame fully adjusted
    assert(approx_equal(g.frame(c).scale(), 0.95));
    assert(approx_equal(g.frame(q).scale(), 0.98));
    assert(approx_equal(g.frame(r).scale(), 0.98));

    std::cout << "  PASS" << std::endl;
}

void test_peer_cycle_terminates() {
    std::cout << "Testing peer cycles terminate..." << std::endl;

    FrameGraph g;
    FrameId a = g.create_frame("A");
    FrameId b = g.create_frame("B");
    FrameId c = g.create_frame("C");
    g.link_frame(a, b);
    g.link_frame(b, c);
    g.link_frame(c, a);
    g.link_frame(a, a);

    AdjustReport r = g.adjust_parameters_and_normalize_nodes(a);
    assert(r.frames_adjusted == 1);
    assert(r.peers_nudged == 3);  // B, C, and A itself
    assert(!r.depth_limited);

    assert(approx_equal(g.frame(a).scale(), 0.95 * 0.98));
    assert(approx_equal(g.frame(b).scale(), 0.98));
    assert(approx_equal(g.frame(c).scale(), 0.98));

    std::cout << "  PASS" << std::endl;
}

void test_nesting_cycle_guard() {
    std::cout << "Testing nesting cycle and depth guard..." << std::endl;

    Recorder rec;
    FrameGraph g(rec.sink(), 3);
    NodeId n = g.create_node("n", 1.0);
    FrameId a = g.create_frame("A");
    FrameId b = g.create_frame("B");
    g.add_node(a, n);
    g.add_sub_frame(a, b);
    g.add_sub_frame(b, a);  // misuse: cycle

    AdjustReport r = g.adjust_parameters_and_normalize_nodes(a);
    assert(r.depth_limited);
    assert(r.frames_adjusted == 2);  // A, B; the edge back to A is cut
    assert(r.deepest == 1);
    assert(rec.count(EventKind::DepthLimit) == 1);
    assert(approx_equal(g.frame(a).scale(), 0.95));
    assert(approx_equal(g.node(n).state, 0.95));

    // Branching self-cycle at the default limit: each frame entered once
    Recorder self_rec;
    FrameGraph loop(self_rec.sink());
    FrameId s = loop.create_frame("S");
    loop.add_sub_frame(s, s);
    loop.add_sub_frame(s, s);
    AdjustReport sr = loop.adjust_parameters_and_normalize_nodes(s);
    assert(sr.depth_limited);
    assert(sr.frames_adjusted == 1);
    assert(sr.deepest == 0);
    assert(self_rec.count(EventKind::DepthLimit) == 2);
    assert(approx_equal(loop.frame(s).scale(), 0.95));

    // An acyclic chain within the limit is not cut
    FrameGraph chain(EventSink{}, 3);
    FrameId prev = chain.create_frame("c0");
    FrameId top = prev;
    for (int i = 1; i <= 3; ++i) {
        FrameId next = chain.create_frame("c" + std::to_string(i));
        chain.add_sub_frame(prev, next);
        prev = next;
    }
    AdjustReport cr = chain.adjust_parameters_and_normalize_nodes(top);
    assert(!cr.depth_limited);
    assert(cr.frames_adjusted == 4);

    std::cout << "  PASS" << std::endl;
}

void test_shared_node() {
    std::cout << "Testing shared node across frames..." << std::endl;

    FrameGraph g;
    NodeId shared = g.create_node("shared", 1.0);
    FrameId a = g.create_frame("A");
    FrameId b = g.create_frame("B");
    g.add_node(a, shared);
    g.add_node(b, shared);
    g.add_sub_frame(a, b);

    g.adjust_parameters_and_normalize_nodes(a);
    assert(approx_equal(g.node(shared).state, 0.95 * 0.95));

    g.normalize_nodes(a, 0.5);
    assert(approx_equal(g.node(shared).state, 0.95 * 0.95 * 0.5));

    // Default factor
    g.normalize_nodes(b);
    assert(approx_equal(g.node(shared).state, 0.95 * 0.95 * 0.5 * 0.95));

    std::cout << "  PASS" << std::endl;
}

void test_sinks() {
    std::cout << "Testing event sinks..." << std::endl;

    // No sink: operations still work, nothing is emitted anywhere
    FrameGraph silent;
    FrameId a = silent.create_frame("A");
    FrameId b = silent.create_frame("B");
    assert(silent.link_frame(a, b));

    // Plain message callback
    std::vector<std::string> messages;
    FrameGraph g(message_sink([&](const std::string& m) { messages.push_back(m); }));
    FrameId x = g.create_frame("X");
    FrameId y = g.create_frame("Y");
    g.link_frame(x, y);
    assert(messages.size() == 2);
    assert(messages[0] == "Linked with Y");
    assert(messages[1] == "Linked with X");

    Event e{SourceKind::Frame, "F0", EventKind::Adjust, "hello"};
    assert(format_event(e) == "[Frame F0] hello");

    std::cout << "  PASS" << std::endl;
}

void test_invalid_handle() {
    std::cout << "Testing invalid handles..." << std::endl;

    FrameGraph g;
    FrameId f = g.create_frame("F");
    bool threw = false;
    try {
        g.add_node(f, NodeId(7));
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);
    assert(g.frame(f).nodes().empty());

    threw = false;
    try {
        g.adjust_parameters_and_normalize_nodes(FrameId());
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_frame_render() {
    std::cout << "Testing ReferenceFrame render..." << std::endl;

    Scenario s;
    s.initialize();
    const FrameGraph& g = s.graph();
    assert(g.frame(s.root_frame()).render() ==
           "Frame(F0, scale=1.000, phase=1.942, nodes=2, boundaries=1, peers=0, sub_frames=0)");

    std::cout << "  PASS" << std::endl;
}

void test_end_to_end() {
    std::cout << "Testing end-to-end perturb/seal..." << std::endl;

    Recorder rec;
    Scenario s(ScenarioConfig{}, rec.sink());
    assert(s.initialize());
    assert(!s.initialize());

    FrameGraph& g = s.graph();
    assert(g.node_count() == 2);
    assert(g.node(NodeId(0)).state == 0.0);
    assert(g.node(NodeId(1)).state == 0.05);
    assert(approx_equal(g.frame(s.root_frame()).phase_offset(), PI / PHI));
    assert(g.boundary_count() == 1);

    BoundaryId b0(0);
    assert(g.boundary(b0).phase_coherence() == 1.0);

    assert(g.perturb_boundary(b0, 0.40));
    assert(approx_equal(g.boundary(b0).phase_coherence(), 0.6));
    assert(!g.boundary(b0).sealed());
    assert(!s.check_coherence());
    assert(rec.count(EventKind::CoherenceViolation) == 1);

    g.seal_boundary(b0);
    assert(g.boundary(b0).phase_coherence() == 1.0);
    assert(g.boundary(b0).sealed());
    assert(s.check_coherence());

    std::cout << "  PASS" << std::endl;
}

void test_growth_counts() {
    std::cout << "Testing scenario growth..." << std::endl;

    Scenario s;
    s.initialize();
    const FrameGraph& g = s.graph();
    size_t frames_before = g.frame_count();
    size_t boundaries_before = g.boundary_count();
    size_t top_before = g.top_level_frames().size();

    const size_t k = 3;
    GrowthReport report = s.grow(k);
    assert(report.entries.size() == k);
    assert(report.links_added == k);

    assert(g.node_count() == 2 + k);
    assert(g.frame_count() == frames_before + 2 * k);  // k frames + k sub-frames
    assert(g.top_level_frames().size() == top_before + k);
    assert(g.boundary_count() == boundaries_before + k);
    assert(g.frame(s.root_frame()).peers().size() == k);
    assert(g.peer_link_count() == k);

    for (const auto& e : report.entries) {
        const ReferenceFrame& f = g.frame(e.frame);
        assert(f.nodes().size() == 1 && f.nodes()[0] == e.node);
        assert(f.boundaries().size() == 1 && f.boundaries()[0] == e.boundary);
        assert(f.peers().size() == 1 && f.peers()[0] == s.root_frame());
        assert(f.sub_frames().size() == 1 && f.sub_frames()[0] == e.sub_frame);

        const BoundaryLoop& b = g.boundary(e.boundary);
        assert(b.nodes().size() == 1 && b.nodes()[0] == e.node);

        const ReferenceFrame& sub = g.frame(e.sub_frame);
        assert(sub.nodes().size() == 1 && sub.nodes()[0] == s.shared_node());
    }

    std::cout << "  PASS" << std::endl;
}

void test_check_stability() {
    std::cout << "Testing check_stability..." << std::endl;

    Recorder rec;
    Scenario s(ScenarioConfig{}, rec.sink());
    s.initialize();
    s.grow(2);
    FrameGraph& g = s.graph();

    double before = g.total_abs_state();
    assert(approx_equal(before, 0.25));

    // Within threshold: read-only
    assert(s.check_stability(10.0));
    assert(g.total_abs_state() == before);
    assert(s.last_repair().frames_adjusted == 0);

    // Over threshold: every top-level frame self-adjusts
    assert(!s.check_stability(0.1));
    assert(rec.count(EventKind::Instability) == 1);
    assert(s.last_repair().frames_adjusted == 5);  // F0, F2+S2, F3+S3
    assert(g.total_abs_state() < before);
    assert(approx_equal(g.frame(s.root_frame()).scale(), 0.95 * 0.98 * 0.98));

    std::cout << "  PASS" << std::endl;
}

void test_check_divergence() {
    std::cout << "Testing check_divergence..." << std::endl;

    ScenarioConfig config;
    config.divergence_cutoff = 0.2;
    Scenario s(config);
    s.initialize();
    assert(!s.check_divergence());
    s.grow(2);  // 0.25
    double sum = s.graph().total_state();
    assert(s.check_divergence());
    assert(s.graph().total_state() == sum);  // no repair

    std::cout << "  PASS" << std::endl;
}

void test_repair_boundaries() {
    std::cout << "Testing repair_boundaries..." << std::endl;

    Scenario s;
    s.initialize();
    s.grow(1);
    FrameGraph& g = s.graph();

    size_t unsealed = s.perturb(0.5, 0.0);
    assert(unsealed == 2);

    // One recovers on its own, the other stays low
    g.perturb_boundary(BoundaryId(1), -0.3);
    RepairReport r = s.repair_boundaries();
    assert(r.auto_resealed == 1);
    assert(r.hard_sealed == 1);
    assert(g.sealed_count() == 2);
    assert(s.check_coherence());

    std::cout << "  PASS" << std::endl;
}

void test_perturb_kick() {
    std::cout << "Testing perturb with state kick..." << std::endl;

    Scenario s;
    s.initialize();
    s.grow(2);
    FrameGraph& g = s.graph();

    std::vector<double> before;
    for (const auto& n : g.nodes()) before.push_back(n.state);

    s.perturb(0.1, 0.05);
    assert(g.nodes().size() == before.size());
    for (size_t i = 0; i < before.size(); ++i) {
        assert(approx_equal(g.node(NodeId(static_cast<uint32_t>(i))).state, before[i] + 0.05));
    }

    // A round whose kick pushes the graph over the stability threshold
    ScenarioConfig config;
    config.growth_per_round = 2;
    config.perturb_every = 1;
    config.state_kick = 0.5;
    config.stability_threshold = 0.5;
    Scenario kicked(config);
    RoundReport r = kicked.run_round();
    assert(r.perturbed);
    assert(!r.coherent);
    assert(!r.stable);
    assert(r.frames_adjusted == 5);  // F0, F2+S2, F3+S3
    assert(r.total_abs_state > 0.0);
    assert(r.total_abs_state < 2.25);  // 0.5 + 0.55 + 0.6 + 0.6 before damping

    std::cout << "  PASS" << std::endl;
}

void test_coherence_check_with_growing_sink() {
    std::cout << "Testing coherence check while sink adds boundaries..." << std::endl;

    Scenario s;
    s.initialize();
    s.grow(2);
    s.perturb(0.5);
    assert(s.graph().boundary_count() == 3);

    size_t violations = 0;
    s.set_sink([&](const Event& e) {
        if (e.kind != EventKind::CoherenceViolation) return;
        violations++;
        s.graph().create_boundary("X" + std::to_string(violations));
    });

    assert(!s.check_coherence());
    assert(violations == 3);
    assert(s.graph().boundary_count() == 6);
    for (size_t i = 3; i < 6; ++i) {
        assert(s.graph().boundary(BoundaryId(static_cast<uint32_t>(i))).coherent());
    }

    std::cout << "  PASS" << std::endl;
}

void test_scenario_set_sink() {
    std::cout << "Testing scenario set_sink..." << std::endl;

    Recorder rec;
    Scenario s;
    s.initialize();
    s.set_sink(rec.sink());
    s.grow(1);

    assert(rec.count(EventKind::Link) == 2);    // from the graph
    assert(rec.count(EventKind::Growth) == 1);  // from the driver
    assert(rec.index_of("F0", EventKind::Link) < rec.index_of(Scenario::SOURCE, EventKind::Growth));

    // Clearing it silences both
    s.set_sink(EventSink{});
    s.grow(1);
    assert(rec.count(EventKind::Link) == 2);
    assert(rec.count(EventKind::Growth) == 1);

    std::cout << "  PASS" << std::endl;
}

void test_uninitialized_scenario() {
    std::cout << "Testing scenario accessors before initialize..." << std::endl;

    Scenario s;
    assert(!s.initialized());
    bool threw = false;
    try {
        s.root_frame();
    } catch (const std::bad_optional_access&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        s.shared_node();
    } catch (const std::bad_optional_access&) {
        threw = true;
    }
    assert(threw);

    s.initialize();
    assert(s.graph().frame(s.root_frame()).id() == "F0");
    assert(s.graph().node(s.shared_node()).label == "D1");

    std::cout << "  PASS" << std::endl;
}

void test_scenario_run() {
    std::cout << "Testing scenario run..." << std::endl;

    ScenarioConfig config;
    config.rounds = 4;
    config.growth_per_round = 2;
    config.perturb_every = 2;
    config.perturb_amount = 0.40;
    config.state_kick = 0.0;
    config.stability_threshold = 1000.0;
    Scenario s(config);
    Summary summary = s.run();

    assert(summary.rounds.size() == 4);
    assert(summary.nodes == 2 + 4 * 2);
    assert(summary.boundaries == 1 + 4 * 2);
    assert(summary.frames == 1 + 2 * 4 * 2);
    assert(summary.top_level_frames == 1 + 4 * 2);
    assert(summary.peer_links == 4 * 2);
    assert(summary.sealed == summary.boundaries);
    assert(summary.min_coherence == 1.0);

    assert(!summary.rounds[0].perturbed && summary.rounds[0].coherent);
    assert(summary.rounds[1].perturbed);
    assert(summary.rounds[1].unsealed == 5);
    assert(!summary.rounds[1].coherent);
    assert(summary.rounds[1].repair.hard_sealed == 5);
    assert(summary.rounds[3].perturbed);
    for (const auto& r : summary.rounds) {
        assert(r.stable);
        assert(!r.diverged);
    }

    json j = summary_json(summary, config);
    assert(j["nodes"] == 10);
    assert(j["rounds"].size() == 4);
    assert(j["config"]["rounds"] == 4);
    assert(j["rounds"][1]["hard_sealed"] == 5);

    std::string text = summary_text(summary);
    assert(text.find("Peer links: 8") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_snapshot_json() {
    std::cout << "Testing snapshot JSON..." << std::endl;

    Scenario s;
    s.initialize();
    s.grow(1);
    json j = snapshot_json(s.graph());

    assert(j["nodes"].size() == 3);
    assert(j["frames"].size() == 3);
    assert(j["frames"][0]["id"] == "F0");
    assert(j["frames"][0]["origin"] == "D0");
    assert(j["frames"][0]["peers"][0] == "F2");
    assert(j["frames"][1]["sub_frames"][0] == "S2");
    assert(j["frames"][2]["nodes"][0] == "D1");
    assert(j["boundaries"][1]["nodes"][0] == "D2");

    std::cout << "  PASS" << std::endl;
}

void test_config() {
    std::cout << "Testing config parsing..." << std::endl;

    ScenarioConfig c;
    std::string error;
    assert(parse_config(R"({"version": "1.0", "rounds": 3, "perturb_amount": 0.5, "extra": true})", c, error));
    assert(c.rounds == 3);
    assert(c.perturb_amount == 0.5);
    assert(c.growth_per_round == 2);  // default kept

    ScenarioConfig untouched;
    assert(!parse_config(R"({"rounds": -1})", untouched, error));
    assert(error.find("rounds") != std::string::npos);
    assert(untouched.rounds == 5);

    // Counts must fit in 32 bits
    assert(!parse_config(R"({"rounds": 4294967296})", untouched, error));
    assert(error.find("rounds") != std::string::npos);
    assert(error.find("at most 4294967295") != std::string::npos);
    assert(!parse_config(R"({"growth_per_round": 4294967297})", untouched, error));
    assert(!parse_config(R"({"perturb_every": 18446744073709551615})", untouched, error));
    assert(untouched.rounds == 5 && untouched.growth_per_round == 2 && untouched.perturb_every == 2);
    ScenarioConfig widest;
    assert(parse_config(R"({"rounds": 4294967295, "max_nesting_depth": 4294967295})", widest, error));
    assert(widest.rounds == 4294967295u);
    assert(widest.max_nesting_depth == 4294967295u);

    assert(!parse_config(R"({"perturb_amount": "big"})", untouched, error));
    assert(!parse_config("{not json", untouched, error));
    assert(error.find("malformed") != std::string::npos);
    assert(!parse_config("[1, 2]", untouched, error));
    assert(!parse_config(R"({"version": "2.0"})", untouched, error));
    assert(!load_config("/nonexistent/reframe.json", untouched, error));

    // Emitted config reads back
    ScenarioConfig copy;
    json j = c;
    assert(config_from_json(j, copy, error));
    assert(copy.rounds == 3 && copy.perturb_amount == 0.5);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== reframe Tests ===" << std::endl;
    std::cout << "version = " << REFRAME_VERSION << std::endl;
    std::cout << std::endl;

    test_node_render();
    test_boundary_perturb();
    test_boundary_seal();
    test_link_symmetric();
    test_adjust_isolated();
    test_propagate_one_hop();
    test_adjust_ordering();
    test_peer_cycle_terminates();
    test_nesting_cycle_guard();
    test_shared_node();
    test_sinks();
    test_invalid_handle();
    test_frame_render();

    std::cout << std::endl;
    std::cout << "=== Scenario Tests ===" << std::endl;
    test_end_to_end();
    test_growth_counts();
    test_check_stability();
    test_check_divergence();
    test_repair_boundaries();
    test_perturb_kick();
    test_coherence_check_with_growing_sink();
    test_scenario_set_sink();
    test_uninitialized_scenario();
    test_scenario_run();
    test_snapshot_json();
    test_config();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
