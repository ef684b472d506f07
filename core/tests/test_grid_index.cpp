#include <catch2/catch_test_macros.hpp>

#include "grid_fixtures.hpp"
#include "phasegrid/v1/electric_grid_index.hpp"

#include <algorithm>
#include <functional>
#include <iterator>
#include <string>

using namespace phasegrid::v1;
using namespace phasegrid::v1::testing;

TEST_CASE("Index dimensions count connected phases only", "[index]") {
    const ElectricGridData data = mixed_grid();
    const ElectricGridIndex index(data);

    CHECK(index.node_dimension() == 9);
    CHECK(index.line_dimension() == 3);
    CHECK(index.transformer_dimension() == 3);
    CHECK(index.branch_dimension() == 6);
    CHECK(index.load_dimension() == 3);

    CHECK(static_cast<Index>(index.nodes_phases().size()) == index.node_dimension());
    CHECK(static_cast<Index>(index.branches_phases().size()) == index.branch_dimension());

    int phase_sum = 0;
    for (const auto& node : data.nodes) phase_sum += node.phases.count();
    CHECK(index.node_dimension() == phase_sum);
}

TEST_CASE("Node table is phase-major in declared node order", "[index]") {
    const ElectricGridIndex index(mixed_grid());
    const auto& table = index.nodes_phases();

    REQUIRE(table.size() == 9);
    CHECK(table[0] == NodePhase{"source", Phase::One, NodeType::Source});
    CHECK(table[1] == NodePhase{"n1", Phase::One, NodeType::NoSource});
    CHECK(table[2] == NodePhase{"n3", Phase::One, NodeType::NoSource});
    CHECK(table[3] == NodePhase{"source", Phase::Two, NodeType::Source});
    CHECK(table[4] == NodePhase{"n2", Phase::Two, NodeType::NoSource});
    CHECK(table[5] == NodePhase{"n3", Phase::Two, NodeType::NoSource});
    CHECK(table[6] == NodePhase{"source", Phase::Three, NodeType::Source});
    CHECK(table[7] == NodePhase{"n1", Phase::Three, NodeType::NoSource});
    CHECK(table[8] == NodePhase{"n3", Phase::Three, NodeType::NoSource});
}

TEST_CASE("Node lookups", "[index]") {
    const ElectricGridIndex index(mixed_grid());

    CHECK(index.node_by_node_name().at("source") == positions({0, 3, 6}));
    CHECK(index.node_by_node_name().at("n1") == positions({1, 7}));
    CHECK(index.node_by_node_name().at("n2") == positions({4}));
    CHECK(index.node_by_node_name().at("n3") == positions({2, 5, 8}));

    CHECK(index.node_by_phase().at(Phase::One) == positions({0, 1, 2}));
    CHECK(index.node_by_phase().at(Phase::Two) == positions({3, 4, 5}));
    CHECK(index.node_by_phase().at(Phase::Three) == positions({6, 7, 8}));

    CHECK(index.node_by_node_type().at(NodeType::Source) == positions({0, 3, 6}));
    CHECK(index.node_by_node_type().at(NodeType::NoSource) == positions({1, 2, 4, 5, 7, 8}));

    CHECK(index.node_positions("source", kPhases13) == positions({0, 6}));
    CHECK(index.node_positions("n1", kPhase2).empty());
}

TEST_CASE("Node name and phase lookups are consistent", "[index][property]") {
    const ElectricGridIndex index(mixed_grid());

    for (const auto& name : index.node_names()) {
        for (Phase phase : index.phases()) {
            const PositionList& by_name = index.node_by_node_name().at(name);
            const PositionList& by_phase = index.node_by_phase().at(phase);

            PositionList intersection;
            std::set_intersection(by_name.begin(), by_name.end(), by_phase.begin(), by_phase.end(),
                                  std::back_inserter(intersection));

            PositionList expected;
            for (std::size_t row = 0; row < index.nodes_phases().size(); ++row) {
                const auto& entry = index.nodes_phases()[row];
                if (entry.node_name == name && entry.phase == phase) {
                    expected.push_back(static_cast<Index>(row));
                }
            }
            CHECK(intersection == expected);

            PhaseConnection single;
            single.phase_1 = phase == Phase::One;
            single.phase_2 = phase == Phase::Two;
            single.phase_3 = phase == Phase::Three;
            CHECK(index.node_positions(name, single) == expected);
        }
    }
}

TEST_CASE("Branch lookups keep lines and transformers apart", "[index]") {
    const ElectricGridIndex index(mixed_grid());

    CHECK(index.line_names() == std::vector<std::string>{"line_1", "line_2"});
    CHECK(index.transformer_names() == std::vector<std::string>{"trafo_1"});
    CHECK(index.branch_names() == std::vector<std::string>{"line_1", "line_2", "trafo_1"});

    CHECK(index.branch_by_line_name().at("line_1") == positions({0, 2}));
    CHECK(index.branch_by_line_name().at("line_2") == positions({1}));
    CHECK(index.branch_by_line_name().count("trafo_1") == 0);
    CHECK(index.branch_by_transformer_name().at("trafo_1") == positions({3, 4, 5}));

    CHECK(index.branch_by_phase().at(Phase::One) == positions({0, 3}));
    CHECK(index.branch_by_phase().at(Phase::Two) == positions({1, 4}));
    CHECK(index.branch_by_phase().at(Phase::Three) == positions({2, 5}));

    CHECK(index.branches_phases()[3] == BranchPhase{"trafo_1", Phase::One, BranchType::Transformer});
}

TEST_CASE("Load lookups", "[index]") {
    ElectricGridData data = mixed_grid();
    data.loads.push_back(load("load_unmatched", "n2", kPhase1));
    data.loads.push_back(load("load_unknown_node", "nowhere", kThreePhase));
    const ElectricGridIndex index(data);

    CHECK(index.load_by_load_name().at("load_1") == 0);
    CHECK(index.load_by_load_name().at("load_2") == 1);
    CHECK(index.load_by_load_name().at("load_3") == 2);
    CHECK(index.load("load_unknown_node") == 4);

    CHECK(index.node_by_load_name().at("load_1") == positions({1, 7}));
    CHECK(index.node_by_load_name().at("load_2") == positions({4}));
    CHECK(index.node_by_load_name().at("load_3") == positions({2, 5, 8}));
    CHECK(index.node_by_load_name().at("load_unmatched").empty());
    CHECK(index.node_by_load_name().at("load_unknown_node").empty());
}

TEST_CASE("Zero-phase elements contribute no positions", "[index][edge]") {
    ElectricGridData data = mixed_grid();
    data.nodes.push_back(node("placeholder", kNoPhase));
    data.lines.push_back(line("line_spare", "two_phase", 1.0, "source", "placeholder", kNoPhase));

    DiagnosticLog log;
    const ElectricGridIndex index(data, &log);

    CHECK(index.node_dimension() == 9);
    CHECK(index.branch_dimension() == 6);
    REQUIRE(index.node_by_node_name().count("placeholder") == 1);
    CHECK(index.node_by_node_name().at("placeholder").empty());
    CHECK(index.branch_by_line_name().at("line_spare").empty());
    CHECK(log.count(diag::kZeroPhaseElement) == 2);
    CHECK(log.count(diag::kIndexSummary) == 1);
}

TEST_CASE("Transformer named like a line gets its own lookup", "[index][edge]") {
    ElectricGridData data = mixed_grid();
    for (auto& winding : data.transformers) winding.transformer_name = "line_2";

    DiagnosticLog log;
    const ElectricGridIndex index(data, &log);

    CHECK(index.branch_by_line_name().at("line_2") == positions({1}));
    CHECK(index.branch_by_transformer_name().at("line_2") == positions({3, 4, 5}));
    CHECK(log.count(diag::kNameCollision) == 1);
}

TEST_CASE("Index rejects invalid grid data", "[index][validation]") {
    SECTION("Unknown source node") {
        ElectricGridData data = mixed_grid();
        data.electric_grid.source_node_name = "missing";
        CHECK(throws_with_code([&] { ElectricGridIndex index(data); }, diag::kSourceNode, "missing"));
    }

    SECTION("No source node") {
        ElectricGridData data = mixed_grid();
        data.electric_grid.source_node_name.clear();
        CHECK(throws_with_code([&] { ElectricGridIndex index(data); }, diag::kSourceNode, "mixed"));
    }

    SECTION("Source node without connected phases") {
        ElectricGridData data = mixed_grid();
        data.nodes[0].phases = kNoPhase;
        CHECK(throws_with_code([&] { ElectricGridIndex index(data); }, diag::kSourceNode, "source"));
    }

    SECTION("Duplicate line name") {
        ElectricGridData data = mixed_grid();
        data.lines.push_back(line("line_1", "one_phase", 1.0, "source", "n2", kPhase2));
        CHECK(throws_with_code([&] { ElectricGridIndex index(data); }, diag::kDuplicateName, "line_1"));
    }

    SECTION("Duplicate first winding") {
        ElectricGridData data = mixed_grid();
        data.transformers.push_back(data.transformers[0]);
        CHECK(throws_with_code([&] { ElectricGridIndex index(data); }, diag::kDuplicateName, "trafo_1"));
    }

    SECTION("Transformer without first winding") {
        ElectricGridData data = mixed_grid();
        data.transformers.erase(data.transformers.begin());
        CHECK(throws_with_code([&] { ElectricGridIndex index(data); }, diag::kTransformerWindings, "trafo_1"));
    }

    SECTION("Transformer with a third winding") {
        ElectricGridData data = mixed_grid();
        data.transformers.push_back(data.transformers[1]);
        data.transformers.back().winding = 3;
        CHECK(throws_with_code([&] { ElectricGridIndex index(data); }, diag::kTransformerWindings, "trafo_1"));
    }

    SECTION("Duplicate node name") {
        ElectricGridData data = mixed_grid();
        data.nodes.push_back(node("n2", kPhase1));
        CHECK(throws_with_code([&] { ElectricGridIndex index(data); }, diag::kDuplicateName, "n2"));
    }

    SECTION("Duplicate load name") {
        ElectricGridData data = mixed_grid();
        data.loads.push_back(load("load_1", "n3", kThreePhase));
        CHECK(throws_with_code([&] { ElectricGridIndex index(data); }, diag::kDuplicateName, "load_1"));
    }

    SECTION("Unknown names in lookups") {
        const ElectricGridIndex index(mixed_grid());
        CHECK(throws_with_code([&] { (void)index.node("nowhere"); }, diag::kNodeUnknown, "nowhere"));
        CHECK(throws_with_code([&] { (void)index.line_branch("trafo_1"); }, diag::kElementUnknown, "trafo_1"));
        CHECK(throws_with_code([&] { (void)index.load("nothing"); }, diag::kElementUnknown, "nothing"));
    }
}

TEST_CASE("Index construction is repeatable", "[index][property]") {
    const ElectricGridData data = mixed_grid();
    const ElectricGridIndex first(data);
    const ElectricGridIndex second(data);
    CHECK(first == second);
}
