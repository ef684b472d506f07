#include <catch2/catch_test_macros.hpp>

#include "grid_fixtures.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace phasegrid::v1;
using namespace phasegrid::v1::testing;

TEST_CASE("Diagnostic log stores every entry", "[diagnostics]") {
    std::vector<std::string> forwarded;
    DiagnosticLog log([&](const Diagnostic& d) { forwarded.push_back(d.code); },
                      DiagnosticSeverity::Warning);

    log.debug("D1", "", "debug detail");
    log.info(diag::kIndexSummary, "grid", "summary");
    log.warning(diag::kFloatingNode, "n7", "Phase 2 of node 'n7' has no admittance entry");

    CHECK(log.entries().size() == 3);
    CHECK(log.count(DiagnosticSeverity::Info) == 1);
    CHECK(log.count(diag::kFloatingNode) == 1);
    REQUIRE(forwarded.size() == 1);
    CHECK(forwarded.front() == diag::kFloatingNode);

    const auto warnings = log.warnings();
    REQUIRE(warnings.size() == 1);
    CHECK(warnings.front() == "[" + std::string(diag::kFloatingNode) +
                                  "] Phase 2 of node 'n7' has no admittance entry");

    log.clear();
    CHECK(log.entries().empty());
}

TEST_CASE("Diagnostic rendering", "[diagnostics]") {
    const Diagnostic d{DiagnosticSeverity::Warning, "CODE", "load_1", "message"};
    CHECK(d.to_string() == "warning [CODE] message (load_1)");

    const Diagnostic grid_level{DiagnosticSeverity::Info, "CODE", "", "message"};
    CHECK(grid_level.to_string() == "info [CODE] message");
}

TEST_CASE("Configuration errors carry code and element", "[diagnostics]") {
    const ConfigurationError error(diag::kNodeUnknown, "line_9", "Unknown node 'x'");
    CHECK(error.code() == diag::kNodeUnknown);
    CHECK(error.element() == "line_9");
    CHECK(std::string(error.what()) == "[" + std::string(diag::kNodeUnknown) + "] Unknown node 'x'");
}

TEST_CASE("Phase connection helpers", "[grid_data]") {
    CHECK(kPhases13.count() == 2);
    CHECK(kNoPhase.empty());
    CHECK(kPhases13.phases() == std::vector<Phase>{Phase::One, Phase::Three});
    CHECK(kPhase2.is_subset_of(kPhases23));
    CHECK_FALSE(kPhases12.is_subset_of(kPhases13));
    CHECK(PhaseConnection::all() == kThreePhase);
}

TEST_CASE("Grid data lookups", "[grid_data]") {
    const ElectricGridData data = mixed_grid();

    REQUIRE(data.find_node("n2") != nullptr);
    CHECK(data.find_node("n2")->phases == kPhase2);
    CHECK(data.find_node("ghost") == nullptr);
    CHECK(data.find_line_type("one_phase") != nullptr);
    CHECK(data.find_transformer_type("trafo_type") != nullptr);
    CHECK(data.transformer_windings("trafo_1").size() == 2);
    CHECK(data.one_winding_transformers().size() == 1);

    CHECK(parse_connection_type("Delta") == ConnectionType::Delta);
    CHECK(parse_connection_type("star") == ConnectionType::Wye);
    CHECK_FALSE(parse_connection_type("zigzag").has_value());
}

TEST_CASE("Line type from flattened vectors", "[grid_data]") {
    const LineType type = LineType::from_flat("t", 2, {1.0, 2.0, 3.0}, {0.1, 0.2, 0.3}, {0.0, 0.0, 0.0});
    REQUIRE(type.entries.size() == 3);
    CHECK(type.entries[1].row == 2);
    CHECK(type.entries[1].col == 1);
    CHECK(type.entries[1].r == 2.0);

    CHECK_THROWS_AS((LineType::from_flat("t", 4, {}, {}, {})), std::invalid_argument);
    CHECK_THROWS_AS((LineType::from_flat("t", 2, {1.0}, {1.0}, {1.0})), std::invalid_argument);
}
