#include <gtest/gtest.h>
#include "plan_report.hpp"
#include "plan_assembler.hpp"

namespace {

std::vector<Order> sample_orders() {
    return {
        {30, 5},
        {40, 3},
        {50, 6},
        {20, 2}
    };
}

} // namespace

TEST(PlanReportTest, BeforeAndAfterTables) {
    std::vector<Coil> coils = {{100, 1000}, {0, 800}};
    auto plan = PlanAssembler::assemble(coils, sample_orders());

    std::string expected =
        "Patterns Before Shear Adjustment\n"
        "Coil (Width(mm), Length(mm))\tPattern\n"
        "(100, 1000)\t30 50 20\n"
        "(0, 800)\t\n"
        "\n"
        "Patterns After Shear Adjustment\n"
        "Coil (Width(mm), Length(mm))\tPattern\n"
        "(100, 1000)\t20 30 50\n"
        "(0, 800)\t\n";

    EXPECT_EQ(PlanReport::tables(plan, coils), expected);
}

TEST(PlanReportTest, FailedSlotShowsMessage) {
    std::vector<Coil> coils = {{-5, 1000}};
    auto plan = PlanAssembler::assemble(coils, sample_orders());

    auto text = PlanReport::tables(plan, coils);

    EXPECT_NE(text.find("(-5, 1000)\tFAILED: Coil width must not be negative"), std::string::npos);
}

TEST(PlanReportTest, ExitCodeOk) {
    auto plan = PlanAssembler::assemble({{100, 1000}}, sample_orders());
    EXPECT_EQ(PlanReport::exit_code(plan), PlanReport::EXIT_OK);
    EXPECT_EQ(PlanReport::EXIT_OK, 0);
}

TEST(PlanReportTest, ExitCodeForFailedCoil) {
    auto plan = PlanAssembler::assemble({{100, 1000}, {-1, 1000}}, sample_orders());
    EXPECT_EQ(PlanReport::exit_code(plan), PlanReport::EXIT_PARTIAL);
    EXPECT_EQ(PlanReport::EXIT_PARTIAL, 2);
}

TEST(PlanReportTest, ExitCodeForRejectedOrder) {
    std::vector<Order> orders = sample_orders();
    orders.push_back({0, 10});

    auto plan = PlanAssembler::assemble({{100, 1000}}, orders);

    EXPECT_EQ(plan.status(), PlanStatus::OK);
    EXPECT_EQ(PlanReport::exit_code(plan), PlanReport::EXIT_PARTIAL);
}
