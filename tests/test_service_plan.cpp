#include <gtest/gtest.h>
#include <algorithm>
#include <cstdlib>
#include <map>
#include <set>
#include <stdexcept>
#include "service_plan.hpp"
#include "evaluation.hpp"
#include "scenario_generator.hpp"
#include "utils.hpp"

namespace {

int count_operations(const Vehicle& v, StopOperation op) {
    int n = 0;
    for (const Stop& s : v.route) {
        if (s.operation == op) n++;
    }
    return n;
}

int total_transferred(const ServicePlan& plan, int point, const std::string& good, StopOperation op) {
    int total = 0;
    for (const Vehicle& v : plan.vehicles) {
        for (const Stop& s : v.route) {
            if (s.point != point || s.operation != op) continue;
            auto it = s.amounts.find(good);
            if (it != s.amounts.end()) total += it->second;
        }
    }
    return total;
}

void expect_capacity_invariant(const ServicePlan& plan) {
    for (const Vehicle& v : plan.vehicles) {
        for (const Stop& s : v.route) {
            int sum = 0;
            for (const auto& l : s.load_after) {
                EXPECT_GE(l.second, 0) << "veículo " << v.id;
                sum += l.second;
            }
            EXPECT_LE(sum, v.capacity) << "veículo " << v.id;
        }
    }
}

} // namespace

class TwoDeliveriesTest : public ::testing::Test {
protected:
    void SetUp() override {
        warehouse = sc.add_warehouse(50, 50);
        a = sc.add_service_point(20, 50, {{"oranges", 100}});
        b = sc.add_service_point(80, 50, {{"oranges", 50}});
        sc.vehicle_capacities = {1000};
    }

    Scenario sc;
    GA_Params params;
    int warehouse = -1, a = -1, b = -1;
};

TEST_F(TwoDeliveriesTest, InitialLoadIsQuarterOfCapacitySplitAcrossGoods) {
    GoodAmounts initial = calculate_initial_load(1000, sc.good_types, 0.25);
    EXPECT_EQ(initial["oranges"], 83);
    EXPECT_EQ(initial["uranium"], 83);
    EXPECT_EQ(initial["tuna"], 83);

    GoodAmounts none = calculate_initial_load(10, sc.good_types, 0.25);
    EXPECT_EQ(none["oranges"], 0);
}

TEST_F(TwoDeliveriesTest, SingleVehicleServesBothPoints) {
    ServicePlan plan = build_service_plan(sc, {a, b}, {warehouse}, params);

    ASSERT_EQ(plan.vehicles.size(), 1u);
    const Vehicle& v = plan.vehicles[0];
    EXPECT_EQ(v.id, 1);
    EXPECT_EQ(v.assigned_warehouse, warehouse);
    ASSERT_FALSE(v.route.empty());
    EXPECT_EQ(v.route.front().operation, StopOperation::InitialLoad);
    EXPECT_EQ(v.route.front().point, warehouse);

    std::set<int> visited;
    for (const Stop& s : v.route) visited.insert(s.point);
    EXPECT_TRUE(visited.count(a));
    EXPECT_TRUE(visited.count(b));

    EXPECT_EQ(total_transferred(plan, a, "oranges", StopOperation::Delivery), 100);
    EXPECT_EQ(total_transferred(plan, b, "oranges", StopOperation::Delivery), 50);
    EXPECT_EQ(plan.points[a].remaining_demands.at("oranges"), 0);
    EXPECT_EQ(plan.points[b].remaining_demands.at("oranges"), 0);
    EXPECT_EQ(plan.unmet_demand, 0);
    expect_capacity_invariant(plan);
}

TEST_F(TwoDeliveriesTest, ReloadsWhenTheGoodRunsOut) {
    ServicePlan plan = build_service_plan(sc, {a, b}, {warehouse}, params);
    const Vehicle& v = plan.vehicles[0];

    // 83 laranjas da carga inicial, depois duas recargas (17 para 'a', 50 para 'b')
    EXPECT_EQ(count_operations(v, StopOperation::TravelToReload), 2);
    EXPECT_EQ(count_operations(v, StopOperation::ReloadSpecificGood), 2);
    EXPECT_EQ(count_operations(v, StopOperation::Delivery), 3);

    for (const Stop& s : v.route) {
        if (s.operation == StopOperation::ReloadSpecificGood || s.operation == StopOperation::TravelToReload) {
            EXPECT_EQ(s.point, warehouse);
            EXPECT_TRUE(s.is_warehouse);
        }
    }

    // 0 + 30 + 30 + 0 + 30 + 30 + 0 + 30 = 150, mais 30 do retorno de 'b' ao armazém
    EXPECT_NEAR(route_distance(plan, sc), 180.0, 1e-9);
}

TEST_F(TwoDeliveriesTest, SimulationDoesNotTouchScenarioPoints) {
    ServicePlan first = build_service_plan(sc, {a, b}, {warehouse}, params);
    ServicePlan second = build_service_plan(sc, {b, a}, {warehouse}, params);

    EXPECT_EQ(sc.points[a].remaining_demands, sc.points[a].demands);
    EXPECT_EQ(sc.points[b].remaining_demands, sc.points[b].demands);
    EXPECT_EQ(first.unmet_demand, 0);
    EXPECT_EQ(second.unmet_demand, 0);
    EXPECT_EQ(total_transferred(second, a, "oranges", StopOperation::Delivery), 100);
}

TEST_F(TwoDeliveriesTest, RejectsWarehouseInChromosomeAndBadAssignment) {
    EXPECT_THROW(build_service_plan(sc, {a, warehouse}, {warehouse}, params), std::invalid_argument);
    EXPECT_THROW(build_service_plan(sc, {a, b}, {}, params), std::invalid_argument);
}

TEST(PickupSplitTest, PickupIsSplitWithForcedUnloads) {
    Scenario sc;
    int w = sc.add_warehouse(0, 0);
    int p = sc.add_service_point(30, 40, {{"uranium", -80}});
    sc.vehicle_capacities = {50};
    GA_Params params;

    ServicePlan plan = build_service_plan(sc, {p}, {w}, params);
    const Vehicle& v = plan.vehicles[0];

    // 12 unidades de carga inicial: coleta 38 (carga 50), descarrega, coleta 42 (>= 40), descarrega
    EXPECT_EQ(total_transferred(plan, p, "uranium", StopOperation::Pickup), 80);
    EXPECT_EQ(count_operations(v, StopOperation::Pickup), 2);
    EXPECT_EQ(count_operations(v, StopOperation::UnloadIfFull), 2);
    EXPECT_TRUE(plan.points[p].is_fully_serviced());
    EXPECT_EQ(plan.unmet_demand, 0);
    EXPECT_EQ(v.current_total_load(), 0);

    for (const Stop& s : v.route) {
        if (s.operation == StopOperation::UnloadIfFull) {
            EXPECT_EQ(s.point, w);
            int sum = 0;
            for (const auto& l : s.load_after) sum += l.second;
            EXPECT_EQ(sum, 0);
        }
    }
    expect_capacity_invariant(plan);
}

TEST(PickupSplitTest, ClosestVehicleWithRoomPicksUp) {
    Scenario sc;
    int near_w = sc.add_warehouse(0, 0);
    int far_w = sc.add_warehouse(100, 100);
    int p = sc.add_service_point(10, 0, {{"tuna", -10}});
    sc.vehicle_capacities = {100, 100};
    GA_Params params;

    ServicePlan plan = build_service_plan(sc, {p}, {far_w, near_w}, params);
    EXPECT_EQ(count_operations(plan.vehicles[0], StopOperation::Pickup), 0);
    EXPECT_EQ(count_operations(plan.vehicles[1], StopOperation::Pickup), 1);
}

TEST(PickupSplitTest, FallbackPrefersMostFreeCapacity) {
    Scenario sc;
    int near_w = sc.add_warehouse(0, 0);
    int far_w = sc.add_warehouse(100, 100);
    int p = sc.add_service_point(10, 0, {{"tuna", -40}});
    sc.vehicle_capacities = {100, 100};

    std::vector<Vehicle> vehicles;
    vehicles.emplace_back(1, 100, near_w, sc.good_types);
    vehicles.emplace_back(2, 100, far_w, sc.good_types);
    vehicles[0].reload("oranges", 80);  // 20 livres, perto do ponto
    vehicles[1].reload("oranges", 70);  // 30 livres, longe do ponto

    // Nenhum comporta 40: vence o de maior espaço livre, não o mais próximo
    EXPECT_EQ(select_vehicle_for_pickup(vehicles, sc, p, 40), 1);
    // Com espaço para tudo, o mais próximo
    EXPECT_EQ(select_vehicle_for_pickup(vehicles, sc, p, 20), 0);

    vehicles[0].reload("tuna", 20);
    vehicles[1].reload("tuna", 30);
    EXPECT_EQ(select_vehicle_for_pickup(vehicles, sc, p, 1), -1);
}

TEST(UnmetDemandTest, DemandBeyondAnyVehicleIsReported) {
    Scenario sc;
    int w = sc.add_warehouse(0, 0);
    int p = sc.add_service_point(5, 5, {{"oranges", 25}});
    sc.vehicle_capacities = {10};
    GA_Params params;

    ServicePlan plan = build_service_plan(sc, {p}, {w}, params);

    EXPECT_EQ(plan.unmet_demand, 25);
    EXPECT_FALSE(plan.points[p].is_fully_serviced());
    EXPECT_EQ(count_operations(plan.vehicles[0], StopOperation::Delivery), 0);
}

TEST(WarehouseAssignmentTest, ByVehicleIndexIsStable) {
    Scenario_Params sp;
    rng.seed(3);
    Scenario sc = generate_random_scenario(sp);
    GA_Params params;
    params.warehouseAssignment = WarehouseAssignment::ByVehicleIndex;

    std::vector<int> first = draw_warehouse_assignment(sc, params);
    std::vector<int> second = draw_warehouse_assignment(sc, params);
    EXPECT_EQ(first, second);
    ASSERT_EQ(first.size(), sc.vehicle_capacities.size());

    params.warehouseAssignment = WarehouseAssignment::Random;
    std::set<int> warehouses(sc.warehouses.begin(), sc.warehouses.end());
    for (int i = 0; i < 20; ++i) {
        for (int w : draw_warehouse_assignment(sc, params)) {
            EXPECT_TRUE(warehouses.count(w));
        }
    }
}

TEST(RandomScenarioTest, ConservationAndCapacityHold) {
    Scenario_Params sp;
    GA_Params params;
    rng.seed(11);
    Scenario sc = generate_random_scenario(sp);
    ASSERT_NO_THROW(sc.validate());

    for (int trial = 0; trial < 5; ++trial) {
        std::vector<int> order = sc.service_points;
        std::shuffle(order.begin(), order.end(), rng);
        ServicePlan plan = build_service_plan(sc, order, draw_warehouse_assignment(sc, params), params);

        expect_capacity_invariant(plan);

        long remaining = 0;
        for (int idx : sc.service_points) {
            const Point& original = sc.points[idx];
            const Point& after = plan.points[idx];
            for (const auto& d : original.demands) {
                const std::string& good = d.first;
                remaining += std::abs(after.remaining_demands.at(good));
                if (after.remaining_demands.at(good) != 0) continue;

                if (original.type == PointType::Delivery) {
                    EXPECT_EQ(total_transferred(plan, idx, good, StopOperation::Delivery), d.second);
                } else {
                    EXPECT_EQ(total_transferred(plan, idx, good, StopOperation::Pickup), -d.second);
                }
            }
        }
        EXPECT_EQ(plan.unmet_demand, remaining);
    }
}
