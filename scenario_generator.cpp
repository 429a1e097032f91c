#include "scenario_generator.hpp"
#include "utils.hpp"
#include <utility>
#include <vector>
#include <string>
#include <stdexcept>

void validate_scenario_params(const Scenario_Params& params) {
    if (params.nDeliveries < 0 || params.nPickups < 0)
        throw std::invalid_argument("nDeliveries e nPickups devem ser >= 0");
    if (params.minCoord > params.maxCoord)
        throw std::invalid_argument("minCoord deve ser <= maxCoord");
    if (params.minAmount < 1 || params.minAmount > params.maxAmount)
        throw std::invalid_argument("quantidades devem satisfazer 1 <= minAmount <= maxAmount");
    if (params.vehicleCapacities.empty())
        throw std::invalid_argument("vehicleCapacities não pode ser vazio");
    for (int cap : params.vehicleCapacities) {
        if (cap <= 0)
            throw std::invalid_argument("capacidade de veículo deve ser positiva: " + std::to_string(cap));
    }
}

Scenario generate_random_scenario(const Scenario_Params& params) {
    validate_scenario_params(params);

    Scenario sc;
    sc.vehicle_capacities = params.vehicleCapacities;

    const std::vector<std::pair<int, int>> warehouse_positions = {
        {10, 10}, {90, 10}, {10, 90}, {90, 90}, {50, 50}
    };
    for (const auto& pos : warehouse_positions) {
        sc.add_warehouse(pos.first, pos.second);
    }

    const int nGoods = (int)sc.good_types.size();

    for (int i = 0; i < params.nDeliveries; ++i) {
        int x = randint(params.minCoord, params.maxCoord);
        int y = randint(params.minCoord, params.maxCoord);
        const std::string& good = sc.good_types[randint(0, nGoods - 1)];
        GoodAmounts demands;
        demands[good] = randint(params.minAmount, params.maxAmount);
        sc.add_service_point(x, y, demands);
    }

    for (int i = 0; i < params.nPickups; ++i) {
        int x = randint(params.minCoord, params.maxCoord);
        int y = randint(params.minCoord, params.maxCoord);
        const std::string& good = sc.good_types[randint(0, nGoods - 1)];
        GoodAmounts demands;
        demands[good] = -randint(params.minAmount, params.maxAmount);
        sc.add_service_point(x, y, demands);
    }
    return sc;
}
