#include "evaluation.hpp"
#include "service_plan.hpp"
#include <vector>
#include <limits>
#include <exception>
#include <iostream>

using std::vector;

bool is_valid_permutation(const vector<int>& chromosome, const Scenario& sc) {
    if (chromosome.size() != sc.service_points.size()) return false;

    vector<bool> seen(sc.points.size(), false);
    for (int gene : chromosome) {
        if (gene < 0 || gene >= (int)sc.points.size()) return false; // posição vazia ou fora do cenário
        if (sc.points[gene].is_warehouse) return false;
        if (seen[gene]) return false;
        seen[gene] = true;
    }
    // Mesmo tamanho, sem repetição e sem armazéns: cobre todos os pontos de serviço
    return true;
}

double vehicle_distance(const Vehicle& v, const Scenario& sc) {
    if (v.route.empty()) return 0.0;

    double total = 0.0;
    int last = v.assigned_warehouse;
    for (const Stop& stop : v.route) {
        total += sc.dist(last, stop.point);
        last = stop.point;
    }
    // Perna de fechamento até o armazém mais próximo
    total += sc.dist(last, sc.nearest_warehouse(last));
    return total;
}

double route_distance(const ServicePlan& plan, const Scenario& sc) {
    double total = 0.0;
    for (const Vehicle& v : plan.vehicles) {
        total += vehicle_distance(v, sc);
    }
    return total;
}

double calculate_fitness(Individual& ind, const Scenario& sc, const GA_Params& params) {
    const double INF = std::numeric_limits<double>::infinity();

    ind.evaluated = true;
    ind.fitness = INF;
    ind.route_distance = INF;
    ind.unmet_demand = 0;

    if (!is_valid_permutation(ind.chromosome, sc)) {
        return ind.fitness;
    }

    try {
        ind.warehouse_assignment = draw_warehouse_assignment(sc, params);
        ServicePlan plan = build_service_plan(sc, ind.chromosome, ind.warehouse_assignment, params);

        ind.route_distance = route_distance(plan, sc);
        ind.unmet_demand = plan.unmet_demand;
        ind.fitness = ind.route_distance + params.unmetPenalty * (double)plan.unmet_demand;
    } catch (const std::exception&) {
        // Cromossomo que quebra o simulador é tratado como o pior possível
        ind.fitness = INF;
        ind.route_distance = INF;
    }
    return ind.fitness;
}
