/*
 * service_plan.cpp
 *
 * Simulação determinística do plano de serviço (dada a ordem de visita e a
 * atribuição de armazéns). Cada chamada trabalha sobre sua própria cópia
 * dos pontos e sua própria frota.
 */

#include "service_plan.hpp"
#include "utils.hpp"
#include <vector>
#include <limits>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <algorithm>

using std::vector;

std::vector<int> draw_warehouse_assignment(const Scenario& sc, const GA_Params& params) {
    const int nW = (int)sc.warehouses.size();
    vector<int> assignment(sc.vehicle_capacities.size(), -1);
    if (nW == 0) return assignment;

    for (size_t k = 0; k < assignment.size(); ++k) {
        if (params.warehouseAssignment == WarehouseAssignment::Random) {
            assignment[k] = sc.warehouses[randint(0, nW - 1)];
        } else {
            // Hash multiplicativo de Knuth: estável entre execuções e plataformas
            uint32_t h = (uint32_t)(k + 1) * 2654435761u;
            assignment[k] = sc.warehouses[h % (uint32_t)nW];
        }
    }
    return assignment;
}

GoodAmounts calculate_initial_load(int capacity, const std::vector<std::string>& goods, double fraction) {
    GoodAmounts initial;
    for (const auto& g : goods) initial[g] = 0;
    if (goods.empty()) return initial;

    int per_good = (int)(capacity * fraction) / (int)goods.size();
    if (per_good <= 0) return initial;

    for (const auto& g : goods) initial[g] = per_good;
    return initial;
}

int select_vehicle_for_delivery(const vector<Vehicle>& vehicles, const Scenario& sc,
                                int point, const std::string& good, int amount_needed) {
    int best = -1;
    double min_cost = std::numeric_limits<double>::infinity();

    for (size_t k = 0; k < vehicles.size(); ++k) {
        const Vehicle& v = vehicles[k];
        int pos = v.current_position();
        int load = v.load_of(good);

        // Opção 1: veículo já carrega a mercadoria, vai direto
        if (load > 0) {
            double cost = sc.dist(pos, point);
            if (cost < min_cost) {
                min_cost = cost;
                best = (int)k;
            } else if (cost == min_cost && best != -1) {
                int best_load = vehicles[best].load_of(good);
                if (load >= amount_needed && best_load < amount_needed) {
                    best = (int)k;
                } else if (load > best_load && best_load < amount_needed) {
                    best = (int)k;
                }
            }
        }

        // Opção 2: desvio para recarregar no armazém mais próximo
        int load_of_other_goods = v.current_total_load() - load;
        if (v.capacity - load_of_other_goods >= amount_needed) {
            int w = sc.nearest_warehouse(pos);
            if (w < 0) continue;

            double cost_reload_trip = sc.dist(pos, w) + sc.dist(w, point);
            if (cost_reload_trip < min_cost) {
                min_cost = cost_reload_trip;
                best = (int)k;
            }
        }
    }
    return best;
}

int select_vehicle_for_pickup(const vector<Vehicle>& vehicles, const Scenario& sc,
                              int point, int amount_to_pickup) {
    int best = -1;
    double min_cost = std::numeric_limits<double>::infinity();

    for (size_t k = 0; k < vehicles.size(); ++k) {
        if (!vehicles[k].can_pickup(amount_to_pickup)) continue;
        double cost = sc.dist(vehicles[k].current_position(), point);
        if (cost < min_cost) {
            min_cost = cost;
            best = (int)k;
        }
    }
    if (best != -1) return best;

    // Nenhum veículo comporta tudo: o de maior capacidade livre, se levar ao menos 1 unidade
    int max_free = 0;
    for (size_t k = 0; k < vehicles.size(); ++k) {
        int free_capacity = vehicles[k].capacity - vehicles[k].current_total_load();
        if (free_capacity > max_free) {
            max_free = free_capacity;
            best = (int)k;
        }
    }
    return best;
}

static void handle_delivery(vector<Vehicle>& vehicles, vector<Point>& points, const Scenario& sc, int p) {
    vector<std::string> goods;
    for (const auto& d : points[p].remaining_demands) goods.push_back(d.first);

    for (const std::string& good : goods) {
        int needed = points[p].remaining_demands[good];
        if (needed <= 0) continue;

        while (needed > 0) {
            int k = select_vehicle_for_delivery(vehicles, sc, p, good, needed);
            if (k < 0) break; // demanda não atendida

            Vehicle& v = vehicles[k];
            if (v.load_of(good) == 0) {
                int w = sc.nearest_warehouse(v.current_position());
                if (v.route.empty() || v.route.back().point != w) {
                    v.add_stop(points[w], w, GoodAmounts(), StopOperation::TravelToReload);
                }
                GoodAmounts reloaded;
                reloaded[good] = v.reload(good, needed);
                v.add_stop(points[w], w, reloaded, StopOperation::ReloadSpecificGood);
            }

            int q = std::min(v.load_of(good), needed);
            if (q <= 0) break;

            points[p].deliver(good, q);
            GoodAmounts delivered;
            delivered[good] = q;
            v.add_stop(points[p], p, delivered, StopOperation::Delivery);
            needed -= q;
        }
    }
}

static void handle_pickup(vector<Vehicle>& vehicles, vector<Point>& points, const Scenario& sc,
                          int p, double unload_threshold) {
    vector<std::string> goods;
    for (const auto& d : points[p].remaining_demands) goods.push_back(d.first);

    for (const std::string& good : goods) {
        int remaining = points[p].remaining_demands[good];
        if (remaining >= 0) continue;

        int needed = -remaining;
        while (needed > 0) {
            int k = select_vehicle_for_pickup(vehicles, sc, p, needed);
            if (k < 0) break;

            Vehicle& v = vehicles[k];
            int q = std::min(v.capacity - v.current_total_load(), needed);
            if (q <= 0) break;

            points[p].pickup(good, q);
            GoodAmounts picked;
            picked[good] = q;
            v.add_stop(points[p], p, picked, StopOperation::Pickup);
            needed -= q;

            // Veículo quase cheio: volta ao armazém mais próximo e descarrega tudo
            if (v.current_total_load() >= v.capacity * unload_threshold) {
                int w = sc.nearest_warehouse(v.current_position());
                v.add_stop(points[w], w, GoodAmounts(), StopOperation::UnloadIfFull);
            }
        }
    }
}

ServicePlan build_service_plan(
    const Scenario& sc,
    const std::vector<int>& chromosome,
    const std::vector<int>& warehouse_assignment,
    const GA_Params& params)
{
    if (warehouse_assignment.size() != sc.vehicle_capacities.size()) {
        throw std::invalid_argument("atribuição de armazéns não corresponde ao tamanho da frota");
    }

    ServicePlan plan;

    // --- PASSO 1: Cópia privada dos pontos, com demandas resetadas ---
    plan.points = sc.points;
    for (Point& p : plan.points) p.reset_remaining();

    // --- PASSO 2: Frota nova ---
    plan.vehicles.reserve(sc.vehicle_capacities.size());
    for (size_t k = 0; k < sc.vehicle_capacities.size(); ++k) {
        plan.vehicles.emplace_back((int)k + 1, sc.vehicle_capacities[k], warehouse_assignment[k], sc.good_types);
    }

    // --- PASSO 3: Carga inicial ---
    for (Vehicle& v : plan.vehicles) {
        v.reset();
        GoodAmounts initial = calculate_initial_load(v.capacity, sc.good_types, params.initialLoadFraction);
        GoodAmounts loaded = v.partial_load(initial);
        const int w = v.assigned_warehouse;
        v.add_stop(plan.points.at(w), w, loaded, StopOperation::InitialLoad);
    }

    // --- PASSO 4: Atende os pontos na ordem do cromossomo ---
    for (int p : chromosome) {
        switch (plan.points.at(p).type) {
            case PointType::Delivery:
                handle_delivery(plan.vehicles, plan.points, sc, p);
                break;
            case PointType::Pickup:
                handle_pickup(plan.vehicles, plan.points, sc, p, params.unloadThreshold);
                break;
            case PointType::Warehouse:
                throw std::invalid_argument("armazém no cromossomo: " + plan.points[p].label);
        }
    }

    for (int idx : sc.service_points) {
        for (const auto& d : plan.points[idx].remaining_demands) {
            plan.unmet_demand += std::abs(d.second);
        }
    }
    return plan;
}
