#include "local_search.hpp"
#include <vector>
#include <algorithm>

using std::vector;

double calculate_route_distance(const vector<int>& route, const Scenario& sc) {
    if (route.empty()) return 0.0;

    double distance = 0.0;
    int last = sc.nearest_warehouse(route[0]);
    for (int p : route) {
        distance += sc.dist(last, p);
        last = p;
    }
    return distance;
}

bool apply_2opt_on_route(vector<int>& route, const Scenario& sc) {
    if (route.size() < 4) return false;

    bool improved = false;
    bool made_improvement_in_pass = true;
    while (made_improvement_in_pass) {
        made_improvement_in_pass = false;
        for (size_t i = 1; i < route.size() - 2; ++i) {
            for (size_t j = i + 1; j < route.size() - 1; ++j) {
                // Inverter [i, j] só troca as arestas (i-1, i) e (j, j+1)
                double current_cost = sc.dist(route[i - 1], route[i]) + sc.dist(route[j], route[j + 1]);
                double new_cost = sc.dist(route[i - 1], route[j]) + sc.dist(route[i], route[j + 1]);

                if (new_cost < current_cost - 1e-9) {
                    std::reverse(route.begin() + i, route.begin() + j + 1);
                    made_improvement_in_pass = true;
                    improved = true;
                    goto next_pass;
                }
            }
        }
        next_pass:;
    }
    return improved;
}

vector<int> optimize_route(const vector<int>& order, const Scenario& sc) {
    if (order.empty()) return order;

    vector<int> full_route = order;
    full_route.push_back(sc.nearest_warehouse(order[0]));

    apply_2opt_on_route(full_route, sc);

    full_route.pop_back();
    return full_route;
}
