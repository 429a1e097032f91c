#include "vehicle.hpp"
#include <algorithm>

const char* operation_name(StopOperation op) {
    switch (op) {
        case StopOperation::InitialLoad: return "initial_load";
        case StopOperation::ReloadSpecificGood: return "reload_specific_good";
        case StopOperation::TravelToReload: return "travel_to_reload";
        case StopOperation::Delivery: return "delivery";
        case StopOperation::Pickup: return "pickup";
        case StopOperation::UnloadIfFull: return "unload_if_full";
    }
    return "unknown";
}

Vehicle::Vehicle(int id, int capacity, int assigned_warehouse, const std::vector<std::string>& goods)
    : id(id), capacity(capacity), assigned_warehouse(assigned_warehouse) {
    for (const auto& g : goods) current_loads[g] = 0;
}

int Vehicle::current_total_load() const {
    int total = 0;
    for (const auto& l : current_loads) total += l.second;
    return total;
}

int Vehicle::load_of(const std::string& good) const {
    auto it = current_loads.find(good);
    return it == current_loads.end() ? 0 : it->second;
}

int Vehicle::current_position() const {
    return route.empty() ? assigned_warehouse : route.back().point;
}

void Vehicle::reset() {
    for (auto& l : current_loads) l.second = 0;
    route.clear();
}

GoodAmounts Vehicle::partial_load(const GoodAmounts& amounts) {
    GoodAmounts loaded;
    for (const auto& l : current_loads) loaded[l.first] = 0;

    for (const auto& a : amounts) {
        int headroom = capacity - current_total_load();
        int q = std::min(a.second, headroom);
        if (q <= 0) break;

        current_loads[a.first] += q;
        loaded[a.first] = q;

        if (current_total_load() >= capacity) break;
    }
    return loaded;
}

int Vehicle::reload(const std::string& good, int amount) {
    int q = std::min(amount, capacity - current_total_load());
    if (q <= 0) return 0;
    current_loads[good] += q;
    return q;
}

void Vehicle::unload_all() {
    for (auto& l : current_loads) l.second = 0;
}

void Vehicle::add_stop(const Point& point, int point_index, const GoodAmounts& amounts, StopOperation op) {
    Stop stop;
    stop.point = point_index;
    stop.is_warehouse = point.is_warehouse;
    stop.amounts = amounts;
    stop.operation = op;

    if (!point.is_warehouse) {
        if (op == StopOperation::Delivery) {
            for (const auto& a : amounts) current_loads[a.first] -= a.second;
        } else if (op == StopOperation::Pickup) {
            for (const auto& a : amounts) current_loads[a.first] += a.second;
        }
        stop.remaining_demand_after = point.remaining_demands;
    } else if (op == StopOperation::UnloadIfFull) {
        unload_all();
    }

    stop.load_after = current_loads;
    route.push_back(stop);
}
