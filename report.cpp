#include "report.hpp"
#include "evaluation.hpp"
#include <fstream>
#include <iostream>
#include <iomanip>
#include <string>

// "oranges=10 tuna=5" (só as mercadorias não nulas; "-" se todas são zero)
static std::string format_amounts(const GoodAmounts& amounts) {
    std::string s;
    for (const auto& a : amounts) {
        if (a.second == 0) continue;
        if (!s.empty()) s += " ";
        s += a.first + "=" + std::to_string(a.second);
    }
    return s.empty() ? "-" : s;
}

void write_route_report(std::ostream& out, const Scenario& sc, const ServicePlan& plan) {
    const std::string rule(60, '=');
    double total_sum = 0.0;

    out << "=== VEHICLE ROUTING PROBLEM ===\n";
    out << "Number of vehicles: " << plan.vehicles.size() << "\n";

    for (const Vehicle& v : plan.vehicles) {
        out << "\n" << rule << "\n";
        out << "Vehicle " << v.id << " (Capacity: " << v.capacity << "kg)\n";
        out << "Assigned Warehouse: " << plan.points[v.assigned_warehouse].label << "\n";
        out << rule << "\n";

        for (size_t j = 0; j < v.route.size(); ++j) {
            const Stop& stop = v.route[j];
            const Point& point = plan.points[stop.point];
            out << "Stop " << j + 1 << ": ";

            switch (stop.operation) {
                case StopOperation::Delivery:
                    out << "[Delivery] " << point.label
                        << " | Delivered: " << format_amounts(stop.amounts)
                        << " | Remaining demand: " << format_amounts(stop.remaining_demand_after)
                        << " | Vehicle load after delivery: " << format_amounts(stop.load_after) << "\n";
                    break;
                case StopOperation::Pickup:
                    out << "[Pickup] " << point.label
                        << " | Picked up: " << format_amounts(stop.amounts)
                        << " | Remaining pickup: " << format_amounts(stop.remaining_demand_after)
                        << " | Vehicle load after pickup: " << format_amounts(stop.load_after) << "\n";
                    break;
                case StopOperation::UnloadIfFull:
                    out << point.label << " | Unloaded to: 0kg\n";
                    break;
                default:
                    out << point.label << " | " << operation_name(stop.operation)
                        << " | Amounts: " << format_amounts(stop.amounts)
                        << " | Load: " << format_amounts(stop.load_after) << "\n";
                    break;
            }
        }

        double d = vehicle_distance(v, sc);
        total_sum += d;
        out << "\nVehicle " << v.id << " Total Distance: " << std::fixed << std::setprecision(2) << d << " km\n";
        out << std::defaultfloat;
    }

    out << "\n" << rule << "\n";
    out << "GRAND TOTAL DISTANCE: " << std::fixed << std::setprecision(2) << total_sum << " km\n";
    out << std::defaultfloat;
    out << "UNMET DEMAND: " << plan.unmet_demand << "\n";
    out << rule << "\n";
}

void write_route_summary(std::ostream& out, const ServicePlan& plan) {
    for (const Vehicle& v : plan.vehicles) {
        out << "  Veículo " << v.id << " (cap. " << v.capacity << "):\n";
        for (const Stop& stop : v.route) {
            out << "    " << plan.points[stop.point].label
                << " [" << operation_name(stop.operation) << "]\n";
        }
    }
}

bool save_routes(const Scenario& sc, const ServicePlan& plan, const std::string& filename) {
    std::ofstream out(filename);
    if (!out.is_open()) {
        std::cerr << "AVISO: Não foi possível criar o arquivo de rotas '" << filename << "'." << std::endl;
        return false;
    }
    write_route_report(out, sc, plan);
    return true;
}
