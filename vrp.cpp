#include "vrp.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <cmath>
#include <cstdlib>
#include <algorithm>

const std::vector<std::string> DEFAULT_GOOD_TYPES = {"oranges", "uranium", "tuna"};

const char* point_type_name(PointType type) {
    switch (type) {
        case PointType::Delivery: return "delivery";
        case PointType::Pickup: return "pickup";
        case PointType::Warehouse: return "warehouse";
    }
    return "unknown";
}

Point::Point(double x, double y, const GoodAmounts& demands, const std::string& label, bool is_warehouse)
    : x(x), y(y), demands(demands), remaining_demands(demands), label(label), is_warehouse(is_warehouse) {
    if (is_warehouse) {
        type = PointType::Warehouse;
        return;
    }
    long total = 0;
    for (const auto& d : demands) total += d.second;
    type = (total < 0) ? PointType::Pickup : PointType::Delivery;
}

Point::Point(double x, double y, const GoodAmounts& demands, const std::string& label, PointType type)
    : x(x), y(y), demands(demands), remaining_demands(demands), label(label),
      is_warehouse(type == PointType::Warehouse), type(type) {}

int Point::total_demand() const {
    int total = 0;
    for (const auto& d : demands) total += std::abs(d.second);
    return total;
}

int Point::total_remaining_demand() const {
    int total = 0;
    for (const auto& d : remaining_demands) total += d.second;
    return total;
}

bool Point::is_fully_serviced() const {
    for (const auto& d : remaining_demands) {
        if (d.second != 0) return false;
    }
    return true;
}

void Point::deliver(const std::string& good, int amount) {
    auto it = remaining_demands.find(good);
    if (it != remaining_demands.end()) it->second -= amount;
}

void Point::pickup(const std::string& good, int amount) {
    // Coletas são negativas: somar a quantidade aproxima de zero
    auto it = remaining_demands.find(good);
    if (it != remaining_demands.end()) it->second += amount;
}

double distance(const Point& a, const Point& b) {
    double dx = a.x - b.x;
    double dy = a.y - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

Scenario::Scenario() : good_types(DEFAULT_GOOD_TYPES) {}

int Scenario::add_warehouse(double x, double y, const std::string& label) {
    GoodAmounts zero;
    for (const auto& g : good_types) zero[g] = 0;

    std::string name = label;
    if (name.empty()) {
        std::ostringstream ss;
        ss << "Warehouse " << warehouses.size() + 1 << " (" << x << "," << y << ")";
        name = ss.str();
    }
    points.emplace_back(x, y, zero, name, true);
    warehouses.push_back((int)points.size() - 1);
    return warehouses.back();
}

int Scenario::add_service_point(double x, double y, const GoodAmounts& demands, const std::string& label) {
    GoodAmounts full = demands;
    for (const auto& g : good_types) full.insert({g, 0});

    Point p(x, y, full, label);
    if (p.label.empty()) {
        std::ostringstream ss;
        ss << (p.type == PointType::Pickup ? "Pickup" : "Delivery") << " (" << x << "," << y << ")";
        p.label = ss.str();
    }
    points.push_back(p);
    service_points.push_back((int)points.size() - 1);
    return service_points.back();
}

int Scenario::nearest_warehouse(int point_index) const {
    int best = -1;
    double best_dist = 0.0;
    for (int w : warehouses) {
        double d = dist(point_index, w);
        if (best == -1 || d < best_dist) {
            best = w;
            best_dist = d;
        }
    }
    return best;
}

void Scenario::validate() const {
    if (good_types.empty()) {
        throw std::invalid_argument("cenário sem tipos de mercadoria");
    }
    if (service_points.empty()) {
        throw std::invalid_argument("cenário sem pontos de serviço");
    }
    if (warehouses.empty()) {
        throw std::invalid_argument("cenário sem armazéns");
    }
    if (vehicle_capacities.empty()) {
        throw std::invalid_argument("frota vazia (nenhum veículo)");
    }
    for (int cap : vehicle_capacities) {
        if (cap <= 0) {
            throw std::invalid_argument("capacidade de veículo deve ser positiva: " + std::to_string(cap));
        }
    }
    for (int idx : service_points) {
        const Point& p = points.at(idx);
        if (p.is_warehouse) {
            throw std::invalid_argument("armazém listado como ponto de serviço: " + p.label);
        }
        for (const auto& d : p.demands) {
            if (std::find(good_types.begin(), good_types.end(), d.first) == good_types.end()) {
                throw std::invalid_argument("mercadoria desconhecida '" + d.first + "' em " + p.label);
            }
        }
    }
}

// Lê o próximo token de conteúdo, pulando linhas de comentário ('#')
static bool next_token(std::istream& in, std::string& token) {
    while (in >> token) {
        if (token[0] == '#') {
            std::string rest;
            std::getline(in, rest);
            continue;
        }
        return true;
    }
    return false;
}

static void expect_section(std::istream& in, const std::string& name, const std::string& filename) {
    std::string token;
    if (!next_token(in, token) || token != name) {
        throw std::runtime_error("Arquivo de cenário '" + filename + "': esperado '" + name + "'");
    }
}

template <typename T>
static T read_value(std::istream& in, const std::string& filename) {
    std::string token;
    if (!next_token(in, token)) {
        throw std::runtime_error("Arquivo de cenário '" + filename + "': fim inesperado");
    }
    std::istringstream ss(token);
    T value;
    if (!(ss >> value)) {
        throw std::runtime_error("Arquivo de cenário '" + filename + "': valor inválido '" + token + "'");
    }
    return value;
}

void Scenario::readDataFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        throw std::runtime_error("Unable to open file: " + filename);
    }

    good_types.clear();
    points.clear();
    warehouses.clear();
    service_points.clear();
    vehicle_capacities.clear();

    expect_section(file, "GOODS", filename);
    int nGoods = read_value<int>(file, filename);
    for (int i = 0; i < nGoods; ++i) {
        good_types.push_back(read_value<std::string>(file, filename));
    }

    expect_section(file, "VEHICLES", filename);
    int nVehicles = read_value<int>(file, filename);
    for (int i = 0; i < nVehicles; ++i) {
        vehicle_capacities.push_back(read_value<int>(file, filename));
    }

    expect_section(file, "WAREHOUSES", filename);
    int nWarehouses = read_value<int>(file, filename);
    for (int i = 0; i < nWarehouses; ++i) {
        double x = read_value<double>(file, filename);
        double y = read_value<double>(file, filename);
        add_warehouse(x, y);
    }

    expect_section(file, "POINTS", filename);
    int nPoints = read_value<int>(file, filename);
    for (int i = 0; i < nPoints; ++i) {
        double x = read_value<double>(file, filename);
        double y = read_value<double>(file, filename);
        GoodAmounts demands;
        for (const auto& g : good_types) {
            demands[g] = read_value<int>(file, filename);
        }
        add_service_point(x, y, demands);
    }
}

void Scenario::printData() const {
    std::cout << "=== Cenário ===\n";
    std::cout << "Mercadorias: ";
    for (size_t g = 0; g < good_types.size(); ++g)
        std::cout << good_types[g] << (g + 1 < good_types.size() ? ", " : "\n");
    std::cout << "Veículos: " << vehicle_capacities.size() << " | Capacidades: ";
    for (size_t v = 0; v < vehicle_capacities.size(); ++v)
        std::cout << vehicle_capacities[v] << (v + 1 < vehicle_capacities.size() ? " " : "");
    std::cout << "\n";
    std::cout << "Armazéns: " << warehouses.size() << " | Pontos de serviço: " << service_points.size() << "\n\n";

    std::cout << "-- Armazéns --\n";
    for (int w : warehouses) {
        std::cout << "  " << points[w].label << "\n";
    }
    std::cout << "\n-- Pontos de serviço --\n";
    for (int idx : service_points) {
        const Point& p = points[idx];
        std::cout << "  " << p.label << " [" << point_type_name(p.type) << "]";
        for (const auto& d : p.demands) {
            if (d.second != 0) std::cout << " " << d.first << "=" << d.second;
        }
        std::cout << "\n";
    }
    std::cout << "===============\n";
}
