#ifndef VRP_HPP
#define VRP_HPP

#include <vector>
#include <string>
#include <map>

// Quantidade por tipo de mercadoria (ex: {"oranges": 50, "uranium": -30}).
// Positivo = entrega, negativo = coleta.
typedef std::map<std::string, int> GoodAmounts;

enum class PointType { Delivery, Pickup, Warehouse };

const char* point_type_name(PointType type);

class Point {
public:
    double x, y;
    GoodAmounts demands;
    GoodAmounts remaining_demands;
    std::string label;
    bool is_warehouse;
    PointType type;

    Point() : x(0.0), y(0.0), is_warehouse(false), type(PointType::Delivery) {}

    /**
     * @brief Cria um ponto. O tipo é inferido pelo sinal da soma das demandas
     * (soma > 0 entrega, soma < 0 coleta, soma 0 entrega), a menos que
     * 'is_warehouse' seja verdadeiro.
     */
    Point(double x, double y, const GoodAmounts& demands, const std::string& label,
          bool is_warehouse = false);

    // Tipo explícito (Warehouse implica is_warehouse)
    Point(double x, double y, const GoodAmounts& demands, const std::string& label, PointType type);

    // Soma dos valores absolutos das demandas iniciais
    int total_demand() const;
    int total_remaining_demand() const;
    bool is_fully_serviced() const;

    void reset_remaining() { remaining_demands = demands; }
    void deliver(const std::string& good, int amount);
    void pickup(const std::string& good, int amount);
};

double distance(const Point& a, const Point& b);

class Scenario {
public:
    std::vector<std::string> good_types;
    std::vector<Point> points;          // armazéns e pontos de serviço
    std::vector<int> warehouses;        // índices em 'points'
    std::vector<int> service_points;    // índices em 'points'
    std::vector<int> vehicle_capacities;

    Scenario();
    explicit Scenario(const std::vector<std::string>& goods) : good_types(goods) {}

    int add_warehouse(double x, double y, const std::string& label = "");
    int add_service_point(double x, double y, const GoodAmounts& demands, const std::string& label = "");

    // Armazém mais próximo do ponto (primeiro mínimo em caso de empate)
    int nearest_warehouse(int point_index) const;
    double dist(int a, int b) const { return distance(points[a], points[b]); }

    // Lança std::invalid_argument se o cenário não pode ser otimizado
    void validate() const;

    void readDataFromFile(const std::string& filename);
    void printData() const;
};

extern const std::vector<std::string> DEFAULT_GOOD_TYPES;

#endif // VRP_HPP
