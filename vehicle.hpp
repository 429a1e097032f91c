/*
 * vehicle.hpp
 * Veículo da frota e o registro de cada parada da sua rota.
 */
#ifndef VEHICLE_HPP
#define VEHICLE_HPP

#include <vector>
#include <string>
#include "vrp.hpp"

enum class StopOperation {
    InitialLoad,
    ReloadSpecificGood,
    TravelToReload,
    Delivery,
    Pickup,
    UnloadIfFull
};

const char* operation_name(StopOperation op);

/**
 * @struct Stop
 * @brief Uma parada da rota: o ponto visitado, o que foi transferido e os
 * instantâneos logo após a operação.
 */
struct Stop {
    int point;                  // índice em Scenario::points
    bool is_warehouse;
    GoodAmounts amounts;
    StopOperation operation;
    GoodAmounts load_after;     // carga do veículo após a operação
    GoodAmounts remaining_demand_after; // vazio em armazéns
};

class Vehicle {
public:
    int id;
    int capacity;
    GoodAmounts current_loads;
    std::vector<Stop> route;
    int assigned_warehouse;

    Vehicle(int id, int capacity, int assigned_warehouse, const std::vector<std::string>& goods);

    int current_total_load() const;
    int load_of(const std::string& good) const;

    // Último ponto visitado, ou o armazém de origem se a rota está vazia
    int current_position() const;

    void reset();

    /**
     * @brief Carrega as quantidades pedidas respeitando a capacidade.
     * @return As quantidades efetivamente carregadas.
     */
    GoodAmounts partial_load(const GoodAmounts& amounts);

    // Recarrega uma mercadoria até o limite da capacidade; retorna o carregado
    int reload(const std::string& good, int amount);

    bool can_pickup(int amount) const { return current_total_load() + amount <= capacity; }

    void unload_all();

    /**
     * @brief Registra uma parada. Em pontos de serviço, aplica a entrega
     * (subtrai da carga) ou a coleta (soma à carga) antes do instantâneo.
     */
    void add_stop(const Point& point, int point_index, const GoodAmounts& amounts, StopOperation op);
};

#endif // VEHICLE_HPP
