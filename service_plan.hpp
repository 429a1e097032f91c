/*
 * service_plan.hpp
 *
 * Simulador do plano de serviço: converte uma ordem de visita (cromossomo)
 * em rotas concretas, uma por veículo, incluindo paradas de recarga e
 * descarga nos armazéns.
 */

#ifndef SERVICE_PLAN_HPP
#define SERVICE_PLAN_HPP

#include "vrp.hpp"
#include "vehicle.hpp"
#include "parameters.hpp"
#include <vector>
#include <string>

/**
 * @struct ServicePlan
 * @brief Resultado de uma simulação. 'points' é a cópia privada dos pontos
 * do cenário usada nesta simulação (com as demandas restantes ao final).
 */
struct ServicePlan {
    std::vector<Vehicle> vehicles;
    std::vector<Point> points;
    long unmet_demand = 0; // soma de |demanda restante| nos pontos de serviço
};

/**
 * @brief Sorteia o armazém de cada veículo (um por capacidade do cenário).
 * Em WarehouseAssignment::Random consome o 'rng' global; em ByVehicleIndex
 * o resultado depende apenas do índice do veículo.
 */
std::vector<int> draw_warehouse_assignment(const Scenario& sc, const GA_Params& params);

// Carga inicial por mercadoria: (capacidade * fração) dividida igualmente entre as mercadorias
GoodAmounts calculate_initial_load(int capacity, const std::vector<std::string>& goods, double fraction);

/**
 * @brief Simula o atendimento dos pontos na ordem do cromossomo.
 *
 * 1. Copia e reseta as demandas dos pontos.
 * 2. Cria um veículo por capacidade, partindo do armazém atribuído.
 * 3. Registra a carga inicial ('initial_load') de cada veículo.
 * 4. Atende cada ponto em ordem: entrega ou coleta, por mercadoria.
 *
 * Demanda que nenhum veículo consegue atender fica em 'unmet_demand'.
 *
 * @param chromosome Índices de pontos de serviço (sem armazéns).
 * @param warehouse_assignment Armazém de cada veículo (mesmo tamanho da frota).
 */
ServicePlan build_service_plan(
    const Scenario& sc,
    const std::vector<int>& chromosome,
    const std::vector<int>& warehouse_assignment,
    const GA_Params& params
);

// Heurísticas de escolha de veículo. Retornam -1 se nenhum veículo serve.
int select_vehicle_for_delivery(const std::vector<Vehicle>& vehicles, const Scenario& sc,
                                int point, const std::string& good, int amount_needed);
int select_vehicle_for_pickup(const std::vector<Vehicle>& vehicles, const Scenario& sc,
                              int point, int amount_to_pickup);

#endif // SERVICE_PLAN_HPP
