/*
 * evaluation.hpp
 *
 * Avaliação de indivíduos: validade da permutação e custo (distância total).
 */

#ifndef EVALUATION_HPP
#define EVALUATION_HPP

#include "vrp.hpp"
#include "individual.hpp"
#include "parameters.hpp"
#include "service_plan.hpp"
#include <vector>

/**
 * @brief Verifica se o cromossomo é uma permutação dos pontos de serviço:
 * tamanho correto, sem posição vazia (-1), sem repetição e sem armazéns.
 */
bool is_valid_permutation(const std::vector<int>& chromosome, const Scenario& sc);

/**
 * @brief Distância percorrida pela frota: para cada veículo com rota, as
 * pernas a partir do armazém atribuído por todas as paradas, mais o retorno
 * da última parada ao armazém mais próximo.
 */
double route_distance(const ServicePlan& plan, const Scenario& sc);

// Distância de um único veículo (mesma regra de 'route_distance')
double vehicle_distance(const Vehicle& v, const Scenario& sc);

/**
 * @brief Avalia o indivíduo e preenche fitness, route_distance,
 * unmet_demand, warehouse_assignment e evaluated.
 *
 * Cromossomo inválido ou exceção na simulação resultam em fitness infinito;
 * nenhuma exceção é propagada.
 *
 * @return O fitness calculado.
 */
double calculate_fitness(Individual& ind, const Scenario& sc, const GA_Params& params);

#endif // EVALUATION_HPP
