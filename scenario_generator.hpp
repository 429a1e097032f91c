#ifndef SCENARIO_GENERATOR_HPP
#define SCENARIO_GENERATOR_HPP

#include "vrp.hpp"
#include "parameters.hpp"

// Lança std::invalid_argument se os intervalos ou a frota são inválidos
void validate_scenario_params(const Scenario_Params& params);

/**
 * @brief Gera um cenário aleatório (usa o 'rng' global).
 *
 * Cinco armazéns fixos em (10,10), (90,10), (10,90), (90,90) e (50,50).
 * Cada ponto de entrega/coleta recebe coordenadas inteiras em
 * [minCoord, maxCoord] e uma quantidade em [minAmount, maxAmount] de uma
 * mercadoria sorteada (negativa nas coletas).
 * Valida os parâmetros antes de sortear qualquer valor.
 */
Scenario generate_random_scenario(const Scenario_Params& params);

#endif // SCENARIO_GENERATOR_HPP
