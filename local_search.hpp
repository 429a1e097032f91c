/*
 * local_search.hpp
 * Refinamento local (2-opt) sobre a ordem de visita de um indivíduo.
 */
#ifndef LOCAL_SEARCH_HPP
#define LOCAL_SEARCH_HPP

#include "vrp.hpp"
#include <vector>

/**
 * @brief Distância de uma sequência de pontos, partindo do armazém mais
 * próximo do primeiro ponto. Sequência vazia tem distância 0.
 */
double calculate_route_distance(const std::vector<int>& route, const Scenario& sc);

/**
 * @brief Aplica o 2-Opt (First Improvement) até atingir um ótimo local.
 * O primeiro e o último ponto da rota ficam fixos.
 * @return true se alguma inversão foi aceita.
 */
bool apply_2opt_on_route(std::vector<int>& route, const Scenario& sc);

/**
 * @brief Otimiza uma ordem de visita com 2-opt: fecha a ordem com o armazém
 * mais próximo do primeiro ponto, aplica o 2-opt e remove o fechamento.
 */
std::vector<int> optimize_route(const std::vector<int>& order, const Scenario& sc);

#endif // LOCAL_SEARCH_HPP
