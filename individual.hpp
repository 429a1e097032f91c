#ifndef INDIVIDUAL_HPP
#define INDIVIDUAL_HPP

#include <vector>
#include <limits>

/*
 * Um indivíduo é uma ordem de visita aos pontos de serviço.
 * Os campos de avaliação são preenchidos por 'calculate_fitness'.
 */
struct Individual {
    std::vector<int> chromosome;            // permutação dos índices de pontos de serviço

    double fitness;                         // custo total (infinito se inválido)
    double route_distance;
    long unmet_demand;
    std::vector<int> warehouse_assignment;  // armazém de cada veículo usado na avaliação
    bool evaluated;

    Individual() {
        fitness = std::numeric_limits<double>::infinity();
        route_distance = 0.0;
        unmet_demand = 0;
        evaluated = false;
    }

    explicit Individual(const std::vector<int>& order) : Individual() {
        chromosome = order;
    }
};

#endif // INDIVIDUAL_HPP
