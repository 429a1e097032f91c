#ifndef GA_HPP
#define GA_HPP

#include "vrp.hpp"
#include "parameters.hpp"
#include "individual.hpp"
#include "service_plan.hpp"
#include <vector>
#include <string>
#include <functional>

struct GA_Result {
    Individual best;
    ServicePlan plan;  // rotas do melhor indivíduo, com a atribuição usada na sua avaliação
    // Melhor fitness da população em cada geração (nGen + 1 entradas, a última é a população final)
    std::vector<double> best_fitness_history;
};

// Chamado com a população avaliada e ordenada de cada geração (gen = nGen para a população final)
typedef std::function<void(int gen, const std::vector<Individual>& pop)> GenerationObserver;

// Lança std::invalid_argument se o cenário ou os parâmetros são inválidos
void validate_configuration(const Scenario& sc, const GA_Params& ga_params);

// Declaração da função principal do GA
GA_Result run_genetic_algorithm(const Scenario& sc, const GA_Params& ga_params, bool verbose,
                                const GenerationObserver& on_generation = nullptr);

// Criação de indivíduo: permutação aleatória dos pontos de serviço
Individual make_random_individual(const Scenario& sc);

// Substitui os últimos 'nImmigrants' indivíduos por novos aleatórios
void inject_immigrants(std::vector<Individual>& pop, const Scenario& sc, int nImmigrants);

// Operadores genéticos
std::vector<int> ordered_crossover(const std::vector<int>& parent1, const std::vector<int>& parent2);
std::vector<int> spatial_crossover(const std::vector<int>& parent1, const std::vector<int>& parent2, const Scenario& sc);
void swap_mutation(std::vector<int>& chromosome, double pMutation);
Individual tournamentSelect(const std::vector<Individual>& pop, int k);

#endif // GA_HPP
