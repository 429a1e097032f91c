#include "ga.hpp"
#include "utils.hpp"
#include "evaluation.hpp"
#include "local_search.hpp"
#include <iostream>
#include <vector>
#include <numeric>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <stdexcept>
#include <set>

using std::vector;

void validate_configuration(const Scenario& sc, const GA_Params& ga_params) {
    sc.validate();

    if (ga_params.popSize < 1)
        throw std::invalid_argument("popSize deve ser >= 1");
    if (ga_params.nGen < 0)
        throw std::invalid_argument("nGen deve ser >= 0");
    if (ga_params.tournamentK < 1 || ga_params.tournamentK > ga_params.popSize)
        throw std::invalid_argument("tournamentK deve estar em [1, popSize]");
    if (ga_params.nElites < 0 || ga_params.nElites > ga_params.popSize)
        throw std::invalid_argument("nElites deve estar em [0, popSize]");
    if (ga_params.immigrantInterval < 1)
        throw std::invalid_argument("immigrantInterval deve ser >= 1");
    if (ga_params.nImmigrants < 0)
        throw std::invalid_argument("nImmigrants deve ser >= 0");

    const double probabilities[] = {ga_params.pMutation, ga_params.pOrderedCrossover,
                                    ga_params.pLocalSearch, ga_params.initialLoadFraction};
    for (double p : probabilities) {
        if (!(p >= 0.0 && p <= 1.0))
            throw std::invalid_argument("probabilidades e frações devem estar em [0, 1]");
    }
    if (!(ga_params.unloadThreshold > 0.0 && ga_params.unloadThreshold <= 1.0))
        throw std::invalid_argument("unloadThreshold deve estar em (0, 1]");
    if (!(ga_params.unmetPenalty >= 0.0))
        throw std::invalid_argument("unmetPenalty deve ser >= 0");
}

Individual make_random_individual(const Scenario& sc) {
    Individual ind(sc.service_points);
    std::shuffle(ind.chromosome.begin(), ind.chromosome.end(), rng);
    return ind;
}

void inject_immigrants(vector<Individual>& pop, const Scenario& sc, int nImmigrants) {
    int n = std::min(nImmigrants, (int)pop.size());
    for (int i = (int)pop.size() - n; i < (int)pop.size(); ++i) {
        pop[i] = make_random_individual(sc);
    }
}

/*
 * Crossover de Ordem (OX)
 * Copia um trecho contíguo do pai 1 e completa as posições restantes
 * na ordem em que os genes aparecem no pai 2.
 */
vector<int> ordered_crossover(const vector<int>& parent1, const vector<int>& parent2) {
    const int size = (int)parent1.size();
    if (size < 2) return parent1;

    vector<int> cut = sample_distinct(size, 2);
    int start = std::min(cut[0], cut[1]);
    int end = std::max(cut[0], cut[1]);

    vector<int> child(size, -1);
    std::set<int> segment_genes;
    for (int i = start; i <= end; ++i) {
        child[i] = parent1[i];
        segment_genes.insert(parent1[i]);
    }

    int ptr_parent2 = 0;
    for (int i = 0; i < size; ++i) {
        if (child[i] != -1) continue;
        while (ptr_parent2 < size && segment_genes.count(parent2[ptr_parent2])) {
            ptr_parent2++;
        }
        if (ptr_parent2 < size) {
            child[i] = parent2[ptr_parent2++];
        }
    }
    return child;
}

/*
 * Crossover Espacial
 * Ordena os dois pais pela distância a um ponto de referência sorteado e
 * intercala os genes, pulando os já usados.
 */
vector<int> spatial_crossover(const vector<int>& parent1, const vector<int>& parent2, const Scenario& sc) {
    if (parent1.empty() || sc.service_points.empty()) return parent1;

    const int reference = sc.service_points[randint(0, (int)sc.service_points.size() - 1)];
    auto closer = [&sc, reference](int a, int b) {
        return sc.dist(a, reference) < sc.dist(b, reference);
    };

    vector<int> sorted1 = parent1;
    vector<int> sorted2 = parent2;
    std::stable_sort(sorted1.begin(), sorted1.end(), closer);
    std::stable_sort(sorted2.begin(), sorted2.end(), closer);

    vector<int> child;
    child.reserve(parent1.size());
    std::set<int> used;

    size_t i = 0, j = 0;
    while (child.size() < parent1.size()) {
        while (i < sorted1.size() && used.count(sorted1[i])) i++;
        if (i < sorted1.size()) {
            child.push_back(sorted1[i]);
            used.insert(sorted1[i]);
            i++;
        }

        while (j < sorted2.size() && used.count(sorted2[j])) j++;
        if (j < sorted2.size() && child.size() < parent1.size()) {
            child.push_back(sorted2[j]);
            used.insert(sorted2[j]);
            j++;
        }

        // Pais com genes diferentes: não há mais o que intercalar
        if (i >= sorted1.size() && j >= sorted2.size()) break;
    }
    return child;
}

void swap_mutation(vector<int>& chromosome, double pMutation) {
    if (randreal() >= pMutation) return;
    if (chromosome.size() < 2) return;

    vector<int> pos = sample_distinct((int)chromosome.size(), 2);
    std::swap(chromosome[pos[0]], chromosome[pos[1]]);
}

// Torneio sem reposição: o mais apto entre k indivíduos distintos
Individual tournamentSelect(const vector<Individual>& pop, int k) {
    vector<int> candidates = sample_distinct((int)pop.size(), k);
    int best_idx = candidates[0];
    for (size_t i = 1; i < candidates.size(); ++i) {
        if (pop[candidates[i]].fitness < pop[best_idx].fitness) {
            best_idx = candidates[i];
        }
    }
    return pop[best_idx];
}

static void evaluate_population(vector<Individual>& pop, const Scenario& sc, const GA_Params& ga_params) {
    for (Individual& ind : pop) {
        if (!ind.evaluated) calculate_fitness(ind, sc, ga_params);
    }
}

static void sort_population(vector<Individual>& pop) {
    std::stable_sort(pop.begin(), pop.end(), [](const Individual& a, const Individual& b) {
        return a.fitness < b.fitness;
    });
}

GA_Result run_genetic_algorithm(const Scenario& sc, const GA_Params& ga_params, bool verbose,
                                const GenerationObserver& on_generation) {
    validate_configuration(sc, ga_params);

    GA_Result result;
    vector<Individual> pop;
    pop.reserve(ga_params.popSize);

    // --- 1. INICIALIZAÇÃO ---
    if (verbose) std::cout << "Inicializando população..." << std::endl;
    for (int i = 0; i < ga_params.popSize; ++i) {
        pop.push_back(make_random_individual(sc));
    }

    // --- 2. INJEÇÃO DE DIVERSIDADE ---
    // Passada única antes do loop evolutivo: a cada 'immigrantInterval'
    // gerações (incluindo a 0) os últimos indivíduos são substituídos.
    for (int gen = 0; gen < ga_params.nGen; ++gen) {
        if (gen % ga_params.immigrantInterval == 0) {
            inject_immigrants(pop, sc, ga_params.nImmigrants);
        }
    }

    // --- 3. LOOP EVOLUTIVO ---
    if (verbose) std::cout << "Iniciando loop do GA para " << ga_params.nGen << " gerações..." << std::endl;

    for (int gen = 0; gen < ga_params.nGen; ++gen) {
        evaluate_population(pop, sc, ga_params);
        sort_population(pop);
        result.best_fitness_history.push_back(pop.front().fitness);
        if (on_generation) on_generation(gen, pop);

        // Log da Geração
        if (verbose || (gen % 10 == 0) || (gen == ga_params.nGen - 1)) {
            double avg_fit = 0.0;
            int finite_count = 0;
            for (const auto& ind : pop) {
                if (std::isfinite(ind.fitness)) {
                    avg_fit += ind.fitness;
                    finite_count++;
                }
            }
            if (finite_count > 0) avg_fit /= finite_count;

            std::cout << "Gen " << std::setw(4) << gen + 1 << "/" << ga_params.nGen
                      << " | Válidos: " << std::setw(3) << finite_count << "/" << (int)pop.size()
                      << " | Melhor: " << std::fixed << std::setprecision(2) << pop.front().fitness
                      << " | Média: " << avg_fit
                      << " | Não atendido: " << pop.front().unmet_demand << std::endl;
            std::cout << std::defaultfloat;
        }

        // 1. Elitismo
        vector<Individual> newPop;
        newPop.reserve(ga_params.popSize);
        for (int i = 0; i < ga_params.nElites; ++i) {
            newPop.push_back(pop[i]);
        }

        // 2. Seleção por torneio
        vector<Individual> selected;
        selected.reserve(ga_params.popSize);
        for (int i = 0; i < ga_params.popSize; ++i) {
            selected.push_back(tournamentSelect(pop, ga_params.tournamentK));
        }

        // 3. Geração de Filhos
        while ((int)newPop.size() < ga_params.popSize) {
            const Individual& parent1 = selected[randint(0, (int)selected.size() - 1)];
            const Individual& parent2 = selected[randint(0, (int)selected.size() - 1)];

            vector<int> child;
            if (randreal() < ga_params.pOrderedCrossover) {
                child = ordered_crossover(parent1.chromosome, parent2.chromosome);
            } else {
                child = spatial_crossover(parent1.chromosome, parent2.chromosome, sc);
            }

            swap_mutation(child, ga_params.pMutation);

            // Busca local em parte dos filhos
            if (randreal() < ga_params.pLocalSearch) {
                child = optimize_route(child, sc);
            }

            newPop.push_back(Individual(child));
        }

        pop.swap(newPop);
    }

    // --- 4. RESULTADO ---
    evaluate_population(pop, sc, ga_params);
    sort_population(pop);
    result.best_fitness_history.push_back(pop.front().fitness);
    if (on_generation) on_generation(ga_params.nGen, pop);
    result.best = pop.front();

    // Reexpande o melhor com a mesma atribuição de armazéns da sua avaliação
    if (result.best.warehouse_assignment.size() != sc.vehicle_capacities.size()) {
        result.best.warehouse_assignment = draw_warehouse_assignment(sc, ga_params);
    }
    result.plan = build_service_plan(sc, result.best.chromosome, result.best.warehouse_assignment, ga_params);

    if (verbose) {
        std::cout << "Melhor distância: " << std::fixed << std::setprecision(2) << result.best.route_distance
                  << " | Demanda não atendida: " << result.plan.unmet_demand << std::endl;
        std::cout << std::defaultfloat;
    }
    return result;
}
