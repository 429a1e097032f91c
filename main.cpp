#include "vrp.hpp"
#include "ga.hpp"
#include "parameters.hpp"
#include "utils.hpp"
#include "report.hpp"
#include "scenario_generator.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <iomanip>
#include <stdexcept>

void print_usage(const char* prog_name) {
    std::cerr << "Uso: " << prog_name << " <arquivo_parametros> <semente_aleatoria> [arquivo_cenario] [--verbose]\n\n";
    std::cerr << "Argumentos:\n";
    std::cerr << "  <arquivo_parametros>   Caminho para o arquivo de configuração (.txt).\n";
    std::cerr << "  <semente_aleatoria>    Um número inteiro para a semente aleatória.\n";
    std::cerr << "  [arquivo_cenario]      (Opcional) Cenário em texto; sem ele um cenário aleatório é gerado.\n";
    std::cerr << "  --verbose              (Opcional) Ativa logs de progresso.\n";
}

int main(int argc, char** argv) {
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::string params_file = argv[1];
    unsigned int seed;
    try {
        seed = std::stoul(argv[2]);
    } catch (const std::exception&) {
        std::cerr << "Erro: A semente aleatória '" << argv[2] << "' é inválida.\n";
        return 1;
    }

    std::string scenario_file;
    bool verbose_mode = false;
    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--verbose") verbose_mode = true;
        else scenario_file = arg;
    }

    rng.seed(seed);

    GA_Params ga_params;
    Scenario_Params scenario_params;
    load_parameters_from_file(params_file, ga_params, scenario_params);

    Scenario sc;
    try {
        if (!scenario_file.empty()) {
            sc.readDataFromFile(scenario_file);
            std::cout << "Cenário lido: " << scenario_file << "\n";
        } else {
            sc = generate_random_scenario(scenario_params);
            std::cout << "Cenário aleatório gerado.\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Erro: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Semente aleatória: " << seed << "\n";
    std::cout << "--- Parâmetros do GA ---\n";
    std::cout << " População: " << ga_params.popSize << ", Gerações: " << ga_params.nGen
              << ", Torneio K: " << ga_params.tournamentK << ", Elites: " << ga_params.nElites << "\n"
              << " Mutação: " << ga_params.pMutation << ", Crossover OX: " << ga_params.pOrderedCrossover
              << ", P(2-opt): " << ga_params.pLocalSearch << "\n"
              << " Imigrantes: " << ga_params.nImmigrants << " a cada " << ga_params.immigrantInterval << " gerações\n"
              << " Atribuição de armazéns: "
              << (ga_params.warehouseAssignment == WarehouseAssignment::Random ? "random" : "by_vehicle_index") << "\n";
    sc.printData();

    GA_Result result;
    try {
        result = run_genetic_algorithm(sc, ga_params, verbose_mode);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Erro: configuração inválida: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n=== Resumo da solução ===\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "  Distância total: .......................... " << result.best.route_distance << "\n";
    std::cout << "  Demanda não atendida: ..................... " << result.plan.unmet_demand << "\n";
    std::cout << "  Fitness final: ............................ " << result.best.fitness << "\n";

    std::cout << "\n--- Rotas da Melhor Solução ---\n";
    write_route_summary(std::cout, result.plan);

    if (save_routes(sc, result.plan, scenario_params.outputFile)) {
        std::cout << "\nRotas salvas em: " << scenario_params.outputFile << "\n";
    }

    std::cout << "\nExecução concluída.\n";
    return 0;
}
