#ifndef PARAMETERS_HPP
#define PARAMETERS_HPP

#include <string>
#include <vector>

// Como cada veículo é associado a um armazém em cada avaliação
enum class WarehouseAssignment {
    Random,          // sorteio uniforme por veículo, a cada avaliação
    ByVehicleIndex   // fixo, derivado de um hash do índice do veículo
};

// Parâmetros do Algoritmo Genético
struct GA_Params {
    int popSize = 50;
    int nGen = 100;
    double pMutation = 0.2;          // Probabilidade da mutação por troca
    int tournamentK = 3;
    int nElites = 2;
    double pOrderedCrossover = 0.7;  // Senão, crossover espacial
    double pLocalSearch = 0.2;       // Probabilidade de aplicar o 2-opt no filho
    int immigrantInterval = 5;       // A cada quantas gerações injetar imigrantes
    int nImmigrants = 10;

    // Simulação do plano de serviço
    double unloadThreshold = 0.8;      // Fração da capacidade que força descarga
    double initialLoadFraction = 0.25; // Fração da capacidade na carga inicial
    double unmetPenalty = 0.0;         // Custo por unidade de demanda não atendida
    WarehouseAssignment warehouseAssignment = WarehouseAssignment::Random;
};

// Parâmetros do gerador de cenários aleatórios
struct Scenario_Params {
    int nDeliveries = 20;
    int nPickups = 10;
    int minCoord = 10;
    int maxCoord = 90;
    int minAmount = 100;
    int maxAmount = 200;
    std::vector<int> vehicleCapacities = {1000, 1500, 2000, 2000};
    std::string outputFile = "routes_pickup_delivery.txt";
};

void load_parameters_from_file(const std::string& filename, GA_Params& ga_params, Scenario_Params& scenario_params);

#endif // PARAMETERS_HPP
