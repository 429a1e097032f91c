#include "parameters.hpp"
#include <iostream>
#include <fstream>
#include <string>
#include <sstream>
#include <stdexcept>
#include <algorithm> // Para std::find_if
#include <cctype>    // Para std::isspace

// Função auxiliar para remover espaços em branco do início e fim de uma string
static void trim(std::string& s) {
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
        return !std::isspace(ch);
    }));
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) {
        return !std::isspace(ch);
    }).base(), s.end());
}

static WarehouseAssignment parse_assignment(const std::string& value) {
    if (value == "random") return WarehouseAssignment::Random;
    if (value == "by_vehicle_index") return WarehouseAssignment::ByVehicleIndex;
    throw std::invalid_argument(value);
}

// Lista de inteiros separados por espaço ou vírgula (ex: "1000, 1500, 2000")
static std::vector<int> parse_int_list(std::string value) {
    std::replace(value.begin(), value.end(), ',', ' ');
    std::stringstream ss(value);
    std::vector<int> out;
    std::string tok;
    while (ss >> tok) out.push_back(std::stoi(tok));
    if (out.empty()) throw std::invalid_argument(value);
    return out;
}

void load_parameters_from_file(const std::string& filename, GA_Params& ga_params, Scenario_Params& scenario_params) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "AVISO: Não foi possível abrir o arquivo de parâmetros '" << filename << "'. Usando valores padrão." << std::endl;
        return;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::stringstream ss(line);
        std::string key, value;
        if (std::getline(ss, key, '=') && std::getline(ss, value)) {
            trim(key);
            trim(value);

            try {
                // Parâmetros do GA
                if (key == "popSize") ga_params.popSize = std::stoi(value);
                else if (key == "nGen") ga_params.nGen = std::stoi(value);
                else if (key == "pMutation") ga_params.pMutation = std::stod(value);
                else if (key == "tournamentK") ga_params.tournamentK = std::stoi(value);
                else if (key == "nElites") ga_params.nElites = std::stoi(value);
                else if (key == "pOrderedCrossover") ga_params.pOrderedCrossover = std::stod(value);
                else if (key == "pLocalSearch") ga_params.pLocalSearch = std::stod(value);
                else if (key == "immigrantInterval") ga_params.immigrantInterval = std::stoi(value);
                else if (key == "nImmigrants") ga_params.nImmigrants = std::stoi(value);
                else if (key == "unloadThreshold") ga_params.unloadThreshold = std::stod(value);
                else if (key == "initialLoadFraction") ga_params.initialLoadFraction = std::stod(value);
                else if (key == "unmetPenalty") ga_params.unmetPenalty = std::stod(value);
                else if (key == "warehouseAssignment") ga_params.warehouseAssignment = parse_assignment(value);
                // Parâmetros do cenário
                else if (key == "nDeliveries") scenario_params.nDeliveries = std::stoi(value);
                else if (key == "nPickups") scenario_params.nPickups = std::stoi(value);
                else if (key == "minCoord") scenario_params.minCoord = std::stoi(value);
                else if (key == "maxCoord") scenario_params.maxCoord = std::stoi(value);
                else if (key == "minAmount") scenario_params.minAmount = std::stoi(value);
                else if (key == "maxAmount") scenario_params.maxAmount = std::stoi(value);
                else if (key == "vehicleCapacities") scenario_params.vehicleCapacities = parse_int_list(value);
                else if (key == "outputFile") scenario_params.outputFile = value;
            } catch (const std::exception& e) {
                std::cerr << "AVISO: Erro ao ler o valor para a chave '" << key << "'. Valor '" << value << "' é inválido." << std::endl;
            }
        }
    }
    std::cout << "Parâmetros lidos de '" << filename << "'." << std::endl;
}
