#ifndef REPORT_HPP
#define REPORT_HPP

#include "vrp.hpp"
#include "service_plan.hpp"
#include <ostream>
#include <string>

// Relatório texto das rotas: paradas de cada veículo, distâncias e demanda não atendida
void write_route_report(std::ostream& out, const Scenario& sc, const ServicePlan& plan);

// Resumo curto para o console: rótulo e operação de cada parada, por veículo
void write_route_summary(std::ostream& out, const ServicePlan& plan);

// Grava o relatório em arquivo. Retorna false se o arquivo não pôde ser aberto.
bool save_routes(const Scenario& sc, const ServicePlan& plan, const std::string& filename);

#endif // REPORT_HPP
