#include "algorithms.hh"
#include "nlohmann/json.hpp"
#include <cstdio>
#include <fstream>
using namespace nlohmann;

void print_infos(Infos infos) {
  cout << "Algorithm: " << infos.algorithm << '.' << endl;
  printf("%d power plants.\n", infos.nb_plants);
  printf("Finished in %.3f seconds.\n\n", infos.elapsed_time);
}

string plan_to_string(const vector<Assignment> &plan) {
  json j = json::array();
  for (const Assignment &assignment : plan) {
    j.push_back({{"name", assignment.name}, {"p", assignment.p}});
  }
  return j.dump(2);
}

void Dispatcher::print_result(Result result) {
  print_infos(result.infos);
  if (!this->verbose)
    return;

  printf("--------------------------RESULT-----------------------------\n");
  printf("%-28s %-12s %12s %10s\n", "Plant", "Type", "euro/MWh", "MW");

  double total = 0.0;
  for (const EvaluatedPlant &plant : result.merit_order) {
    double p = result.plan[plant.index].p;
    printf("%-28s %-12s %12.2f %10.1f\n", plant.name.c_str(),
           plant_type_to_string(plant.type).c_str(), plant.cost, p);
    total += p;
  }
  printf("\nTotal: %.1f MW for a load of %.1f MW.\n", total, this->problem.load);

  double cost = 0.0;
  for (const EvaluatedPlant &plant : result.merit_order) {
    cost += plant.cost * result.plan[plant.index].p;
  }
  printf("Hourly cost: %.2f euro.\n", cost);
  printf("-------------------------------------------------------------\n");
}

bool Dispatcher::save_result(Result result, string path) {
  ofstream file;
  file.open(path);
  if (!file)
    return false;
  file << plan_to_string(result.plan) << '\n';
  file.close();
  return !file.fail();
}
