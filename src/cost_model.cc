#include "cost_model.hh"

EvaluatedPlant evaluate(size_t index, const PowerPlant &plant, const Fuels &fuels) {
  EvaluatedPlant evaluated = {index, plant.name, plant.type, 0.0, plant.pmin, plant.pmax};

  switch (plant.type) {
    case GASFIRED:
      evaluated.cost = fuels.gas / plant.efficiency + fuels.co2 * CO2_GAS_EMISSION_FACTOR;
      break;
    case TURBOJET:
      evaluated.cost = fuels.kerosine / plant.efficiency;
      break;
    case WINDTURBINE:
      evaluated.pmin = 0.0;
      evaluated.pmax = plant.pmax * fuels.wind / 100.0;
      break;
  }
  return evaluated;
}

vector<EvaluatedPlant> evaluate_all(const Problem &problem) {
  vector<EvaluatedPlant> evaluated;
  evaluated.reserve(problem.powerplants.size());
  for (size_t i=0; i<problem.powerplants.size(); i++) {
    evaluated.push_back(evaluate(i, problem.powerplants[i], problem.fuels));
  }
  return evaluated;
}
