#pragma once

#include "problem.hh"

/**
 *  Plant as seen by the dispatcher for one request: marginal cost and the
 *  output range it can actually deliver under the current fuels.
*/
struct EvaluatedPlant {
  size_t    index;  // position in the payload
  string    name;
  PlantType type;
  double    cost;   // euro/MWh
  double    pmin;   // MW
  double    pmax;   // MW
};

/**
 *  @brief        Marginal cost and effective range of a plant.
 *  @param index  position of the plant in the payload.
 *  @param plant  the plant as read from the payload.
 *  @param fuels  current fuel prices and wind availability.
 *  @return       The evaluated plant.
*/
EvaluatedPlant evaluate(size_t index, const PowerPlant &plant, const Fuels &fuels);

vector<EvaluatedPlant> evaluate_all(const Problem &problem);
