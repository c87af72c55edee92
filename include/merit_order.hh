#pragma once

#include "cost_model.hh"

/**
 *  @brief           Sort plants by ascending marginal cost. On equal cost wind
 *                   comes first, otherwise plants keep their payload order.
 *  @param evaluated the evaluated plants, in any order.
 *  @return          The merit order.
*/
vector<EvaluatedPlant> merit_order(vector<EvaluatedPlant> evaluated);
