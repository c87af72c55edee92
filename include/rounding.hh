#pragma once

#include "algorithms.hh"

/**
 *  @brief    Round a power to the 0.1 MW grid, half-up.
 *  @return   The power in tenths of MW.
*/
long long to_tenths(double mw);

/**
 *  @brief             Round every output to 0.1 MW and put the rounding residual on
 *                     the running plant with the largest output that can absorb it.
 *                     Throws InfeasibleDemand if no plant can.
 *  @param merit_order the evaluated plants, sorted by merit order.
 *  @param raw         unrounded outputs, indexed by payload position.
 *  @param load        the demand in MW.
 *  @return            One assignment per plant, in payload order.
*/
vector<Assignment> finalize(const vector<EvaluatedPlant> &merit_order,
                            const vector<double> &raw, double load);
