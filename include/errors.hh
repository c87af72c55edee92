#pragma once

#include <stdexcept>
#include <string>
using namespace std;

/**
 *  @brief Structural problem with a payload (negative load, pmax < pmin, ...).
 *         Raised by the payload reader before the engine runs.
*/
class InvalidInput: public invalid_argument {
  public:
    explicit InvalidInput(const string &what) : invalid_argument(what) {};
};

/**
 *  @brief The fleet cannot match the load exactly.
 *  @param missing MW left uncovered (positive) or forced above load by minimum
 *                 outputs (negative). 0 when not meaningful.
*/
class InfeasibleDemand: public runtime_error {
  public:
    InfeasibleDemand(const string &what, double missing = 0.0)
      : runtime_error(what), missing(missing) {};

    double missing;
};
