#include "merit_order.hh"
#include <algorithm>

vector<EvaluatedPlant> merit_order(vector<EvaluatedPlant> evaluated) {
  // free thermal plants (zero prices) still come after wind
  stable_sort(evaluated.begin(), evaluated.end(),
              [](const EvaluatedPlant &a, const EvaluatedPlant &b) {
                if (a.cost != b.cost)
                  return a.cost < b.cost;
                return a.type == WINDTURBINE && b.type != WINDTURBINE;
              });
  return evaluated;
}
