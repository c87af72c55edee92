#include "algorithms.hh"
#include "errors.hh"
#include "rounding.hh"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <limits>
using namespace chrono;

static double get_time_milli() {
  return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

/*******************************/
/**********ALLOCATION***********/
/*******************************/

vector<double> allocate(const vector<EvaluatedPlant> &merit_order, double load, bool verbose) {
  size_t n = merit_order.size();
  vector<double> power(n, 0.0);  // merit position
  vector<size_t> committed;      // merit positions, in commit order

  // capacity_after[k]: pmax of every plant after position k
  // floor_after[k]: lowest pmin among the plants after position k that can run at all
  vector<double> capacity_after(n, 0.0);
  vector<double> floor_after(n, numeric_limits<double>::infinity());
  for (size_t k=n; k-- > 1;) {
    capacity_after[k-1] = capacity_after[k] + merit_order[k].pmax;
    floor_after[k-1] = floor_after[k];
    if (merit_order[k].pmax > EPSILON)
      floor_after[k-1] = min(floor_after[k-1], merit_order[k].pmin);
  }

  double remaining = load;
  for (size_t k=0; k<n && remaining > EPSILON; k++) {
    const EvaluatedPlant &plant = merit_order[k];
    double want = min(remaining, plant.pmax);
    if (want <= EPSILON)
      continue;

    if (want < plant.pmin - EPSILON) {
      // skipping only helps if a later plant can go as low as the residual
      if (capacity_after[k] >= remaining - EPSILON && floor_after[k] <= remaining + EPSILON) {
        if (verbose)
          fprintf(stderr, "[dispatch] skip %s: pmin %.1f MW above residual %.3f MW\n",
                  plant.name.c_str(), plant.pmin, remaining);
        continue;
      }

      /*
       * Nothing after this plant can take the residual, so it has to run at
       * pmin. Back off the most recently committed plant that is above its own
       * pmin to make room; only that one plant is touched.
      */
      double needed = plant.pmin - remaining;
      size_t donor = n;
      for (size_t c=committed.size(); c-- > 0;) {
        size_t d = committed[c];
        if (power[d] - merit_order[d].pmin > EPSILON) {
          donor = d;
          break;
        }
      }

      double freed = 0.0;
      if (donor != n)
        freed = power[donor] - max(merit_order[donor].pmin, power[donor] - needed);

      if (remaining + freed < plant.pmin - EPSILON) {
        char error[200];
        snprintf(error, sizeof(error),
                 "Unable to meet load demand: %s cannot run below %.1f MW and only %.1f MW can be left to it.",
                 plant.name.c_str(), plant.pmin, remaining + freed);
        throw InfeasibleDemand(error, remaining - plant.pmin);
      }

      if (donor != n)
        power[donor] -= freed;
      remaining += freed;
      want = min(max(remaining, plant.pmin), plant.pmax);
      if (verbose && donor != n)
        fprintf(stderr, "[dispatch] back off %s by %.3f MW to run %s at pmin\n",
                merit_order[donor].name.c_str(), freed, plant.name.c_str());
    }

    power[k] = want;
    remaining -= want;
    committed.push_back(k);
    if (verbose)
      fprintf(stderr, "[dispatch] commit %s: %.3f MW, residual %.3f MW\n",
              plant.name.c_str(), want, remaining);
  }

  if (remaining > EPSILON) {
    char error[120];
    snprintf(error, sizeof(error),
             "Unable to meet load demand with available plants. Missing: %.1f MW", remaining);
    throw InfeasibleDemand(error, remaining);
  }

  vector<double> raw(n, 0.0);
  for (size_t k=0; k<n; k++) {
    raw[merit_order[k].index] = power[k];
  }
  return raw;
}

vector<Assignment> compute_plan(const Problem &problem) {
  Dispatcher dispatcher(problem);
  Result result;
  dispatcher.run(result);
  return result.plan;
}

/*******************************/
/**********DISPATCHER***********/
/*******************************/

Dispatcher::Dispatcher(Problem problem) {
  this->name = "Merit order dispatch";
  this->problem = problem;
  this->verbose = false;
}

void Dispatcher::set_verbose(bool verbose) {
  this->verbose = verbose;
}

void Dispatcher::run(Result &result) {
  double start_time = get_time_milli();

  result.merit_order = merit_order(evaluate_all(this->problem));
  vector<double> raw = allocate(result.merit_order, this->problem.load, this->verbose);
  result.plan = finalize(result.merit_order, raw, this->problem.load);

  result.infos = mk_infos(this->name, (int)this->problem.powerplants.size(),
                          (get_time_milli() - start_time) / 1000.0);
}
