#include "rounding.hh"
#include "errors.hh"
#include <algorithm>
#include <cmath>
#include <cstdio>

long long to_tenths(double mw) {
  // nudge so that decimal halves (0.15, 2.45, ...) round up despite binary representation
  return (long long)floor(mw * POWER_TENTHS + 0.5 + 1e-9);
}

static long long lower_bound_tenths(const EvaluatedPlant &plant) {
  return (long long)ceil(plant.pmin * POWER_TENTHS - 1e-9);
}

static long long upper_bound_tenths(const EvaluatedPlant &plant) {
  return (long long)floor(plant.pmax * POWER_TENTHS + 1e-9);
}

vector<Assignment> finalize(const vector<EvaluatedPlant> &merit_order,
                            const vector<double> &raw, double load) {
  size_t n = merit_order.size();
  vector<long long> tenths(n, 0);  // merit position
  long long total = 0;

  for (size_t k=0; k<n; k++) {
    const EvaluatedPlant &plant = merit_order[k];
    double p = raw[plant.index];
    if (p <= EPSILON) continue;

    long long t = to_tenths(p);
    long long lo = lower_bound_tenths(plant);
    long long hi = upper_bound_tenths(plant);
    if (lo <= hi)
      t = max(lo, min(t, hi));
    tenths[k] = t;
    total += t;
  }

  long long residual = to_tenths(load) - total;
  if (residual != 0) {
    vector<size_t> candidates;
    for (size_t k=0; k<n; k++) {
      if (tenths[k] > 0) candidates.push_back(k);
    }
    stable_sort(candidates.begin(), candidates.end(),
                [&](size_t a, size_t b) { return tenths[a] > tenths[b]; });

    bool placed = false;
    for (size_t k : candidates) {
      long long t = tenths[k] + residual;
      long long lo = lower_bound_tenths(merit_order[k]);
      long long hi = upper_bound_tenths(merit_order[k]);
      if (t >= max(lo, 0LL) && t <= hi) {
        tenths[k] = t;
        placed = true;
        break;
      }
    }
    if (!placed) {
      double missing = (double)residual / POWER_TENTHS;
      char error[120];
      snprintf(error, sizeof(error), "Cannot absorb a rounding residual of %.1f MW on a single plant.", missing);
      throw InfeasibleDemand(error, missing);
    }
  }

  vector<Assignment> plan(n);
  for (size_t k=0; k<n; k++) {
    plan[merit_order[k].index] = {merit_order[k].name, (double)tenths[k] / POWER_TENTHS};
  }
  return plan;
}
