#pragma once

#include "merit_order.hh"

struct Infos {
  string algorithm;
  int nb_plants;
  double elapsed_time;
};

static Infos mk_infos(string algorithm, int nb_plants, double elapsed_time) {
  Infos infos = {algorithm, nb_plants, elapsed_time};
  return infos;
};

struct Assignment {
  string name;
  double p;  // MW, multiple of 0.1
};

struct Result {
  vector<Assignment>     plan;         // payload order
  vector<EvaluatedPlant> merit_order;
  Infos infos;
};

/**
 *  @brief             Split the load over the plants, cheapest first, honouring
 *                     every plant's effective [pmin, pmax]. A plant whose pmin
 *                     exceeds the residual load is skipped when the plants after
 *                     it can still cover the residual, otherwise the last
 *                     committed plant is backed off so that it can run at pmin.
 *                     Throws InfeasibleDemand when no such split exists.
 *  @param merit_order the evaluated plants, sorted by merit order.
 *  @param load        the demand in MW.
 *  @param verbose     trace every decision on stderr.
 *  @return            Unrounded output per plant, indexed by payload position.
*/
vector<double> allocate(const vector<EvaluatedPlant> &merit_order, double load, bool verbose = false);

/**
 *  @brief         Whole pipeline: cost model, merit order, allocation and rounding.
 *  @param problem a validated problem.
 *  @return        One assignment per plant, in payload order.
*/
vector<Assignment> compute_plan(const Problem &problem);

string plan_to_string(const vector<Assignment> &plan);

class Dispatcher {
  public:
    Dispatcher(Problem problem);
    ~Dispatcher() = default;

    void set_verbose(bool verbose);

    /**
     *  @brief        Compute the production plan of the problem.
     *  @param result the address where the plan and its infos will be stored.
    */
    void run(Result &result);

    /**
     *  @brief        Print the production plan in a pretty way.
     *  @param result the result you want to print.
    */
    void print_result(Result result);

    /**
     *  @brief        Save the production plan as a JSON array of {name, p}.
     *  @param result the result you want to save.
     *  @return       false if the file could not be written.
    */
    bool save_result(Result result, string path);

  private:
    string name;
    bool verbose;
  protected:
    Problem problem;
};
