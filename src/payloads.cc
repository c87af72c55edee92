#include "payloads.hh"
#include "algorithms.hh"
#include "errors.hh"
#include <cstdio>
#include <fstream>

vector<string> read_payload_list(const string &path) {
  ifstream file(path);
  if (!file)
    throw InvalidInput("Cannot read payload list \"" + path + "\".");

  vector<string> payloads;
  string line;
  while (getline(file, line)) {
    size_t first = line.find_first_not_of(" \t\r");
    if (first == string::npos || line[first] == '#')
      continue;
    size_t last = line.find_last_not_of(" \t\r");
    payloads.push_back(line.substr(first, last - first + 1));
  }
  return payloads;
}

string plan_path(const string &out_dir, const string &payload_path) {
  size_t slash = payload_path.find_last_of('/');
  string stem = (slash == string::npos) ? payload_path : payload_path.substr(slash + 1);
  size_t dot = stem.find_last_of('.');
  if (dot != string::npos && dot != 0)
    stem = stem.substr(0, dot);
  return out_dir + "/" + stem + ".plan.json";
}

int process_payload(const string &payload_path, const string &out_path, bool verbose) {
  Result result;
  try {
    Problem problem(payload_path);
    printf("%s: load of %.1f MW over %zu power plants.\n",
           payload_path.c_str(), problem.load, problem.powerplants.size());

    Dispatcher dispatcher(problem);
    dispatcher.set_verbose(verbose);
    dispatcher.run(result);
    dispatcher.print_result(result);

    if (!dispatcher.save_result(result, out_path)) {
      fprintf(stderr, "Error: cannot write production plan to \"%s\".\n", out_path.c_str());
      return STATUS_WRITE_FAILED;
    }
  } catch (const InvalidInput &e) {
    fprintf(stderr, "Error: %s: %s\n", payload_path.c_str(), e.what());
    return STATUS_INVALID;
  } catch (const InfeasibleDemand &e) {
    fprintf(stderr, "Error: %s: %s\n", payload_path.c_str(), e.what());
    return STATUS_INFEASIBLE;
  }
  printf("Production plan written to %s.\n", out_path.c_str());
  return STATUS_OK;
}
