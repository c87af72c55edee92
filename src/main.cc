#include "batch.hh"
#include "errors.hh"
#include "parse_args.hh"
#include "utils.hh"
#include "mpi.h"

static void print_usage() {
  printf("Usage: productionplan (-js <payload.json> | -l <payload list>) [-p <output dir>] [-v]\n");
}

int main(int argc, char** argv) {
  /* MPI initialisation */
  MPI_Init(&argc, &argv);

  int rank;
  MPI_Comm_rank(MPI_COMM_WORLD, &rank);

  bool verbose          = cmdOptionExists(argv, argv + argc, "-v");
  const char* json_path = getCmdOption(argv, argv + argc, "-js");
  const char* list_path = getCmdOption(argv, argv + argc, "-l");
  const char* save_path = getCmdOption(argv, argv + argc, "-p");
  string out_dir = save_path ? save_path : ".";

  if (rank == 0)
    print_cpp_version();

  bool missing_value = cmdOptionMissingValue(argv, argv + argc, "-js")
                    || cmdOptionMissingValue(argv, argv + argc, "-l")
                    || cmdOptionMissingValue(argv, argv + argc, "-p");

  int status = STATUS_OK;
  if (missing_value || (json_path == 0) == (list_path == 0)) {
    if (rank == 0)
      print_usage();
    status = STATUS_INVALID;
  }

  else if (json_path != 0) {
    if (rank == 0)
      status = process_payload(json_path, plan_path(out_dir, json_path), verbose);
    MPI_Bcast(&status, 1, MPI_INT, 0, MPI_COMM_WORLD);
  }

  else {
    vector<string> payloads;
    try {
      payloads = read_payload_list(list_path);
    } catch (const InvalidInput &e) {
      if (rank == 0)
        fprintf(stderr, "Error: %s\n", e.what());
      status = STATUS_INVALID;
    }
    if (status == STATUS_OK)
      status = run_batch(payloads, out_dir, verbose);
  }

  MPI_Finalize();
  return status;
}
