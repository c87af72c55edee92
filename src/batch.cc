#include "batch.hh"
#include "mpi.h"
#include <algorithm>
#include <cstdio>

int run_batch(const vector<string> &payloads, const string &out_dir, bool verbose) {
  // Get the number of processes
  int size;
  MPI_Comm_size(MPI_COMM_WORLD, &size);

  // Get the rank of the process
  int rank;
  MPI_Comm_rank(MPI_COMM_WORLD, &rank);

  /*
   * Payloads are independent, so every rank takes its share round-robin and
   * nothing but the final status is exchanged.
  */
  int status  = STATUS_OK;
  int written = 0;
  for (size_t i = rank; i < payloads.size(); i += size) {
    int payload_status = process_payload(payloads[i], plan_path(out_dir, payloads[i]), verbose);
    if (payload_status == STATUS_OK)
      written++;
    status = max(status, payload_status);
  }

  int status_all  = STATUS_OK;
  int written_all = 0;
  MPI_Allreduce(&status, &status_all, 1, MPI_INT, MPI_MAX, MPI_COMM_WORLD);
  MPI_Reduce(&written, &written_all, 1, MPI_INT, MPI_SUM, 0, MPI_COMM_WORLD);

  if (rank == 0)
    printf("%d/%zu production plans written on %d processes.\n", written_all, payloads.size(), size);

  MPI_Barrier(MPI_COMM_WORLD);
  return status_all;
}
