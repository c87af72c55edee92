#pragma once

#include "payloads.hh"

/**
 *  @brief          Dispatch every payload, spread round-robin over the MPI ranks.
 *  @return         The worst status over all ranks.
*/
int run_batch(const vector<string> &payloads, const string &out_dir, bool verbose);
