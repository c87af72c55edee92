#pragma once

#include <string>
#include <vector>
using namespace std;

/* Process exit status, the worst one wins in batch mode */
const int STATUS_OK           = 0;
const int STATUS_INVALID      = 1;
const int STATUS_INFEASIBLE   = 2;
const int STATUS_WRITE_FAILED = 3;

/**
 *  @brief      Read a list of payload paths, one per line. Blank lines and
 *              lines starting with '#' are ignored. Throws InvalidInput.
*/
vector<string> read_payload_list(const string &path);

/**
 *  @brief  Output path of a payload's plan: <out_dir>/<payload stem>.plan.json
*/
string plan_path(const string &out_dir, const string &payload_path);

/**
 *  @brief              Validate one payload, dispatch it and save its plan.
 *  @param payload_path the JSON payload.
 *  @param out_path     where the plan is written.
 *  @return             STATUS_OK, STATUS_INVALID, STATUS_INFEASIBLE or STATUS_WRITE_FAILED.
*/
int process_payload(const string &payload_path, const string &out_path, bool verbose);
