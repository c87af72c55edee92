/*
Command line option tests.
*/
#include "parse_args.hh"
#include "test_utils.hh"
#include <cstring>
#include <vector>

// Mutable argv built from string literals
struct Args {
  vector<vector<char>> storage;
  vector<char*> argv;

  Args(std::initializer_list<const char*> words) {
    for (const char* word : words)
      storage.push_back(vector<char>(word, word + strlen(word) + 1));
    for (vector<char> &word : storage)
      argv.push_back(word.data());
  }
  char** begin() { return argv.data(); }
  char** end() { return argv.data() + argv.size(); }
};

static int test_option_value() {
  Args args = {"productionplan", "-js", "payload1.json", "-p", "out", "-v"};
  EXPECT(strcmp(getCmdOption(args.begin(), args.end(), "-js"), "payload1.json") == 0, "payload path");
  EXPECT(strcmp(getCmdOption(args.begin(), args.end(), "-p"), "out") == 0, "output dir");
  EXPECT(getCmdOption(args.begin(), args.end(), "-l") == 0, "absent option");
  EXPECT(cmdOptionExists(args.begin(), args.end(), "-v"), "flag");
  EXPECT(!cmdOptionExists(args.begin(), args.end(), "-l"), "absent flag");
  return 0;
}

static int test_value_missing_at_end() {
  Args args = {"productionplan", "-js", "payload1.json", "-p"};
  EXPECT(getCmdOption(args.begin(), args.end(), "-p") == 0, "no value after the last option");
  EXPECT(cmdOptionMissingValue(args.begin(), args.end(), "-p"), "reported as missing");
  EXPECT(!cmdOptionMissingValue(args.begin(), args.end(), "-js"), "payload path present");
  EXPECT(!cmdOptionMissingValue(args.begin(), args.end(), "-l"), "absent is not missing");
  return 0;
}

static int test_value_is_another_option() {
  Args args = {"productionplan", "-l", "-v"};
  EXPECT(getCmdOption(args.begin(), args.end(), "-l") == 0, "an option is not a value");
  EXPECT(cmdOptionMissingValue(args.begin(), args.end(), "-l"), "list path missing");

  Args dash = {"productionplan", "-js", "-"};
  EXPECT(strcmp(getCmdOption(dash.begin(), dash.end(), "-js"), "-") == 0, "lone dash is a value");
  return 0;
}

int main(void)
{
    if (test_option_value() != 0) return 1;
    if (test_value_missing_at_end() != 0) return 1;
    if (test_value_is_another_option() != 0) return 1;
    return 0;
}
