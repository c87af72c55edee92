/*
Payload parsing and validation tests.
*/
#include "algorithms.hh"
#include "errors.hh"
#include "test_utils.hh"

static const char* EXAMPLE_PAYLOAD = R"json({
  "load": 910,
  "fuels": {
    "gas(euro/MWh)": 13.4,
    "kerosine(euro/MWh)": 50.8,
    "co2(euro/ton)": 20,
    "wind(%)": 60
  },
  "powerplants": [
    {"name": "gasfiredbig1", "type": "gasfired", "efficiency": 0.53, "pmin": 100, "pmax": 460},
    {"name": "gasfiredbig2", "type": "gasfired", "efficiency": 0.53, "pmin": 100, "pmax": 460},
    {"name": "gasfiredsomewhatsmaller", "type": "gasfired", "efficiency": 0.37, "pmin": 40, "pmax": 210},
    {"name": "tj1", "type": "turbojet", "efficiency": 0.3, "pmin": 0, "pmax": 16},
    {"name": "windpark1", "type": "windturbine", "efficiency": 1, "pmin": 0, "pmax": 150},
    {"name": "windpark2", "type": "windturbine", "efficiency": 1, "pmin": 0, "pmax": 36}
  ]
})json";

static bool rejects(const string &text) {
  Problem problem;
  try {
    problem.parse(text);
  } catch (const InvalidInput &) {
    return true;
  }
  return false;
}

static string one_plant_payload(const string &load, const string &plant) {
  return "{\"load\": " + load + ", \"fuels\": {\"gas\": 13.4, \"kerosine\": 50.8, \"co2\": 20, \"wind\": 60},"
         " \"powerplants\": [" + plant + "]}";
}

static int test_parse_example() {
  Problem problem;
  problem.parse(EXAMPLE_PAYLOAD);
  EXPECT(problem.load == 910, "load");
  EXPECT(problem.fuels.gas == 13.4 && problem.fuels.kerosine == 50.8, "fuel prices");
  EXPECT(problem.fuels.co2 == 20 && problem.fuels.wind == 60, "co2 and wind");
  EXPECT(problem.powerplants.size() == 6, "plants");
  EXPECT(problem.powerplants[2].name == "gasfiredsomewhatsmaller", "name");
  EXPECT(problem.powerplants[2].type == GASFIRED, "gas type");
  EXPECT(problem.powerplants[3].type == TURBOJET, "turbojet type");
  EXPECT(problem.powerplants[5].type == WINDTURBINE && problem.powerplants[5].pmax == 36, "wind plant");
  EXPECT(problem.powerplants[2].efficiency == 0.37 && problem.powerplants[2].pmin == 40, "efficiency and pmin");
  return 0;
}

static int test_bare_fuel_keys() {
  Problem problem;
  problem.parse(one_plant_payload("10", R"({"name": "g", "type": "gasfired", "efficiency": 0.5, "pmin": 0, "pmax": 20})"));
  EXPECT(problem.fuels.gas == 13.4 && problem.fuels.wind == 60, "bare keys");
  EXPECT(problem.powerplants.size() == 1, "plant");
  return 0;
}

static int test_rejections() {
  const string gas = R"({"name": "g", "type": "gasfired", "efficiency": 0.5, "pmin": 10, "pmax": 20})";
  EXPECT(!rejects(one_plant_payload("0", gas)), "zero load accepted");
  EXPECT(rejects(one_plant_payload("-1", gas)), "negative load");
  EXPECT(rejects(one_plant_payload("\"ten\"", gas)), "load not a number");
  EXPECT(rejects(one_plant_payload("10", gas + ", " + gas)), "duplicate names");
  EXPECT(rejects(one_plant_payload("10", R"({"name": "g", "type": "gasfired", "efficiency": 0.5, "pmin": 30, "pmax": 20})")), "pmax < pmin");
  EXPECT(rejects(one_plant_payload("10", R"({"name": "g", "type": "gasfired", "efficiency": 0, "pmin": 0, "pmax": 20})")), "zero efficiency");
  EXPECT(rejects(one_plant_payload("10", R"({"name": "g", "type": "turbojet", "efficiency": 1.5, "pmin": 0, "pmax": 20})")), "efficiency above 1");
  EXPECT(rejects(one_plant_payload("10", R"({"name": "g", "type": "gasfired", "efficiency": 0.5, "pmin": -1, "pmax": 20})")), "negative pmin");
  EXPECT(rejects(one_plant_payload("10", R"({"name": "g", "type": "nuclear", "efficiency": 0.5, "pmin": 0, "pmax": 20})")), "unknown type");
  EXPECT(rejects(one_plant_payload("10", R"({"name": "", "type": "gasfired", "efficiency": 0.5, "pmin": 0, "pmax": 20})")), "empty name");
  EXPECT(rejects(one_plant_payload("10", R"({"type": "gasfired", "efficiency": 0.5, "pmin": 0, "pmax": 20})")), "missing name");
  EXPECT(!rejects(one_plant_payload("10", R"({"name": "w", "type": "windturbine", "efficiency": 0, "pmin": 0, "pmax": 20})")), "wind efficiency ignored");
  return 0;
}

static int test_malformed_payloads() {
  EXPECT(rejects("{\"load\": 10,"), "truncated JSON");
  EXPECT(rejects("[1, 2]"), "not an object");
  EXPECT(rejects(R"({"load": 10, "powerplants": []})"), "missing fuels");
  EXPECT(rejects(R"({"load": 10, "fuels": {"gas": 1, "kerosine": 1, "co2": 1}, "powerplants": []})"), "missing wind");
  EXPECT(rejects(R"({"load": 10, "fuels": {"gas": 1, "kerosine": 1, "co2": 1, "wind": 120}, "powerplants": []})"), "wind above 100 %");
  EXPECT(rejects(R"({"load": 10, "fuels": {"gas": 1, "kerosine": 1, "co2": 1, "wind": 10}})"), "missing powerplants");
  return 0;
}

static int test_missing_file() {
  bool thrown = false;
  try {
    Problem problem("/nonexistent/payload.json");
  } catch (const InvalidInput &) {
    thrown = true;
  }
  EXPECT(thrown, "unreadable payload");
  return 0;
}

static int test_plan_serialization() {
  Problem problem;
  problem.parse(EXAMPLE_PAYLOAD);
  string text = plan_to_string(compute_plan(problem));
  EXPECT(text.find("\"name\": \"gasfiredbig1\"") != string::npos, "name field");
  EXPECT(text.find("\"p\": 460.0") != string::npos, "power field");
  EXPECT(text.find("gasfiredbig1") < text.find("windpark1"), "payload order");
  return 0;
}

int main(void)
{
    if (test_parse_example() != 0) return 1;
    if (test_bare_fuel_keys() != 0) return 1;
    if (test_rejections() != 0) return 1;
    if (test_malformed_payloads() != 0) return 1;
    if (test_missing_file() != 0) return 1;
    if (test_plan_serialization() != 0) return 1;
    return 0;
}
