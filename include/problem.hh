#pragma once

#include <iostream>
#include <vector>
#include "constants.hh"
using namespace std;

enum PlantType {
  GASFIRED,
  TURBOJET,
  WINDTURBINE
};

/**
 *  @brief  Map a payload type key ("gasfired", ...) to its PlantType.
 *  @return false if the key is unknown.
*/
bool plant_type_from_string(const string &key, PlantType &type);
string plant_type_to_string(PlantType type);

struct Fuels {
  double gas;       // euro/MWh
  double kerosine;  // euro/MWh
  double co2;       // euro/ton
  double wind;      // % of pmax available
};

struct PowerPlant {
  string    name;
  PlantType type;
  double    efficiency;
  double    pmin;
  double    pmax;
};

class Problem {
  public:
    Problem() = default;

    /**
     *  @brief      Read and validate a payload file.
     *  @param path path of the JSON payload.
    */
    Problem(string path);

    /**
     *  @brief      Fill the problem from JSON payload text, then validate it.
     *              Throws InvalidInput on malformed or inconsistent payloads.
    */
    void parse(const string &text);

    /**
     *  @brief Structural checks on load, fuels and plants. Throws InvalidInput.
    */
    void validate() const;

    /* Attributes */
    double             load = 0.0;
    Fuels              fuels = {0.0, 0.0, 0.0, 0.0};
    vector<PowerPlant> powerplants;
};
