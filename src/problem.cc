#include "problem.hh"
#include "errors.hh"
#include "nlohmann/json.hpp"
#include <cmath>
#include <fstream>
#include <set>
#include <sstream>
using namespace nlohmann;

bool plant_type_from_string(const string &key, PlantType &type) {
  if (key == power_plant_types[GASFIRED])         type = GASFIRED;
  else if (key == power_plant_types[TURBOJET])    type = TURBOJET;
  else if (key == power_plant_types[WINDTURBINE]) type = WINDTURBINE;
  else return false;
  return true;
}

string plant_type_to_string(PlantType type) {
  return power_plant_types[type];
}

static double get_number(const json &j, const string &key, const string &where) {
  auto it = j.find(key);
  if (it == j.end())
    throw InvalidInput("Missing \"" + key + "\" in " + where + ".");
  if (!it->is_number())
    throw InvalidInput("\"" + key + "\" in " + where + " must be a number.");
  return it->get<double>();
}

// Fuel keys come either with their unit ("gas(euro/MWh)") or bare ("gas").
static double get_fuel(const json &fuels, const string &key) {
  if (fuels.contains(key))
    return get_number(fuels, key, "fuels");
  string bare = key.substr(0, key.find('('));
  if (fuels.contains(bare))
    return get_number(fuels, bare, "fuels");
  throw InvalidInput("Missing fuel value: " + key + ".");
}

Problem::Problem(string path) {
  ifstream file(path);
  if (!file)
    throw InvalidInput("Cannot read payload file \"" + path + "\".");
  ostringstream ss;
  ss << file.rdbuf();
  file.close();
  this->parse(ss.str());
}

void Problem::parse(const string &text) {
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error &e) {
    throw InvalidInput(string("Malformed JSON payload: ") + e.what());
  }
  if (!j.is_object())
    throw InvalidInput("Payload must be a JSON object.");

  this->load = get_number(j, "load", "payload");

  auto fuels = j.find("fuels");
  if (fuels == j.end() || !fuels->is_object())
    throw InvalidInput("Missing \"fuels\" object in payload.");
  this->fuels.gas      = get_fuel(*fuels, "gas(euro/MWh)");
  this->fuels.kerosine = get_fuel(*fuels, "kerosine(euro/MWh)");
  this->fuels.co2      = get_fuel(*fuels, "co2(euro/ton)");
  this->fuels.wind     = get_fuel(*fuels, "wind(%)");

  auto plants = j.find("powerplants");
  if (plants == j.end() || !plants->is_array())
    throw InvalidInput("Missing \"powerplants\" array in payload.");

  this->powerplants.clear();
  for (size_t i=0; i<plants->size(); i++) {
    const json &pp = (*plants)[i];
    string where = "powerplants[" + std::to_string(i) + "]";
    if (!pp.is_object())
      throw InvalidInput(where + " must be an object.");

    PowerPlant plant;
    auto name = pp.find("name");
    if (name == pp.end() || !name->is_string())
      throw InvalidInput("Missing \"name\" string in " + where + ".");
    plant.name = name->get<string>();

    auto type = pp.find("type");
    if (type == pp.end() || !type->is_string())
      throw InvalidInput("Missing \"type\" string in " + where + ".");
    if (!plant_type_from_string(type->get<string>(), plant.type))
      throw InvalidInput("Unknown plant type \"" + type->get<string>() + "\" in " + where + ".");

    plant.efficiency = get_number(pp, "efficiency", where);
    plant.pmin       = get_number(pp, "pmin", where);
    plant.pmax       = get_number(pp, "pmax", where);
    this->powerplants.push_back(plant);
  }

  this->validate();
}

void Problem::validate() const {
  if (!isfinite(this->load) || this->load < 0)
    throw InvalidInput("Load must be a non-negative value.");

  const double prices[] = {this->fuels.gas, this->fuels.kerosine, this->fuels.co2};
  for (double price : prices) {
    if (!isfinite(price) || price < 0)
      throw InvalidInput("Fuel prices must be non-negative values.");
  }
  if (!isfinite(this->fuels.wind) || this->fuels.wind < 0 || this->fuels.wind > 100)
    throw InvalidInput("Wind availability must be within [0, 100] %.");

  set<string> names;
  for (const PowerPlant &plant : this->powerplants) {
    if (plant.name.empty())
      throw InvalidInput("Power plant names must not be empty.");
    if (!names.insert(plant.name).second)
      throw InvalidInput("Duplicate power plant name \"" + plant.name + "\".");

    if (!isfinite(plant.efficiency))
      throw InvalidInput("Efficiency of " + plant.name + " is not a number.");
    if (plant.type != WINDTURBINE && (plant.efficiency <= 0 || plant.efficiency > 1))
      throw InvalidInput("Efficiency of " + plant.name + " must be within (0, 1].");

    if (!isfinite(plant.pmin) || !isfinite(plant.pmax) || plant.pmin < 0)
      throw InvalidInput("pmin of " + plant.name + " must be a non-negative value.");
    if (plant.pmax < plant.pmin)
      throw InvalidInput("pmax of " + plant.name + " is lower than its pmin.");
  }
}
