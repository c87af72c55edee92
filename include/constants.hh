#pragma once

#include <array>
#include <string>
using namespace std;

const int NB_TYPES = 3;
const array<string, NB_TYPES> power_plant_types = {"gasfired", "turbojet", "windturbine"};

const double CO2_GAS_EMISSION_FACTOR = 0.3;  // ton CO2 per MWh, all gas-fired plants
const long   POWER_TENTHS = 10;              // output steps per MW (0.1 MW grid)
const double EPSILON      = 1e-6;            // MW
