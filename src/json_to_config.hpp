#pragma once

#include <nlohmann/json_fwd.hpp>

// fwd
struct SimpleConfigModel;

// expects { "module": { "category": value | { "default": value, "entries": { "entry": value } } } }
// returns false on the first value of a type the config model can not hold
bool load_json_into_config(const nlohmann::ordered_json& config_json, SimpleConfigModel& conf);
