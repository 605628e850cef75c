#include "./json_to_config.hpp"

#include <solanaceae/util/simple_config_model.hpp>

#include <nlohmann/json.hpp>

#include <iostream>

// fn_set gets called with the typed value
template<typename FN>
static bool visitConfigValue(const nlohmann::ordered_json& value, FN&& fn_set) {
	if (value.is_string()) {
		fn_set(std::string_view{value.get_ref<const std::string&>()});
	} else if (value.is_boolean()) {
		fn_set(value.get<bool>());
	} else if (value.is_number_float()) {
		fn_set(value.get<double>());
	} else if (value.is_number_integer()) {
		fn_set(value.get<int64_t>());
	} else {
		return false;
	}
	return true;
}

bool load_json_into_config(const nlohmann::ordered_json& config_json, SimpleConfigModel& conf) {
	if (!config_json.is_object()) {
		std::cerr << "ROLLCALL error: config file is not an json object!!!\n";
		return false;
	}

	for (const auto& [mod, cats] : config_json.items()) {
		if (!cats.is_object()) {
			std::cerr << "JSON error: module '" << mod << "' is not an object\n";
			return false;
		}

		for (const auto& [cat, cat_v] : cats.items()) {
			if (!cat_v.is_object()) {
				const bool ok = visitConfigValue(cat_v, [&conf, &m = mod, &c = cat](const auto v) {
					conf.set(m, c, v);
				});
				if (!ok) {
					std::cerr << "JSON error: wrong value type in " << mod << "::" << cat << " = " << cat_v << "\n";
					return false;
				}
				continue;
			}

			if (cat_v.contains("default")) {
				const auto& value = cat_v["default"];
				const bool ok = visitConfigValue(value, [&conf, &m = mod, &c = cat](const auto v) {
					conf.set(m, c, v);
				});
				if (!ok) {
					std::cerr << "JSON error: wrong value type in " << mod << "::" << cat << " = " << value << "\n";
					return false;
				}
			}
			if (cat_v.contains("entries")) {
				for (const auto& [ent, ent_v] : cat_v["entries"].items()) {
					const bool ok = visitConfigValue(ent_v, [&conf, &m = mod, &c = cat, &e = ent](const auto v) {
						conf.set(m, c, e, v);
					});
					if (!ok) {
						std::cerr << "JSON error: wrong value type in " << mod << "::" << cat << "::" << ent << " = " << ent_v << "\n";
						return false;
					}
				}
			}
		}
	}

	return true;
}
