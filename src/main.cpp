#include "version.hpp"

#include "./json_to_config.hpp"
#include "./rollcall_host.hpp"
#include "./event_log.hpp"
#include "./roster_filter.hpp"

#include <solanaceae/util/simple_config_model.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

static void printUsage(std::string_view exe) {
	std::cout << "usage: " << exe << " [-c config.json] [-s state.json] [-e events.json]... [--show-all] [--no-save]\n";
}

static void printRoster(RollcallHost& host, const RosterFilter& filter) {
	const auto& s = host.settings();

	std::cout << "=== players (" << (filter.show_all ? "all" : "in squad") << ") ===\n";
	for (const auto& p : collectVisible(host.roster(), filter)) {
		std::cout << (p.present ? "  " : "- ") << p.name();
		if (!p.comment().empty()) {
			std::cout << " : " << p.comment();
		}
		std::cout << "\n";
	}

	if (s.shortcut_key.has_value()) {
		std::cout << "shortcut: " << shortcutKeyName(s.shortcut_key.value()) << "\n";
	} else {
		std::cout << "no shortcut set\n";
	}
}

int main(int argc, char** argv) {
	std::cout << "rollcall " ROLLCALL_VERSION_STR "\n";

	// better args
	std::vector<std::string_view> args;
	for (int i = 0; i < argc; i++) {
		args.push_back(argv[i]);
	}

	SimpleConfigModel conf;
	bool config_loaded {false};
	std::string config_path;
	std::string state_path_arg;
	std::vector<std::string> event_log_paths;
	bool show_all_arg {false};
	bool no_save {false};

	for (size_t ai = 1; ai < args.size(); ai++) {
		if (args.at(ai) == "--config" || args.at(ai) == "-c") {
			if (config_loaded) {
				std::cerr << "ROLLCALL error: config specified more than once!\n";
				return 1;
			}
			if (args.size() == ai+1) {
				std::cerr << "ROLLCALL error: argument '" << args.at(ai) << "' missing parameter!\n";
				return 1;
			}
			ai++;

			config_path = args.at(ai);
			auto config_file = std::ifstream(config_path);
			if (!config_file.is_open()) {
				std::cerr << "ROLLCALL error: failed to open config file '" << config_path << "'\n";
				return 1;
			}

			const auto config_json = nlohmann::ordered_json::parse(config_file, nullptr, false);
			if (config_json.is_discarded() || !load_json_into_config(config_json, conf)) {
				std::cerr << "ROLLCALL error in config json, exiting...\n";
				return 1;
			}
			config_loaded = true;
		} else if (args.at(ai) == "--state" || args.at(ai) == "-s") {
			if (args.size() == ai+1) {
				std::cerr << "ROLLCALL error: argument '" << args.at(ai) << "' missing parameter!\n";
				return 1;
			}
			ai++;
			state_path_arg = args.at(ai);
		} else if (args.at(ai) == "--events" || args.at(ai) == "-e") {
			if (args.size() == ai+1) {
				std::cerr << "ROLLCALL error: argument '" << args.at(ai) << "' missing parameter!\n";
				return 1;
			}
			ai++;
			event_log_paths.emplace_back(args.at(ai));
		} else if (args.at(ai) == "--show-all") {
			show_all_arg = true;
		} else if (args.at(ai) == "--no-save") {
			no_save = true;
		} else if (args.at(ai) == "--help" || args.at(ai) == "-h") {
			printUsage(args.at(0));
			return 0;
		} else {
			std::cerr << "ROLLCALL error: unknown cli arg: '" << args.at(ai) << "'\n";
			printUsage(args.at(0));
			return 1;
		}
	}

	// cli > config > default, config paths are relative to the config file
	std::string state_path = state_path_arg;
	if (state_path.empty()) {
		std::filesystem::path real_state_path = static_cast<std::string>(
			conf.get_string("rollcall", "state_file_path").value_or("player_list.json")
		);
		if (real_state_path.is_relative() && !config_path.empty()) {
			real_state_path = std::filesystem::path{config_path}.parent_path() / real_state_path;
		}
		state_path = real_state_path.generic_string();
	}

	RollcallHost host{conf, state_path};

	EventLogReplayer replayer{host.events(), host.roster(), host.addPlaceholder()};
	for (const auto& log_path : event_log_paths) {
		std::ifstream log_file{log_path};
		if (!log_file.is_open()) {
			std::cerr << "ROLLCALL error: failed to open event log '" << log_path << "'\n";
			return 1;
		}

		const auto log_json = nlohmann::ordered_json::parse(log_file, nullptr, false);
		if (log_json.is_discarded()) {
			std::cerr << "ROLLCALL error: event log '" << log_path << "' is not valid json\n";
			return 1;
		}

		replayer.replay(log_json);
	}

	auto filter = host.makeFilter();
	if (show_all_arg) {
		filter.show_all = true;
	}
	printRoster(host, filter);

	if (no_save) {
		return 0;
	}

	try {
		host.save();
	} catch (const std::runtime_error& e) {
		std::cerr << "ROLLCALL error: saving failed, changes are lost: " << e.what() << "\n";
		return 2;
	}

	return 0;
}
