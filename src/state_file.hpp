#pragma once

#include "./player.hpp"
#include "./settings.hpp"

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <vector>

struct PersistedState {
	std::vector<PlayerRecord> players;
	Settings settings;
};

// never fails, every missing or broken field falls back to its default.
// broken player records are skipped
PersistedState stateFromJson(const nlohmann::ordered_json& j);
PersistedState loadStateFile(const std::string& path);

// only players with a comment are written
nlohmann::ordered_json stateToJson(const std::vector<PlayerRecord>& players, const Settings& settings);

// throws std::runtime_error, losing the roster is not something to hide
void saveStateFile(const std::string& path, const std::vector<PlayerRecord>& players, const Settings& settings);
