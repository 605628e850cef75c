#include "./state_file.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <system_error>

static constexpr const char* g_key_players {"Players"};
static constexpr const char* g_key_window_open {"WindowOpen"};
static constexpr const char* g_key_inactive_color {"InactiveColor"};
static constexpr const char* g_key_comment_size {"CommentSize"};
static constexpr const char* g_key_show_all {"ShowAll"};
static constexpr const char* g_key_shortcut {"ShortcutKey"};

// all or nothing, out stays untouched on any mismatch
template<size_t N>
static bool readFloatArray(const nlohmann::ordered_json& j, std::array<float, N>& out, float min, float max) {
	if (!j.is_array() || j.size() != N) {
		return false;
	}

	std::array<float, N> tmp {};
	for (size_t i = 0; i < N; i++) {
		if (!j.at(i).is_number()) {
			return false;
		}
		tmp[i] = j.at(i).get<float>();
		if (!(tmp[i] >= min && tmp[i] <= max)) {
			return false;
		}
	}

	out = tmp;
	return true;
}

static bool readBool(const nlohmann::ordered_json& j, const char* key, bool& out) {
	if (!j.contains(key)) {
		return false;
	}
	const auto& v = j.at(key);
	if (!v.is_boolean()) {
		std::cerr << "STATE error: '" << key << "' is not a bool, using default\n";
		return false;
	}
	out = v.get<bool>();
	return true;
}

static std::vector<PlayerRecord> readPlayers(const nlohmann::ordered_json& j) {
	std::vector<PlayerRecord> players;

	if (!j.contains(g_key_players)) {
		return players;
	}
	const auto& j_players = j.at(g_key_players);
	if (!j_players.is_array()) {
		std::cerr << "STATE error: '" << g_key_players << "' is not an array, no players loaded\n";
		return players;
	}

	for (const auto& j_p : j_players) {
		if (!j_p.is_object()
			|| !j_p.contains("name") || !j_p.at("name").is_string()
			|| !j_p.contains("comment") || !j_p.at("comment").is_string()
		) {
			std::cout << "STATE debug: skipping malformed player " << j_p << "\n";
			continue;
		}

		players.push_back({
			j_p.at("name").get<std::string>(),
			j_p.at("comment").get<std::string>(),
		});
	}

	return players;
}

static std::optional<int32_t> readShortcut(const nlohmann::ordered_json& j) {
	if (!j.contains(g_key_shortcut)) {
		return std::nullopt;
	}
	const auto& v = j.at(g_key_shortcut);

	if (v.is_number_integer()) {
		const auto key = v.get<int64_t>();
		if (key < 0 || key > std::numeric_limits<int32_t>::max()) {
			std::cerr << "STATE error: shortcut key " << key << " out of range\n";
			return std::nullopt;
		}
		return static_cast<int32_t>(key);
	} else if (v.is_string()) {
		// older format
		auto key = shortcutKeyFromLetter(v.get_ref<const std::string&>());
		if (!key.has_value()) {
			std::cerr << "STATE error: unknown shortcut key " << v << "\n";
		}
		return key;
	}

	std::cerr << "STATE error: shortcut key has wrong type\n";
	return std::nullopt;
}

PersistedState stateFromJson(const nlohmann::ordered_json& j) {
	PersistedState state;

	if (!j.is_object()) {
		std::cerr << "STATE error: state is not a json object, using defaults\n";
		return state;
	}

	state.players = readPlayers(j);

	auto& s = state.settings;
	readBool(j, g_key_window_open, s.window_open);
	readBool(j, g_key_show_all, s.show_all);

	if (j.contains(g_key_inactive_color) && !readFloatArray(j.at(g_key_inactive_color), s.inactive_color, 0.f, 1.f)) {
		std::cerr << "STATE error: '" << g_key_inactive_color << "' needs 4 numbers in [0,1], using default\n";
	}
	if (j.contains(g_key_comment_size) && !readFloatArray(j.at(g_key_comment_size), s.comment_size, 0.f, std::numeric_limits<float>::max())) {
		std::cerr << "STATE error: '" << g_key_comment_size << "' needs 2 positive numbers, using default\n";
	}

	s.shortcut_key = readShortcut(j);

	return state;
}

PersistedState loadStateFile(const std::string& path) {
	std::ifstream file{path};
	if (!file.is_open()) {
		std::cout << "STATE no state file at '" << path << "', starting empty\n";
		return {};
	}

	const auto j = nlohmann::ordered_json::parse(file, nullptr, false);
	if (j.is_discarded()) {
		std::cerr << "STATE error: failed to parse '" << path << "', using defaults\n";
		return {};
	}

	auto state = stateFromJson(j);
	std::cout << "STATE loaded " << state.players.size() << " players from '" << path << "'\n";
	return state;
}

nlohmann::ordered_json stateToJson(const std::vector<PlayerRecord>& players, const Settings& settings) {
	nlohmann::ordered_json j = nlohmann::ordered_json::object();

	auto& j_players = j[g_key_players] = nlohmann::ordered_json::array();
	for (const auto& p : players) {
		if (p.comment.empty()) {
			continue;
		}
		j_players.push_back({
			{"name", p.name},
			{"comment", p.comment},
		});
	}

	j[g_key_window_open] = settings.window_open;
	j[g_key_inactive_color] = settings.inactive_color;
	j[g_key_comment_size] = settings.comment_size;
	j[g_key_show_all] = settings.show_all;
	if (settings.shortcut_key.has_value()) {
		j[g_key_shortcut] = settings.shortcut_key.value();
	}

	return j;
}

void saveStateFile(const std::string& path, const std::vector<PlayerRecord>& players, const Settings& settings) {
	const auto j = stateToJson(players, settings);
	const std::string data = j.dump(2);

	std::filesystem::path tmp_path = path + ".tmp";
	tmp_path.replace_filename("." + tmp_path.filename().generic_string());

	{
		std::ofstream ofile{tmp_path, std::ios::binary | std::ios::trunc};
		ofile.write(data.data(), data.size());
		ofile.flush();
		if (!ofile.good()) {
			std::error_code ec;
			std::filesystem::remove(tmp_path, ec);
			std::cerr << "STATE error: writing '" << tmp_path.generic_string() << "' failed\n";
			throw std::runtime_error("failed to write state file " + path);
		}
	}

	std::error_code ec;
	std::filesystem::rename(tmp_path, path, ec);
	if (ec) {
		std::error_code ec_rm;
		std::filesystem::remove(tmp_path, ec_rm);
		std::cerr << "STATE error: replacing '" << path << "' failed: " << ec.message() << "\n";
		throw std::runtime_error("failed to replace state file " + path + ": " + ec.message());
	}

	std::cout << "STATE saved " << j.at(g_key_players).size() << " players\n";
}
