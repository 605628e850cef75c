#include "./state_file.hpp"
#include "./player_roster.hpp"

#include <nlohmann/json.hpp>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

static bool sameArray(const std::array<float, 4>& a, const std::array<float, 4>& b) {
	return a == b;
}

int main(void) {
	const auto test_dir = std::filesystem::temp_directory_path() / "rollcall_test_state";
	std::filesystem::remove_all(test_dir);
	std::filesystem::create_directories(test_dir);

	{ // round trip keeps commented players in order, drops the rest
		PlayerRoster roster;
		roster.upsertPresent("plain");
		roster.addOrGet("Zed.1", "tank");
		roster.upsertPresent("also plain");
		roster.addOrGet("amy.2", "Healer, \"quotes\" and\nnewline");

		Settings s;
		s.window_open = true;
		s.show_all = true;
		s.inactive_color = {0.25f, 0.5f, 0.75f, 1.f};
		s.comment_size = {200.f, 40.f};
		s.shortcut_key = 0x50;

		const auto path = (test_dir / "roundtrip.json").generic_string();
		saveStateFile(path, roster.persistentRecords(), s);
		assert(std::filesystem::exists(path));

		const auto loaded = loadStateFile(path);
		assert(loaded.players.size() == 2);
		assert(loaded.players.at(0).name == "Zed.1");
		assert(loaded.players.at(0).comment == "tank");
		assert(loaded.players.at(1).name == "amy.2");
		assert(loaded.players.at(1).comment == "Healer, \"quotes\" and\nnewline");

		assert(loaded.settings.window_open);
		assert(loaded.settings.show_all);
		assert(sameArray(loaded.settings.inactive_color, s.inactive_color));
		assert(loaded.settings.comment_size == s.comment_size);
		assert(loaded.settings.shortcut_key == 0x50);

		// and back into a roster
		PlayerRoster hydrated;
		hydrated.hydrate(loaded.players);
		assert(hydrated.size() == 2);
		assert(hydrated.indexOf("amy.2") == 1);
		assert(!hydrated.get("Zed.1")->present);
	}

	{ // serializer drops empty comments itself too
		const auto j = stateToJson({{"a", ""}, {"b", "x"}}, Settings{});
		assert(j.at("Players").size() == 1);
		assert(j.at("Players").at(0).at("name") == "b");
		assert(!j.contains("ShortcutKey"));
	}

	{ // missing file
		const auto loaded = loadStateFile((test_dir / "does_not_exist.json").generic_string());
		assert(loaded.players.empty());
		assert(!loaded.settings.window_open);
		assert(!loaded.settings.shortcut_key.has_value());
	}

	{ // garbage file
		const auto path = (test_dir / "garbage.json").generic_string();
		{
			std::ofstream f{path};
			f << "Players = [ { name = \"toml?\" } ]";
		}
		const auto loaded = loadStateFile(path);
		assert(loaded.players.empty());
		assert(sameArray(loaded.settings.inactive_color, Settings{}.inactive_color));
	}

	{ // broken fields fall back one by one
		const auto j = nlohmann::ordered_json::parse(R"({
			"Players": [
				{"name": "ok.1", "comment": "fine"},
				{"name": "no comment"},
				{"name": 12, "comment": "bad name"},
				"not an object",
				{"name": "ok.2", "comment": "also fine", "extra": true}
			],
			"WindowOpen": "yes",
			"InactiveColor": [1.0, 0.0, 2.0, 1.0],
			"CommentSize": [100, 30],
			"ShowAll": true,
			"ShortcutKey": 3.5
		})");

		const auto state = stateFromJson(j);
		assert(state.players.size() == 2);
		assert(state.players.at(0).name == "ok.1");
		assert(state.players.at(1).name == "ok.2");

		assert(!state.settings.window_open); // default
		assert(sameArray(state.settings.inactive_color, Settings{}.inactive_color)); // out of range
		assert(state.settings.comment_size[0] == 100.f); // integers are fine
		assert(state.settings.comment_size[1] == 30.f);
		assert(state.settings.show_all);
		assert(!state.settings.shortcut_key.has_value());
	}

	{ // wrong shapes
		const auto j = nlohmann::ordered_json::parse(R"({
			"Players": {"name": "x", "comment": "y"},
			"InactiveColor": [0.1, 0.2, 0.3],
			"CommentSize": "big"
		})");

		const auto state = stateFromJson(j);
		assert(state.players.empty());
		assert(sameArray(state.settings.inactive_color, Settings{}.inactive_color));
		assert(state.settings.comment_size == Settings{}.comment_size);

		const auto not_obj = stateFromJson(nlohmann::ordered_json::array());
		assert(not_obj.players.empty());
	}

	{ // legacy letter shortcut
		auto j = nlohmann::ordered_json::parse(R"({"ShortcutKey": "P"})");
		assert(stateFromJson(j).settings.shortcut_key == 0x50);

		j["ShortcutKey"] = "p";
		assert(!stateFromJson(j).settings.shortcut_key.has_value());

		j["ShortcutKey"] = "PP";
		assert(!stateFromJson(j).settings.shortcut_key.has_value());

		j["ShortcutKey"] = -4;
		assert(!stateFromJson(j).settings.shortcut_key.has_value());
	}

	{ // key names
		assert(shortcutKeyName(0x41) == "A");
		assert(shortcutKeyName(0x5A) == "Z");
		assert(shortcutKeyName(0x70) == "Key<112>");
		assert(shortcutKeyFromLetter("Q") == 0x51);
		assert(!shortcutKeyFromLetter("").has_value());
	}

	{ // saving into a missing directory throws
		bool thrown {false};
		try {
			saveStateFile((test_dir / "missing_dir" / "state.json").generic_string(), {{"a", "b"}}, Settings{});
		} catch (const std::runtime_error&) {
			thrown = true;
		}
		assert(thrown);
	}

	{ // save replaces the old file and leaves no temp file behind
		const auto path = (test_dir / "replace.json").generic_string();
		saveStateFile(path, {{"old", "x"}}, Settings{});
		saveStateFile(path, {{"new", "y"}}, Settings{});

		const auto loaded = loadStateFile(path);
		assert(loaded.players.size() == 1);
		assert(loaded.players.at(0).name == "new");
		assert(!std::filesystem::exists(test_dir / ".replace.json.tmp"));
	}

	std::filesystem::remove_all(test_dir);

	std::cout << "test_state_file done\n";
	return 0;
}
