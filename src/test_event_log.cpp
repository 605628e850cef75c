#include "./event_log.hpp"
#include "./json_to_config.hpp"
#include "./rollcall_host.hpp"
#include "./state_file.hpp"

#include <solanaceae/util/simple_config_model.hpp>

#include <nlohmann/json.hpp>

#include <cassert>
#include <filesystem>
#include <iostream>

int main(void) {
	const auto test_dir = std::filesystem::temp_directory_path() / "rollcall_test_event_log";
	std::filesystem::remove_all(test_dir);
	std::filesystem::create_directories(test_dir);
	const auto state_path = (test_dir / "player_list.json").generic_string();

	{ // config
		SimpleConfigModel conf;
		const auto config_json = nlohmann::ordered_json::parse(R"({
			"rollcall": {
				"self_name": "Me.1000",
				"add_comment_placeholder": "who is this?",
				"name_filter": "B",
				"list_self": {"default": false}
			}
		})");
		assert(load_json_into_config(config_json, conf));
		assert(conf.get_bool("rollcall", "list_self").value_or(true) == false);

		SimpleConfigModel bad_conf;
		assert(!load_json_into_config(nlohmann::ordered_json::parse(R"({"rollcall": {"x": [1, 2]}})"), bad_conf));
		assert(!load_json_into_config(nlohmann::ordered_json::parse(R"({"rollcall": 1})"), bad_conf));
		assert(!load_json_into_config(nlohmann::ordered_json::array(), bad_conf));

		RollcallHost host{conf, state_path};
		assert(host.session().selfName() == "Me.1000");
		assert(host.addPlaceholder() == "who is this?");
		assert(host.roster().size() == 0);

		EventLogReplayer replayer{host.events(), host.roster(), host.addPlaceholder()};
		const auto log = nlohmann::ordered_json::parse(R"([
			{"type": "squad", "name": "Me.1000", "role": "squad_leader"},
			{"type": "squad", "name": "alice.1", "role": "member"},
			{"type": "squad", "name": "bob.2", "role": 2},
			{"type": "comment", "name": "bob.2", "comment": "tank"},
			{"type": "add", "name": "carl.3"},
			{"type": "add", "name": "dora.4", "comment": "met in pvp"},
			{"type": "squad", "name": "alice.1", "role": "none"},
			{"type": "squad", "name": "eve.5", "role": "commander"},
			{"type": "delete", "name": "dora.4"},
			{"type": "teleport", "name": "x"},
			{"type": "squad", "role": "member"},
			"garbage"
		])");

		const size_t applied = replayer.replay(log);
		assert(applied == 8);

		assert(!host.roster().get("Me.1000").has_value()); // list_self is off
		assert(!host.roster().get("alice.1").has_value());
		assert(host.roster().get("bob.2")->present);
		assert(host.roster().get("carl.3")->comment() == "who is this?");
		assert(!host.roster().get("dora.4").has_value());
		assert(!host.roster().get("eve.5").has_value());

		const auto filter = host.makeFilter();
		assert(filter.namePrefix() == "b");
		assert(!filter.show_all);

		// we leave
		const bool ok = replayer.apply(nlohmann::ordered_json::parse(R"({"type": "squad", "name": "Me.1000", "role": 5})"));
		assert(ok);
		assert(host.roster().size() == 2);
		assert(!host.roster().get("bob.2")->present);

		host.settings().show_all = true;
		host.save();
	}

	{ // next session starts from the saved state
		SimpleConfigModel conf;
		RollcallHost host{conf, state_path};

		assert(host.roster().size() == 2);
		assert(host.roster().indexOf("bob.2") == 0);
		assert(host.roster().indexOf("carl.3") == 1);
		assert(host.settings().show_all);
		assert(host.makeFilter().show_all);
		assert(host.addPlaceholder() == "Comment here");
		assert(host.session().selfName().empty());
	}

	std::filesystem::remove_all(test_dir);

	std::cout << "test_event_log done\n";
	return 0;
}
