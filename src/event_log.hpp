#pragma once

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <string_view>

// fwd
struct SquadEventSource;
class PlayerRoster;

// plays back recorded host events and user actions.
// squad and self records go through the event source, add/delete/comment hit the roster directly, like the ui would.
class EventLogReplayer {
	SquadEventSource& _events;
	PlayerRoster& _roster;
	std::string _add_placeholder;

	public:
		EventLogReplayer(SquadEventSource& events, PlayerRoster& roster, std::string_view add_placeholder);

		// returns false if the record was malformed and skipped
		bool apply(const nlohmann::ordered_json& record);

		// log is an array of records, returns the number applied
		size_t replay(const nlohmann::ordered_json& log);
};
