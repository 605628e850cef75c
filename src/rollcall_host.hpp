#pragma once

#include "./player_roster.hpp"
#include "./squad_events.hpp"
#include "./squad_session_adapter.hpp"
#include "./roster_filter.hpp"
#include "./settings.hpp"

#include <string>
#include <string_view>

// fwd
struct ConfigModelI;

// owns the roster and everything talking to it.
// loads the state file on construction, save() has to be called before shutdown.
class RollcallHost {
	ConfigModelI& _conf;

	std::string _state_path;
	Settings _settings;

	PlayerRoster _roster;
	SquadEventSource _events;
	SquadSessionAdapter _ssa;

	public:
		RollcallHost(ConfigModelI& conf, std::string_view state_path);
		~RollcallHost(void);

		PlayerRoster& roster(void) { return _roster; }
		SquadEventSource& events(void) { return _events; }
		SquadSessionAdapter& session(void) { return _ssa; }
		Settings& settings(void) { return _settings; }
		const std::string& statePath(void) const { return _state_path; }

		// comment given to players added by hand
		std::string addPlaceholder(void) const;

		// filter from config and settings
		RosterFilter makeFilter(void) const;

		// throws std::runtime_error
		void save(void);
};
