#include "./rollcall_host.hpp"

#include "./state_file.hpp"

#include <solanaceae/util/config_model.hpp>

#include <iostream>

RollcallHost::RollcallHost(ConfigModelI& conf, std::string_view state_path) :
	_conf(conf),
	_state_path(state_path),
	_ssa(_roster, _events, _conf.get_bool("rollcall", "list_self").value_or(true))
{
	auto state = loadStateFile(_state_path);
	_settings = state.settings;
	_roster.hydrate(state.players);

	if (_conf.has_string("rollcall", "self_name")) {
		_ssa.setSelfName(static_cast<std::string>(_conf.get_string("rollcall", "self_name").value()));
	}
}

RollcallHost::~RollcallHost(void) {
}

std::string RollcallHost::addPlaceholder(void) const {
	return _conf.get_string("rollcall", "add_comment_placeholder").value_or("Comment here");
}

RosterFilter RollcallHost::makeFilter(void) const {
	RosterFilter filter;
	filter.show_all = _settings.show_all;
	if (_conf.has_string("rollcall", "name_filter")) {
		filter.setNamePrefix(static_cast<std::string>(_conf.get_string("rollcall", "name_filter").value()));
	}
	if (_conf.has_string("rollcall", "comment_filter")) {
		filter.setCommentPrefix(static_cast<std::string>(_conf.get_string("rollcall", "comment_filter").value()));
	}
	return filter;
}

void RollcallHost::save(void) {
	if (_state_path.empty()) {
		std::cerr << "ROLLCALL warning: no state file path, not saving\n";
		return;
	}

	// copy out first, the roster lock is not held while writing
	const auto records = _roster.persistentRecords();
	saveStateFile(_state_path, records, _settings);
}
