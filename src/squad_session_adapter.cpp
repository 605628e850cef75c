#include "./squad_session_adapter.hpp"

#include "./player_roster.hpp"

#include <iostream>

SquadSessionAdapter::SquadSessionAdapter(PlayerRoster& roster, SquadEventProviderI& sep, bool list_self) :
	_roster(roster), _sep_sr(sep.newSubRef(this)), _list_self(list_self)
{
	_sep_sr
		.subscribe(Squad_Event::self_identity)
		.subscribe(Squad_Event::member_update)
	;
}

SquadSessionAdapter::~SquadSessionAdapter(void) {
}

void SquadSessionAdapter::setSelfName(std::string_view name) {
	std::lock_guard lg{_self_mutex};
	_self_name = name;
}

std::string SquadSessionAdapter::selfName(void) const {
	std::lock_guard lg{_self_mutex};
	return _self_name;
}

bool SquadSessionAdapter::isSelf(std::string_view name) const {
	std::lock_guard lg{_self_mutex};
	// unknown self never matches, names are never empty here
	return !_self_name.empty() && _self_name == name;
}

bool SquadSessionAdapter::onEvent(const Squad::Events::SelfIdentity& e) {
	if (e.name.empty()) {
		// host reports unknown like this, keep what we have
		return false;
	}

	std::cout << "SSA: self is '" << e.name << "'\n";
	setSelfName(e.name);

	return false;
}

bool SquadSessionAdapter::onEvent(const Squad::Events::MemberUpdate& e) {
	if (e.name.empty()) {
		return false;
	}

	const bool is_self = isSelf(e.name);

	if (e.role == SquadRole::none) {
		if (is_self) {
			_roster.sweepRetainable();
		} else {
			_roster.markAbsentOrDelete(e.name);
		}
	} else if (!is_self || _list_self) {
		_roster.upsertPresent(e.name);
	}

	return false;
}
