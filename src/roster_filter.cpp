#include "./roster_filter.hpp"

#include "./player_roster.hpp"

static bool startsWith(std::string_view str, std::string_view prefix) {
	return str.substr(0, prefix.size()) == prefix;
}

bool RosterFilter::matches(const Player& p) const {
	if (!_name_prefix.empty() && !startsWith(p.nameLower(), _name_prefix)) {
		return false;
	}
	if (!_comment_prefix.empty() && !startsWith(p.commentLower(), _comment_prefix)) {
		return false;
	}
	if (!show_all && !p.present) {
		return false;
	}
	return true;
}

std::vector<Player> collectVisible(const PlayerRoster& roster, const RosterFilter& filter) {
	std::vector<Player> visible;

	auto cursor = roster.iterate();
	while (auto p = cursor.next()) {
		if (filter.matches(*p)) {
			visible.push_back(std::move(*p));
		}
	}

	return visible;
}
