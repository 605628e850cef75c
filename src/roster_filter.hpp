#pragma once

#include "./player.hpp"

#include <string>
#include <string_view>
#include <vector>

// fwd
class PlayerRoster;

// what the player list shows.
// prefixes are stored lower case, matching is case insensitive
class RosterFilter {
	std::string _name_prefix;
	std::string _comment_prefix;

	public:
		bool show_all {false}; // also show players not in the squad

	public:
		void setNamePrefix(std::string_view prefix) { _name_prefix = toLowerASCII(prefix); }
		void setCommentPrefix(std::string_view prefix) { _comment_prefix = toLowerASCII(prefix); }
		const std::string& namePrefix(void) const { return _name_prefix; }
		const std::string& commentPrefix(void) const { return _comment_prefix; }

		bool matches(const Player& p) const;
};

// in roster order
std::vector<Player> collectVisible(const PlayerRoster& roster, const RosterFilter& filter);
