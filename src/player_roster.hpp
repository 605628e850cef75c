#pragma once

#include "./player.hpp"

#include <entt/container/dense_map.hpp>

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ordered list of players, with a name -> position index kept in lock-step.
// every public function locks for its whole duration.
class PlayerRoster {
	mutable std::mutex _mutex;

	std::vector<Player> _players; // insertion order
	entt::dense_map<std::string, size_t> _index;

	public:
		// lazy walk over the live roster.
		// each step locks on its own and returns a copy, so nothing is held between steps.
		// removals between steps shift later players left, which the cursor follows by position.
		class Cursor {
			const PlayerRoster& _roster;
			size_t _pos {0};

			public:
				Cursor(const PlayerRoster& roster) : _roster(roster) {}

				std::optional<Player> next(void);
				void restart(void) { _pos = 0; }
		};

	public:
		PlayerRoster(void) = default;
		PlayerRoster(const PlayerRoster&) = delete;
		PlayerRoster& operator=(const PlayerRoster&) = delete;

		// replaces the content with persisted players, all not present.
		// duplicate names after the first are dropped
		void hydrate(const std::vector<PlayerRecord>& records);

		// joined, adds if new
		void upsertPresent(std::string_view name);

		// left, removed if retainable as empty, otherwise marked not present
		void markAbsentOrDelete(std::string_view name);

		// unconditional
		void remove(std::string_view name);

		// self left: nobody is present anymore, drop everyone without comment
		void sweepRetainable(void);

		// adds with comment if new, does not touch existing players.
		// returns the player as it is after the call
		Player addOrGet(std::string_view name, std::string_view default_comment);

		// returns false if name is unknown
		bool setComment(std::string_view name, std::string_view comment);

		Cursor iterate(void) const { return Cursor{*this}; }

		std::optional<Player> get(std::string_view name) const;
		std::optional<size_t> indexOf(std::string_view name) const;
		size_t size(void) const;
		std::vector<Player> snapshot(void) const;

		// players worth saving (non empty comment), in order
		std::vector<PlayerRecord> persistentRecords(void) const;

		// checks the index <-> list bijection and the lower case caches
		bool checkConsistency(void) const;

	private: // expect _mutex to be held
		Player& addLocked(std::string_view name, std::string_view comment);
		Player* findLocked(std::string_view name);

		// the only place positions shift
		void eraseAtLocked(size_t pos);
};
