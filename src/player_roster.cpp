#include "./player_roster.hpp"

#include "./retention_policy.hpp"

#include <iostream>

std::optional<Player> PlayerRoster::Cursor::next(void) {
	std::lock_guard lg{_roster._mutex};

	if (_pos >= _roster._players.size()) {
		return std::nullopt;
	}

	return _roster._players[_pos++];
}

void PlayerRoster::hydrate(const std::vector<PlayerRecord>& records) {
	std::lock_guard lg{_mutex};

	_players.clear();
	_index.clear();
	_players.reserve(records.size());

	for (const auto& record : records) {
		if (_index.contains(record.name)) {
			std::cerr << "ROSTER warning: dropping duplicate player '" << record.name << "'\n";
			continue;
		}
		addLocked(record.name, record.comment);
	}
}

void PlayerRoster::upsertPresent(std::string_view name) {
	std::lock_guard lg{_mutex};

	Player* p = findLocked(name);
	if (p == nullptr) {
		p = &addLocked(name, "");
	}
	p->present = true;
}

void PlayerRoster::markAbsentOrDelete(std::string_view name) {
	std::lock_guard lg{_mutex};

	const auto it = _index.find(std::string{name});
	if (it == _index.end()) {
		return;
	}

	const size_t pos = it->second;
	if (isRetainableAsEmpty(_players.at(pos))) {
		eraseAtLocked(pos);
	} else {
		_players.at(pos).present = false;
	}
}

void PlayerRoster::remove(std::string_view name) {
	std::lock_guard lg{_mutex};

	const auto it = _index.find(std::string{name});
	if (it == _index.end()) {
		return;
	}

	eraseAtLocked(it->second);
}

void PlayerRoster::sweepRetainable(void) {
	std::lock_guard lg{_mutex};

	// collected back to front, so erasing in this order never moves a position still to be erased
	std::vector<size_t> to_erase;
	for (size_t i = _players.size(); i > 0; i--) {
		auto& p = _players[i-1];
		p.present = false;
		if (isRetainableAsEmpty(p)) {
			to_erase.push_back(i-1);
		}
	}

	for (const size_t pos : to_erase) {
		eraseAtLocked(pos);
	}
}

Player PlayerRoster::addOrGet(std::string_view name, std::string_view default_comment) {
	std::lock_guard lg{_mutex};

	if (Player* p = findLocked(name); p != nullptr) {
		return *p;
	}

	return addLocked(name, default_comment);
}

bool PlayerRoster::setComment(std::string_view name, std::string_view comment) {
	std::lock_guard lg{_mutex};

	Player* p = findLocked(name);
	if (p == nullptr) {
		return false;
	}

	p->setComment(comment);
	return true;
}

std::optional<Player> PlayerRoster::get(std::string_view name) const {
	std::lock_guard lg{_mutex};

	const auto it = _index.find(std::string{name});
	if (it == _index.end()) {
		return std::nullopt;
	}

	return _players.at(it->second);
}

std::optional<size_t> PlayerRoster::indexOf(std::string_view name) const {
	std::lock_guard lg{_mutex};

	const auto it = _index.find(std::string{name});
	if (it == _index.end()) {
		return std::nullopt;
	}

	return it->second;
}

size_t PlayerRoster::size(void) const {
	std::lock_guard lg{_mutex};
	return _players.size();
}

std::vector<Player> PlayerRoster::snapshot(void) const {
	std::lock_guard lg{_mutex};
	return _players;
}

std::vector<PlayerRecord> PlayerRoster::persistentRecords(void) const {
	std::lock_guard lg{_mutex};

	std::vector<PlayerRecord> records;
	for (const auto& p : _players) {
		if (p.comment().empty()) {
			continue;
		}
		records.push_back({p.name(), p.comment()});
	}

	return records;
}

bool PlayerRoster::checkConsistency(void) const {
	std::lock_guard lg{_mutex};

	if (_index.size() != _players.size()) {
		return false;
	}

	for (size_t i = 0; i < _players.size(); i++) {
		const auto& p = _players[i];

		const auto it = _index.find(p.name());
		if (it == _index.end() || it->second != i) {
			return false;
		}

		if (p.nameLower() != toLowerASCII(p.name()) || p.commentLower() != toLowerASCII(p.comment())) {
			return false;
		}
	}

	// sizes match and every player found itself, so the index can not point anywhere else
	return true;
}

Player& PlayerRoster::addLocked(std::string_view name, std::string_view comment) {
	_index.emplace(std::string{name}, _players.size());
	return _players.emplace_back(name, comment);
}

Player* PlayerRoster::findLocked(std::string_view name) {
	const auto it = _index.find(std::string{name});
	if (it == _index.end()) {
		return nullptr;
	}

	return &_players.at(it->second);
}

void PlayerRoster::eraseAtLocked(size_t pos) {
	// copy, the player is gone after the erase
	const std::string name = _players.at(pos).name();

	_players.erase(_players.begin() + pos);
	_index.erase(name);

	// everything after pos moved one to the left
	for (auto&& [key, idx] : _index) {
		if (idx > pos) {
			idx--;
		}
	}
}
