#include "./event_log.hpp"

#include "./squad_events.hpp"
#include "./player_roster.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <optional>

static std::optional<std::string> stringField(const nlohmann::ordered_json& record, const char* key) {
	if (!record.contains(key) || !record.at(key).is_string()) {
		return std::nullopt;
	}
	return record.at(key).get<std::string>();
}

static std::optional<SquadRole> roleField(const nlohmann::ordered_json& record) {
	if (!record.contains("role")) {
		return std::nullopt;
	}

	const auto& role = record.at("role");
	if (role.is_string()) {
		return squadRoleFromName(role.get_ref<const std::string&>());
	} else if (role.is_number_integer()) {
		return squadRoleFromValue(role.get<int64_t>());
	}

	return std::nullopt;
}

EventLogReplayer::EventLogReplayer(SquadEventSource& events, PlayerRoster& roster, std::string_view add_placeholder) :
	_events(events), _roster(roster), _add_placeholder(add_placeholder)
{
}

bool EventLogReplayer::apply(const nlohmann::ordered_json& record) {
	if (!record.is_object()) {
		std::cerr << "LOG error: record is not an object: " << record << "\n";
		return false;
	}

	const auto type = stringField(record, "type");
	const auto name = stringField(record, "name");
	if (!type.has_value() || !name.has_value()) {
		std::cerr << "LOG error: record needs string 'type' and 'name': " << record << "\n";
		return false;
	}

	if (type == "self") {
		_events.pushSelfIdentity(*name);
	} else if (type == "squad") {
		const auto role = roleField(record);
		if (!role.has_value()) {
			std::cerr << "LOG error: bad role in " << record << "\n";
			return false;
		}
		_events.pushMemberUpdate(*name, *role);
	} else if (type == "add") {
		if (name->empty()) {
			std::cerr << "LOG error: can not add a player without name\n";
			return false;
		}
		const auto comment = stringField(record, "comment");
		_roster.addOrGet(*name, comment.value_or(_add_placeholder));
	} else if (type == "delete") {
		_roster.remove(*name);
	} else if (type == "comment") {
		const auto comment = stringField(record, "comment");
		if (!comment.has_value()) {
			std::cerr << "LOG error: comment record without 'comment': " << record << "\n";
			return false;
		}
		if (!_roster.setComment(*name, *comment)) {
			std::cerr << "LOG warning: comment for unknown player '" << *name << "'\n";
		}
	} else {
		std::cerr << "LOG error: unknown record type '" << *type << "'\n";
		return false;
	}

	return true;
}

size_t EventLogReplayer::replay(const nlohmann::ordered_json& log) {
	if (!log.is_array()) {
		std::cerr << "LOG error: event log is not an array\n";
		return 0;
	}

	size_t applied {0};
	for (const auto& record : log) {
		if (apply(record)) {
			applied++;
		}
	}

	std::cout << "LOG applied " << applied << "/" << log.size() << " records\n";
	return applied;
}
