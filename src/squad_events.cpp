#include "./squad_events.hpp"

#include <array>

static constexpr std::array<std::string_view, 7> g_role_names {
	"squad_leader",
	"lieutenant",
	"member",
	"invited",
	"applied",
	"none",
	"invalid",
};

std::string_view squadRoleName(SquadRole role) {
	const size_t i = static_cast<size_t>(role);
	if (i >= g_role_names.size()) {
		return "unknown";
	}
	return g_role_names[i];
}

std::optional<SquadRole> squadRoleFromName(std::string_view name) {
	for (size_t i = 0; i < g_role_names.size(); i++) {
		if (g_role_names[i] == name) {
			return static_cast<SquadRole>(i);
		}
	}
	return std::nullopt;
}

std::optional<SquadRole> squadRoleFromValue(int64_t value) {
	if (value < 0 || value >= int64_t(g_role_names.size())) {
		return std::nullopt;
	}
	return static_cast<SquadRole>(value);
}

void SquadEventSource::pushSelfIdentity(std::string_view name) {
	dispatch(
		Squad_Event::self_identity,
		Squad::Events::SelfIdentity{
			name
		}
	);
}

void SquadEventSource::pushMemberUpdate(std::string_view name, SquadRole role) {
	dispatch(
		Squad_Event::member_update,
		Squad::Events::MemberUpdate{
			name,
			role,
		}
	);
}
