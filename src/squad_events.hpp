#pragma once

#include <solanaceae/util/event_provider.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// same numbering as the host
enum class SquadRole : uint8_t {
	squad_leader = 0,
	lieutenant = 1,
	member = 2,
	invited = 3,
	applied = 4,
	none = 5, // no longer in the squad
	invalid = 6,
};

std::string_view squadRoleName(SquadRole role);
std::optional<SquadRole> squadRoleFromName(std::string_view name);
std::optional<SquadRole> squadRoleFromValue(int64_t value);

namespace Squad::Events {

	// the host knows our own account name
	struct SelfIdentity {
		std::string_view name;
	};

	struct MemberUpdate {
		std::string_view name; // can be empty, if the host does not know it (yet)
		SquadRole role;
	};

} // Squad::Events

enum class Squad_Event : uint32_t {
	self_identity,
	member_update,

	MAX
};

struct SquadEventI {
	using enumType = Squad_Event;

	virtual ~SquadEventI(void) {}

	virtual bool onEvent(const Squad::Events::SelfIdentity&) { return false; }
	virtual bool onEvent(const Squad::Events::MemberUpdate&) { return false; }
};
using SquadEventProviderI = EventProviderI<SquadEventI>;

// host side, turns host callbacks into events
struct SquadEventSource : public SquadEventProviderI {
	virtual ~SquadEventSource(void) {}

	void pushSelfIdentity(std::string_view name);
	void pushMemberUpdate(std::string_view name, SquadRole role);
};
