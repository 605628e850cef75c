#pragma once

#include "./squad_events.hpp"

#include <mutex>
#include <string>
#include <string_view>

// fwd
class PlayerRoster;

// keeps the roster in sync with squad membership.
// a peer leaving goes through the retention policy, us leaving sweeps the whole roster.
class SquadSessionAdapter : public SquadEventI {
	PlayerRoster& _roster;
	SquadEventProviderI::SubscriptionReference _sep_sr;

	// if false, we never show up in our own roster
	const bool _list_self {true};

	mutable std::mutex _self_mutex;
	std::string _self_name; // empty until the host tells us

	public:
		SquadSessionAdapter(PlayerRoster& roster, SquadEventProviderI& sep, bool list_self = true);
		~SquadSessionAdapter(void);

		// for hosts that know the account name out of band
		void setSelfName(std::string_view name);
		std::string selfName(void) const;

	private:
		bool isSelf(std::string_view name) const;

	protected:
		bool onEvent(const Squad::Events::SelfIdentity& e) override;
		bool onEvent(const Squad::Events::MemberUpdate& e) override;
};
