#pragma once

#include "./player.hpp"

// true if the player can be dropped when they leave.
// a comment means the user wants to remember them.
static inline bool isRetainableAsEmpty(const Player& p) {
	return p.comment().empty();
}
