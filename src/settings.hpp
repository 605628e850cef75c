#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// scalar settings persisted next to the roster
struct Settings {
	bool window_open {false};
	std::array<float, 4> inactive_color {0.5f, 0.5f, 0.5f, 1.f}; // rgba, name color of players not in the squad
	std::array<float, 2> comment_size {300.f, 20.f};
	bool show_all {false};
	std::optional<int32_t> shortcut_key; // virtual key code
};

// "A" - "Z" for letters, "Key<n>" otherwise
std::string shortcutKeyName(int32_t key);

// older versions stored the shortcut as a single upper case letter
std::optional<int32_t> shortcutKeyFromLetter(std::string_view letter);
