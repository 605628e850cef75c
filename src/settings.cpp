#include "./settings.hpp"

// virtual key codes of letters match ascii
static constexpr int32_t g_vk_a {0x41};
static constexpr int32_t g_vk_z {0x5A};

std::string shortcutKeyName(int32_t key) {
	if (key >= g_vk_a && key <= g_vk_z) {
		return std::string(1, static_cast<char>(key));
	}
	return "Key<" + std::to_string(key) + ">";
}

std::optional<int32_t> shortcutKeyFromLetter(std::string_view letter) {
	if (letter.size() != 1) {
		return std::nullopt;
	}

	const int32_t c = static_cast<unsigned char>(letter.front());
	if (c < g_vk_a || c > g_vk_z) {
		return std::nullopt;
	}

	return c;
}
