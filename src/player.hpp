#pragma once

#include <string>
#include <string_view>
#include <cctype>

// ascii only, account names are ascii
static inline std::string toLowerASCII(std::string_view str) {
	std::string lower{str};
	for (char& c : lower) {
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}
	return lower;
}

// persisted form of a player
struct PlayerRecord {
	std::string name;
	std::string comment;
};

class Player {
	std::string _name;
	std::string _name_lower;

	std::string _comment; // empty means no comment
	std::string _comment_lower;

	public:
		bool present {false};

	public:
		Player(std::string_view name, std::string_view comment, bool present_ = false) :
			_name(name), _name_lower(toLowerASCII(name)),
			_comment(comment), _comment_lower(toLowerASCII(comment)),
			present(present_)
		{}

		const std::string& name(void) const { return _name; }
		const std::string& nameLower(void) const { return _name_lower; }
		const std::string& comment(void) const { return _comment; }
		const std::string& commentLower(void) const { return _comment_lower; }

		// the only way to change the comment, keeps the lower case cache in sync
		void setComment(std::string_view comment) {
			_comment = comment;
			_comment_lower = toLowerASCII(comment);
		}
};
