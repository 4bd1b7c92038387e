#include <crowdmod/protocol/username.hpp>
#include <crowdmod/protocol/exceptions.hpp>

#include <algorithm>

namespace crowdmod { namespace protocol {

// local inlines to simplify validation checks
inline bool is_letter(char x) { return 'a' <= x && x <= 'z'; }  // lowercase only
inline bool is_digit (char x) { return '0' <= x && x <= '9'; }

    namespace {
        enum class username_error {
            none,
            empty,
            too_long,
            bad_character,
            gap,
            too_short
        };

        username_error check_username(const string& name) {
            if (name.size() > CROWDMOD_USERNAME_LENGTH) {
                return username_error::too_long;
            }

            size_t used = 0;
            bool padding = false;
            for (size_t i = 0; i < CROWDMOD_USERNAME_LENGTH; i++) {
                const char c = i < name.size() ? name[i] : '\0';
                if (c == '\0') {
                    padding = true;
                    continue;
                }
                if (padding) {
                    return username_error::gap;
                }
                if (!is_letter(c) && !is_digit(c) && c != '_') {
                    return username_error::bad_character;
                }
                used++;
            }

            if (used == 0) {
                return username_error::empty;
            }
            if (used < CROWDMOD_MIN_USERNAME_LENGTH) {
                return username_error::too_short;
            }
            return username_error::none;
        }
    }

    bool is_valid_username(const string& name) {
        return check_username(name) == username_error::none;
    }

    void validate_username(const string& name) {
        switch (check_username(name)) {
            case username_error::none:
                return;
            case username_error::empty:
                CROWDMOD_CHECK_VALUE(false, "Username cannot be empty");
            case username_error::too_long:
                CROWDMOD_CHECK_VALUE(false, "Username ${name} is longer than ${max} characters",
                    ("name", name)("max", CROWDMOD_USERNAME_LENGTH));
            case username_error::bad_character:
                CROWDMOD_CHECK_VALUE(false, "Username ${name} may only contain [a-z0-9_]", ("name", name));
            case username_error::gap:
                CROWDMOD_CHECK_VALUE(false, "Username ${name} has a character after its null padding",
                    ("name", name));
            case username_error::too_short:
                CROWDMOD_CHECK_VALUE(false, "Username ${name} must have at least ${min} characters",
                    ("name", name)("min", CROWDMOD_MIN_USERNAME_LENGTH));
        }
    }

    string trim_username(const string& name) {
        return name.substr(0, std::min(name.find('\0'), name.size()));
    }

} } // crowdmod::protocol
