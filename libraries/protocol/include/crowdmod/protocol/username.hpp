#pragma once

#include <crowdmod/protocol/types.hpp>

namespace crowdmod { namespace protocol {

    /**
     * A username occupies CROWDMOD_USERNAME_LENGTH fixed character slots, left-justified.
     * Each slot holds one of [a-z0-9_] or a null pad byte. Null padding must be one
     * contiguous suffix, and at least CROWDMOD_MIN_USERNAME_LENGTH slots must be used.
     *
     * A string shorter than the slot count is treated as padded with nulls.
     */
    bool is_valid_username(const string& name);

    /// throws invalid_value with the reason when is_valid_username() would return false
    void validate_username(const string& name);

    /// name with its null padding stripped, as stored in the registry
    string trim_username(const string& name);

} } // crowdmod::protocol
