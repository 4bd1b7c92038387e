#pragma once

// macro helpers on CROWDMOD_CHECK_VALUE and CROWDMOD_CHECK_PARAM
// to check common cases and autogenerate message text


// CROWDMOD_CHECK_PARAM helpers
//-------------------------------------------------------------

// check if account parameter valid
#define CROWDMOD_CHECK_PARAM_ACCOUNT(A)    CROWDMOD_CHECK_PARAM(A, validate_account_name(A))
// check if content id parameter refers to an existing library
#define CROWDMOD_CHECK_PARAM_CONTENT(C)    CROWDMOD_CHECK_PARAM(C, validate_content_id(C))
// check if digest parameter is set
#define CROWDMOD_CHECK_PARAM_DIGEST(D)     CROWDMOD_CHECK_PARAM(D, CROWDMOD_CHECK_VALUE_NOT_ZERO_DIGEST(D))

// CROWDMOD_CHECK_VALUE helpers
//-------------------------------------------------------------

// digest
#define CROWDMOD_CHECK_VALUE_NOT_ZERO_DIGEST(F) \
    CROWDMOD_CHECK_VALUE(F != crowdmod::protocol::digest_type(), CANNOT_BE(F, "zero digest"));


// internals
//-------------------------------------------------------------

// utils
#define CANNOT_BE(NAME, REQ) #NAME " cannot be " REQ
