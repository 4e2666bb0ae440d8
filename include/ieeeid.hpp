#pragma once

/**
 * @file ieeeid.hpp
 * @brief IEEE Registration Authority identifier types
 *
 * Types provided:
 * - CompanyId (Cid)                       - 24-bit Company ID
 * - Oui24, Oui36                          - Organizationally Unique Identifiers
 * - MacBlockLarge/Medium/Small (MaL/M/S)  - MAC address block assignments
 * - Eui48, Eui60, Eui64                   - Extended Unique Identifiers
 * - ModifiedEui64 (Meui64)                - IPv6-style modified EUI-64
 * - Cdi32, Cdi40                          - Context Dependent Identifiers
 *
 * Every type is an immutable, trivially copyable value with the same
 * capability set (see concepts.hpp). Text constructors never fail loudly:
 * they yield the kind's zero() value, which is_valid() rejects. Use
 * T::parse() for a ParseResult carrying the reason instead.
 *
 * Conversions between kinds are free functions in conversions.hpp.
 */

#include "ieeeid/cdi.hpp"
#include "ieeeid/company_id.hpp"
#include "ieeeid/concepts.hpp"
#include "ieeeid/conversions.hpp"
#include "ieeeid/eui.hpp"
#include "ieeeid/expected.hpp"
#include "ieeeid/identifier_error.hpp"
#include "ieeeid/mac_block.hpp"
#include "ieeeid/oui.hpp"
#include "ieeeid/types.hpp"
