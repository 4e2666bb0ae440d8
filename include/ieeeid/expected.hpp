#pragma once

// IEEEID Expected Type
//
// Exposes tl::expected in the ieeeid namespace. Strict parsing and
// runtime-checked construction return expected<T, ParseError>.
//
// Usage:
//   ieeeid::expected<Eui48, ParseError> result = Eui48::parse(text);
//   if (result.has_value()) {
//       use(*result);
//   } else {
//       report(result.error());
//   }
//
// Monadic operations:
//   result.and_then(f)  - chain on success
//   result.map(f)       - transform value
//   result.or_else(f)   - chain on error
//   result.map_error(f) - transform error

#include <tl/expected.hpp>

namespace ieeeid {

using tl::expected;
using tl::make_unexpected;
using tl::unexpect;
using tl::unexpect_t;
using tl::unexpected;

} // namespace ieeeid
