#pragma once
// Error bindings: IdentifierKind, IdentifierError, ParseError exception

#include <nanobind/nanobind.h>
#include <nanobind/stl/string.h>

#include <ieeeid/identifier_error.hpp>
#include <ieeeid/types.hpp>

#include "py_types.hpp"

#include <stdexcept>
#include <string>

namespace nb = nanobind;
using namespace nb::literals;

namespace ieeeid_python {

inline void bind_errors(nb::module_& m) {
    // =========================================================================
    // Enums
    // =========================================================================

    nb::enum_<ieeeid::IdentifierKind>(m, "IdentifierKind",
                                      "IEEE Registration Authority identifier kinds")
        .value("company_id", ieeeid::IdentifierKind::company_id, "Company ID (CID)")
        .value("oui24", ieeeid::IdentifierKind::oui24, "24-bit OUI")
        .value("oui36", ieeeid::IdentifierKind::oui36, "36-bit OUI")
        .value("ma_l", ieeeid::IdentifierKind::ma_l, "MAC address block, large")
        .value("ma_m", ieeeid::IdentifierKind::ma_m, "MAC address block, medium")
        .value("ma_s", ieeeid::IdentifierKind::ma_s, "MAC address block, small")
        .value("eui48", ieeeid::IdentifierKind::eui48, "48-bit EUI")
        .value("eui60", ieeeid::IdentifierKind::eui60, "60-bit EUI")
        .value("eui64", ieeeid::IdentifierKind::eui64, "64-bit EUI")
        .value("meui64", ieeeid::IdentifierKind::meui64, "Modified EUI-64")
        .value("cdi32", ieeeid::IdentifierKind::cdi32, "32-bit CDI")
        .value("cdi40", ieeeid::IdentifierKind::cdi40, "40-bit CDI")
        .def("__str__", [](ieeeid::IdentifierKind k) {
            return std::string(ieeeid::identifier_kind_string(k));
        });

    nb::enum_<ieeeid::IdentifierError>(m, "IdentifierError",
                                       "Reasons an identifier could not be constructed")
        .value("none", ieeeid::IdentifierError::none, "No error")
        .value("invalid_length", ieeeid::IdentifierError::invalid_length,
               "Byte sequence has the wrong length")
        .value("text_too_long", ieeeid::IdentifierError::text_too_long,
               "Text exceeds the canonical length")
        .value("byte_count_mismatch", ieeeid::IdentifierError::byte_count_mismatch,
               "Text decoded to the wrong number of bytes")
        .value("registration_mismatch", ieeeid::IdentifierError::registration_mismatch,
               "Registration bit contradicts the kind's convention")
        .def("__str__", [](ieeeid::IdentifierError e) {
            return std::string(ieeeid::identifier_error_string(e));
        });

    // =========================================================================
    // Custom Exceptions
    // =========================================================================

    // ParseError - strict parse and from_bytes failures
    auto parse_error = nb::exception<std::runtime_error>(m, "ParseError", PyExc_ValueError);
    parse_error_type = parse_error.ptr();
}

} // namespace ieeeid_python
