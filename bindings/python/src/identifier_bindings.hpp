#pragma once
// Identifier bindings: one class per kind plus conversions

#include <nanobind/nanobind.h>
#include <nanobind/stl/array.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/string_view.h>

#include <ieeeid.hpp>

#include "py_types.hpp"

#include <functional>
#include <span>
#include <string>
#include <string_view>

namespace nb = nanobind;
using namespace nb::literals;

namespace ieeeid_python {

/**
 * @brief Bind the capability set shared by every identifier kind
 *
 * The Python constructor takes text and is lenient (invalid text gives
 * the zero value), matching the C++ text constructor. parse() and
 * from_bytes() raise ParseError instead.
 */
template <ieeeid::IeeeIdentifier T>
nb::class_<T> bind_identifier(nb::module_& m, const char* name, const char* doc) {
    return nb::class_<T>(m, name, doc)
        .def(nb::init<>(), "Create the all-zero value")
        .def(nb::init<std::string_view>(), "Create from hex text (zero value if invalid)",
             "text"_a)
        .def_static(
            "parse", [](std::string_view text) { return unwrap_or_raise(T::parse(text)); },
            "Strict parse from hex text; raises ParseError on failure", "text"_a)
        .def_static(
            "from_bytes",
            [](nb::bytes data) {
                std::span<const uint8_t> raw(reinterpret_cast<const uint8_t*>(data.c_str()),
                                             data.size());
                return unwrap_or_raise(T::from_bytes(raw));
            },
            "Create from raw octets; raises ParseError on wrong length", "data"_a)
        .def_static(
            "zero", []() { return T::zero(); }, "All-zero value of this kind")
        .def_prop_ro_static("kind", [](nb::handle) { return T::kind; }, "Identifier kind")
        .def_prop_ro_static(
            "byte_length", [](nb::handle) { return T::byte_length; }, "Length in octets")
        .def_prop_ro_static(
            "bit_length", [](nb::handle) { return T::bit_length; }, "Length in bits")
        .def_prop_ro(
            "bytes",
            [](const T& id) {
                return nb::bytes(reinterpret_cast<const char*>(id.bytes().data()),
                                 id.bytes().size());
            },
            "Stored octets")
        .def(
            "to_integer", [](const T& id) { return id.to_integer(); }, "Big-endian integer value")
        .def_prop_ro(
            "is_unicast", [](const T& id) { return id.is_unicast(); },
            "Broadcast scope bit is clear")
        .def_prop_ro(
            "is_multicast", [](const T& id) { return id.is_multicast(); },
            "Broadcast scope bit is set")
        .def_prop_ro(
            "is_global", [](const T& id) { return id.is_global(); }, "Registration bit is clear")
        .def_prop_ro(
            "is_local", [](const T& id) { return id.is_local(); }, "Registration bit is set")
        .def_prop_ro(
            "is_valid", [](const T& id) { return id.is_valid(); },
            "Not a uniform fill of one octet value")
        .def(
            "to_colon_hex", [](const T& id) { return id.to_colon_hex(); },
            "Uppercase hex joined with ':'")
        .def(
            "to_dash_hex", [](const T& id) { return id.to_dash_hex(); },
            "Uppercase hex joined with '-'")
        .def("__eq__", [](const T& a, const T& b) { return a == b; })
        .def("__hash__", [](const T& id) { return std::hash<T>{}(id); })
        .def("__str__", [](const T& id) { return id.to_colon_hex(); })
        .def("__repr__", [name](const T& id) {
            return std::string(name) + "('" + id.to_colon_hex() + "')";
        });
}

inline void bind_identifiers(nb::module_& m) {
    using namespace ieeeid;

    // =========================================================================
    // Assignment blocks
    // =========================================================================

    bind_identifier<CompanyId>(m, "CompanyId", "24-bit Company ID (registration bit set)");
    bind_identifier<Oui24>(m, "Oui24", "24-bit Organizationally Unique Identifier");
    bind_identifier<Oui36>(m, "Oui36", "36-bit Organizationally Unique Identifier");
    bind_identifier<MacBlockLarge>(m, "MacBlockLarge", "MAC address block, large (MA-L)");
    bind_identifier<MacBlockMedium>(m, "MacBlockMedium", "MAC address block, medium (MA-M)");
    bind_identifier<MacBlockSmall>(m, "MacBlockSmall", "MAC address block, small (MA-S)");

    // =========================================================================
    // Extended and context dependent identifiers
    // =========================================================================

    bind_identifier<Eui48>(m, "Eui48", "48-bit Extended Unique Identifier")
        .def(nb::init<const Oui24&, const std::array<uint8_t, 3>&>(), "oui"_a, "extension"_a)
        .def(nb::init<const Oui36&, uint8_t, uint8_t>(), "oui"_a, "nibble"_a, "extension"_a)
        .def(nb::init<const MacBlockLarge&, const std::array<uint8_t, 3>&>(), "block"_a,
             "extension"_a)
        .def(nb::init<const MacBlockMedium&, uint8_t, const std::array<uint8_t, 2>&>(),
             "block"_a, "nibble"_a, "extension"_a)
        .def(nb::init<const MacBlockSmall&, uint8_t, uint8_t>(), "block"_a, "nibble"_a,
             "extension"_a);

    bind_identifier<Eui60>(m, "Eui60", "60-bit Extended Unique Identifier")
        .def(nb::init<const Oui24&, const std::array<uint8_t, 5>&>(), "oui"_a, "extension"_a);

    bind_identifier<Eui64>(m, "Eui64", "64-bit Extended Unique Identifier")
        .def(nb::init<const Oui24&, const std::array<uint8_t, 5>&>(), "oui"_a, "extension"_a)
        .def(nb::init<const Oui36&, uint8_t, const std::array<uint8_t, 3>&>(), "oui"_a,
             "nibble"_a, "extension"_a)
        .def(nb::init<const MacBlockLarge&, const std::array<uint8_t, 5>&>(), "block"_a,
             "extension"_a)
        .def(nb::init<const MacBlockMedium&, uint8_t, const std::array<uint8_t, 4>&>(),
             "block"_a, "nibble"_a, "extension"_a)
        .def(nb::init<const MacBlockSmall&, uint8_t, const std::array<uint8_t, 3>&>(),
             "block"_a, "nibble"_a, "extension"_a);

    bind_identifier<ModifiedEui64>(m, "ModifiedEui64", "Modified EUI-64 (IPv6 interface ID)")
        .def(nb::init<const Oui24&, const std::array<uint8_t, 5>&>(), "oui"_a, "extension"_a)
        .def(nb::init<const Oui36&, uint8_t, const std::array<uint8_t, 3>&>(), "oui"_a,
             "nibble"_a, "extension"_a)
        .def(nb::init<const MacBlockLarge&, const std::array<uint8_t, 5>&>(), "block"_a,
             "extension"_a)
        .def(nb::init<const MacBlockMedium&, uint8_t, const std::array<uint8_t, 4>&>(),
             "block"_a, "nibble"_a, "extension"_a)
        .def(nb::init<const MacBlockSmall&, uint8_t, const std::array<uint8_t, 3>&>(),
             "block"_a, "nibble"_a, "extension"_a);

    bind_identifier<Cdi32>(m, "Cdi32", "32-bit Context Dependent Identifier")
        .def(nb::init<const Oui24&, uint8_t>(), "oui"_a, "extension"_a)
        .def(nb::init<const MacBlockLarge&, uint8_t>(), "block"_a, "extension"_a);

    bind_identifier<Cdi40>(m, "Cdi40", "40-bit Context Dependent Identifier")
        .def(nb::init<const Oui24&, const std::array<uint8_t, 2>&>(), "oui"_a, "extension"_a)
        .def(nb::init<const Oui36&, uint8_t>(), "oui"_a, "nibble"_a);

    // =========================================================================
    // Conversions
    // =========================================================================

    nb::enum_<Eui48Padding>(m, "Eui48Padding", "Octets inserted when widening an EUI-48")
        .value("mac48", Eui48Padding::mac48, "FF-FF")
        .value("eui48", Eui48Padding::eui48, "FF-FE");

    m.def("to_oui24", &to_oui24, "block"_a);
    m.def("to_ma_l", &to_ma_l, "oui"_a);
    m.def("to_oui36", &to_oui36, "block"_a);
    m.def("to_ma_s", &to_ma_s, "oui"_a);
    m.def("to_eui64", nb::overload_cast<const Eui48&, Eui48Padding>(&to_eui64), "eui"_a,
          "padding"_a = Eui48Padding::mac48, "Widen an EUI-48 to an EUI-64");
    m.def("to_eui64", nb::overload_cast<const ModifiedEui64&>(&to_eui64), "meui"_a,
          "Undo the registration bit inversion of a modified EUI-64");
    m.def("to_modified_eui64", nb::overload_cast<const Eui64&>(&to_modified_eui64), "eui"_a);
    m.def("to_modified_eui64", nb::overload_cast<const Eui48&>(&to_modified_eui64), "eui"_a,
          "IPv6 interface identifier from an EUI-48");
}

} // namespace ieeeid_python
