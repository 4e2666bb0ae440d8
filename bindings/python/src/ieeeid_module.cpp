// IEEEID Python Bindings
// Main module entry point - includes component bindings

#include <nanobind/nanobind.h>

// Binding components
#include "error_bindings.hpp"
#include "identifier_bindings.hpp"

namespace nb = nanobind;

// Define the exception type pointer (declared extern in py_types.hpp)
namespace ieeeid_python {
PyObject* parse_error_type = nullptr;
} // namespace ieeeid_python

NB_MODULE(ieeeid, m) {
    m.doc() = "IEEEID - IEEE Registration Authority identifier types";

    // 1. Enums and exceptions (sets parse_error_type)
    ieeeid_python::bind_errors(m);

    // 2. Identifier classes and conversions - need IdentifierKind, parse_error_type
    ieeeid_python::bind_identifiers(m);
}
