#pragma once
// Shared helpers for IEEEID bindings

#include <nanobind/nanobind.h>

#include <ieeeid/identifier_error.hpp>

namespace nb = nanobind;

namespace ieeeid_python {

// Exception type pointer (set during module init)
extern PyObject* parse_error_type;

/**
 * @brief Unwrap a ParseResult or raise ieeeid.ParseError
 */
template <typename T>
T unwrap_or_raise(const ieeeid::ParseResult<T>& result) {
    if (!result) {
        PyErr_SetString(parse_error_type, result.error().message());
        throw nb::python_error();
    }
    return *result;
}

} // namespace ieeeid_python
