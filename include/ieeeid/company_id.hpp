#pragma once

#include <string_view>

#include <cstddef>
#include <cstdint>

#include "detail/identifier_base.hpp"

namespace ieeeid {

/**
 * IEEE-assigned Company ID (CID), always 24 bits.
 *
 * A CID occupies the same 24-bit space as an MA-L or OUI-24 but has the
 * registration (X) bit set, marking every identifier rooted in it as
 * locally administered. A CID may not be used to build EUIs and no
 * conversion to or from any other kind exists.
 *
 * Construction:
 * - From bytes: the registration bit is forced SET.
 * - From text: yields zero() unless the text decodes to exactly three
 *   octets with the registration bit already SET.
 */
class CompanyId : public detail::IdentifierBase<CompanyId, 3> {
public:
    static constexpr IdentifierKind kind = IdentifierKind::company_id;
    static constexpr std::size_t bit_length = 24;
    static constexpr RegistrationRule text_registration = RegistrationRule::local;

    constexpr CompanyId() noexcept = default;

    constexpr explicit CompanyId(const bytes_type& bytes) noexcept
        : IdentifierBase(detail::with_registration(bytes, Registration::local)) {}

    explicit CompanyId(std::string_view text) : CompanyId(parse(text).value_or(zero())) {}
};

using Cid = CompanyId;

} // namespace ieeeid
