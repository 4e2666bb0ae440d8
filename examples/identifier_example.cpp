#include <iostream>
#include <string>
#include <unordered_set>

#include <ieeeid.hpp>

using namespace ieeeid;

// Helper function to print identifier details
template <IeeeIdentifier T>
void printIdentifier(const T& id, const std::string& label) {
    std::cout << label << ":\n";
    std::cout << "  Kind: " << identifier_kind_string(T::kind) << " (" << T::bit_length
              << " bits)\n";
    std::cout << "  Text: " << id.to_colon_hex() << "\n";
    std::cout << "  Scope: " << (id.is_multicast() ? "multicast" : "unicast") << "\n";
    std::cout << "  Registration: " << (id.is_local() ? "local" : "global") << "\n";
    std::cout << "  Valid: " << (id.is_valid() ? "yes" : "no") << "\n";
    std::cout << std::endl;
}

int main() {
    std::cout << "IEEEID Identifier Examples\n";
    std::cout << "==========================\n\n";

    // Example 1: Creating identifiers
    std::cout << "1. Creating Identifiers\n";
    std::cout << "-----------------------\n";

    // From text (lenient: invalid text gives the zero value)
    Eui48 nic("00-1B-63-84-45-E6");
    printIdentifier(nic, "EUI-48 from text");

    // From raw bytes (kind-specific bits are forced)
    Oui24 oui({0x02, 0x1B, 0x63});
    printIdentifier(oui, "OUI-24 from bytes 02:1B:63");

    CompanyId cid("12:34:56");
    printIdentifier(cid, "Company ID");

    // Example 2: Composite construction
    std::cout << "2. Composite Construction\n";
    std::cout << "-------------------------\n";

    MacBlockSmall block("70:B3:D5:12:30");
    Eui48 device(block, 0x05, 0x67);
    printIdentifier(device, "EUI-48 from MA-S + nibble + octet");

    Cdi40 cdi(Oui36("70:B3:D5:00:10"), 0x0B);
    printIdentifier(cdi, "CDI-40 from OUI-36 + nibble");

    // Example 3: Strict parsing
    std::cout << "3. Strict Parsing\n";
    std::cout << "-----------------\n";

    for (const char* text : {"00:1B:63:84:45:E6", "02:1B:63:84:45:E6", "00:1B:63", "zz"}) {
        auto result = Eui48::parse(text);
        if (result) {
            std::cout << "  " << text << " -> " << *result << "\n";
        } else {
            std::cout << "  " << text << " -> error: " << result.error().message() << "\n";
        }
    }
    std::cout << std::endl;

    // Example 4: Conversions
    std::cout << "4. Conversions\n";
    std::cout << "--------------\n";

    std::cout << "  EUI-48:              " << nic << "\n";
    std::cout << "  EUI-64 (MAC-48):     " << to_eui64(nic) << "\n";
    std::cout << "  EUI-64 (EUI-48):     " << to_eui64(nic, Eui48Padding::eui48) << "\n";
    std::cout << "  IPv6 interface ID:   " << to_modified_eui64(nic) << "\n";
    std::cout << "  OUI-24 -> MA-L:      " << to_ma_l(oui) << "\n";
    std::cout << std::endl;

    // Example 5: Identifiers as hash keys
    std::cout << "5. Hashing\n";
    std::cout << "----------\n";

    std::unordered_set<Eui48> seen{nic, Eui48("00:1b:63:84:45:e6"), device};
    std::cout << "  Distinct EUI-48 values: " << seen.size() << "\n";

    return 0;
}
