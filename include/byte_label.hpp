#pragma once

#include <array>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

/// \brief Tests whether the byte has a symbolic name rather than being displayed as itself.
inline bool has_symbolic_label(uint8_t const c) {
    return c < 0x20 || c == 0x20 || c == 0x7F || c == 0xA0 || c == 0xAD;
}

/// \brief Produces the label of a byte for display in a frequency table.
///
/// Control characters, space, DEL, non-breaking space and soft hyphen are given symbolic names.
/// Other printable ASCII characters are displayed as themselves, and any remaining byte
/// is displayed as its hexadecimal value, e.g., <tt>&lt;0xE9&gt;</tt>, so the label is always plain ASCII.
inline std::string byte_label(uint8_t const c) {
    // symbolic names of the C0 control codes 0x00 to 0x1F
    static constexpr std::array<std::string_view, 32> c0_names = {
        "<NULL>", "<SOH>", "<STX>", "<ETX>", "<EOT>", "<ENQ>", "<ACK>", "<BEL>",
        "<BS>",   "<TAB>", "\\n",   "<VT>",  "<FF>",  "\\r",   "<SO>",  "<SI>",
        "<DLE>",  "<DC1>", "<DC2>", "<DC3>", "<DC4>", "<NAK>", "<SYN>", "<ETB>",
        "<CAN>",  "<EM>",  "<SUB>", "<ESC>", "<FS>",  "<GS>",  "<RS>",  "<US>",
    };

    if(c < 0x20) return std::string(c0_names[c]);

    switch(c) {
        case 0x20: return "<space>";
        case 0x7F: return "<DEL>";
        case 0xA0: return "<non break space>";
        case 0xAD: return "<soft hyphen>";
        default: break;
    }

    if(c < 0x7F) return std::string(1, (char)c);

    std::ostringstream oss;
    oss << "<0x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0') << (unsigned int)c << ">";
    return oss.str();
}
