#pragma once

#include <cstdio>
#include <string>
#include <string_view>

namespace dirauth::ldap_escape {

// RFC 4515 section 3: assertion values inside a search filter
[[nodiscard]] inline std::string filter_value(std::string_view str) {
    std::string out;
    out.reserve(str.size());
    char tmp[4];
    for (const char ch : str) {
        const auto c = static_cast<unsigned char>(ch);
        if (c == '*' || c == '(' || c == ')' || c == '\\' || c == '\0' || c > 127) {
            std::snprintf(tmp, sizeof(tmp), "\\%02x", c);
            out += tmp;
        } else {
            out += ch;
        }
    }
    return out;
}

// RFC 4514 section 2.4: attribute values inside a distinguished name
[[nodiscard]] inline std::string dn_value(std::string_view str) {
    std::string out;
    out.reserve(str.size());
    for (size_t i = 0; i < str.size(); ++i) {
        const char c = str[i];
        const bool leading = (i == 0) && (c == ' ' || c == '#');
        const bool trailing = (i + 1 == str.size()) && c == ' ';
        switch (c) {
            case '"': case '+': case ',': case ';':
            case '<': case '>': case '\\': case '=':
                out += '\\';
                out += c;
                break;
            case '\0':
                out += "\\00";
                break;
            default:
                if (leading || trailing) out += '\\';
                out += c;
        }
    }
    return out;
}

} // namespace dirauth::ldap_escape
