#pragma once

#include <algorithm>
#include <cctype>
#include <string_view>

namespace eldor {

/// ASCII case-insensitive comparison, used for names read from scenario files.
inline bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char l, char r) {
               return std::tolower(static_cast<unsigned char>(l)) ==
                      std::tolower(static_cast<unsigned char>(r));
           });
}

} // namespace eldor
