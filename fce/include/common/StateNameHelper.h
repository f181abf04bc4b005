// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-FCE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of FCE (FSM Core Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Commercial License:
//   Individual: $100 cumulative
//   Enterprise: $500 cumulative
//   Contact: https://github.com/newmassrael
//
// Full terms: see LICENSE

#pragma once

#include <cctype>
#include <string>

namespace FCE {

/**
 * @brief Naming rules shared by the definition builder and the JSON loader
 */
class StateNameHelper {
public:
    /**
     * @brief Check that a state name is usable as a table key
     *
     * @param name Candidate state name
     * @return true if the name is non-empty
     */
    static bool isValidStateName(const std::string &name) {
        return !name.empty();
    }

    /**
     * @brief Derive the symbolic constant for a state name
     *
     * Upper-cases ASCII letters and replaces every other non-alphanumeric
     * character with '_'.
     *
     * @example
     * toSymbol("in_progress") → "IN_PROGRESS"
     * toSymbol("awaiting-review") → "AWAITING_REVIEW"
     */
    static std::string toSymbol(const std::string &name) {
        std::string symbol;
        symbol.reserve(name.size());
        for (char c : name) {
            unsigned char uc = static_cast<unsigned char>(c);
            if (std::isalnum(uc)) {
                symbol += static_cast<char>(std::toupper(uc));
            } else {
                symbol += '_';
            }
        }
        return symbol;
    }
};

}  // namespace FCE
