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

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace FCE {

using json = nlohmann::json;

/**
 * @brief Centralized JSON processing utilities using nlohmann/json
 *
 * Consistent parsing and error reporting for machine definition documents.
 */
class JsonUtils {
public:
    /**
     * @brief Parse JSON string into json object with error handling
     * @param jsonString Input JSON string
     * @param errorOut Optional error message output
     * @return Parsed json object or nullopt on failure
     */
    static std::optional<json> parseJson(const std::string &jsonString, std::string *errorOut = nullptr);

    /**
     * @brief Serialize json object to compact JSON string
     */
    static std::string toCompactString(const json &value);

    /**
     * @brief Serialize json object to pretty-formatted JSON string
     */
    static std::string toPrettyString(const json &value);

    /**
     * @brief Check if JSON object has key and it's not null
     * @param object JSON object
     * @param key Key to check
     * @return true if key exists and is not null
     */
    static bool hasKey(const json &object, const std::string &key);

    /**
     * @brief Human readable type name for diagnostics ("array", "string", ...)
     */
    static std::string typeName(const json &value);
};

}  // namespace FCE
