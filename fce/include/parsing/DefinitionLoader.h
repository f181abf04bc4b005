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

#include "common/FSMErrors.h"
#include "common/JsonUtils.h"
#include "model/MachineDefinitionBuilder.h"
#include <memory>
#include <string>

namespace FCE {

/**
 * @brief Builds a MachineDefinition from a structured (JSON) description
 *
 * Expected document:
 * @code
 * {
 *     "transitions": {
 *         "created": ["waiting"],
 *         "waiting": ["in_progress", "done"],
 *         "in_progress": ["waiting", "done"],
 *         "done": null
 *     },
 *     "default_state": "created"
 * }
 * @endcode
 *
 * "allowed_transitions" is accepted in place of "transitions". The result is
 * the same MachineDefinition type MachineDefinitionBuilder produces, so a
 * loaded machine behaves exactly like a declared one.
 *
 * Handlers cannot be expressed in a document; pass a builder carrying them
 * and the loader adds the transitions and default state to it. The builder
 * must not declare transitions of its own.
 */
class DefinitionLoader {
public:
    static constexpr const char *TRANSITIONS_KEY = "transitions";
    static constexpr const char *LEGACY_TRANSITIONS_KEY = "allowed_transitions";
    static constexpr const char *DEFAULT_STATE_KEY = "default_state";

    /**
     * @brief Result type for loader operations
     *
     * On failure code is always ErrorCode::MalformedDefinition and cause
     * holds the specific reason when validation narrowed it down
     * (InvalidDefault, NoStatesDefined, InvalidState).
     */
    struct LoadResult {
        std::shared_ptr<const MachineDefinition> value;
        std::string error;
        ErrorCode code = ErrorCode::None;
        ErrorCode cause = ErrorCode::None;
        bool success = false;

        LoadResult(std::shared_ptr<const MachineDefinition> definition)
            : value(std::move(definition)), success(true) {}

        LoadResult(ErrorCode errorCause, const std::string &err)
            : error(err), code(ErrorCode::MalformedDefinition), cause(errorCause), success(false) {}

        bool has_value() const {
            return success;
        }

        explicit operator bool() const {
            return success;
        }
    };

    /**
     * @brief Load a definition from a parsed document
     * @param document Parsed JSON description
     * @param builder Builder carrying pre-registered handlers
     * @return Definition or error description
     */
    static LoadResult load(const json &document, MachineDefinitionBuilder builder = {});

    /**
     * @brief Parse JSON text and load it
     */
    static LoadResult loadFromString(const std::string &text, MachineDefinitionBuilder builder = {});

    /**
     * @brief Read a JSON file ("file:" prefix allowed) and load it
     */
    static LoadResult loadFromFile(const std::string &path, MachineDefinitionBuilder builder = {});

    /**
     * @brief Describe a definition in the document format load() accepts
     *
     * Handlers are not part of the document.
     */
    static json toJson(const MachineDefinition &definition);
};

}  // namespace FCE
