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

#include "parsing/DefinitionLoader.h"
#include "common/FileLoadingHelper.h"
#include "common/Logger.h"
#include <vector>

namespace FCE {

namespace {
DefinitionLoader::LoadResult malformed(ErrorCode cause, const std::string &message) {
    LOG_WARN("DefinitionLoader: {}", message);
    return DefinitionLoader::LoadResult(cause, message);
}
}  // anonymous namespace

DefinitionLoader::LoadResult DefinitionLoader::load(const json &document, MachineDefinitionBuilder builder) {
    if (!document.is_object()) {
        return malformed(ErrorCode::None,
                         "Definition document must be an object, got " + JsonUtils::typeName(document));
    }

    bool hasTransitions = document.contains(TRANSITIONS_KEY);
    bool hasLegacyTransitions = document.contains(LEGACY_TRANSITIONS_KEY);
    if (hasTransitions && hasLegacyTransitions) {
        return malformed(ErrorCode::None, std::string("Definition declares both '") + TRANSITIONS_KEY + "' and '" +
                                              LEGACY_TRANSITIONS_KEY + "'");
    }
    if (!hasTransitions && !hasLegacyTransitions) {
        return malformed(ErrorCode::None, std::string("Definition is missing '") + TRANSITIONS_KEY + "'");
    }

    const json &transitions = document.at(hasTransitions ? TRANSITIONS_KEY : LEGACY_TRANSITIONS_KEY);
    if (!transitions.is_object()) {
        return malformed(ErrorCode::None, "Transitions must be an object, got " + JsonUtils::typeName(transitions));
    }

    for (const auto &[state, edges] : transitions.items()) {
        if (edges.is_null()) {
            builder.withTerminalState(state);
            continue;
        }
        if (!edges.is_array()) {
            return malformed(ErrorCode::None, "Edges of '" + state + "' must be an array or null, got " +
                                                  JsonUtils::typeName(edges));
        }

        std::vector<std::string> destinations;
        destinations.reserve(edges.size());
        for (const auto &destination : edges) {
            if (!destination.is_string()) {
                return malformed(ErrorCode::None, "Edges of '" + state + "' must contain state names, got " +
                                                      JsonUtils::toCompactString(destination));
            }
            destinations.push_back(destination.get<std::string>());
        }
        builder.withTransitions(state, std::move(destinations));
    }

    if (!JsonUtils::hasKey(document, DEFAULT_STATE_KEY)) {
        return malformed(ErrorCode::InvalidDefault, std::string("Definition is missing '") + DEFAULT_STATE_KEY + "'");
    }
    const json &defaultState = document.at(DEFAULT_STATE_KEY);
    if (!defaultState.is_string()) {
        return malformed(ErrorCode::InvalidDefault,
                         std::string("'") + DEFAULT_STATE_KEY + "' must be a string, got " +
                             JsonUtils::toCompactString(defaultState));
    }
    builder.withDefaultState(defaultState.get<std::string>());

    try {
        auto definition = builder.build();
        LOG_DEBUG("DefinitionLoader: Loaded definition with {} states", definition->getTable().size());
        return LoadResult(std::move(definition));
    } catch (const FSMError &e) {
        return malformed(e.getCode(), e.what());
    }
}

DefinitionLoader::LoadResult DefinitionLoader::loadFromString(const std::string &text,
                                                              MachineDefinitionBuilder builder) {
    std::string parseError;
    auto document = JsonUtils::parseJson(text, &parseError);
    if (!document) {
        return malformed(ErrorCode::None, "Invalid JSON: " + parseError);
    }
    return load(*document, std::move(builder));
}

DefinitionLoader::LoadResult DefinitionLoader::loadFromFile(const std::string &path, MachineDefinitionBuilder builder) {
    std::string content;
    if (!FileLoadingHelper::loadFileContent(path, content)) {
        return malformed(ErrorCode::None, "Cannot read definition file: " + path);
    }
    return loadFromString(content, std::move(builder));
}

json DefinitionLoader::toJson(const MachineDefinition &definition) {
    json transitions = json::object();
    for (const auto &[state, edges] : definition.getTable().getEntries()) {
        transitions[state] = edges.has_value() ? json(*edges) : json(nullptr);
    }

    json document = json::object();
    document[TRANSITIONS_KEY] = std::move(transitions);
    document[DEFAULT_STATE_KEY] = definition.getDefaultState();
    return document;
}

}  // namespace FCE
