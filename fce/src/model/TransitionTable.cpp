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

#include "model/TransitionTable.h"
#include "common/FSMErrors.h"
#include "common/Logger.h"
#include "common/StateNameHelper.h"
#include <algorithm>
#include <unordered_set>

namespace FCE {

TransitionTable::TransitionTable(Entries entries) : entries_(std::move(entries)) {
    if (entries_.empty()) {
        LOG_ERROR("TransitionTable: No states defined");
        throw NoStatesDefinedError("Transition table declares no states");
    }

    for (auto &[source, edges] : entries_) {
        if (!StateNameHelper::isValidStateName(source)) {
            LOG_ERROR("TransitionTable: Empty source state name");
            throw MalformedDefinitionError("State names must not be empty");
        }

        if (!edges.has_value()) {
            continue;
        }

        std::vector<std::string> unique;
        std::unordered_set<std::string> seen;
        for (const auto &destination : *edges) {
            if (!StateNameHelper::isValidStateName(destination)) {
                LOG_ERROR("TransitionTable: Empty destination in edges of '{}'", source);
                throw MalformedDefinitionError("State '" + source + "' lists an empty destination name");
            }
            if (entries_.find(destination) == entries_.end()) {
                LOG_ERROR("TransitionTable: Destination '{}' of '{}' is not a declared state", destination, source);
                throw MalformedDefinitionError("State '" + source + "' lists undeclared destination '" + destination +
                                               "' (declare it, with null edges if it is terminal)");
            }
            if (seen.insert(destination).second) {
                unique.push_back(destination);
            } else {
                LOG_WARN("TransitionTable: Duplicate destination '{}' in edges of '{}' ignored", destination, source);
            }
        }
        edges = std::move(unique);
    }
}

std::vector<std::string> TransitionTable::getAllStates() const {
    std::vector<std::string> states;
    states.reserve(entries_.size());
    for (const auto &entry : entries_) {
        states.push_back(entry.first);
    }
    return states;
}

bool TransitionTable::isValidState(const std::string &state) const {
    return entries_.find(state) != entries_.end();
}

bool TransitionTable::isAllowed(const std::string &from, const std::string &to) const {
    auto it = entries_.find(from);
    if (it == entries_.end() || !it->second.has_value()) {
        return false;
    }
    const auto &destinations = *it->second;
    return std::find(destinations.begin(), destinations.end(), to) != destinations.end();
}

const TransitionTable::Edges &TransitionTable::getOutgoing(const std::string &from) const {
    auto it = entries_.find(from);
    if (it == entries_.end()) {
        throw InvalidStateError(from, "'" + from + "' is not a recognized state");
    }
    return it->second;
}

bool TransitionTable::isTerminal(const std::string &state) const {
    auto it = entries_.find(state);
    if (it == entries_.end()) {
        return false;
    }
    return !it->second.has_value() || it->second->empty();
}

}  // namespace FCE
