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

#include "model/TransitionTable.h"
#include "runtime/HandlerRegistry.h"
#include <map>
#include <optional>
#include <set>
#include <string>

namespace FCE {

/**
 * @brief Immutable description of one machine shape
 *
 * Transition table, default state, transition handlers and the symbolic
 * state lookup. A definition is built once (MachineDefinitionBuilder or
 * DefinitionLoader) and shared read-only by any number of
 * FiniteStateMachine instances through std::shared_ptr<const MachineDefinition>.
 */
class MachineDefinition {
public:
    /**
     * @brief Validate and assemble a definition
     *
     * @throws InvalidDefaultError if defaultState is empty or not a table key
     * @throws InvalidStateError if a handler targets an unknown state
     */
    MachineDefinition(TransitionTable table, const std::string &defaultState, HandlerRegistry handlers = {});

    const TransitionTable &getTable() const {
        return table_;
    }

    const std::string &getDefaultState() const {
        return defaultState_;
    }

    const HandlerRegistry &getHandlers() const {
        return handlers_;
    }

    /**
     * @brief Resolve a symbolic constant ("IN_PROGRESS") to its state name
     * @return State name, or nullopt for an unknown or ambiguous symbol
     */
    std::optional<std::string> getStateForSymbol(const std::string &symbol) const;

    /**
     * @brief Check if several states map to symbol ("draft" and "Draft" both give "DRAFT")
     */
    bool isAmbiguousSymbol(const std::string &symbol) const;

    /**
     * @brief Symbol → state name for every state with an unambiguous symbol
     */
    const std::map<std::string, std::string> &getSymbols() const {
        return symbols_;
    }

private:
    TransitionTable table_;
    std::string defaultState_;
    HandlerRegistry handlers_;
    std::map<std::string, std::string> symbols_;
    std::set<std::string> ambiguousSymbols_;
};

}  // namespace FCE
