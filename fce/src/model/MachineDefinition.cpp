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

#include "model/MachineDefinition.h"
#include "common/FSMErrors.h"
#include "common/Logger.h"
#include "common/StateNameHelper.h"

namespace FCE {

MachineDefinition::MachineDefinition(TransitionTable table, const std::string &defaultState,
                                     HandlerRegistry handlers)
    : table_(std::move(table)), defaultState_(defaultState), handlers_(std::move(handlers)) {
    if (defaultState_.empty()) {
        LOG_ERROR("MachineDefinition: Default state not defined");
        throw InvalidDefaultError("Default state is not defined");
    }
    if (!table_.isValidState(defaultState_)) {
        LOG_ERROR("MachineDefinition: Default state '{}' is not a declared state", defaultState_);
        throw InvalidDefaultError("Default state '" + defaultState_ + "' is not a declared state");
    }

    for (const auto &state : handlers_.getHandledStates()) {
        if (!table_.isValidState(state)) {
            LOG_ERROR("MachineDefinition: Handler registered for unknown state '{}'", state);
            throw InvalidStateError(state, "Handler registered for unknown state '" + state + "'");
        }
    }

    for (const auto &state : table_.getAllStates()) {
        std::string symbol = StateNameHelper::toSymbol(state);
        if (ambiguousSymbols_.count(symbol) > 0) {
            continue;
        }
        auto [it, inserted] = symbols_.emplace(symbol, state);
        if (!inserted) {
            // A shared symbol resolves to no state
            LOG_DEBUG("MachineDefinition: States '{}' and '{}' share symbol '{}', symbol left unresolved", it->second,
                      state, symbol);
            symbols_.erase(it);
            ambiguousSymbols_.insert(symbol);
        }
    }

    LOG_DEBUG("MachineDefinition: {} states, default '{}', wildcard handler: {}, state handlers: {}", table_.size(),
              defaultState_, handlers_.hasWildcardHandler(), handlers_.getHandledStates().size());
}

std::optional<std::string> MachineDefinition::getStateForSymbol(const std::string &symbol) const {
    auto it = symbols_.find(symbol);
    if (it == symbols_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MachineDefinition::isAmbiguousSymbol(const std::string &symbol) const {
    return ambiguousSymbols_.count(symbol) > 0;
}

}  // namespace FCE
