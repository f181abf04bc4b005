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

#include "runtime/HandlerRegistry.h"
#include "common/FSMErrors.h"
#include "common/Logger.h"
#include "common/StateNameHelper.h"

namespace FCE {

void HandlerRegistry::setWildcardHandler(TransitionHandler handler) {
    if (!handler) {
        LOG_ERROR("HandlerRegistry: Wildcard handler is not callable");
        throw InvalidHandlerError("The wildcard handler is not callable");
    }
    if (wildcard_) {
        LOG_DEBUG("HandlerRegistry: Replacing wildcard handler");
    }
    wildcard_ = std::move(handler);
}

void HandlerRegistry::setStateHandler(const std::string &state, TransitionHandler handler) {
    if (!StateNameHelper::isValidStateName(state)) {
        LOG_ERROR("HandlerRegistry: Handler registered for an empty state name");
        throw InvalidHandlerError("Handlers must name a non-empty state");
    }
    if (!handler) {
        LOG_ERROR("HandlerRegistry: Handler for '{}' is not callable", state);
        throw InvalidHandlerError("The handler for '" + state + "' is not callable");
    }

    auto [it, inserted] = stateHandlers_.insert_or_assign(state, std::move(handler));
    if (!inserted) {
        LOG_DEBUG("HandlerRegistry: Replacing handler for '{}'", it->first);
    }
}

HandlerSet HandlerRegistry::resolve(const std::string &targetState) const {
    HandlerSet set;
    if (wildcard_) {
        set.wildcard = &wildcard_;
    }

    auto it = stateHandlers_.find(targetState);
    if (it != stateHandlers_.end()) {
        set.specific = &it->second;
    }
    return set;
}

bool HandlerRegistry::hasStateHandler(const std::string &state) const {
    return stateHandlers_.find(state) != stateHandlers_.end();
}

std::vector<std::string> HandlerRegistry::getHandledStates() const {
    std::vector<std::string> states;
    states.reserve(stateHandlers_.size());
    for (const auto &entry : stateHandlers_) {
        states.push_back(entry.first);
    }
    return states;
}

}  // namespace FCE
