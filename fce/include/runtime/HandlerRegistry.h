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

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace FCE {

class FiniteStateMachine;

/**
 * @brief Behavior invoked while a transition is in flight
 *
 * Receives the machine (still reporting the old state through
 * getCurrentState()) and the destination state name.
 */
using TransitionHandler = std::function<void(FiniteStateMachine &machine, const std::string &targetState)>;

/**
 * @brief Handlers applicable to one destination state
 *
 * Either member may be empty; absence is the common case.
 */
struct HandlerSet {
    const TransitionHandler *wildcard = nullptr;
    const TransitionHandler *specific = nullptr;

    bool empty() const {
        return wildcard == nullptr && specific == nullptr;
    }
};

/**
 * @brief Explicit registry of transition handlers
 *
 * Holds at most one wildcard handler, run on every transition, and at most
 * one specific handler per destination state. Registering again replaces
 * the previous handler.
 */
class HandlerRegistry {
public:
    HandlerRegistry() = default;

    /**
     * @brief Register the handler run on every successful transition
     * @throws InvalidHandlerError if handler is empty
     */
    void setWildcardHandler(TransitionHandler handler);

    /**
     * @brief Register the handler run when transitioning into state
     * @throws InvalidHandlerError if handler is empty or state is empty
     */
    void setStateHandler(const std::string &state, TransitionHandler handler);

    /**
     * @brief Locate the handlers for a destination state
     *
     * Never fails. Pointers stay valid for the registry's lifetime.
     */
    HandlerSet resolve(const std::string &targetState) const;

    bool hasWildcardHandler() const {
        return static_cast<bool>(wildcard_);
    }

    bool hasStateHandler(const std::string &state) const;

    /**
     * @brief States with a specific handler, lexicographic order
     */
    std::vector<std::string> getHandledStates() const;

private:
    TransitionHandler wildcard_;
    std::map<std::string, TransitionHandler> stateHandlers_;
};

}  // namespace FCE
