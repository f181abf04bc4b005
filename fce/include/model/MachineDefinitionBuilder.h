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

#include "model/MachineDefinition.h"
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace FCE {

/**
 * @brief Builder pattern for MachineDefinition construction
 *
 * Collects transitions, the default state and handlers, then validates all
 * of them together in build().
 *
 * @code
 * auto definition = MachineDefinitionBuilder()
 *                       .withTransitions("created", {"waiting"})
 *                       .withTransitions("waiting", {"in_progress", "done"})
 *                       .withTransitions("in_progress", {"waiting", "done"})
 *                       .withTerminalState("done")
 *                       .withDefaultState("created")
 *                       .onTransitionTo("done", [](FiniteStateMachine &fsm, const std::string &) { ... })
 *                       .build();
 * @endcode
 */
class MachineDefinitionBuilder {
public:
    MachineDefinitionBuilder() = default;

    /**
     * @brief Declare a source state and its permitted destinations
     *
     * An empty list declares a state with no outgoing edges.
     */
    MachineDefinitionBuilder &withTransitions(const std::string &from, std::vector<std::string> destinations);

    MachineDefinitionBuilder &withTransitions(const std::string &from,
                                              std::initializer_list<std::string> destinations) {
        return withTransitions(from, std::vector<std::string>(destinations));
    }

    /**
     * @brief Declare a state carrying the terminal marker
     */
    MachineDefinitionBuilder &withTerminalState(const std::string &state);

    MachineDefinitionBuilder &withDefaultState(const std::string &state) {
        defaultState_ = state;
        return *this;
    }

    /**
     * @brief Register the handler run on every transition
     * @throws InvalidHandlerError if handler is empty
     */
    MachineDefinitionBuilder &onAnyTransition(TransitionHandler handler) {
        handlers_.setWildcardHandler(std::move(handler));
        return *this;
    }

    /**
     * @brief Register the handler run when transitioning into state
     * @throws InvalidHandlerError if handler is empty
     */
    MachineDefinitionBuilder &onTransitionTo(const std::string &state, TransitionHandler handler) {
        handlers_.setStateHandler(state, std::move(handler));
        return *this;
    }

    /**
     * @brief Validate everything collected so far and build the definition
     *
     * @return Immutable, shareable definition
     * @throws NoStatesDefinedError if no state was declared
     * @throws MalformedDefinitionError on a state declared twice, an empty name
     *         or an undeclared destination
     * @throws InvalidDefaultError if the default state is missing or unknown
     * @throws InvalidStateError if a handler targets an unknown state
     */
    std::shared_ptr<const MachineDefinition> build() const;

private:
    std::vector<std::pair<std::string, TransitionTable::Edges>> declarations_;
    std::string defaultState_;
    HandlerRegistry handlers_;
};

}  // namespace FCE
