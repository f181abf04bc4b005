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

#include "runtime/FiniteStateMachine.h"
#include "common/Logger.h"
#include <stdexcept>

namespace FCE {

namespace {

/**
 * @brief Marks a machine as mid-transition for the guard's lifetime
 *
 * Cleared on scope exit, including when a handler throws.
 */
class TransitionGuard {
public:
    explicit TransitionGuard(bool &inTransition) : inTransition_(inTransition) {
        inTransition_ = true;
    }

    ~TransitionGuard() noexcept {
        inTransition_ = false;
    }

    TransitionGuard(const TransitionGuard &) = delete;
    TransitionGuard &operator=(const TransitionGuard &) = delete;

private:
    bool &inTransition_;
};

}  // anonymous namespace

FiniteStateMachine::FiniteStateMachine(std::shared_ptr<const MachineDefinition> definition,
                                       const std::string &initialState)
    : definition_(std::move(definition)) {
    if (!definition_) {
        throw std::invalid_argument("FiniteStateMachine: Definition cannot be null");
    }

    if (initialState.empty()) {
        currentState_ = definition_->getDefaultState();
    } else if (definition_->getTable().isValidState(initialState)) {
        currentState_ = initialState;
    } else {
        LOG_ERROR("FiniteStateMachine: Initial state '{}' is not a recognized state", initialState);
        throw InvalidStateError(initialState, "'" + initialState + "' is not a recognized state");
    }

    LOG_DEBUG("FiniteStateMachine: Created in state '{}'", currentState_);
}

FiniteStateMachine::FiniteStateMachine(std::shared_ptr<const MachineDefinition> definition, const char *initialState)
    : FiniteStateMachine(std::move(definition), std::string(initialState != nullptr ? initialState : "")) {}

bool FiniteStateMachine::isValid(const std::string &state) const {
    return definition_->getTable().isValidState(state);
}

bool FiniteStateMachine::isAllowed(const std::string &state) const {
    return definition_->getTable().isAllowed(currentState_, state);
}

std::vector<std::string> FiniteStateMachine::getAllStates() const {
    return definition_->getTable().getAllStates();
}

std::vector<std::string> FiniteStateMachine::getAllowedTransitions() const {
    const auto &edges = definition_->getTable().getOutgoing(currentState_);
    return edges.has_value() ? *edges : std::vector<std::string>{};
}

bool FiniteStateMachine::isTerminal() const {
    return definition_->getTable().isTerminal(currentState_);
}

FiniteStateMachine::TransitionResult FiniteStateMachine::validateTransition(const std::string &targetState) const {
    if (!isValid(targetState)) {
        LOG_WARN("FiniteStateMachine: '{}' is not a recognized state", targetState);
        return TransitionResult(ErrorCode::InvalidState, currentState_, targetState,
                                "'" + targetState + "' is not a recognized state");
    }

    if (!isAllowed(targetState)) {
        LOG_WARN("FiniteStateMachine: '{}' cannot transition to '{}'", currentState_, targetState);
        return TransitionResult(ErrorCode::TransitionNotAllowed, currentState_, targetState,
                                "'" + currentState_ + "' cannot transition to '" + targetState + "'");
    }

    return TransitionResult(true, currentState_, targetState);
}

FiniteStateMachine::TransitionResult FiniteStateMachine::transitionTo(const std::string &targetState) {
    if (inTransition_) {
        LOG_WARN("FiniteStateMachine: Transition to '{}' requested while '{}' is still transitioning", targetState,
                 currentState_);
        return TransitionResult(ErrorCode::TransitionInProgress, currentState_, targetState,
                                "Cannot transition to '" + targetState + "' from a handler of the same machine");
    }

    TransitionResult result = validateTransition(targetState);
    if (!result.success) {
        return result;
    }

    TransitionGuard guard(inTransition_);

    // Handlers run while the transition is in flight: currentState_ still holds the source
    HandlerSet handlers = definition_->getHandlers().resolve(targetState);
    if (handlers.wildcard) {
        LOG_DEBUG("FiniteStateMachine: Running wildcard handler for '{}' -> '{}'", currentState_, targetState);
        (*handlers.wildcard)(*this, targetState);
    }
    if (handlers.specific) {
        LOG_DEBUG("FiniteStateMachine: Running handler of '{}' for '{}' -> '{}'", targetState, currentState_,
                  targetState);
        (*handlers.specific)(*this, targetState);
    }

    currentState_ = targetState;
    LOG_DEBUG("FiniteStateMachine: Transitioned '{}' -> '{}'", result.fromState, currentState_);
    return result;
}

void FiniteStateMachine::transitionToOrThrow(const std::string &targetState) {
    TransitionResult result = transitionTo(targetState);
    switch (result.error) {
    case ErrorCode::None:
        return;
    case ErrorCode::InvalidState:
        throw InvalidStateError(targetState, result.errorMessage);
    case ErrorCode::TransitionNotAllowed:
        throw TransitionNotAllowedError(result.fromState, result.toState, result.errorMessage);
    default:
        throw FSMError(result.error, result.errorMessage);
    }
}

}  // namespace FCE
