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
#include "model/MachineDefinition.h"
#include <memory>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <vector>

namespace FCE {

/**
 * @brief One entity's position in a MachineDefinition
 *
 * Holds the current state, the shared definition and an optional subject:
 * an external object handlers may read and mutate. The subject is never
 * owned or copied; the caller keeps it alive for the machine's lifetime.
 *
 * transitionTo() runs, in this order:
 * 1. target validation (InvalidState)
 * 2. edge validation from the current state (TransitionNotAllowed)
 * 3. the wildcard handler, if registered
 * 4. the handler registered for the target, if any
 * 5. commit of the new current state
 *
 * Handlers therefore observe the old state through getCurrentState() and
 * receive the new one as their argument.
 *
 * Not thread-safe; a machine must not be shared across concurrent callers
 * without external locking. The definition itself may be shared freely.
 */
class FiniteStateMachine {
public:
    /**
     * @brief Outcome of a transition attempt
     */
    struct TransitionResult {
        bool success = false;
        ErrorCode error = ErrorCode::None;
        std::string fromState;
        std::string toState;
        std::string errorMessage;

        TransitionResult() = default;

        TransitionResult(bool s, const std::string &from, const std::string &to)
            : success(s), fromState(from), toState(to) {}

        TransitionResult(ErrorCode code, const std::string &from, const std::string &to, const std::string &message)
            : success(false), error(code), fromState(from), toState(to), errorMessage(message) {}

        explicit operator bool() const {
            return success;
        }
    };

    /**
     * @brief Create a machine without subject
     *
     * @param definition Shared machine definition
     * @param initialState Starting state, empty for the definition's default
     * @throws std::invalid_argument if definition is null
     * @throws InvalidStateError if initialState is not a declared state
     */
    explicit FiniteStateMachine(std::shared_ptr<const MachineDefinition> definition,
                                const std::string &initialState = "");

    /**
     * @brief Overloads keeping C strings away from the subject constructor
     */
    FiniteStateMachine(std::shared_ptr<const MachineDefinition> definition, const char *initialState);
    FiniteStateMachine(std::shared_ptr<const MachineDefinition> definition, char *initialState)
        : FiniteStateMachine(std::move(definition), static_cast<const char *>(initialState)) {}

    /**
     * @brief Create a machine bound to a subject
     *
     * A subject bound through a const pointer is only handed back by
     * getSubject<const Subject>().
     *
     * @param definition Shared machine definition
     * @param subject External object exposed to handlers (not owned, may be null)
     * @param initialState Starting state, empty for the definition's default
     * @throws InvalidStateError if initialState is not a declared state
     */
    template <typename Subject>
    FiniteStateMachine(std::shared_ptr<const MachineDefinition> definition, Subject *subject,
                       const std::string &initialState = "")
        : FiniteStateMachine(std::move(definition), initialState) {
        if (subject != nullptr) {
            subject_ = const_cast<void *>(static_cast<const void *>(subject));
            subjectType_ = &typeid(Subject);
            subjectIsConst_ = std::is_const_v<Subject>;
        }
    }

    /**
     * @brief Get current state name
     */
    const std::string &getCurrentState() const {
        return currentState_;
    }

    /**
     * @brief Check if a state name is declared by the definition
     */
    bool isValid(const std::string &state) const;

    /**
     * @brief Check if the current state has an edge to state
     */
    bool isAllowed(const std::string &state) const;

    /**
     * @brief All declared states, lexicographic order
     */
    std::vector<std::string> getAllStates() const;

    /**
     * @brief Destinations reachable from the current state (empty when terminal)
     */
    std::vector<std::string> getAllowedTransitions() const;

    /**
     * @brief Check if the current state has no outgoing edges
     */
    bool isTerminal() const;

    /**
     * @brief Move to targetState along a declared edge
     *
     * On failure no handler runs and the current state is unchanged.
     * Exceptions thrown by handlers propagate and also leave the state
     * unchanged. A handler calling transitionTo() on the machine it runs
     * for gets TransitionInProgress.
     *
     * @param targetState Destination state name
     * @return Transition result (InvalidState, TransitionNotAllowed or TransitionInProgress on failure)
     */
    TransitionResult transitionTo(const std::string &targetState);

    /**
     * @brief transitionTo() reporting failures as exceptions
     *
     * @throws InvalidStateError if targetState is not declared
     * @throws TransitionNotAllowedError if the edge is not declared
     * @throws FSMError (TransitionInProgress) if called from a handler of this machine
     */
    void transitionToOrThrow(const std::string &targetState);

    const std::shared_ptr<const MachineDefinition> &getDefinition() const {
        return definition_;
    }

    bool hasSubject() const {
        return subject_ != nullptr;
    }

    /**
     * @brief Access the bound subject
     *
     * @return Subject pointer, nullptr if none is bound, Subject is not the bound type,
     *         or the subject was bound const and Subject is not
     */
    template <typename Subject> Subject *getSubject() const {
        if (subject_ == nullptr || *subjectType_ != typeid(Subject)) {
            return nullptr;
        }
        if (subjectIsConst_ && !std::is_const_v<Subject>) {
            return nullptr;
        }
        return static_cast<Subject *>(subject_);
    }

private:
    std::shared_ptr<const MachineDefinition> definition_;
    std::string currentState_;
    void *subject_ = nullptr;
    const std::type_info *subjectType_ = nullptr;
    bool subjectIsConst_ = false;
    bool inTransition_ = false;

    TransitionResult validateTransition(const std::string &targetState) const;
};

}  // namespace FCE
