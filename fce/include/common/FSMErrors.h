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

#include <stdexcept>
#include <string>

namespace FCE {

/**
 * @brief Error kinds reported by the engine
 *
 * Construction-time kinds (InvalidDefault, MalformedDefinition, InvalidHandler,
 * NoStatesDefined) abort building a definition. Operation-time kinds
 * (InvalidState, TransitionNotAllowed, TransitionInProgress) leave the
 * machine usable.
 */
enum class ErrorCode {
    None,
    InvalidDefault,
    InvalidState,
    TransitionNotAllowed,
    MalformedDefinition,
    InvalidHandler,
    NoStatesDefined,
    TransitionInProgress
};

/**
 * @brief Stable name of an error code ("TransitionNotAllowed", ...)
 */
const char *errorCodeToString(ErrorCode code);

/**
 * @brief Base class of every exception thrown by the engine
 */
class FSMError : public std::runtime_error {
public:
    FSMError(ErrorCode code, const std::string &message) : std::runtime_error(message), code_(code) {}

    ErrorCode getCode() const {
        return code_;
    }

private:
    ErrorCode code_;
};

/**
 * @brief Default state of a definition is missing or not a table key
 */
class InvalidDefaultError : public FSMError {
public:
    explicit InvalidDefaultError(const std::string &message) : FSMError(ErrorCode::InvalidDefault, message) {}
};

/**
 * @brief A state name is not recognized by the definition
 */
class InvalidStateError : public FSMError {
public:
    InvalidStateError(const std::string &state, const std::string &message)
        : FSMError(ErrorCode::InvalidState, message), state_(state) {}

    const std::string &getState() const {
        return state_;
    }

private:
    std::string state_;
};

/**
 * @brief The source state has no edge to the requested target
 */
class TransitionNotAllowedError : public FSMError {
public:
    TransitionNotAllowedError(const std::string &fromState, const std::string &toState, const std::string &message)
        : FSMError(ErrorCode::TransitionNotAllowed, message), fromState_(fromState), toState_(toState) {}

    const std::string &getFromState() const {
        return fromState_;
    }

    const std::string &getToState() const {
        return toState_;
    }

private:
    std::string fromState_;
    std::string toState_;
};

/**
 * @brief A definition (declared or loaded) cannot be interpreted as a table/default pair
 */
class MalformedDefinitionError : public FSMError {
public:
    explicit MalformedDefinitionError(const std::string &message)
        : FSMError(ErrorCode::MalformedDefinition, message) {}
};

/**
 * @brief A handler was registered without a callable target
 */
class InvalidHandlerError : public FSMError {
public:
    explicit InvalidHandlerError(const std::string &message) : FSMError(ErrorCode::InvalidHandler, message) {}
};

/**
 * @brief A definition declares no states at all
 */
class NoStatesDefinedError : public FSMError {
public:
    explicit NoStatesDefinedError(const std::string &message) : FSMError(ErrorCode::NoStatesDefined, message) {}
};

}  // namespace FCE
