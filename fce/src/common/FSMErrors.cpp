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

#include "common/FSMErrors.h"

namespace FCE {

const char *errorCodeToString(ErrorCode code) {
    switch (code) {
    case ErrorCode::None:
        return "None";
    case ErrorCode::InvalidDefault:
        return "InvalidDefault";
    case ErrorCode::InvalidState:
        return "InvalidState";
    case ErrorCode::TransitionNotAllowed:
        return "TransitionNotAllowed";
    case ErrorCode::MalformedDefinition:
        return "MalformedDefinition";
    case ErrorCode::InvalidHandler:
        return "InvalidHandler";
    case ErrorCode::NoStatesDefined:
        return "NoStatesDefined";
    case ErrorCode::TransitionInProgress:
        return "TransitionInProgress";
    }
    return "Unknown";
}

}  // namespace FCE
