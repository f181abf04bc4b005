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

#include "model/MachineDefinitionBuilder.h"
#include "common/FSMErrors.h"
#include "common/Logger.h"

namespace FCE {

MachineDefinitionBuilder &MachineDefinitionBuilder::withTransitions(const std::string &from,
                                                                    std::vector<std::string> destinations) {
    declarations_.emplace_back(from, std::move(destinations));
    return *this;
}

MachineDefinitionBuilder &MachineDefinitionBuilder::withTerminalState(const std::string &state) {
    declarations_.emplace_back(state, std::nullopt);
    return *this;
}

std::shared_ptr<const MachineDefinition> MachineDefinitionBuilder::build() const {
    TransitionTable::Entries entries;
    for (const auto &[state, edges] : declarations_) {
        if (!entries.emplace(state, edges).second) {
            LOG_ERROR("MachineDefinitionBuilder: State '{}' declared more than once", state);
            throw MalformedDefinitionError("State '" + state + "' is declared more than once");
        }
    }

    return std::make_shared<MachineDefinition>(TransitionTable(std::move(entries)), defaultState_, handlers_);
}

}  // namespace FCE
