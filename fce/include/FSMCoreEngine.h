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

/**
 * @file FSMCoreEngine.h
 * @brief Single include for applications embedding the engine
 */

#include "Version.h"
#include "common/FSMErrors.h"
#include "common/Logger.h"
#include "model/MachineDefinition.h"
#include "model/MachineDefinitionBuilder.h"
#include "model/TransitionTable.h"
#include "parsing/DefinitionLoader.h"
#include "runtime/FiniteStateMachine.h"
#include "runtime/HandlerRegistry.h"
