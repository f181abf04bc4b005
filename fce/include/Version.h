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

#include <string>

namespace FCE {

constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;
constexpr const char *VERSION_RELEASE = "alpha";

/**
 * @brief Library version string
 *
 * @param full Append the release tag ("1.0.0-alpha") instead of the short semver ("1.0.0")
 */
std::string getVersion(bool full = false);

}  // namespace FCE
