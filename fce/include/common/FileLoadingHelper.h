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

#include "common/Logger.h"
#include <fstream>
#include <sstream>
#include <string>

namespace FCE {

/**
 * @brief Helper functions for loading machine definition documents from disk
 */
class FileLoadingHelper {
public:
    /**
     * @brief Normalize file path by removing a "file:" / "file://" URI prefix
     *
     * @param srcPath Source path (may include "file:" prefix)
     * @return Normalized file path without URI prefix
     */
    static std::string normalizePath(const std::string &srcPath) {
        if (srcPath.rfind("file://", 0) == 0) {
            return srcPath.substr(7);
        } else if (srcPath.rfind("file:", 0) == 0) {
            return srcPath.substr(5);
        }
        return srcPath;
    }

    /**
     * @brief Load file content from disk
     *
     * Leading/trailing whitespace is trimmed.
     *
     * @param filePath Path to file (may include "file:" prefix)
     * @param content Output parameter for file content
     * @return true if file loaded successfully, false on error
     */
    static bool loadFileContent(const std::string &filePath, std::string &content) {
        std::string actualPath = normalizePath(filePath);
        std::ifstream file(actualPath);
        if (!file.is_open()) {
            LOG_ERROR("FileLoadingHelper: Failed to open file: {}", actualPath);
            return false;
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        content = buffer.str();

        size_t start = content.find_first_not_of(" \t\r\n");
        size_t end = content.find_last_not_of(" \t\r\n");

        if (start != std::string::npos && end != std::string::npos) {
            content = content.substr(start, end - start + 1);
        } else if (start == std::string::npos) {
            content = "";  // All whitespace
        }

        LOG_DEBUG("FileLoadingHelper: Loaded {} bytes from {}", content.size(), actualPath);
        return true;
    }
};

}  // namespace FCE
