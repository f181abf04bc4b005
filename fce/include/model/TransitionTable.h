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

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace FCE {

/**
 * @brief Immutable mapping from state name to its permitted destinations
 *
 * Each source state maps either to an ordered, duplicate-free list of
 * destination names or to std::nullopt (terminal marker, no outgoing edges).
 *
 * Destination policy: every destination must itself be a key. A state that
 * is only ever entered must be declared explicitly as terminal.
 */
class TransitionTable {
public:
    using Edges = std::optional<std::vector<std::string>>;
    using Entries = std::map<std::string, Edges>;

    /**
     * @brief Build and validate a table
     *
     * Duplicate destinations within one list are collapsed, keeping the
     * first occurrence.
     *
     * @param entries Source state → edges
     * @throws NoStatesDefinedError if entries is empty
     * @throws MalformedDefinitionError on an empty state name or a destination
     *         that is not a key
     */
    explicit TransitionTable(Entries entries);

    /**
     * @brief All state names in lexicographic order
     */
    std::vector<std::string> getAllStates() const;

    bool isValidState(const std::string &state) const;

    /**
     * @brief Check whether the edge from → to is declared
     *
     * Self transitions are allowed only when explicitly listed.
     */
    bool isAllowed(const std::string &from, const std::string &to) const;

    /**
     * @brief Raw edges of a state, std::nullopt for the terminal marker
     * @throws InvalidStateError if from is not a key
     */
    const Edges &getOutgoing(const std::string &from) const;

    /**
     * @brief True for the terminal marker and for an explicit empty list
     */
    bool isTerminal(const std::string &state) const;

    size_t size() const {
        return entries_.size();
    }

    const Entries &getEntries() const {
        return entries_;
    }

private:
    Entries entries_;
};

}  // namespace FCE
