// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PWGUESS_ADJACENCY_GRAPHS_H
#define PWGUESS_ADJACENCY_GRAPHS_H

#include <map>
#include <string>
#include <vector>

/**
 * Physical neighbourhood of the keys on one input device. Each key is a
 * token of one or two characters (unshifted, shifted); every character
 * maps to the tokens of the keys around its own key, listed clockwise
 * starting from the left. A missing neighbour is an empty token.
 */
class CAdjacencyGraph
{
public:
    /**
     * Build from a layout drawing. Slanted layouts shift each row by one
     * column to the right, as on a typewriter keyboard; aligned layouts
     * (keypads) have eight neighbours per key.
     */
    CAdjacencyGraph(const std::string& strNameIn, const std::string& strLayout, bool fSlantedIn);

    const std::string& GetName() const { return strName; }
    bool IsSlanted() const { return fSlanted; }

    /** Neighbour tokens of the key that carries c, NULL if c is not on this device */
    const std::vector<std::string>* GetAdjacent(char32_t c) const;

    /** True if c needs shift on this device (second character of its key) */
    bool IsShifted(char32_t c) const;

    double GetStartingPositions() const { return nStartingPositions; }
    double GetAverageDegree() const { return nAverageDegree; }

private:
    std::string strName;
    bool fSlanted;
    std::map<char32_t, std::vector<std::string> > mapAdjacency;
    std::map<char32_t, bool> mapShifted;
    double nStartingPositions;
    double nAverageDegree;
};

/** The fixed set of devices the spatial matcher walks */
class CKeyboardGraphs
{
public:
    CKeyboardGraphs();

    const std::vector<CAdjacencyGraph>& Graphs() const { return vGraphs; }
    const CAdjacencyGraph* Find(const std::string& strName) const;

private:
    std::vector<CAdjacencyGraph> vGraphs;
};

/** qwerty, dvorak, keypad and mac_keypad, built on first use */
const CKeyboardGraphs& DefaultKeyboardGraphs();

#endif // PWGUESS_ADJACENCY_GRAPHS_H
