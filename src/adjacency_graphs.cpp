// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "adjacency_graphs.h"

#include "util.h"

#include <sstream>
#include <stdexcept>
#include <utility>

static const char* const LAYOUT_QWERTY =
    "`~ 1! 2@ 3# 4$ 5% 6^ 7& 8* 9( 0) -_ =+\n"
    "    qQ wW eE rR tT yY uU iI oO pP [{ ]} \\|\n"
    "     aA sS dD fF gG hH jJ kK lL ;: '\"\n"
    "      zZ xX cC vV bB nN mM ,< .> /?\n";

static const char* const LAYOUT_DVORAK =
    "`~ 1! 2@ 3# 4$ 5% 6^ 7& 8* 9( 0) [{ ]}\n"
    "    '\" ,< .> pP yY fF gG cC rR lL /? =+ \\|\n"
    "     aA oO eE uU iI dD hH tT nN sS -_\n"
    "      ;: qQ jJ kK xX bB mM wW vV zZ\n";

static const char* const LAYOUT_KEYPAD =
    "  / * -\n"
    "7 8 9 +\n"
    "4 5 6\n"
    "1 2 3\n"
    "  0 .\n";

static const char* const LAYOUT_MAC_KEYPAD =
    "  = / *\n"
    "7 8 9 -\n"
    "4 5 6 +\n"
    "1 2 3\n"
    "  0 .\n";

typedef std::pair<int, int> Coord;

static std::vector<Coord> NeighbourCoords(int x, int y, bool fSlanted)
{
    std::vector<Coord> v;
    if (fSlanted) {
        v.push_back(Coord(x - 1, y));
        v.push_back(Coord(x, y - 1));
        v.push_back(Coord(x + 1, y - 1));
        v.push_back(Coord(x + 1, y));
        v.push_back(Coord(x, y + 1));
        v.push_back(Coord(x - 1, y + 1));
    } else {
        v.push_back(Coord(x - 1, y));
        v.push_back(Coord(x - 1, y - 1));
        v.push_back(Coord(x, y - 1));
        v.push_back(Coord(x + 1, y - 1));
        v.push_back(Coord(x + 1, y));
        v.push_back(Coord(x + 1, y + 1));
        v.push_back(Coord(x, y + 1));
        v.push_back(Coord(x - 1, y + 1));
    }
    return v;
}

CAdjacencyGraph::CAdjacencyGraph(const std::string& strNameIn, const std::string& strLayout, bool fSlantedIn)
    : strName(strNameIn), fSlanted(fSlantedIn), nStartingPositions(0), nAverageDegree(0)
{
    std::map<Coord, std::string> mapPositions;
    size_t nTokenSize = 0;

    std::istringstream streamLayout(strLayout);
    std::string strLine;
    for (int y = 0; std::getline(streamLayout, strLine); y++) {
        int nSlant = fSlanted ? y : 0;
        size_t nPos = 0;
        while ((nPos = strLine.find_first_not_of(' ', nPos)) != std::string::npos) {
            size_t nEnd = strLine.find(' ', nPos);
            if (nEnd == std::string::npos)
                nEnd = strLine.size();
            std::string strToken = strLine.substr(nPos, nEnd - nPos);
            if (nTokenSize == 0)
                nTokenSize = strToken.size();
            int nUnit = nTokenSize + 1;
            if (strToken.size() != nTokenSize || (int(nPos) - nSlant) % nUnit != 0)
                throw std::runtime_error(strprintf("%s: misaligned key %s in layout %s", __func__, strToken, strName));
            mapPositions[Coord((int(nPos) - nSlant) / nUnit, y)] = strToken;
            nPos = nEnd;
        }
    }

    size_t nEdges = 0;
    for (std::map<Coord, std::string>::const_iterator it = mapPositions.begin(); it != mapPositions.end(); ++it) {
        std::vector<std::string> vAdjacent;
        size_t nDegree = 0;
        std::vector<Coord> vCoords = NeighbourCoords(it->first.first, it->first.second, fSlanted);
        for (size_t n = 0; n < vCoords.size(); n++) {
            std::map<Coord, std::string>::const_iterator mi = mapPositions.find(vCoords[n]);
            if (mi != mapPositions.end()) {
                vAdjacent.push_back(mi->second);
                nDegree++;
            } else {
                vAdjacent.push_back(std::string());
            }
        }
        const std::string& strKey = it->second;
        for (size_t n = 0; n < strKey.size(); n++) {
            char32_t c = static_cast<unsigned char>(strKey[n]);
            mapAdjacency[c] = vAdjacent;
            mapShifted[c] = (n == 1);
            nEdges += nDegree;
        }
    }

    nStartingPositions = mapAdjacency.size();
    if (!mapAdjacency.empty())
        nAverageDegree = double(nEdges) / mapAdjacency.size();
}

const std::vector<std::string>* CAdjacencyGraph::GetAdjacent(char32_t c) const
{
    std::map<char32_t, std::vector<std::string> >::const_iterator it = mapAdjacency.find(c);
    if (it == mapAdjacency.end())
        return NULL;
    return &it->second;
}

bool CAdjacencyGraph::IsShifted(char32_t c) const
{
    std::map<char32_t, bool>::const_iterator it = mapShifted.find(c);
    return it != mapShifted.end() && it->second;
}

CKeyboardGraphs::CKeyboardGraphs()
{
    vGraphs.push_back(CAdjacencyGraph("qwerty", LAYOUT_QWERTY, true));
    vGraphs.push_back(CAdjacencyGraph("dvorak", LAYOUT_DVORAK, true));
    vGraphs.push_back(CAdjacencyGraph("keypad", LAYOUT_KEYPAD, false));
    vGraphs.push_back(CAdjacencyGraph("mac_keypad", LAYOUT_MAC_KEYPAD, false));
}

const CAdjacencyGraph* CKeyboardGraphs::Find(const std::string& strName) const
{
    for (size_t n = 0; n < vGraphs.size(); n++) {
        if (vGraphs[n].GetName() == strName)
            return &vGraphs[n];
    }
    return NULL;
}

const CKeyboardGraphs& DefaultKeyboardGraphs()
{
    static const CKeyboardGraphs graphs;
    return graphs;
}
