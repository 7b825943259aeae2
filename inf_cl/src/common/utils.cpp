/*
 * Part of the Infinity client (INF) project.
 *
 * SPDX-FileCopyrightText: 2025 Infinity client contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of the Infinity client (INF). See LICENSE for details.
 */

#include "inf/internal/utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace inf::internal {

void trim_inplace(std::string& s) {
    std::size_t a = 0;
    while (a < s.size() && std::isspace((unsigned char)s[a])) ++a;
    std::size_t b = s.size();
    while (b > a && std::isspace((unsigned char)s[b-1])) --b;
    if (a > 0 || b < s.size()) s.assign(s.begin()+a, s.begin()+b);
}

int hexval(char c){
    if(c>='0'&&c<='9')return c-'0';
    if(c>='a'&&c<='f')return 10+(c-'a');
    if(c>='A'&&c<='F')return 10+(c-'A');
    return -1;
}

std::string upper_copy(std::string s){
    for(char& c: s) c = (char)std::toupper((unsigned char)c);
    return s;
}
std::string lower_copy(std::string s){
    for(char& c: s) c = (char)std::tolower((unsigned char)c);
    return s;
}

bool ends_with(const std::string& s, const std::string& suffix){
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string join(const std::vector<std::string>& parts, char sep){
    std::string out;
    for(std::size_t i=0;i<parts.size();++i){
        if(i) out.push_back(sep);
        out += parts[i];
    }
    return out;
}

std::vector<std::string> split(const std::string& s, char sep){
    std::vector<std::string> out;
    std::istringstream iss(s);
    std::string item;
    while (std::getline(iss, item, sep)) {
        trim_inplace(item);
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

} // namespace inf::internal
