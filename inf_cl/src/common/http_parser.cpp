/*
 * Part of the Infinity client (INF) project.
 *
 * SPDX-FileCopyrightText: 2025 Infinity client contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of the Infinity client (INF). See LICENSE for details.
 */

#include "inf/internal/http_parser.hpp"
#include <sstream>
#include <strings.h> // strcasecmp

namespace inf::internal {

std::string url_encode(const std::string& s){
    static const char unreserved[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-._~";
    auto is_unreserved = [&](unsigned char c){
        for(const char* p=unreserved; *p; ++p) if((unsigned char)*p==c) return true;
        return false;
    };
    std::string out; out.reserve(s.size()*3);
    for(unsigned char c: s){
        if(is_unreserved(c)) out.push_back((char)c);
        else {
            static const char* H="0123456789ABCDEF";
            out.push_back('%'); out.push_back(H[c>>4]); out.push_back(H[c&0xF]);
        }
    }
    return out;
}

std::string canonical_query_sorted(const std::map<std::string,std::string>& params){
    std::ostringstream oss;
    bool first=true;
    for(const auto& kv: params){
        if(!first) oss << '&';
        first=false;
        oss << url_encode(kv.first) << '=' << url_encode(kv.second);
    }
    return oss.str();
}

std::string hdr_ci(const std::unordered_map<std::string,std::string>& H, const char* name){
    auto it = H.find(name);
    if (it != H.end()) return it->second;
    for (const auto& kv : H){
        if (strcasecmp(kv.first.c_str(), name)==0) return kv.second;
    }
    return {};
}

} // namespace inf::internal
