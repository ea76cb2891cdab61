// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "SSDPHTTPUtils.hpp"
#include <cctype>

SSDPHTTPHeader::SSDPHTTPHeader(const std::string &line0)
{
    _storage = line0 + "\r\n";
}

void SSDPHTTPHeader::addField(const std::string &key, const std::string &value)
{
    _storage += key + ": " + value + "\r\n";
}

void SSDPHTTPHeader::finalize(void)
{
    _storage += "\r\n";
}

SSDPHTTPHeader::SSDPHTTPHeader(const void *buff, const size_t length)
{
    _storage = std::string((const char *)buff, length);
}

std::string SSDPHTTPHeader::getLine0(void) const
{
    const auto pos = _storage.find("\r\n");
    if (pos == std::string::npos) return "";
    return _storage.substr(0, pos);
}

static bool keyMatches(const std::string &line, const std::string &key)
{
    if (line.size() <= key.size()) return false;
    if (line[key.size()] != ':') return false;
    for (size_t i = 0; i < key.size(); i++)
    {
        if (std::toupper((unsigned char)line[i]) != std::toupper((unsigned char)key[i])) return false;
    }
    return true;
}

std::string SSDPHTTPHeader::getField(const std::string &key) const
{
    //skip the request/response line
    auto pos = _storage.find("\r\n");
    while (pos != std::string::npos)
    {
        pos += 2;

        //a field is only complete with its line terminator
        const auto end = _storage.find("\r\n", pos);
        if (end == std::string::npos) return "";

        //blank line ends the header block
        if (end == pos) return "";

        const auto line = _storage.substr(pos, end-pos);
        if (keyMatches(line, key))
        {
            //offset from whitespace
            auto valuePos = key.size()+1;
            while (valuePos < line.size() and std::isspace((unsigned char)line[valuePos])) valuePos++;
            return line.substr(valuePos);
        }
        pos = end;
    }
    return "";
}

bool SSDPHTTPHeader::isTerminated(void) const
{
    return _storage.find("\r\n\r\n") != std::string::npos;
}
