/** \file    IniFile.cc
 *  \brief   Implementation of class IniFile.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Artur Kedzierski
 *  \author  Dr. Gordon W. Paynter
 *
 *  \copyright 2002-2008 Project iVia.
 *  \copyright 2002-2008 The Regents of The University of California.
 *  \copyright 2015-2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include "IniFile.h"
#include <algorithm>
#include <fstream>
#include <cctype>
#include <cerrno>
#include <cstring>
#include "StringUtil.h"
#include "util.h"


void IniFile::Section::insert(const std::string &variable_name, const std::string &value) {
    const auto existing_entry(std::find_if(entries_.begin(), entries_.end(),
                                           [&variable_name](const Entry &entry) { return entry.name_ == variable_name; }));
    if (existing_entry == entries_.end())
        entries_.emplace_back(variable_name, value);
    else
        existing_entry->value_ = value;
}


bool IniFile::Section::lookup(const std::string &variable_name, std::string * const s) const {
    const auto existing_entry(find(variable_name));
    if (existing_entry == entries_.end()) {
        s->clear();
        return false;
    }

    *s = existing_entry->value_;
    return true;
}


IniFile::Section::const_iterator IniFile::Section::find(const std::string &variable_name) const {
    return std::find_if(entries_.cbegin(), entries_.cend(),
                        [&variable_name](const Entry &entry) { return entry.name_ == variable_name; });
}


IniFile::IniFile(const std::string &ini_file_name): ini_file_name_(ini_file_name), current_line_no_(0) {
    processFile();
}


std::runtime_error IniFile::makeError(const std::string &function_name, const std::string &msg) const {
    return std::runtime_error("in IniFile::" + function_name + ": " + msg + " on line " + std::to_string(current_line_no_)
                              + " in file \"" + ini_file_name_ + "\"!");
}


void IniFile::processSectionHeader(const std::string &line) {
    if (line[line.length() - 1] != ']')
        throw makeError("processSectionHeader", "garbled section header");

    const std::string section_name(StringUtil::TrimWhite(line.substr(1, line.length() - 2)));
    if (section_name.empty())
        throw makeError("processSectionHeader", "empty section name");

    if (std::find(sections_.cbegin(), sections_.cend(), section_name) != sections_.cend())
        throw makeError("processSectionHeader", "duplicate section \"" + section_name + "\"");
    sections_.emplace_back(section_name);
}


namespace {


// IsValidVariableName -- only allow names that start with a letter followed by letters, digits,
// hyphens and underscores.
//
bool IsValidVariableName(const std::string &possible_variable_name) {
    if (unlikely(possible_variable_name.empty()))
        return false;

    auto ch(possible_variable_name.cbegin());
    if (not std::isalpha(static_cast<unsigned char>(*ch)))
        return false;

    for (++ch; ch != possible_variable_name.cend(); ++ch) {
        if (not std::isalnum(static_cast<unsigned char>(*ch)) and *ch != '-' and *ch != '_' and *ch != '.')
            return false;
    }

    return true;
}


bool CStyleUnescape(std::string * const s) {
    std::string unescaped;
    for (auto ch(s->cbegin()); ch != s->cend(); ++ch) {
        if (*ch != '\\') {
            unescaped += *ch;
            continue;
        }

        if (++ch == s->cend())
            return false;
        switch (*ch) {
        case 'n':
            unescaped += '\n';
            break;
        case 't':
            unescaped += '\t';
            break;
        case 'r':
            unescaped += '\r';
            break;
        case '\\':
        case '"':
        case '#':
            unescaped += *ch;
            break;
        default:
            return false;
        }
    }

    s->swap(unescaped);
    return true;
}


void StripComment(std::string * const line) {
    bool inside_string_literal(false);
    for (auto character(line->begin()); character != line->end(); ++character) {
        if (*character == '"' and (character == line->begin() or *(character - 1) != '\\'))
            inside_string_literal = not inside_string_literal;
        else if (*character == '#' and not inside_string_literal) {
            if (character != line->begin() and *(character - 1) == '\\')
                continue; // skip escaped hash characters
            line->resize(std::distance(line->begin(), character));
            return;
        }
    }
}


} // unnamed namespace


void IniFile::processSectionEntry(const std::string &line) {
    const size_t equal_sign(line.find('='));
    if (equal_sign == std::string::npos) {
        const std::string trimmed_line(StringUtil::TrimWhite(line));
        if (unlikely(not IsValidVariableName(trimmed_line)))
            throw makeError("processSectionEntry", "invalid variable name \"" + trimmed_line + "\"");

        sections_.back().insert(trimmed_line, "true");
        return;
    }

    const std::string variable_name(StringUtil::TrimWhite(line.substr(0, equal_sign)));
    if (variable_name.empty())
        throw makeError("processSectionEntry", "missing variable name");
    if (not IsValidVariableName(variable_name))
        throw makeError("processSectionEntry", "invalid variable name \"" + variable_name + "\"");

    std::string value(StringUtil::TrimWhite(line.substr(equal_sign + 1)));
    if (value.empty())
        throw makeError("processSectionEntry", "missing variable value");

    if (value[0] == '"') { // double-quoted string
        if (value.length() == 1 or value[value.length() - 1] != '"')
            throw makeError("processSectionEntry", "improperly quoted value");
        value = value.substr(1, value.length() - 2);
        if (not CStyleUnescape(&value))
            throw makeError("processSectionEntry", "bad escape");
    }

    sections_.back().insert(variable_name, value);
}


void IniFile::processFile() {
    std::ifstream ini_file(ini_file_name_.c_str());
    if (ini_file.fail())
        throw std::runtime_error("in IniFile::processFile: can't open \"" + ini_file_name_ + "\"! (" + std::string(std::strerror(errno))
                                 + ")");

    while (not ini_file.eof()) {
        std::string line;

        // Read lines until the newline character is not preceeded by a backslash:
        bool continued_line(false);
        do {
            std::string buf;
            std::getline(ini_file, buf);
            ++current_line_no_;
            line += StringUtil::Trim(buf, " \t\r");
            if (line.empty())
                break;

            continued_line = line[line.length() - 1] == '\\';
            if (continued_line)
                line = StringUtil::Trim(line.substr(0, line.length() - 1), " \t");
        } while (continued_line and not ini_file.eof());

        StripComment(&line);
        StringUtil::Trim(" \t", &line);
        if (line.empty())
            continue;

        if (line[0] == '[')
            processSectionHeader(line);
        else {
            if (sections_.empty())
                sections_.emplace_back("");
            processSectionEntry(line);
        }
    }
}


bool IniFile::lookup(const std::string &section_name, const std::string &variable_name, std::string * const s) const {
    const auto section(std::find(sections_.cbegin(), sections_.cend(), section_name));
    if (section == sections_.cend())
        return false;

    return section->lookup(variable_name, s);
}


bool IniFile::sectionIsDefined(const std::string &section_name) const {
    return std::find(sections_.cbegin(), sections_.cend(), section_name) != sections_.cend();
}


bool IniFile::variableIsDefined(const std::string &section_name, const std::string &variable_name) const {
    std::string value;
    return lookup(section_name, variable_name, &value);
}


std::vector<std::string> IniFile::getSections() const {
    std::vector<std::string> section_names;
    for (const auto &section : sections_)
        section_names.emplace_back(section.getSectionName());

    return section_names;
}


std::string IniFile::getString(const std::string &section_name, const std::string &variable_name) const {
    std::string value;
    if (unlikely(not lookup(section_name, variable_name, &value)))
        LOG_ERROR("can't find \"" + variable_name + "\" in section \"" + section_name + "\" in \"" + ini_file_name_ + "\"!");

    return value;
}


std::string IniFile::getString(const std::string &section_name, const std::string &variable_name, const std::string &default_value) const {
    std::string value;
    return lookup(section_name, variable_name, &value) ? value : default_value;
}


unsigned IniFile::getUnsigned(const std::string &section_name, const std::string &variable_name) const {
    unsigned number;
    const std::string value(getString(section_name, variable_name));
    if (not StringUtil::ToUnsigned(value, &number))
        LOG_ERROR("invalid unsigned entry \"" + variable_name + "\" in section \"" + section_name + "\"!");

    return number;
}


unsigned IniFile::getUnsigned(const std::string &section_name, const std::string &variable_name, const unsigned default_value) const {
    return variableIsDefined(section_name, variable_name) ? getUnsigned(section_name, variable_name) : default_value;
}


uint64_t IniFile::getUint64T(const std::string &section_name, const std::string &variable_name) const {
    uint64_t number;
    const std::string value(getString(section_name, variable_name));
    if (not StringUtil::ToUInt64T(value, &number))
        LOG_ERROR("invalid uint64_t entry \"" + variable_name + "\" in section \"" + section_name + "\"!");

    return number;
}


uint64_t IniFile::getUint64T(const std::string &section_name, const std::string &variable_name, const uint64_t default_value) const {
    return variableIsDefined(section_name, variable_name) ? getUint64T(section_name, variable_name) : default_value;
}


double IniFile::getDouble(const std::string &section_name, const std::string &variable_name, const double default_value) const {
    std::string value;
    if (not lookup(section_name, variable_name, &value))
        return default_value;

    double number;
    if (not StringUtil::ToDouble(value, &number))
        LOG_ERROR("invalid double entry \"" + variable_name + "\" in section \"" + section_name + "\"!");

    return number;
}


bool IniFile::getBool(const std::string &section_name, const std::string &variable_name, const bool default_value) const {
    std::string value;
    if (not lookup(section_name, variable_name, &value))
        return default_value;

    StringUtil::ToLower(&value);
    if (value == "true" or value == "yes" or value == "on")
        return true;
    if (value == "false" or value == "no" or value == "off")
        return false;

    LOG_ERROR("invalid boolean value \"" + value + "\" for \"" + variable_name + "\" in section \"" + section_name + "\"!");
}
