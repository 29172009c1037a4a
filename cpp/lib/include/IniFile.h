/** \file    IniFile.h
 *  \brief   Declarations for an initialisation file parsing class.
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
#pragma once


#include <stdexcept>
#include <string>
#include <vector>
#include <cinttypes>


/** \class  IniFile
 *  \brief  Read a configuration file in our .ini format.
 *
 *  The file consists of "[section]" headers followed by "name = value" lines.  Values may be double-quoted in
 *  which case C-style backslash escapes like \\n are recognised.  Everything following an unquoted and unescaped hash
 *  mark is a comment.  In order to extend a line over multiple lines, put backslashes just before the line ends on all
 *  but the last line.  Entries that precede the first section header belong to the section with the empty name.
 */
class IniFile {
public:
    struct Entry {
        std::string name_, value_;

    public:
        Entry(const std::string &name, const std::string &value): name_(name), value_(value) { }
    };

    class Section {
        friend class IniFile;
        std::string section_name_;
        std::vector<Entry> entries_;

    public:
        typedef std::vector<Entry>::const_iterator const_iterator;

    public:
        explicit Section(const std::string &section_name): section_name_(section_name) { }

        inline bool operator==(const std::string &section_name) const { return section_name == section_name_; }

        inline const std::string &getSectionName() const { return section_name_; }

        inline const_iterator begin() const { return entries_.cbegin(); }
        inline const_iterator end() const { return entries_.cend(); }

        //* \note Overwrites existing entries with the same name.
        void insert(const std::string &variable_name, const std::string &value);

        bool lookup(const std::string &variable_name, std::string * const s) const;

    private:
        const_iterator find(const std::string &variable_name) const;
    };

private:
    std::string ini_file_name_;
    std::vector<Section> sections_;
    unsigned current_line_no_;

public:
    /** \brief  Reads and parses "ini_file_name".
     *  \throws std::runtime_error if the file can't be read or is syntactically invalid.
     */
    explicit IniFile(const std::string &ini_file_name);

    const std::string &getFilename() const { return ini_file_name_; }

    bool lookup(const std::string &section_name, const std::string &variable_name, std::string * const s) const;

    bool sectionIsDefined(const std::string &section_name) const;
    bool variableIsDefined(const std::string &section_name, const std::string &variable_name) const;

    std::vector<std::string> getSections() const;

    //* \note Aborts if the variable is not defined.
    std::string getString(const std::string &section_name, const std::string &variable_name) const;
    std::string getString(const std::string &section_name, const std::string &variable_name, const std::string &default_value) const;

    //* \note Aborts if the variable is not defined or not a valid unsigned integer.
    unsigned getUnsigned(const std::string &section_name, const std::string &variable_name) const;
    unsigned getUnsigned(const std::string &section_name, const std::string &variable_name, const unsigned default_value) const;

    uint64_t getUint64T(const std::string &section_name, const std::string &variable_name) const;
    uint64_t getUint64T(const std::string &section_name, const std::string &variable_name, const uint64_t default_value) const;

    double getDouble(const std::string &section_name, const std::string &variable_name, const double default_value) const;

    /** \brief  Retrieves a boolean value.
     *  \return True if the retrieved value was "true", "yes" or "on" and false if the retrieved value was "false",
     *          "no" or "off", or the default if it was not defined.
     *  \note   Any other value results in program termination.
     */
    bool getBool(const std::string &section_name, const std::string &variable_name, const bool default_value) const;

private:
    void processFile();
    void processSectionHeader(const std::string &line);
    void processSectionEntry(const std::string &line);
    std::runtime_error makeError(const std::string &function_name, const std::string &msg) const;
};
