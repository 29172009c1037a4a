/** \file   SchemaMapper.h
 *  \brief  Maps raw dump records onto the fixed, per-category output schemas.
 *
 *  \copyright 2026 Universitätsbibliothek Tübingen.  All rights reserved.
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


#include <string>
#include <vector>
#include <cinttypes>
#include "SyncTypes.h"


namespace OLSync {


enum ColumnType { STRING, STRING_LIST, INT64, TIMESTAMP /* ms since the epoch, UTC */ };


struct ColumnSpec {
    std::string name_;
    ColumnType type_;
    bool required_;

public:
    ColumnSpec(const std::string &name, const ColumnType type, const bool required = false)
        : name_(name), type_(type), required_(required) { }
};


const std::vector<ColumnSpec> &GetSchema(const Category category);


class ColumnValue {
    bool is_null_;
    std::string text_;
    int64_t number_;
    std::vector<std::string> list_;

public:
    ColumnValue(): is_null_(true), number_(0) { }

    static ColumnValue Null() { return ColumnValue(); }
    static ColumnValue Text(const std::string &text);
    static ColumnValue Number(const int64_t number);
    static ColumnValue List(const std::vector<std::string> &list);

    inline bool isNull() const { return is_null_; }
    inline const std::string &getText() const { return text_; }
    inline int64_t getNumber() const { return number_; }
    inline const std::vector<std::string> &getList() const { return list_; }

    //* \return A rough estimate of the memory needed for this value.
    size_t estimatedSize() const;

    bool operator==(const ColumnValue &rhs) const;
    bool operator!=(const ColumnValue &rhs) const { return not operator==(rhs); }
};


/** \brief  A record in the shape of its category's schema.
 *  \note   "values_" always has one entry per schema column, unset columns are null.
 */
struct MappedRecord {
    Category category_;
    std::vector<ColumnValue> values_;

public:
    explicit MappedRecord(const Category category): category_(category), values_(GetSchema(category).size()) { }

    //* \throws std::out_of_range if "column_name" is not part of our schema.
    const ColumnValue &getValue(const std::string &column_name) const;
    void setValue(const std::string &column_name, const ColumnValue &value);

    size_t estimatedSize() const;

    bool operator==(const MappedRecord &rhs) const { return category_ == rhs.category_ and values_ == rhs.values_; }
};


class SchemaMapper {
    Category category_;
    uint64_t skipped_count_;

public:
    explicit SchemaMapper(const Category category): category_(category), skipped_count_(0) { }

    /** \return False if "raw_record" lacks a required column, in which case it should be skipped.  Skipped records are
     *          counted.
     */
    bool map(const RawRecord &raw_record, MappedRecord * const mapped_record);

    inline uint64_t getSkippedCount() const { return skipped_count_; }
};


// Coercion helpers.  Each returns a null ColumnValue if the member is missing or can't be converted.


//* \brief Accepts strings and {"type": "/type/text", "value": ...} objects.
ColumnValue GetTextValue(const nlohmann::json &json_obj, const std::string &member_name);

//* \brief Accepts arrays of strings or text objects.
ColumnValue GetTextListValue(const nlohmann::json &json_obj, const std::string &member_name);

//* \brief Accepts arrays of key strings, {"key": ...} objects and {"author": {"key": ...}} style references.
ColumnValue GetKeyListValue(const nlohmann::json &json_obj, const std::string &member_name);

//* \brief Accepts integral JSON numbers and strings containing a decimal integer.
ColumnValue GetIntegerValue(const nlohmann::json &json_obj, const std::string &member_name);

//* \brief Accepts ISO 8601 strings and {"type": "/type/datetime", "value": ...} objects.
ColumnValue GetTimestampValue(const nlohmann::json &json_obj, const std::string &member_name);

ColumnValue IntegerStringToValue(const std::string &integer_candidate);
ColumnValue TimestampStringToValue(const std::string &timestamp_candidate);


} // namespace OLSync
