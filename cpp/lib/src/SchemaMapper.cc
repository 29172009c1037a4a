/** \file   SchemaMapper.cc
 *  \brief  Implementation of the per-category schema mapping.
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
#include "SchemaMapper.h"
#include <limits>
#include <stdexcept>
#include "StringUtil.h"
#include "TimeUtil.h"
#include "util.h"


namespace OLSync {


const std::vector<ColumnSpec> &GetSchema(const Category category) {
    static const std::vector<ColumnSpec> authors_schema{
        { "key", STRING, /* required = */ true },
        { "name", STRING },
        { "personal_name", STRING },
        { "alternate_names", STRING_LIST },
        { "birth_date", STRING },
        { "death_date", STRING },
        { "bio", STRING },
        { "remote_ids_wikidata", STRING },
        { "revision", INT64 },
        { "created", TIMESTAMP },
        { "last_modified", TIMESTAMP },
    };
    static const std::vector<ColumnSpec> editions_schema{
        { "key", STRING, /* required = */ true },
        { "title", STRING },
        { "subtitle", STRING },
        { "work_keys", STRING_LIST },
        { "author_keys", STRING_LIST },
        { "publishers", STRING_LIST },
        { "publish_date", STRING },
        { "number_of_pages", INT64 },
        { "isbn_10", STRING_LIST },
        { "isbn_13", STRING_LIST },
        { "languages", STRING_LIST },
        { "revision", INT64 },
        { "created", TIMESTAMP },
        { "last_modified", TIMESTAMP },
    };
    static const std::vector<ColumnSpec> works_schema{
        { "key", STRING, /* required = */ true },
        { "title", STRING },
        { "subtitle", STRING },
        { "author_keys", STRING_LIST },
        { "subjects", STRING_LIST },
        { "first_publish_date", STRING },
        { "description", STRING },
        { "covers", STRING_LIST },
        { "revision", INT64 },
        { "created", TIMESTAMP },
        { "last_modified", TIMESTAMP },
    };

    switch (category) {
    case AUTHORS:
        return authors_schema;
    case EDITIONS:
        return editions_schema;
    case WORKS:
        return works_schema;
    }

    LOG_ERROR("unknown category " + std::to_string(category) + "!");
}


ColumnValue ColumnValue::Text(const std::string &text) {
    ColumnValue value;
    value.is_null_ = false;
    value.text_ = text;
    return value;
}


ColumnValue ColumnValue::Number(const int64_t number) {
    ColumnValue value;
    value.is_null_ = false;
    value.number_ = number;
    return value;
}


ColumnValue ColumnValue::List(const std::vector<std::string> &list) {
    ColumnValue value;
    value.is_null_ = false;
    value.list_ = list;
    return value;
}


size_t ColumnValue::estimatedSize() const {
    size_t size(sizeof(ColumnValue) + text_.size());
    for (const auto &element : list_)
        size += sizeof(std::string) + element.size();
    return size;
}


bool ColumnValue::operator==(const ColumnValue &rhs) const {
    return is_null_ == rhs.is_null_ and text_ == rhs.text_ and number_ == rhs.number_ and list_ == rhs.list_;
}


namespace {


size_t GetColumnIndex(const Category category, const std::string &column_name) {
    const auto &schema(GetSchema(category));
    for (size_t column_index(0); column_index < schema.size(); ++column_index) {
        if (schema[column_index].name_ == column_name)
            return column_index;
    }

    throw std::out_of_range("\"" + column_name + "\" is not a column of the " + CategoryToString(category) + " schema!");
}


// Returns a pointer to the member or nullptr if it is missing or null.
const nlohmann::json *GetMember(const nlohmann::json &json_obj, const std::string &member_name) {
    if (not json_obj.is_object())
        return nullptr;

    const auto member(json_obj.find(member_name));
    if (member == json_obj.end() or member->is_null())
        return nullptr;
    return &*member;
}


// Strings are returned as is, {"type": ..., "value": "..."} objects yield their value.
bool ExtractText(const nlohmann::json &json_value, std::string * const text) {
    if (json_value.is_string()) {
        *text = json_value.get<std::string>();
        return true;
    }

    if (json_value.is_object()) {
        const auto value(json_value.find("value"));
        if (value != json_value.end() and value->is_string()) {
            *text = value->get<std::string>();
            return true;
        }
    }

    return false;
}


bool ExtractKey(const nlohmann::json &json_value, std::string * const key) {
    if (json_value.is_string()) {
        *key = json_value.get<std::string>();
        return true;
    }
    if (not json_value.is_object())
        return false;

    const auto key_member(json_value.find("key"));
    if (key_member != json_value.end() and key_member->is_string()) {
        *key = key_member->get<std::string>();
        return true;
    }

    // Works reference their authors as {"author": {"key": "/authors/OL1A"}, "type": {"key": "/type/author_role"}}.
    const auto author(json_value.find("author"));
    if (author != json_value.end())
        return ExtractKey(*author, key);

    return false;
}


} // unnamed namespace


const ColumnValue &MappedRecord::getValue(const std::string &column_name) const {
    return values_[GetColumnIndex(category_, column_name)];
}


void MappedRecord::setValue(const std::string &column_name, const ColumnValue &value) {
    values_[GetColumnIndex(category_, column_name)] = value;
}


size_t MappedRecord::estimatedSize() const {
    size_t size(sizeof(MappedRecord));
    for (const auto &value : values_)
        size += value.estimatedSize();
    return size;
}


ColumnValue GetTextValue(const nlohmann::json &json_obj, const std::string &member_name) {
    const nlohmann::json * const member(GetMember(json_obj, member_name));
    std::string text;
    if (member == nullptr or not ExtractText(*member, &text))
        return ColumnValue::Null();
    return ColumnValue::Text(text);
}


ColumnValue GetTextListValue(const nlohmann::json &json_obj, const std::string &member_name) {
    const nlohmann::json * const member(GetMember(json_obj, member_name));
    if (member == nullptr or not member->is_array())
        return ColumnValue::Null();

    std::vector<std::string> list;
    for (const auto &element : *member) {
        std::string text;
        if (ExtractText(element, &text))
            list.emplace_back(text);
        else if (element.is_number_integer())
            list.emplace_back(std::to_string(element.get<int64_t>()));
    }

    return ColumnValue::List(list);
}


ColumnValue GetKeyListValue(const nlohmann::json &json_obj, const std::string &member_name) {
    const nlohmann::json * const member(GetMember(json_obj, member_name));
    if (member == nullptr or not member->is_array())
        return ColumnValue::Null();

    std::vector<std::string> keys;
    for (const auto &element : *member) {
        std::string key;
        if (ExtractKey(element, &key))
            keys.emplace_back(key);
    }

    return ColumnValue::List(keys);
}


ColumnValue IntegerStringToValue(const std::string &integer_candidate) {
    int64_t number;
    if (not StringUtil::ToInt64T(StringUtil::TrimWhite(integer_candidate), &number))
        return ColumnValue::Null();
    return ColumnValue::Number(number);
}


ColumnValue GetIntegerValue(const nlohmann::json &json_obj, const std::string &member_name) {
    const nlohmann::json * const member(GetMember(json_obj, member_name));
    if (member == nullptr)
        return ColumnValue::Null();

    if (member->is_number_unsigned()) {
        const uint64_t number(member->get<uint64_t>());
        if (number > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
            return ColumnValue::Null();
        return ColumnValue::Number(static_cast<int64_t>(number));
    }
    if (member->is_number_integer())
        return ColumnValue::Number(member->get<int64_t>());
    if (member->is_string())
        return IntegerStringToValue(member->get<std::string>());

    return ColumnValue::Null();
}


ColumnValue TimestampStringToValue(const std::string &timestamp_candidate) {
    int64_t milliseconds;
    if (not TimeUtil::Iso8601StringToMilliseconds(StringUtil::TrimWhite(timestamp_candidate), &milliseconds))
        return ColumnValue::Null();
    return ColumnValue::Number(milliseconds);
}


ColumnValue GetTimestampValue(const nlohmann::json &json_obj, const std::string &member_name) {
    const nlohmann::json * const member(GetMember(json_obj, member_name));
    std::string timestamp;
    if (member == nullptr or not ExtractText(*member, &timestamp))
        return ColumnValue::Null();
    return TimestampStringToValue(timestamp);
}


bool SchemaMapper::map(const RawRecord &raw_record, MappedRecord * const mapped_record) {
    const nlohmann::json &json_obj(raw_record.json_);
    *mapped_record = MappedRecord(category_);

    ColumnValue key(GetTextValue(json_obj, "key"));
    if (key.isNull() and not raw_record.key_.empty())
        key = ColumnValue::Text(raw_record.key_);
    if (key.isNull() or key.getText().empty()) {
        ++skipped_count_;
        LOG_DEBUG("skipping the record on line " + std::to_string(raw_record.line_no_) + " because it has no key");
        return false;
    }
    mapped_record->setValue("key", key);

    ColumnValue revision(GetIntegerValue(json_obj, "revision"));
    if (revision.isNull())
        revision = IntegerStringToValue(raw_record.revision_);
    mapped_record->setValue("revision", revision);

    mapped_record->setValue("created", GetTimestampValue(json_obj, "created"));

    ColumnValue last_modified(GetTimestampValue(json_obj, "last_modified"));
    if (last_modified.isNull())
        last_modified = TimestampStringToValue(raw_record.last_modified_);
    mapped_record->setValue("last_modified", last_modified);

    switch (category_) {
    case AUTHORS: {
        mapped_record->setValue("name", GetTextValue(json_obj, "name"));
        mapped_record->setValue("personal_name", GetTextValue(json_obj, "personal_name"));
        mapped_record->setValue("alternate_names", GetTextListValue(json_obj, "alternate_names"));
        mapped_record->setValue("birth_date", GetTextValue(json_obj, "birth_date"));
        mapped_record->setValue("death_date", GetTextValue(json_obj, "death_date"));
        mapped_record->setValue("bio", GetTextValue(json_obj, "bio"));
        const nlohmann::json * const remote_ids(GetMember(json_obj, "remote_ids"));
        if (remote_ids != nullptr)
            mapped_record->setValue("remote_ids_wikidata", GetTextValue(*remote_ids, "wikidata"));
        break;
    }
    case EDITIONS:
        mapped_record->setValue("title", GetTextValue(json_obj, "title"));
        mapped_record->setValue("subtitle", GetTextValue(json_obj, "subtitle"));
        mapped_record->setValue("work_keys", GetKeyListValue(json_obj, "works"));
        mapped_record->setValue("author_keys", GetKeyListValue(json_obj, "authors"));
        mapped_record->setValue("publishers", GetTextListValue(json_obj, "publishers"));
        mapped_record->setValue("publish_date", GetTextValue(json_obj, "publish_date"));
        mapped_record->setValue("number_of_pages", GetIntegerValue(json_obj, "number_of_pages"));
        mapped_record->setValue("isbn_10", GetTextListValue(json_obj, "isbn_10"));
        mapped_record->setValue("isbn_13", GetTextListValue(json_obj, "isbn_13"));
        mapped_record->setValue("languages", GetKeyListValue(json_obj, "languages"));
        break;
    case WORKS:
        mapped_record->setValue("title", GetTextValue(json_obj, "title"));
        mapped_record->setValue("subtitle", GetTextValue(json_obj, "subtitle"));
        mapped_record->setValue("author_keys", GetKeyListValue(json_obj, "authors"));
        mapped_record->setValue("subjects", GetTextListValue(json_obj, "subjects"));
        mapped_record->setValue("first_publish_date", GetTextValue(json_obj, "first_publish_date"));
        mapped_record->setValue("description", GetTextValue(json_obj, "description"));
        mapped_record->setValue("covers", GetTextListValue(json_obj, "covers"));
        break;
    }

    return true;
}


} // namespace OLSync
