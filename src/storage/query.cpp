/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file query.cpp
 * @brief Implementation of filter matching and update operators.
 *
 * @details
 * Evaluation is a straightforward recursive walk over the filter document. Every
 * clause at one level is conjunctive; `$or` and `$nor` introduce disjunction and
 * negation over nested filters.
 */

#include "chronicle/storage/query.hpp"

#include "chronicle/infra/string.hpp"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <vector>

namespace chronicle::storage {

namespace {

bool is_operator(const char* name)
{
    return name && name[0] == '$';
}

bool is_operator_object(const cJSON* value)
{
    return cJSON_IsObject(value) && value->child && is_operator(value->child->string);
}

bool is_index(const std::string& segment)
{
    if (segment.empty())
        return false;
    for (char c : segment) {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return false;
    }
    return true;
}

/// @brief Equality with the "null matches missing" rule.
bool equals(const cJSON* value, const cJSON* operand)
{
    if (cJSON_IsNull(operand))
        return value == nullptr || cJSON_IsNull(value);
    return value != nullptr && cJSON_Compare(value, operand, 1);
}

/// @brief Orders two scalars of the same kind; returns false when incomparable.
bool ordered(const cJSON* value, const cJSON* operand, int& order)
{
    if (cJSON_IsNumber(value) && cJSON_IsNumber(operand)) {
        double a = value->valuedouble;
        double b = operand->valuedouble;
        order = (a < b) ? -1 : (a > b ? 1 : 0);
        return true;
    }
    if (cJSON_IsString(value) && cJSON_IsString(operand) && value->valuestring &&
        operand->valuestring) {
        int cmp = std::strcmp(value->valuestring, operand->valuestring);
        order = (cmp < 0) ? -1 : (cmp > 0 ? 1 : 0);
        return true;
    }
    return false;
}

const cJSON* require_array(const cJSON* operand, const char* op)
{
    if (!cJSON_IsArray(operand))
        throw std::invalid_argument(std::string(op) + " requires an array operand");
    return operand;
}

bool any_equal(const cJSON* value, const cJSON* candidates)
{
    const cJSON* candidate = nullptr;
    cJSON_ArrayForEach(candidate, candidates)
    {
        if (equals(value, candidate))
            return true;
    }
    return false;
}

bool field_matches(const cJSON* value, const cJSON* condition);

bool operator_matches(const cJSON* value, const cJSON* op)
{
    const std::string name = op->string;

    if (name == "$eq")
        return equals(value, op);
    if (name == "$ne")
        return !equals(value, op);
    if (name == "$in")
        return any_equal(value, require_array(op, "$in"));
    if (name == "$nin")
        return !any_equal(value, require_array(op, "$nin"));
    if (name == "$exists") {
        if (!cJSON_IsBool(op))
            throw std::invalid_argument("$exists requires a boolean operand");
        return (value != nullptr) == static_cast<bool>(cJSON_IsTrue(op));
    }
    if (name == "$not") {
        if (!is_operator_object(op))
            throw std::invalid_argument("$not requires an operator object");
        return !field_matches(value, op);
    }

    int order = 0;
    if (name == "$gt")
        return value && ordered(value, op, order) && order > 0;
    if (name == "$gte")
        return value && ordered(value, op, order) && order >= 0;
    if (name == "$lt")
        return value && ordered(value, op, order) && order < 0;
    if (name == "$lte")
        return value && ordered(value, op, order) && order <= 0;

    throw std::invalid_argument("Unknown query operator: " + name);
}

bool field_matches(const cJSON* value, const cJSON* condition)
{
    if (!is_operator_object(condition))
        return equals(value, condition);

    const cJSON* op = nullptr;
    cJSON_ArrayForEach(op, condition)
    {
        if (!is_operator(op->string))
            throw std::invalid_argument("Cannot mix operators and fields in a condition");
        if (!operator_matches(value, op))
            return false;
    }
    return true;
}

bool logical_matches(const cJSON* doc, const cJSON* clause)
{
    const std::string name = clause->string;
    const cJSON* operands = require_array(clause, name.c_str());

    if (name == "$and") {
        const cJSON* sub = nullptr;
        cJSON_ArrayForEach(sub, operands)
        {
            if (!Query::matches(doc, sub))
                return false;
        }
        return true;
    }
    if (name == "$or" || name == "$nor") {
        bool any = false;
        const cJSON* sub = nullptr;
        cJSON_ArrayForEach(sub, operands)
        {
            if (Query::matches(doc, sub)) {
                any = true;
                break;
            }
        }
        return (name == "$or") ? any : !any;
    }
    throw std::invalid_argument("Unknown logical operator: " + name);
}

/**
 * @brief Walks to the parent object of the last path segment.
 *
 * @param create Whether to materialize missing intermediate objects.
 * @return cJSON* The parent, or `nullptr` when a segment is missing and `create` is false.
 */
cJSON* parent_of(cJSON* doc, const std::vector<std::string>& segments, bool create)
{
    cJSON* current = doc;
    for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
        cJSON* next = cJSON_GetObjectItemCaseSensitive(current, segments[i].c_str());
        if (!next) {
            if (!create)
                return nullptr;
            next = cJSON_AddObjectToObject(current, segments[i].c_str());
        } else if (!cJSON_IsObject(next)) {
            if (!create)
                return nullptr;
            throw std::invalid_argument("Cannot set a field inside non-object '" + segments[i] +
                                        "'");
        }
        current = next;
    }
    return current;
}

bool set_path(cJSON* doc, const std::string& path, const cJSON* value)
{
    auto segments = infra::String::split(path, '.');
    cJSON* parent = parent_of(doc, segments, true);
    const std::string& leaf = segments.back();

    cJSON* existing = cJSON_GetObjectItemCaseSensitive(parent, leaf.c_str());
    if (existing && cJSON_Compare(existing, value, 1))
        return false;

    cJSON* copy = cJSON_Duplicate(value, 1);
    if (existing)
        cJSON_ReplaceItemInObjectCaseSensitive(parent, leaf.c_str(), copy);
    else
        cJSON_AddItemToObject(parent, leaf.c_str(), copy);
    return true;
}

bool unset_path(cJSON* doc, const std::string& path)
{
    auto segments = infra::String::split(path, '.');
    cJSON* parent = parent_of(doc, segments, false);
    if (!parent || !cJSON_HasObjectItem(parent, segments.back().c_str()))
        return false;
    cJSON_DeleteItemFromObjectCaseSensitive(parent, segments.back().c_str());
    return true;
}

} // namespace

bool Query::matches(const cJSON* doc, const cJSON* filter)
{
    if (!filter || cJSON_IsNull(filter))
        return true;
    if (!cJSON_IsObject(filter))
        throw std::invalid_argument("Filter must be a JSON object");

    const cJSON* clause = nullptr;
    cJSON_ArrayForEach(clause, filter)
    {
        bool ok = is_operator(clause->string)
                      ? logical_matches(doc, clause)
                      : field_matches(resolve(doc, clause->string), clause);
        if (!ok)
            return false;
    }
    return true;
}

bool Query::apply_update(cJSON* doc, const cJSON* update)
{
    if (!cJSON_IsObject(doc))
        throw std::invalid_argument("Update target must be a JSON object");
    if (!cJSON_IsObject(update))
        throw std::invalid_argument("Update must be a JSON object");

    bool changed = false;
    const cJSON* op = nullptr;
    cJSON_ArrayForEach(op, update)
    {
        const std::string name = op->string ? op->string : "";
        if (!cJSON_IsObject(op))
            throw std::invalid_argument(name + " requires an object operand");

        const cJSON* field = nullptr;
        if (name == "$set") {
            cJSON_ArrayForEach(field, op) changed = set_path(doc, field->string, field) || changed;
        } else if (name == "$unset") {
            cJSON_ArrayForEach(field, op) changed = unset_path(doc, field->string) || changed;
        } else {
            throw std::invalid_argument("Unknown update operator: " + name);
        }
    }
    return changed;
}

const cJSON* Query::resolve(const cJSON* doc, const std::string& path)
{
    const cJSON* current = doc;
    for (const auto& segment : infra::String::split(path, '.')) {
        if (cJSON_IsObject(current)) {
            current = cJSON_GetObjectItemCaseSensitive(current, segment.c_str());
        } else if (cJSON_IsArray(current) && is_index(segment)) {
            // Indices past the end, including ones too long for any integer type, miss.
            errno = 0;
            unsigned long long index = std::strtoull(segment.c_str(), nullptr, 10);
            if (errno == ERANGE ||
                index >= static_cast<unsigned long long>(cJSON_GetArraySize(current)))
                return nullptr;
            current = cJSON_GetArrayItem(current, static_cast<int>(index));
        } else {
            return nullptr;
        }
        if (!current)
            return nullptr;
    }
    return current;
}

const cJSON* Query::simple_equality(const cJSON* filter, std::string& field)
{
    if (!cJSON_IsObject(filter) || !filter->child || filter->child->next)
        return nullptr;
    const cJSON* only = filter->child;
    if (is_operator(only->string))
        return nullptr;
    if (!cJSON_IsString(only) && !cJSON_IsNumber(only))
        return nullptr;
    field = only->string;
    return only;
}

std::string Query::index_key(const cJSON* value)
{
    if (cJSON_IsString(value) && value->valuestring)
        return std::string("s:") + value->valuestring;
    if (cJSON_IsNumber(value)) {
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%.17g", value->valuedouble);
        return std::string("n:") + buffer;
    }
    return "";
}

} // namespace chronicle::storage
