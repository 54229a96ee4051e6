// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "object.hpp"
#include "object_type.hpp"

namespace jsentry {

object object::make_array(std::size_t capacity)
{
    auto array = std::make_shared<object_array>();
    array->reserve(capacity);

    object obj;
    obj.value_ = std::move(array);
    return obj;
}

object object::make_map(std::size_t capacity)
{
    auto map = std::make_shared<object_map>();
    map->reserve(capacity);

    object obj;
    obj.value_ = std::move(map);
    return obj;
}

object_type object::type() const
{
    switch (value_.index()) {
    case 1:
        return object_type::boolean;
    case 2:
        return object_type::float64;
    case 3:
        return object_type::string;
    case 4:
        return object_type::array;
    case 5:
        return object_type::map;
    default:
        break;
    }
    return object_type::null;
}

std::size_t object::size() const
{
    switch (type()) {
    case object_type::string:
        return std::get<std::string>(value_).size();
    case object_type::array:
        return as_array().size();
    case object_type::map:
        return as_map().size();
    default:
        break;
    }
    return 0;
}

const object_array &object::as_array() const
{
    return *std::get<std::shared_ptr<object_array>>(value_);
}

const object_map &object::as_map() const { return *std::get<std::shared_ptr<object_map>>(value_); }

const object &object::at(std::size_t index) const { return as_array().at(index); }

object &object::emplace_back(object value)
{
    auto *array = std::get_if<std::shared_ptr<object_array>>(&value_);
    if (array == nullptr) {
        throw std::invalid_argument("emplace_back on a non-array object");
    }
    return (*array)->emplace_back(std::move(value));
}

object &object::emplace(std::string key, object value)
{
    auto *map = std::get_if<std::shared_ptr<object_map>>(&value_);
    if (map == nullptr) {
        throw std::invalid_argument("emplace on a non-map object");
    }
    return (*map)->emplace(std::move(key), std::move(value));
}

void object::clear()
{
    if (auto *array = std::get_if<std::shared_ptr<object_array>>(&value_); array != nullptr) {
        (*array)->clear();
    } else if (auto *map = std::get_if<std::shared_ptr<object_map>>(&value_); map != nullptr) {
        (*map)->clear();
    } else {
        throw std::invalid_argument("clear on a non-container object");
    }
}

const object *object::find(std::string_view key) const
{
    if (!is_map()) {
        return nullptr;
    }
    return as_map().find(key);
}

const void *object::container_id() const
{
    if (const auto *array = std::get_if<std::shared_ptr<object_array>>(&value_)) {
        return array->get();
    }

    if (const auto *map = std::get_if<std::shared_ptr<object_map>>(&value_)) {
        return map->get();
    }

    return nullptr;
}

// NOLINTNEXTLINE(misc-no-recursion)
bool object::operator==(const object &other) const
{
    const auto this_type = type();
    if (this_type != other.type()) {
        return false;
    }

    switch (this_type) {
    case object_type::null:
        return true;
    case object_type::boolean:
        return as<bool>() == other.as<bool>();
    case object_type::float64:
        return as<double>() == other.as<double>();
    case object_type::string:
        return as<std::string_view>() == other.as<std::string_view>();
    case object_type::array: {
        const auto &left = as_array();
        const auto &right = other.as_array();
        if (left.size() != right.size()) {
            return false;
        }
        for (std::size_t i = 0; i < left.size(); ++i) {
            if (!(left[i] == right[i])) {
                return false;
            }
        }
        return true;
    }
    case object_type::map: {
        const auto &left = as_map();
        const auto &right = other.as_map();
        if (left.size() != right.size()) {
            return false;
        }
        for (const auto &[key, value] : left) {
            const auto *counterpart = right.find(key);
            if (counterpart == nullptr || !(value == *counterpart)) {
                return false;
            }
        }
        return true;
    }
    default:
        break;
    }
    return false;
}

const object *object_map::find(std::string_view key) const
{
    auto it = index_.find(key);
    if (it == index_.end()) {
        return nullptr;
    }
    return &entries_[it->second].second;
}

object &object_map::emplace(std::string key, object value)
{
    auto it = index_.find(std::string_view{key});
    if (it != index_.end()) {
        auto &existing = entries_[it->second].second;
        existing = std::move(value);
        return existing;
    }

    index_.emplace(key, entries_.size());
    return entries_.emplace_back(std::move(key), std::move(value)).second;
}

void object_map::reserve(std::size_t capacity)
{
    entries_.reserve(capacity);
    index_.reserve(capacity);
}

} // namespace jsentry
