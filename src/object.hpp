// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "object_type.hpp"

namespace jsentry {

class object;
class object_map;
using object_array = std::vector<object>;

// A node of a parsed structured-data tree.
//
// Scalars are stored inline, containers are shared: copying an object
// yields a second handle to the same array or map, which is how a graph
// built programmatically can reach one of its own containers. Trees coming
// from json_to_object never share containers.
class object {
public:
    object() = default;
    ~object() = default;
    object(const object &) = default;
    object(object &&) noexcept = default;
    object &operator=(const object &) = default;
    object &operator=(object &&) noexcept = default;

    static object make_null() { return {}; }
    static object make_boolean(bool value)
    {
        object obj;
        obj.value_ = value;
        return obj;
    }
    static object make_float(double value)
    {
        object obj;
        obj.value_ = value;
        return obj;
    }
    static object make_string(std::string value)
    {
        object obj;
        obj.value_ = std::move(value);
        return obj;
    }
    static object make_array(std::size_t capacity = 0);
    static object make_map(std::size_t capacity = 0);

    [[nodiscard]] object_type type() const;

    [[nodiscard]] bool is_null() const { return type() == object_type::null; }
    [[nodiscard]] bool is_boolean() const { return type() == object_type::boolean; }
    [[nodiscard]] bool is_number() const { return type() == object_type::float64; }
    [[nodiscard]] bool is_string() const { return type() == object_type::string; }
    [[nodiscard]] bool is_array() const { return type() == object_type::array; }
    [[nodiscard]] bool is_map() const { return type() == object_type::map; }
    [[nodiscard]] bool is_container() const { return jsentry::is_container(type()); }
    [[nodiscard]] bool is_scalar() const { return jsentry::is_scalar(type()); }

    // Unchecked access, the caller must verify the type beforehand
    template <typename T> [[nodiscard]] T as() const
    {
        if constexpr (std::is_same_v<T, bool>) {
            return std::get<bool>(value_);
        } else if constexpr (std::is_same_v<T, double>) {
            return std::get<double>(value_);
        } else if constexpr (std::is_same_v<T, std::string_view>) {
            return std::get<std::string>(value_);
        } else {
            static_assert(!std::is_same_v<T, T>, "unsupported conversion");
        }
    }

    // Number of elements for containers, bytes for strings, zero otherwise
    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] const object_array &as_array() const;
    [[nodiscard]] const object_map &as_map() const;

    // Array elements
    [[nodiscard]] const object &at(std::size_t index) const;
    object &emplace_back(object value);

    // Map entries, emplacing an existing key replaces its value in place
    object &emplace(std::string key, object value);
    [[nodiscard]] const object *find(std::string_view key) const;

    // Removes every element or entry of a container, this is the way to
    // release a graph built with cycles.
    void clear();

    // Address of the underlying container, nullptr for scalars
    [[nodiscard]] const void *container_id() const;

    // Deep comparison, map entries are compared regardless of their order.
    // Graphs containing cycles must not be compared.
    bool operator==(const object &other) const;

protected:
    std::variant<std::monostate, bool, double, std::string, std::shared_ptr<object_array>,
        std::shared_ptr<object_map>>
        value_;
};

class object_map {
public:
    using value_type = std::pair<std::string, object>;
    using const_iterator = std::vector<value_type>::const_iterator;

    object_map() = default;

    [[nodiscard]] const_iterator begin() const { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const { return entries_.end(); }
    [[nodiscard]] std::size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] const value_type &operator[](std::size_t index) const { return entries_[index]; }

    [[nodiscard]] const object *find(std::string_view key) const;
    object &emplace(std::string key, object value);
    void reserve(std::size_t capacity);
    void clear()
    {
        entries_.clear();
        index_.clear();
    }

protected:
    struct key_hash {
        using is_transparent = void;
        std::size_t operator()(std::string_view key) const
        {
            return std::hash<std::string_view>{}(key);
        }
    };

    std::vector<value_type> entries_;
    std::unordered_map<std::string, std::size_t, key_hash, std::equal_to<>> index_;
};

} // namespace jsentry
