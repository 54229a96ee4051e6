// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <fmt/core.h>
#include <rapidjson/encodings.h>
#include <rapidjson/error/en.h>
#include <rapidjson/error/error.h>
#include <rapidjson/rapidjson.h>
#include <rapidjson/reader.h>
#include <rapidjson/writer.h>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include "json_utils.hpp"
#include "log.hpp"
#include "object.hpp"
#include "object_type.hpp"
#include "utils.hpp"
#include "violation.hpp"

namespace jsentry {

namespace {

struct string_view_stream {
    using Ch = std::string_view::value_type;

    explicit string_view_stream(std::string_view str) : src(str) {}

    [[nodiscard]] char Peek() const
    {
        if (idx < src.size()) [[likely]] {
            return src[idx];
        }
        return '\0';
    }
    char Take()
    {
        if (idx < src.size()) [[likely]] {
            return src[idx++];
        }
        return '\0';
    }
    [[nodiscard]] std::size_t Tell() const { return idx; }

    // Write operations are never used by the reader
    static char *PutBegin() { return nullptr; }
    static void Put(Ch /*unused*/) {}
    static void Flush() {}
    static std::size_t PutEnd(Ch * /*unused*/) { return 0; }

    std::string_view src;
    std::size_t idx{0};
};

class object_reader_handler
    : public rapidjson::BaseReaderHandler<rapidjson::UTF8<>, object_reader_handler> {
public:
    explicit object_reader_handler(std::size_t max_depth) : limit_(max_depth + 1)
    {
        stack_.reserve(std::min<std::size_t>(limit_ + 1, initial_stack_capacity));
    }
    ~object_reader_handler() = default;
    object_reader_handler(object_reader_handler &&) = delete;
    object_reader_handler(const object_reader_handler &) = delete;
    object_reader_handler &operator=(object_reader_handler &&) = delete;
    object_reader_handler &operator=(const object_reader_handler &) = delete;

    bool Null() { return skip() || emplace(object::make_null()); }
    bool Bool(bool b) { return skip() || emplace(object::make_boolean(b)); }
    bool Int(int i) { return skip() || emplace(object::make_float(i)); }
    bool Uint(unsigned u) { return skip() || emplace(object::make_float(u)); }
    bool Int64(int64_t i)
    {
        return skip() || emplace(object::make_float(static_cast<double>(i)));
    }
    bool Uint64(uint64_t u)
    {
        return skip() || emplace(object::make_float(static_cast<double>(u)));
    }
    bool Double(double d) { return skip() || emplace(object::make_float(d)); }

    bool String(const char *str, rapidjson::SizeType length, bool /*copy*/)
    {
        // Strings may contain NUL characters, the length is authoritative
        return skip() || emplace(object::make_string(std::string{str, length}));
    }

    bool Key(const char *str, rapidjson::SizeType length, bool /*copy*/)
    {
        if (!skip()) {
            key_.assign(str, length);
        }
        return true;
    }

    bool StartObject()
    {
        if (skip()) {
            ++depth_skip_count_;
            return true;
        }

        return emplace(object::make_map());
    }

    bool EndObject(rapidjson::SizeType /*memberCount*/) { return end_container(); }

    bool StartArray()
    {
        if (skip()) {
            ++depth_skip_count_;
            return true;
        }

        return emplace(object::make_array());
    }

    bool EndArray(rapidjson::SizeType /*elementCount*/) { return end_container(); }

    object finalize()
    {
        stack_.clear();
        return std::move(root_);
    }

    [[nodiscard]] bool clipped() const { return clipped_; }
    [[nodiscard]] const std::string &error() const { return error_; }

private:
    // True when the next value lies beyond the depth limit
    bool skip()
    {
        if (stack_.size() > limit_) [[unlikely]] {
            clipped_ = true;
            return true;
        }
        return false;
    }

    bool end_container()
    {
        depth_skip_count_ -= static_cast<std::size_t>(depth_skip_count_ > 0);
        if (depth_skip_count_ == 0 && !stack_.empty()) {
            stack_.pop_back();
        }
        return true;
    }

    bool emplace(object &&value)
    {
        try {
            if (stack_.empty()) {
                root_ = std::move(value);
                if (root_.is_container()) {
                    stack_.emplace_back(root_);
                }
                return true;
            }

            auto &container = stack_.back();
            auto &child = container.is_map() ? container.emplace(std::move(key_), std::move(value))
                                             : container.emplace_back(std::move(value));
            key_.clear();
            if (child.is_container()) {
                // Copies of an object share its container
                stack_.emplace_back(child);
                if (stack_.size() > limit_) {
                    depth_skip_count_ = 1;
                }
            }
        } catch (const std::exception &e) {
            error_ = e.what();
            return false;
        }

        return true;
    }

    static constexpr std::size_t initial_stack_capacity = 64;

    std::size_t limit_;
    object root_;
    std::vector<object> stack_;
    std::string key_;
    std::size_t depth_skip_count_{0};
    bool clipped_{false};
    std::string error_;
};

class string_buffer {
public:
    using Ch = char;

protected:
    static constexpr std::size_t default_capacity = 1024;

public:
    string_buffer() { buffer_.reserve(default_capacity); }

    void Put(Ch c) { buffer_.push_back(c); }
    void PutUnsafe(Ch c) { Put(c); }
    void Flush() {}
    void Clear() { buffer_.clear(); }
    void ShrinkToFit() { buffer_.shrink_to_fit(); }
    void Reserve(std::size_t count) { buffer_.reserve(count); }

    [[nodiscard]] const Ch *GetString() const { return buffer_.c_str(); }
    [[nodiscard]] std::size_t GetSize() const { return buffer_.size(); }
    [[nodiscard]] std::size_t GetLength() const { return GetSize(); }

    std::string &get_string_ref() { return buffer_; }

protected:
    std::string buffer_;
};

using json_writer = rapidjson::Writer<string_buffer, rapidjson::UTF8<>, rapidjson::UTF8<>,
    rapidjson::CrtAllocator, rapidjson::kWriteNanAndInfFlag>;

void write_string(json_writer &writer, std::string_view str)
{
    writer.String(str.data(), static_cast<rapidjson::SizeType>(str.size()));
}

void write_key(json_writer &writer, std::string_view str)
{
    writer.Key(str.data(), static_cast<rapidjson::SizeType>(str.size()));
}

void write_number(json_writer &writer, double value)
{
    if (std::isfinite(value) && std::trunc(value) == value &&
        std::fabs(value) < max_exact_integer) {
        writer.Int64(static_cast<int64_t>(value));
    } else {
        writer.Double(value);
    }
}

// NOLINTNEXTLINE(misc-no-recursion)
void write_object(json_writer &writer, const object &node, bool canonical,
    std::unordered_set<const void *> &open)
{
    switch (node.type()) {
    case object_type::null:
        writer.Null();
        return;
    case object_type::boolean:
        writer.Bool(node.as<bool>());
        return;
    case object_type::float64:
        write_number(writer, node.as<double>());
        return;
    case object_type::string:
        write_string(writer, node.as<std::string_view>());
        return;
    case object_type::map:
    case object_type::array:
        break;
    case object_type::scalar:
    case object_type::container:
        writer.Null();
        return;
    }

    const auto *id = node.container_id();
    if (open.contains(id)) {
        writer.Null();
        return;
    }
    open.emplace(id);
    const defer close{[&open, id]() { open.erase(id); }};

    if (node.is_array()) {
        writer.StartArray();
        for (const auto &child : node.as_array()) { write_object(writer, child, canonical, open); }
        writer.EndArray();
        return;
    }

    const auto &map = node.as_map();
    std::vector<const object_map::value_type *> entries;
    entries.reserve(map.size());
    for (const auto &entry : map) { entries.emplace_back(&entry); }

    if (canonical) {
        // std::string comparison is bytewise, as with memcmp
        std::sort(entries.begin(), entries.end(),
            [](const auto *left, const auto *right) { return left->first < right->first; });
    }

    writer.StartObject();
    for (const auto *entry : entries) {
        write_key(writer, entry->first);
        write_object(writer, entry->second, canonical, open);
    }
    writer.EndObject();
}

} // namespace

json_parse_result json_to_object(std::string_view json, std::size_t max_depth)
{
    object_reader_handler handler{max_depth};
    string_view_stream ss(json);

    rapidjson::Reader reader;
    const rapidjson::ParseResult res =
        reader.Parse<rapidjson::kParseIterativeFlag | rapidjson::kParseFullPrecisionFlag |
                     rapidjson::kParseNanAndInfFlag>(ss, handler);
    if (res.IsError()) {
        json_parse_result result;
        result.error = handler.error().empty() ? rapidjson::GetParseError_En(res.Code())
                                               : handler.error();
        result.offset = res.Offset();
        JSENTRY_DEBUG("Failed to parse JSON at offset {}: {}", result.offset, result.error);
        return result;
    }

    if (handler.clipped()) {
        JSENTRY_WARN("JSON nesting exceeds {} levels, deeper content skipped", max_depth + 1);
    }

    return {handler.finalize(), {}, 0, handler.clipped()};
}

json_parse_result json_to_document(std::string_view json)
{
    auto parsed = json_to_object(json, max_document_depth - 1);
    if (parsed.ok() && parsed.clipped) {
        json_parse_result result;
        result.error = fmt::format("nesting exceeds {} levels", max_document_depth);
        result.clipped = true;
        return result;
    }
    return parsed;
}

violation parse_violation(const json_parse_result &parsed)
{
    if (parsed.clipped) {
        return violation::make(violation_kind::depth_limit_exceeded,
            fmt::format("JSON {}", parsed.error), "$");
    }
    return violation::make(violation_kind::invalid_unicode,
        fmt::format("Invalid JSON: {} at offset {}", parsed.error, parsed.offset), "$");
}

std::string object_to_json(const object &root, bool canonical)
{
    string_buffer buffer;
    json_writer writer(buffer);

    std::unordered_set<const void *> open;
    write_object(writer, root, canonical, open);

    return std::move(buffer.get_string_ref());
}

std::string result_to_json(const validation_result &result)
{
    string_buffer buffer;
    json_writer writer(buffer);

    writer.StartObject();
    write_key(writer, "valid");
    writer.Bool(result.is_valid());

    write_key(writer, "violations");
    writer.StartArray();
    for (const auto &item : result.violations) {
        writer.StartObject();
        write_key(writer, "kind");
        write_string(writer, to_string(item.kind));
        write_key(writer, "severity");
        write_string(writer, to_string(item.level));
        write_key(writer, "path");
        write_string(writer, item.path);
        write_key(writer, "message");
        write_string(writer, item.message);
        if (item.snippet.has_value()) {
            write_key(writer, "snippet");
            write_string(writer, *item.snippet);
        }
        writer.EndObject();
    }
    writer.EndArray();
    writer.EndObject();

    return std::move(buffer.get_string_ref());
}

} // namespace jsentry
