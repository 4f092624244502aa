#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

/**
 * @brief Ordered JSON-like value tree used for the result bundle.
 * @details Objects keep insertion order. DateTime is a distinct alternative so that
 * serialization can turn it into canonical ISO text in one place.
 */
class BundleValue {
public:
    struct DateTime {
        int64_t unixSeconds = 0;
    };
    using Array = std::vector<BundleValue>;
    using Object = std::vector<std::pair<std::string, BundleValue>>;
    using Storage = std::variant<std::nullptr_t, bool, int64_t, double, std::string, DateTime, Array, Object>;

    BundleValue() : value_(nullptr) {}
    BundleValue(std::nullptr_t) : value_(nullptr) {}
    BundleValue(bool v) : value_(v) {}
    BundleValue(int v) : value_(static_cast<int64_t>(v)) {}
    BundleValue(int64_t v) : value_(v) {}
    BundleValue(size_t v) : value_(static_cast<int64_t>(v)) {}
    BundleValue(double v) : value_(v) {}
    BundleValue(const char* v) : value_(std::string(v)) {}
    BundleValue(std::string v) : value_(std::move(v)) {}
    BundleValue(DateTime v) : value_(v) {}
    BundleValue(Array v) : value_(std::move(v)) {}
    BundleValue(Object v) : value_(std::move(v)) {}

    static BundleValue array() { return BundleValue(Array{}); }
    static BundleValue object() { return BundleValue(Object{}); }

    bool isNull() const noexcept { return std::holds_alternative<std::nullptr_t>(value_); }
    bool isBool() const noexcept { return std::holds_alternative<bool>(value_); }
    bool isInt() const noexcept { return std::holds_alternative<int64_t>(value_); }
    bool isDouble() const noexcept { return std::holds_alternative<double>(value_); }
    bool isString() const noexcept { return std::holds_alternative<std::string>(value_); }
    bool isDateTime() const noexcept { return std::holds_alternative<DateTime>(value_); }
    bool isArray() const noexcept { return std::holds_alternative<Array>(value_); }
    bool isObject() const noexcept { return std::holds_alternative<Object>(value_); }

    // Accessors throw std::bad_variant_access on a kind mismatch.
    bool asBool() const { return std::get<bool>(value_); }
    int64_t asInt() const { return std::get<int64_t>(value_); }
    double asDouble() const { return std::get<double>(value_); }
    const std::string& asString() const { return std::get<std::string>(value_); }
    const DateTime& asDateTime() const { return std::get<DateTime>(value_); }
    const Array& asArray() const { return std::get<Array>(value_); }
    Array& asArray() { return std::get<Array>(value_); }
    const Object& asObject() const { return std::get<Object>(value_); }
    Object& asObject() { return std::get<Object>(value_); }

    const Storage& storage() const noexcept { return value_; }

    // Object: replaces an existing key in place, appends otherwise.
    BundleValue& set(const std::string& key, BundleValue v);
    // Object lookup; nullptr when absent or when this is not an object.
    const BundleValue* find(const std::string& key) const;
    // Array append.
    void push(BundleValue v);
    size_t size() const;

    /**
     * @brief Serializes to JSON text. Non-finite doubles become null; DateTime becomes ISO text.
     * @param indent Spaces per nesting level; negative for compact output.
     */
    std::string toJson(int indent = -1) const;

private:
    void write(std::string& out, int indent, int depth) const;

    Storage value_;
};
