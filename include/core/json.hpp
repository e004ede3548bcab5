#pragma once

#include <glaze/glaze.hpp>

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace promptshield {

/**
 * @brief Thin read-only wrapper around glz::json_t
 *
 * Stores json_t by value. Const operator[] returns copies, missing keys and
 * out-of-range indices yield null. Used for model responses, LLM provider
 * envelopes and CLI request documents.
 */
class JsonValue {
public:
    using array_t = glz::json_t::array_t;
    using object_t = glz::json_t::object_t;

    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    JsonValue() = default;
    JsonValue(glz::json_t v) : data_(std::move(v)) {}

    // ===== Type Checks =====

    [[nodiscard]] bool is_null() const { return data_.is_null(); }
    [[nodiscard]] bool is_object() const { return data_.is_object(); }
    [[nodiscard]] bool is_array() const { return data_.is_array(); }
    [[nodiscard]] bool is_string() const { return data_.is_string(); }
    [[nodiscard]] bool is_number() const { return data_.is_number(); }
    [[nodiscard]] bool is_boolean() const { return data_.is_boolean(); }

    [[nodiscard]] size_t size() const { return data_.size(); }

    [[nodiscard]] bool contains(std::string_view key) const {
        if (!data_.is_object()) return false;
        const auto& obj = data_.get_object();
        return obj.find(std::string(key)) != obj.end();
    }

    // ===== Const Element Access (returns copy) =====

    [[nodiscard]] JsonValue operator[](std::string_view key) const {
        if (!data_.is_object()) return {};
        const auto& obj = data_.get_object();
        auto it = obj.find(std::string(key));
        if (it != obj.end()) return JsonValue(it->second);
        return {};
    }

    [[nodiscard]] JsonValue operator[](size_t idx) const {
        if (!data_.is_array()) return {};
        const auto& arr = data_.get_array();
        if (idx < arr.size()) return JsonValue(arr[idx]);
        return {};
    }

    // ===== Value Extraction =====

    template <typename T>
    [[nodiscard]] T get() const {
        if constexpr (std::is_same_v<T, std::string>) {
            return data_.get<std::string>();
        } else if constexpr (std::is_same_v<T, bool>) {
            return data_.get<bool>();
        } else if constexpr (std::is_same_v<T, double>) {
            return data_.get<double>();
        } else if constexpr (std::is_integral_v<T>) {
            // json_t stores all numbers as double
            return static_cast<T>(data_.get<double>());
        } else {
            static_assert(!sizeof(T), "Unsupported type for JsonValue::get<T>()");
        }
    }

    /**
     * @brief Typed lookup with default. A present key of the wrong type also
     * yields the default instead of throwing.
     */
    template <typename T>
    [[nodiscard]] T value(std::string_view key, T default_value) const {
        const JsonValue v = (*this)[key];
        if constexpr (std::is_same_v<T, std::string>) {
            return v.is_string() ? v.get<std::string>() : default_value;
        } else if constexpr (std::is_same_v<T, bool>) {
            return v.is_boolean() ? v.get<bool>() : default_value;
        } else {
            return v.is_number() ? v.get<T>() : default_value;
        }
    }

    // Collects the string elements of an array member, skipping others
    [[nodiscard]] std::vector<std::string> string_array(std::string_view key) const {
        std::vector<std::string> out;
        const JsonValue arr = (*this)[key];
        for (size_t i = 0; i < arr.size() && arr.is_array(); ++i) {
            const JsonValue elem = arr[i];
            if (elem.is_string()) out.push_back(elem.get<std::string>());
        }
        return out;
    }

    [[nodiscard]] std::vector<std::pair<std::string, JsonValue>> items() const {
        std::vector<std::pair<std::string, JsonValue>> out;
        if (!data_.is_object()) return out;
        for (const auto& [k, v] : data_.get_object()) {
            out.emplace_back(k, JsonValue(v));
        }
        return out;
    }

    // ===== Parsing =====

    [[nodiscard]] static JsonValue parse(std::string_view json_str) {
        glz::json_t result;
        const std::string buffer(json_str);
        auto ec = glz::read_json(result, buffer);
        if (ec) {
            throw parse_error("JSON parse error");
        }
        return JsonValue(std::move(result));
    }

    [[nodiscard]] const glz::json_t& raw() const { return data_; }

private:
    glz::json_t data_{};
};

} // namespace promptshield
