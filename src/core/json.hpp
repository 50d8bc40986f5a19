/**
 * @file json.hpp
 * @brief Минимальный JSON для stratum протокола
 *
 * Значение JSON, парсер и сериализатор. Покрывает ровно то, что нужно
 * line-based JSON-RPC: объекты, массивы, строки с escape-последовательностями,
 * целые 64-битные числа без потери точности (nonce, proof), double.
 *
 * Ошибки парсинга возвращаются как ProtocolMalformed, без исключений.
 */

#pragma once

#include "types.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace strata {

/**
 * @brief Значение JSON
 */
class JsonValue {
public:
    using Array = std::vector<JsonValue>;
    using Object = std::map<std::string, JsonValue, std::less<>>;
    using Storage = std::variant<std::nullptr_t, bool, int64_t, uint64_t, double,
                                 std::string, Array, Object>;

    JsonValue() : value_(nullptr) {}
    JsonValue(std::nullptr_t) : value_(nullptr) {}
    JsonValue(bool value) : value_(value) {}
    JsonValue(int value) : value_(static_cast<int64_t>(value)) {}
    JsonValue(unsigned value) : value_(static_cast<uint64_t>(value)) {}
    JsonValue(int64_t value) : value_(value) {}
    JsonValue(uint64_t value) : value_(value) {}
    JsonValue(double value) : value_(value) {}
    JsonValue(std::string value) : value_(std::move(value)) {}
    JsonValue(std::string_view value) : value_(std::string(value)) {}
    JsonValue(const char* value) : value_(std::string(value)) {}
    JsonValue(Array value) : value_(std::move(value)) {}
    JsonValue(Object value) : value_(std::move(value)) {}

    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::nullptr_t>(value_); }
    [[nodiscard]] bool is_bool() const noexcept { return std::holds_alternative<bool>(value_); }
    [[nodiscard]] bool is_number() const noexcept {
        return std::holds_alternative<int64_t>(value_) ||
               std::holds_alternative<uint64_t>(value_) ||
               std::holds_alternative<double>(value_);
    }
    [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<std::string>(value_); }
    [[nodiscard]] bool is_array() const noexcept { return std::holds_alternative<Array>(value_); }
    [[nodiscard]] bool is_object() const noexcept { return std::holds_alternative<Object>(value_); }

    /**
     * @brief Значение как bool (nullopt для другого типа)
     */
    [[nodiscard]] std::optional<bool> as_bool() const noexcept;

    /**
     * @brief Неотрицательное целое (nullopt для отрицательных, дробных и не чисел)
     */
    [[nodiscard]] std::optional<uint64_t> as_uint64() const noexcept;

    /**
     * @brief Знаковое целое
     */
    [[nodiscard]] std::optional<int64_t> as_int64() const noexcept;

    /**
     * @brief Любое число как double
     */
    [[nodiscard]] std::optional<double> as_double() const noexcept;

    /// @brief Указатель на строку или nullptr
    [[nodiscard]] const std::string* as_string() const noexcept { return std::get_if<std::string>(&value_); }

    /// @brief Указатель на массив или nullptr
    [[nodiscard]] const Array* as_array() const noexcept { return std::get_if<Array>(&value_); }

    /// @brief Указатель на объект или nullptr
    [[nodiscard]] const Object* as_object() const noexcept { return std::get_if<Object>(&value_); }

    /**
     * @brief Найти поле объекта
     *
     * @return Указатель на значение или nullptr (нет поля или не объект)
     */
    [[nodiscard]] const JsonValue* find(std::string_view key) const;

    [[nodiscard]] const Storage& raw() const noexcept { return value_; }

private:
    Storage value_;
};

/**
 * @brief Распарсить JSON документ
 *
 * Документ должен содержать ровно одно значение (пробелы по краям допустимы).
 *
 * @return Result<JsonValue> Значение или ProtocolMalformed с позицией ошибки
 */
[[nodiscard]] Result<JsonValue> parse_json(std::string_view text);

/**
 * @brief Сериализовать значение в компактный JSON (одна строка)
 */
[[nodiscard]] std::string to_json(const JsonValue& value);

} // namespace strata
