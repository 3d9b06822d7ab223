#pragma once

#include "value.hpp"
#include "core/errors.hpp"
#include <memory>
#include <string>

namespace sqlgraph::data {

enum class ParameterDirection {
    Input,
    Output,
    InputOutput,
    ReturnValue
};

const char* direction_name(ParameterDirection direction) noexcept;

// A named, typed, directional command parameter. Output values are written
// back into `value` by the backend once the command has completed.
struct QueryParameter {
    std::string name;
    SqlValue value;
    ParameterDirection direction = ParameterDirection::Input;
    DbType type = DbType::String;
    bool nullable = false;
    int size = 0;
    uint8_t precision = 0;
    uint8_t scale = 0;

    // Set by the executor once the command has completed
    bool value_available = false;

    bool is_output() const noexcept {
        return direction != ParameterDirection::Input;
    }
};

using QueryParameterPtr = std::shared_ptr<QueryParameter>;

// Typed read-only view over an output, input/output or return-value
// parameter. value() is valid only after the owning execution completed.
template<typename T>
class OutputParameter {
public:
    OutputParameter() = default;
    explicit OutputParameter(std::shared_ptr<const QueryParameter> param)
        : param_(std::move(param)) {}

    bool is_bound() const noexcept { return param_ != nullptr; }

    const std::string& name() const {
        check_bound();
        return param_->name;
    }

    bool has_value() const noexcept {
        return param_ && param_->value_available;
    }

    T value() const {
        check_bound();
        if (!param_->value_available) {
            throw core::InvalidStateError(
                "Output parameter '" + param_->name + "' is read before execution completed");
        }
        if (is_null(param_->value)) {
            if constexpr (is_optional_v<T>) {
                return std::nullopt;
            } else {
                throw core::NullValueError(
                    param_->name + " is null and can't be assigned to a non-nullable type");
            }
        }
        return value_cast<T>(param_->value);
    }

    std::string to_string() const {
        check_bound();
        return data::to_string(param_->value);
    }

private:
    void check_bound() const {
        if (!param_) {
            throw core::InvalidStateError("Output parameter is not bound to a command");
        }
    }

    std::shared_ptr<const QueryParameter> param_;
};

} // namespace sqlgraph::data
