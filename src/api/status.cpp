/**
 * @file status.cpp
 * @brief Status class implementation
 */

#include "fixedwidth/status.hpp"

namespace fixedwidth {

std::string Status::to_string() const {
    std::string result;

    switch (code_) {
        case StatusCode::kOk:              result = "OK"; break;
        case StatusCode::kError:           result = "Error"; break;
        case StatusCode::kNotFound:        result = "NotFound"; break;
        case StatusCode::kInvalidArgument: result = "InvalidArgument"; break;
        case StatusCode::kConfigError:     result = "ConfigError"; break;
        case StatusCode::kDuplicateName:   result = "DuplicateNameError"; break;
        case StatusCode::kSchemaError:     result = "SchemaError"; break;
        case StatusCode::kInternal:        result = "Internal"; break;
    }

    if (!message_.empty()) {
        result += ": ";
        result += message_;
    }

    return result;
}

}  // namespace fixedwidth
