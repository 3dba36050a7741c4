#pragma once

#include <expected>
#include <string>
#include <stdexcept>

namespace chainlog
{

    /**
     * Error categories for chainlog operations
     */
    enum class ErrorCode
    {
        EncodingError,
        ParsingError,
        ValidationError,
        ConfigError,
        InvalidInput,
        IOError
    };

    inline std::string error_code_to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::EncodingError:
            return "EncodingError";
        case ErrorCode::ParsingError:
            return "ParsingError";
        case ErrorCode::ValidationError:
            return "ValidationError";
        case ErrorCode::ConfigError:
            return "ConfigError";
        case ErrorCode::InvalidInput:
            return "InvalidInput";
        case ErrorCode::IOError:
            return "IOError";
        }
        return "Unknown";
    }

    /**
     * chainlog error with code and message
     */
    class ChainlogError : public std::runtime_error
    {
    public:
        ErrorCode code;

        ChainlogError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static ChainlogError encoding(const std::string &msg)
        {
            return ChainlogError(ErrorCode::EncodingError, msg);
        }

        static ChainlogError parsing(const std::string &msg)
        {
            return ChainlogError(ErrorCode::ParsingError, msg);
        }

        static ChainlogError validation(const std::string &msg)
        {
            return ChainlogError(ErrorCode::ValidationError, msg);
        }

        static ChainlogError config(const std::string &msg)
        {
            return ChainlogError(ErrorCode::ConfigError, msg);
        }

        static ChainlogError invalid_input(const std::string &msg)
        {
            return ChainlogError(ErrorCode::InvalidInput, msg);
        }

        static ChainlogError io(const std::string &msg)
        {
            return ChainlogError(ErrorCode::IOError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, ChainlogError>;

} // namespace chainlog
