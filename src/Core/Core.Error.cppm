module;

#include <cstdint>
#include <string_view>
#include <expected>
#include <type_traits>
#include <utility>

export module Core.Error;

export namespace Core
{
    // -------------------------------------------------------------------------
    // Error Handling Strategy
    // -------------------------------------------------------------------------
    // 1. std::expected<T, E>  - For FALLIBLE operations where failure is expected
    //                          and the caller MUST handle it. Use when:
    //                          - Narrowing a value into a smaller scalar type
    //
    // 2. std::optional<T>    - For QUERIES where "no value" is a valid outcome,
    //                          not an error. Use when:
    //                          - A single scalar conversion has no result
    //
    // 3. Plain values        - Geometry algebra is total. Arithmetic faults of
    //                          the scalar type propagate unmodified.
    // -------------------------------------------------------------------------

    // Generic error code for operations that can fail for multiple reasons
    enum class ErrorCode : uint32_t
    {
        Success = 0,

        // Validation errors (300-399)
        InvalidArgument = 300,
        OutOfRange = 303,

        // Generic
        Unknown = 999
    };

    // Convert error code to string for logging
    constexpr std::string_view ErrorCodeToString(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::Success:                return "Success";
            case ErrorCode::InvalidArgument:        return "InvalidArgument";
            case ErrorCode::OutOfRange:             return "OutOfRange";
            default:                                return "Unknown";
        }
    }

    // Type alias for common expected patterns
    template<typename T>
    using Expected = std::expected<T, ErrorCode>;

    // Helper to create success result
    template<typename T>
    constexpr Expected<std::remove_cvref_t<T>> Ok(T&& value)
    {
        return Expected<std::remove_cvref_t<T>>(std::forward<T>(value));
    }

    // Helper to create error result
    template<typename T>
    constexpr Expected<T> Err(ErrorCode code)
    {
        return std::unexpected(code);
    }
}
