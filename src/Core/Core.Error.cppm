module;

#include <cstdint>
#include <string_view>
#include <expected>
#include <utility>

export module Core:Error;

export namespace Core
{
    // -------------------------------------------------------------------------
    // Error Handling Strategy
    // -------------------------------------------------------------------------
    // 1. std::expected<T, E>  - For FALLIBLE operations where failure is expected
    //                          and the caller MUST handle it:
    //                          - Pipeline construction, buffer allocation
    //                          - Draw submission
    //                          - Resolving a blend mode that was never registered
    //
    // 2. std::optional<T>    - For QUERIES where "not found" is a valid outcome
    //                          (pipeline set lookups, cache lookups).
    //
    // 3. Raw pointers (T*)   - ONLY for non-owning observation. nullptr means
    //                          "no reference". Never for newly allocated resources.
    //
    // 4. Assertions          - For INVARIANTS that indicate a bug in this code,
    //                          never for caller mistakes.
    // -------------------------------------------------------------------------

    enum class ErrorCode : uint32_t
    {
        Success = 0,

        // Resource errors (100-199)
        OutOfMemory = 100,
        ResourceNotFound = 101,
        InvalidResource = 102,

        // I/O errors (200-299)
        FileNotFound = 200,
        FileReadError = 201,

        // Validation errors (300-399)
        InvalidArgument = 300,
        InvalidState = 301,
        OutOfRange = 303,

        // Graphics/RHI errors (400-499)
        DeviceLost = 400,
        OutOfDeviceMemory = 401,
        ShaderModuleInvalid = 402,
        PipelineCreationFailed = 403,
        PipelineNotRegistered = 404,
        DescriptorAllocationFailed = 405,
        SubmissionFailed = 406,

        // Frame protocol errors (500-599)
        FrameNotStarted = 500,
        FrameAborted = 501,

        // Generic
        Unknown = 999
    };

    constexpr std::string_view ErrorCodeToString(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::Success:                    return "Success";
            case ErrorCode::OutOfMemory:                return "OutOfMemory";
            case ErrorCode::ResourceNotFound:           return "ResourceNotFound";
            case ErrorCode::InvalidResource:            return "InvalidResource";
            case ErrorCode::FileNotFound:               return "FileNotFound";
            case ErrorCode::FileReadError:              return "FileReadError";
            case ErrorCode::InvalidArgument:            return "InvalidArgument";
            case ErrorCode::InvalidState:               return "InvalidState";
            case ErrorCode::OutOfRange:                 return "OutOfRange";
            case ErrorCode::DeviceLost:                 return "DeviceLost";
            case ErrorCode::OutOfDeviceMemory:          return "OutOfDeviceMemory";
            case ErrorCode::ShaderModuleInvalid:        return "ShaderModuleInvalid";
            case ErrorCode::PipelineCreationFailed:     return "PipelineCreationFailed";
            case ErrorCode::PipelineNotRegistered:      return "PipelineNotRegistered";
            case ErrorCode::DescriptorAllocationFailed: return "DescriptorAllocationFailed";
            case ErrorCode::SubmissionFailed:           return "SubmissionFailed";
            case ErrorCode::FrameNotStarted:            return "FrameNotStarted";
            case ErrorCode::FrameAborted:               return "FrameAborted";
            default:                                    return "Unknown";
        }
    }

    template<typename T>
    using Expected = std::expected<T, ErrorCode>;

    template<typename T>
    constexpr Expected<T> Ok(T&& value)
    {
        return Expected<T>(std::forward<T>(value));
    }

    template<typename T>
    constexpr Expected<T> Err(ErrorCode code)
    {
        return std::unexpected(code);
    }

    // Void success type for operations that don't return a value
    struct Unit {};
    constexpr Unit unit{};

    using Result = Expected<Unit>;

    constexpr Result Ok()
    {
        return Result(unit);
    }

    constexpr Result Err(ErrorCode code)
    {
        return std::unexpected(code);
    }
}
