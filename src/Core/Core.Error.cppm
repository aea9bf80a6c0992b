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
    // 1. std::expected<T, E>  - For FALLIBLE operations where the caller MUST
    //                          react to failure:
    //                          - Pipeline specialization / creation
    //                          - Bind group construction
    //                          - Material preparation
    //
    // 2. std::optional<T>    - For QUERIES where "not found" is a valid outcome:
    //                          - Prepared material / mesh / image lookups
    //                          - Compiled pipeline lookups
    //
    // 3. Raw pointers (T*)   - ONLY for non-owning observation of existing objects
    //                          where nullptr means "not there (yet)".
    //
    // "Not ready" is never an error in the render loop. It is a skip for this
    // frame and the work is re-attempted on the next one.
    // -------------------------------------------------------------------------

    enum class ErrorCode : uint32_t
    {
        Success = 0,

        // Resource errors (100-199)
        OutOfMemory = 100,
        ResourceNotFound = 101,
        ResourceNotReady = 102,

        // Validation errors (300-399)
        InvalidArgument = 300,
        InvalidState = 301,
        TypeMismatch = 304,

        // Graphics/RHI errors (400-499)
        DeviceLost = 400,
        ShaderCompilationFailed = 402,
        PipelineCreationFailed = 403,
        MissingVertexAttribute = 405,
        SpecializationFailed = 406,
        BindGroupCreationFailed = 407,

        // Asset errors (500-599)
        AssetNotLoaded = 500,
        AssetLoadFailed = 501,

        // Generic
        Unknown = 999
    };

    constexpr std::string_view ErrorCodeToString(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::Success:                 return "Success";
            case ErrorCode::OutOfMemory:             return "OutOfMemory";
            case ErrorCode::ResourceNotFound:        return "ResourceNotFound";
            case ErrorCode::ResourceNotReady:        return "ResourceNotReady";
            case ErrorCode::InvalidArgument:         return "InvalidArgument";
            case ErrorCode::InvalidState:            return "InvalidState";
            case ErrorCode::TypeMismatch:            return "TypeMismatch";
            case ErrorCode::DeviceLost:              return "DeviceLost";
            case ErrorCode::ShaderCompilationFailed: return "ShaderCompilationFailed";
            case ErrorCode::PipelineCreationFailed:  return "PipelineCreationFailed";
            case ErrorCode::MissingVertexAttribute:  return "MissingVertexAttribute";
            case ErrorCode::SpecializationFailed:    return "SpecializationFailed";
            case ErrorCode::BindGroupCreationFailed: return "BindGroupCreationFailed";
            case ErrorCode::AssetNotLoaded:          return "AssetNotLoaded";
            case ErrorCode::AssetLoadFailed:         return "AssetLoadFailed";
            default:                                 return "Unknown";
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
