module;
#include <cstdint>
#include <cstddef>
#include <limits>
#include <string_view>
#include <format>
#include <functional>

export module Core:Handle;

export namespace Core
{
    // -------------------------------------------------------------------------
    // StrongHandle - Type-safe generational handle template
    // -------------------------------------------------------------------------
    // The Tag type keeps handles of different resource kinds apart:
    //
    //   using MeshHandle  = Core::StrongHandle<struct MeshTag>;
    //   using ImageHandle = Core::StrongHandle<struct ImageTag>;
    //   // MeshHandle m = ImageHandle{}; // Compile error
    //
    // Generation distinguishes a recycled slot from the value that used to
    // live there, so stale handles fail lookups instead of aliasing.
    // -------------------------------------------------------------------------
    template <typename Tag>
    struct StrongHandle
    {
        static constexpr uint32_t INVALID_INDEX = std::numeric_limits<uint32_t>::max();

        uint32_t Index = INVALID_INDEX;
        uint32_t Generation = 0;

        constexpr StrongHandle() = default;

        constexpr StrongHandle(uint32_t index, uint32_t gen) : Index(index), Generation(gen)
        {
        }

        [[nodiscard]] constexpr bool IsValid() const noexcept
        {
            return Index != INVALID_INDEX;
        }

        [[nodiscard]] constexpr explicit operator bool() const noexcept
        {
            return IsValid();
        }

        [[nodiscard]] constexpr uint64_t ToBits() const noexcept
        {
            return (static_cast<uint64_t>(Generation) << 32) | Index;
        }

        auto operator<=>(const StrongHandle&) const = default;
    };
}

namespace std
{
    template <typename Tag>
    struct hash<Core::StrongHandle<Tag>>
    {
        std::size_t operator()(const Core::StrongHandle<Tag>& h) const noexcept
        {
            uint64_t val = h.ToBits();

            // MurmurHash3 finalizer
            val ^= val >> 33;
            val *= 0xff51afd7ed558ccd;
            val ^= val >> 33;
            val *= 0xc4ceb9fe1a85ec53;
            val ^= val >> 33;

            return static_cast<std::size_t>(val);
        }
    };

    // Prints "index:generation", or "null" for an invalid handle.
    template <typename Tag>
    struct formatter<Core::StrongHandle<Tag>> : formatter<std::string_view>
    {
        auto format(const Core::StrongHandle<Tag>& h, format_context& ctx) const
        {
            if (!h.IsValid())
                return formatter<std::string_view>::format("null", ctx);
            return std::format_to(ctx.out(), "{}:{}", h.Index, h.Generation);
        }
    };
}
