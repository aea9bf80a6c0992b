module;
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>

export module Core:Hash;

export namespace Core::Hash
{
    // FNV-1a
    constexpr uint32_t HashString(std::string_view str)
    {
        uint32_t hash = 2166136261u;
        for (char c : str)
        {
            hash ^= static_cast<uint8_t>(c);
            hash *= 16777619u;
        }
        return hash;
    }

    // Hashed name for vertex attributes and shader registry entries.
    // Two names are the same attribute iff their hashes match.
    struct StringID
    {
        uint32_t Value = 0;

        constexpr StringID() = default;
        constexpr StringID(uint32_t v) : Value(v) {}
        constexpr StringID(std::string_view str) : Value(HashString(str)) {}
        constexpr StringID(const char* str) : Value(HashString(str)) {}

        constexpr auto operator<=>(const StringID&) const = default;
    };

    constexpr StringID operator""_id(const char* str, size_t len)
    {
        return {std::string_view(str, len)};
    }

    // Boost-style mixing on 64-bit. Used to build structural hashes for
    // composite keys (pipeline keys, bin keys, vertex layouts).
    constexpr void HashCombineRaw(size_t& seed, size_t value)
    {
        seed ^= value + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2);
    }

    template <typename T>
    void HashCombine(size_t& seed, const T& value)
    {
        HashCombineRaw(seed, std::hash<T>{}(value));
    }

    template <typename... Ts>
    [[nodiscard]] size_t HashAll(const Ts&... values)
    {
        size_t seed = 0;
        (HashCombine(seed, values), ...);
        return seed;
    }
}

template <>
struct std::hash<Core::Hash::StringID>
{
    std::size_t operator()(const Core::Hash::StringID& id) const noexcept
    {
        return std::hash<uint32_t>{}(id.Value);
    }
};
