#include "keystead/identity/Base58.hpp"
#include <algorithm>
#include <array>
#include <cstddef>

namespace keystead::identity::base58
{
namespace
{

constexpr std::string_view g_kAlphabet{ "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz" };
constexpr std::uint32_t g_kRadix{ 58U };
constexpr std::uint32_t g_kByteRadix{ 256U };
constexpr std::int8_t g_kInvalidDigit{ -1 };

[[nodiscard]] constexpr std::array<std::int8_t, 128> buildDigitTable() noexcept
{
    std::array<std::int8_t, 128> table{};
    table.fill(g_kInvalidDigit);
    for (std::size_t i{ 0U }; i < g_kAlphabet.size(); ++i)
    {
        table[static_cast<std::size_t>(g_kAlphabet[i])] = static_cast<std::int8_t>(i);
    }
    return table;
}

constexpr auto g_kDigitTable{ buildDigitTable() };

} // namespace

std::string encode(std::span<const std::uint8_t> bytes)
{
    const auto leadingZeros{ static_cast<std::size_t>(
        std::find_if(bytes.begin(), bytes.end(), [](std::uint8_t b) { return b != 0U; }) - bytes.begin()) };

    // Little-endian base-58 digits of the big-endian input number.
    std::vector<std::uint8_t> digits{};
    digits.reserve(bytes.size() * 138U / 100U + 1U);
    for (std::size_t i{ leadingZeros }; i < bytes.size(); ++i)
    {
        std::uint32_t carry{ bytes[i] };
        for (auto& d : digits)
        {
            carry += static_cast<std::uint32_t>(d) * g_kByteRadix;
            d = static_cast<std::uint8_t>(carry % g_kRadix);
            carry /= g_kRadix;
        }
        while (carry > 0U)
        {
            digits.push_back(static_cast<std::uint8_t>(carry % g_kRadix));
            carry /= g_kRadix;
        }
    }

    std::string out(leadingZeros, g_kAlphabet[0]);
    out.reserve(leadingZeros + digits.size());
    for (auto it{ digits.rbegin() }; it != digits.rend(); ++it)
    {
        out.push_back(g_kAlphabet[*it]);
    }
    return out;
}

std::optional<std::vector<std::uint8_t>> decode(std::string_view text)
{
    const auto leadingOnes{ static_cast<std::size_t>(
        std::find_if(text.begin(), text.end(), [](char c) { return c != g_kAlphabet[0]; }) - text.begin()) };

    std::vector<std::uint8_t> bytes{};
    bytes.reserve(text.size() * 733U / 1000U + 1U);
    for (std::size_t i{ leadingOnes }; i < text.size(); ++i)
    {
        const auto c{ static_cast<unsigned char>(text[i]) };
        if (c >= g_kDigitTable.size() || g_kDigitTable[c] == g_kInvalidDigit)
        {
            return std::nullopt;
        }
        auto carry{ static_cast<std::uint32_t>(g_kDigitTable[c]) };
        for (auto& b : bytes)
        {
            carry += static_cast<std::uint32_t>(b) * g_kRadix;
            b = static_cast<std::uint8_t>(carry & 0xFFU);
            carry >>= 8U;
        }
        while (carry > 0U)
        {
            bytes.push_back(static_cast<std::uint8_t>(carry & 0xFFU));
            carry >>= 8U;
        }
    }

    std::vector<std::uint8_t> out(leadingOnes, 0U);
    out.insert(out.end(), bytes.rbegin(), bytes.rend());
    return out;
}

} // namespace keystead::identity::base58
