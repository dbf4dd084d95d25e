#ifndef INCLUDE_KEYSTEAD_IDENTITY_BASE58_HPP
#define INCLUDE_KEYSTEAD_IDENTITY_BASE58_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Base58 with the bitcoin alphabet. Leading zero bytes map to leading '1' characters.
namespace keystead::identity::base58
{

[[nodiscard]] std::string encode(std::span<const std::uint8_t> bytes);

// Returns std::nullopt on any character outside the alphabet.
[[nodiscard]] std::optional<std::vector<std::uint8_t>> decode(std::string_view text);

} // namespace keystead::identity::base58

#endif // INCLUDE_KEYSTEAD_IDENTITY_BASE58_HPP
