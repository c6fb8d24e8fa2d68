#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chatdrop::encoding
{

    std::string encode_base64(std::span<const std::byte> data);

    // Standard alphabet with padding; whitespace is ignored. Returns nullopt for malformed input.
    std::optional<std::vector<std::byte>> decode_base64(std::string_view input);

} // namespace chatdrop::encoding
