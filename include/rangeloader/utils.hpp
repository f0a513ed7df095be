#ifndef RANGELOADER_UTILS_HPP
#define RANGELOADER_UTILS_HPP

#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <rangeloader/export.hpp>

namespace rangeloader
{
    namespace fs = std::filesystem;

    RANGELOADER_API bool starts_with(const std::string_view& str, const std::string_view& prefix);

    template <class B>
    inline std::string hex_string(const B& buffer, std::size_t size)
    {
        std::ostringstream oss;
        oss << std::hex;
        for (std::size_t i = 0; i < size; ++i)
        {
            oss << std::setw(2) << std::setfill('0') << static_cast<int>(buffer[i]);
        }
        return oss.str();
    }

    RANGELOADER_API std::string sha256(std::string_view bytes) noexcept;
    RANGELOADER_API std::string sha256sum(const fs::path& path);

    RANGELOADER_API std::string string_transform(const std::string_view& input,
                                                 int (*functor)(int));
    RANGELOADER_API std::string to_lower(const std::string_view& input);
    RANGELOADER_API bool contains(const std::string_view& str, const std::string_view& sub_str);

    // Splits a raw "Name: value\r\n" header line into a lower-cased name and its value.
    // Lines without a colon (status lines, the empty terminator) yield an empty name.
    RANGELOADER_API std::pair<std::string, std::string> parse_header(
        const std::string_view& header);

    RANGELOADER_API
    std::vector<std::string> rsplit(const std::string_view& input,
                                    const std::string_view& sep,
                                    std::size_t max_split);

    // Parses a byte count such as "1048576", "512K", "10M" or "2G" (binary multiples).
    RANGELOADER_API std::optional<std::int64_t> parse_size(std::string_view input);
}

#endif
