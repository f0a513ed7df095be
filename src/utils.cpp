#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <openssl/evp.h>

#include <rangeloader/utils.hpp>

namespace rangeloader
{
    bool starts_with(const std::string_view& str, const std::string_view& prefix)
    {
        return str.size() >= prefix.size() && 0 == str.compare(0, prefix.size(), prefix);
    }

    std::string sha256(std::string_view bytes) noexcept
    {
        unsigned char hash[32];

        EVP_MD_CTX* mdctx;
        mdctx = EVP_MD_CTX_create();
        EVP_DigestInit_ex(mdctx, EVP_sha256(), NULL);
        EVP_DigestUpdate(mdctx, bytes.data(), bytes.size());
        EVP_DigestFinal_ex(mdctx, hash, nullptr);
        EVP_MD_CTX_destroy(mdctx);

        return hex_string(hash, 32);
    }

    std::string sha256sum(const fs::path& path)
    {
        unsigned char hash[32];
        EVP_MD_CTX* mdctx;
        mdctx = EVP_MD_CTX_create();
        EVP_DigestInit_ex(mdctx, EVP_sha256(), NULL);

        std::ifstream infile(path, std::ios::binary);
        constexpr std::size_t BUFSIZE = 32768;
        std::vector<char> buffer(BUFSIZE);

        while (infile)
        {
            infile.read(buffer.data(), BUFSIZE);
            size_t count = infile.gcount();
            if (!count)
                break;
            EVP_DigestUpdate(mdctx, buffer.data(), count);
        }

        EVP_DigestFinal_ex(mdctx, hash, nullptr);
        EVP_MD_CTX_destroy(mdctx);

        return hex_string(hash, 32);
    }

    std::string string_transform(const std::string_view& input, int (*functor)(int))
    {
        std::string res(input);
        std::transform(
            res.begin(), res.end(), res.begin(), [&](unsigned char c) { return functor(c); });
        return res;
    }

    std::string to_lower(const std::string_view& input)
    {
        return string_transform(input, std::tolower);
    }

    bool contains(const std::string_view& str, const std::string_view& sub_str)
    {
        return str.find(sub_str) != std::string::npos;
    }

    std::pair<std::string, std::string> parse_header(const std::string_view& header)
    {
        auto colon_idx = header.find(':');
        if (colon_idx != std::string_view::npos)
        {
            std::string_view key = header.substr(0, colon_idx);
            std::string_view value = header.substr(colon_idx + 1);

            // remove leading spaces and the \r\n header ending
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())))
            {
                value.remove_prefix(1);
            }
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
            {
                value.remove_suffix(1);
            }
            // http headers are case insensitive!
            return std::make_pair(to_lower(key), std::string(value));
        }
        return std::make_pair(std::string(), std::string(header));
    }

    std::vector<std::string> rsplit(const std::string_view& input,
                                    const std::string_view& sep,
                                    std::size_t max_split)
    {
        std::vector<std::string> result;

        std::ptrdiff_t i, j, len = static_cast<std::ptrdiff_t>(input.size()),
                             n = static_cast<std::ptrdiff_t>(sep.size());
        i = j = len;

        while (i >= n)
        {
            if (input[i - 1] == sep[n - 1] && input.substr(i - n, n) == sep)
            {
                if (max_split-- <= 0)
                {
                    break;
                }
                result.emplace_back(input.substr(i, j - i));
                i = j = i - n;
            }
            else
            {
                i--;
            }
        }
        result.emplace_back(input.substr(0, j));
        std::reverse(result.begin(), result.end());

        return result;
    }

    std::optional<std::int64_t> parse_size(std::string_view input)
    {
        if (input.empty())
            return std::nullopt;

        std::int64_t multiplier = 1;
        switch (std::toupper(static_cast<unsigned char>(input.back())))
        {
            case 'K':
                multiplier = std::int64_t(1) << 10;
                break;
            case 'M':
                multiplier = std::int64_t(1) << 20;
                break;
            case 'G':
                multiplier = std::int64_t(1) << 30;
                break;
            default:
                break;
        }
        if (multiplier != 1)
            input.remove_suffix(1);

        std::int64_t value = 0;
        auto [ptr, ec] = std::from_chars(input.data(), input.data() + input.size(), value);
        if (ec != std::errc() || ptr != input.data() + input.size() || value < 0)
            return std::nullopt;
        return value * multiplier;
    }
}
