#pragma once
#include <array>
#include <filesystem>
#include <limits>
#include <string>
#include <vector>
#include <openssl/bio.h>

#include <certkit/crypto/pointers.hpp>
#include <certkit/crypto/exception.hpp>

namespace certkit::crypto
{

class BioTraits
{
    static constexpr size_t kBufferSize{4096};

public:
    static inline BioPtr openFile(const std::filesystem::path& path, const char* mode)
    {
        BioPtr result{BIO_new_file(path.c_str(), mode)};
        ThrowIfTrue(result == nullptr, "unable to open '" + path.string() + "'");
        return result;
    }

    static inline BioPtr createMemoryBuffer()
    {
        BioPtr result{BIO_new(BIO_s_mem())};
        ThrowIfTrue(result == nullptr);
        return result;
    }

    static inline BioPtr createMemoryReader(const uint8_t* data, size_t size)
    {
        constexpr size_t limit = std::numeric_limits<int>::max();
        BioPtr bio{BIO_new_mem_buf(data, static_cast<int>(size > limit ? limit : size))};
        ThrowIfTrue(bio == nullptr);
        return bio;
    }

    /// @brief Reads until end of input. Empty vector for empty input.
    static inline std::vector<uint8_t> readAllData(Bio* bio)
    {
        std::vector<uint8_t> data;
        std::array<uint8_t, kBufferSize> buffer{};
        size_t bytesRead{0};

        while (0 < BIO_read_ex(bio, buffer.data(), buffer.size(), &bytesRead))
        {
            data.insert(data.end(), buffer.data(), buffer.data() + bytesRead);
        }

        return data;
    }

    static inline std::vector<uint8_t> getMemoryData(Bio* bio)
    {
        uint8_t* data{nullptr};
        auto length = BIO_get_mem_data(bio, &data);
        ThrowIfTrue(data == nullptr, "invalid pointer");
        return std::vector<uint8_t>(data, data + length);
    }

    static inline std::string getMemoryDataAsString(Bio* bio)
    {
        char* data{nullptr};
        auto length = BIO_get_mem_data(bio, &data);
        ThrowIfTrue(data == nullptr, "invalid pointer");
        return std::string(data, length);
    }
};

} // namespace certkit::crypto
