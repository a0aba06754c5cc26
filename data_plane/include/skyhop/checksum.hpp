#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace skyhop {

class Checksum {
  public:
    static std::uint32_t crc32(const char *data, std::size_t size);

    static std::uint32_t crc32(const std::vector<char> &data);

    static std::string to_hex(std::uint32_t value);

    // Incremental CRC-32 for data that arrives in blocks.
    class Crc32Accumulator {
      public:
        Crc32Accumulator();

        void update(const char *data, std::size_t size);

        void reset();

        std::uint32_t value() const;

        std::uint64_t bytes() const noexcept { return bytes_; }

      private:
        std::uint32_t crc_;
        std::uint64_t bytes_;
    };
};

} // namespace skyhop
