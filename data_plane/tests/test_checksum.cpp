#include "skyhop/checksum.hpp"

#include <cassert>
#include <vector>

int main() {
    std::vector<char> data{'a', 'b', 'c'};
    auto crc = skyhop::Checksum::crc32(data);
    assert(crc == 0x352441C2u);
    assert(skyhop::Checksum::to_hex(crc) == "352441c2");
    assert(skyhop::Checksum::crc32(std::vector<char>{}) == 0);

    skyhop::Checksum::Crc32Accumulator accumulator;
    assert(accumulator.value() == 0);
    accumulator.update(data.data(), 2);
    accumulator.update(data.data() + 2, data.size() - 2);
    assert(accumulator.value() == crc);
    assert(accumulator.bytes() == 3);

    accumulator.reset();
    assert(accumulator.bytes() == 0);
    std::vector<char> digits{'1', '2', '3', '4', '5', '6', '7', '8', '9'};
    accumulator.update(digits.data(), digits.size());
    assert(accumulator.value() == 0xCBF43926u);
    return 0;
}
