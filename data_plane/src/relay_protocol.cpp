#include "skyhop/relay_protocol.hpp"

#include "skyhop/errors.hpp"

#include <endian.h>

#include <cstring>

namespace skyhop {

namespace {

constexpr std::uint32_t frame_magic = 0x534b4850u; // "SKHP"
constexpr std::uint32_t max_key_bytes = 64 * 1024;
constexpr std::uint32_t max_route_bytes = 64 * 1024;
constexpr std::size_t fixed_header_bytes = 4 + 8 + 8 + 8 + 8 + 4 + 4 + 4;

void put_u32(std::vector<char> &out, std::uint32_t value) {
    value = htobe32(value);
    const char *bytes = reinterpret_cast<const char *>(&value);
    out.insert(out.end(), bytes, bytes + sizeof(value));
}

void put_u64(std::vector<char> &out, std::uint64_t value) {
    value = htobe64(value);
    const char *bytes = reinterpret_cast<const char *>(&value);
    out.insert(out.end(), bytes, bytes + sizeof(value));
}

std::uint32_t get_u32(const char *&in) {
    std::uint32_t value;
    std::memcpy(&value, in, sizeof(value));
    in += sizeof(value);
    return be32toh(value);
}

std::uint64_t get_u64(const char *&in) {
    std::uint64_t value;
    std::memcpy(&value, in, sizeof(value));
    in += sizeof(value);
    return be64toh(value);
}

std::string join_route(const std::vector<RegionTag> &route) {
    std::string joined;
    for (const auto &region : route) {
        if (!joined.empty()) {
            joined += ',';
        }
        joined += region;
    }
    return joined;
}

std::vector<RegionTag> split_route(const std::string &joined) {
    std::vector<RegionTag> route;
    std::size_t start = 0;
    while (start < joined.size()) {
        auto comma = joined.find(',', start);
        if (comma == std::string::npos) {
            comma = joined.size();
        }
        route.push_back(joined.substr(start, comma - start));
        start = comma + 1;
    }
    return route;
}

} // namespace

const char *to_string(TransferStatus status) {
    switch (status) {
    case TransferStatus::Ok:
        return "ok";
    case TransferStatus::ChecksumMismatch:
        return "checksum mismatch";
    case TransferStatus::TransientError:
        return "transient error";
    case TransferStatus::PermanentError:
        return "permanent error";
    case TransferStatus::Aborted:
        return "aborted";
    case TransferStatus::Unreachable:
        return "next hop unreachable";
    }
    return "unknown";
}

void write_header(Connection &connection, const FrameHeader &header) {
    auto route = join_route(header.route);
    if (header.destination_key.size() > max_key_bytes || route.size() > max_route_bytes) {
        throw ProtocolError("frame header fields too large");
    }
    std::vector<char> buffer;
    buffer.reserve(fixed_header_bytes + header.destination_key.size() + route.size());
    put_u32(buffer, frame_magic);
    put_u64(buffer, header.job);
    put_u64(buffer, header.chunk_id);
    put_u64(buffer, header.offset);
    put_u64(buffer, header.length);
    put_u32(buffer, header.checksum);
    put_u32(buffer, static_cast<std::uint32_t>(header.destination_key.size()));
    put_u32(buffer, static_cast<std::uint32_t>(route.size()));
    buffer.insert(buffer.end(), header.destination_key.begin(), header.destination_key.end());
    buffer.insert(buffer.end(), route.begin(), route.end());
    connection.send(buffer.data(), buffer.size());
}

std::optional<FrameHeader> read_header(Connection &connection) {
    char fixed[fixed_header_bytes];
    std::size_t first = connection.receive(fixed, sizeof(fixed));
    if (first == 0) {
        return std::nullopt;
    }
    connection.receive_exact(fixed + first, sizeof(fixed) - first);

    const char *in = fixed;
    if (get_u32(in) != frame_magic) {
        throw ProtocolError("bad frame magic");
    }
    FrameHeader header;
    header.job = get_u64(in);
    header.chunk_id = get_u64(in);
    header.offset = get_u64(in);
    header.length = get_u64(in);
    header.checksum = get_u32(in);
    auto key_bytes = get_u32(in);
    auto route_bytes = get_u32(in);
    if (key_bytes > max_key_bytes || route_bytes > max_route_bytes) {
        throw ProtocolError("frame header fields too large");
    }
    header.destination_key.resize(key_bytes);
    if (key_bytes > 0) {
        connection.receive_exact(&header.destination_key[0], key_bytes);
    }
    std::string route(route_bytes, '\0');
    if (route_bytes > 0) {
        connection.receive_exact(&route[0], route_bytes);
    }
    header.route = split_route(route);
    return header;
}

void write_status(Connection &connection, TransferStatus status) {
    char byte = static_cast<char>(status);
    connection.send(&byte, 1);
}

TransferStatus read_status(Connection &connection) {
    char byte = 0;
    connection.receive_exact(&byte, 1);
    auto value = static_cast<std::uint8_t>(byte);
    if (value > static_cast<std::uint8_t>(TransferStatus::Unreachable)) {
        throw ProtocolError("unknown transfer status " + std::to_string(value));
    }
    return static_cast<TransferStatus>(value);
}

} // namespace skyhop
