#pragma once

#include "skyhop/network.hpp"
#include "skyhop/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace skyhop {

// Result of one chunk frame, sent back along the path once the destination
// has stored and verified the chunk or given up on it.
enum class TransferStatus : std::uint8_t {
    Ok = 0,
    ChecksumMismatch = 1,
    TransientError = 2,
    PermanentError = 3,
    Aborted = 4,
    // A relay could not reach the next region; the chunk itself is fine.
    Unreachable = 5,
};

const char *to_string(TransferStatus status);

// Precedes `length` body bytes on a gateway-to-gateway connection.
struct FrameHeader {
    JobId job;
    ChunkId chunk_id;
    std::uint64_t offset;
    std::uint64_t length;
    std::uint32_t checksum;
    std::string destination_key;
    // Regions still to cross after the receiving gateway.
    std::vector<RegionTag> route;
};

void write_header(Connection &connection, const FrameHeader &header);

// nullopt when the peer closed the connection cleanly between frames.
std::optional<FrameHeader> read_header(Connection &connection);

void write_status(Connection &connection, TransferStatus status);

TransferStatus read_status(Connection &connection);

} // namespace skyhop
