#include "skyhop/errors.hpp"
#include "skyhop/loopback.hpp"
#include "skyhop/network.hpp"
#include "skyhop/relay_protocol.hpp"

#include <cassert>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

void test_round_trip(skyhop::NetworkTransport &transport, const skyhop::NetworkEndpoint &bind) {
    auto listener = transport.listen(bind);
    auto endpoint = listener->endpoint();
    assert(endpoint.port != 0);

    std::vector<char> body(200000);
    for (std::size_t i = 0; i < body.size(); ++i) {
        body[i] = static_cast<char>(i % 253);
    }

    std::thread server([&] {
        auto connection = listener->accept();
        assert(connection);
        auto header = skyhop::read_header(*connection);
        assert(header);
        assert(header->chunk_id == 42 && header->offset == 1ull << 40);
        assert(header->destination_key == "dir/object.bin");
        assert((header->route == std::vector<skyhop::RegionTag>{"aws:us-west-2", "gcp:europe-west1"}));
        std::vector<char> received(static_cast<std::size_t>(header->length));
        connection->receive_exact(received.data(), received.size());
        assert(received == body);
        skyhop::write_status(*connection, skyhop::TransferStatus::ChecksumMismatch);
        assert(!skyhop::read_header(*connection));
    });

    auto connection = transport.open(endpoint);
    skyhop::FrameHeader header{3, 42, 1ull << 40, body.size(), 0xdeadbeef, "dir/object.bin",
                               {"aws:us-west-2", "gcp:europe-west1"}};
    skyhop::write_header(*connection, header);
    connection->send(body.data(), body.size());
    assert(skyhop::read_status(*connection) == skyhop::TransferStatus::ChecksumMismatch);
    connection->close();
    server.join();
    listener->close();
    assert(listener->accept() == nullptr);
}

void test_backpressure() {
    skyhop::LoopbackTransport transport(4096);
    auto listener = transport.listen({"relay", 0});
    auto endpoint = listener->endpoint();
    auto writer = transport.open(endpoint);
    auto reader = listener->accept();

    const std::size_t total = 1 << 20;
    std::thread producer([&] {
        std::vector<char> block(1024, 'x');
        for (std::size_t sent = 0; sent < total; sent += block.size()) {
            writer->send(block.data(), block.size());
        }
        writer->close();
    });

    std::vector<char> buffer(512);
    std::size_t received = 0;
    while (auto n = reader->receive(buffer.data(), buffer.size())) {
        received += n;
        std::this_thread::yield();
    }
    producer.join();
    assert(received == total);
    for (const auto &pipe : transport.pipes()) {
        assert(pipe->high_watermark() <= pipe->capacity());
    }
}

void test_failures() {
    skyhop::LoopbackTransport transport(1024);
    bool refused = false;
    try {
        transport.open({"nowhere", 9});
    } catch (const skyhop::ConnectionError &) {
        refused = true;
    }
    assert(refused);

    auto listener = transport.listen({"gw", 0});
    auto client = transport.open(listener->endpoint());
    auto server = listener->accept();
    const char garbage[64] = {'n', 'o', 't', ' ', 'a', ' ', 'f', 'r', 'a', 'm', 'e'};
    client->send(garbage, sizeof(garbage));
    bool rejected = false;
    try {
        skyhop::read_header(*server);
    } catch (const skyhop::ProtocolError &) {
        rejected = true;
    }
    assert(rejected);

    server->close();
    bool broken = false;
    try {
        char byte = 0;
        client->receive_exact(&byte, 1);
    } catch (const skyhop::ConnectionError &) {
        broken = true;
    }
    assert(broken);
}

// The accepting side never reads or writes; both directions of the other side
// must give up once the timeout runs out.
void test_stalled_peer_times_out(skyhop::NetworkTransport &transport, const skyhop::NetworkEndpoint &bind) {
    auto listener = transport.listen(bind);
    auto client = transport.open(listener->endpoint());
    auto server = listener->accept();
    assert(server);
    client->set_timeout(std::chrono::milliseconds(100));

    auto started = std::chrono::steady_clock::now();
    bool read_timed_out = false;
    try {
        char byte = 0;
        client->receive(&byte, 1);
    } catch (const skyhop::ConnectionError &) {
        read_timed_out = true;
    }
    assert(read_timed_out);
    assert(std::chrono::steady_clock::now() - started >= std::chrono::milliseconds(80));

    // Fill every buffer between the two ends; the next send stalls and fails.
    std::vector<char> block(64 * 1024, 'z');
    bool write_timed_out = false;
    for (int i = 0; i < 4096 && !write_timed_out; ++i) {
        try {
            client->send(block.data(), block.size());
        } catch (const skyhop::ConnectionError &) {
            write_timed_out = true;
        }
    }
    assert(write_timed_out);

    client->close();
    server->close();
    listener->close();
}

} // namespace

int main() {
    skyhop::TcpTransport tcp;
    test_round_trip(tcp, {"127.0.0.1", 0});
    skyhop::LoopbackTransport loopback(8192);
    test_round_trip(loopback, {"gateway", 0});
    test_backpressure();
    test_failures();
    test_stalled_peer_times_out(tcp, {"127.0.0.1", 0});
    skyhop::LoopbackTransport stalled(16 * 1024);
    test_stalled_peer_times_out(stalled, {"gateway", 0});
    return 0;
}
