#pragma once

#include "skyhop/control_channel.hpp"
#include "skyhop/job_context.hpp"
#include "skyhop/network.hpp"
#include "skyhop/object_store.hpp"
#include "skyhop/relay_protocol.hpp"
#include "skyhop/types.hpp"
#include "skyhop/work_queue.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace skyhop {

struct GatewaySpec {
    GatewayId id;
    RegionTag region;
    // Port 0 binds an ephemeral port.
    NetworkEndpoint bind;
    // Threads pushing chunks out of the source store; 0 for gateways that
    // only relay or receive.
    std::size_t workers;
};

struct GatewayStats {
    std::uint64_t chunks_completed;
    std::uint64_t chunk_failures;
    std::uint64_t retries;
    std::uint64_t bytes_sent;
    std::uint64_t bytes_relayed;
    std::uint64_t bytes_stored;
    std::uint64_t connections_opened;
    // Chunks put back because the next hop was unreachable.
    std::uint64_t deferrals;
    // Inbound handler threads not yet joined.
    std::uint64_t handler_threads;
};

// A transient transfer node in one region. Source gateways read chunks from
// the source store and push them along their route; relays forward frames to
// the next region; destination gateways store and verify them. Every state
// change of a chunk it owns goes to the job's event channel.
class Gateway {
  public:
    Gateway(GatewaySpec spec, std::shared_ptr<JobContext> context, std::shared_ptr<NetworkTransport> transport,
            std::shared_ptr<ObjectStore> source, std::shared_ptr<ObjectStore> destination);

    ~Gateway();

    Gateway(const Gateway &) = delete;
    Gateway &operator=(const Gateway &) = delete;

    // Binds the listener, registers in the job's directory and starts the
    // control, accept and worker threads.
    void start();

    // Orderly shutdown. Joins every thread; safe to call more than once.
    void stop();

    // Crash: listener and connections drop, no further events or heartbeats.
    void kill();

    // Accepts AssignChunk and Cancel.
    ControlChannel &inbox() noexcept { return inbox_; }

    GatewayId id() const noexcept { return spec_.id; }
    const RegionTag &region() const noexcept { return spec_.region; }
    std::size_t workers() const noexcept { return spec_.workers; }
    NetworkEndpoint endpoint() const;

    bool fenced() const noexcept { return fenced_; }
    bool killed() const noexcept { return killed_; }

    // Every chunk this gateway holds is finished.
    bool idle() const { return queue_.idle(); }

    GatewayStats stats() const;

  private:
    struct Link;

    struct Handler {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void control_loop();
    void accept_loop();
    void worker_loop(std::size_t worker);
    void serve(std::unique_ptr<Connection> connection);

    void process(const WorkItem &item, std::size_t worker, Link &link);
    TransferStatus send_downstream(const WorkItem &item, std::size_t worker, Link &link);
    TransferStatus store_chunk(Connection &upstream, const FrameHeader &header);
    TransferStatus relay_chunk(Connection &upstream, const FrameHeader &header, Link &link);
    TransferStatus verify_stored(const std::string &key, std::uint64_t offset, std::uint64_t length,
                                 std::uint32_t checksum);

    void open_link(Link &link, const GatewayAddress &peer);
    void drop_link(Link &link);
    void link_failed(Link &link);
    void link_succeeded();
    bool link_broken() const;
    void suspect(const GatewayAddress &peer, const std::string &reason);
    void reap_handlers();
    void track(Connection *connection);
    void untrack(Connection *connection);
    void close_connections();

    void bounce(const AssignChunk &assign);
    void fence(const std::string &reason);
    void cancel_local();
    bool cancelled() const;
    void publish(const ChunkStateChanged &event);

    GatewaySpec spec_;
    std::shared_ptr<JobContext> context_;
    std::shared_ptr<NetworkTransport> transport_;
    std::shared_ptr<ObjectStore> source_;
    std::shared_ptr<ObjectStore> destination_;

    ControlChannel inbox_;
    WorkQueue queue_;
    std::unique_ptr<Listener> listener_;
    NetworkEndpoint endpoint_;

    std::thread control_thread_;
    std::thread accept_thread_;
    std::vector<std::thread> workers_;
    mutable std::mutex handlers_mutex_;
    std::vector<Handler> handlers_;

    mutable std::mutex connections_mutex_;
    std::set<Connection *> connections_;

    std::atomic<bool> started_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<bool> killed_{false};
    std::atomic<bool> fenced_{false};
    std::atomic<bool> cancelled_{false};

    mutable std::mutex link_mutex_;
    std::uint32_t link_failures_{0};
    std::set<GatewayId> failed_peers_;

    std::atomic<std::uint64_t> chunks_completed_{0};
    std::atomic<std::uint64_t> chunk_failures_{0};
    std::atomic<std::uint64_t> retries_{0};
    std::atomic<std::uint64_t> bytes_sent_{0};
    std::atomic<std::uint64_t> bytes_relayed_{0};
    std::atomic<std::uint64_t> bytes_stored_{0};
    std::atomic<std::uint64_t> connections_opened_{0};
    std::atomic<std::uint64_t> deferrals_{0};
};

} // namespace skyhop
