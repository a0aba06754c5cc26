#include "skyhop/gateway.hpp"

#include "skyhop/checksum.hpp"
#include "skyhop/errors.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace skyhop {

struct Gateway::Link {
    std::unique_ptr<Connection> connection;
    GatewayAddress peer{};
};

Gateway::Gateway(GatewaySpec spec, std::shared_ptr<JobContext> context, std::shared_ptr<NetworkTransport> transport,
                 std::shared_ptr<ObjectStore> source, std::shared_ptr<ObjectStore> destination)
    : spec_(std::move(spec)), context_(std::move(context)), transport_(std::move(transport)),
      source_(std::move(source)), destination_(std::move(destination)),
      queue_(context_ ? context_->job_id : 0, spec_.id, [this](const ChunkStateChanged &event) { publish(event); }) {
    if (!context_ || !transport_) {
        throw std::invalid_argument("gateway needs a job context and a transport");
    }
    if (spec_.id == kNoGateway) {
        throw std::invalid_argument("gateway id must be non-zero");
    }
    if (spec_.workers > 0 && !source_) {
        throw std::invalid_argument("gateway with workers needs a source store");
    }
}

Gateway::~Gateway() { stop(); }

void Gateway::start() {
    if (started_.exchange(true)) {
        throw std::logic_error("gateway " + std::to_string(spec_.id) + " already started");
    }
    listener_ = transport_->listen(spec_.bind);
    endpoint_ = listener_->endpoint();
    context_->directory.add(GatewayAddress{spec_.id, spec_.region, endpoint_});

    control_thread_ = std::thread(&Gateway::control_loop, this);
    accept_thread_ = std::thread(&Gateway::accept_loop, this);
    workers_.reserve(spec_.workers);
    for (std::size_t i = 0; i < spec_.workers; ++i) {
        workers_.emplace_back(&Gateway::worker_loop, this, i);
    }
}

void Gateway::stop() {
    stopping_ = true;
    queue_.close();
    inbox_.close();
    if (listener_) {
        listener_->close();
    }
    close_connections();

    if (control_thread_.joinable()) {
        control_thread_.join();
    }
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    for (auto &thread : workers_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workers_.clear();

    std::vector<Handler> handlers;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handlers.swap(handlers_);
    }
    for (auto &handler : handlers) {
        if (handler.thread.joinable()) {
            handler.thread.join();
        }
    }
}

void Gateway::kill() {
    if (killed_.exchange(true)) {
        return;
    }
    queue_.close();
    inbox_.close();
    if (listener_) {
        listener_->close();
    }
    close_connections();
}

NetworkEndpoint Gateway::endpoint() const { return endpoint_; }

GatewayStats Gateway::stats() const {
    std::uint64_t handlers = 0;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handlers = handlers_.size();
    }
    return GatewayStats{chunks_completed_, chunk_failures_,     retries_,   bytes_sent_, bytes_relayed_,
                        bytes_stored_,     connections_opened_, deferrals_, handlers};
}

void Gateway::control_loop() {
    const auto interval = context_->config.gateway.heartbeat_interval;
    auto next_heartbeat = Clock::now();
    while (!stopping_ && !killed_) {
        auto now = Clock::now();
        if (now >= next_heartbeat) {
            if (!fenced_) {
                context_->events.publish(Heartbeat{spec_.id, now});
            }
            next_heartbeat = now + interval;
        }
        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(next_heartbeat - now);
        auto message = inbox_.poll(std::max(wait, std::chrono::milliseconds(1)));
        if (!message) {
            continue;
        }
        if (const auto *assign = std::get_if<AssignChunk>(&*message)) {
            if (fenced_ || cancelled()) {
                bounce(*assign);
            } else {
                queue_.assign(assign->chunk, assign->segment, assign->version);
            }
        } else if (std::get_if<Cancel>(&*message) != nullptr) {
            cancel_local();
        }
    }
}

void Gateway::accept_loop() {
    while (auto connection = listener_->accept()) {
        if (stopping_ || killed_) {
            connection->close();
            break;
        }
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        reap_handlers();
        auto done = std::make_shared<std::atomic<bool>>(false);
        std::thread thread([this, done, inbound = std::move(connection)]() mutable {
            serve(std::move(inbound));
            *done = true;
        });
        handlers_.push_back(Handler{std::move(thread), done});
    }
}

void Gateway::reap_handlers() {
    for (auto it = handlers_.begin(); it != handlers_.end();) {
        if (*it->done) {
            it->thread.join();
            it = handlers_.erase(it);
        } else {
            ++it;
        }
    }
}

void Gateway::worker_loop(std::size_t worker) {
    Link link;
    while (auto item = queue_.take(worker)) {
        process(*item, worker, link);
        if (link_broken()) {
            std::uint32_t failures = 0;
            std::size_t peers = 0;
            {
                std::lock_guard<std::mutex> lock(link_mutex_);
                failures = link_failures_;
                peers = failed_peers_.size();
            }
            std::ostringstream oss;
            oss << failures << " consecutive link failures to " << peers << " peers";
            fence(oss.str());
        }
    }
    drop_link(link);
}

void Gateway::process(const WorkItem &item, std::size_t worker, Link &link) {
    const auto &chunk = item.chunk;
    if (!queue_.advance(chunk.id, worker, ChunkState::InFlight)) {
        return;
    }

    TransferStatus status = TransferStatus::TransientError;
    std::string error;
    bool path_fault = false;
    try {
        if (item.segment.route.empty()) {
            throw ChunkTransferError("chunk " + std::to_string(chunk.id) + " has no route", false);
        }
        status = send_downstream(item, worker, link);
    } catch (const ObjectStoreError &e) {
        status = e.transient() ? TransferStatus::TransientError : TransferStatus::PermanentError;
        error = e.what();
    } catch (const ConnectionError &e) {
        link_failed(link);
        error = e.what();
        path_fault = true;
    } catch (const ProtocolError &e) {
        link_failed(link);
        error = e.what();
        path_fault = true;
    } catch (const ChunkTransferError &e) {
        status = e.transient() ? TransferStatus::TransientError : TransferStatus::PermanentError;
        error = e.what();
    }

    if (status == TransferStatus::Ok) {
        if (queue_.advance(chunk.id, worker, ChunkState::Completed)) {
            ++chunks_completed_;
        }
        return;
    }
    if (status == TransferStatus::Aborted || cancelled()) {
        return;
    }
    if (error.empty()) {
        error = to_string(status);
    }

    const auto &policy = context_->config.retry;
    if (status == TransferStatus::Unreachable) {
        path_fault = true;
    }
    if (path_fault && item.deferrals < context_->config.gateway.max_link_deferrals) {
        if (queue_.defer(chunk.id, worker, error, policy.backoff_for(item.deferrals + 1))) {
            ++deferrals_;
        }
        return;
    }

    std::uint32_t failures = item.attempts + 1;
    bool retry = status != TransferStatus::PermanentError && failures < policy.retry_budget;
    if (queue_.fail(chunk.id, worker, error, retry, policy.backoff_for(failures))) {
        ++chunk_failures_;
        if (retry) {
            ++retries_;
        }
    }
}

TransferStatus Gateway::send_downstream(const WorkItem &item, std::size_t worker, Link &link) {
    const auto &chunk = item.chunk;
    const auto &route = item.segment.route;
    auto next = context_->directory.resolve(route.front(), worker + item.attempts + item.deferrals);
    if (!next) {
        return TransferStatus::Unreachable;
    }
    if (link.connection && link.peer.id != next->id) {
        drop_link(link);
    }
    if (!link.connection) {
        open_link(link, *next);
    }

    FrameHeader header;
    header.job = chunk.job_id;
    header.chunk_id = chunk.id;
    header.offset = chunk.offset;
    header.length = chunk.length;
    header.checksum = chunk.checksum;
    header.destination_key = chunk.destination_key;
    header.route.assign(route.begin() + 1, route.end());

    const std::size_t block = context_->config.gateway.stream_block_bytes;
    try {
        write_header(*link.connection, header);
        for (std::uint64_t done = 0; done < chunk.length;) {
            if (cancelled()) {
                drop_link(link);
                return TransferStatus::Aborted;
            }
            auto want = static_cast<std::size_t>(std::min<std::uint64_t>(block, chunk.length - done));
            auto bytes = source_->get(chunk.source_key, chunk.offset + done, want);
            if (bytes.size() != want) {
                throw ObjectStoreError("short read from " + chunk.source_key, true);
            }
            link.connection->send(bytes.data(), bytes.size());
            bytes_sent_ += want;
            done += want;
        }
    } catch (const ObjectStoreError &) {
        // The frame is incomplete; the receiver must see the stream end.
        drop_link(link);
        throw;
    }
    queue_.advance(chunk.id, worker, ChunkState::Verifying);
    auto status = read_status(*link.connection);
    link_succeeded();
    return status;
}

void Gateway::serve(std::unique_ptr<Connection> connection) {
    track(connection.get());
    const auto io_timeout = context_->config.gateway.io_timeout;
    Link downstream;
    try {
        while (!stopping_ && !killed_) {
            // Idle between frames for as long as the upstream likes.
            connection->set_timeout(std::chrono::milliseconds(0));
            auto header = read_header(*connection);
            if (!header) {
                break;
            }
            connection->set_timeout(io_timeout);
            if (header->length > context_->config.chunking.max_chunk_bytes) {
                throw ProtocolError("chunk " + std::to_string(header->chunk_id) + " exceeds the chunk size limit");
            }
            auto status = header->route.empty() ? store_chunk(*connection, *header)
                                                : relay_chunk(*connection, *header, downstream);
            write_status(*connection, status);
        }
    } catch (const ConnectionError &e) {
        if (!stopping_ && !killed_ && !cancelled()) {
            std::cerr << "gateway " << spec_.id << ": inbound connection dropped: " << e.what() << std::endl;
        }
    } catch (const ProtocolError &e) {
        std::cerr << "gateway " << spec_.id << ": protocol error on inbound connection: " << e.what() << std::endl;
    }
    drop_link(downstream);
    untrack(connection.get());
    connection->close();
}

TransferStatus Gateway::store_chunk(Connection &upstream, const FrameHeader &header) {
    const std::size_t block = context_->config.gateway.stream_block_bytes;
    std::vector<char> data(static_cast<std::size_t>(header.length));
    for (std::uint64_t done = 0; done < header.length;) {
        if (cancelled()) {
            throw ConnectionError("transfer cancelled");
        }
        auto want = static_cast<std::size_t>(std::min<std::uint64_t>(block, header.length - done));
        upstream.receive_exact(data.data() + done, want);
        done += want;
    }
    if (Checksum::crc32(data) != header.checksum) {
        return TransferStatus::ChecksumMismatch;
    }
    if (!destination_) {
        return TransferStatus::PermanentError;
    }
    if (cancelled()) {
        return TransferStatus::Aborted;
    }
    try {
        destination_->put(header.destination_key, header.offset, data);
        bytes_stored_ += header.length;
        return verify_stored(header.destination_key, header.offset, header.length, header.checksum);
    } catch (const ObjectStoreError &e) {
        std::cerr << "gateway " << spec_.id << ": storing chunk " << header.chunk_id << " failed: " << e.what()
                  << std::endl;
        return e.transient() ? TransferStatus::TransientError : TransferStatus::PermanentError;
    }
}

TransferStatus Gateway::relay_chunk(Connection &upstream, const FrameHeader &header, Link &link) {
    const auto &next_region = header.route.front();
    if (link.connection && (link.peer.region != next_region || !context_->directory.healthy(link.peer.id))) {
        drop_link(link);
    }
    bool forwarding = true;
    if (!link.connection) {
        auto next = context_->directory.resolve(next_region, static_cast<std::size_t>(header.chunk_id));
        if (!next) {
            forwarding = false;
        } else {
            try {
                open_link(link, *next);
            } catch (const ConnectionError &e) {
                suspect(*next, e.what());
                drop_link(link);
                forwarding = false;
            }
        }
    }

    FrameHeader forward = header;
    forward.route.erase(forward.route.begin());
    if (forwarding) {
        try {
            write_header(*link.connection, forward);
        } catch (const ConnectionError &e) {
            suspect(link.peer, e.what());
            drop_link(link);
            forwarding = false;
        }
    }

    // Blocks go downstream as they arrive; a slow next hop stalls the sends
    // and, through them, the reads from upstream. The upstream body is drained
    // even when forwarding stopped, so the frame boundary holds.
    const std::size_t block = context_->config.gateway.stream_block_bytes;
    std::vector<char> buffer(static_cast<std::size_t>(std::min<std::uint64_t>(block, header.length)));
    for (std::uint64_t done = 0; done < header.length;) {
        if (cancelled()) {
            throw ConnectionError("transfer cancelled");
        }
        auto want = static_cast<std::size_t>(std::min<std::uint64_t>(block, header.length - done));
        upstream.receive_exact(buffer.data(), want);
        done += want;
        if (!forwarding) {
            continue;
        }
        try {
            link.connection->send(buffer.data(), want);
            bytes_relayed_ += want;
        } catch (const ConnectionError &e) {
            suspect(link.peer, e.what());
            drop_link(link);
            forwarding = false;
        }
    }
    if (!forwarding) {
        return TransferStatus::Unreachable;
    }
    try {
        return read_status(*link.connection);
    } catch (const ConnectionError &e) {
        suspect(link.peer, e.what());
        drop_link(link);
    } catch (const ProtocolError &e) {
        suspect(link.peer, e.what());
        drop_link(link);
    }
    return TransferStatus::Unreachable;
}

TransferStatus Gateway::verify_stored(const std::string &key, std::uint64_t offset, std::uint64_t length,
                                      std::uint32_t checksum) {
    auto stored = destination_->get(key, offset, length);
    if (stored.size() != length || Checksum::crc32(stored) != checksum) {
        return TransferStatus::ChecksumMismatch;
    }
    return TransferStatus::Ok;
}

void Gateway::open_link(Link &link, const GatewayAddress &peer) {
    link.peer = peer;
    link.connection = transport_->open(peer.endpoint);
    track(link.connection.get());
    link.connection->set_timeout(context_->config.gateway.io_timeout);
    ++connections_opened_;
}

void Gateway::drop_link(Link &link) {
    if (!link.connection) {
        return;
    }
    untrack(link.connection.get());
    link.connection->close();
    link.connection.reset();
}

// The peer behind a broken link is suspect until its region gets a
// replacement; a failure to reach several peers points at this gateway.
void Gateway::link_failed(Link &link) {
    auto peer = link.peer;
    drop_link(link);
    if (peer.id == kNoGateway) {
        return;
    }
    suspect(peer, "link failure");
    std::lock_guard<std::mutex> lock(link_mutex_);
    ++link_failures_;
    failed_peers_.insert(peer.id);
}

void Gateway::link_succeeded() {
    std::lock_guard<std::mutex> lock(link_mutex_);
    link_failures_ = 0;
    failed_peers_.clear();
}

bool Gateway::link_broken() const {
    std::lock_guard<std::mutex> lock(link_mutex_);
    return link_failures_ >= context_->config.gateway.link_failure_threshold && failed_peers_.size() >= 2;
}

void Gateway::suspect(const GatewayAddress &peer, const std::string &reason) {
    if (peer.id == kNoGateway || stopping_ || killed_ || cancelled() || !context_->directory.healthy(peer.id)) {
        return;
    }
    context_->directory.mark_unhealthy(peer.id);
    std::cerr << "gateway " << spec_.id << ": next hop gateway " << peer.id << " in " << peer.region
              << " marked unhealthy: " << reason << std::endl;
}

void Gateway::track(Connection *connection) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.insert(connection);
    if (stopping_ || killed_ || cancelled_) {
        connection->close();
    }
}

void Gateway::untrack(Connection *connection) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.erase(connection);
}

void Gateway::close_connections() {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto *connection : connections_) {
        connection->close();
    }
}

void Gateway::bounce(const AssignChunk &assign) {
    ChunkStateChanged event;
    event.job = assign.chunk.job_id;
    event.chunk_id = assign.chunk.id;
    event.state = ChunkState::Pending;
    event.version = assign.version + 1;
    event.timestamp = Clock::now();
    event.gateway = spec_.id;
    event.attempts = 0;
    event.permanent = false;
    event.released = true;
    publish(event);
}

void Gateway::fence(const std::string &reason) {
    if (fenced_.exchange(true)) {
        return;
    }
    context_->directory.mark_unhealthy(spec_.id);
    auto released = queue_.release_all();
    queue_.close();
    if (listener_) {
        listener_->close();
    }
    std::cerr << "gateway " << spec_.id << " in " << spec_.region << " fenced (" << reason << "), released "
              << released << " chunks" << std::endl;
}

void Gateway::cancel_local() {
    cancelled_ = true;
    queue_.close();
    close_connections();
}

bool Gateway::cancelled() const { return cancelled_ || context_->cancelled; }

void Gateway::publish(const ChunkStateChanged &event) {
    if (killed_) {
        return;
    }
    context_->events.publish(event);
}

} // namespace skyhop
