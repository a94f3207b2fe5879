#pragma once

#include "mbk/core/error.hpp"
#include "mbk/events/event_bus.hpp"
#include "mbk/network/wire.hpp"
#include "mbk/services/auth.hpp"
#include "mbk/transfer/channel.hpp"
#include "mbk/transfer/chunk_manager.hpp"

#include <boost/asio.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mbk::network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

struct FileReceiverOptions {
    std::string bind_address = "0.0.0.0";
    std::size_t io_threads = 4;
    std::uint64_t min_free_bytes = 0;           ///< Headroom kept on the storage volume
    std::chrono::seconds stop_grace{30};
};

/**
 * @brief Transport-independent form of a "begin" request
 */
struct ReceiveRequest {
    std::string client_id;
    std::string auth_token;
    transfer::BeginRequest begin;
};

struct ReceiveResult {
    bool success = false;
    std::string file_path;
    std::uint64_t bytes_received = 0;
    std::string sha256;
    std::chrono::milliseconds duration{0};
};

class FileReceiver;

/**
 * @brief One client connection
 *
 * Reads a frame, hands it to the receiver, writes the single reply, and
 * loops. A failed hello closes the connection after the error reply.
 * Lifetime is held by the pending async operation's shared_ptr.
 */
class ReceiverConnection : public std::enable_shared_from_this<ReceiverConnection> {
public:
    ReceiverConnection(tcp::socket socket, FileReceiver& receiver);
    ~ReceiverConnection();

    void start();

private:
    void do_read_prefix();
    void do_read_body(FrameSizes sizes);
    void do_write(const Frame& reply, bool close_after);
    void finish_request();

    tcp::socket socket_;
    FileReceiver& receiver_;
    std::string peer_;
    std::array<std::uint8_t, kFramePrefixBytes> prefix_{};
    std::vector<std::uint8_t> header_;
    std::vector<std::uint8_t> payload_;
    std::optional<services::AuthorizationContext> identity_;
    bool request_active_ = false;
};

/**
 * @brief Server side of the backup transfer
 *
 * Authenticates clients, enforces per-transfer ownership, checks storage
 * before accepting a file, and drives the ChunkManager. The listener runs
 * the frame protocol from wire.hpp on a small Asio thread pool; the public
 * receive_file / accept_chunk / complete_file / checkpoint calls are the
 * same operations without the socket and are what the listener dispatches to.
 *
 * THREAD SAFETY:
 * - All public members may be called concurrently
 * - stop_listening() stops accepting immediately and waits up to
 *   stop_grace for requests already being processed
 */
class FileReceiver {
public:
    FileReceiver(FileReceiverOptions options,
                 transfer::ChunkManager& chunks,
                 const services::Authenticator& authenticator,
                 events::EventBus* bus = nullptr);
    ~FileReceiver();

    FileReceiver(const FileReceiver&) = delete;
    FileReceiver& operator=(const FileReceiver&) = delete;

    /// Port 0 binds an ephemeral port; see bound_port().
    Outcome<void> start_listening(std::uint16_t port);
    void stop_listening();

    [[nodiscard]] std::uint16_t bound_port() const noexcept { return bound_port_.load(); }
    [[nodiscard]] bool is_listening() const noexcept { return listening_.load(); }

    Outcome<services::AuthorizationContext> authenticate(const std::string& client_id,
                                                         const std::string& auth_token) const;

    /**
     * @brief Authenticate, authorize, and open or resume a transfer
     *
     * A resume token that is unknown, expired, or describes another file
     * falls back to a fresh transfer. A token owned by another client is
     * Unauthorized.
     */
    Outcome<transfer::BeginReply> receive_file(const ReceiveRequest& request);
    Outcome<transfer::BeginReply> begin_transfer(const services::AuthorizationContext& client,
                                                 const transfer::BeginRequest& request);

    Outcome<transfer::ChunkStatus> accept_chunk(const services::AuthorizationContext& client,
                                                const std::string& transfer_id,
                                                const transfer::ChunkData& chunk);

    Outcome<std::string> checkpoint(const services::AuthorizationContext& client,
                                    const std::string& transfer_id);

    Outcome<ReceiveResult> complete_file(const services::AuthorizationContext& client,
                                         const std::string& transfer_id);

    [[nodiscard]] std::size_t in_flight_requests() const noexcept { return in_flight_.load(); }

private:
    friend class ReceiverConnection;

    struct Dispatched {
        Frame reply;
        bool close_connection = false;
    };

    Dispatched dispatch(std::optional<services::AuthorizationContext>& identity, Frame frame);

    void request_started();
    void request_finished();
    [[nodiscard]] bool is_stopping() const noexcept { return stopping_.load(); }

    void do_accept();

    Outcome<void> check_ownership(const services::AuthorizationContext& client,
                                  const std::string& transfer_id) const;
    Outcome<void> check_storage(std::uint64_t required_bytes) const;
    Outcome<transfer::BeginReply> try_resume(const services::AuthorizationContext& client,
                                             const transfer::BeginRequest& request);

    template<typename EventType>
    void publish(const EventType& event) {
        if (bus_) {
            bus_->emit(event);
        }
    }

    FileReceiverOptions options_;
    transfer::ChunkManager& chunks_;
    const services::Authenticator& authenticator_;
    events::EventBus* bus_;

    std::mutex lifecycle_mutex_;
    std::unique_ptr<asio::io_context> io_context_;
    std::unique_ptr<tcp::acceptor> acceptor_;
    std::vector<std::thread> threads_;
    std::atomic<bool> listening_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<std::uint16_t> bound_port_{0};

    std::atomic<std::size_t> in_flight_{0};
    std::mutex drain_mutex_;
    std::condition_variable drained_;
};

/// Joins directory and file name below the storage root; rejects escapes.
[[nodiscard]] Outcome<std::string> confine_target_path(const std::string& target_directory,
                                                       const std::string& file_name);

} // namespace mbk::network
