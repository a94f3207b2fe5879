#include "mbk/network/file_receiver.hpp"
#include "mbk/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>

namespace mbk::network {

namespace fs = std::filesystem;
using nlohmann::json;

// ──────────────────────────────────────────────────────────
// ReceiverConnection
// ──────────────────────────────────────────────────────────

ReceiverConnection::ReceiverConnection(tcp::socket socket, FileReceiver& receiver)
    : socket_(std::move(socket))
    , receiver_(receiver) {
    boost::system::error_code ec;
    const auto remote = socket_.remote_endpoint(ec);
    peer_ = ec ? std::string("unknown") : remote.address().to_string() + ":" + std::to_string(remote.port());
}

ReceiverConnection::~ReceiverConnection() {
    finish_request();
    spdlog::debug("Connection {} closed", peer_);
}

void ReceiverConnection::start() {
    spdlog::debug("Accepted connection from {}", peer_);
    do_read_prefix();
}

void ReceiverConnection::do_read_prefix() {
    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(prefix_),
        [this, self](boost::system::error_code ec, std::size_t) {
            if (ec) {
                if (ec != asio::error::eof && ec != asio::error::operation_aborted) {
                    spdlog::debug("Read error from {}: {}", peer_, ec.message());
                }
                return;
            }

            request_active_ = true;
            receiver_.request_started();

            auto sizes = decode_prefix(prefix_);
            if (sizes.is_error()) {
                spdlog::warn("Bad frame from {}: {}", peer_, sizes.error().message);
                do_write(make_error_reply(sizes.error()), true);
                return;
            }
            // Payload buffers are only sized for authenticated peers.
            if (!identity_ && sizes.value().payload_bytes > 0) {
                spdlog::warn("Rejecting {}-byte payload from unauthenticated peer {}",
                             sizes.value().payload_bytes, peer_);
                do_write(make_error_reply(Error(ErrorCode::Unauthorized, "hello required before sending data")), true);
                return;
            }
            do_read_body(sizes.value());
        });
}

void ReceiverConnection::do_read_body(FrameSizes sizes) {
    header_.assign(sizes.header_bytes, 0);
    payload_.assign(sizes.payload_bytes, 0);
    std::array<asio::mutable_buffer, 2> buffers{asio::buffer(header_), asio::buffer(payload_)};

    auto self = shared_from_this();
    asio::async_read(socket_, buffers,
        [this, self](boost::system::error_code ec, std::size_t) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    spdlog::debug("Connection {} dropped mid-frame: {}", peer_, ec.message());
                }
                finish_request();
                return;
            }

            auto frame = decode_body(header_, std::move(payload_));
            header_.clear();
            payload_.clear();
            if (frame.is_error()) {
                spdlog::warn("Bad frame from {}: {}", peer_, frame.error().message);
                do_write(make_error_reply(frame.error()), true);
                return;
            }

            FileReceiver::Dispatched result;
            try {
                result = receiver_.dispatch(identity_, std::move(frame.value()));
            } catch (const std::exception& e) {
                spdlog::error("Request from {} failed: {}", peer_, e.what());
                result.reply = make_error_reply(Error(ErrorCode::Io, std::string("Internal receiver error: ") + e.what()));
                result.close_connection = true;
            }
            do_write(result.reply, result.close_connection);
        });
}

void ReceiverConnection::do_write(const Frame& reply, bool close_after) {
    auto encoded = encode_frame(reply);
    if (encoded.is_error()) {
        spdlog::error("Cannot encode reply to {}: {}", peer_, encoded.error().message);
        finish_request();
        boost::system::error_code ignored;
        socket_.close(ignored);
        return;
    }

    auto data = std::make_shared<std::vector<std::uint8_t>>(std::move(encoded.value()));
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(*data),
        [this, self, data, close_after](boost::system::error_code ec, std::size_t) {
            finish_request();
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    spdlog::debug("Write error to {}: {}", peer_, ec.message());
                }
                return;
            }
            if (close_after) {
                boost::system::error_code ignored;
                socket_.shutdown(tcp::socket::shutdown_both, ignored);
                return;
            }
            do_read_prefix();
        });
}

void ReceiverConnection::finish_request() {
    if (request_active_) {
        request_active_ = false;
        receiver_.request_finished();
    }
}

// ──────────────────────────────────────────────────────────
// FileReceiver
// ──────────────────────────────────────────────────────────

FileReceiver::FileReceiver(FileReceiverOptions options,
                           transfer::ChunkManager& chunks,
                           const services::Authenticator& authenticator,
                           events::EventBus* bus)
    : options_(std::move(options))
    , chunks_(chunks)
    , authenticator_(authenticator)
    , bus_(bus) {
}

FileReceiver::~FileReceiver() {
    stop_listening();
}

Outcome<void> FileReceiver::start_listening(std::uint16_t port) {
    std::lock_guard lock(lifecycle_mutex_);
    if (listening_) {
        return Fail<void>(ErrorCode::Validation, "Receiver is already listening on port " + std::to_string(bound_port_));
    }

    boost::system::error_code ec;
    const auto address = asio::ip::make_address(options_.bind_address, ec);
    if (ec) {
        return Fail<void>(ErrorCode::Validation, "Invalid bind address '" + options_.bind_address + "'");
    }

    auto io_context = std::make_unique<asio::io_context>();
    auto acceptor = std::make_unique<tcp::acceptor>(asio::make_strand(*io_context));
    const tcp::endpoint endpoint(address, port);

    acceptor->open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor->set_option(tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor->bind(endpoint, ec);
    }
    if (!ec) {
        acceptor->listen(asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        return Fail<void>(ErrorCode::Io, "Cannot listen on " + options_.bind_address + ":" +
                          std::to_string(port) + ": " + ec.message());
    }

    bound_port_ = acceptor->local_endpoint().port();
    io_context_ = std::move(io_context);
    acceptor_ = std::move(acceptor);
    stopping_ = false;
    listening_ = true;

    do_accept();

    const auto thread_count = std::max<std::size_t>(1, options_.io_threads);
    for (std::size_t i = 0; i < thread_count; ++i) {
        threads_.emplace_back([io = io_context_.get()]() {
            io->run();
        });
    }

    publish(events::ReceiverStartedEvent{bound_port_.load()});
    spdlog::info("Receiver listening on {}:{} with {} I/O thread(s)", options_.bind_address, bound_port_.load(), thread_count);
    return Ok();
}

void FileReceiver::stop_listening() {
    std::lock_guard lock(lifecycle_mutex_);
    if (!listening_) {
        return;
    }

    stopping_ = true;
    publish(events::ReceiverStoppingEvent{"stop requested", in_flight_.load()});

    asio::post(acceptor_->get_executor(), [acceptor = acceptor_.get()]() {
        boost::system::error_code ignored;
        acceptor->close(ignored);
    });

    {
        std::unique_lock drain(drain_mutex_);
        if (!drained_.wait_for(drain, options_.stop_grace, [this]() { return in_flight_.load() == 0; })) {
            spdlog::warn("{} request(s) still in flight after {}s, closing connections",
                         in_flight_.load(), options_.stop_grace.count());
        }
    }

    io_context_->stop();
    for (auto& thread : threads_) {
        thread.join();
    }
    threads_.clear();

    // Destroying the io_context releases every pending handler and with it
    // the connections they keep alive.
    acceptor_.reset();
    io_context_.reset();

    listening_ = false;
    bound_port_ = 0;
    spdlog::info("Receiver stopped");
}

void FileReceiver::do_accept() {
    acceptor_->async_accept(asio::make_strand(*io_context_),
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (!ec) {
                std::make_shared<ReceiverConnection>(std::move(socket), *this)->start();
            } else if (ec == asio::error::operation_aborted) {
                return;
            } else {
                spdlog::error("Accept error: {}", ec.message());
            }

            if (!stopping_ && acceptor_->is_open()) {
                do_accept();
            }
        });
}

void FileReceiver::request_started() {
    ++in_flight_;
}

void FileReceiver::request_finished() {
    if (in_flight_.fetch_sub(1) == 1) {
        std::lock_guard drain(drain_mutex_);
        drained_.notify_all();
    }
}

FileReceiver::Dispatched FileReceiver::dispatch(std::optional<services::AuthorizationContext>& identity, Frame frame) {
    const auto type = frame.type();

    if (is_stopping()) {
        return {make_error_reply(Error(ErrorCode::TransientNetwork, "Receiver is shutting down")), true};
    }

    if (type == message_type::kHello) {
        auto client = authenticate(frame.header.value("client_id", ""), frame.header.value("auth_token", ""));
        if (client.is_error()) {
            return {make_error_reply(client.error()), true};
        }
        identity = client.value();
        return {make_ok_reply(json{{"client_id", identity->client_id}}), false};
    }

    if (!identity) {
        return {make_error_reply(Error(ErrorCode::Unauthorized, "hello required before " + type)), true};
    }

    if (type == message_type::kBegin) {
        auto request = parse_begin(frame);
        if (request.is_error()) {
            return {make_error_reply(request.error()), false};
        }
        auto reply = begin_transfer(*identity, request.value());
        if (reply.is_error()) {
            return {make_error_reply(reply.error()), false};
        }
        const auto& begun = reply.value();
        return {make_ok_reply(json{{"transfer_id", begun.transfer_id},
                                   {"resume_token", begun.resume_token},
                                   {"completed_chunks", begun.completed_chunks}}), false};
    }

    if (type == message_type::kChunk) {
        std::string transfer_id;
        auto chunk = parse_chunk(std::move(frame), transfer_id);
        if (chunk.is_error()) {
            return {make_error_reply(chunk.error()), false};
        }
        auto status = accept_chunk(*identity, transfer_id, chunk.value());
        if (status.is_error()) {
            return {make_error_reply(status.error()), false};
        }
        return {make_chunk_reply(chunk.value().index, status.value()), false};
    }

    if (type == message_type::kCheckpoint) {
        auto token = checkpoint(*identity, frame.header.value("transfer_id", ""));
        if (token.is_error()) {
            return {make_error_reply(token.error()), false};
        }
        return {make_ok_reply(json{{"resume_token", token.value()}}), false};
    }

    if (type == message_type::kFinalize) {
        auto result = complete_file(*identity, frame.header.value("transfer_id", ""));
        if (result.is_error()) {
            return {make_error_reply(result.error()), false};
        }
        const auto& done = result.value();
        return {make_ok_reply(json{{"file_path", done.file_path},
                                   {"file_size", done.bytes_received},
                                   {"sha256", done.sha256}}), false};
    }

    return {make_error_reply(Error(ErrorCode::Protocol, "Unknown message type '" + type + "'")), true};
}

Outcome<services::AuthorizationContext> FileReceiver::authenticate(const std::string& client_id,
                                                                   const std::string& auth_token) const {
    auto client = authenticator_.authenticate(client_id, auth_token);
    if (client.is_error()) {
        spdlog::warn("Authentication failed for client '{}': {}", client_id, client.error().message);
    }
    return client;
}

Outcome<transfer::BeginReply> FileReceiver::receive_file(const ReceiveRequest& request) {
    auto client = authenticate(request.client_id, request.auth_token);
    if (client.is_error()) {
        return Err<transfer::BeginReply>(client.error());
    }
    return begin_transfer(client.value(), request.begin);
}

Outcome<transfer::BeginReply> FileReceiver::begin_transfer(const services::AuthorizationContext& client,
                                                           const transfer::BeginRequest& request) {
    if (!authenticator_.is_authorized(client, services::kUploadBackupPermission)) {
        return Fail<transfer::BeginReply>(ErrorCode::Unauthorized,
                                          "Client " + client.client_id + " may not upload backups");
    }

    const auto& metadata = request.metadata;
    const auto file_name = request.file_name.empty() ? metadata.file_name : request.file_name;
    auto target = confine_target_path(request.target_directory, file_name);
    if (target.is_error()) {
        return Err<transfer::BeginReply>(target.error());
    }

    if (!request.resume_token.empty()) {
        auto resumed = try_resume(client, request);
        if (resumed.is_ok()) {
            return resumed;
        }
        const auto code = resumed.error().code;
        if (code == ErrorCode::Unauthorized || code == ErrorCode::Io) {
            return resumed;
        }
        spdlog::warn("Resume token {} not usable ({}), starting a new transfer",
                     request.resume_token, resumed.error().message);
    }

    if (auto space = check_storage(metadata.file_size + options_.min_free_bytes); space.is_error()) {
        return Err<transfer::BeginReply>(space.error());
    }

    auto transfer_id = chunks_.initialize_transfer(metadata, target.value(), client.client_id);
    if (transfer_id.is_error()) {
        return Err<transfer::BeginReply>(transfer_id.error());
    }

    transfer::BeginReply reply;
    reply.transfer_id = transfer_id.value();
    if (auto token = chunks_.create_resume_token(reply.transfer_id); token.is_ok()) {
        reply.resume_token = token.value();
    } else {
        spdlog::warn("Transfer {}: no resume token issued: {}", reply.transfer_id, token.error().message);
    }

    publish(events::TransferStartedEvent{reply.transfer_id, client.client_id, file_name,
                                         metadata.file_size, metadata.chunk_count, false});
    return Ok(std::move(reply));
}

Outcome<transfer::BeginReply> FileReceiver::try_resume(const services::AuthorizationContext& client,
                                                       const transfer::BeginRequest& request) {
    // Ownership is settled before a session is rebuilt for the token.
    auto owner = chunks_.get_resume_info(request.resume_token);
    if (owner.is_error()) {
        return Err<transfer::BeginReply>(owner.error());
    }
    if (!owner.value().client_id.empty() && owner.value().client_id != client.client_id) {
        spdlog::warn("Client {} presented resume token {} owned by {}",
                     client.client_id, request.resume_token, owner.value().client_id);
        return Fail<transfer::BeginReply>(ErrorCode::Unauthorized, "Resume token belongs to another client");
    }

    auto restored = chunks_.restore_transfer(request.resume_token, request.metadata);
    if (restored.is_error()) {
        return Err<transfer::BeginReply>(restored.error());
    }
    const auto& transfer_id = restored.value();

    auto info = chunks_.get_resume_info(request.resume_token);
    if (info.is_error()) {
        return Err<transfer::BeginReply>(info.error());
    }

    transfer::BeginReply reply;
    reply.transfer_id = transfer_id;
    reply.resume_token = request.resume_token;
    reply.completed_chunks = info.value().completed_chunks;

    publish(events::TransferStartedEvent{transfer_id, client.client_id, request.metadata.file_name,
                                         request.metadata.file_size, request.metadata.chunk_count, true});
    spdlog::info("Transfer {} resumed by {}: {}/{} chunks already stored",
                 transfer_id, client.client_id, reply.completed_chunks.size(), request.metadata.chunk_count);
    return Ok(std::move(reply));
}

Outcome<transfer::ChunkStatus> FileReceiver::accept_chunk(const services::AuthorizationContext& client,
                                                          const std::string& transfer_id,
                                                          const transfer::ChunkData& chunk) {
    if (!chunks_.snapshot(transfer_id)) {
        return Ok(transfer::ChunkStatus::UnknownTransfer);
    }
    if (auto owned = check_ownership(client, transfer_id); owned.is_error()) {
        return Err<transfer::ChunkStatus>(owned.error());
    }

    auto status = chunks_.receive_chunk(transfer_id, chunk);
    if (status.is_ok()) {
        if (status.value() == transfer::ChunkStatus::Accepted) {
            publish(events::ChunkAcceptedEvent{transfer_id, chunk.index, chunk.data.size()});
        } else if (status.value() == transfer::ChunkStatus::ChecksumMismatch) {
            publish(events::ChunkRejectedEvent{transfer_id, chunk.index, "checksum mismatch"});
        }
    } else {
        publish(events::ChunkRejectedEvent{transfer_id, chunk.index, status.error().message});
    }
    return status;
}

Outcome<std::string> FileReceiver::checkpoint(const services::AuthorizationContext& client,
                                              const std::string& transfer_id) {
    if (auto owned = check_ownership(client, transfer_id); owned.is_error()) {
        return Err<std::string>(owned.error());
    }
    return chunks_.create_resume_token(transfer_id);
}

Outcome<ReceiveResult> FileReceiver::complete_file(const services::AuthorizationContext& client,
                                                   const std::string& transfer_id) {
    if (auto owned = check_ownership(client, transfer_id); owned.is_error()) {
        return Err<ReceiveResult>(owned.error());
    }

    const auto before = chunks_.snapshot(transfer_id);
    auto finalized = chunks_.finalize_transfer(transfer_id);
    if (finalized.is_error()) {
        return Err<ReceiveResult>(finalized.error());
    }

    ReceiveResult result;
    result.success = true;
    result.file_path = finalized.value().string();
    if (before) {
        result.bytes_received = before->metadata.file_size;
        result.sha256 = before->metadata.sha256;
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now() - before->created_at);
    }

    publish(events::TransferCompletedEvent{transfer_id, client.client_id, result.file_path,
                                           result.bytes_received, result.sha256, result.duration});
    return Ok(std::move(result));
}

Outcome<void> FileReceiver::check_ownership(const services::AuthorizationContext& client,
                                            const std::string& transfer_id) const {
    const auto snapshot = chunks_.snapshot(transfer_id);
    if (!snapshot) {
        return Fail<void>(ErrorCode::UnknownTransfer, "Unknown transfer: " + transfer_id);
    }
    if (!snapshot->client_id.empty() && snapshot->client_id != client.client_id) {
        spdlog::warn("Client {} attempted to use transfer {} owned by {}",
                     client.client_id, transfer_id, snapshot->client_id);
        return Fail<void>(ErrorCode::Unauthorized, "Transfer " + transfer_id + " belongs to another client");
    }
    return Ok();
}

Outcome<void> FileReceiver::check_storage(std::uint64_t required_bytes) const {
    const auto& root = chunks_.options().storage_root;
    if (root.empty()) {
        return Ok();
    }

    std::error_code ec;
    fs::create_directories(root, ec);
    const auto info = fs::space(root, ec);
    if (ec) {
        spdlog::warn("Cannot determine free space on {}: {}", root.string(), ec.message());
        return Ok();
    }
    if (info.available < required_bytes) {
        return Fail<void>(ErrorCode::InsufficientStorage,
                          "Need " + std::to_string(required_bytes) + " bytes on " + root.string() +
                          ", " + std::to_string(info.available) + " available");
    }
    return Ok();
}

Outcome<std::string> confine_target_path(const std::string& target_directory, const std::string& file_name) {
    if (file_name.empty() || file_name == "." || file_name == ".." ||
        file_name.find_first_of("/\\") != std::string::npos) {
        return Fail<std::string>(ErrorCode::Validation, "Invalid target file name '" + file_name + "'");
    }

    // Absolute directories are taken relative to the storage root.
    const auto directory = fs::path(target_directory).relative_path();
    for (const auto& part : directory) {
        if (part == "..") {
            return Fail<std::string>(ErrorCode::Validation,
                                     "Target directory escapes the storage root: " + target_directory);
        }
    }
    return Ok((directory / file_name).lexically_normal().generic_string());
}

} // namespace mbk::network
