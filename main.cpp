#include <iostream>
#include <memory>
#include <string>
#include <csignal>
#include <chrono>
#include <atomic>
#include <mutex>
#include <optional>
#include <fstream>
#include <filesystem>
#include <unordered_set>

#include <elio/elio.hpp>
#include <elio/net/tcp.hpp>
#include "peerdrop/base/logger.h"
#include "peerdrop/base/config.h"
#include "peerdrop/base/utils.h"
#include "peerdrop/net/tcp_channel.h"
#include "peerdrop/protocol/control_codec.h"
#include "peerdrop/storage/resume_store.h"
#include "peerdrop/transfer/transfer_coordinator.h"

using namespace peerdrop;

// Global flag for signal handling
static volatile std::sig_atomic_t g_running = 1;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = 0;
    }
}

class PeerDropApplication {
public:
    PeerDropApplication() = default;
    ~PeerDropApplication() {
        if (coordinator_) {
            coordinator_->stop();
        }
    }

    bool initialize(int argc, char* argv[]) {
        Config::instance().load_from_env();

        // Returns false for --help, --version and parse errors
        if (!Config::instance().parse_command_line(argc, argv)) {
            return false;
        }

        auto& config = Config::instance().get();
        if (config.node.peer_id.empty()) {
            config.node.peer_id = generate_id("peer");
        }
        if (!Config::instance().validate()) {
            return false;
        }
        Config::instance().print();

        auto store = std::make_shared<FileResumeStore>(config.resume.checkpoint_dir);
        if (!store->initialize()) {
            Logger::instance().error("Cannot use checkpoint directory " + config.resume.checkpoint_dir);
            return false;
        }

        std::error_code ec;
        std::filesystem::create_directories(config.session.download_dir, ec);
        if (ec) {
            Logger::instance().error("Cannot create download directory " + config.session.download_dir +
                                     ": " + ec.message());
            return false;
        }

        coordinator_ = std::make_unique<TransferCoordinator>(config.node.peer_id, config.transfer,
                                                             store, config.resume);
        pending_fetch_.insert(config.session.fetch_ids.begin(), config.session.fetch_ids.end());

        coordinator_->set_on_file_received([this](const TransferSession& session, const ReceivedFile& file) {
            save_file(session, file);
        });
        coordinator_->set_on_session_finished([](const TransferSession& session) {
            if (session.state == SessionState::Completed) {
                Logger::instance().info("{} {} finished: {} ({} bytes)", to_string(session.direction),
                                        session.id, session.file_name, session.bytes_transferred);
            } else {
                Logger::instance().warning("{} {} ended {}: {}{}", to_string(session.direction), session.id,
                                           to_string(session.state), to_reason(session.last_error),
                                           is_resumable(session.last_error) ? " (resumable)" : "");
            }
        });
        coordinator_->set_on_catalog_updated([this](const std::string& peer_id) {
            on_catalog_updated(peer_id);
        });

        Logger::instance().info("PeerDrop node {} initialized", config.node.peer_id);
        return true;
    }

    void run() {
        elio::run(serve());
        Logger::instance().info("PeerDrop stopped");
    }

private:
    elio::coro::task<void> serve() {
        auto& config = Config::instance().get();
        coordinator_->start();

        for (const auto& path : config.session.share_paths) {
            if (auto entry = coordinator_->share_file(path)) {
                shared_ids_.push_back(entry->id);
                std::cout << "Sharing " << entry->name << " as " << entry->id << std::endl;
            }
        }

        if (config.node.listen_port != 0 && !start_listener(config.node)) {
            coordinator_->stop();
            co_return;
        }

        for (const auto& address : config.session.connect_addresses) {
            co_await connect_to(address);
        }
        if (config.session.push && !config.session.connect_addresses.empty()) {
            push_shared_files();
        }

        while (g_running) {
            co_await elio::time::sleep_for(std::chrono::milliseconds(100));
            if (config.session.exit_when_done && work_finished()) {
                Logger::instance().info("All requested transfers finished");
                break;
            }
        }

        listening_ = false;
        if (listener_) {
            listener_->close();
        }
        coordinator_->stop();
        co_return;
    }

    bool start_listener(const NodeConfig& node) {
        elio::net::tcp_options opts;
        opts.reuse_addr = true;
        opts.no_delay = true;

        elio::net::ipv4_address addr(node.bind_address, node.listen_port);
        auto listener = elio::net::tcp_listener::bind(addr, opts);
        if (!listener) {
            Logger::instance().error("Failed to bind TCP listener on port " + std::to_string(node.listen_port));
            return false;
        }

        listener_ = std::move(listener);
        listening_ = true;
        Logger::instance().info("Listening on " + node.bind_address + ":" +
                                std::to_string(listener_->local_address().port()));
        (void)accept_loop().spawn();
        return true;
    }

    elio::coro::task<void> accept_loop() {
        while (listening_) {
            auto stream_result = co_await listener_->accept();
            if (!stream_result) {
                if (listening_) {
                    Logger::instance().warning("Accept failed");
                }
                continue;
            }
            auto channel = std::make_shared<TcpChannel>(std::move(*stream_result));
            (void)exchange_hello(channel, true).spawn();
        }
        co_return;
    }

    elio::coro::task<void> connect_to(const std::string& address) {
        auto colon = address.rfind(':');
        if (colon == std::string::npos) {
            Logger::instance().error("Invalid peer address " + address + ", expected host:port");
            co_return;
        }
        std::string host = address.substr(0, colon);
        uint16_t port = 0;
        try {
            port = static_cast<uint16_t>(std::stoul(address.substr(colon + 1)));
        } catch (const std::exception&) {
            Logger::instance().error("Invalid port in " + address);
            co_return;
        }

        auto channel = co_await TcpChannel::connect(host, port);
        if (!channel) {
            co_return;
        }
        co_await exchange_hello(channel, false);
    }

    // Both sides send hello first; the first frame from the peer names it.
    // The coordinator takes the channel over from inside the data handler so
    // no frame after the hello is missed.
    elio::coro::task<void> exchange_hello(std::shared_ptr<TcpChannel> channel, bool inbound) {
        auto identified = std::make_shared<std::atomic<bool>>(false);
        std::weak_ptr<TcpChannel> weak = channel;
        channel->on_data([this, weak, identified, inbound](Frame frame) {
            auto self = weak.lock();
            if (!self || identified->load()) return;

            std::string error;
            auto message = frame.kind == FrameKind::Control ? ControlCodec::decode(frame.text(), &error)
                                                             : std::nullopt;
            auto* hello = message ? std::get_if<HelloMessage>(&*message) : nullptr;
            if (!hello || hello->peer_id.empty()) {
                Logger::instance().warning("Closing connection: expected hello" +
                                           (error.empty() ? std::string() : " (" + error + ")"));
                self->close();
                return;
            }
            if (hello->version != PROTOCOL_VERSION) {
                Logger::instance().warning("Peer {} speaks protocol {}, expected {}",
                                           hello->peer_id, hello->version, PROTOCOL_VERSION);
            }
            identified->store(true);
            coordinator_->add_peer(hello->peer_id, self);
            if (inbound) {
                on_inbound_peer();
            }
        });

        channel->start();
        channel->send(Frame::control(ControlCodec::encode(HelloMessage{coordinator_->local_peer_id()})));

        const auto timeout = std::chrono::milliseconds(Config::instance().get().transfer.handshake_timeout_ms);
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!identified->load() && channel->is_connected() && std::chrono::steady_clock::now() < deadline) {
            co_await elio::time::sleep_for(std::chrono::milliseconds(10));
        }
        if (!identified->load()) {
            Logger::instance().warning("No hello received within {} ms", timeout.count());
            channel->close();
        }
        co_return;
    }

    void on_inbound_peer() {
        auto& session = Config::instance().get().session;
        if (session.push && session.connect_addresses.empty() && !pushed_.exchange(true)) {
            push_shared_files();
        }
    }

    void push_shared_files() {
        for (const auto& id : shared_ids_) {
            auto uploads = coordinator_->broadcast_file(id);
            push_started_ = push_started_ || !uploads.empty();
        }
    }

    void on_catalog_updated(const std::string& peer_id) {
        auto& session = Config::instance().get().session;
        catalog_received_ = true;

        if (session.fetch_all) {
            coordinator_->request_all_downloads();
        }

        std::vector<std::string> ready;
        {
            std::lock_guard<std::mutex> lock(fetch_mutex_);
            for (const auto& id : pending_fetch_) {
                if (coordinator_->catalog().find_remote(id)) {
                    ready.push_back(id);
                }
            }
            for (const auto& id : ready) {
                pending_fetch_.erase(id);
            }
        }
        for (const auto& id : ready) {
            if (!coordinator_->request_download(id)) {
                Logger::instance().warning("Download of " + id + " could not be queued");
            }
        }

        for (const auto& entry : coordinator_->catalog().available_downloads()) {
            if (entry.owner_peer_id == peer_id) {
                Logger::instance().debug("Available from {}: {} {} ({} bytes)",
                                         peer_id, entry.id, entry.name, entry.byte_size);
            }
        }
    }

    bool work_finished() {
        auto& session = Config::instance().get().session;
        bool wants_fetch = !session.fetch_ids.empty() || session.fetch_all;
        if (wants_fetch && !catalog_received_) return false;
        if (!session.fetch_ids.empty()) {
            std::lock_guard<std::mutex> lock(fetch_mutex_);
            if (!pending_fetch_.empty()) return false;
        }
        if (session.push && !push_started_) return false;
        return coordinator_->active_sessions().empty();
    }

    void save_file(const TransferSession& session, const ReceivedFile& file) {
        namespace fs = std::filesystem;
        fs::path dir = Config::instance().get().session.download_dir;
        std::string name = sanitize_file_name(file.name.empty() ? file.file_id : file.name);
        fs::path target = dir / name;
        for (int n = 1; fs::exists(target); ++n) {
            target = dir / (name + "." + std::to_string(n));
        }

        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(file.data.data()), static_cast<std::streamsize>(file.data.size()));
        out.close();
        if (!out) {
            Logger::instance().error("Failed to write " + target.string());
            return;
        }
        Logger::instance().info("Saved {} from {} to {}", file.name, session.peer_id, target.string());
        std::cout << "Received " << file.name << " (" << file.data.size() << " bytes) -> "
                  << target.string() << std::endl;
    }

    std::unique_ptr<TransferCoordinator> coordinator_;
    std::optional<elio::net::tcp_listener> listener_;
    std::atomic<bool> listening_{false};

    std::vector<std::string> shared_ids_;
    std::mutex fetch_mutex_;
    std::unordered_set<std::string> pending_fetch_;
    std::atomic<bool> catalog_received_{false};
    std::atomic<bool> push_started_{false};
    std::atomic<bool> pushed_{false};
};

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        PeerDropApplication app;
        if (!app.initialize(argc, argv)) {
            return 1;
        }
        app.run();
    } catch (const PeerDropError& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
