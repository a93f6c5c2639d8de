#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <pthread.h>
#include <string>
#include <thread>
#include <utility>
#include "app/cli_parser.hpp"
#include "app/frame_handler.hpp"
#include "app/tcp_server.hpp"
#include "core/errors/tandem_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/frame_contract.hpp"
#include "runtime/deterministic_engine.hpp"
#include "runtime/worker_pool.hpp"
#include "session/connection_registry.hpp"
#include "session/conversation_store.hpp"
#include "session/session_coordinator.hpp"
#include "session/tool_call_correlator.hpp"
#include "tools/knowledge_search.hpp"
#include "tools/tool_router.hpp"

int main(int argc, char* argv[]) {
    // 1. Parse CLI input and return normalized input errors
    TANDEM_LOG_INFO("tandemd: bootstrapping...");
    auto parsed = tandem::app::cli::parse_and_validate(argc, argv);
    if (tandem::core::errors::is_error(parsed)) {
        const auto& err = tandem::core::errors::get_error(parsed);
        TANDEM_LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            TANDEM_LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto config = tandem::core::errors::take_value(std::move(parsed));
    tandem::core::logging::Logger::get().set_min_level(config.log_level);

    // 2. Block SIGINT/SIGTERM before any thread starts; one watcher thread owns them.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    // 3. Wire the components
    std::shared_ptr<tandem::session::ConversationPersistence> persistence;
    if (config.store_dir.empty()) {
        persistence = std::make_shared<tandem::session::InMemoryPersistence>();
    } else {
        persistence = std::make_shared<tandem::session::FilePersistence>(config.store_dir);
        TANDEM_LOG_INFO("Conversations persist under " + config.store_dir.string());
    }
    tandem::session::ConversationStore store(persistence);
    tandem::session::ConnectionRegistry connections;
    tandem::session::ToolCallCorrelator correlator;

    tandem::tools::ToolRouter router(config.forwarded_tools);
    tandem::runtime::DeterministicEngineOptions engine_options;
    if (!config.knowledge_dir.empty()) {
        router.register_local("knowledge_search",
                              tandem::tools::KnowledgeSearch(config.knowledge_dir));
        engine_options.use_knowledge_search = true;
    }
    tandem::runtime::DeterministicEngine engine(engine_options);

    tandem::runtime::WorkerPool pool(config.worker_threads, config.worker_queue_capacity);
    tandem::session::CoordinatorOptions coordinator_options;
    coordinator_options.tool_timeout = std::chrono::milliseconds(config.tool_timeout_ms);
    tandem::session::SessionCoordinator coordinator(store, connections, correlator, router,
                                                   engine, pool, coordinator_options);

    tandem::app::FrameHandler handler(coordinator, connections, correlator, store);
    tandem::app::TcpServer server(config.host, config.port, handler);
    auto started = server.start();
    if (tandem::core::errors::is_error(started)) {
        const auto& err = tandem::core::errors::get_error(started);
        TANDEM_LOG_ERROR("Failed to start server [" + err.code + "]: " + err.message);
        return 3;
    }

    std::atomic_bool signalled{false};
    std::thread signal_watcher([&server, &signalled, signals] {
        int received = 0;
        sigwait(&signals, &received);
        signalled.store(true);
        TANDEM_LOG_INFO("Received signal " + std::to_string(received) + ", shutting down");
        server.stop();
    });

    // 4. Serve until a signal arrives
    server.run();

    // 5. Graceful shutdown: refuse new work, let rounds drain, then say goodbye
    coordinator.begin_shutdown();
    if (!coordinator.wait_for_idle(std::chrono::milliseconds(config.shutdown_grace_ms))) {
        TANDEM_LOG_WARN("Rounds still running after grace period: " +
                        std::to_string(coordinator.in_flight_count()));
    }
    const auto released = correlator.fail_all("Server shutting down");
    if (released > 0) {
        TANDEM_LOG_WARN("Released " + std::to_string(released) + " pending tool calls");
    }
    connections.close_all(tandem::protocol::shutdown_frame(
        "Server shutting down", tandem::protocol::now_unix_ms()));
    server.close_connections();
    pool.shutdown();

    if (!signalled.load()) {
        // The accept loop ended on its own; wake the watcher.
        pthread_kill(signal_watcher.native_handle(), SIGTERM);
    }
    signal_watcher.join();
    TANDEM_LOG_INFO("tandemd: stopped");
    return 0;
}
