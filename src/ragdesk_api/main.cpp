#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>

#include "ragdesk_api/routes.hpp"
#include "ragdesk_api/server.hpp"
#include "ragdesk_core/config.hpp"
#include "ragdesk_core/service_provider.hpp"
#include "ragdesk_core/services/retriever.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

// The signal handler function
void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();  // Wake up the main thread
}

int main(int argc, char *argv[]) {
  try {
    const std::string config_path = argc > 1 ? argv[1] : "ragdeskrc.json";
    ragdesk_core::Config config = ragdesk_core::Config::from_file(config_path);

    std::string server_url = config.api_base_url;
    std::cout << "Starting ragdesk API Server..." << std::endl;
    std::cout << "Server URL: " << server_url << std::endl;
    std::cout << "Store Directory: " << config.store_dir << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << std::endl;
    std::cout << "Default Provider: " << config.default_provider << std::endl;
    std::cout << "Guardrail Threshold: " << config.guardrail_threshold << std::endl;
    std::cout << "Generation Timeout: " << config.generation_timeout_seconds << "s" << std::endl;

    // Built eagerly so a bad store or model fails at startup, not on the first request
    auto services = ragdesk_core::ServiceProvider::from_config(config);
    std::cout << "Retriever ready with " << services->get_retriever().size() << " chunks"
              << std::endl;

    ragdesk_api::Server server(ragdesk_api::parse_bind_address(server_url));
    ragdesk_api::Routes routes(services);
    routes.register_routes(server);

    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    std::cout << "Stopping API server..." << std::endl;
    server.stop();
    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
