#include "ragdesk_cli/cli_handler.hpp"
#include <iostream>
#include <iomanip> // Required for std::fixed and std::setprecision

#include "ragdesk_core/config.hpp"
#include "ragdesk_core/ingest/ingestion_service.hpp"
#include "ragdesk_core/service_provider.hpp"

namespace ragdesk_cli {

namespace {

int parse_top_k(const std::string& value) {
    try {
        size_t parsed = 0;
        int top_k = std::stoi(value, &parsed);
        if (parsed != value.size()) {
            throw CliError("Invalid --top-k value: " + value);
        }
        return top_k;
    } catch (const std::logic_error&) {
        throw CliError("Invalid --top-k value: " + value);
    }
}

// Reads the value following a flag, or throws when it is missing
std::string flag_value(int argc, char* argv[], int& i, const std::string& flag) {
    if (i + 1 >= argc) {
        throw CliError("Missing value for " + flag);
    }
    return argv[++i];
}

}  // namespace

CliHandler::CliHandler(const std::string& api_base_url)
    : api_base_url_(api_base_url), curl_handle_(nullptr) {
    setup_curl_handle();
}

CliHandler::~CliHandler() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

void CliHandler::setup_curl_handle() {
    curl_handle_ = curl_easy_init();
    if (!curl_handle_) {
        throw CliError("Failed to initialize CURL");
    }
}

size_t CliHandler::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append((char*)contents, size * nmemb);
    return size * nmemb;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];

    if (command == "ingest" || command == "i") {
        options.command = Command::Ingest;
        for (int i = 2; i < argc; ++i) {
            std::string flag = argv[i];
            if (flag == "--config" || flag == "-c") {
                options.config_path = flag_value(argc, argv, i, flag);
            } else {
                throw CliError("Unknown option for ingest: " + flag);
            }
        }
    } else if (command == "search" || command == "s" || command == "answer" || command == "a") {
        options.command = (command == "search" || command == "s") ? Command::Search : Command::Answer;
        for (int i = 2; i < argc; ++i) {
            std::string flag = argv[i];
            if (flag == "--query" || flag == "-q") {
                options.query = flag_value(argc, argv, i, flag);
            } else if (flag == "--top-k" || flag == "-k") {
                options.top_k = parse_top_k(flag_value(argc, argv, i, flag));
            } else if (options.command == Command::Search && (flag == "--with-text" || flag == "-t")) {
                options.with_text = true;
            } else if (options.command == Command::Answer && (flag == "--provider" || flag == "-p")) {
                options.provider = flag_value(argc, argv, i, flag);
            } else {
                throw CliError("Unknown option for " + command + ": " + flag);
            }
        }
        if (options.query.empty()) {
            throw CliError("The " + command + " command requires a query. Usage: " + command +
                           " --query <query>");
        }
        if (options.top_k < 1) {
            throw CliError("--top-k must be at least 1");
        }
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Ingest:
            handle_ingest_command(options);
            break;
        case Command::Search:
            handle_search_command(options);
            break;
        case Command::Answer:
            handle_answer_command(options);
            break;
        case Command::Help:
            handle_help_command(options);
            break;
    }
}

// Ingestion runs in-process; it never talks to the API server
void CliHandler::handle_ingest_command(const CliOptions& options) {
    ragdesk_core::Config config = ragdesk_core::Config::from_file(options.config_path);
    std::cout << "Ingesting documents from " << config.data_dir << " into " << config.store_dir
              << std::endl;

    auto ingestion = ragdesk_core::ServiceProvider::make_ingestion_service(config);
    ragdesk_core::IngestionReport report = ingestion->ingest(config.data_dir, config.store_dir);

    std::cout << "\nIngestion complete" << std::endl;
    std::cout << "  Documents: " << report.documents << std::endl;
    std::cout << "  Chunks:    " << report.chunks << std::endl;
    std::cout << "  Model:     " << report.model << " (dim " << report.dim << ")" << std::endl;
    std::cout << "  Store:     " << report.store_dir.string() << std::endl;
}

void CliHandler::handle_search_command(const CliOptions& options) {
    std::cout << "Search for: " << options.query << " (k: " << options.top_k << ")" << std::endl;

    nlohmann::json request_data = {
        {"query", options.query},
        {"k", options.top_k},
        {"include_text", options.with_text}
    };

    nlohmann::json response = make_post_request("/rag/search", request_data);
    print_search_response(response, options.with_text);
}

void CliHandler::handle_answer_command(const CliOptions& options) {
    nlohmann::json request_data = {
        {"query", options.query},
        {"k", options.top_k}
    };
    if (!options.provider.empty()) {
        request_data["provider"] = options.provider;
    }

    nlohmann::json response = make_post_request("/rag/answer", request_data);
    print_answer_response(response);
}

void CliHandler::handle_help_command(const CliOptions& options) {
    print_help();
}

nlohmann::json CliHandler::make_post_request(const std::string& endpoint, const nlohmann::json& data) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string url = build_url(endpoint);
    std::string request_json = data.dump();
    std::string response_buffer;

    struct curl_slist* headers = curl_slist_append(nullptr, "Content-Type: application/json");

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_json.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl_handle_);
    curl_slist_free_all(headers);
    if (res != CURLE_OK) {
        throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);

    nlohmann::json body = nlohmann::json::parse(response_buffer, nullptr, false);
    if (http_code != 200) {
        std::string message = "HTTP request failed with status code: " + std::to_string(http_code);
        if (body.is_object() && body.contains("error") && body["error"].is_string()) {
            message += " (" + body["error"].get<std::string>() + ")";
        }
        throw CliError(message);
    }
    if (body.is_discarded()) {
        throw CliError("Server returned invalid JSON from " + endpoint);
    }
    return body;
}

void CliHandler::print_search_response(const nlohmann::json& response, bool with_text) {
    if (!response.is_array() || response.empty()) {
        std::cout << "No results found." << std::endl;
        return;
    }

    std::cout << "\nResults (" << response.size() << "):" << std::endl;
    int rank = 1;
    for (const auto& context : response) {
        std::cout << "  [" << rank++ << "] " << context.value("title", "")
                  << "  score: " << std::fixed << std::setprecision(4)
                  << context.value("score", 0.0) << std::endl;
        std::cout << "      " << context.value("source", "") << std::endl;
        if (with_text && context.contains("text")) {
            std::cout << "      " << context["text"].get<std::string>() << std::endl;
        }
    }
}

void CliHandler::print_answer_response(const nlohmann::json& response) {
    std::cout << "\n" << response.value("answer", "") << "\n" << std::endl;

    const auto& contexts = response.contains("contexts") ? response["contexts"] : nlohmann::json::array();
    if (!contexts.empty()) {
        std::cout << "Sources:" << std::endl;
        int rank = 1;
        for (const auto& context : contexts) {
            std::cout << "  [" << rank++ << "] " << context.value("title", "")
                      << "  score: " << std::fixed << std::setprecision(4)
                      << context.value("score", 0.0) << std::endl;
        }
    }

    if (response.contains("meta")) {
        const auto& meta = response["meta"];
        std::cout << "\nprovider: " << meta.value("provider", "")
                  << "  guardrail: " << meta.value("guardrail", "")
                  << "  generated_at: " << meta.value("generated_at", "") << std::endl;
    }
}

void CliHandler::print_help() {
    std::cout << R"(
ragdesk CLI - question answering over your documents

Usage: ragdesk_cli <command> [options]

Commands:
  ingest, i     Chunk, embed and index the documents in data_dir (runs locally)
    --config, -c <file>    Config file (default: ragdeskrc.json)

  search, s     Retrieve the passages most similar to a query
    --query, -q <query>    Search query
    --top-k, -k <num>      Number of results to return (default: 4)
    --with-text, -t        Print the passage text

  answer, a     Answer a question from the indexed documents
    --query, -q <query>    Question
    --top-k, -k <num>      Number of passages to retrieve (default: 4)
    --provider, -p <name>  Generation provider: azure or ollama (default: server setting)

  help, h       Show this help message

Environment:
  API_BASE_URL  Base URL of the ragdesk API (default: http://127.0.0.1:8000)
)" << std::endl;
}

std::string CliHandler::build_url(const std::string& endpoint) {
    std::string url = api_base_url_;
    if (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url + endpoint;
}

}  // namespace ragdesk_cli
