#include "ragdesk_api/routes.hpp"

#include <iostream>

#include "ragdesk_core/service_provider.hpp"
#include "ragdesk_core/services/answer_service.hpp"
#include "ragdesk_core/services/retriever.hpp"

namespace ragdesk_api {

namespace {
constexpr int kDefaultTopK = 4;
}

int http_status_for(ragdesk_core::ErrorKind kind) {
  switch (kind) {
    case ragdesk_core::ErrorKind::InvalidInput:
      return 400;
    case ragdesk_core::ErrorKind::Timeout:
      return 504;
    case ragdesk_core::ErrorKind::Upstream:
      return 502;
    default:
      return 500;
  }
}

Routes::Routes(std::shared_ptr<ragdesk_core::ServiceProvider> services)
    : services_(std::move(services)) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  CROW_ROUTE(app, "/health")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/rag/answer").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_answer(req);
  });

  CROW_ROUTE(app, "/rag/search").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_search(req);
  });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &req) {
  return create_json_response({{"ok", true}});
}

crow::response Routes::handle_answer(const crow::request &req) {
  try {
    nlohmann::json body = parse_json_body(req.body);
    if (!body.is_object() || !body.contains("query") || !body["query"].is_string() ||
        body["query"].get<std::string>().empty()) {
      return create_error_response("Missing 'query'", "", 400);
    }
    const std::string query = body["query"].get<std::string>();
    const int top_k = body.value("k", kDefaultTopK);
    const std::string provider = body.value("provider", services_->get_default_provider());

    std::cout << "Answer for: " << query << " with k: " << top_k << " provider: " << provider
              << std::endl;
    ragdesk_core::AnswerResponse response =
        services_->get_answer_service().answer(query, top_k, provider);
    std::cout << "Guardrail: " << ragdesk_core::to_string(response.meta.guardrail)
              << ", contexts: " << response.contexts.size() << std::endl;
    return create_json_response(ragdesk_core::to_json(response));
  } catch (const ragdesk_core::RagError &e) {
    std::cerr << "Exception in handle_answer: " << e.what() << std::endl;
    return create_error_response(e.what(), ragdesk_core::to_string(e.kind()),
                                 http_status_for(e.kind()));
  } catch (const nlohmann::json::exception &e) {
    return create_error_response(std::string("Invalid request body: ") + e.what(),
                                 ragdesk_core::to_string(ragdesk_core::ErrorKind::InvalidInput),
                                 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_answer: " << e.what() << std::endl;
    return create_error_response(e.what(), "Internal", 500);
  }
}

crow::response Routes::handle_search(const crow::request &req) {
  try {
    nlohmann::json body = parse_json_body(req.body);
    if (!body.is_object() || !body.contains("query") || !body["query"].is_string() ||
        body["query"].get<std::string>().empty()) {
      return create_error_response("Missing 'query'", "", 400);
    }
    const std::string query = body["query"].get<std::string>();
    const int top_k = body.value("k", kDefaultTopK);
    const bool include_text = body.value("include_text", false);

    std::cout << "Search for: " << query << " with k: " << top_k << std::endl;
    std::vector<ragdesk_core::Context> contexts = services_->get_retriever().search(query, top_k);
    std::cout << "Search results: " << contexts.size() << std::endl;
    return create_json_response(ragdesk_core::to_json(contexts, include_text));
  } catch (const ragdesk_core::RagError &e) {
    std::cerr << "Exception in handle_search: " << e.what() << std::endl;
    return create_error_response(e.what(), ragdesk_core::to_string(e.kind()),
                                 http_status_for(e.kind()));
  } catch (const nlohmann::json::exception &e) {
    return create_error_response(std::string("Invalid request body: ") + e.what(),
                                 ragdesk_core::to_string(ragdesk_core::ErrorKind::InvalidInput),
                                 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_search: " << e.what() << std::endl;
    return create_error_response(e.what(), "Internal", 500);
  }
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2, ' ', false,
                                                  nlohmann::json::error_handler_t::replace));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

crow::response Routes::create_error_response(const std::string &error, const std::string &kind,
                                             int status_code) {
  nlohmann::json response;
  response["error"] = error;
  if (!kind.empty()) {
    response["kind"] = kind;
  }
  return create_json_response(response, status_code);
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  return nlohmann::json::parse(body);
}

}  // namespace ragdesk_api
