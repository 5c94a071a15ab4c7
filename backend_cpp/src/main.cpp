#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

#include "app_config.hpp"
#include "app_context.hpp"
#include "chat_session.hpp"
#include "confidence_gate.hpp"
#include "embedding_service.hpp"
#include "generator_service.hpp"
#include "InteractionLogger.hpp"
#include "KeyManager.hpp"
#include "knowledge_base.hpp"

using json = nlohmann::json;

class EduBotServer {
public:
    EduBotServer(edubot::AppContext& context, std::shared_ptr<edubot::KeyManager> key_manager)
        : context_(context), key_manager_(std::move(key_manager)), sessions_(context) {
        setup_routes();
    }

    bool run() {
        const auto& cfg = context_.config();
        spdlog::info("🚀 Starting EduBot backend on {}:{}", cfg.host, cfg.port);
        return server_.listen(cfg.host, cfg.port);
    }

private:
    edubot::AppContext& context_;
    std::shared_ptr<edubot::KeyManager> key_manager_;
    edubot::SessionRegistry sessions_;
    httplib::Server server_;

    static void send_error(httplib::Response& res, int status, const std::string& message) {
        res.status = status;
        res.set_content(json{{"error", message}}.dump(), "application/json");
    }

    // Parses the body as a JSON object; answers 400 and returns false otherwise.
    static bool parse_body(const httplib::Request& req, httplib::Response& res, json& body) {
        try {
            body = json::parse(req.body);
        } catch (const json::parse_error& e) {
            send_error(res, 400, std::string("Malformed JSON body: ") + e.what());
            return false;
        }
        if (!body.is_object()) {
            send_error(res, 400, "Request body must be a JSON object");
            return false;
        }
        return true;
    }

    static json sources_json(const edubot::ChatReply& reply) {
        json list = json::array();
        for (const auto& s : reply.sources) {
            list.push_back({{"title", s.title}, {"category", s.category}, {"score", s.score}});
        }
        return list;
    }

    void setup_routes() {
        server_.Options("/(.*)", [](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            res.set_header("Access-Control-Allow-Headers", "Content-Type");
            res.status = 204;
        });

        server_.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            return httplib::Server::HandlerResponse::Unhandled;
        });

        server_.Get("/api/kb/stats", [this](const httplib::Request&, httplib::Response& res) {
            try {
                auto stats = context_.stats();
                res.set_content(json{
                    {"total_articles", stats.total_entries},
                    {"by_category", stats.by_category}
                }.dump(), "application/json");
            } catch (const std::exception& e) {
                spdlog::error("❌ Stats error: {}", e.what());
                send_error(res, 500, e.what());
            }
        });

        server_.Post("/api/retrieve", [this](const httplib::Request& req, httplib::Response& res) {
            handle_retrieve(req, res);
        });

        server_.Post("/api/chat", [this](const httplib::Request& req, httplib::Response& res) {
            handle_chat(req, res);
        });

        server_.Post("/api/chat/:session_id/clear", [this](const httplib::Request& req, httplib::Response& res) {
            auto session_id = req.path_params.at("session_id");
            bool existed = sessions_.clear(session_id);
            res.set_content(json{{"success", true}, {"cleared", existed}}.dump(), "application/json");
        });

        server_.Get("/api/admin/telemetry", [this](const httplib::Request&, httplib::Response& res) {
            auto m = context_.metrics().get_latest_snapshot();
            json response = {
                {"metrics", {
                    {"retrieval_latency", m.retrieval_latency_ms},
                    {"embedding_latency", m.embedding_latency_ms},
                    {"llm_latency", m.generation_latency_ms},
                    {"candidate_pool", m.last_candidate_pool},
                    {"answers", m.answers},
                    {"clarifications", m.clarifications},
                    {"blocked", m.blocked},
                    {"rate_limited", m.rate_limited},
                    {"generation_errors", m.generation_errors},
                    {"sessions", sessions_.size()},
                    {"active_keys", key_manager_->get_active_key_count()},
                    {"index_ready", context_.index().is_ready()}
                }},
                {"logs", context_.logger().recent_json()}
            };
            res.set_content(response.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
        });
    }

    void handle_retrieve(const httplib::Request& req, httplib::Response& res) {
        json body;
        if (!parse_body(req, res, body)) return;

        try {
            std::string query = body.value("query", "");
            std::string category = body.value("category", "");
            if (query.empty()) {
                send_error(res, 400, "Missing query");
                return;
            }
            const auto& cfg = context_.config();
            size_t k = static_cast<size_t>(cfg.clamp_top_k(body.value("top_k", 0)));

            auto engine = context_.retrieval_engine();
            auto chunks = engine.retrieve(query, category, k);

            json results = json::array();
            for (const auto& c : chunks) {
                results.push_back({
                    {"id", c.id},
                    {"title", c.title},
                    {"category", edubot::to_string(c.category)},
                    {"content", c.content},
                    {"tags", c.tags},
                    {"score", c.score}
                });
            }
            res.set_content(json{
                {"chunks", results},
                {"top_k", k},
                {"needs_clarification", edubot::needs_clarification(chunks, cfg.confidence_threshold)}
            }.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
        } catch (const json::type_error& e) {
            send_error(res, 400, std::string("Invalid field type: ") + e.what());
        } catch (const std::exception& e) {
            spdlog::error("❌ Retrieval error: {}", e.what());
            send_error(res, 500, e.what());
        }
    }

    void handle_chat(const httplib::Request& req, httplib::Response& res) {
        json body;
        if (!parse_body(req, res, body)) return;

        try {
            std::string query = body.value("query", "");
            int top_k = body.value("top_k", 0);
            std::string session_id = body.value("session_id", "");

            // Rejected before any session is created for it
            if (edubot::trim_query(query).empty()) {
                send_error(res, 400, "Missing query");
                return;
            }
            if (session_id.empty()) session_id = edubot::SessionRegistry::new_session_id();

            auto session = sessions_.get_or_create(session_id);
            auto reply = session->ask(query, top_k);

            json response = {
                {"session_id", session_id},
                {"kind", edubot::to_string(reply.kind)},
                {"response", reply.text},
                {"intent", reply.intent},
                {"sources", sources_json(reply)},
                {"chunk_count", reply.chunk_count},
                {"top_k", reply.top_k},
                {"latency", reply.latency_s},
                {"retrieval_ms", reply.retrieval_ms},
                {"turns", session->turn_count()}
            };
            if (reply.kind == edubot::ReplyKind::RateLimited) res.status = 429;
            res.set_content(response.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
        } catch (const json::type_error& e) {
            send_error(res, 400, std::string("Invalid field type: ") + e.what());
        } catch (const std::exception& e) {
            spdlog::error("❌ Chat error: {}", e.what());
            send_error(res, 500, e.what());
        }
    }
};

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    std::string config_path = argc > 1 ? argv[1] : "config.json";

    edubot::AppConfig config;
    try {
        config = edubot::AppConfig::load(config_path);
    } catch (const edubot::ConfigError& e) {
        spdlog::critical("❌ Invalid configuration {}: {}", config_path, e.what());
        return 1;
    }
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    auto key_manager = std::make_shared<edubot::KeyManager>(config.keys_path);
    auto metrics = std::make_shared<edubot::ServiceMetrics>();

    std::shared_ptr<edubot::Embedder> embedder;
    try {
        embedder = edubot::create_embedder(config, key_manager, metrics.get());
    } catch (const std::exception& e) {
        spdlog::critical("❌ {}", e.what());
        return 1;
    }
    spdlog::info("🧮 Embedding backend: {} (dim {})", embedder->name(), embedder->dimension());

    edubot::GenerationSettings settings;
    settings.model = config.generation_model;
    auto generator = std::make_shared<edubot::GeminiGenerator>(key_manager, settings, metrics.get());
    auto logger = std::make_shared<edubot::InteractionLogger>(config.log_path);

    edubot::AppContext context(config, embedder, generator, logger, {}, metrics);

    try {
        auto stats = context.stats();
        spdlog::info("📚 Knowledge base ready: {} articles", stats.total_entries);
    } catch (const std::exception& e) {
        spdlog::critical("❌ Failed to build the knowledge index: {}", e.what());
        return 1;
    }

    if (!key_manager->has_keys()) {
        spdlog::warn("⚠️ Chat answers will fail until a Gemini key is configured");
    }

    EduBotServer server(context, key_manager);
    if (!server.run()) {
        spdlog::critical("❌ Could not bind {}:{}", config.host, config.port);
        return 1;
    }
    return 0;
}
