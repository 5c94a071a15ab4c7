#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>
#include "app_config.hpp"
#include "faiss_vector_store.hpp"
#include "retrieval_engine.hpp"
#include "KeyManager.hpp"
#include "ServiceMetrics.hpp"

namespace edubot {

class TextGenerator;
class InteractionLogger;

using CorpusLoader = std::function<std::vector<CorpusEntry>()>;

/**
 * @brief Lazily built, shared, read-only knowledge index.
 *
 * The first get() loads the corpus and builds the index while holding the build lock;
 * concurrent first callers block on the lock and then share the same store. A failed
 * build publishes nothing and rethrows, so a later get() tries again.
 */
class IndexHandle {
public:
    IndexHandle(CorpusLoader loader, std::shared_ptr<Embedder> embedder);

    std::shared_ptr<const FaissVectorStore> get();
    bool is_ready() const { return ready_.load(std::memory_order_acquire); }

    // Number of completed builds; stays at 1 for the lifetime of a healthy process.
    size_t build_count() const { return build_count_.load(); }

private:
    CorpusLoader loader_;
    std::shared_ptr<Embedder> embedder_;

    std::mutex build_mutex_;
    std::atomic<bool> ready_{false};
    std::shared_ptr<const FaissVectorStore> store_;
    std::atomic<size_t> build_count_{0};
};

/**
 * @brief Process-wide owner of configuration and long-lived collaborators.
 *
 * Constructed once in main() and passed explicitly to sessions and handlers.
 */
class AppContext {
public:
    AppContext(AppConfig config,
               std::shared_ptr<Embedder> embedder,
               std::shared_ptr<TextGenerator> generator,
               std::shared_ptr<InteractionLogger> logger,
               CorpusLoader loader = {},
               std::shared_ptr<ServiceMetrics> metrics = nullptr);

    const AppConfig& config() const { return config_; }
    Embedder& embedder() { return *embedder_; }
    TextGenerator& generator() { return *generator_; }
    InteractionLogger& logger() { return *logger_; }
    ServiceMetrics& metrics() { return *metrics_; }
    IndexHandle& index() { return index_; }

    // A retrieval engine over the (possibly just built) shared index.
    RetrievalEngine retrieval_engine();

    KnowledgeBaseStats stats();

private:
    AppConfig config_;
    std::shared_ptr<Embedder> embedder_;
    std::shared_ptr<TextGenerator> generator_;
    std::shared_ptr<InteractionLogger> logger_;
    std::shared_ptr<ServiceMetrics> metrics_;
    IndexHandle index_;
};

} // namespace edubot
