#include "app_context.hpp"
#include "generator_service.hpp"
#include "InteractionLogger.hpp"
#include <spdlog/spdlog.h>

namespace edubot {

IndexHandle::IndexHandle(CorpusLoader loader, std::shared_ptr<Embedder> embedder)
    : loader_(std::move(loader)), embedder_(std::move(embedder)) {}

std::shared_ptr<const FaissVectorStore> IndexHandle::get() {
    if (ready_.load(std::memory_order_acquire)) {
        return store_;
    }

    std::lock_guard<std::mutex> lock(build_mutex_);
    if (ready_.load(std::memory_order_relaxed)) {
        return store_;
    }

    spdlog::info("📂 Building knowledge index (first use)...");
    auto store = std::make_shared<FaissVectorStore>();
    store->build(loader_(), *embedder_);

    store_ = std::move(store);
    build_count_++;
    ready_.store(true, std::memory_order_release);
    return store_;
}

AppContext::AppContext(AppConfig config,
                       std::shared_ptr<Embedder> embedder,
                       std::shared_ptr<TextGenerator> generator,
                       std::shared_ptr<InteractionLogger> logger,
                       CorpusLoader loader,
                       std::shared_ptr<ServiceMetrics> metrics)
    : config_(std::move(config)),
      embedder_(std::move(embedder)),
      generator_(std::move(generator)),
      logger_(std::move(logger)),
      metrics_(metrics ? std::move(metrics) : std::make_shared<ServiceMetrics>()),
      index_(loader ? std::move(loader) : CorpusLoader([path = config_.knowledge_base_path]() {
                 return load_knowledge_base(path);
             }),
             embedder_) {}

RetrievalEngine AppContext::retrieval_engine() {
    RerankOptions options;
    options.preference_floor = config_.category_preference_floor;
    return RetrievalEngine(index_.get(), embedder_, options, metrics_.get());
}

KnowledgeBaseStats AppContext::stats() {
    return index_.get()->stats();
}

} // namespace edubot
