// ============= src/registry/batch_ingestor.cpp =============
#include "rollcall/registry/batch_ingestor.hpp"
#include "rollcall/core/errors.hpp"
#include "rollcall/registry/thread_pool.hpp"
#include <spdlog/spdlog.h>

namespace rollcall {

int ingest_priority(const SightingManifest& manifest) {
    // Los archivos con mas rostros arrancan primero
    return static_cast<int>(manifest.sightings.size());
}

// ==================== WORKER ====================

IngestWorker::IngestWorker(const RegistryConfig& config)
    : db(config.database.path, config.database.busy_timeout_ms),
      hasher(config.duplicates.hash_size),
      detector(db, hasher, SimilarityIndex::Options::from_config(config)),
      reconciler(rules, DetectionReconciler::Options::from_config(config)),
      matcher(FaceEmbeddingMatcher::make_index(config.matching.index, config.matching.embedding_dim),
              FaceEmbeddingMatcher::Options::from_config(config)),
      registry(db, matcher, reconciler) {}

IngestResult IngestWorker::ingest(const SightingManifest& manifest) {
    IngestResult result;
    result.media_path = manifest.media_path;

    auto registration = detector.register_upload(manifest.media_path, manifest.type);
    if (!registration) {
        result.error = "unreadable media or insert failed";
        spdlog::error("✗ {}: {}", manifest.media_path, result.error);
        return result;
    }

    result.media_id = registration->media_id;
    result.check = registration->check;

    if (!registration->should_process) {
        spdlog::info("{}: duplicado exacto de media {}, no se procesa",
                     manifest.media_path, registration->check.original_id.value_or(-1));
        return result;
    }

    // Pool fresco: incluye oficiales creados por otros hilos hasta ahora
    registry.load_officers();
    result.outcome = registry.process_media(registration->media_id, manifest.sightings);
    result.processed = true;
    return result;
}

// ==================== BATCH ====================

BatchIngestor::BatchIngestor(const RegistryConfig& config) : config(config) {}

IngestWorker& BatchIngestor::worker_for_current_thread() {
    std::lock_guard<std::mutex> lock(workers_mutex);
    auto& slot = workers[std::this_thread::get_id()];
    if (!slot) {
        slot = std::make_unique<IngestWorker>(config);
    }
    return *slot;
}

std::vector<IngestResult> BatchIngestor::run(const std::vector<SightingManifest>& manifests) {
    std::vector<IngestResult> results(manifests.size());
    if (manifests.empty()) return results;

    size_t threads = std::min(static_cast<size_t>(config.ingest_workers), manifests.size());
    spdlog::info("Ingesta: {} archivos con {} workers", manifests.size(), threads);

    std::vector<std::future<IngestResult>> futures;
    {
        ThreadPool pool(threads);
        for (const auto& m : manifests) {
            futures.push_back(pool.submit(ingest_priority(m), [this, &m]() {
                return worker_for_current_thread().ingest(m);
            }));
        }
        pool.wait_all();
    }

    int processed = 0, duplicates = 0, failed = 0;
    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            results[i] = futures[i].get();
        } catch (const std::exception& e) {
            results[i].media_path = manifests[i].media_path;
            results[i].error = e.what();
            spdlog::error("✗ {}: {}", manifests[i].media_path, e.what());
        }

        if (!results[i].ok()) failed++;
        else if (results[i].processed) processed++;
        else duplicates++;
    }

    // Las conexiones se cierran con el batch
    workers.clear();

    spdlog::info("✓ Ingesta completa: {} procesados, {} duplicados exactos, {} fallidos",
                 processed, duplicates, failed);
    return results;
}

} // namespace rollcall
