// ============= include/rollcall/registry/batch_ingestor.hpp =============
/*
 * Batch Ingestor - varios archivos en paralelo
 *
 * - Un ThreadPool de ingest_workers hilos
 * - Cada hilo abre SU conexion a la BD y su propio registro/matcher
 * - Dentro de un archivo: rostros en orden, secuencial
 * - Duplicado exacto: se registra pero no se procesa
 *
 * Dos hilos pueden crear dos oficiales para la misma persona si la ven a
 * la vez; eso se resuelve despues con el flujo de merge.
 */

#pragma once
#include "rollcall/analysis/sighting_manifest.hpp"
#include "rollcall/core/config.hpp"
#include "rollcall/dedup/duplicate_detector.hpp"
#include "rollcall/registry/identity_registry.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace rollcall {

struct IngestResult {
    std::string media_path;
    std::optional<int64_t> media_id;
    DuplicateCheckResult check;
    bool processed = false;
    MediaOutcome outcome;
    std::string error;

    bool ok() const { return error.empty(); }
};

// Todo lo que un hilo necesita para ingerir un archivo
class IngestWorker {
public:
    explicit IngestWorker(const RegistryConfig& config);

    IngestResult ingest(const SightingManifest& manifest);

    RegistryDatabase& get_database() { return db; }
    IdentityRegistry& get_registry() { return registry; }

private:
    RegistryDatabase db;
    ContentHasher hasher;
    DuplicateDetector detector;
    BadgeRules rules;
    DetectionReconciler reconciler;
    FaceEmbeddingMatcher matcher;
    IdentityRegistry registry;
};

// Prioridad en el ThreadPool: mas rostros = antes
int ingest_priority(const SightingManifest& manifest);

class BatchIngestor {
public:
    explicit BatchIngestor(const RegistryConfig& config);

    std::vector<IngestResult> run(const std::vector<SightingManifest>& manifests);

private:
    RegistryConfig config;
    std::mutex workers_mutex;
    std::map<std::thread::id, std::unique_ptr<IngestWorker>> workers;

    IngestWorker& worker_for_current_thread();
};

} // namespace rollcall
