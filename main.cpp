// ============= main.cpp - ROLLCALL CLI =============
#include "rollcall/analysis/sighting_manifest.hpp"
#include "rollcall/core/config.hpp"
#include "rollcall/core/errors.hpp"
#include "rollcall/dedup/duplicate_detector.hpp"
#include "rollcall/registry/batch_ingestor.hpp"
#include "rollcall/registry/identity_registry.hpp"
#include "rollcall/registry/merge_manager.hpp"
#include "rollcall/vision/analysis_cache.hpp"
#include <spdlog/spdlog.h>
#include <json/json.h>
#include <atomic>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace rollcall;

std::atomic<bool> stop_signal(false);

void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        spdlog::info("Deteniendo");
        stop_signal = true;
    }
}

void print_usage(const char* prog) {
    std::cout << "USO: " << prog << " [-c config.toml] <comando> [args]\n\n";
    std::cout << "COMANDOS:\n";
    std::cout << "  check <archivo>                          Comprobar duplicado (sin escribir)\n";
    std::cout << "  ingest <manifest.json>...                Registrar y procesar archivos\n";
    std::cout << "  officer <id>                             Perfil del oficial\n";
    std::cout << "  override <officer_id> <campo> <valor|->  Override manual (- lo borra)\n";
    std::cout << "  verify <appearance_id> [actor]           Marcar aparicion como verificada\n";
    std::cout << "  suggest [umbral]                         Pares candidatos a merge\n";
    std::cout << "  merge <primary> <candidate> <conf> [actor]\n";
    std::cout << "  unmerge <merge_id> [actor]\n";
    std::cout << "  auto-merge                               Merge automatico sobre el umbral\n";
    std::cout << "  duplicates                               Grupos de duplicados exactos\n";
    std::cout << "  backfill                                 Calcular hashes faltantes\n";
    std::cout << "  cache-cleanup                            Borrar analisis de vision expirados\n";
    std::cout << "\nEJEMPLOS:\n";
    std::cout << "  " << prog << " check clips/march_01.jpg\n";
    std::cout << "  " << prog << " -c config.toml ingest manifests/*.json\n";
    std::cout << "  " << prog << " merge 12 31 0.91 moderator\n";
}

std::string to_json_string(const Json::Value& v) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    return Json::writeString(writer, v);
}

// ==================== COMANDOS ====================

int cmd_check(const RegistryConfig& config, const std::string& path) {
    RegistryDatabase db(config.database.path, config.database.busy_timeout_ms);
    ContentHasher hasher(config.duplicates.hash_size);
    DuplicateDetector detector(db, hasher, SimilarityIndex::Options::from_config(config));

    auto result = detector.check_for_duplicate(path);
    std::cout << to_json_string(result.to_json()) << std::endl;
    return result.fingerprint.readable() ? 0 : 1;
}

int cmd_ingest(const RegistryConfig& config, const std::vector<std::string>& paths) {
    std::vector<SightingManifest> manifests;
    int invalid = 0;
    for (const auto& p : paths) {
        if (stop_signal) break;
        auto m = SightingManifest::load(p);
        if (m) manifests.push_back(std::move(*m));
        else invalid++;
    }

    BatchIngestor ingestor(config);
    auto results = ingestor.run(manifests);

    int failed = invalid;
    for (const auto& r : results) {
        std::cout << std::setw(40) << std::left << r.media_path << " ";
        if (!r.ok()) {
            std::cout << "ERROR: " << r.error << "\n";
            failed++;
        } else if (!r.processed) {
            std::cout << "duplicado exacto de " << r.check.original_id.value_or(-1) << "\n";
        } else {
            std::cout << "media " << *r.media_id << ": " << r.outcome.persisted << " apariciones, "
                      << r.outcome.new_officers << " oficiales nuevos, "
                      << r.outcome.matched << " match";
            if (r.check.is_duplicate) {
                std::cout << " (similar a " << r.check.original_id.value_or(-1)
                          << ", d=" << r.check.similarity_score.value_or(-1) << ")";
            }
            std::cout << "\n";
        }
    }
    return failed == 0 ? 0 : 1;
}

int cmd_officer(const RegistryConfig& config, int64_t officer_id) {
    RegistryDatabase db(config.database.path, config.database.busy_timeout_ms);
    BadgeRules rules;
    DetectionReconciler reconciler(rules);
    FaceEmbeddingMatcher matcher(FaceEmbeddingMatcher::make_index(IndexKind::Linear, config.matching.embedding_dim),
                                 {false, config.matching.embedding_threshold, config.matching.embedding_dim});
    IdentityRegistry registry(db, matcher, reconciler);

    auto p = registry.profile(officer_id);
    if (!p) {
        std::cerr << "Oficial " << officer_id << " no encontrado" << std::endl;
        return 1;
    }

    std::cout << "\n═══════════════════════════════════════════════" << std::endl;
    std::cout << "   OFICIAL #" << officer_id;
    if (p->officer.is_merged()) std::cout << "  (fusionado en #" << *p->officer.merged_into_id << ")";
    std::cout << "\n═══════════════════════════════════════════════" << std::endl;

    for (const auto& [field, r] : p->effective) {
        std::cout << std::setw(12) << std::left << to_string(field) << ": "
                  << (r.value ? *r.value : "-");
        if (r.value) {
            std::cout << "  [" << to_string(r.source) << " " << std::fixed << std::setprecision(2)
                      << r.confidence << "]";
        }
        std::cout << std::endl;
        for (const auto& i : r.indicators) std::cout << "              · " << i << std::endl;
    }

    std::cout << "Apariciones: " << p->appearance_count;
    if (!p->merged_officer_ids.empty()) {
        std::cout << " (incluye";
        for (auto id : p->merged_officer_ids) std::cout << " #" << id;
        std::cout << ")";
    }
    std::cout << "\n" << std::endl;

    for (const auto& a : p->timeline) {
        std::cout << "  media " << std::setw(6) << a.media_id
                  << " frame " << std::setw(6) << a.frame_number.value_or(0)
                  << " oficial " << std::setw(5) << a.officer_id
                  << " conf " << std::setw(3) << a.confidence
                  << (a.verified ? "  ✓" : "") << std::endl;
    }
    return 0;
}

int cmd_override(const RegistryConfig& config, int64_t officer_id,
                 const std::string& field_name, const std::string& value) {
    auto field = field_from_string(field_name);
    if (!field) {
        std::cerr << "Campo desconocido: " << field_name << std::endl;
        return 1;
    }

    RegistryDatabase db(config.database.path, config.database.busy_timeout_ms);
    std::optional<std::string> v;
    if (value != "-") v = value;
    return db.set_officer_override(officer_id, *field, v) ? 0 : 1;
}

int cmd_verify(const RegistryConfig& config, int64_t appearance_id, const std::string& actor) {
    RegistryDatabase db(config.database.path, config.database.busy_timeout_ms);
    if (!db.verify_appearance(appearance_id, actor)) {
        std::cerr << "Aparicion " << appearance_id << " no encontrada" << std::endl;
        return 1;
    }
    return 0;
}

int cmd_suggest(const RegistryConfig& config, std::optional<float> threshold) {
    RegistryDatabase db(config.database.path, config.database.busy_timeout_ms);
    MergeManager merges(db, MergeManager::Options::from_config(config));

    auto suggestions = merges.suggest_merges(threshold);
    if (suggestions.empty()) {
        std::cout << "Sin sugerencias." << std::endl;
        return 0;
    }

    std::cout << std::setw(10) << "Primary" << std::setw(10) << "Candidate"
              << std::setw(10) << "Sim" << "  Conflictos" << std::endl;
    std::cout << std::string(60, '-') << std::endl;
    for (const auto& s : suggestions) {
        std::cout << std::setw(10) << s.primary_id << std::setw(10) << s.candidate_id
                  << std::setw(10) << std::fixed << std::setprecision(3) << s.similarity << "  ";
        for (const auto& c : s.conflicts) std::cout << c << "; ";
        std::cout << std::endl;
    }
    return 0;
}

int cmd_merge(const RegistryConfig& config, int64_t primary, int64_t candidate,
              float confidence, const std::string& actor) {
    RegistryDatabase db(config.database.path, config.database.busy_timeout_ms);
    MergeManager merges(db, MergeManager::Options::from_config(config));

    auto id = merges.merge(primary, candidate, confidence, false, actor);
    if (!id) return 1;
    std::cout << "Merge #" << *id << ": " << candidate << " -> " << primary << std::endl;
    return 0;
}

int cmd_unmerge(const RegistryConfig& config, int64_t merge_id, const std::string& actor) {
    RegistryDatabase db(config.database.path, config.database.busy_timeout_ms);
    MergeManager merges(db, MergeManager::Options::from_config(config));
    return merges.unmerge(merge_id, actor) ? 0 : 1;
}

int cmd_auto_merge(const RegistryConfig& config) {
    RegistryDatabase db(config.database.path, config.database.busy_timeout_ms);
    MergeManager merges(db, MergeManager::Options::from_config(config));

    auto stats = merges.run_auto_merge_pass("auto");
    std::cout << "Fusionados: " << stats.merged << " de " << stats.considered
              << " (" << stats.skipped_conflict << " con conflicto)" << std::endl;
    return stats.failed == 0 ? 0 : 1;
}

int cmd_duplicates(const RegistryConfig& config) {
    RegistryDatabase db(config.database.path, config.database.busy_timeout_ms);
    ContentHasher hasher(config.duplicates.hash_size);
    DuplicateDetector detector(db, hasher, SimilarityIndex::Options::from_config(config));

    Json::Value groups(Json::arrayValue);
    for (const auto& g : detector.find_all_duplicates()) groups.append(g.to_json());
    std::cout << to_json_string(groups) << std::endl;
    return 0;
}

int cmd_backfill(const RegistryConfig& config) {
    RegistryDatabase db(config.database.path, config.database.busy_timeout_ms);
    ContentHasher hasher(config.duplicates.hash_size);
    DuplicateDetector detector(db, hasher, SimilarityIndex::Options::from_config(config));

    auto stats = detector.backfill_hashes();
    std::cout << "Procesados: " << stats.processed << ", actualizados: " << stats.updated
              << ", fallidos: " << stats.failed << std::endl;
    return stats.failed == 0 ? 0 : 1;
}

int cmd_cache_cleanup(const RegistryConfig& config) {
    AnalysisCache cache(config.vision.cache_dir, config.vision.cache_ttl_days);
    int removed = cache.cleanup_expired();
    auto s = cache.stats();
    std::cout << "Eliminadas: " << removed << ", validas: " << s.valid_entries
              << " (" << std::fixed << std::setprecision(2)
              << s.total_size_bytes / (1024.0 * 1024.0) << " MB)" << std::endl;
    return 0;
}

// ==================== MAIN ====================

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    std::string config_file = "config.toml";
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if ((a == "-c" || a == "--config") && i + 1 < argc) {
            config_file = argv[++i];
        } else if (a == "-h" || a == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            args.push_back(a);
        }
    }

    if (args.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    RegistryConfig config = RegistryConfig::from_file(config_file);
    setup_logging(config.log_level);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    const std::string& cmd = args[0];
    auto arg = [&args](size_t i, const std::string& def = "") {
        return i < args.size() ? args[i] : def;
    };

    try {
        if (cmd == "check" && args.size() >= 2) {
            return cmd_check(config, args[1]);
        }
        if (cmd == "ingest" && args.size() >= 2) {
            return cmd_ingest(config, std::vector<std::string>(args.begin() + 1, args.end()));
        }
        if (cmd == "officer" && args.size() >= 2) {
            return cmd_officer(config, std::stoll(args[1]));
        }
        if (cmd == "override" && args.size() >= 4) {
            return cmd_override(config, std::stoll(args[1]), args[2], args[3]);
        }
        if (cmd == "verify" && args.size() >= 2) {
            return cmd_verify(config, std::stoll(args[1]), arg(2, "operator"));
        }
        if (cmd == "suggest") {
            std::optional<float> threshold;
            if (args.size() >= 2) threshold = std::stof(args[1]);
            return cmd_suggest(config, threshold);
        }
        if (cmd == "merge" && args.size() >= 4) {
            return cmd_merge(config, std::stoll(args[1]), std::stoll(args[2]),
                             std::stof(args[3]), arg(4, "operator"));
        }
        if (cmd == "unmerge" && args.size() >= 2) {
            return cmd_unmerge(config, std::stoll(args[1]), arg(2, "operator"));
        }
        if (cmd == "auto-merge") return cmd_auto_merge(config);
        if (cmd == "duplicates") return cmd_duplicates(config);
        if (cmd == "backfill") return cmd_backfill(config);
        if (cmd == "cache-cleanup") return cmd_cache_cleanup(config);

    } catch (const ConsistencyError& e) {
        spdlog::error("Operacion rechazada: {}", e.what());
        return 2;
    } catch (const RegistryError& e) {
        spdlog::error("Error del registro: {}", e.what());
        return 1;
    } catch (const std::invalid_argument& e) {
        spdlog::error("Argumento invalido: {}", e.what());
        return 1;
    } catch (const std::out_of_range& e) {
        spdlog::error("Argumento fuera de rango: {}", e.what());
        return 1;
    }

    print_usage(argv[0]);
    return 1;
}
