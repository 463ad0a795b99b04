// ============= include/rollcall/database/records.hpp =============
/*
 * Registros persistentes
 *
 * TABLAS:
 * ├── media                 archivos subidos + huellas + relacion de duplicado
 * ├── officers              identidades (nunca se borran; merged_into_id)
 * ├── officer_appearances   un avistamiento por rostro detectado
 * ├── appearance_fields     resultado reconciliado por campo
 * └── officer_merges        auditoria append-only de merges
 */

#pragma once
#include "rollcall/hashing/content_hasher.hpp"
#include "rollcall/matching/embedding.hpp"
#include "rollcall/reconcile/field_result.hpp"
#include <opencv2/core.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rollcall {

enum class DuplicateType { Exact, Similar };

const char* to_string(DuplicateType type);
std::optional<DuplicateType> duplicate_type_from_string(const std::string& name);

struct MediaRecord {
    int64_t id = -1;
    std::string path;
    MediaType type = MediaType::Other;
    std::optional<std::string> content_hash;
    std::optional<std::string> perceptual_hash;
    int64_t file_size = 0;

    bool is_duplicate = false;
    std::optional<int64_t> duplicate_of_id;
    std::optional<DuplicateType> duplicate_type;
    std::optional<int> similarity_distance;

    bool processed = false;
    std::string created_at;
};

struct OfficerRecord {
    int64_t id = -1;

    FieldMap detected;        // badge, force, rank, name, unit
    OverrideMap overrides;    // badge, force, rank, name, unit

    Embedding face_embedding; // vacio = sin embedding
    float embedding_quality = 0.0f;
    std::optional<std::string> primary_crop_path;

    std::optional<int64_t> merged_into_id;
    std::optional<float> merge_confidence;
    std::optional<std::string> merged_at;

    std::string created_at;
    std::string updated_at;

    bool is_merged() const { return merged_into_id.has_value(); }
};

// Campos que se guardan a nivel de oficial
const std::vector<Field>& officer_fields();

struct AppearanceRecord {
    int64_t id = -1;
    int64_t officer_id = -1;
    int64_t media_id = -1;

    std::optional<int> frame_number;
    std::optional<double> timestamp_seconds;
    cv::Rect bbox;
    std::optional<std::string> image_crop_path;
    Embedding face_embedding;

    std::optional<std::string> ocr_badge_text;
    float ocr_badge_confidence = 0.0f;
    std::optional<std::string> ocr_name_text;
    float ocr_name_confidence = 0.0f;

    FieldMap fields;          // salida del reconciliador
    OverrideMap overrides;    // badge, name, force, rank, role
    std::string notes;

    int confidence = 0;                // 0-100
    std::string confidence_factors;    // JSON

    bool verified = false;
    std::optional<std::string> verified_at;
    std::optional<std::string> verified_by;

    std::string created_at;
};

struct MergeRecord {
    int64_t id = -1;
    int64_t primary_officer_id = -1;
    int64_t merged_officer_id = -1;
    float merge_confidence = 0.0f;
    bool auto_merged = false;
    std::string merged_at;
    std::optional<std::string> merged_by;

    bool unmerged = false;
    std::optional<std::string> unmerged_at;
    std::optional<std::string> unmerged_by;
};

// Effective (override-aware) field values for stored records.
FieldResult effective_value(const OfficerRecord& officer, Field field);
FieldResult effective_value(const AppearanceRecord& appearance, Field field);

// Conteo de oficiales por fuerza efectiva ("Unknown" sin valor), mayor primero
std::vector<std::pair<std::string, int>> force_distribution(const std::vector<OfficerRecord>& officers);

} // namespace rollcall
