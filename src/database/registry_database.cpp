// ============= src/database/registry_database.cpp =============
#include "rollcall/database/registry_database.hpp"
#include "rollcall/core/errors.hpp"
#include "rollcall/core/utils.hpp"
#include <json/json.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <sstream>

namespace rollcall {

namespace {

// prepare/finalize con RAII; los errores se loguean con el mensaje de SQLite
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db(db), stmt(nullptr) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            spdlog::error("Failed to prepare statement: {}", sqlite3_errmsg(db));
            stmt = nullptr;
        }
    }
    ~Statement() {
        if (stmt) sqlite3_finalize(stmt);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return stmt != nullptr; }

    void bind_int64(int i, int64_t v) { sqlite3_bind_int64(stmt, i, v); }
    void bind_double(int i, double v) { sqlite3_bind_double(stmt, i, v); }
    void bind_null(int i) { sqlite3_bind_null(stmt, i); }
    void bind_text(int i, const std::string& v) {
        sqlite3_bind_text(stmt, i, v.c_str(), -1, SQLITE_TRANSIENT);
    }
    void bind_text(int i, const std::optional<std::string>& v) {
        if (v) bind_text(i, *v); else bind_null(i);
    }
    void bind_int64(int i, const std::optional<int64_t>& v) {
        if (v) bind_int64(i, *v); else bind_null(i);
    }
    void bind_embedding(int i, const Embedding& emb) {
        if (emb.empty()) {
            bind_null(i);
            return;
        }
        auto blob = serialize_embedding(emb);
        sqlite3_bind_blob(stmt, i, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
    }

    bool row() { return sqlite3_step(stmt) == SQLITE_ROW; }

    bool run() {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_DONE) {
            spdlog::error("SQL step failed: {}", sqlite3_errmsg(db));
            return false;
        }
        return true;
    }

    bool is_null(int i) { return sqlite3_column_type(stmt, i) == SQLITE_NULL; }
    int64_t int64(int i) { return sqlite3_column_int64(stmt, i); }
    double dbl(int i) { return sqlite3_column_double(stmt, i); }
    std::string text(int i) {
        const unsigned char* t = sqlite3_column_text(stmt, i);
        return t ? reinterpret_cast<const char*>(t) : "";
    }
    std::optional<std::string> opt_text(int i) {
        if (is_null(i)) return std::nullopt;
        return text(i);
    }
    std::optional<int64_t> opt_int64(int i) {
        if (is_null(i)) return std::nullopt;
        return int64(i);
    }
    Embedding embedding(int i) {
        if (is_null(i)) return {};
        return deserialize_embedding(sqlite3_column_blob(stmt, i), sqlite3_column_bytes(stmt, i));
    }

private:
    sqlite3* db;
    sqlite3_stmt* stmt;
};

// Columnas por campo de oficial: valor, confianza, fuente, override
struct OfficerColumns {
    Field field;
    const char* value;
    const char* confidence;
    const char* source;
    const char* override_col;
};

const std::vector<OfficerColumns>& officer_columns() {
    static const std::vector<OfficerColumns> cols = {
        {Field::Badge, "badge_number", "badge_confidence", "badge_source", "badge_override"},
        {Field::Force, "force", "force_confidence", "force_source", "force_override"},
        {Field::Rank,  "rank",  "rank_confidence",  "rank_source",  "rank_override"},
        {Field::Name,  "name",  "name_confidence",  "name_source",  "name_override"},
        {Field::Unit,  "unit",  "unit_confidence",  "unit_source",  "unit_override"},
    };
    return cols;
}

const char* appearance_override_column(Field field) {
    switch (field) {
        case Field::Badge: return "badge_override";
        case Field::Name:  return "name_override";
        case Field::Force: return "force_override";
        case Field::Rank:  return "rank_override";
        case Field::Role:  return "role_override";
        default:           return nullptr;
    }
}

const std::vector<Field>& appearance_override_fields() {
    static const std::vector<Field> fields = {
        Field::Badge, Field::Name, Field::Force, Field::Rank, Field::Role
    };
    return fields;
}

// Columnas de oficial en el orden de los SELECT
std::string officer_select_columns() {
    std::string cols = "id";
    for (const auto& c : officer_columns()) {
        cols += std::string(", ") + c.value + ", " + c.confidence + ", " + c.source;
    }
    for (const auto& c : officer_columns()) {
        cols += std::string(", ") + c.override_col;
    }
    cols += ", face_embedding, embedding_quality, primary_crop_path,"
            " merged_into_id, merge_confidence, merged_at, created_at, updated_at";
    return cols;
}

OfficerRecord read_officer(Statement& stmt) {
    OfficerRecord o;
    int col = 0;
    o.id = stmt.int64(col++);

    for (const auto& c : officer_columns()) {
        auto value = stmt.opt_text(col++);
        float conf = static_cast<float>(stmt.dbl(col++));
        auto source = stmt.opt_text(col++);
        if (value) {
            o.detected[c.field] = FieldResult::of(*value, conf, source_from_string(source.value_or("")));
        }
    }
    for (const auto& c : officer_columns()) {
        auto value = stmt.opt_text(col++);
        if (value && !value->empty()) {
            o.overrides[c.field] = *value;
        }
    }

    o.face_embedding = stmt.embedding(col++);
    o.embedding_quality = static_cast<float>(stmt.dbl(col++));
    o.primary_crop_path = stmt.opt_text(col++);
    o.merged_into_id = stmt.opt_int64(col++);
    if (!stmt.is_null(col)) o.merge_confidence = static_cast<float>(stmt.dbl(col));
    col++;
    o.merged_at = stmt.opt_text(col++);
    o.created_at = stmt.text(col++);
    o.updated_at = stmt.text(col++);
    return o;
}

const char* MEDIA_COLUMNS =
    "id, path, media_type, content_hash, perceptual_hash, file_size, is_duplicate,"
    " duplicate_of_id, duplicate_type, similarity_distance, processed, created_at";

MediaRecord read_media(Statement& stmt) {
    MediaRecord m;
    m.id = stmt.int64(0);
    m.path = stmt.text(1);
    m.type = media_type_from_string(stmt.text(2));
    m.content_hash = stmt.opt_text(3);
    m.perceptual_hash = stmt.opt_text(4);
    m.file_size = stmt.int64(5);
    m.is_duplicate = stmt.int64(6) != 0;
    m.duplicate_of_id = stmt.opt_int64(7);
    if (auto t = stmt.opt_text(8)) m.duplicate_type = duplicate_type_from_string(*t);
    if (!stmt.is_null(9)) m.similarity_distance = static_cast<int>(stmt.int64(9));
    m.processed = stmt.int64(10) != 0;
    m.created_at = stmt.text(11);
    return m;
}

const char* APPEARANCE_COLUMNS =
    "id, officer_id, media_id, frame_number, timestamp_in_video,"
    " bbox_x, bbox_y, bbox_w, bbox_h, image_crop_path, face_embedding,"
    " ocr_badge_result, ocr_badge_confidence, ocr_name_result, ocr_name_confidence,"
    " badge_override, name_override, force_override, rank_override, role_override,"
    " notes, confidence, confidence_factors, verified, verified_at, verified_by, created_at";

AppearanceRecord read_appearance(Statement& stmt) {
    AppearanceRecord a;
    a.id = stmt.int64(0);
    a.officer_id = stmt.int64(1);
    a.media_id = stmt.int64(2);
    if (!stmt.is_null(3)) a.frame_number = static_cast<int>(stmt.int64(3));
    if (!stmt.is_null(4)) a.timestamp_seconds = stmt.dbl(4);
    a.bbox = cv::Rect(static_cast<int>(stmt.int64(5)), static_cast<int>(stmt.int64(6)),
                      static_cast<int>(stmt.int64(7)), static_cast<int>(stmt.int64(8)));
    a.image_crop_path = stmt.opt_text(9);
    a.face_embedding = stmt.embedding(10);
    a.ocr_badge_text = stmt.opt_text(11);
    a.ocr_badge_confidence = static_cast<float>(stmt.dbl(12));
    a.ocr_name_text = stmt.opt_text(13);
    a.ocr_name_confidence = static_cast<float>(stmt.dbl(14));

    int col = 15;
    for (Field f : appearance_override_fields()) {
        auto v = stmt.opt_text(col++);
        if (v && !v->empty()) a.overrides[f] = *v;
    }

    a.notes = stmt.text(20);
    a.confidence = static_cast<int>(stmt.int64(21));
    a.confidence_factors = stmt.text(22);
    a.verified = stmt.int64(23) != 0;
    a.verified_at = stmt.opt_text(24);
    a.verified_by = stmt.opt_text(25);
    a.created_at = stmt.text(26);
    return a;
}

const char* MERGE_COLUMNS =
    "id, primary_officer_id, merged_officer_id, merge_confidence, auto_merged,"
    " merged_at, merged_by, unmerged, unmerged_at, unmerged_by";

MergeRecord read_merge(Statement& stmt) {
    MergeRecord m;
    m.id = stmt.int64(0);
    m.primary_officer_id = stmt.int64(1);
    m.merged_officer_id = stmt.int64(2);
    m.merge_confidence = static_cast<float>(stmt.dbl(3));
    m.auto_merged = stmt.int64(4) != 0;
    m.merged_at = stmt.text(5);
    m.merged_by = stmt.opt_text(6);
    m.unmerged = stmt.int64(7) != 0;
    m.unmerged_at = stmt.opt_text(8);
    m.unmerged_by = stmt.opt_text(9);
    return m;
}

std::string indicators_to_json(const std::vector<std::string>& indicators) {
    Json::Value arr(Json::arrayValue);
    for (const auto& i : indicators) arr.append(i);

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, arr);
}

std::vector<std::string> indicators_from_json(const std::string& text) {
    std::vector<std::string> out;
    if (text.empty()) return out;

    Json::Value root;
    Json::CharReaderBuilder reader;
    std::string errs;
    std::istringstream in(text);
    if (!Json::parseFromStream(reader, in, &root, &errs) || !root.isArray()) {
        spdlog::warn("appearance_fields: indicadores invalidos ({})", errs);
        return out;
    }
    for (const auto& v : root) {
        if (v.isString()) out.push_back(v.asString());
    }
    return out;
}

} // namespace

// ==================== CONSTRUCTOR/DESTRUCTOR ====================

RegistryDatabase::RegistryDatabase(const std::string& db_path, int busy_timeout_ms)
    : db(nullptr), db_path(db_path)
{
    spdlog::info("Inicializando Registry Database");
    spdlog::info("   Path: {}", db_path);

    if (db_path != ":memory:") {
        std::filesystem::path p(db_path);
        if (!p.parent_path().empty()) {
            std::error_code ec;
            std::filesystem::create_directories(p.parent_path(), ec);
            if (ec) {
                throw RegistryError("No se pudo crear directorio: " + p.parent_path().string());
            }
        }
    }

    if (!init_database(busy_timeout_ms)) {
        if (db) {
            sqlite3_close(db);
            db = nullptr;
        }
        throw RegistryError("No se pudo inicializar la base de datos: " + db_path);
    }

    spdlog::info("Registry ready ({} officers, {} media)", count_officers(false), count_media());
}

RegistryDatabase::~RegistryDatabase() {
    if (db) {
        sqlite3_close(db);
    }
}

// ==================== INITIALIZATION ====================

bool RegistryDatabase::init_database(int busy_timeout_ms) {
    int rc = sqlite3_open(db_path.c_str(), &db);
    if (rc != SQLITE_OK) {
        spdlog::error("Cannot open database: {}", sqlite3_errmsg(db));
        return false;
    }

    sqlite3_busy_timeout(db, busy_timeout_ms);

    if (!exec("PRAGMA journal_mode=WAL;") ||
        !exec("PRAGMA synchronous=NORMAL;") ||
        !exec("PRAGMA foreign_keys=ON;")) {
        return false;
    }

    return create_tables();
}

bool RegistryDatabase::exec(const char* sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);

    if (rc != SQLITE_OK) {
        spdlog::error("SQL error: {}", err_msg ? err_msg : sqlite3_errmsg(db));
        sqlite3_free(err_msg);
        return false;
    }
    return true;
}

bool RegistryDatabase::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS media (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            path TEXT NOT NULL,
            media_type TEXT NOT NULL,
            content_hash TEXT,
            perceptual_hash TEXT,
            file_size INTEGER DEFAULT 0,
            is_duplicate INTEGER NOT NULL DEFAULT 0,
            duplicate_of_id INTEGER REFERENCES media(id),
            duplicate_type TEXT,
            similarity_distance INTEGER,
            processed INTEGER NOT NULL DEFAULT 0,
            created_at TEXT NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_media_content_hash ON media(content_hash);
        CREATE INDEX IF NOT EXISTS idx_media_perceptual_hash ON media(perceptual_hash);

        CREATE TABLE IF NOT EXISTS officers (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            badge_number TEXT, badge_confidence REAL DEFAULT 0, badge_source TEXT,
            force TEXT, force_confidence REAL DEFAULT 0, force_source TEXT,
            rank TEXT, rank_confidence REAL DEFAULT 0, rank_source TEXT,
            name TEXT, name_confidence REAL DEFAULT 0, name_source TEXT,
            unit TEXT, unit_confidence REAL DEFAULT 0, unit_source TEXT,
            badge_override TEXT,
            force_override TEXT,
            rank_override TEXT,
            name_override TEXT,
            unit_override TEXT,
            face_embedding BLOB,
            embedding_quality REAL DEFAULT 0,
            primary_crop_path TEXT,
            merged_into_id INTEGER REFERENCES officers(id),
            merge_confidence REAL,
            merged_at TEXT,
            created_at TEXT NOT NULL,
            updated_at TEXT NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_officers_merged_into ON officers(merged_into_id);

        CREATE TABLE IF NOT EXISTS officer_appearances (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            officer_id INTEGER NOT NULL REFERENCES officers(id),
            media_id INTEGER NOT NULL REFERENCES media(id),
            frame_number INTEGER,
            timestamp_in_video REAL,
            bbox_x INTEGER, bbox_y INTEGER, bbox_w INTEGER, bbox_h INTEGER,
            image_crop_path TEXT,
            face_embedding BLOB,
            ocr_badge_result TEXT, ocr_badge_confidence REAL DEFAULT 0,
            ocr_name_result TEXT, ocr_name_confidence REAL DEFAULT 0,
            badge_override TEXT,
            name_override TEXT,
            force_override TEXT,
            rank_override TEXT,
            role_override TEXT,
            notes TEXT,
            confidence INTEGER DEFAULT 0,
            confidence_factors TEXT,
            verified INTEGER NOT NULL DEFAULT 0,
            verified_at TEXT,
            verified_by TEXT,
            created_at TEXT NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_appearances_officer ON officer_appearances(officer_id);
        CREATE INDEX IF NOT EXISTS idx_appearances_media ON officer_appearances(media_id);

        CREATE TABLE IF NOT EXISTS appearance_fields (
            appearance_id INTEGER NOT NULL REFERENCES officer_appearances(id),
            field TEXT NOT NULL,
            value TEXT,
            confidence REAL DEFAULT 0,
            source TEXT NOT NULL,
            indicators TEXT,
            PRIMARY KEY (appearance_id, field)
        );

        CREATE TABLE IF NOT EXISTS officer_merges (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            primary_officer_id INTEGER NOT NULL REFERENCES officers(id),
            merged_officer_id INTEGER NOT NULL REFERENCES officers(id),
            merge_confidence REAL NOT NULL,
            auto_merged INTEGER NOT NULL DEFAULT 0,
            merged_at TEXT NOT NULL,
            merged_by TEXT,
            unmerged INTEGER NOT NULL DEFAULT 0,
            unmerged_at TEXT,
            unmerged_by TEXT
        );
        CREATE INDEX IF NOT EXISTS idx_merges_primary ON officer_merges(primary_officer_id);
        CREATE INDEX IF NOT EXISTS idx_merges_merged ON officer_merges(merged_officer_id);

        CREATE TRIGGER IF NOT EXISTS officer_merges_immutable
        BEFORE UPDATE OF primary_officer_id, merged_officer_id, merge_confidence,
                         auto_merged, merged_at, merged_by ON officer_merges
        BEGIN
            SELECT RAISE(ABORT, 'officer_merges rows are immutable');
        END;

        CREATE TRIGGER IF NOT EXISTS officer_merges_no_delete
        BEFORE DELETE ON officer_merges
        BEGIN
            SELECT RAISE(ABORT, 'officer_merges rows cannot be deleted');
        END;

        CREATE TRIGGER IF NOT EXISTS officers_no_delete
        BEFORE DELETE ON officers
        BEGIN
            SELECT RAISE(ABORT, 'officers are never deleted');
        END;
    )";

    return exec(sql);
}

// ==================== TRANSACTION ====================

RegistryDatabase::Transaction::Transaction(RegistryDatabase& db) : db(db), active(false) {
    if (!db.exec("BEGIN IMMEDIATE;")) {
        throw RegistryError("No se pudo iniciar la transaccion");
    }
    active = true;
}

RegistryDatabase::Transaction::~Transaction() {
    if (active) {
        spdlog::warn("Transaction rollback");
        db.exec("ROLLBACK;");
    }
}

bool RegistryDatabase::Transaction::commit() {
    if (!active) return false;
    if (!db.exec("COMMIT;")) {
        return false;
    }
    active = false;
    return true;
}

// ==================== MEDIA ====================

std::optional<int64_t> RegistryDatabase::insert_media(const MediaRecord& media) {
    Statement stmt(db,
        "INSERT INTO media (path, media_type, content_hash, perceptual_hash, file_size,"
        " is_duplicate, duplicate_of_id, duplicate_type, similarity_distance, processed, created_at)"
        " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    if (!stmt.ok()) return std::nullopt;

    stmt.bind_text(1, media.path);
    stmt.bind_text(2, std::string(to_string(media.type)));
    stmt.bind_text(3, media.content_hash);
    stmt.bind_text(4, media.perceptual_hash);
    stmt.bind_int64(5, media.file_size);
    stmt.bind_int64(6, media.is_duplicate ? 1 : 0);
    stmt.bind_int64(7, media.duplicate_of_id);
    if (media.duplicate_type) stmt.bind_text(8, std::string(to_string(*media.duplicate_type)));
    else stmt.bind_null(8);
    if (media.similarity_distance) stmt.bind_int64(9, *media.similarity_distance);
    else stmt.bind_null(9);
    stmt.bind_int64(10, media.processed ? 1 : 0);
    stmt.bind_text(11, media.created_at.empty() ? now_timestamp() : media.created_at);

    if (!stmt.run()) return std::nullopt;
    return sqlite3_last_insert_rowid(db);
}

std::optional<MediaRecord> RegistryDatabase::get_media(int64_t media_id) {
    Statement stmt(db, std::string("SELECT ") + MEDIA_COLUMNS + " FROM media WHERE id = ?");
    if (!stmt.ok()) return std::nullopt;

    stmt.bind_int64(1, media_id);
    if (!stmt.row()) return std::nullopt;
    return read_media(stmt);
}

bool RegistryDatabase::update_media_fingerprint(int64_t media_id, const MediaFingerprint& fp) {
    Statement stmt(db,
        "UPDATE media SET content_hash = ?, perceptual_hash = ?, file_size = ? WHERE id = ?");
    if (!stmt.ok()) return false;

    stmt.bind_text(1, fp.content_hash);
    stmt.bind_text(2, fp.perceptual_hash);
    stmt.bind_int64(3, fp.file_size);
    stmt.bind_int64(4, media_id);
    return stmt.run();
}

bool RegistryDatabase::mark_media_processed(int64_t media_id) {
    Statement stmt(db, "UPDATE media SET processed = 1 WHERE id = ?");
    if (!stmt.ok()) return false;
    stmt.bind_int64(1, media_id);
    return stmt.run();
}

std::vector<MediaRecord> RegistryDatabase::media_missing_hashes(int64_t after_id, int limit) {
    std::vector<MediaRecord> records;

    Statement stmt(db, std::string("SELECT ") + MEDIA_COLUMNS +
        " FROM media WHERE id > ? AND content_hash IS NULL ORDER BY id LIMIT ?");
    if (!stmt.ok()) return records;

    stmt.bind_int64(1, after_id);
    stmt.bind_int64(2, limit);
    while (stmt.row()) {
        records.push_back(read_media(stmt));
    }
    return records;
}

std::vector<std::pair<std::string, std::vector<int64_t>>> RegistryDatabase::shared_content_hashes() {
    std::vector<std::pair<std::string, std::vector<int64_t>>> groups;

    Statement stmt(db,
        "SELECT content_hash, id FROM media"
        " WHERE content_hash IN ("
        "   SELECT content_hash FROM media WHERE content_hash IS NOT NULL AND content_hash != ''"
        "   GROUP BY content_hash HAVING COUNT(*) > 1)"
        " ORDER BY content_hash, id");
    if (!stmt.ok()) return groups;

    while (stmt.row()) {
        std::string hash = stmt.text(0);
        if (groups.empty() || groups.back().first != hash) {
            groups.emplace_back(hash, std::vector<int64_t>{});
        }
        groups.back().second.push_back(stmt.int64(1));
    }
    return groups;
}

int RegistryDatabase::count_media() {
    Statement stmt(db, "SELECT COUNT(*) FROM media");
    if (!stmt.ok() || !stmt.row()) return 0;
    return static_cast<int>(stmt.int64(0));
}

// ==================== FINGERPRINT STORE ====================

std::optional<int64_t> RegistryDatabase::find_original_by_content_hash(const std::string& content_hash) {
    Statement stmt(db,
        "SELECT id FROM media WHERE content_hash = ? AND is_duplicate = 0 ORDER BY id LIMIT 1");
    if (!stmt.ok()) return std::nullopt;

    stmt.bind_text(1, content_hash);
    if (!stmt.row()) return std::nullopt;
    return stmt.int64(0);
}

std::vector<HashCandidate> RegistryDatabase::image_hash_batch(int64_t after_id, int limit) {
    std::vector<HashCandidate> batch;

    Statement stmt(db,
        "SELECT id, perceptual_hash FROM media"
        " WHERE id > ? AND is_duplicate = 0 AND media_type = 'image'"
        " AND perceptual_hash IS NOT NULL AND perceptual_hash != ''"
        " ORDER BY id LIMIT ?");
    if (!stmt.ok()) return batch;

    stmt.bind_int64(1, after_id);
    stmt.bind_int64(2, limit);
    while (stmt.row()) {
        batch.push_back({stmt.int64(0), stmt.text(1)});
    }
    return batch;
}

// ==================== OFFICERS ====================

std::optional<int64_t> RegistryDatabase::insert_officer(const OfficerRecord& officer) {
    std::string cols, marks;
    for (const auto& c : officer_columns()) {
        cols += std::string(c.value) + ", " + c.confidence + ", " + c.source + ", ";
        marks += "?, ?, ?, ";
    }
    for (const auto& c : officer_columns()) {
        cols += std::string(c.override_col) + ", ";
        marks += "?, ";
    }
    cols += "face_embedding, embedding_quality, primary_crop_path, created_at, updated_at";
    marks += "?, ?, ?, ?, ?";

    Statement stmt(db, "INSERT INTO officers (" + cols + ") VALUES (" + marks + ")");
    if (!stmt.ok()) return std::nullopt;

    int i = 1;
    for (const auto& c : officer_columns()) {
        auto it = officer.detected.find(c.field);
        if (it != officer.detected.end() && it->second.has_value()) {
            stmt.bind_text(i++, it->second.value);
            stmt.bind_double(i++, it->second.confidence);
            stmt.bind_text(i++, std::string(to_string(it->second.source)));
        } else {
            stmt.bind_null(i++);
            stmt.bind_double(i++, 0.0);
            stmt.bind_null(i++);
        }
    }
    for (const auto& c : officer_columns()) {
        auto it = officer.overrides.find(c.field);
        if (it != officer.overrides.end()) stmt.bind_text(i++, it->second);
        else stmt.bind_null(i++);
    }

    std::string now = now_timestamp();
    stmt.bind_embedding(i++, officer.face_embedding);
    stmt.bind_double(i++, officer.embedding_quality);
    stmt.bind_text(i++, officer.primary_crop_path);
    stmt.bind_text(i++, officer.created_at.empty() ? now : officer.created_at);
    stmt.bind_text(i++, now);

    if (!stmt.run()) return std::nullopt;
    return sqlite3_last_insert_rowid(db);
}

bool RegistryDatabase::update_officer(const OfficerRecord& officer) {
    std::string sets;
    for (const auto& c : officer_columns()) {
        sets += std::string(c.value) + " = ?, " + c.confidence + " = ?, " + c.source + " = ?, ";
    }
    sets += "face_embedding = ?, embedding_quality = ?, primary_crop_path = ?, updated_at = ?";

    Statement stmt(db, "UPDATE officers SET " + sets + " WHERE id = ?");
    if (!stmt.ok()) return false;

    int i = 1;
    for (const auto& c : officer_columns()) {
        auto it = officer.detected.find(c.field);
        if (it != officer.detected.end() && it->second.has_value()) {
            stmt.bind_text(i++, it->second.value);
            stmt.bind_double(i++, it->second.confidence);
            stmt.bind_text(i++, std::string(to_string(it->second.source)));
        } else {
            stmt.bind_null(i++);
            stmt.bind_double(i++, 0.0);
            stmt.bind_null(i++);
        }
    }
    stmt.bind_embedding(i++, officer.face_embedding);
    stmt.bind_double(i++, officer.embedding_quality);
    stmt.bind_text(i++, officer.primary_crop_path);
    stmt.bind_text(i++, now_timestamp());
    stmt.bind_int64(i++, officer.id);

    if (!stmt.run()) return false;
    return sqlite3_changes(db) == 1;
}

std::optional<OfficerRecord> RegistryDatabase::get_officer(int64_t officer_id) {
    Statement stmt(db, "SELECT " + officer_select_columns() + " FROM officers WHERE id = ?");
    if (!stmt.ok()) return std::nullopt;

    stmt.bind_int64(1, officer_id);
    if (!stmt.row()) return std::nullopt;
    return read_officer(stmt);
}

std::vector<OfficerRecord> RegistryDatabase::list_officers(bool active_only) {
    std::vector<OfficerRecord> officers;

    std::string sql = "SELECT " + officer_select_columns() + " FROM officers";
    if (active_only) sql += " WHERE merged_into_id IS NULL";
    sql += " ORDER BY id";

    Statement stmt(db, sql);
    if (!stmt.ok()) return officers;

    while (stmt.row()) {
        officers.push_back(read_officer(stmt));
    }
    return officers;
}

std::vector<std::pair<int64_t, Embedding>> RegistryDatabase::active_officer_embeddings() {
    std::vector<std::pair<int64_t, Embedding>> out;

    Statement stmt(db,
        "SELECT id, face_embedding FROM officers"
        " WHERE merged_into_id IS NULL AND face_embedding IS NOT NULL ORDER BY id");
    if (!stmt.ok()) return out;

    while (stmt.row()) {
        out.emplace_back(stmt.int64(0), stmt.embedding(1));
    }
    return out;
}

bool RegistryDatabase::officer_exists(int64_t officer_id) {
    Statement stmt(db, "SELECT 1 FROM officers WHERE id = ?");
    if (!stmt.ok()) return false;
    stmt.bind_int64(1, officer_id);
    return stmt.row();
}

bool RegistryDatabase::set_officer_override(int64_t officer_id, Field field,
                                            const std::optional<std::string>& value) {
    const char* column = nullptr;
    for (const auto& c : officer_columns()) {
        if (c.field == field) column = c.override_col;
    }
    if (!column) {
        spdlog::error("Campo '{}' no admite override de oficial", to_string(field));
        return false;
    }

    Statement stmt(db, std::string("UPDATE officers SET ") + column + " = ?, updated_at = ? WHERE id = ?");
    if (!stmt.ok()) return false;

    stmt.bind_text(1, value);
    stmt.bind_text(2, now_timestamp());
    stmt.bind_int64(3, officer_id);
    if (!stmt.run()) return false;
    return sqlite3_changes(db) == 1;
}

bool RegistryDatabase::set_merge_state(int64_t officer_id,
                                       std::optional<int64_t> merged_into_id,
                                       std::optional<float> merge_confidence,
                                       std::optional<std::string> merged_at) {
    Statement stmt(db,
        "UPDATE officers SET merged_into_id = ?, merge_confidence = ?, merged_at = ?, updated_at = ?"
        " WHERE id = ?");
    if (!stmt.ok()) return false;

    stmt.bind_int64(1, merged_into_id);
    if (merge_confidence) stmt.bind_double(2, *merge_confidence);
    else stmt.bind_null(2);
    stmt.bind_text(3, merged_at);
    stmt.bind_text(4, now_timestamp());
    stmt.bind_int64(5, officer_id);

    if (!stmt.run()) return false;
    return sqlite3_changes(db) == 1;
}

std::vector<int64_t> RegistryDatabase::officers_merged_into(int64_t primary_id) {
    std::vector<int64_t> ids;

    Statement stmt(db, "SELECT id FROM officers WHERE merged_into_id = ? ORDER BY id");
    if (!stmt.ok()) return ids;

    stmt.bind_int64(1, primary_id);
    while (stmt.row()) {
        ids.push_back(stmt.int64(0));
    }
    return ids;
}

int RegistryDatabase::count_officers(bool active_only) {
    Statement stmt(db, active_only
        ? "SELECT COUNT(*) FROM officers WHERE merged_into_id IS NULL"
        : "SELECT COUNT(*) FROM officers");
    if (!stmt.ok() || !stmt.row()) return 0;
    return static_cast<int>(stmt.int64(0));
}

// ==================== APPEARANCES ====================

std::optional<int64_t> RegistryDatabase::insert_appearance(const AppearanceRecord& appearance) {
    if (appearance.officer_id < 0 || !officer_exists(appearance.officer_id)) {
        throw ConsistencyError("appearance references officer " +
                               std::to_string(appearance.officer_id) + " which is not persisted");
    }

    Statement stmt(db,
        "INSERT INTO officer_appearances (officer_id, media_id, frame_number, timestamp_in_video,"
        " bbox_x, bbox_y, bbox_w, bbox_h, image_crop_path, face_embedding,"
        " ocr_badge_result, ocr_badge_confidence, ocr_name_result, ocr_name_confidence,"
        " badge_override, name_override, force_override, rank_override, role_override,"
        " notes, confidence, confidence_factors, verified, created_at)"
        " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, 0, ?)");
    if (!stmt.ok()) return std::nullopt;

    int i = 1;
    stmt.bind_int64(i++, appearance.officer_id);
    stmt.bind_int64(i++, appearance.media_id);
    if (appearance.frame_number) stmt.bind_int64(i++, *appearance.frame_number);
    else stmt.bind_null(i++);
    if (appearance.timestamp_seconds) stmt.bind_double(i++, *appearance.timestamp_seconds);
    else stmt.bind_null(i++);
    stmt.bind_int64(i++, appearance.bbox.x);
    stmt.bind_int64(i++, appearance.bbox.y);
    stmt.bind_int64(i++, appearance.bbox.width);
    stmt.bind_int64(i++, appearance.bbox.height);
    stmt.bind_text(i++, appearance.image_crop_path);
    stmt.bind_embedding(i++, appearance.face_embedding);
    stmt.bind_text(i++, appearance.ocr_badge_text);
    stmt.bind_double(i++, appearance.ocr_badge_confidence);
    stmt.bind_text(i++, appearance.ocr_name_text);
    stmt.bind_double(i++, appearance.ocr_name_confidence);
    for (Field f : appearance_override_fields()) {
        auto it = appearance.overrides.find(f);
        if (it != appearance.overrides.end()) stmt.bind_text(i++, it->second);
        else stmt.bind_null(i++);
    }
    stmt.bind_text(i++, appearance.notes);
    stmt.bind_int64(i++, appearance.confidence);
    stmt.bind_text(i++, appearance.confidence_factors);
    stmt.bind_text(i++, appearance.created_at.empty() ? now_timestamp() : appearance.created_at);

    if (!stmt.run()) return std::nullopt;

    int64_t id = sqlite3_last_insert_rowid(db);
    if (!insert_appearance_fields(id, appearance.fields)) {
        return std::nullopt;
    }
    return id;
}

bool RegistryDatabase::insert_appearance_fields(int64_t appearance_id, const FieldMap& fields) {
    for (const auto& [field, result] : fields) {
        Statement stmt(db,
            "INSERT INTO appearance_fields (appearance_id, field, value, confidence, source, indicators)"
            " VALUES (?, ?, ?, ?, ?, ?)");
        if (!stmt.ok()) return false;

        stmt.bind_int64(1, appearance_id);
        stmt.bind_text(2, std::string(to_string(field)));
        stmt.bind_text(3, result.value);
        stmt.bind_double(4, result.confidence);
        stmt.bind_text(5, std::string(to_string(result.source)));
        stmt.bind_text(6, indicators_to_json(result.indicators));
        if (!stmt.run()) return false;
    }
    return true;
}

FieldMap RegistryDatabase::load_appearance_fields(int64_t appearance_id) {
    FieldMap fields;

    Statement stmt(db,
        "SELECT field, value, confidence, source, indicators FROM appearance_fields"
        " WHERE appearance_id = ?");
    if (!stmt.ok()) return fields;

    stmt.bind_int64(1, appearance_id);
    while (stmt.row()) {
        auto field = field_from_string(stmt.text(0));
        if (!field) continue;

        FieldResult r;
        r.value = stmt.opt_text(1);
        r.confidence = static_cast<float>(stmt.dbl(2));
        r.source = source_from_string(stmt.text(3));
        r.indicators = indicators_from_json(stmt.text(4));
        fields[*field] = r;
    }
    return fields;
}

std::optional<AppearanceRecord> RegistryDatabase::get_appearance(int64_t appearance_id) {
    std::optional<AppearanceRecord> record;
    {
        Statement stmt(db, std::string("SELECT ") + APPEARANCE_COLUMNS +
                           " FROM officer_appearances WHERE id = ?");
        if (!stmt.ok()) return std::nullopt;

        stmt.bind_int64(1, appearance_id);
        if (!stmt.row()) return std::nullopt;
        record = read_appearance(stmt);
    }
    record->fields = load_appearance_fields(appearance_id);
    return record;
}

std::vector<AppearanceRecord> RegistryDatabase::appearances_for_officers(const std::vector<int64_t>& officer_ids) {
    std::vector<AppearanceRecord> records;
    if (officer_ids.empty()) return records;

    std::string marks;
    for (size_t i = 0; i < officer_ids.size(); ++i) {
        marks += (i == 0) ? "?" : ", ?";
    }

    {
        Statement stmt(db, std::string("SELECT ") + APPEARANCE_COLUMNS +
            " FROM officer_appearances WHERE officer_id IN (" + marks + ")"
            " ORDER BY media_id, frame_number, id");
        if (!stmt.ok()) return records;

        for (size_t i = 0; i < officer_ids.size(); ++i) {
            stmt.bind_int64(static_cast<int>(i + 1), officer_ids[i]);
        }
        while (stmt.row()) {
            records.push_back(read_appearance(stmt));
        }
    }

    for (auto& r : records) {
        r.fields = load_appearance_fields(r.id);
    }
    return records;
}

std::vector<AppearanceRecord> RegistryDatabase::recent_appearances(int limit) {
    std::vector<AppearanceRecord> records;
    {
        Statement stmt(db, std::string("SELECT ") + APPEARANCE_COLUMNS +
                           " FROM officer_appearances ORDER BY id DESC LIMIT ?");
        if (!stmt.ok()) return records;

        stmt.bind_int64(1, limit);
        while (stmt.row()) {
            records.push_back(read_appearance(stmt));
        }
    }

    for (auto& r : records) {
        r.fields = load_appearance_fields(r.id);
    }
    return records;
}

int RegistryDatabase::count_appearances(int64_t officer_id) {
    Statement stmt(db, "SELECT COUNT(*) FROM officer_appearances WHERE officer_id = ?");
    if (!stmt.ok()) return 0;
    stmt.bind_int64(1, officer_id);
    if (!stmt.row()) return 0;
    return static_cast<int>(stmt.int64(0));
}

bool RegistryDatabase::set_appearance_override(int64_t appearance_id, Field field,
                                               const std::optional<std::string>& value) {
    const char* column = appearance_override_column(field);
    if (!column) {
        spdlog::error("Campo '{}' no admite override de aparicion", to_string(field));
        return false;
    }

    Statement stmt(db, std::string("UPDATE officer_appearances SET ") + column + " = ? WHERE id = ?");
    if (!stmt.ok()) return false;

    stmt.bind_text(1, value);
    stmt.bind_int64(2, appearance_id);
    if (!stmt.run()) return false;
    return sqlite3_changes(db) == 1;
}

bool RegistryDatabase::verify_appearance(int64_t appearance_id, const std::string& actor) {
    Statement stmt(db,
        "UPDATE officer_appearances SET verified = 1, verified_at = ?, verified_by = ? WHERE id = ?");
    if (!stmt.ok()) return false;

    stmt.bind_text(1, now_timestamp());
    stmt.bind_text(2, actor);
    stmt.bind_int64(3, appearance_id);
    if (!stmt.run()) return false;
    return sqlite3_changes(db) == 1;
}

// ==================== MERGES ====================

std::optional<int64_t> RegistryDatabase::insert_merge(const MergeRecord& merge) {
    Statement stmt(db,
        "INSERT INTO officer_merges (primary_officer_id, merged_officer_id, merge_confidence,"
        " auto_merged, merged_at, merged_by, unmerged) VALUES (?, ?, ?, ?, ?, ?, 0)");
    if (!stmt.ok()) return std::nullopt;

    stmt.bind_int64(1, merge.primary_officer_id);
    stmt.bind_int64(2, merge.merged_officer_id);
    stmt.bind_double(3, merge.merge_confidence);
    stmt.bind_int64(4, merge.auto_merged ? 1 : 0);
    stmt.bind_text(5, merge.merged_at);
    stmt.bind_text(6, merge.merged_by);

    if (!stmt.run()) return std::nullopt;
    return sqlite3_last_insert_rowid(db);
}

std::optional<MergeRecord> RegistryDatabase::get_merge(int64_t merge_id) {
    Statement stmt(db, std::string("SELECT ") + MERGE_COLUMNS + " FROM officer_merges WHERE id = ?");
    if (!stmt.ok()) return std::nullopt;

    stmt.bind_int64(1, merge_id);
    if (!stmt.row()) return std::nullopt;
    return read_merge(stmt);
}

bool RegistryDatabase::mark_unmerged(int64_t merge_id, const std::string& actor, const std::string& at) {
    Statement stmt(db,
        "UPDATE officer_merges SET unmerged = 1, unmerged_at = ?, unmerged_by = ?"
        " WHERE id = ? AND unmerged = 0");
    if (!stmt.ok()) return false;

    stmt.bind_text(1, at);
    stmt.bind_text(2, actor);
    stmt.bind_int64(3, merge_id);
    if (!stmt.run()) return false;
    return sqlite3_changes(db) == 1;
}

std::vector<MergeRecord> RegistryDatabase::merges_for_officer(int64_t officer_id) {
    std::vector<MergeRecord> merges;

    Statement stmt(db, std::string("SELECT ") + MERGE_COLUMNS +
        " FROM officer_merges WHERE primary_officer_id = ? OR merged_officer_id = ? ORDER BY id");
    if (!stmt.ok()) return merges;

    stmt.bind_int64(1, officer_id);
    stmt.bind_int64(2, officer_id);
    while (stmt.row()) {
        merges.push_back(read_merge(stmt));
    }
    return merges;
}

std::vector<MergeRecord> RegistryDatabase::list_merges() {
    std::vector<MergeRecord> merges;

    Statement stmt(db, std::string("SELECT ") + MERGE_COLUMNS + " FROM officer_merges ORDER BY id");
    if (!stmt.ok()) return merges;

    while (stmt.row()) {
        merges.push_back(read_merge(stmt));
    }
    return merges;
}

} // namespace rollcall
