// ============= tools/query_registry.cpp =============
/*
 * Herramienta de consulta del registro de oficiales
 *
 * EJEMPLOS DE USO:
 *
 * ./build/bin/query_registry data/rollcall.db --stats
 * ./query_registry data/rollcall.db --officers
 * ./query_registry data/rollcall.db --officers --all
 * ./query_registry data/rollcall.db --merges
 * ./query_registry data/rollcall.db --recent 20
 * ./query_registry data/rollcall.db --recent 500 --export apariciones.csv
 */

#include "rollcall/core/errors.hpp"
#include "rollcall/database/registry_database.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace rollcall;

struct AppearanceRow {
    int64_t id;
    int64_t officer_id;
    int64_t media_id;
    int frame;
    int confidence;
    bool verified;
    std::string badge;
    std::string created_at;
};

class RegistryQueryTool {
private:
    RegistryDatabase db;

    int scalar(const char* sql) {
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db.handle(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
            std::cerr << "Error preparando query: " << sqlite3_errmsg(db.handle()) << std::endl;
            return 0;
        }
        int value = sqlite3_step(stmt) == SQLITE_ROW ? sqlite3_column_int(stmt, 0) : 0;
        sqlite3_finalize(stmt);
        return value;
    }

public:
    explicit RegistryQueryTool(const std::string& path) : db(path) {}

    // Estadísticas generales
    void show_statistics() {
        std::cout << "\n═══════════════════════════════════════════════" << std::endl;
        std::cout << "   ESTADÍSTICAS DEL REGISTRO" << std::endl;
        std::cout << "═══════════════════════════════════════════════" << std::endl;
        std::cout << "Media:               " << db.count_media() << std::endl;
        std::cout << "  duplicados exactos " << scalar("SELECT COUNT(*) FROM media WHERE duplicate_type = 'exact'") << std::endl;
        std::cout << "  similares          " << scalar("SELECT COUNT(*) FROM media WHERE duplicate_type = 'similar'") << std::endl;
        std::cout << "  sin hash           " << scalar("SELECT COUNT(*) FROM media WHERE content_hash IS NULL") << std::endl;
        std::cout << "Oficiales:           " << db.count_officers(false) << std::endl;
        std::cout << "  activos            " << db.count_officers(true) << std::endl;
        std::cout << "  con embedding      " << scalar("SELECT COUNT(*) FROM officers WHERE face_embedding IS NOT NULL") << std::endl;
        std::cout << "Apariciones:         " << scalar("SELECT COUNT(*) FROM officer_appearances") << std::endl;
        std::cout << "  verificadas        " << scalar("SELECT COUNT(*) FROM officer_appearances WHERE verified = 1") << std::endl;
        std::cout << "Merges:              " << scalar("SELECT COUNT(*) FROM officer_merges") << std::endl;
        std::cout << "  automaticos        " << scalar("SELECT COUNT(*) FROM officer_merges WHERE auto_merged = 1") << std::endl;
        std::cout << "  revertidos         " << scalar("SELECT COUNT(*) FROM officer_merges WHERE unmerged = 1") << std::endl;
        std::cout << "═══════════════════════════════════════════════\n" << std::endl;

        show_force_distribution();
    }

    void show_force_distribution() {
        std::cout << "FUERZAS (oficiales activos):" << std::endl;
        for (const auto& entry : force_distribution(db.list_officers(true))) {
            std::cout << "  " << std::setw(36) << std::left << entry.first << ": " << entry.second << std::endl;
        }
        std::cout << std::right << std::endl;
    }

    void show_officers(bool active_only) {
        auto officers = db.list_officers(active_only);
        if (officers.empty()) {
            std::cout << "No hay oficiales." << std::endl;
            return;
        }

        std::cout << std::setw(6) << "ID"
                  << std::setw(12) << "Badge"
                  << std::setw(34) << "Force"
                  << std::setw(20) << "Rank"
                  << std::setw(8) << "Apar."
                  << "Estado" << std::endl;
        std::cout << std::string(90, '-') << std::endl;

        for (const auto& o : officers) {
            auto badge = effective_value(o, Field::Badge);
            auto force = effective_value(o, Field::Force);
            auto rank = effective_value(o, Field::Rank);

            std::cout << std::setw(6) << o.id
                      << std::setw(12) << badge.value.value_or("-")
                      << std::setw(34) << force.value.value_or("-")
                      << std::setw(20) << rank.value.value_or("-")
                      << std::setw(8) << db.count_appearances(o.id);
            if (o.is_merged()) std::cout << "-> #" << *o.merged_into_id;
            else std::cout << "activo";
            std::cout << std::endl;
        }
    }

    void show_merges() {
        auto merges = db.list_merges();
        if (merges.empty()) {
            std::cout << "No hay merges." << std::endl;
            return;
        }

        std::cout << std::setw(6) << "ID" << std::setw(10) << "Primary" << std::setw(10) << "Merged"
                  << std::setw(8) << "Conf" << std::setw(7) << "Auto" << std::setw(22) << "Fecha"
                  << "Revertido" << std::endl;
        std::cout << std::string(80, '-') << std::endl;

        for (const auto& m : merges) {
            std::cout << std::setw(6) << m.id
                      << std::setw(10) << m.primary_officer_id
                      << std::setw(10) << m.merged_officer_id
                      << std::setw(8) << std::fixed << std::setprecision(3) << m.merge_confidence
                      << std::setw(7) << (m.auto_merged ? "si" : "no")
                      << std::setw(22) << m.merged_at
                      << (m.unmerged ? m.unmerged_at.value_or("si") : "-") << std::endl;
        }
    }

    std::vector<AppearanceRow> recent_appearances(int limit) {
        std::vector<AppearanceRow> rows;
        for (const auto& a : db.recent_appearances(limit)) {
            AppearanceRow r;
            r.id = a.id;
            r.officer_id = a.officer_id;
            r.media_id = a.media_id;
            r.frame = a.frame_number.value_or(0);
            r.confidence = a.confidence;
            r.verified = a.verified;
            r.badge = effective_value(a, Field::Badge).value.value_or("");
            r.created_at = a.created_at;
            rows.push_back(r);
        }
        return rows;
    }

    void print_appearances(const std::vector<AppearanceRow>& rows) {
        if (rows.empty()) {
            std::cout << "No se encontraron apariciones." << std::endl;
            return;
        }

        std::cout << "\nUltimas " << rows.size() << " apariciones:\n" << std::endl;
        std::cout << std::setw(8) << "ID" << std::setw(9) << "Oficial" << std::setw(8) << "Media"
                  << std::setw(8) << "Frame" << std::setw(6) << "Conf" << std::setw(12) << "Badge"
                  << std::setw(22) << "Fecha" << std::endl;
        std::cout << std::string(75, '-') << std::endl;

        for (const auto& r : rows) {
            std::cout << std::setw(8) << r.id << std::setw(9) << r.officer_id << std::setw(8) << r.media_id
                      << std::setw(8) << r.frame << std::setw(6) << r.confidence
                      << std::setw(12) << (r.badge.empty() ? "-" : r.badge)
                      << std::setw(22) << r.created_at << (r.verified ? " ✓" : "") << std::endl;
        }
    }

    void export_csv(const std::vector<AppearanceRow>& rows, const std::string& filename) {
        std::ofstream file(filename);
        if (!file.is_open()) {
            std::cerr << "Error abriendo archivo: " << filename << std::endl;
            return;
        }

        file << "id,officer_id,media_id,frame,confidence,verified,badge,created_at\n";
        for (const auto& r : rows) {
            file << r.id << "," << r.officer_id << "," << r.media_id << "," << r.frame << ","
                 << r.confidence << "," << (r.verified ? 1 : 0) << ","
                 << "\"" << r.badge << "\"," << r.created_at << "\n";
        }

        std::cout << "Exportado a: " << filename << std::endl;
    }
};

void print_usage(const char* prog) {
    std::cout << "USO: " << prog << " <rollcall.db> [opciones]\n\n";
    std::cout << "OPCIONES:\n";
    std::cout << "  --stats                     Estadísticas generales\n";
    std::cout << "  --officers [--all]          Oficiales activos (o todos)\n";
    std::cout << "  --merges                    Historial de merges\n";
    std::cout << "  --recent N                  Últimas N apariciones\n";
    std::cout << "  --export FILENAME.csv       Exportar apariciones a CSV\n";
    std::cout << "\nEJEMPLOS:\n";
    std::cout << "  " << prog << " data/rollcall.db --stats\n";
    std::cout << "  " << prog << " data/rollcall.db --recent 20 --export recientes.csv\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    spdlog::set_level(spdlog::level::warn);

    bool stats = false, officers = false, all = false, merges = false;
    int limit = 50;
    std::string export_file;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--stats") stats = true;
        else if (arg == "--officers") officers = true;
        else if (arg == "--all") all = true;
        else if (arg == "--merges") merges = true;
        else if (arg == "--recent" && i + 1 < argc) {
            try {
                limit = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "--recent requiere un numero" << std::endl;
                return 1;
            }
        }
        else if (arg == "--export" && i + 1 < argc) export_file = argv[++i];
    }

    try {
        RegistryQueryTool tool(argv[1]);

        if (stats) {
            tool.show_statistics();
            return 0;
        }
        if (officers) {
            tool.show_officers(!all);
            return 0;
        }
        if (merges) {
            tool.show_merges();
            return 0;
        }

        auto rows = tool.recent_appearances(limit);
        tool.print_appearances(rows);
        if (!export_file.empty()) tool.export_csv(rows, export_file);

    } catch (const RegistryError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
