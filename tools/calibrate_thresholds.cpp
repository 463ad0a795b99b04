// ============= tools/calibrate_thresholds.cpp =============
/*
 * Calibra los umbrales de matching con pares etiquetados
 *
 * ENTRADA (CSV, una linea por par, '#' = comentario):
 *   --kind embedding   appearance_a,appearance_b,same     (requiere --db)
 *   --kind phash       hash_a,hash_b,same
 *   --kind distance    distance,same
 *
 *   same = 1 (misma persona / misma imagen) o 0
 *
 * USO:
 *   ./calibrate_thresholds pairs.csv --kind embedding --db data/rollcall.db
 *   ./calibrate_thresholds phash_pairs.csv --kind phash --from 0 --to 40 --step 1
 *   ./calibrate_thresholds pairs.csv --kind distance --export sweep.csv
 */

#include "rollcall/core/errors.hpp"
#include "rollcall/core/utils.hpp"
#include "rollcall/database/registry_database.hpp"
#include "rollcall/matching/threshold_calibrator.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace rollcall;

namespace {

std::vector<std::string> split_csv(const std::string& line) {
    std::vector<std::string> out;
    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, ',')) out.push_back(trim(cell));
    return out;
}

bool parse_label(const std::string& s, bool& same) {
    if (s == "1" || s == "true" || s == "same") { same = true; return true; }
    if (s == "0" || s == "false" || s == "different") { same = false; return true; }
    return false;
}

} // namespace

void print_usage(const char* prog) {
    std::cout << "USO: " << prog << " <pairs.csv> [opciones]\n\n";
    std::cout << "OPCIONES:\n";
    std::cout << "  --kind embedding|phash|distance   Tipo de pares (default: distance)\n";
    std::cout << "  --db FILE                         Registro (para --kind embedding)\n";
    std::cout << "  --from N --to N --step N          Rango del barrido\n";
    std::cout << "  --export FILE                     Exportar barrido a CSV\n\n";
    std::cout << "EJEMPLOS:\n";
    std::cout << "  " << prog << " pairs.csv --kind embedding --db data/rollcall.db\n";
    std::cout << "  " << prog << " phash_pairs.csv --kind phash --from 0 --to 40 --step 1\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    spdlog::set_level(spdlog::level::warn);

    std::string pairs_file = argv[1];
    std::string kind = "distance";
    std::string db_path;
    std::string export_file;
    double from = -1, to = -1, step = -1;

    try {
        for (int i = 2; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--kind" && i + 1 < argc) kind = argv[++i];
            else if (arg == "--db" && i + 1 < argc) db_path = argv[++i];
            else if (arg == "--from" && i + 1 < argc) from = std::stod(argv[++i]);
            else if (arg == "--to" && i + 1 < argc) to = std::stod(argv[++i]);
            else if (arg == "--step" && i + 1 < argc) step = std::stod(argv[++i]);
            else if (arg == "--export" && i + 1 < argc) export_file = argv[++i];
        }
    } catch (const std::exception& e) {
        std::cerr << "Argumento invalido: " << e.what() << std::endl;
        return 1;
    }

    if (kind != "embedding" && kind != "phash" && kind != "distance") {
        std::cerr << "--kind desconocido: " << kind << std::endl;
        return 1;
    }

    // Rango por defecto segun el tipo de distancia
    if (from < 0) from = 0.0;
    if (to < 0) to = kind == "phash" ? 64.0 : 2.0;
    if (step <= 0) step = kind == "phash" ? 1.0 : 0.05;

    std::unique_ptr<RegistryDatabase> db;
    if (kind == "embedding") {
        if (db_path.empty()) {
            std::cerr << "--kind embedding requiere --db" << std::endl;
            return 1;
        }
        try {
            db = std::make_unique<RegistryDatabase>(db_path);
        } catch (const RegistryError& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
    }

    std::ifstream in(pairs_file);
    if (!in.is_open()) {
        std::cerr << "No se pudo abrir " << pairs_file << std::endl;
        return 1;
    }

    ThresholdCalibrator calibrator;
    int line_no = 0, skipped = 0;
    std::string line;

    while (std::getline(in, line)) {
        line_no++;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto cells = split_csv(line);
        bool same = false;

        try {
            if (kind == "distance" && cells.size() >= 2 && parse_label(cells[1], same)) {
                calibrator.add_pair(std::stod(cells[0]), same);
                continue;
            }
            if (kind == "phash" && cells.size() >= 3 && parse_label(cells[2], same)) {
                if (calibrator.add_hash_pair(cells[0], cells[1], same)) continue;
            }
            if (kind == "embedding" && cells.size() >= 3 && parse_label(cells[2], same)) {
                auto a = db->get_appearance(std::stoll(cells[0]));
                auto b = db->get_appearance(std::stoll(cells[1]));
                if (a && b && !a->face_embedding.empty() &&
                    a->face_embedding.size() == b->face_embedding.size()) {
                    calibrator.add_embedding_pair(a->face_embedding, b->face_embedding, same);
                    continue;
                }
            }
        } catch (const std::exception& e) {
            spdlog::debug("linea {}: {}", line_no, e.what());
        }

        skipped++;
        std::cerr << "linea " << line_no << " ignorada: " << line << std::endl;
    }

    if (calibrator.size() == 0) {
        std::cerr << "No hay pares validos." << std::endl;
        return 1;
    }

    auto report = calibrator.sweep(from, to, step);

    std::cout << "\n═══════════════════════════════════════════════════════════════\n";
    std::cout << "   CALIBRACION (" << kind << ", " << calibrator.size() << " pares, "
              << skipped << " ignorados)\n";
    std::cout << "═══════════════════════════════════════════════════════════════\n\n";
    std::cout << std::setw(10) << "Umbral" << std::setw(6) << "TP" << std::setw(6) << "FP"
              << std::setw(6) << "TN" << std::setw(6) << "FN" << std::setw(11) << "Precision"
              << std::setw(9) << "Recall" << std::setw(8) << "F1" << "\n";
    std::cout << std::string(62, '-') << "\n";

    for (const auto& m : report.sweep) {
        std::cout << std::setw(10) << std::fixed << std::setprecision(3) << m.threshold
                  << std::setw(6) << m.tp << std::setw(6) << m.fp
                  << std::setw(6) << m.tn << std::setw(6) << m.fn
                  << std::setw(11) << m.precision << std::setw(9) << m.recall
                  << std::setw(8) << m.f1
                  << (m.threshold == report.best.threshold ? "  <-" : "") << "\n";
    }

    std::cout << "\nMejor umbral: " << report.best.threshold << " (F1 " << report.best.f1 << ")\n\n";

    if (!export_file.empty()) {
        std::ofstream out(export_file);
        if (!out.is_open()) {
            std::cerr << "Error abriendo archivo: " << export_file << std::endl;
            return 1;
        }
        out << "threshold,tp,fp,tn,fn,precision,recall,f1\n";
        for (const auto& m : report.sweep) {
            out << m.threshold << "," << m.tp << "," << m.fp << "," << m.tn << "," << m.fn << ","
                << m.precision << "," << m.recall << "," << m.f1 << "\n";
        }
        std::cout << "Exportado a: " << export_file << "\n";
    }

    return 0;
}
