// ============= test/test_helpers.hpp =============
#pragma once
#include "rollcall/matching/embedding.hpp"
#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <filesystem>
#include <string>

namespace rollcall::test {

// Directorio temporal unico por test, se borra al salir
class TempDir {
public:
    TempDir() {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = std::string("rollcall_") + info->test_suite_name() + "_" + info->name();
        path = std::filesystem::temp_directory_path() / name;

        std::error_code ec;
        std::filesystem::remove_all(path, ec);
        std::filesystem::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string file(const std::string& name) const { return (path / name).string(); }

    std::filesystem::path path;
};

// Imagen suave: ruido 16x16 escalado con INTER_CUBIC
inline cv::Mat smooth_random_image(uint64_t seed, int size = 512) {
    cv::RNG rng(seed);
    cv::Mat small(16, 16, CV_8UC3);
    rng.fill(small, cv::RNG::UNIFORM, 0, 256);

    cv::Mat big;
    cv::resize(small, big, cv::Size(size, size), 0, 0, cv::INTER_CUBIC);
    return big;
}

inline std::string write_jpeg(const std::string& path, const cv::Mat& image, int quality = 95) {
    cv::imwrite(path, image, {cv::IMWRITE_JPEG_QUALITY, quality});
    return path;
}

// Vector unitario en el eje `axis`, opcionalmente desplazado en `shift_axis`
inline Embedding unit_embedding(int dim, int axis, float shift = 0.0f, int shift_axis = -1) {
    Embedding e(dim, 0.0f);
    e[axis % dim] = 1.0f;
    if (shift_axis >= 0) e[shift_axis % dim] += shift;
    return e;
}

} // namespace rollcall::test
