// ============= test/test_ingest.cpp =============
/*
 * Tests de la ingesta
 *
 * - ThreadPool: prioridad, futures, wait_all, stop
 * - SightingManifest: parseo tolerante del JSON
 * - IngestWorker / BatchIngestor contra una BD en archivo
 *   (cada hilo abre su propia conexion, no sirve :memory:)
 */

#include "rollcall/analysis/sighting_manifest.hpp"
#include "rollcall/registry/batch_ingestor.hpp"
#include "rollcall/registry/thread_pool.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <fstream>

using namespace rollcall;
using rollcall::test::TempDir;
using rollcall::test::smooth_random_image;
using rollcall::test::unit_embedding;
using rollcall::test::write_jpeg;

namespace {

constexpr int DIM = 8;

Json::Value sighting_json(int axis, const std::string& badge) {
    Json::Value s;
    s["frame"] = 0;
    s["bbox"].append(40);
    s["bbox"].append(30);
    s["bbox"].append(120);
    s["bbox"].append(120);
    s["detection_confidence"] = 0.96;
    s["blur_score"] = 120.0;
    for (float v : unit_embedding(DIM, axis)) s["embedding"].append(v);

    Json::Value reading;
    reading["text"] = badge;
    reading["confidence"] = 0.9;
    s["ocr"].append(reading);
    return s;
}

std::string write_manifest(const TempDir& dir, const std::string& name, const Json::Value& root) {
    std::string path = dir.file(name);
    std::ofstream out(path);
    out << Json::writeString(Json::StreamWriterBuilder(), root);
    return path;
}

SightingManifest manifest_for(const TempDir& dir, const std::string& image, int axis,
                              const std::string& badge) {
    Json::Value root;
    root["media"] = image;
    root["sightings"].append(sighting_json(axis, badge));
    auto m = SightingManifest::load(write_manifest(dir, image + ".json", root));
    EXPECT_TRUE(m.has_value());
    return m.value_or(SightingManifest{});
}

RegistryConfig test_config(const TempDir& dir, int workers) {
    RegistryConfig config;
    config.database.path = dir.file("registry.db");
    config.matching.embedding_dim = DIM;
    config.ingest_workers = workers;
    return config;
}

} // namespace

// ==================== THREAD POOL ====================

TEST(ThreadPool, FuturesCarryResultsAndExceptions) {
    ThreadPool pool(2);
    auto sum = pool.submit([](int a, int b) { return a + b; }, 2, 3);
    auto boom = pool.submit([]() -> int { throw std::runtime_error("boom"); });

    EXPECT_EQ(sum.get(), 5);
    EXPECT_THROW(boom.get(), std::runtime_error);
    EXPECT_EQ(pool.size(), 2u);
}

TEST(ThreadPool, HigherPriorityRunsFirst) {
    ThreadPool pool(1);
    std::promise<void> started;
    std::promise<void> release;
    auto gate = release.get_future().share();

    pool.submit([&started, gate]() {
        started.set_value();
        gate.wait();
    });
    started.get_future().wait();

    std::vector<int> order;
    std::mutex order_mutex;
    auto record = [&](int v) {
        std::lock_guard<std::mutex> lock(order_mutex);
        order.push_back(v);
    };

    pool.submit(0, record, 1);
    pool.submit(0, record, 2);
    pool.submit(10, record, 3);
    EXPECT_EQ(pool.pending_tasks(), 3u);

    release.set_value();
    pool.wait_all();

    EXPECT_EQ(order, (std::vector<int>{3, 1, 2}));
}

TEST(ThreadPool, StopDrainsQueueThenRejects) {
    ThreadPool pool(2);
    std::atomic<int> done{0};
    for (int i = 0; i < 20; ++i) {
        pool.submit([&done]() { done++; });
    }
    pool.stop();
    EXPECT_EQ(done.load(), 20);
    EXPECT_THROW(pool.submit([]() {}), std::runtime_error);
}

// ==================== MANIFEST ====================

TEST(SightingManifest, ParsesSightingsRelativeToManifest) {
    TempDir dir;
    Json::Value root;
    root["media"] = "clip.mp4";
    root["type"] = "image";

    Json::Value s = sighting_json(2, "PS 1234");
    s["timestamp"] = 1.5;
    s["crop_path"] = "crops/0001.jpg";
    s["equipment"].append("riot shield");
    s["equipment"].append(7);
    s["uniform"] = "dark operational";
    s["ocr"].append("not an object");
    s["vision_raw"] = R"(sure: {"force": {"name": "Kent Police", "confidence": 0.8}})";
    root["sightings"].append(s);
    root["sightings"].append("junk");

    auto m = SightingManifest::load(write_manifest(dir, "m.json", root));
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->media_path, dir.file("clip.mp4"));
    EXPECT_EQ(m->type, MediaType::Image);
    EXPECT_EQ(m->source, dir.file("m.json"));
    ASSERT_EQ(m->sightings.size(), 1u);

    const auto& sighting = m->sightings[0];
    EXPECT_EQ(sighting.bbox, cv::Rect(40, 30, 120, 120));
    EXPECT_EQ(sighting.timestamp_seconds, 1.5);
    ASSERT_TRUE(sighting.embedding.has_value());
    EXPECT_EQ(*sighting.embedding, unit_embedding(DIM, 2));
    ASSERT_EQ(sighting.signals.ocr.size(), 1u);
    EXPECT_EQ(sighting.signals.ocr[0].text, "PS 1234");
    EXPECT_EQ(sighting.signals.equipment, std::vector<std::string>{"riot shield"});
    ASSERT_TRUE(sighting.signals.vision.has_value());
    EXPECT_EQ(sighting.signals.vision->force.value, "Kent Police");
}

TEST(SightingManifest, TypeFromExtensionAndBadFields) {
    Json::Value root;
    root["media"] = "/abs/path/photo.JPG";
    Json::Value s;
    s["bbox"].append(1);
    s["bbox"].append("two");
    s["bbox"].append(3);
    s["bbox"].append(4);
    s["embedding"].append(0.5);
    s["embedding"].append("x");
    root["sightings"].append(s);

    auto m = SightingManifest::from_json(root, "/ignored");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->media_path, "/abs/path/photo.JPG");
    EXPECT_EQ(m->type, MediaType::Image);
    EXPECT_TRUE(m->sightings[0].bbox.empty());
    EXPECT_FALSE(m->sightings[0].embedding.has_value());
}

TEST(SightingManifest, InvalidManifests) {
    TempDir dir;
    EXPECT_FALSE(SightingManifest::load(dir.file("missing.json")).has_value());

    {
        std::ofstream out(dir.file("broken.json"));
        out << "{ \"media\": ";
    }
    EXPECT_FALSE(SightingManifest::load(dir.file("broken.json")).has_value());

    Json::Value no_media;
    no_media["sightings"] = Json::arrayValue;
    EXPECT_FALSE(SightingManifest::from_json(no_media, "").has_value());
}

// ==================== WORKER ====================

TEST(IngestWorker, ExactDuplicateIsRecordedButNotProcessed) {
    TempDir dir;
    write_jpeg(dir.file("a.jpg"), smooth_random_image(31));
    std::filesystem::copy_file(dir.file("a.jpg"), dir.file("a_copy.jpg"));

    IngestWorker worker(test_config(dir, 1));

    auto first = worker.ingest(manifest_for(dir, "a.jpg", 0, "PS 1234"));
    ASSERT_TRUE(first.ok());
    EXPECT_TRUE(first.processed);
    EXPECT_FALSE(first.check.is_duplicate);
    EXPECT_EQ(first.outcome.persisted, 1);
    EXPECT_EQ(first.outcome.new_officers, 1);

    auto second = worker.ingest(manifest_for(dir, "a_copy.jpg", 0, "PS 1234"));
    ASSERT_TRUE(second.ok());
    EXPECT_FALSE(second.processed);
    EXPECT_TRUE(second.check.is_duplicate);
    EXPECT_EQ(second.check.duplicate_type, DuplicateType::Exact);
    EXPECT_EQ(second.check.original_id, first.media_id);

    auto& db = worker.get_database();
    EXPECT_EQ(db.count_media(), 2);
    EXPECT_EQ(db.count_officers(false), 1);
    EXPECT_TRUE(db.get_media(*first.media_id)->processed);
    EXPECT_FALSE(db.get_media(*second.media_id)->processed);

    auto officers = db.list_officers(true);
    ASSERT_EQ(officers.size(), 1u);
    EXPECT_EQ(effective_value(officers[0], Field::Rank).value, "Sergeant");
}

TEST(IngestWorker, MissingMediaIsAnError) {
    TempDir dir;
    IngestWorker worker(test_config(dir, 1));

    SightingManifest m;
    m.media_path = dir.file("gone.jpg");
    m.type = MediaType::Image;

    auto result = worker.ingest(m);
    EXPECT_FALSE(result.ok());
    EXPECT_FALSE(result.media_id.has_value());
    EXPECT_EQ(worker.get_database().count_media(), 0);
}

// ==================== BATCH ====================

TEST(BatchIngestor, ProcessesFilesInParallel) {
    TempDir dir;
    auto config = test_config(dir, 3);
    {
        RegistryDatabase schema(config.database.path);
    }

    std::vector<SightingManifest> manifests;
    for (int i = 0; i < 4; ++i) {
        std::string name = "clip" + std::to_string(i) + ".jpg";
        write_jpeg(dir.file(name), smooth_random_image(100 + i));
        manifests.push_back(manifest_for(dir, name, i, "U12" + std::to_string(30 + i)));
    }
    SightingManifest missing;
    missing.media_path = dir.file("nowhere.jpg");
    missing.type = MediaType::Image;
    manifests.push_back(missing);

    BatchIngestor ingestor(config);
    auto results = ingestor.run(manifests);
    ASSERT_EQ(results.size(), 5u);

    for (int i = 0; i < 4; ++i) {
        EXPECT_TRUE(results[i].ok()) << results[i].error;
        EXPECT_TRUE(results[i].processed);
        EXPECT_EQ(results[i].media_path, manifests[i].media_path);
    }
    EXPECT_FALSE(results[4].ok());

    RegistryDatabase db(config.database.path);
    EXPECT_EQ(db.count_media(), 4);
    EXPECT_EQ(db.count_officers(true), 4);
}

TEST(BatchIngestor, BusierFilesGetHigherPriority) {
    SightingManifest empty;
    SightingManifest busy;
    busy.sightings.resize(3);
    SightingManifest single;
    single.sightings.resize(1);

    EXPECT_EQ(ingest_priority(empty), 0);
    EXPECT_GT(ingest_priority(busy), ingest_priority(single));
    EXPECT_GT(ingest_priority(single), ingest_priority(empty));
}

TEST(BatchIngestor, EmptyBatch) {
    TempDir dir;
    BatchIngestor ingestor(test_config(dir, 2));
    EXPECT_TRUE(ingestor.run({}).empty());
}
