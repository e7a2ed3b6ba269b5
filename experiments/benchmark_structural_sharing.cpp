// =============================================================================
// Benchmark: structural sharing in jpatch vs deep-copy patching in nlohmann::json
// =============================================================================
//
// PURPOSE: Measure what copy-on-write buys when a small patch is applied to a
// large document while the original must stay intact:
//   (A) jpatch path:    apply_patch on an immutable jpatch::value.  Only the
//                       containers on each touched path are copied.
//   (B) nlohmann path:  deep-copy the nlohmann::json document, then run
//                       nlohmann::json::patch on the copy.
//
// SCENARIO:
//   1. Generate a synthetic document (object holding an array of N records).
//   2. Measure: import into jpatch::value (one-time conversion cost).
//   3. Measure: K single-field patches with jpatch::apply_patch.
//   4. Measure: the same K patches with nlohmann::json::patch on a copy.
//   5. Check both paths produce the same final document.
//
// BUILD:
//   cmake -S . -B build -DJPATCH_BUILD_EXPERIMENTS=ON
//   cmake --build build --target benchmark_structural_sharing
// =============================================================================

#include <iostream>
#include <chrono>
#include <string>
#include <vector>
#include <iomanip>

#include <nlohmann/json.hpp>
#include "jpatch/jpatch.h"

// ---------------------------------------------------------------------------
// Timing helpers
// ---------------------------------------------------------------------------

using Clock     = std::chrono::high_resolution_clock;
using TimePoint = Clock::time_point;

static TimePoint now_tp() { return Clock::now(); }

static double elapsed_ms(TimePoint start, TimePoint end) {
    return std::chrono::duration<double, std::milli>(end - start).count();
}

// ---------------------------------------------------------------------------
// Benchmark document generation
// ---------------------------------------------------------------------------

/**
 * Generate {"records": [...]} with `record_count` records.  Each record mixes
 * strings, numbers, booleans and a nested object.
 */
static nlohmann::json generate_document(int record_count) {
    nlohmann::json records = nlohmann::json::array();
    for (int i = 0; i < record_count; ++i) {
        nlohmann::json record;
        record["id"]     = i;
        record["name"]   = "item_" + std::to_string(i);
        record["value"]  = static_cast<double>(i) * 3.14159;
        record["active"] = (i % 2 == 0);
        record["tags"]   = {"tag_" + std::to_string(i % 10), "tag_" + std::to_string(i % 7)};
        record["meta"]   = {{"created", i * 1000}, {"version", 1}};
        records.push_back(std::move(record));
    }
    return nlohmann::json{{"records", std::move(records)}};
}

/** Patch k: bump meta/version of record (k * 7919) mod n and test it. */
static nlohmann::json generate_patch(int k, int record_count) {
    const std::string base = "/records/" + std::to_string((k * 7919) % record_count);
    return nlohmann::json::array({
        {{"op", "replace"}, {"path", base + "/meta/version"}, {"value", k + 2}},
        {{"op", "test"},    {"path", base + "/meta/version"}, {"value", k + 2}},
    });
}

// ---------------------------------------------------------------------------
// Benchmark runner
// ---------------------------------------------------------------------------

struct BenchmarkResult {
    int    record_count   = 0;
    size_t doc_json_bytes = 0;
    double import_ms      = 0.0;  // nlohmann::json -> jpatch::value
    double jpatch_ms      = 0.0;  // K patches via structural sharing
    double nlohmann_ms    = 0.0;  // K patches via deep copy + json::patch
    bool   same_result    = false;
};

static BenchmarkResult run_benchmark(int record_count, int patch_count) {
    BenchmarkResult r;
    r.record_count = record_count;

    nlohmann::json doc = generate_document(record_count);
    r.doc_json_bytes = doc.dump().size();

    std::vector<nlohmann::json> patches;
    std::vector<std::vector<jpatch::operation_record>> records;
    for (int k = 0; k < patch_count; ++k) {
        patches.push_back(generate_patch(k, record_count));
        records.push_back(jpatch::patch_from_json(patches.back()));
    }

    TimePoint t0 = now_tp();
    jpatch::value base = jpatch::import_json(doc);
    TimePoint t1 = now_tp();
    r.import_ms = elapsed_ms(t0, t1);

    // Every version is kept alive, as a history would.
    std::vector<jpatch::value> versions;
    versions.reserve(records.size() + 1);
    versions.push_back(base);
    {
        TimePoint s = now_tp();
        for (const auto& p : records) {
            versions.push_back(jpatch::apply_patch(versions.back(), p).value());
        }
        TimePoint e = now_tp();
        r.jpatch_ms = elapsed_ms(s, e);
    }

    std::vector<nlohmann::json> json_versions;
    json_versions.reserve(patches.size() + 1);
    json_versions.push_back(doc);
    {
        TimePoint s = now_tp();
        for (const auto& p : patches) {
            // json::patch works on an internal deep copy of the source
            json_versions.push_back(json_versions.back().patch(p));
        }
        TimePoint e = now_tp();
        r.nlohmann_ms = elapsed_ms(s, e);
    }

    r.same_result = jpatch::export_json(versions.back()) == json_versions.back();
    if (!r.same_result) {
        std::cerr << "ERROR: final documents differ for " << record_count << " records\n";
    }
    if (!(versions.front() == jpatch::import_json(doc))) {
        std::cerr << "ERROR: the base version was modified\n";
    }
    return r;
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main() {
    const int patch_count = 200;
    std::vector<int> record_counts = {100, 1000, 10000};

    std::cout << "=============================================================================\n";
    std::cout << "jpatch structural sharing vs nlohmann::json deep copy (" << patch_count << " patches)\n";
    std::cout << "=============================================================================\n\n";

    std::cout << std::left
              << std::setw(10) << "Records"
              << std::setw(14) << "JSON(bytes)"
              << std::setw(14) << "Import(ms)"
              << std::setw(14) << "jpatch(ms)"
              << std::setw(16) << "nlohmann(ms)"
              << std::setw(10) << "Speedup"
              << std::setw(6)  << "Same"
              << "\n";
    std::cout << std::string(84, '-') << "\n";

    bool all_same = true;
    for (int n : record_counts) {
        BenchmarkResult r = run_benchmark(n, patch_count);
        all_same = all_same && r.same_result;

        double speedup = (r.jpatch_ms > 0.0001) ? r.nlohmann_ms / r.jpatch_ms : 0.0;

        std::cout << std::left
                  << std::setw(10) << r.record_count
                  << std::setw(14) << r.doc_json_bytes
                  << std::setw(14) << std::fixed << std::setprecision(3) << r.import_ms
                  << std::setw(14) << std::fixed << std::setprecision(3) << r.jpatch_ms
                  << std::setw(16) << std::fixed << std::setprecision(3) << r.nlohmann_ms
                  << std::setw(10) << std::fixed << std::setprecision(2) << speedup
                  << std::setw(6)  << (r.same_result ? "yes" : "NO")
                  << "\n";
    }

    std::cout << "\nColumn legend:\n";
    std::cout << "  Import(ms)   : one-time nlohmann::json -> jpatch::value conversion.\n";
    std::cout << "  jpatch(ms)   : apply all patches, keeping every version alive.\n";
    std::cout << "  nlohmann(ms) : deep copy + json::patch per version.\n";
    std::cout << "  Speedup      : nlohmann / jpatch.\n";
    std::cout << "=============================================================================\n";

    return all_same ? 0 : 1;
}
