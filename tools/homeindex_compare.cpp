// Builds both indexes over a synthetic dataset, replays random filters through
// the planner and prints per-path latency and agreement.

#include "homeindex/index_set.hpp"
#include "homeindex/search/query_planner.hpp"
#include "tests/support/dataset_generator.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using homeindex::IndexConfig;
using homeindex::merge_strategy;
using homeindex::search::QueryPlanner;
using homeindex::test::DatasetParams;

namespace {
struct Args {
    std::size_t n{100'000};
    std::size_t queries{1'000};
    std::uint32_t seed{42};
    std::optional<merge_strategy> merge;        // unset => environment / default
    std::optional<std::int64_t> price_bucket;   // unset => environment / default
};

static std::optional<std::string> eat(std::string_view a, std::string_view key) {
    if (a.rfind(key, 0) == 0) return std::string(a.substr(key.size()));
    return std::nullopt;
}

static void print_usage() {
    std::cout << "homeindex compare\n"
              << "Usage: homeindex_compare [--n=100000] [--queries=1000] [--seed=42]\n"
              << "  [--merge=pairwise|heap] [--price_bucket=50000]\n"
              << "Environment: HOMEINDEX_PRICE_BUCKET, HOMEINDEX_YEAR_BUCKET, HOMEINDEX_MERGE, HOMEINDEX_DEBUG\n";
}

static double percentile(std::vector<double> v, double p) {
    if (v.empty()) return 0.0;
    std::sort(v.begin(), v.end());
    const auto idx = static_cast<std::size_t>(p * static_cast<double>(v.size() - 1));
    return v[idx];
}
}

int main(int argc, char** argv) {
    Args args;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string a(argv[i]);
            if (a == "--help" || a == "-h") { print_usage(); return 0; }
            else if (auto v = eat(a, "--n=")) args.n = static_cast<std::size_t>(std::stoull(*v));
            else if (auto v = eat(a, "--queries=")) args.queries = static_cast<std::size_t>(std::stoull(*v));
            else if (auto v = eat(a, "--seed=")) args.seed = static_cast<std::uint32_t>(std::stoul(*v));
            else if (auto v = eat(a, "--price_bucket=")) args.price_bucket = std::stoll(*v);
            else if (auto v = eat(a, "--merge=")) {
                if (*v == "pairwise") args.merge = merge_strategy::pairwise;
                else if (*v == "heap") args.merge = merge_strategy::heap;
                else { std::cerr << "Unknown merge strategy: " << *v << "\n"; return 2; }
            }
            else { std::cerr << "Unknown arg: " << a << "\n"; print_usage(); return 2; }
        }
    } catch (const std::exception& e) {
        std::cerr << "Bad argument: " << e.what() << "\n";
        return 2;
    }

    auto cfg = IndexConfig::from_env();
    if (!cfg) {
        std::cerr << "Config error: " << cfg.error().message << "\n";
        return 1;
    }
    if (args.merge) cfg->merge = *args.merge;
    if (args.price_bucket) cfg->price_bucket_width = *args.price_bucket;

    DatasetParams params;
    params.count = args.n;
    params.seed = args.seed;

    const auto t0 = std::chrono::steady_clock::now();
    auto set = homeindex::build_indexes(homeindex::test::generate_properties(params), *cfg);
    if (!set) {
        std::cerr << "Build failed: " << homeindex::core::to_string(set.error().code)
                  << " " << set.error().message << "\n";
        return 1;
    }
    const double build_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - t0).count();

    QueryPlanner planner(*set);
    std::mt19937 rng(args.seed ^ 0x9e3779b9u);
    std::vector<double> hs_ms;
    std::vector<double> pl_ms;
    hs_ms.reserve(args.queries);
    pl_ms.reserve(args.queries);
    std::size_t total_matches = 0;
    std::size_t failures = 0;

    for (std::size_t q = 0; q < args.queries; ++q) {
        auto r = planner.query(homeindex::test::random_filter(rng, params));
        if (!r) {
            ++failures;
            std::cerr << "Query " << q << " failed: " << homeindex::core::to_string(r.error().code)
                      << " " << r.error().message << "\n";
            continue;
        }
        hs_ms.push_back(r->hash_set_ms());
        pl_ms.push_back(r->posting_list_ms());
        total_matches += r->ids.size();
    }

    const auto stats = planner.get_stats();
    std::cout << std::fixed << std::setprecision(4)
              << "properties=" << set->store().size()
              << " price_bucket=" << cfg->price_bucket_width
              << " year_bucket=" << cfg->year_bucket_width
              << " merge=" << homeindex::to_string(cfg->merge) << "\n"
              << "build_ms=" << build_ms
              << " hash_set_build_ms="
              << std::chrono::duration<double, std::milli>(set->hash_set().stats().build_time).count()
              << " posting_list_build_ms="
              << std::chrono::duration<double, std::milli>(set->posting_list().stats().build_time).count()
              << "\n"
              << "queries=" << stats.queries_executed
              << " mismatches=" << stats.mismatches
              << " avg_matches=" << (hs_ms.empty() ? 0.0 : static_cast<double>(total_matches) / hs_ms.size())
              << "\n"
              << "hash_set_ms p50=" << percentile(hs_ms, 0.50) << " p99=" << percentile(hs_ms, 0.99)
              << " total=" << std::chrono::duration<double, std::milli>(stats.hash_set_time).count() << "\n"
              << "posting_list_ms p50=" << percentile(pl_ms, 0.50) << " p99=" << percentile(pl_ms, 0.99)
              << " total=" << std::chrono::duration<double, std::milli>(stats.posting_list_time).count() << "\n";
    return failures == 0 ? 0 : 1;
}
