/**
 * @file similarity_search.cpp
 * @brief Example: rank candidate images by visual similarity to a query
 *
 * Usage: similarity_search <query> <candidate>... [--threshold t] [--cache-dir dir] [--verbose]
 */

#include <VisMatch/VisMatch.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

using namespace Vis::Match;

namespace {

void PrintUsage(const char* program) {
    printf("Usage: %s <query> <candidate>... [--threshold t] [--cache-dir dir] [--verbose]\n",
           program);
}

} // namespace

int main(int argc, char* argv[]) {
    printf("=== VisMatch %s Sample: Similarity Search ===\n\n", GetVersion());

    std::vector<std::string> paths;
    Matching::SearchParams params;
    std::string cacheDir;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--threshold") == 0 && i + 1 < argc) {
            params.threshold = std::atof(argv[++i]);
        } else if (std::strcmp(argv[i], "--cache-dir") == 0 && i + 1 < argc) {
            cacheDir = argv[++i];
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            Platform::SetLogLevel(spdlog::level::debug);
        } else {
            paths.emplace_back(argv[i]);
        }
    }

    if (paths.size() < 2) {
        PrintUsage(argv[0]);
        return 1;
    }

    try {
        auto source = std::make_shared<IO::FileImageSource>();

        std::shared_ptr<Feature::FeatureCache> cache;
        if (!cacheDir.empty()) {
            auto store = std::make_shared<Feature::FileKeyValueStore>(cacheDir);
            cache = std::make_shared<Feature::FeatureCache>(store);
            auto stats = cache->Stats();
            printf("Cache: %zu entries, %zu bytes in '%s'\n\n",
                   stats.count, stats.sizeBytes, cacheDir.c_str());
        }

        auto matcher = std::make_shared<Matching::BatchMatcher>(source, cache);
        Matching::SimilaritySearch search(matcher);

        Matching::LabeledImage query{paths[0], paths[0], Matching::TagSet()};
        std::vector<Matching::LabeledImage> candidates;
        for (size_t i = 1; i < paths.size(); ++i) {
            candidates.push_back({paths[i], paths[i], Matching::TagSet()});
        }

        Platform::Timer timer(true);
        auto results = search.Run(query, candidates, params,
            [](size_t done, size_t total) {
                printf("\r  progress: %zu/%zu", done, total);
                std::fflush(stdout);
            });
        printf("\n\n");

        printf("%zu of %zu candidates at or above %.2f (%.1f ms):\n",
               results.size(), candidates.size(), params.threshold, timer.ElapsedMs());
        for (size_t i = 0; i < results.size(); ++i) {
            printf("  %2zu. %6.2f%%  %s\n", i + 1, results[i].similarity * 100.0,
                   results[i].imageUrl.c_str());
        }
    } catch (const Exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }

    printf("\n=== Done ===\n");
    return 0;
}
