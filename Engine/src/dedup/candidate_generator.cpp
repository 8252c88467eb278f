#include <dedup/candidate_generator.hpp>
#include <index/multi_index_hash.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <algorithm>
#include <exception>
#include <memory>
#include <omp.h>

namespace Lookalike {

CandidateGenerator::CandidateGenerator(RelationStore& store) : store_(store) {}

size_t CandidateGenerator::load(FingerprintIndex& index, const SourceScope& scope) {
    Timer timer;
    // Scope filters the input, so excluded items never cost a query.
    auto items = store_.live_items(scope);
    index.build(items);
    Logger::info("Indexed " + std::to_string(items.size()) + " items (" +
                 std::to_string(index.group_count()) + " distinct fingerprints) in " +
                 std::to_string(static_cast<int>(timer.elapsed_ms())) + "ms");
    return items.size();
}

CandidateSet CandidateGenerator::generate(const FingerprintIndex& index, const GeneratorOptions& options) const {
    Timer timer;
    CandidateSet result;

    std::vector<uint32_t> groups;
    groups.reserve(index.group_count());
    for (size_t g = 0; g < index.group_count(); ++g) {
        if (!index.group_ids(g).empty()) groups.push_back(static_cast<uint32_t>(g));
    }
    result.stats.fingerprints = groups.size();

    // ---- Exact pass -------------------------------------------------------
    for (uint32_t g : groups) {
        if (options.cancel && options.cancel->cancelled()) {
            result.cancelled = true;
            break;
        }
        std::vector<ItemId> ids = index.group_ids(g);
        result.stats.items += ids.size();
        std::sort(ids.begin(), ids.end());
        for (size_t i = 0; i < ids.size(); ++i) {
            for (size_t j = i + 1; j < ids.size(); ++j) {
                result.candidates.push_back(Candidate{PairKey{ids[i], ids[j]}, 0});
            }
        }
    }
    result.stats.exact_pairs = result.candidates.size();

    // ---- Fuzzy pass -------------------------------------------------------
    if (!result.cancelled && options.threshold > 0 && groups.size() > 1) {
        std::unique_ptr<MultiIndexHash> mih;
        if (options.mih_slices > 0) {
            mih = std::make_unique<MultiIndexHash>(index.bits(), options.mih_slices);
            for (uint32_t g : groups) mih->add(g, index.group_fingerprint(g));
        }

        int num_threads = options.worker_threads > 0 ? options.worker_threads : omp_get_max_threads();
        std::vector<std::vector<Candidate>> locals(num_threads);
        std::exception_ptr failure;
        std::atomic<bool> failed{false};
        std::atomic<size_t> done{0};
        const size_t total = groups.size();
        const size_t report_every = std::max<size_t>(total / 100, 1);

        #pragma omp parallel for schedule(dynamic, 64) num_threads(num_threads)
        for (size_t i = 0; i < groups.size(); ++i) {
            if (failed.load(std::memory_order_relaxed) || (options.cancel && options.cancel->cancelled())) continue;
            auto& tl = locals[omp_get_thread_num()];
            try {
                const uint32_t g = groups[i];
                auto matches = mih ? mih->query(index.group_fingerprint(g), options.threshold)
                                   : index.query_groups(index.group_fingerprint(g), options.threshold);
                for (const auto& [h, distance] : matches) {
                    if (h <= g) continue;   // self, or emitted by the lower group
                    for (ItemId a : index.group_ids(g)) {
                        for (ItemId b : index.group_ids(h)) {
                            tl.push_back(Candidate{PairKey::make(a, b), distance});
                        }
                    }
                }
            } catch (const std::exception&) {
                #pragma omp critical(candidate_failure)
                {
                    if (!failure) failure = std::current_exception();
                }
                failed.store(true, std::memory_order_relaxed);
            }

            size_t n = done.fetch_add(1, std::memory_order_relaxed) + 1;
            if (options.progress && omp_get_thread_num() == 0 && n % report_every == 0) {
                options.progress(n, total);
            }
        }

        if (failure) std::rethrow_exception(failure);

        for (auto& tl : locals) {
            result.stats.fuzzy_pairs += tl.size();
            result.candidates.insert(result.candidates.end(), tl.begin(), tl.end());
        }
        result.cancelled = done.load() < total;
        if (options.progress) options.progress(done.load(), total);
    }

    std::sort(result.candidates.begin(), result.candidates.end(),
              [](const Candidate& x, const Candidate& y) { return x.pair < y.pair; });

    result.stats.elapsed_ms = timer.elapsed_ms();
    Logger::step("Generated " + std::to_string(result.candidates.size()) + " candidates (" +
                 std::to_string(result.stats.exact_pairs) + " exact, " +
                 std::to_string(result.stats.fuzzy_pairs) + " within " + std::to_string(options.threshold) +
                 ") in " + std::to_string(static_cast<int>(result.stats.elapsed_ms)) + "ms" +
                 (result.cancelled ? " [cancelled]" : ""));
    return result;
}

} // namespace Lookalike
