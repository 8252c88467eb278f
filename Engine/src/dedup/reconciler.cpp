#include <dedup/reconciler.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <stdexcept>

namespace Lookalike {

Reconciler::Reconciler(RelationStore& store, size_t batch_size)
    : store_(store), batch_size_(batch_size) {
    if (batch_size_ == 0) {
        throw std::invalid_argument("Reconciler: batch size must be > 0");
    }
}

ReconcileResult Reconciler::reconcile(const std::vector<Candidate>& candidates, bool include_annotated) const {
    ReconcileResult result;

    // Sorted and unique by pair; chunks then yield relations already in order.
    std::vector<Candidate> sorted(candidates);
    std::sort(sorted.begin(), sorted.end(), [](const Candidate& x, const Candidate& y) { return x.pair < y.pair; });
    sorted.erase(std::unique(sorted.begin(), sorted.end(),
                             [](const Candidate& x, const Candidate& y) { return x.pair == y.pair; }),
                 sorted.end());

    for (size_t start = 0; start < sorted.size(); start += batch_size_) {
        size_t end = std::min(start + batch_size_, sorted.size());
        reconcile_chunk(std::vector<Candidate>(sorted.begin() + start, sorted.begin() + end),
                        include_annotated, result);
    }

    if (!result.failures.empty()) {
        Logger::warn(std::to_string(result.failures.size()) + " candidate writes rejected; first: " +
                     to_string(result.failures.front().pair) + " " + result.failures.front().reason);
    }
    if (!result.warnings.empty()) {
        Logger::warn("Partial result: " + std::to_string(result.warnings.size()) +
                     " pairs excluded; first: " + to_string(result.warnings.front().pair) + " " +
                     result.warnings.front().reason);
    }
    return result;
}

void Reconciler::reconcile_chunk(std::vector<Candidate> chunk, bool include_annotated, ReconcileResult& result) const {
    // 1. Insert-if-absent only. Rediscovery never carries a kind into storage.
    for (auto& c : chunk) c.kind = RelationKind::NewMatch;

    BatchResult written = store_.upsert_if_absent(chunk);
    result.inserted += written.inserted.size();
    result.existing += written.existing.size();
    result.failures.insert(result.failures.end(), written.failures.begin(), written.failures.end());

    // 2. Authoritative re-read, strictly after the writes above returned.
    std::vector<PairKey> pairs;
    pairs.reserve(chunk.size());
    for (const auto& c : chunk) pairs.push_back(c.pair);

    RelationMap stored;
    try {
        stored = store_.get_relations(pairs);
    } catch (const std::exception& e) {
        const auto* store_error = dynamic_cast<const StoreError*>(&e);
        ErrorKind kind = store_error ? store_error->kind() : ErrorKind::TransientStorageError;
        for (const auto& pair : pairs) {
            result.warnings.push_back({pair, kind, std::string("re-read failed: ") + e.what()});
        }
        return;
    }

    // 3. The visibility decision, made only from stored state.
    for (const auto& pair : pairs) {
        auto it = stored.find(pair);
        if (it == stored.end()) {
            result.warnings.push_back({pair, ErrorKind::NotFound, "no stored relation after upsert"});
            continue;
        }
        if (visible(it->second, include_annotated)) {
            result.relations.push_back(it->second);
        }
    }
}

} // namespace Lookalike
