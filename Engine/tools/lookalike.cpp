#include <config/engine_config.hpp>
#include <dedup/duplicate_engine.hpp>
#include <storage/relation_store.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace Lookalike;

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--config FILE] <command> [args]\n";
    std::cerr << "\nCommands:\n";
    std::cerr << "  init                                  Create storage tables\n";
    std::cerr << "  import <file.tsv>                     Register items (id<TAB>hex fingerprint<TAB>source)\n";
    std::cerr << "  delete <id>                           Delete an item and its relations\n";
    std::cerr << "  scan [--threshold N] [--root DIR]... [--all]\n";
    std::cerr << "                                        Find duplicates (--all includes annotated pairs)\n";
    std::cerr << "  annotate <a> <b> <kind>               not_duplicate | near_duplicate | similar | same_set\n";
    std::cerr << "  reset <a> <b>                         Return a pair to new_match\n";
    std::cerr << "  check                                 Remove orphaned relations\n";
    std::cerr << "  clusters [--persist] [--root DIR]...  Show duplicate clusters\n";
    std::cerr << "\nExamples:\n";
    std::cerr << "  " << prog << " import scan.tsv\n";
    std::cerr << "  " << prog << " scan --threshold 8 --root /photos/2023\n";
}

static int64_t parse_id(const std::string& text) {
    size_t pos = 0;
    long long value = std::stoll(text, &pos);
    if (pos != text.size()) throw std::invalid_argument("Not an item id: " + text);
    return value;
}

static size_t import_tsv(DuplicateEngine& engine, const std::string& path, size_t bits) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Cannot open " + path);

    const size_t batch_size = 1000;
    std::vector<Item> batch;
    size_t written = 0;
    size_t failed = 0;
    size_t line_no = 0;

    auto flush = [&]() {
        if (batch.empty()) return;
        auto result = engine.register_items(batch);
        written += result.written;
        failed += result.failures.size();
        for (const auto& f : result.failures) {
            Logger::warn("Item " + std::to_string(f.id) + ": " + to_string(f.kind) + " " + f.reason);
        }
        batch.clear();
    };

    std::string line;
    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;

        std::istringstream fields(line);
        std::string id, hex, source;
        if (!std::getline(fields, id, '\t') || !std::getline(fields, hex, '\t')) {
            Logger::warn(path + ":" + std::to_string(line_no) + ": expected id and fingerprint");
            ++failed;
            continue;
        }
        std::getline(fields, source);

        try {
            batch.push_back(Item{parse_id(id), Fingerprint::from_hex(hex, bits), source});
        } catch (const std::exception& e) {
            Logger::warn(path + ":" + std::to_string(line_no) + ": " + e.what());
            ++failed;
            continue;
        }
        if (batch.size() >= batch_size) flush();
    }
    flush();

    if (failed > 0) Logger::warn(std::to_string(failed) + " lines rejected");
    return written;
}

static int cmd_scan(DuplicateEngine& engine, const std::vector<std::string>& args) {
    ScanRequest request;
    request.threshold = engine.config().default_threshold;
    std::vector<std::string> roots;

    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--threshold" && i + 1 < args.size()) {
            request.threshold = static_cast<uint32_t>(std::stoul(args[++i]));
        } else if (args[i] == "--root" && i + 1 < args.size()) {
            roots.push_back(args[++i]);
        } else if (args[i] == "--all") {
            request.include_annotated = true;
        } else {
            throw std::invalid_argument("Unknown scan option: " + args[i]);
        }
    }
    request.scope = SourceScope(roots);

    auto report = engine.find_duplicates(request);

    for (const auto& rel : report.relations) {
        std::cout << rel.pair.a << "\t" << rel.pair.b << "\t" << rel.distance << "\t"
                  << to_string(rel.kind) << "\t" << format_utc(rel.created_at) << "\n";
    }
    for (const auto& w : report.warnings) {
        std::cerr << "excluded " << to_string(w.pair) << ": " << to_string(w.kind) << " " << w.reason << "\n";
    }

    std::cerr << "\n=== Scan Complete ===\n"
              << "Items: " << report.stats.items << " (" << report.stats.fingerprints << " distinct fingerprints)\n"
              << "Candidates: " << report.stats.exact_pairs << " exact / " << report.stats.fuzzy_pairs << " fuzzy\n"
              << "Relations: " << report.inserted << " new / " << report.existing << " known / "
              << report.relations.size() << " shown\n"
              << "Write failures: " << report.failures.size() << "\n"
              << "Orphans swept: " << report.orphans_swept << "\n"
              << "Time: " << static_cast<int>(report.elapsed_ms) << "ms\n";

    return (report.warnings.empty() && report.failures.empty() && report.orphans_swept == 0) ? 0 : 2;
}

static int cmd_clusters(DuplicateEngine& engine, const std::vector<std::string>& args) {
    ClusterOptions options;
    std::vector<std::string> roots;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--persist") {
            options.persist_new = true;
        } else if (args[i] == "--root" && i + 1 < args.size()) {
            roots.push_back(args[++i]);
        } else {
            throw std::invalid_argument("Unknown clusters option: " + args[i]);
        }
    }
    options.scope = SourceScope(roots);

    auto projection = engine.project_clusters(options);
    for (const auto& cluster : projection.clusters) {
        std::cout << cluster.id << "\t" << cluster.name << "\t";
        for (size_t i = 0; i < cluster.members.size(); ++i) {
            if (i > 0) std::cout << ",";
            std::cout << cluster.members[i];
        }
        std::cout << "\n";
    }
    return 0;
}

int main(int argc, char** argv) {
    std::string config_path;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            usage(argv[0]);
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        usage(argv[0]);
        return 1;
    }

    const std::string command = args[0];
    args.erase(args.begin());

    try {
        EngineConfig config = config_path.empty() ? EngineConfig::from_env() : EngineConfig::from_file(config_path);
        auto store = open_relation_store(config);
        store->initialize();

        if (command == "init") {
            Logger::success("Storage ready (" + config.backend + ")");
            return 0;
        }

        DuplicateEngine engine(*store, config);

        if (command == "import" && args.size() == 1) {
            Timer timer;
            size_t written = import_tsv(engine, args[0], config.fingerprint_bits);
            Logger::success("Imported " + std::to_string(written) + " items in " +
                            std::to_string(static_cast<int>(timer.elapsed_ms())) + "ms");
            return 0;
        }
        if (command == "delete" && args.size() == 1) {
            size_t removed = engine.item_deleted(parse_id(args[0]));
            std::cout << "Deleted item " << args[0] << " (" << removed << " relations)\n";
            return 0;
        }
        if (command == "scan") {
            return cmd_scan(engine, args);
        }
        if (command == "annotate" && args.size() == 3) {
            auto kind = parse_relation_kind(args[2]);
            if (!kind) throw std::invalid_argument("Unknown relation kind: " + args[2]);
            auto pair = PairKey::make(parse_id(args[0]), parse_id(args[1]));
            engine.annotate(pair, *kind);
            std::cout << to_string(pair) << " -> " << to_string(*kind) << "\n";
            return 0;
        }
        if (command == "reset" && args.size() == 2) {
            auto pair = PairKey::make(parse_id(args[0]), parse_id(args[1]));
            engine.reset_annotation(pair);
            std::cout << to_string(pair) << " -> " << to_string(RelationKind::NewMatch) << "\n";
            return 0;
        }
        if (command == "check" && args.empty()) {
            size_t orphans = engine.integrity_check();
            std::cout << "Orphans removed: " << orphans << "\n";
            return orphans == 0 ? 0 : 2;
        }
        if (command == "clusters") {
            return cmd_clusters(engine, args);
        }

        usage(argv[0]);
        return 1;
    } catch (const StoreError& e) {
        std::cerr << "Error [" << to_string(e.kind()) << "]: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
