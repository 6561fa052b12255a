#include <string>
#include <cstdio>
#include <cstdlib>
#include <chrono>
#include <vector>

#include <nlohmann/json.hpp>
#include <lap/core/CTypedef.hpp>
#include "CGeoHistory.hpp"

using namespace lap;
using namespace lap::geo;

void printUsage(const char* programName) {
    printf("Usage: %s [options] <command> [args...]\n", programName);
    printf("\n");
    printf("Commands:\n");
    printf("  save --id <id> --lat <lat> --lon <lon> --desc <text>\n");
    printf("       [--mode <basic|function|grounding|image-search>] [--source <camera|upload>]\n");
    printf("       [--confidence <0..1>] [--timestamp <ms>]\n");
    printf("                               Save a new location record\n");
    printf("  list [limit]                 List record summaries, newest first (default 50)\n");
    printf("  get <id>                     Print one full record\n");
    printf("  search <term> [limit]        Search descriptions, case-insensitive (default 20)\n");
    printf("  delete <id>                  Delete a record\n");
    printf("  clear                        Delete all records\n");
    printf("  stats                        Print record statistics\n");
    printf("  export                       Print all records as a JSON array\n");
    printf("\n");
    printf("Options:\n");
    printf("  -r, --root <path>            Storage root (default: from config, %s)\n", LAP_GEO_DEFAULT_STORAGE_ROOT);
    printf("      --volatile               Disable the durable file area, use the backup snapshot\n");
    printf("  -h, --help                   Show this help message\n");
    printf("\n");
    printf("Examples:\n");
    printf("  %s save --id a1 --lat 35.68 --lon 139.76 --desc \"Tokyo Station, Japan\"\n", programName);
    printf("  %s search station\n", programName);
    printf("  %s --volatile list 10\n", programName);
}

bool parseLimit(const std::string& str, core::UInt32& limit) {
    auto parsed = LimitFromString(str);
    if (!parsed.HasValue()) return false;

    limit = parsed.Value();
    return true;
}

void reportOutcome(const MutationOutcome& outcome) {
    if (!outcome.IsDurable()) {
        fprintf(stderr, "Warning: change applied but not yet durable: %s\n", outcome.detail.c_str());
    }
}

int runSave(LocationHistoryStore& store, const std::vector<std::string>& args) {
    LocationRecord record;
    record.timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::system_clock::now().time_since_epoch()).count();
    bool hasLat = false, hasLon = false, hasDesc = false;

    try {
        for (size_t i = 1; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (i + 1 >= args.size()) {
                fprintf(stderr, "Error: %s requires an argument\n", arg.c_str());
                return 1;
            }
            const std::string& value = args[++i];

            if (arg == "--id") {
                record.id = value;
            } else if (arg == "--lat") {
                record.latitude = std::stod(value);
                hasLat = true;
            } else if (arg == "--lon") {
                record.longitude = std::stod(value);
                hasLon = true;
            } else if (arg == "--desc") {
                record.description = value;
                hasDesc = true;
            } else if (arg == "--mode") {
                auto mode = AnalysisModeFromString(value);
                if (!mode.HasValue()) {
                    fprintf(stderr, "Error: Invalid analysis mode %s\n", value.c_str());
                    return 1;
                }
                record.analysisMode = mode.Value();
            } else if (arg == "--source") {
                auto source = RecordSourceFromString(value);
                if (!source.HasValue()) {
                    fprintf(stderr, "Error: Invalid source %s\n", value.c_str());
                    return 1;
                }
                record.source = source.Value();
            } else if (arg == "--confidence") {
                record.confidenceScore = std::stod(value);
            } else if (arg == "--timestamp") {
                record.timestamp = std::stoll(value);
            } else {
                fprintf(stderr, "Error: Unknown save option %s\n", arg.c_str());
                return 1;
            }
        }
    } catch (const std::exception&) {
        fprintf(stderr, "Error: Invalid numeric argument\n");
        return 1;
    }

    if (record.id.empty() || !hasLat || !hasLon || !hasDesc) {
        fprintf(stderr, "Error: save requires --id, --lat, --lon and --desc\n");
        return 1;
    }

    auto result = store.Save(record);
    if (!result.HasValue()) {
        fprintf(stderr, "Error: Failed to save record: %s\n", std::string(result.Error().Message()).c_str());
        return 1;
    }

    reportOutcome(result.Value());
    printf("Record %s saved\n", record.id.c_str());
    return 0;
}

void printSummaries(const core::Vector<LocationSummary>& summaries) {
    if (summaries.empty()) {
        printf("No records found\n");
        return;
    }

    for (const auto& summary : summaries) {
        printf("%-24s %11.6f %12.6f  %-6s  %s\n",
               summary.id.c_str(), summary.latitude, summary.longitude,
               ToString(summary.source), summary.description.c_str());
    }
}

int main(int argc, char* argv[]) {
    std::string storageRoot;
    bool forceVolatile = false;
    std::vector<std::string> args;

    // Global options come before the command
    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "-r" || arg == "--root") {
            if (i + 1 < argc) {
                storageRoot = argv[++i];
            } else {
                fprintf(stderr, "Error: --root requires an argument\n");
                printUsage(argv[0]);
                return 1;
            }
        } else if (arg == "--volatile") {
            forceVolatile = true;
        } else if (arg.find("-") == 0) {
            fprintf(stderr, "Error: Unknown option %s\n", arg.c_str());
            printUsage(argv[0]);
            return 1;
        } else {
            break;
        }
    }
    for (; i < argc; ++i) {
        args.push_back(argv[i]);
    }

    if (args.empty()) {
        fprintf(stderr, "Error: No command specified\n");
        printUsage(argv[0]);
        return 1;
    }

    // Initialize logging system
    ::lap::log::LogManager::getInstance().initialize();

    auto configResult = LoadStoreConfig();
    if (!configResult.HasValue()) {
        fprintf(stderr, "Error: Failed to load config: %s\n", std::string(configResult.Error().Message()).c_str());
        return 1;
    }

    StoreConfig config = configResult.Value();
    if (!storageRoot.empty()) config.storageRoot = storageRoot;
    if (forceVolatile) config.durableAreaEnabled = false;

    auto validResult = ValidateStoreConfig(config);
    if (!validResult.HasValue()) {
        fprintf(stderr, "Error: Invalid config: %s\n", std::string(validResult.Error().Message()).c_str());
        return 1;
    }

    LocationHistoryStore store(config);
    std::string command = args[0];

    if (command == "save") {
        return runSave(store, args);

    } else if (command == "list") {
        core::UInt32 limit = LAP_GEO_DEFAULT_LIST_LIMIT;
        if (args.size() > 1 && !parseLimit(args[1], limit)) {
            fprintf(stderr, "Error: Invalid limit %s\n", args[1].c_str());
            return 1;
        }

        auto result = store.List(limit);
        if (!result.HasValue()) {
            fprintf(stderr, "Error: Failed to list records: %s\n", std::string(result.Error().Message()).c_str());
            return 1;
        }
        printSummaries(result.Value());

    } else if (command == "get") {
        if (args.size() < 2) {
            fprintf(stderr, "Error: get command requires an id\n");
            return 1;
        }

        auto result = store.GetById(args[1]);
        if (!result.HasValue()) {
            fprintf(stderr, "Error: Failed to get record: %s\n", std::string(result.Error().Message()).c_str());
            return 1;
        }
        if (!result.Value().has_value()) {
            printf("Record %s not found\n", args[1].c_str());
            return 0;
        }
        printf("%s\n", nlohmann::json(*result.Value()).dump(2).c_str());

    } else if (command == "search") {
        if (args.size() < 2) {
            fprintf(stderr, "Error: search command requires a term\n");
            return 1;
        }

        core::UInt32 limit = LAP_GEO_DEFAULT_SEARCH_LIMIT;
        if (args.size() > 2 && !parseLimit(args[2], limit)) {
            fprintf(stderr, "Error: Invalid limit %s\n", args[2].c_str());
            return 1;
        }

        auto result = store.Search(args[1], limit);
        if (!result.HasValue()) {
            fprintf(stderr, "Error: Failed to search records: %s\n", std::string(result.Error().Message()).c_str());
            return 1;
        }
        printSummaries(result.Value());

    } else if (command == "delete" || command == "remove") {
        if (args.size() < 2) {
            fprintf(stderr, "Error: delete command requires an id\n");
            return 1;
        }

        auto result = store.Delete(args[1]);
        if (!result.HasValue()) {
            fprintf(stderr, "Error: Failed to delete record: %s\n", std::string(result.Error().Message()).c_str());
            return 1;
        }
        reportOutcome(result.Value());
        printf("%s\n", result.Value().affectedRows > 0 ? "Record deleted" : "Record not present");

    } else if (command == "clear") {
        auto result = store.ClearAll();
        if (!result.HasValue()) {
            fprintf(stderr, "Error: Failed to clear records: %s\n", std::string(result.Error().Message()).c_str());
            return 1;
        }
        reportOutcome(result.Value());
        printf("Cleared %lld records\n", static_cast<long long>(result.Value().affectedRows));

    } else if (command == "stats") {
        auto result = store.GetStatistics();
        if (!result.HasValue()) {
            fprintf(stderr, "Error: Failed to read statistics: %s\n", std::string(result.Error().Message()).c_str());
            return 1;
        }
        printf("%s\n", nlohmann::json(result.Value()).dump(2).c_str());
        printf("Strategy: %s\n", ToString(store.GetActiveStrategy()));

    } else if (command == "export") {
        auto result = store.ExportAll();
        if (!result.HasValue()) {
            fprintf(stderr, "Error: Failed to export records: %s\n", std::string(result.Error().Message()).c_str());
            return 1;
        }
        printf("%s\n", nlohmann::json(result.Value()).dump(2).c_str());

    } else {
        fprintf(stderr, "Error: Unknown command '%s'\n", command.c_str());
        printUsage(argv[0]);
        return 1;
    }

    return 0;
}
