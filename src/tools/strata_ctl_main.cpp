#include "strata/storage/key.hpp"
#include "strata/storage/remote_storage.hpp"
#include "strata/timeline/engine_metrics.hpp"
#include "strata/timeline/engine_telemetry_registry.hpp"
#include "strata/timeline/timeline_registry.hpp"
#include "strata/timeline/wal_ingest.hpp"

#include <CLI/CLI.hpp>
#include <glog/logging.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

using strata::storage::format_lsn;
using strata::timeline::EngineTelemetryRegistry;
using strata::timeline::RegistryConfig;
using strata::timeline::TimelineId;
using strata::timeline::TimelineInfo;
using strata::timeline::TimelineRegistry;

namespace {

constexpr std::size_t kIngestChunkBytes = 64U * 1024U;

struct GlobalOptions final {
    std::string data_dir = "strata-data";
    std::string remote_dir{};
    std::size_t checkpoint_distance_mib = 256U;
    std::uint64_t checkpoint_timeout_ms = 10U * 60U * 1000U;
    std::size_t max_frozen_mib = 1024U;
    std::size_t compaction_target_mib = 128U;
    std::size_t compaction_threshold = 10U;
    std::size_t image_creation_threshold = 3U;
    std::uint64_t compaction_period_ms = 20U * 1000U;
    std::uint64_t gc_horizon = 64U * 1024U * 1024U;
    std::uint64_t gc_period_ms = 100U * 1000U;
    std::uint64_t wait_lsn_timeout_ms = 60U * 1000U;
    std::size_t page_cache_mib = 64U;
    std::size_t remote_retry_attempts = 5U;
    std::uint64_t remote_retry_base_delay_ms = 50U;
};

std::string format_bytes(std::uint64_t bytes)
{
    if (bytes == 0U) {
        return "0 B";
    }
    constexpr double kScale = 1024.0;
    const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    constexpr std::size_t kUnitCount = sizeof(units) / sizeof(units[0]);
    double value = static_cast<double>(bytes);
    std::size_t index = 0U;
    while (value >= kScale && index < kUnitCount - 1U) {
        value /= kScale;
        ++index;
    }
    std::ostringstream stream;
    const int precision = value < 10.0 ? 2 : 1;
    stream << std::fixed << std::setprecision(index == 0U ? 0 : precision) << value << ' ' << units[index];
    return stream.str();
}

std::string to_hex(const std::vector<std::byte>& bytes)
{
    std::ostringstream stream;
    stream << std::hex << std::setfill('0');
    for (std::size_t index = 0U; index < bytes.size(); ++index) {
        if (index != 0U && index % 32U == 0U) {
            stream << '\n';
        }
        stream << std::setw(2) << static_cast<unsigned>(std::to_integer<std::uint8_t>(bytes[index]));
    }
    return stream.str();
}

void check(const std::error_code& ec, const std::string& what)
{
    if (ec) {
        throw std::runtime_error(what + ": " + ec.message());
    }
}

TimelineId parse_id(const std::string& text)
{
    const auto id = TimelineId::parse(text);
    if (!id) {
        throw std::runtime_error("invalid timeline id: " + text);
    }
    return *id;
}

std::uint64_t parse_lsn_option(const std::string& text)
{
    if (const auto lsn = strata::storage::parse_lsn(text)) {
        return *lsn;
    }
    throw std::runtime_error("invalid lsn: " + text);
}

RegistryConfig make_config(const GlobalOptions& options, EngineTelemetryRegistry* telemetry)
{
    RegistryConfig config{};
    config.data_dir = options.data_dir;
    config.timeline.checkpoint_distance = options.checkpoint_distance_mib * 1024U * 1024U;
    config.timeline.checkpoint_timeout = std::chrono::milliseconds{options.checkpoint_timeout_ms};
    config.timeline.max_frozen_bytes = options.max_frozen_mib * 1024U * 1024U;
    config.timeline.compaction_period = std::chrono::milliseconds{options.compaction_period_ms};
    config.timeline.compaction_target_size = options.compaction_target_mib * 1024U * 1024U;
    config.timeline.compaction_threshold = options.compaction_threshold;
    config.timeline.image_creation_threshold = options.image_creation_threshold;
    config.timeline.gc_horizon = options.gc_horizon;
    config.timeline.gc_period = std::chrono::milliseconds{options.gc_period_ms};
    config.timeline.wait_lsn_timeout = std::chrono::milliseconds{options.wait_lsn_timeout_ms};
    config.timeline.remote_retry.max_attempts = options.remote_retry_attempts;
    config.timeline.remote_retry.base_delay = std::chrono::milliseconds{options.remote_retry_base_delay_ms};
    config.page_cache.capacity_bytes = options.page_cache_mib * 1024U * 1024U;
    if (!options.remote_dir.empty()) {
        config.remote = std::make_shared<strata::storage::LocalRemoteStorage>(options.remote_dir);
    }
    config.telemetry_registry = telemetry;
    return config;
}

std::unique_ptr<TimelineRegistry> open_registry(const GlobalOptions& options, EngineTelemetryRegistry* telemetry = nullptr)
{
    auto registry = std::make_unique<TimelineRegistry>(make_config(options, telemetry));
    check(registry->load(), "failed to load " + options.data_dir);
    return registry;
}

void print_info(const TimelineInfo& info, std::ostream& out)
{
    out << "timeline " << info.id.to_string() << '\n';
    if (info.ancestor_id) {
        out << "  ancestor              : " << info.ancestor_id->to_string() << " @ " << format_lsn(info.ancestor_lsn)
            << '\n';
    }
    out << "  state                 : " << strata::timeline::to_string(info.state) << '\n';
    out << "  last_record_lsn       : " << format_lsn(info.last_record_lsn) << '\n';
    out << "  prev_record_lsn       : " << format_lsn(info.prev_record_lsn) << '\n';
    out << "  disk_consistent_lsn   : " << format_lsn(info.disk_consistent_lsn) << '\n';
    out << "  remote_consistent_lsn : " << format_lsn(info.remote_consistent_lsn) << '\n';
    out << "  gc_cutoff_lsn         : " << format_lsn(info.gc_cutoff_lsn) << '\n';
    out << "  layers (delta/image)  : " << info.delta_layers << " / " << info.image_layers << '\n';
    out << "  physical size         : " << format_bytes(info.physical_size) << '\n';
}

void write_output(const std::string& text, const std::string& output_path)
{
    if (output_path.empty()) {
        std::cout << text;
        return;
    }
    std::ofstream file{output_path, std::ios::out | std::ios::trunc};
    if (!file.is_open()) {
        throw std::runtime_error("failed to open output file: " + output_path);
    }
    file << text;
}

void ingest_file(const GlobalOptions& options,
                 const std::string& timeline_text,
                 const std::string& wal_path,
                 const std::string& start_lsn_text,
                 bool emit_metrics)
{
    EngineTelemetryRegistry telemetry;
    auto registry = open_registry(options, &telemetry);
    const auto timeline = registry->get(parse_id(timeline_text));
    if (!timeline) {
        throw std::runtime_error("timeline not found: " + timeline_text);
    }

    std::ifstream file{wal_path, std::ios::binary};
    if (!file.is_open()) {
        throw std::runtime_error("failed to open WAL file: " + wal_path);
    }

    const auto start_lsn = parse_lsn_option(start_lsn_text);
    strata::timeline::WalIngest ingest{timeline, start_lsn};
    std::vector<std::byte> chunk(kIngestChunkBytes);
    while (file) {
        file.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
        const auto read = static_cast<std::size_t>(file.gcount());
        if (read == 0U) {
            break;
        }
        check(ingest.feed(std::span<const std::byte>{chunk.data(), read}), "ingest failed");
    }
    check(timeline->checkpoint(), "checkpoint failed");

    const auto& stats = ingest.stats();
    std::cout << "decoded " << stats.records_decoded << " records, ingested " << stats.records_ingested << ", skipped "
              << stats.records_skipped << "; last_record_lsn " << format_lsn(timeline->last_record_lsn()) << '\n';
    if (emit_metrics) {
        std::cout << strata::timeline::engine_metrics_to_openmetrics(strata::timeline::collect_engine_metrics(telemetry));
    }
}

void print_layers(const GlobalOptions& options, const std::string& timeline_text)
{
    auto registry = open_registry(options);
    const auto timeline = registry->get(parse_id(timeline_text));
    if (!timeline) {
        throw std::runtime_error("timeline not found: " + timeline_text);
    }

    const auto snapshot = timeline->layers();
    for (const auto& layer : snapshot->historic_layers()) {
        std::cout << layer->descriptor().to_string() << "  " << format_bytes(layer->file_size())
                  << (layer->uploaded() ? "  uploaded" : "") << '\n';
    }
    if (const auto& open = snapshot->open_layer()) {
        std::cout << "open layer from " << format_lsn(open->start_lsn()) << ", " << format_bytes(open->size_bytes()) << '\n';
    }
}

}  // namespace

int main(int argc, char** argv)
{
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    CLI::App app{"Operational tooling for the strata timeline storage engine"};
    app.require_subcommand(1);
    app.set_config("--config", "", "Read options from an INI or TOML file");

    GlobalOptions options{};
    app.add_option("-d,--data-dir", options.data_dir, "Data directory")->capture_default_str();
    app.add_option("--remote-dir", options.remote_dir, "Directory used as remote object storage");
    app.add_option("--checkpoint-distance-mib", options.checkpoint_distance_mib, "Open layer size that triggers a flush")
        ->capture_default_str();
    app.add_option("--checkpoint-timeout-ms", options.checkpoint_timeout_ms, "Age of unflushed data that triggers a flush")
        ->capture_default_str();
    app.add_option("--max-frozen-mib", options.max_frozen_mib, "Frozen layer bytes before ingest waits for flushes")
        ->capture_default_str();
    app.add_option("--compaction-period-ms", options.compaction_period_ms, "Interval of the compaction loop")
        ->capture_default_str();
    app.add_option("--compaction-target-mib", options.compaction_target_mib, "Target size of compacted layers")
        ->capture_default_str();
    app.add_option("--compaction-threshold", options.compaction_threshold, "Level-0 layers that trigger compaction")
        ->capture_default_str();
    app.add_option("--image-creation-threshold", options.image_creation_threshold, "Deltas above the newest image that trigger image creation")
        ->capture_default_str();
    app.add_option("--gc-horizon", options.gc_horizon, "WAL distance retained behind last_record_lsn")->capture_default_str();
    app.add_option("--gc-period-ms", options.gc_period_ms, "Interval of the GC loop")->capture_default_str();
    app.add_option("--wait-lsn-timeout-ms", options.wait_lsn_timeout_ms, "Default wait for an LSN to arrive")
        ->capture_default_str();
    app.add_option("--page-cache-mib", options.page_cache_mib, "Page cache capacity")->capture_default_str();
    app.add_option("--remote-retry-attempts", options.remote_retry_attempts, "Remote storage attempts per operation")
        ->capture_default_str();
    app.add_option("--remote-retry-base-delay-ms", options.remote_retry_base_delay_ms, "First remote retry delay")
        ->capture_default_str();

    std::string create_id;
    auto* create = app.add_subcommand("create", "Create a root timeline");
    create->add_option("--id", create_id, "Timeline id (generated when omitted)");
    create->callback([&]() {
        auto registry = open_registry(options);
        std::optional<TimelineId> requested;
        if (!create_id.empty()) {
            requested = parse_id(create_id);
        }
        TimelineId created{};
        check(registry->create_timeline(requested, created), "create failed");
        std::cout << created.to_string() << '\n';
    });

    std::string branch_ancestor;
    std::string branch_lsn;
    std::string branch_id;
    auto* branch = app.add_subcommand("branch", "Branch a timeline at an LSN");
    branch->add_option("--ancestor", branch_ancestor, "Ancestor timeline id")->required();
    branch->add_option("--lsn", branch_lsn, "Branch point (decimal or XXXXXXXX/XXXXXXXX); defaults to last_record_lsn");
    branch->add_option("--id", branch_id, "New timeline id (generated when omitted)");
    branch->callback([&]() {
        auto registry = open_registry(options);
        const auto ancestor = parse_id(branch_ancestor);
        std::uint64_t lsn = 0U;
        if (branch_lsn.empty()) {
            check(registry->get_last_record_lsn(ancestor, lsn), "branch failed");
        } else {
            lsn = parse_lsn_option(branch_lsn);
        }
        std::optional<TimelineId> requested;
        if (!branch_id.empty()) {
            requested = parse_id(branch_id);
        }
        TimelineId created{};
        check(registry->create_branch(ancestor, lsn, requested, created), "branch failed");
        std::cout << created.to_string() << '\n';
    });

    std::string ingest_timeline;
    std::string ingest_file_path;
    std::string ingest_start_lsn = "0";
    bool ingest_metrics = false;
    auto* ingest = app.add_subcommand("ingest", "Feed a WAL byte file into a timeline");
    ingest->add_option("--timeline", ingest_timeline, "Timeline id")->required();
    ingest->add_option("--file", ingest_file_path, "WAL file")->required()->check(CLI::ExistingFile);
    ingest->add_option("--start-lsn", ingest_start_lsn, "WAL position of the file's first byte")->capture_default_str();
    ingest->add_flag("--metrics", ingest_metrics, "Print OpenMetrics counters after ingesting");
    ingest->callback([&]() { ingest_file(options, ingest_timeline, ingest_file_path, ingest_start_lsn, ingest_metrics); });

    std::string page_timeline;
    std::uint32_t page_block = 0U;
    std::string page_key;
    std::string page_lsn;
    bool page_u64 = false;
    auto* get_page = app.add_subcommand("get-page", "Reconstruct a page and print it");
    get_page->add_option("--timeline", page_timeline, "Timeline id")->required();
    auto* block_option = get_page->add_option("--block", page_block, "Block of the default relation");
    get_page->add_option("--key", page_key, "Full key as 34 hex digits")->excludes(block_option);
    get_page->add_option("--lsn", page_lsn, "Read LSN, decimal or XXXXXXXX/XXXXXXXX (defaults to last_record_lsn)");
    get_page->add_flag("--u64", page_u64, "Print the page as a little-endian integer");
    get_page->callback([&]() {
        auto registry = open_registry(options);
        const auto id = parse_id(page_timeline);
        auto key = strata::storage::Key::from_block(page_block);
        if (!page_key.empty()) {
            const auto parsed = strata::storage::Key::parse(page_key);
            if (!parsed) {
                throw std::runtime_error("invalid key: " + page_key);
            }
            key = *parsed;
        }
        std::uint64_t lsn = 0U;
        if (page_lsn.empty()) {
            check(registry->get_last_record_lsn(id, lsn), "get-page failed");
        } else {
            lsn = parse_lsn_option(page_lsn);
        }

        std::vector<std::byte> page;
        check(registry->get_page(id, key, lsn, page), "get-page failed");
        if (page_u64) {
            std::cout << strata::storage::decode_u64_page(page) << '\n';
        } else {
            std::cout << to_hex(page) << '\n';
        }
    });

    auto* list = app.add_subcommand("list", "List timelines");
    list->callback([&]() {
        auto registry = open_registry(options);
        for (const auto& info : registry->list_timelines()) {
            std::cout << info.id.to_string() << "  " << strata::timeline::to_string(info.state) << "  last "
                      << format_lsn(info.last_record_lsn);
            if (info.ancestor_id) {
                std::cout << "  ancestor " << info.ancestor_id->to_string() << " @ " << format_lsn(info.ancestor_lsn);
            }
            std::cout << '\n';
        }
    });

    std::string info_timeline;
    auto* info = app.add_subcommand("info", "Show timeline metadata");
    info->add_option("--timeline", info_timeline, "Timeline id")->required();
    info->callback([&]() {
        auto registry = open_registry(options);
        TimelineInfo timeline_info{};
        check(registry->timeline_info(parse_id(info_timeline), timeline_info), "info failed");
        print_info(timeline_info, std::cout);
    });

    std::string layers_timeline;
    auto* layers = app.add_subcommand("layers", "Dump a timeline's layer map");
    layers->add_option("--timeline", layers_timeline, "Timeline id")->required();
    layers->callback([&]() { print_layers(options, layers_timeline); });

    std::string compact_timeline;
    bool compact_force = false;
    auto* compact = app.add_subcommand("compact", "Run a compaction pass");
    compact->add_option("--timeline", compact_timeline, "Timeline id")->required();
    compact->add_flag("--force", compact_force, "Compact below the configured thresholds");
    compact->callback([&]() {
        auto registry = open_registry(options);
        strata::timeline::CompactionResult result{};
        check(registry->compact(parse_id(compact_timeline), compact_force, result), "compaction failed");
        std::cout << "merged " << result.level0_inputs << " level-0 layers into " << result.delta_layers_written
                  << " deltas; wrote " << result.image_layers_written << " image layers (" << result.images_keys
                  << " pages, " << format_bytes(result.bytes_written) << ") in " << result.elapsed.count() << " ms\n";
    });

    std::string gc_timeline;
    std::optional<std::uint64_t> gc_horizon;
    auto* gc = app.add_subcommand("gc", "Run garbage collection");
    gc->add_option("--timeline", gc_timeline, "Timeline id")->required();
    gc->add_option("--horizon", gc_horizon, "Override the configured GC horizon");
    gc->callback([&]() {
        auto registry = open_registry(options);
        strata::timeline::GcResult result{};
        check(registry->gc(parse_id(gc_timeline), gc_horizon, result), "gc failed");
        std::cout << "cutoff " << format_lsn(result.cutoff_lsn) << ": " << result.layers_total << " layers, "
                  << result.layers_needed_by_cutoff << " needed by cutoff, " << result.layers_needed_by_branches
                  << " needed by branches, " << result.layers_not_updated << " not updated, " << result.layers_removed
                  << " removed in " << result.elapsed.count() << " ms\n";
    });

    std::string delete_timeline;
    auto* remove = app.add_subcommand("delete", "Delete a timeline without children");
    remove->add_option("--timeline", delete_timeline, "Timeline id")->required();
    remove->callback([&]() {
        auto registry = open_registry(options);
        check(registry->delete_timeline(parse_id(delete_timeline)), "delete failed");
    });

    std::string metrics_output_path;
    auto* metrics = app.add_subcommand("metrics", "Export engine metrics in OpenMetrics format");
    metrics->add_option("-o,--output", metrics_output_path, "Write output to a file instead of stdout");
    metrics->callback([&]() {
        EngineTelemetryRegistry telemetry;
        auto registry = open_registry(options, &telemetry);
        write_output(strata::timeline::engine_metrics_to_openmetrics(strata::timeline::collect_engine_metrics(telemetry)),
                     metrics_output_path);
    });

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& error) {
        return app.exit(error);
    } catch (const std::exception& error) {
        std::cerr << "error: " << error.what() << '\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
