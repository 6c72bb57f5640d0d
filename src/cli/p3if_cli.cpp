// File: src/cli/p3if_cli.cpp
//
// Interactive CLI interface for P3IF
//
// Features:
// - Pattern and relationship editing
// - Search, metrics and validation reports
// - Multiplexing external JSON frameworks on the worker pool
// - JSON import/export and SQLite snapshots

#include "cli/p3if_cli.hpp"
#include "core/errors.hpp"
#include "io/json_codec.hpp"
#include "storage/sqlite_backend.hpp"
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace p3if {

namespace {

// Two decimals without touching the flags of the output stream
std::string FormatScore(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

} // namespace

P3ifCli::P3ifCli(const FrameworkConfig& config, std::ostream& out)
    : config_(config),
      out_(out),
      framework_(Framework::Create(config)),
      verbose_(config.framework.verbose),
      colors_enabled_(config.interface.colors_enabled)
{
    WorkerPool::Config pool_config;
    pool_config.num_threads = config.multiplex.worker_threads;
    pool_config.queue_capacity = config.multiplex.queue_capacity;
    pool_ = std::make_unique<WorkerPool>(pool_config);
}

P3ifCli::~P3ifCli() = default;

void P3ifCli::Run(std::istream& in) {
    PrintWelcome();

    std::string line;
    while (running_) {
        out_ << config_.interface.prompt;
        out_.flush();
        if (!std::getline(in, line)) {
            break;
        }
        if (line == "exit" || line == "quit") {
            break;
        }
        ProcessCommand(line);
    }

    out_ << "\n" << framework_->PatternCount() << " pattern(s), "
         << framework_->RelationshipCount() << " relationship(s). Goodbye.\n";
}

void P3ifCli::PrintWelcome() {
    out_ << C(Color::BOLD_CYAN) << "P3IF Pattern Framework" << C(Color::RESET) << "\n"
         << "Properties, Processes and Perspectives\n\n"
         << "Storage: " << config_.storage.type;
    if (config_.storage.type != "memory") {
        out_ << " (" << config_.storage.path << ")";
    }
    out_ << "\nLoaded " << framework_->PatternCount() << " pattern(s)\n"
         << "Type '/help' for available commands; any other input is a search.\n\n";
}

void P3ifCli::ProcessCommand(const std::string& input) {
    std::string line = Trim(input);
    if (line.empty()) return;

    commands_processed_++;
    try {
        if (line[0] == '/') {
            HandleCommand(line.substr(1));
        } else {
            Search(line);
        }
    } catch (const FrameworkError& e) {
        Error(std::string(ToString(e.code())) + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        Error(e.what());
    } catch (const std::out_of_range& e) {
        Error(std::string("Value out of range: ") + e.what());
    }
}

void P3ifCli::HandleCommand(const std::string& cmd) {
    std::istringstream iss(cmd);
    std::string command;
    iss >> command;

    if (command == "help") {
        ShowHelp();
    } else if (command == "stats") {
        ShowStatistics();
    } else if (command == "validate") {
        ShowValidation();
    } else if (command == "patterns") {
        std::string type;
        iss >> type;
        ShowPatterns(type);
    } else if (command == "relationships") {
        ShowRelationships();
    } else if (command == "search") {
        std::string query;
        std::getline(iss, query);
        Search(Trim(query));
    } else if (command == "add") {
        AddPattern(iss);
    } else if (command == "link") {
        Link(iss);
    } else if (command == "remove") {
        std::string id;
        iss >> id;
        RemovePattern(id);
    } else if (command == "unlink") {
        std::string id;
        iss >> id;
        Unlink(id);
    } else if (command == "swap" || command == "replace") {
        std::string old_id, new_id;
        iss >> old_id >> new_id;
        if (command == "swap") {
            Swap(old_id, new_id);
        } else {
            auto replacement = framework_->GetPattern(new_id);
            if (!replacement) {
                Error("Pattern not found: " + new_id);
                return;
            }
            SwapResult result = framework_->ReplacePattern(old_id, *replacement);
            out_ << C(Color::GREEN) << "✓ " << C(Color::RESET) << "Replaced " << old_id
                 << ", " << result.updated_relationships << " relationship(s) relinked\n";
        }
    } else if (command == "merge") {
        std::vector<std::string> files;
        std::string file;
        while (iss >> file) {
            files.push_back(file);
        }
        Merge(files);
    } else if (command == "export") {
        std::string path;
        iss >> path;
        Export(path);
    } else if (command == "import") {
        std::string path;
        iss >> path;
        Import(path);
    } else if (command == "export-sqlite") {
        std::string path;
        iss >> path;
        ExportSqlite(path);
    } else if (command == "policy") {
        std::string policy;
        iss >> policy;
        SetPolicy(policy);
    } else if (command == "config") {
        out_ << config_.ToYamlString();
    } else if (command == "verbose") {
        verbose_ = !verbose_;
        framework_->SetVerbose(verbose_);
        out_ << "Verbose mode: " << (verbose_ ? "ON" : "OFF") << "\n";
    } else if (command == "reset") {
        Reset();
    } else if (command == "exit" || command == "quit") {
        running_ = false;
    } else {
        Error("Unknown command: /" + command + " (type '/help' for available commands)");
    }
}

// ============================================================================
// Information
// ============================================================================

void P3ifCli::ShowHelp() {
    out_ << R"(
Available Commands:
===================

Patterns:
  <text>                          Search pattern names and descriptions
  /search <text>                  Same as above
  /patterns [type]                List patterns (property, process, perspective)
  /add <type> <domain|-> <name>   Add a pattern
  /remove <id>                    Remove a pattern (obeys the removal policy)

Relationships:
  /relationships                  List relationships
  /link <prop|-> <proc|-> <persp|-> [strength] [confidence]
                                  Connect up to three patterns
  /unlink <id>                    Remove a relationship
  /swap <old-id> <new-id>         Point relationships at another pattern
  /replace <old-id> <new-id>      Swap, then remove the old pattern

Information:
  /stats                          Show framework metrics
  /validate                       Run the validator
  /config                         Print the active configuration

Data:
  /merge <file> [file...]         Multiplex external JSON frameworks
  /import <file>                  Import an exported JSON document
  /export <file>                  Export to JSON
  /export-sqlite <db>             Copy everything into a SQLite database

Settings:
  /policy <restrict|cascade>      Set the pattern removal policy
  /verbose                        Toggle verbose output
  /reset                          Remove every pattern and relationship
  /help                           Show this help
  exit, quit                      Exit the program

)";
}

void P3ifCli::ShowStatistics() {
    Metrics metrics = framework_->GetMetrics();
    MetricsCache::Stats cache = framework_->GetMetricsCacheStats();

    out_ << "\n" << C(Color::BOLD) << "Framework Metrics" << C(Color::RESET) << "\n\n";

    out_ << "Patterns:\n";
    out_ << "  Total: " << metrics.total_patterns << "\n";
    out_ << "  Properties: " << metrics.property_count << "\n";
    out_ << "  Processes: " << metrics.process_count << "\n";
    out_ << "  Perspectives: " << metrics.perspective_count << "\n";
    out_ << "  Domains: " << metrics.domain_count << "\n";
    out_ << "  Orphaned: " << metrics.orphaned_patterns << "\n";
    out_ << "  Deprecated: " << metrics.deprecated_patterns << "\n\n";

    out_ << "Relationships:\n";
    out_ << "  Total: " << metrics.total_relationships << "\n";
    out_ << "  Average strength: " << FormatScore(metrics.average_relationship_strength) << "\n";
    out_ << "  Average confidence: " << FormatScore(metrics.average_confidence) << "\n\n";

    out_ << "Validation issues: " << metrics.validation_issues << "\n";

    if (verbose_) {
        out_ << "Metrics cache: " << cache.hits << " hit(s), " << cache.misses << " miss(es), "
             << cache.invalidations << " invalidation(s)\n";
    }

    auto storage = framework_->GetStorage();
    if (storage) {
        StorageStats storage_stats = storage->GetStats();
        out_ << "Storage: " << config_.storage.path << " ("
             << storage_stats.disk_usage_bytes / 1024 << " KB)\n";
    }
    out_ << "\n";
}

void P3ifCli::ShowValidation() {
    ValidationReport report = framework_->ValidateFramework();
    if (report.valid) {
        out_ << C(Color::BOLD_GREEN) << "✓ Framework is valid" << C(Color::RESET);
    } else {
        out_ << C(Color::BOLD_RED) << "✗ Framework has errors" << C(Color::RESET);
    }
    out_ << "\n" << FormatReport(report) << "\n";
}

void P3ifCli::PrintPattern(const Pattern& pattern) {
    out_ << "  " << C(Color::CYAN) << pattern.GetId() << C(Color::RESET)
         << "  [" << ToString(pattern.GetType()) << "] " << pattern.GetName();
    if (pattern.GetDomain()) {
        out_ << C(Color::DIM) << " (" << *pattern.GetDomain() << ")" << C(Color::RESET);
    }
    out_ << "\n";
}

void P3ifCli::ShowPatterns(const std::string& type_filter) {
    std::vector<Pattern> patterns = type_filter.empty()
        ? framework_->GetAllPatterns()
        : framework_->GetPatternsByType(ParsePatternType(type_filter));

    out_ << patterns.size() << " pattern(s)\n";
    for (const auto& pattern : patterns) {
        PrintPattern(pattern);
    }
}

void P3ifCli::ShowRelationships() {
    std::vector<Relationship> relationships = framework_->GetAllRelationships();
    out_ << relationships.size() << " relationship(s)\n";
    for (const auto& relationship : relationships) {
        out_ << "  " << C(Color::CYAN) << relationship.GetId() << C(Color::RESET) << "  "
             << relationship.GetPropertyId().value_or("-") << " / "
             << relationship.GetProcessId().value_or("-") << " / "
             << relationship.GetPerspectiveId().value_or("-")
             << "  strength=" << FormatScore(relationship.GetStrength())
             << " confidence=" << FormatScore(relationship.GetConfidence()) << "\n";
    }
}

void P3ifCli::Search(const std::string& query) {
    std::vector<Pattern> results = framework_->SearchPatterns(query);
    if (results.empty()) {
        out_ << "No patterns match \"" << query << "\"\n";
        return;
    }
    out_ << results.size() << " match(es)\n";
    for (const auto& pattern : results) {
        PrintPattern(pattern);
    }
}

// ============================================================================
// Editing
// ============================================================================

void P3ifCli::AddPattern(std::istringstream& args) {
    std::string type, domain, name;
    args >> type >> domain;
    std::getline(args, name);

    std::optional<std::string> pattern_domain;
    if (domain != "-") {
        pattern_domain = domain;
    }
    Pattern pattern = Pattern::Create(ParsePatternType(type), Trim(name), pattern_domain);
    std::string id = framework_->AddPattern(pattern);
    out_ << C(Color::GREEN) << "✓ " << C(Color::RESET) << "Added " << id << "\n";
}

void P3ifCli::Link(std::istringstream& args) {
    std::string slots[3];
    args >> slots[0] >> slots[1] >> slots[2];

    auto slot = [](const std::string& value) -> std::optional<std::string> {
        if (value.empty() || value == "-") return std::nullopt;
        return value;
    };

    double strength = 0.5;
    double confidence = 1.0;
    std::string value;
    if (args >> value) strength = std::stod(value);
    if (args >> value) confidence = std::stod(value);

    Relationship relationship = Relationship::Connect(slot(slots[0]), slot(slots[1]), slot(slots[2]),
                                                      strength, confidence);
    std::string id = framework_->AddRelationship(relationship);
    out_ << C(Color::GREEN) << "✓ " << C(Color::RESET) << "Linked " << id << "\n";
}

void P3ifCli::RemovePattern(const std::string& id) {
    if (framework_->RemovePattern(id)) {
        out_ << "Removed " << id << "\n";
    } else {
        out_ << "No pattern " << id << "\n";
    }
}

void P3ifCli::Unlink(const std::string& id) {
    if (framework_->RemoveRelationship(id)) {
        out_ << "Removed relationship " << id << "\n";
    } else {
        out_ << "No relationship " << id << "\n";
    }
}

void P3ifCli::Swap(const std::string& old_id, const std::string& new_id) {
    size_t updated = framework_->HotSwapDimension(old_id, new_id);
    out_ << C(Color::GREEN) << "✓ " << C(Color::RESET) << "Relinked " << updated
         << " relationship(s) from " << old_id << " to " << new_id << "\n";
}

void P3ifCli::SetPolicy(const std::string& policy) {
    framework_->SetRemovalPolicy(ParseRemovalPolicy(policy));
    out_ << "Removal policy: " << ToString(framework_->GetRemovalPolicy()) << "\n";
}

void P3ifCli::Reset() {
    framework_->Clear();
    out_ << "✓ Framework cleared\n";
}

// ============================================================================
// Data
// ============================================================================

void P3ifCli::Merge(const std::vector<std::string>& files) {
    if (files.empty()) {
        Error("Usage: /merge <file> [file...]");
        return;
    }

    auto start = std::chrono::steady_clock::now();

    std::vector<MultiplexJob> jobs;
    for (const auto& file : files) {
        MultiplexJob job;
        job.target = framework_.get();
        job.external = json_codec::DecodeExternalFramework(json_codec::ParseFile(file));
        jobs.push_back(std::move(job));
    }

    std::vector<MultiplexResult> results = Framework::MultiplexBatches(jobs, *pool_);

    MultiplexResult total;
    for (size_t i = 0; i < results.size(); ++i) {
        if (verbose_) {
            out_ << "  " << files[i] << ": " << results[i].ToString() << "\n";
        }
        total += results[i];
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    out_ << C(Color::GREEN) << "✓ " << C(Color::RESET) << "Merged " << files.size()
         << " file(s) in " << duration.count() << " ms\n";
    out_ << "  Patterns integrated: " << total.integrated_patterns << "\n";
    out_ << "  Relationships integrated: " << total.integrated_relationships << "\n";
    if (total.skipped + total.FailureCount() > 0) {
        out_ << C(Color::YELLOW) << "  Skipped: " << total.skipped
             << ", conflicts: " << total.conflicts
             << ", dangling: " << total.dangling
             << ", invalid: " << total.invalid << C(Color::RESET) << "\n";
    }
}

void P3ifCli::Export(const std::string& path) {
    if (path.empty()) {
        Error("Usage: /export <file>");
        return;
    }
    framework_->ExportToJsonFile(path);
    out_ << C(Color::GREEN) << "✓ " << C(Color::RESET) << "Exported to " << path << "\n";
}

void P3ifCli::Import(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        Error("File not found: " + path);
        return;
    }
    ImportResult result = framework_->ImportFromJsonFile(path);
    out_ << C(Color::GREEN) << "✓ " << C(Color::RESET) << "Imported "
         << result.patterns_imported << " pattern(s), "
         << result.relationships_imported << " relationship(s)\n";
    if (result.duplicates > 0 || result.rejected > 0) {
        out_ << C(Color::YELLOW) << "  Duplicates: " << result.duplicates
             << ", rejected: " << result.rejected << C(Color::RESET) << "\n";
    }
    if (verbose_) {
        for (const auto& error : result.errors) {
            out_ << "  " << error << "\n";
        }
    }
}

void P3ifCli::ExportSqlite(const std::string& db_path) {
    if (db_path.empty()) {
        Error("Usage: /export-sqlite <db>");
        return;
    }

    SqliteBackend::Config sqlite_config;
    sqlite_config.db_path = db_path;
    SqliteBackend backend(sqlite_config);

    size_t failed = 0;
    for (const auto& pattern : framework_->GetAllPatterns()) {
        if (!backend.SavePattern(pattern)) failed++;
    }
    for (const auto& relationship : framework_->GetAllRelationships()) {
        if (!backend.SaveRelationship(relationship)) failed++;
    }
    backend.Flush();

    StorageStats stats = backend.GetStats();
    out_ << C(Color::GREEN) << "✓ " << C(Color::RESET) << "Wrote " << stats.pattern_count
         << " pattern(s) and " << stats.relationship_count << " relationship(s) to " << db_path << "\n";
    if (failed > 0) {
        Error(std::to_string(failed) + " record(s) could not be written");
    }
}

void P3ifCli::Error(const std::string& message) {
    errors_++;
    out_ << C(Color::RED) << "Error: " << C(Color::RESET) << message << "\n";
}

} // namespace p3if
