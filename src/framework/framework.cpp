// File: src/framework/framework.cpp
#include "framework/framework.hpp"
#include "core/errors.hpp"
#include "framework/dimension_swapper.hpp"
#include "io/json_codec.hpp"
#include <future>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace p3if {

// ============================================================================
// Result Types
// ============================================================================

std::vector<Pattern> PatternCollection::AllPatterns() const {
    std::vector<Pattern> all;
    all.reserve(Size());
    all.insert(all.end(), properties.begin(), properties.end());
    all.insert(all.end(), processes.begin(), processes.end());
    all.insert(all.end(), perspectives.begin(), perspectives.end());
    return all;
}

std::string ImportResult::ToString() const {
    std::ostringstream oss;
    oss << "ImportResult{patterns=" << patterns_imported
        << ", relationships=" << relationships_imported
        << ", duplicates=" << duplicates
        << ", rejected=" << rejected << "}";
    return oss.str();
}

// ============================================================================
// Construction
// ============================================================================

Framework::Config Framework::Config::FromFrameworkConfig(const FrameworkConfig& config) {
    if (config.framework.metrics_cache_timeout_seconds > FrameworkConfig::kMaxMetricsCacheTimeoutSeconds) {
        throw std::invalid_argument("metrics_cache_timeout_seconds out of range: " +
                                    std::to_string(config.framework.metrics_cache_timeout_seconds));
    }

    Config result;
    result.metrics_cache_timeout = std::chrono::seconds(
        static_cast<std::chrono::seconds::rep>(config.framework.metrics_cache_timeout_seconds));
    result.removal_policy = ParseRemovalPolicy(config.framework.removal_policy);
    result.verbose = config.framework.verbose;
    result.multiplex.match_by_name = config.multiplex.match_by_name;
    return result;
}

Framework::Framework()
    : Framework(Config())
{
}

Framework::Framework(const Config& config)
    : Framework(config, nullptr)
{
}

Framework::Framework(const Config& config, std::shared_ptr<StorageBackend> storage)
    : config_(config),
      patterns_(config.pattern_store),
      relationships_(config.relationship_store),
      validator_(config.validation),
      metrics_cache_(config.metrics_cache_timeout),
      storage_(std::move(storage)),
      verbose_(config.verbose)
{
}

std::unique_ptr<Framework> Framework::Create(const FrameworkConfig& config) {
    auto storage = CreateStorageBackend(config.storage.type, config.storage.path);
    auto framework = std::make_unique<Framework>(Config::FromFrameworkConfig(config), storage);
    if (storage) {
        ImportResult loaded = framework->LoadFromStorage();
        framework->Log("Loaded " + loaded.ToString() + " from " + config.storage.type + " storage");
    }
    return framework;
}

// ============================================================================
// Patterns
// ============================================================================

std::string Framework::AddPattern(const Pattern& pattern) {
    std::unique_lock<std::shared_mutex> lock = WriteLock();
    std::string id = patterns_.Add(pattern);
    metrics_cache_.Invalidate();
    MirrorPattern(pattern);
    Log("Added " + std::string(ToString(pattern.GetType())) + " pattern " + id);
    return id;
}

std::optional<Pattern> Framework::GetPattern(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock = ReadLock();
    return patterns_.Get(id);
}

bool Framework::RemovePattern(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock = WriteLock();
    if (!patterns_.Contains(id)) {
        return false;
    }

    std::vector<std::string> referencing = relationships_.ReferencingIds(id);
    if (!referencing.empty()) {
        if (config_.removal_policy == RemovalPolicy::RESTRICT) {
            throw FrameworkError(ErrorCode::PATTERN_IN_USE,
                                 "Pattern " + id + " is referenced by " +
                                 std::to_string(referencing.size()) + " relationship(s)");
        }
        for (const auto& relationship_id : referencing) {
            relationships_.Remove(relationship_id);
            MirrorRelationshipDelete(relationship_id);
        }
    }

    patterns_.Remove(id);
    metrics_cache_.Invalidate();
    MirrorPatternDelete(id);
    Log("Removed pattern " + id + (referencing.empty() ? std::string()
        : " and " + std::to_string(referencing.size()) + " relationship(s)"));
    return true;
}

std::vector<Pattern> Framework::GetPatternsByType(PatternType type) const {
    std::shared_lock<std::shared_mutex> lock = ReadLock();
    return patterns_.GetByType(type);
}

std::vector<Pattern> Framework::GetPatternsByDomain(const std::string& domain) const {
    std::shared_lock<std::shared_mutex> lock = ReadLock();
    return patterns_.GetByDomain(domain);
}

std::vector<Pattern> Framework::GetPatternsByTag(const std::string& tag) const {
    std::shared_lock<std::shared_mutex> lock = ReadLock();
    return patterns_.GetByTag(tag);
}

std::vector<Pattern> Framework::SearchPatterns(const std::string& query) const {
    std::shared_lock<std::shared_mutex> lock = ReadLock();
    return patterns_.Search(query);
}

std::vector<Pattern> Framework::GetAllPatterns() const {
    std::shared_lock<std::shared_mutex> lock = ReadLock();
    return patterns_.All();
}

PatternCollection Framework::GetPatternCollection() const {
    std::shared_lock<std::shared_mutex> lock = ReadLock();
    PatternCollection collection;
    collection.properties = patterns_.GetByType(PatternType::PROPERTY);
    collection.processes = patterns_.GetByType(PatternType::PROCESS);
    collection.perspectives = patterns_.GetByType(PatternType::PERSPECTIVE);
    return collection;
}

bool Framework::Contains(const std::string& pattern_id) const {
    std::shared_lock<std::shared_mutex> lock = ReadLock();
    return patterns_.Contains(pattern_id);
}

size_t Framework::PatternCount() const {
    std::shared_lock<std::shared_mutex> lock = ReadLock();
    return patterns_.Size();
}

// ============================================================================
// Relationships
// ============================================================================

std::string Framework::AddRelationship(const Relationship& relationship) {
    std::unique_lock<std::shared_mutex> lock = WriteLock();
    std::string id = relationships_.Add(relationship, patterns_);
    metrics_cache_.Invalidate();
    MirrorRelationship(id);
    Log("Added relationship " + id);
    return id;
}

std::optional<Relationship> Framework::GetRelationship(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock = ReadLock();
    return relationships_.Get(id);
}

bool Framework::RemoveRelationship(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock = WriteLock();
    if (!relationships_.Remove(id)) {
        return false;
    }
    metrics_cache_.Invalidate();
    MirrorRelationshipDelete(id);
    Log("Removed relationship " + id);
    return true;
}

std::vector<Relationship> Framework::GetRelationshipsByPattern(const std::string& pattern_id) const {
    std::shared_lock<std::shared_mutex> lock = ReadLock();
    return relationships_.GetByPattern(pattern_id);
}

std::vector<Relationship> Framework::GetAllRelationships() const {
    std::shared_lock<std::shared_mutex> lock = ReadLock();
    return relationships_.All();
}

size_t Framework::RelationshipCount() const {
    std::shared_lock<std::shared_mutex> lock = ReadLock();
    return relationships_.Size();
}

// ============================================================================
// Validation and Metrics
// ============================================================================

ValidationReport Framework::ValidateFramework() const {
    std::shared_lock<std::shared_mutex> lock = ReadLock();
    return validator_.Validate(patterns_, relationships_);
}

Metrics Framework::GetMetrics() const {
    std::shared_lock<std::shared_mutex> lock = ReadLock();
    return metrics_cache_.GetOrCompute(patterns_, relationships_, validator_);
}

void Framework::InvalidateMetricsCache() {
    metrics_cache_.Invalidate();
}

MetricsCache::Stats Framework::GetMetricsCacheStats() const {
    return metrics_cache_.GetStats();
}

// ============================================================================
// Composite Mutations
// ============================================================================

size_t Framework::HotSwapDimension(const Pattern& old_pattern, const Pattern& new_pattern) {
    std::unique_lock<std::shared_mutex> lock = WriteLock();

    std::vector<std::string> candidates = relationships_.ReferencingIds(old_pattern.GetId());
    DimensionSwapper swapper(patterns_, relationships_);
    size_t updated = swapper.HotSwap(old_pattern, new_pattern);

    if (updated > 0) {
        metrics_cache_.Invalidate();
        PatternType slot = old_pattern.GetType();
        for (const auto& relationship_id : candidates) {
            const Relationship* relationship = relationships_.Find(relationship_id);
            if (relationship != nullptr && relationship->GetSlot(slot) == new_pattern.GetId()) {
                MirrorRelationship(relationship_id);
            }
        }
        Log("Swapped " + old_pattern.GetId() + " for " + new_pattern.GetId() + " in " +
            std::to_string(updated) + " relationship(s)");
    }
    return updated;
}

size_t Framework::HotSwapDimension(const std::string& old_id, const std::string& new_id) {
    std::optional<Pattern> old_pattern;
    std::optional<Pattern> new_pattern;
    {
        std::shared_lock<std::shared_mutex> lock = ReadLock();
        old_pattern = patterns_.Get(old_id);
        new_pattern = patterns_.Get(new_id);
    }
    if (!old_pattern) {
        throw FrameworkError(ErrorCode::NOT_FOUND, "Pattern " + old_id + " not found");
    }
    if (!new_pattern) {
        throw FrameworkError(ErrorCode::NOT_FOUND,
                             "Replacement pattern " + new_id + " is not registered");
    }
    return HotSwapDimension(*old_pattern, *new_pattern);
}

SwapResult Framework::ReplacePattern(const std::string& old_id, const Pattern& new_pattern) {
    std::unique_lock<std::shared_mutex> lock = WriteLock();

    const Pattern* old_pattern = patterns_.Find(old_id);
    if (old_pattern == nullptr) {
        throw FrameworkError(ErrorCode::NOT_FOUND, "Pattern " + old_id + " not found");
    }
    PatternType slot = old_pattern->GetType();

    const Pattern* registered = patterns_.Find(new_pattern.GetId());
    PatternType new_type = registered != nullptr ? registered->GetType() : new_pattern.GetType();
    if (new_type != slot) {
        throw FrameworkError(ErrorCode::TYPE_MISMATCH,
                             "Cannot replace " + std::string(ToString(slot)) + " " + old_id +
                             " with " + ToString(new_type) + " " + new_pattern.GetId());
    }
    if (old_id == new_pattern.GetId()) {
        return SwapResult{};
    }

    // All checks happen before the first mutation
    std::vector<std::string> referencing = relationships_.ReferencingIds(old_id);
    for (const auto& relationship_id : referencing) {
        const Relationship* relationship = relationships_.Find(relationship_id);
        if (relationship != nullptr && relationship->GetSlot(slot) != old_id) {
            throw FrameworkError(ErrorCode::PATTERN_IN_USE,
                                 "Pattern " + old_id + " is held in a foreign slot of " + relationship_id);
        }
    }

    if (registered == nullptr) {
        patterns_.Add(new_pattern);
        MirrorPattern(new_pattern);
    }

    Pattern old_copy = *old_pattern;
    DimensionSwapper swapper(patterns_, relationships_);
    SwapResult result;
    result.updated_relationships = swapper.HotSwap(old_copy, new_pattern);
    for (const auto& relationship_id : referencing) {
        MirrorRelationship(relationship_id);
    }

    patterns_.Remove(old_id);
    MirrorPatternDelete(old_id);
    result.replaced_patterns = 1;

    metrics_cache_.Invalidate();
    Log("Replaced pattern " + old_id + " with " + new_pattern.GetId());
    return result;
}

MultiplexResult Framework::Multiplex(const ExternalFramework& external) {
    std::unique_lock<std::shared_mutex> lock = WriteLock();

    Multiplexer multiplexer(patterns_, relationships_, validator_, config_.multiplex);
    MultiplexResult result = multiplexer.Multiplex(external);

    if (!result.added_pattern_ids.empty() || !result.added_relationship_ids.empty()) {
        metrics_cache_.Invalidate();
    }
    for (const auto& id : result.added_pattern_ids) {
        const Pattern* pattern = patterns_.Find(id);
        if (pattern != nullptr) {
            MirrorPattern(*pattern);
        }
    }
    for (const auto& id : result.added_relationship_ids) {
        MirrorRelationship(id);
    }

    Log("Multiplex: " + result.ToString());
    return result;
}

std::vector<MultiplexResult> Framework::MultiplexBatches(const std::vector<MultiplexJob>& jobs,
                                                         WorkerPool& pool) {
    std::vector<std::future<MultiplexResult>> futures;
    futures.reserve(jobs.size());
    for (const auto& job : jobs) {
        if (job.target == nullptr) {
            throw FrameworkError(ErrorCode::INVALID_ARGUMENT, "Multiplex job has no target framework");
        }
    }
    for (const auto& job : jobs) {
        Framework* target = job.target;
        const ExternalFramework* external = &job.external;
        futures.push_back(pool.Submit([target, external]() {
            return target->Multiplex(*external);
        }));
    }

    std::vector<MultiplexResult> results;
    results.reserve(futures.size());
    for (auto& future : futures) {
        results.push_back(future.get());
    }
    return results;
}

std::unique_ptr<Framework> Framework::Combine(const std::vector<const Framework*>& frameworks) {
    return Combine(frameworks, Config());
}

std::unique_ptr<Framework> Framework::Combine(const std::vector<const Framework*>& frameworks,
                                              const Config& config) {
    auto combined = std::make_unique<Framework>(config);

    for (const Framework* source : frameworks) {
        if (source == nullptr) {
            continue;
        }
        std::vector<Pattern> patterns;
        std::vector<Relationship> relationships;
        {
            std::shared_lock<std::shared_mutex> lock = source->ReadLock();
            patterns = source->patterns_.All();
            relationships = source->relationships_.All();
        }

        std::unique_lock<std::shared_mutex> lock = combined->WriteLock();
        ImportResult merged = combined->InsertLocked(patterns, relationships, false, false);
        combined->Log("Combined " + merged.ToString());
    }
    return combined;
}

void Framework::Clear() {
    std::unique_lock<std::shared_mutex> lock = WriteLock();
    relationships_.Clear();
    patterns_.Clear();
    metrics_cache_.Invalidate();
    if (storage_) {
        try {
            storage_->Clear();
        } catch (const FrameworkError& e) {
            std::cerr << "Warning: Failed to clear storage: " << e.what() << std::endl;
        }
    }
    Log("Cleared framework");
}

// ============================================================================
// Import / Export
// ============================================================================

Json::Value Framework::ExportDocument() const {
    std::vector<Pattern> patterns;
    std::vector<Relationship> relationships;
    {
        std::shared_lock<std::shared_mutex> lock = ReadLock();
        patterns = patterns_.All();
        relationships = relationships_.All();
    }
    return json_codec::EncodeDocument(patterns, relationships);
}

std::string Framework::ExportToJson(bool pretty) const {
    return json_codec::Write(ExportDocument(), pretty);
}

void Framework::ExportToJsonFile(const std::string& path) const {
    json_codec::WriteFile(path, ExportDocument());
    Log("Exported framework to " + path);
}

ImportResult Framework::ImportFromJson(const std::string& json, const ImportOptions& options) {
    return ImportDocument(json_codec::Parse(json), options);
}

ImportResult Framework::ImportFromJsonFile(const std::string& path, const ImportOptions& options) {
    return ImportDocument(json_codec::ParseFile(path), options);
}

ImportResult Framework::ImportDocument(const Json::Value& root, const ImportOptions& options) {
    json_codec::Document document;
    try {
        document = json_codec::DecodeDocument(root);
    } catch (const FrameworkError& e) {
        if (e.code() == ErrorCode::PARSE_ERROR) {
            throw;
        }
        throw FrameworkError(ErrorCode::PARSE_ERROR, std::string("Invalid record: ") + e.what());
    }

    std::unique_lock<std::shared_mutex> lock = WriteLock();
    ImportResult result = InsertLocked(document.patterns, document.relationships, options.lenient, true);
    Log("Imported " + result.ToString());
    return result;
}

ImportResult Framework::InsertLocked(const std::vector<Pattern>& patterns,
                                     const std::vector<Relationship>& relationships,
                                     bool lenient,
                                     bool mirror) {
    ImportResult result;

    for (const auto& pattern : patterns) {
        if (patterns_.Contains(pattern.GetId())) {
            ++result.duplicates;
            continue;
        }
        patterns_.Add(pattern);
        ++result.patterns_imported;
        if (mirror) {
            MirrorPattern(pattern);
        }
    }

    for (const auto& relationship : relationships) {
        if (relationships_.Contains(relationship.GetId())) {
            ++result.duplicates;
            continue;
        }
        try {
            relationships_.Add(relationship, patterns_);
        } catch (const FrameworkError& e) {
            if (!lenient) {
                ++result.rejected;
                result.errors.push_back(e.what());
                continue;
            }
            relationships_.InsertUnchecked(relationship);
        }
        ++result.relationships_imported;
        if (mirror) {
            MirrorRelationship(relationship.GetId());
        }
    }

    if (result.patterns_imported > 0 || result.relationships_imported > 0) {
        metrics_cache_.Invalidate();
    }
    return result;
}

// ============================================================================
// Storage
// ============================================================================

void Framework::AttachStorage(std::shared_ptr<StorageBackend> storage) {
    std::unique_lock<std::shared_mutex> lock = WriteLock();
    storage_ = std::move(storage);
}

std::shared_ptr<StorageBackend> Framework::GetStorage() const {
    std::shared_lock<std::shared_mutex> lock = ReadLock();
    return storage_;
}

ImportResult Framework::LoadFromStorage() {
    std::unique_lock<std::shared_mutex> lock = WriteLock();
    if (!storage_) {
        return ImportResult{};
    }
    std::vector<Pattern> patterns = storage_->LoadPatterns();
    std::vector<Relationship> relationships = storage_->LoadRelationships();
    return InsertLocked(patterns, relationships, true, false);
}

void Framework::MirrorPattern(const Pattern& pattern) {
    if (storage_ && !storage_->SavePattern(pattern)) {
        std::cerr << "Warning: Failed to persist pattern " << pattern.GetId() << std::endl;
    }
}

void Framework::MirrorRelationship(const std::string& relationship_id) {
    if (!storage_) {
        return;
    }
    const Relationship* relationship = relationships_.Find(relationship_id);
    if (relationship != nullptr && !storage_->SaveRelationship(*relationship)) {
        std::cerr << "Warning: Failed to persist relationship " << relationship_id << std::endl;
    }
}

void Framework::MirrorPatternDelete(const std::string& id) {
    if (storage_ && !storage_->DeletePattern(id)) {
        std::cerr << "Warning: Pattern " << id << " was not present in storage" << std::endl;
    }
}

void Framework::MirrorRelationshipDelete(const std::string& id) {
    if (storage_ && !storage_->DeleteRelationship(id)) {
        std::cerr << "Warning: Relationship " << id << " was not present in storage" << std::endl;
    }
}

// ============================================================================
// Settings
// ============================================================================

RemovalPolicy Framework::GetRemovalPolicy() const {
    std::shared_lock<std::shared_mutex> lock = ReadLock();
    return config_.removal_policy;
}

void Framework::SetRemovalPolicy(RemovalPolicy policy) {
    std::unique_lock<std::shared_mutex> lock = WriteLock();
    config_.removal_policy = policy;
}

std::vector<std::string> Framework::CheckConsistency() const {
    std::shared_lock<std::shared_mutex> lock = ReadLock();
    std::vector<std::string> problems = patterns_.CheckConsistency();
    std::vector<std::string> relationship_problems = relationships_.CheckConsistency();
    problems.insert(problems.end(), relationship_problems.begin(), relationship_problems.end());
    return problems;
}

// ============================================================================
// Locking
// ============================================================================

std::shared_lock<std::shared_mutex> Framework::ReadLock() const {
    // A waiting writer holds off new readers
    while (pending_writers_.load(std::memory_order_acquire) > 0) {
        std::this_thread::yield();
    }
    return std::shared_lock<std::shared_mutex>(mutex_);
}

std::unique_lock<std::shared_mutex> Framework::WriteLock() {
    pending_writers_.fetch_add(1, std::memory_order_acq_rel);
    std::unique_lock<std::shared_mutex> lock(mutex_);
    pending_writers_.fetch_sub(1, std::memory_order_acq_rel);
    return lock;
}

void Framework::Log(const std::string& message) const {
    if (IsVerbose()) {
        std::cerr << "[p3if] " << message << std::endl;
    }
}

} // namespace p3if
